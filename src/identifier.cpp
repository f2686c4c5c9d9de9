/**
 * @file identifier.cpp
 * @brief Identifier model implementation
 */

#include "pubid/identifier.h"
#include "pubid/errors.h"
#include "pubid/parser.h"
#include "pubid/renderer.h"
#include "pubid/utils/string_utils.h"

namespace pubid {

namespace {

/// Strip a leading publisher acronym from a series argument ("NIST SP" -> "SP")
std::string stripPublisherPrefix(Publisher publisher, const std::string& series) {
    std::string text = utils::trim(series);
    size_t sep = text.find_first_of(" .");
    if (sep == std::string::npos) {
        return text;
    }

    auto prefix = publisherFromString(text.substr(0, sep));
    if (!prefix) {
        return text;
    }
    if (*prefix != publisher) {
        throw InvalidModelError("series '" + series + "' is prefixed by " +
                                publisherToString(*prefix) + " but the publisher is " +
                                publisherToString(publisher));
    }
    return utils::trim(text.substr(sep + 1));
}

const SeriesEntry& resolveSeries(Publisher publisher, const std::string& series,
                                 const SeriesRegistry& registry) {
    std::string token = stripPublisherPrefix(publisher, series);
    auto resolution = registry.resolve(publisher, token);
    if (!resolution) {
        throw InvalidModelError("unknown series '" + series + "' for " +
                                publisherToString(publisher));
    }
    return *resolution->entry;
}

Qualifiers normalized(Qualifiers qualifiers) {
    if (qualifiers.translation) {
        qualifiers.translation = utils::toLowerCase(*qualifiers.translation);
    }
    return qualifiers;
}

} // namespace

Identifier::Identifier(Publisher publisher,
                       const std::string& series,
                       const std::string& docNumber,
                       Qualifiers qualifiers,
                       const SeriesRegistry& registry)
    : Identifier(publisher, resolveSeries(publisher, series, registry),
                 docNumber, std::move(qualifiers), registry) {}

Identifier::Identifier(Publisher publisher,
                       const SeriesEntry& series,
                       const std::string& docNumber,
                       Qualifiers qualifiers,
                       const SeriesRegistry& registry)
    : publisher_(publisher),
      series_(&series),
      docNumber_(docNumber),
      qualifiers_(normalized(std::move(qualifiers))),
      registry_(&registry) {
    validate();
}

Identifier Identifier::parse(const std::string& text) {
    return parseIdentifier(text, SeriesRegistry::defaultRegistry(), ParseOptions::defaults());
}

Identifier Identifier::parse(const std::string& text, const SeriesRegistry& registry) {
    return parseIdentifier(text, registry, ParseOptions::defaults());
}

Identifier Identifier::parse(const std::string& text, const SeriesRegistry& registry,
                             const ParseOptions& options) {
    return parseIdentifier(text, registry, options);
}

void Identifier::validate() const {
    if (!series_->isIssuedBy(publisher_)) {
        throw InvalidModelError("series " + series_->code + " was not issued by " +
                                publisherToString(publisher_));
    }
    if (docNumber_.empty()) {
        throw InvalidModelError("document number is empty");
    }
    if (!registry_->matchesDocNumber(*series_, docNumber_)) {
        throw InvalidModelError("malformed document number '" + docNumber_ +
                                "' for series " + series_->code);
    }
    if (auto violation = validateQualifiers(qualifiers_, *series_)) {
        throw InvalidModelError(*violation);
    }
}

void Identifier::replaceQualifiers(const Qualifiers& candidate) {
    Qualifiers next = normalized(candidate);
    if (auto violation = validateQualifiers(next, *series_)) {
        throw InvalidModelError(*violation);
    }
    qualifiers_ = std::move(next);
}

std::string Identifier::toString(Style style) const {
    return render(*this, style);
}

Json::Value Identifier::toJson() const {
    Json::Value json;
    json["publisher"] = publisherToString(publisher_);
    json["series"] = series_->code;
    json["docnumber"] = docNumber_;

    if (qualifiers_.stage) {
        json["stage"] = stageToCode(*qualifiers_.stage);
    }
    if (qualifiers_.part) {
        json["part"] = *qualifiers_.part;
    }
    if (qualifiers_.volume) {
        json["volume"] = *qualifiers_.volume;
    }
    if (qualifiers_.version) {
        json["version"] = *qualifiers_.version;
    }
    if (qualifiers_.revision) {
        json["revision"] = *qualifiers_.revision;
    }
    if (qualifiers_.edition) {
        json["edition"] = *qualifiers_.edition;
    }
    if (qualifiers_.addendum) {
        json["addendum"] = *qualifiers_.addendum;
    }
    if (qualifiers_.update) {
        Json::Value update;
        update["number"] = qualifiers_.update->number;
        update["date"] = qualifiers_.update->date;
        json["update"] = update;
    }
    if (qualifiers_.translation) {
        json["translation"] = *qualifiers_.translation;
    }

    Json::Value forms;
    for (Style style : allStyles()) {
        forms[styleToString(style)] = toString(style);
    }
    json["forms"] = forms;

    return json;
}

void Identifier::setStage(Stage stage) {
    Qualifiers next = qualifiers_;
    next.stage = stage;
    replaceQualifiers(next);
}

void Identifier::setPart(const std::string& part) {
    Qualifiers next = qualifiers_;
    next.part = part;
    replaceQualifiers(next);
}

void Identifier::setVolume(int volume) {
    Qualifiers next = qualifiers_;
    next.volume = volume;
    replaceQualifiers(next);
}

void Identifier::setVersion(int version) {
    Qualifiers next = qualifiers_;
    next.version = version;
    replaceQualifiers(next);
}

void Identifier::setRevision(int revision) {
    Qualifiers next = qualifiers_;
    next.revision = revision;
    next.edition.reset();
    replaceQualifiers(next);
}

void Identifier::setEdition(int edition) {
    Qualifiers next = qualifiers_;
    next.edition = edition;
    next.revision.reset();
    replaceQualifiers(next);
}

void Identifier::setAddendum(int addendum) {
    Qualifiers next = qualifiers_;
    next.addendum = addendum;
    next.update.reset();
    replaceQualifiers(next);
}

void Identifier::setUpdate(const Update& update) {
    Qualifiers next = qualifiers_;
    next.update = update;
    next.addendum.reset();
    replaceQualifiers(next);
}

void Identifier::setTranslation(const std::string& languageCode) {
    Qualifiers next = qualifiers_;
    next.translation = languageCode;
    replaceQualifiers(next);
}

bool Identifier::operator==(const Identifier& other) const {
    return publisher_ == other.publisher_ &&
           series_->code == other.series_->code &&
           docNumber_ == other.docNumber_ &&
           qualifiers_ == other.qualifiers_;
}

} // namespace pubid
