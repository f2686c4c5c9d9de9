/**
 * @file series_sources.cpp
 * @brief JSON series source and registry export
 */

#include "pubid/series_sources.h"
#include "pubid/errors.h"
#include <sstream>
#include <spdlog/spdlog.h>

namespace pubid {

namespace {

std::string requireString(const Json::Value& json, const char* field, const std::string& context) {
    const Json::Value& value = json[field];
    if (!value.isString() || value.asString().empty()) {
        throw RegistryError(context + ": field '" + field + "' must be a non-empty string");
    }
    return value.asString();
}

bool optionalBool(const Json::Value& json, const char* field, bool defaultValue,
                  const std::string& context) {
    if (!json.isMember(field)) {
        return defaultValue;
    }
    if (!json[field].isBool()) {
        throw RegistryError(context + ": field '" + field + "' must be a boolean");
    }
    return json[field].asBool();
}

Publisher requirePublisher(const Json::Value& value, const std::string& context) {
    if (!value.isString()) {
        throw RegistryError(context + ": publisher must be a string");
    }
    auto publisher = publisherFromString(value.asString());
    if (!publisher) {
        throw RegistryError(context + ": unknown publisher '" + value.asString() + "'");
    }
    return *publisher;
}

Json::Value publishersToJson(const std::vector<Publisher>& publishers) {
    Json::Value array = Json::arrayValue;
    for (Publisher p : publishers) {
        array.append(publisherToString(p));
    }
    return array;
}

} // namespace

JsonSeriesSource::JsonSeriesSource(const std::string& document, std::string name)
    : name_(std::move(name)) {

    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errs;
    std::istringstream iss(document);

    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        throw RegistryError("cannot parse series document '" + name_ + "': " + errs);
    }
    if (!root.isObject()) {
        throw RegistryError("series document '" + name_ + "' must be a JSON object");
    }

    const Json::Value& series = root["series"];
    if (!series.isArray()) {
        throw RegistryError("series document '" + name_ + "' has no 'series' array");
    }
    for (const auto& item : series) {
        series_.push_back(seriesFromJson(item));
    }

    if (root.isMember("aliases")) {
        const Json::Value& aliases = root["aliases"];
        if (!aliases.isArray()) {
            throw RegistryError("series document '" + name_ + "': 'aliases' must be an array");
        }
        for (const auto& item : aliases) {
            aliases_.push_back(aliasFromJson(item));
        }
    }

    spdlog::debug("Series document '{}' parsed: {} series, {} aliases",
                  name_, series_.size(), aliases_.size());
}

std::vector<Publisher> JsonSeriesSource::publishersFromJson(const Json::Value& json,
                                                            const std::string& context) {
    std::vector<Publisher> publishers;
    if (json.isNull()) {
        return publishers;
    }
    if (!json.isArray()) {
        throw RegistryError(context + ": 'publishers' must be an array");
    }
    for (const auto& item : json) {
        publishers.push_back(requirePublisher(item, context));
    }
    return publishers;
}

SeriesEntry JsonSeriesSource::seriesFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw RegistryError("series record must be an object");
    }

    SeriesEntry entry;
    entry.code = requireString(json, "code", "series record");

    std::string context = "series '" + entry.code + "'";
    entry.publishers = publishersFromJson(json["publishers"], context);
    entry.longTitle = requireString(json, "long", context);
    entry.abbrevTitle = requireString(json, "abbrev", context);
    entry.embedsOrganization = optionalBool(json, "embedsOrganization", false, context);
    entry.supportsParts = optionalBool(json, "supportsParts", true, context);
    entry.supportsVolumes = optionalBool(json, "supportsVolumes", true, context);
    entry.gluedDocNumber = optionalBool(json, "gluedDocNumber", false, context);

    if (json.isMember("docNumberPattern")) {
        if (!json["docNumberPattern"].isString()) {
            throw RegistryError(context + ": field 'docNumberPattern' must be a string");
        }
        entry.docNumberPattern = json["docNumberPattern"].asString();
    }

    return entry;
}

SeriesAlias JsonSeriesSource::aliasFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw RegistryError("alias record must be an object");
    }

    SeriesAlias alias;
    alias.token = requireString(json, "token", "alias record");

    std::string context = "alias '" + alias.token + "'";
    alias.target = requireString(json, "target", context);
    alias.publishers = publishersFromJson(json["publishers"], context);

    if (json.isMember("impliedPublisher") && !json["impliedPublisher"].isNull()) {
        alias.impliedPublisher = requirePublisher(json["impliedPublisher"], context);
    }

    return alias;
}

Json::Value registryToJson(const SeriesRegistry& registry) {
    Json::Value root;

    Json::Value series = Json::arrayValue;
    for (const auto& entry : registry.entries()) {
        Json::Value json;
        json["code"] = entry.code;
        json["publishers"] = publishersToJson(entry.publishers);
        json["long"] = entry.longTitle;
        json["abbrev"] = entry.abbrevTitle;
        json["embedsOrganization"] = entry.embedsOrganization;
        json["supportsParts"] = entry.supportsParts;
        json["supportsVolumes"] = entry.supportsVolumes;
        json["gluedDocNumber"] = entry.gluedDocNumber;
        if (!entry.docNumberPattern.empty()) {
            json["docNumberPattern"] = entry.docNumberPattern;
        }
        series.append(json);
    }
    root["series"] = series;

    Json::Value aliases = Json::arrayValue;
    for (const auto& alias : registry.aliases()) {
        Json::Value json;
        json["token"] = alias.token;
        json["target"] = alias.target;
        json["publishers"] = publishersToJson(alias.publishers);
        if (alias.impliedPublisher) {
            json["impliedPublisher"] = publisherToString(*alias.impliedPublisher);
        }
        aliases.append(json);
    }
    root["aliases"] = aliases;

    return root;
}

} // namespace pubid
