/**
 * @file qualifiers.cpp
 * @brief Qualifier value checks and invariants
 */

#include "pubid/qualifiers.h"
#include "pubid/series_registry.h"
#include <cctype>

namespace pubid {

bool Qualifiers::operator==(const Qualifiers& other) const {
    return stage == other.stage &&
           part == other.part &&
           volume == other.volume &&
           version == other.version &&
           revision == other.revision &&
           edition == other.edition &&
           addendum == other.addendum &&
           update == other.update &&
           translation == other.translation;
}

bool isValidPartLabel(const std::string& label) {
    if (label.empty() || !std::isdigit(static_cast<unsigned char>(label[0]))) {
        return false;
    }
    for (char c : label) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isdigit(uc) && !std::isupper(uc)) {
            return false;
        }
    }
    return true;
}

bool isValidUpdateDate(const std::string& date) {
    if (date.size() < 4 || date.size() > 8) {
        return false;
    }
    for (char c : date) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool isValidLanguageCode(const std::string& code) {
    if (code.size() < 2 || code.size() > 3) {
        return false;
    }
    for (char c : code) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> validateQualifiers(const Qualifiers& q, const SeriesEntry& series) {
    auto negative = [](const std::optional<int>& value) {
        return value && *value < 0;
    };

    if (q.revision && q.edition) {
        return std::string("revision and edition are mutually exclusive");
    }
    if (q.addendum && q.update) {
        return std::string("addendum and update are mutually exclusive");
    }
    if (negative(q.revision) || negative(q.edition) ||
        negative(q.volume) || negative(q.version)) {
        return std::string("revision, edition, volume and version must be >= 0");
    }
    if (q.addendum && *q.addendum < 1) {
        return std::string("addendum number must be >= 1");
    }
    if (q.update) {
        if (q.update->number < 0) {
            return std::string("update number must be >= 0");
        }
        if (!isValidUpdateDate(q.update->date)) {
            return "invalid update date '" + q.update->date + "'";
        }
    }
    if (q.part) {
        if (!series.supportsParts) {
            return "series " + series.code + " has no parts";
        }
        if (!isValidPartLabel(*q.part)) {
            return "invalid part label '" + *q.part + "'";
        }
    }
    if (q.volume && !series.supportsVolumes) {
        return "series " + series.code + " has no volumes";
    }
    if (q.translation && !isValidLanguageCode(*q.translation)) {
        return "invalid language code '" + *q.translation + "'";
    }
    return std::nullopt;
}

} // namespace pubid
