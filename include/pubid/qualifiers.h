/**
 * @file qualifiers.h
 * @brief Optional qualifiers of a PubID
 *
 * One canonical value type shared by the parser and all four renderers.
 * Every field is independently optional; the cross-field invariants are
 * checked by validateQualifiers().
 */

#pragma once

#include "pubid/stage.h"
#include <optional>
#include <string>

namespace pubid {

struct SeriesEntry;

/**
 * @brief Dated post-publication update ("/Upd 3:2015")
 */
struct Update {
    int number = 0;
    std::string date;       ///< 4 to 8 digits, typically a year

    bool operator==(const Update& other) const {
        return number == other.number && date == other.date;
    }
    bool operator!=(const Update& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Qualifier set of an identifier
 */
struct Qualifiers {
    std::optional<Stage> stage;
    std::optional<std::string> part;        ///< Label: digit then digits/upper-case letters ("1", "2A")
    std::optional<int> volume;
    std::optional<int> version;
    std::optional<int> revision;            ///< Mutually exclusive with edition
    std::optional<int> edition;
    std::optional<int> addendum;            ///< Sequence number; a plain "Addendum" is 1
    std::optional<Update> update;           ///< Mutually exclusive with addendum
    std::optional<std::string> translation; ///< Lower-case language code ("esp")

    bool operator==(const Qualifiers& other) const;
    bool operator!=(const Qualifiers& other) const {
        return !(*this == other);
    }
};

/// @brief True for a valid part label
bool isValidPartLabel(const std::string& label);

/// @brief True for a valid update date (4 to 8 digits)
bool isValidUpdateDate(const std::string& date);

/// @brief True for a 2 or 3 letter language code, in any case
bool isValidLanguageCode(const std::string& code);

/**
 * @brief Check the qualifier invariants
 *
 * @param qualifiers Qualifiers to check
 * @param series Series the identifier belongs to (part/volume support)
 * @return Description of the first violation, or std::nullopt if valid
 */
std::optional<std::string> validateQualifiers(const Qualifiers& qualifiers,
                                              const SeriesEntry& series);

} // namespace pubid
