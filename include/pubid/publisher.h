/**
 * @file publisher.h
 * @brief Issuing organizations of PubIDs
 *
 * NIST and its predecessor NBS. The acronym is used by the short and
 * machine-readable forms, the long and abbreviated names by the human forms.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pubid {

/**
 * @brief Organization that issued a publication
 */
enum class Publisher {
    NIST,   ///< National Institute of Standards and Technology (since 1988)
    NBS     ///< National Bureau of Standards (predecessor)
};

/// @brief Acronym used in short and MR forms ("NIST", "NBS")
std::string publisherToString(Publisher publisher);

/// @brief Full organization name ("National Bureau of Standards")
std::string publisherLongName(Publisher publisher);

/// @brief Abbreviated organization name ("Natl. Bur. Stand.")
std::string publisherAbbrevName(Publisher publisher);

/**
 * @brief Parse a publisher acronym (case-insensitive)
 * @return Publisher, or std::nullopt if the token is not an acronym
 */
std::optional<Publisher> publisherFromString(const std::string& token);

/// @brief Every publisher, current organization first
const std::vector<Publisher>& allPublishers();

} // namespace pubid
