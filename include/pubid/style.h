/**
 * @file style.h
 * @brief Textual representations of a PubID
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pubid {

/**
 * @brief Output/input style of a PubID string
 *
 * Example for the same identifier:
 * - LONG:   "National Institute of Standards and Technology Special Publication 800-53, Revision 5"
 * - ABBREV: "Natl. Inst. Stand. Technol. Spec. Publ. 800-53, Rev. 5"
 * - SHORT:  "NIST SP 800-53r5"
 * - MR:     "NIST.SP.800-53r5"
 */
enum class Style {
    LONG,
    ABBREV,
    SHORT,
    MR
};

/// @brief Lower-case style name ("long", "abbrev", "short", "mr")
std::string styleToString(Style style);

/**
 * @brief Parse a style name (case-insensitive)
 * @return Style, or std::nullopt for an unknown name
 */
std::optional<Style> parseStyle(const std::string& name);

/// @brief Every style, human forms first
const std::vector<Style>& allStyles();

} // namespace pubid
