/**
 * @file qualifier_grammar.h
 * @brief Marker tables for qualifier suffixes, shared by parser and renderer
 *
 * Each style owns one table of tagged marker rules. The parser walks the
 * table in priority order at every position of the suffix; the renderer
 * walks the qualifiers in canonical order and looks up the rule for each.
 * Because both sides read the same literals, the four forms cannot drift.
 *
 * Canonical order (QualifierKind declaration order):
 *   part -> volume -> version -> revision/edition -> update -> addendum -> translation
 *
 * | Kind        | SHORT          | MR        | LONG           | ABBREV      |
 * |-------------|----------------|-----------|----------------|-------------|
 * | PART        | pt1            | pt1       | " Part 1"      | " Pt. 1"    |
 * | VOLUME      | v1             | v1        | ", Volume 1"   | ", Vol. 1"  |
 * | VERSION     | ver2           | ver2      | " Version 2"   | " Ver. 2"   |
 * | REVISION    | r5             | r5        | ", Revision 5" | ", Rev. 5"  |
 * | EDITION     | e5             | e5        | " Edition 5"   | " Ed. 5"    |
 * | UPDATE      | /Upd 3:2015    | .u3-2015  | " Update 3:2015" | " Upd. 3:2015" |
 * | ADDENDUM    | " Addendum"    | .add-1    | prefix         | prefix      |
 * | TRANSLATION | (esp)          | (esp)     | " (ESP)"       | " (ESP)"    |
 */

#pragma once

#include "pubid/qualifiers.h"
#include "pubid/style.h"
#include <optional>
#include <string>
#include <vector>

namespace pubid {

/**
 * @brief Qualifier addressed by a marker rule, in canonical order
 */
enum class QualifierKind {
    PART,
    VOLUME,
    VERSION,
    REVISION,
    EDITION,
    UPDATE,
    ADDENDUM,
    TRANSLATION
};

/// @brief Shape of the value following a marker
enum class ValueShape {
    INTEGER,        ///< Decimal digits
    LABEL,          ///< Digit followed by digits/upper-case letters
    UPDATE,         ///< Number, separator, date
    ADDENDUM_WORD,  ///< Optional " N"; absent means 1
    LANGUAGE        ///< 2-3 letters, closed by the suffix
};

/**
 * @brief One tagged grammar rule
 */
struct QualifierMarker {
    QualifierKind kind;
    ValueShape shape;
    std::string prefix;         ///< Literal introducing the value
    std::string separator;      ///< UPDATE only: between number and date
    std::string suffix;         ///< LANGUAGE only: closes the value
};

/// @brief Convert QualifierKind to string
std::string qualifierKindToString(QualifierKind kind);

/**
 * @brief Marker table of a style, in parse priority order
 *
 * Markers sharing a prefix are listed longest first ("ver" before "v").
 * LONG and ABBREV tables carry no ADDENDUM rule; the addendum is a prefix
 * of the whole string in those styles.
 */
const std::vector<QualifierMarker>& qualifierMarkers(Style style);

/**
 * @brief Render the qualifier suffix that follows the docnumber
 *
 * Covers every qualifier except stage (placed next to the series) and,
 * for LONG/ABBREV, the addendum prefix.
 */
std::string renderQualifierSuffix(const Qualifiers& qualifiers, Style style);

/**
 * @brief Parse a qualifier suffix
 *
 * Consumes text completely. Qualifiers must appear in canonical order and
 * at most once. Rules of every listed style are tried, so a human-form
 * suffix may mix long and abbreviated markers.
 *
 * @param text Suffix following the docnumber
 * @param styles Styles whose marker tables apply
 * @param qualifiers Receives the parsed values (stage untouched)
 * @return Error description, or std::nullopt when the whole text matched
 */
std::optional<std::string> parseQualifierSuffix(const std::string& text,
                                                const std::vector<Style>& styles,
                                                Qualifiers& qualifiers);

/**
 * @brief Render the LONG/ABBREV addendum prefix ("Addendum to ", "Add. 2 to ")
 * @return Empty string if there is no addendum or the style is compact
 */
std::string renderAddendumPrefix(const Qualifiers& qualifiers, Style style);

/**
 * @brief Parse a LONG/ABBREV addendum prefix
 *
 * @param text Whole identifier string
 * @param addendum Receives the addendum number when a prefix is present
 * @return Number of characters consumed (0 if text has no addendum prefix)
 */
size_t parseAddendumPrefix(const std::string& text, std::optional<int>& addendum);

} // namespace pubid
