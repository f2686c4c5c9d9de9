/**
 * @file qualifier_grammar.cpp
 * @brief Qualifier marker tables, suffix parser and suffix renderer
 */

#include "pubid/qualifier_grammar.h"
#include "pubid/utils/string_utils.h"
#include <cctype>
#include <spdlog/spdlog.h>

namespace pubid {

namespace {

const std::vector<QualifierMarker> SHORT_MARKERS = {
    {QualifierKind::PART,        ValueShape::LABEL,         "pt",        "",  ""},
    {QualifierKind::VERSION,     ValueShape::INTEGER,       "ver",       "",  ""},
    {QualifierKind::VOLUME,      ValueShape::INTEGER,       "v",         "",  ""},
    {QualifierKind::REVISION,    ValueShape::INTEGER,       "r",         "",  ""},
    {QualifierKind::EDITION,     ValueShape::INTEGER,       "e",         "",  ""},
    {QualifierKind::UPDATE,      ValueShape::UPDATE,        "/Upd ",     ":", ""},
    {QualifierKind::ADDENDUM,    ValueShape::ADDENDUM_WORD, " Addendum", "",  ""},
    {QualifierKind::TRANSLATION, ValueShape::LANGUAGE,      "(",         "",  ")"},
};

const std::vector<QualifierMarker> MR_MARKERS = {
    {QualifierKind::PART,        ValueShape::LABEL,    "pt",    "",  ""},
    {QualifierKind::VERSION,     ValueShape::INTEGER,  "ver",   "",  ""},
    {QualifierKind::VOLUME,      ValueShape::INTEGER,  "v",     "",  ""},
    {QualifierKind::REVISION,    ValueShape::INTEGER,  "r",     "",  ""},
    {QualifierKind::EDITION,     ValueShape::INTEGER,  "e",     "",  ""},
    {QualifierKind::UPDATE,      ValueShape::UPDATE,   ".u",    "-", ""},
    {QualifierKind::ADDENDUM,    ValueShape::INTEGER,  ".add-", "",  ""},
    {QualifierKind::TRANSLATION, ValueShape::LANGUAGE, "(",     "",  ")"},
};

const std::vector<QualifierMarker> LONG_MARKERS = {
    {QualifierKind::PART,        ValueShape::LABEL,    " Part ",       "",  ""},
    {QualifierKind::VOLUME,      ValueShape::INTEGER,  ", Volume ",    "",  ""},
    {QualifierKind::VERSION,     ValueShape::INTEGER,  " Version ",    "",  ""},
    {QualifierKind::REVISION,    ValueShape::INTEGER,  ", Revision ",  "",  ""},
    {QualifierKind::EDITION,     ValueShape::INTEGER,  " Edition ",    "",  ""},
    {QualifierKind::UPDATE,      ValueShape::UPDATE,   " Update ",     ":", ""},
    {QualifierKind::TRANSLATION, ValueShape::LANGUAGE, " (",           "",  ")"},
};

const std::vector<QualifierMarker> ABBREV_MARKERS = {
    {QualifierKind::PART,        ValueShape::LABEL,    " Pt. ",   "",  ""},
    {QualifierKind::VOLUME,      ValueShape::INTEGER,  ", Vol. ", "",  ""},
    {QualifierKind::VERSION,     ValueShape::INTEGER,  " Ver. ",  "",  ""},
    {QualifierKind::REVISION,    ValueShape::INTEGER,  ", Rev. ", "",  ""},
    {QualifierKind::EDITION,     ValueShape::INTEGER,  " Ed. ",   "",  ""},
    {QualifierKind::UPDATE,      ValueShape::UPDATE,   " Upd. ",  ":", ""},
    {QualifierKind::TRANSLATION, ValueShape::LANGUAGE, " (",      "",  ")"},
};

const std::vector<QualifierKind> CANONICAL_ORDER = {
    QualifierKind::PART,
    QualifierKind::VOLUME,
    QualifierKind::VERSION,
    QualifierKind::REVISION,
    QualifierKind::EDITION,
    QualifierKind::UPDATE,
    QualifierKind::ADDENDUM,
    QualifierKind::TRANSLATION,
};

/// Value read after a marker prefix
struct ParsedValue {
    int number = 0;
    std::string text;       // LABEL, LANGUAGE, UPDATE date
    size_t length = 0;      // characters consumed after the prefix
};

bool isHumanStyle(Style style) {
    return style == Style::LONG || style == Style::ABBREV;
}

const QualifierMarker* findMarker(Style style, QualifierKind kind) {
    for (const auto& marker : qualifierMarkers(style)) {
        if (marker.kind == kind) {
            return &marker;
        }
    }
    return nullptr;
}

std::optional<int> readInt(const std::string& text, size_t pos, size_t& length) {
    length = utils::countDigits(text, pos);
    if (length == 0) {
        return std::nullopt;
    }
    return utils::parseNonNegativeInt(text.substr(pos, length));
}

/**
 * Match the value shape of a marker at pos.
 * Returns std::nullopt when the text does not have the expected shape.
 */
std::optional<ParsedValue> matchValue(const std::string& text, size_t pos,
                                      const QualifierMarker& marker) {
    ParsedValue value;

    switch (marker.shape) {
        case ValueShape::INTEGER: {
            auto number = readInt(text, pos, value.length);
            if (!number) {
                return std::nullopt;
            }
            value.number = *number;
            return value;
        }

        case ValueShape::LABEL: {
            size_t end = pos;
            if (end >= text.size() || !std::isdigit(static_cast<unsigned char>(text[end]))) {
                return std::nullopt;
            }
            while (end < text.size()) {
                unsigned char c = static_cast<unsigned char>(text[end]);
                if (!std::isdigit(c) && !std::isupper(c)) {
                    break;
                }
                ++end;
            }
            value.text = text.substr(pos, end - pos);
            value.length = end - pos;
            return value;
        }

        case ValueShape::UPDATE: {
            size_t numberLength = 0;
            auto number = readInt(text, pos, numberLength);
            if (!number) {
                return std::nullopt;
            }
            size_t datePos = pos + numberLength;
            if (text.compare(datePos, marker.separator.size(), marker.separator) != 0) {
                return std::nullopt;
            }
            datePos += marker.separator.size();
            size_t dateLength = utils::countDigits(text, datePos);
            std::string date = text.substr(datePos, dateLength);
            if (!isValidUpdateDate(date)) {
                return std::nullopt;
            }
            value.number = *number;
            value.text = date;
            value.length = datePos + dateLength - pos;
            return value;
        }

        case ValueShape::ADDENDUM_WORD: {
            value.number = 1;
            if (pos < text.size() && text[pos] == ' ') {
                size_t numberLength = 0;
                auto number = readInt(text, pos + 1, numberLength);
                if (number) {
                    value.number = *number;
                    value.length = 1 + numberLength;
                }
            }
            return value;
        }

        case ValueShape::LANGUAGE: {
            size_t end = pos;
            while (end < text.size() && end - pos < 3 &&
                   std::isalpha(static_cast<unsigned char>(text[end]))) {
                ++end;
            }
            std::string code = text.substr(pos, end - pos);
            if (!isValidLanguageCode(code) ||
                text.compare(end, marker.suffix.size(), marker.suffix) != 0) {
                return std::nullopt;
            }
            value.text = utils::toLowerCase(code);
            value.length = end - pos + marker.suffix.size();
            return value;
        }
    }

    return std::nullopt;
}

void applyValue(QualifierKind kind, const ParsedValue& value, Qualifiers& q) {
    switch (kind) {
        case QualifierKind::PART:        q.part = value.text; break;
        case QualifierKind::VOLUME:      q.volume = value.number; break;
        case QualifierKind::VERSION:     q.version = value.number; break;
        case QualifierKind::REVISION:    q.revision = value.number; break;
        case QualifierKind::EDITION:     q.edition = value.number; break;
        case QualifierKind::UPDATE:      q.update = Update{value.number, value.text}; break;
        case QualifierKind::ADDENDUM:    q.addendum = value.number; break;
        case QualifierKind::TRANSLATION: q.translation = value.text; break;
    }
}

std::string renderValue(const QualifierMarker& marker, const Qualifiers& q, Style style) {
    switch (marker.kind) {
        case QualifierKind::PART:
            return marker.prefix + *q.part;
        case QualifierKind::VOLUME:
            return marker.prefix + std::to_string(*q.volume);
        case QualifierKind::VERSION:
            return marker.prefix + std::to_string(*q.version);
        case QualifierKind::REVISION:
            return marker.prefix + std::to_string(*q.revision);
        case QualifierKind::EDITION:
            return marker.prefix + std::to_string(*q.edition);
        case QualifierKind::UPDATE:
            return marker.prefix + std::to_string(q.update->number) +
                   marker.separator + q.update->date;
        case QualifierKind::ADDENDUM:
            if (marker.shape == ValueShape::ADDENDUM_WORD) {
                return marker.prefix + (*q.addendum == 1 ? "" : " " + std::to_string(*q.addendum));
            }
            return marker.prefix + std::to_string(*q.addendum);
        case QualifierKind::TRANSLATION: {
            std::string code = isHumanStyle(style) ? utils::toUpperCase(*q.translation)
                                                   : utils::toLowerCase(*q.translation);
            return marker.prefix + code + marker.suffix;
        }
    }
    return "";
}

bool isPresent(QualifierKind kind, const Qualifiers& q) {
    switch (kind) {
        case QualifierKind::PART:        return q.part.has_value();
        case QualifierKind::VOLUME:      return q.volume.has_value();
        case QualifierKind::VERSION:     return q.version.has_value();
        case QualifierKind::REVISION:    return q.revision.has_value();
        case QualifierKind::EDITION:     return q.edition.has_value();
        case QualifierKind::UPDATE:      return q.update.has_value();
        case QualifierKind::ADDENDUM:    return q.addendum.has_value();
        case QualifierKind::TRANSLATION: return q.translation.has_value();
    }
    return false;
}

} // namespace

std::string qualifierKindToString(QualifierKind kind) {
    switch (kind) {
        case QualifierKind::PART:        return "part";
        case QualifierKind::VOLUME:      return "volume";
        case QualifierKind::VERSION:     return "version";
        case QualifierKind::REVISION:    return "revision";
        case QualifierKind::EDITION:     return "edition";
        case QualifierKind::UPDATE:      return "update";
        case QualifierKind::ADDENDUM:    return "addendum";
        case QualifierKind::TRANSLATION: return "translation";
    }
    return "unknown";
}

const std::vector<QualifierMarker>& qualifierMarkers(Style style) {
    switch (style) {
        case Style::LONG:   return LONG_MARKERS;
        case Style::ABBREV: return ABBREV_MARKERS;
        case Style::SHORT:  return SHORT_MARKERS;
        case Style::MR:     return MR_MARKERS;
    }
    return SHORT_MARKERS;
}

std::string renderQualifierSuffix(const Qualifiers& qualifiers, Style style) {
    std::string result;
    for (QualifierKind kind : CANONICAL_ORDER) {
        if (!isPresent(kind, qualifiers)) {
            continue;
        }
        const QualifierMarker* marker = findMarker(style, kind);
        if (!marker) {
            continue;
        }
        result += renderValue(*marker, qualifiers, style);
    }
    return result;
}

std::optional<std::string> parseQualifierSuffix(const std::string& text,
                                                const std::vector<Style>& styles,
                                                Qualifiers& qualifiers) {
    size_t pos = 0;
    int lastRank = -1;

    while (pos < text.size()) {
        const QualifierMarker* matched = nullptr;
        std::optional<ParsedValue> value;

        for (Style style : styles) {
            for (const auto& marker : qualifierMarkers(style)) {
                if (text.compare(pos, marker.prefix.size(), marker.prefix) != 0) {
                    continue;
                }
                value = matchValue(text, pos + marker.prefix.size(), marker);
                if (value) {
                    matched = &marker;
                    break;
                }
            }
            if (matched) {
                break;
            }
        }

        if (!matched) {
            return "unrecognized qualifier suffix '" + text.substr(pos) + "'";
        }

        int rank = static_cast<int>(matched->kind);
        if (rank <= lastRank) {
            return "qualifier '" + qualifierKindToString(matched->kind) +
                   "' is repeated or out of order in '" + text + "'";
        }

        applyValue(matched->kind, *value, qualifiers);
        spdlog::trace("Qualifier {} matched by marker '{}'",
                      qualifierKindToString(matched->kind), matched->prefix);

        lastRank = rank;
        pos += matched->prefix.size() + value->length;
    }

    return std::nullopt;
}

std::string renderAddendumPrefix(const Qualifiers& qualifiers, Style style) {
    if (!qualifiers.addendum || !isHumanStyle(style)) {
        return "";
    }
    std::string word = style == Style::LONG ? "Addendum" : "Add.";
    if (*qualifiers.addendum != 1) {
        word += " " + std::to_string(*qualifiers.addendum);
    }
    return word + " to ";
}

size_t parseAddendumPrefix(const std::string& text, std::optional<int>& addendum) {
    for (const std::string word : {"Addendum", "Add."}) {
        if (!utils::startsWith(text, word + " ")) {
            continue;
        }
        size_t pos = word.size() + 1;
        int number = 1;

        size_t length = 0;
        auto explicitNumber = readInt(text, pos, length);
        if (explicitNumber) {
            if (pos + length >= text.size() || text[pos + length] != ' ') {
                continue;
            }
            number = *explicitNumber;
            pos += length + 1;
        }

        if (!utils::startsWith(text.substr(pos), "to ")) {
            continue;
        }
        addendum = number;
        return pos + 3;
    }
    return 0;
}

} // namespace pubid
