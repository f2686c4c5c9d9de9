/**
 * @file style.cpp
 * @brief Style names
 */

#include "pubid/style.h"
#include "pubid/utils/string_utils.h"

namespace pubid {

std::string styleToString(Style style) {
    switch (style) {
        case Style::LONG:   return "long";
        case Style::ABBREV: return "abbrev";
        case Style::SHORT:  return "short";
        case Style::MR:     return "mr";
    }
    return "unknown";
}

std::optional<Style> parseStyle(const std::string& name) {
    std::string lower = utils::toLowerCase(utils::trim(name));
    for (Style style : allStyles()) {
        if (styleToString(style) == lower) {
            return style;
        }
    }
    return std::nullopt;
}

const std::vector<Style>& allStyles() {
    static const std::vector<Style> styles = {
        Style::LONG, Style::ABBREV, Style::SHORT, Style::MR
    };
    return styles;
}

} // namespace pubid
