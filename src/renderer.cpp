/**
 * @file renderer.cpp
 * @brief Identifier rendering
 */

#include "pubid/renderer.h"
#include "pubid/qualifier_grammar.h"

namespace pubid {

namespace {

std::string renderHuman(const Identifier& identifier, Style style) {
    const SeriesEntry& series = identifier.getSeries();
    const Qualifiers& qualifiers = identifier.getQualifiers();
    const bool isLong = style == Style::LONG;

    std::string result = renderAddendumPrefix(qualifiers, style);
    if (!series.embedsOrganization) {
        result += isLong ? publisherLongName(identifier.getPublisher())
                         : publisherAbbrevName(identifier.getPublisher());
        result += " ";
    }
    result += isLong ? series.longTitle : series.abbrevTitle;

    if (qualifiers.stage) {
        result += " " + stageTitle(*qualifiers.stage);
    }

    result += " " + identifier.getDocNumber();
    result += renderQualifierSuffix(qualifiers, style);
    return result;
}

std::string renderCompact(const Identifier& identifier, Style style) {
    const SeriesEntry& series = identifier.getSeries();
    const Qualifiers& qualifiers = identifier.getQualifiers();

    std::string result = publisherToString(identifier.getPublisher());
    if (style == Style::MR) {
        result += "." + series.mrCode();
        if (qualifiers.stage) {
            result += "." + stageToCode(*qualifiers.stage);
        }
        result += ".";
    } else {
        result += " " + series.code;
        if (qualifiers.stage) {
            result += "(" + stageToCode(*qualifiers.stage) + ")";
        }
        result += " ";
    }

    result += identifier.getDocNumber();
    result += renderQualifierSuffix(qualifiers, style);
    return result;
}

} // namespace

std::string render(const Identifier& identifier, Style style) {
    switch (style) {
        case Style::LONG:
        case Style::ABBREV:
            return renderHuman(identifier, style);
        case Style::SHORT:
        case Style::MR:
            return renderCompact(identifier, style);
    }
    return renderCompact(identifier, Style::SHORT);
}

} // namespace pubid
