/**
 * @file parser.cpp
 * @brief PubID parser implementation
 *
 * Compact forms (SHORT, MR) share one algorithm parameterized by the field
 * delimiter; human forms (LONG, ABBREV) are matched against publisher
 * names and series titles from the registry.
 */

#include "pubid/parser.h"
#include "pubid/common/config_manager.h"
#include "pubid/errors.h"
#include "pubid/qualifier_grammar.h"
#include "pubid/stage.h"
#include "pubid/utils/string_utils.h"
#include <cctype>
#include <vector>
#include <spdlog/spdlog.h>

namespace pubid {

namespace {

[[noreturn]] void fail(ParseErrorKind kind, const std::string& input, const std::string& message) {
    spdlog::debug("Rejected PubID '{}': {}", input, message);
    throw ParseError(kind, input, message);
}

bool isSeriesChar(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '-';
}

bool isDocNumberChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isdigit(uc) || std::isupper(uc) || c == '-';
}

bool hasWhitespace(const std::string& text) {
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

/// Build the identifier, reporting invariant violations as malformed input
Identifier construct(const std::string& input, const SeriesResolution& resolution,
                     const std::string& docNumber, const Qualifiers& qualifiers,
                     const SeriesRegistry& registry) {
    try {
        return Identifier(resolution.publisher, *resolution.entry, docNumber, qualifiers, registry);
    } catch (const InvalidModelError& e) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input, e.what());
    }
}

std::optional<SeriesResolution> resolveCompactSeries(std::optional<Publisher> publisher,
                                                     const std::string& token,
                                                     const SeriesRegistry& registry,
                                                     const ParseOptions& options) {
    auto resolution = registry.resolve(publisher, token);
    if (resolution || publisher || !options.allowMissingPublisher) {
        return resolution;
    }
    return registry.resolve(options.defaultPublisher, token);
}

/**
 * SHORT: NIST SP(IPD) 800-53r5/Upd 1:2020(esp)
 * MR:    NIST.SP.IPD.800-53r5.u1-2020(esp)
 */
Identifier parseCompact(const std::string& input, Style style,
                        const SeriesRegistry& registry, const ParseOptions& options) {
    const char delim = style == Style::MR ? '.' : ' ';
    const size_t n = input.size();
    size_t pos = 0;

    // Publisher token
    std::optional<Publisher> publisher;
    size_t tokenEnd = input.find(delim);
    if (tokenEnd != std::string::npos) {
        publisher = publisherFromString(input.substr(0, tokenEnd));
        if (publisher) {
            pos = tokenEnd + 1;
        }
    }

    // Series: longest run of letter words, tried longest first.
    // A word never ends in '-' ("SP-800" is not series "SP-").
    std::vector<size_t> wordEnds;
    size_t p = pos;
    while (p < n && std::isalpha(static_cast<unsigned char>(input[p]))) {
        while (p < n && isSeriesChar(input[p])) {
            ++p;
        }
        while (input[p - 1] == '-') {
            --p;
        }
        wordEnds.push_back(p);
        if (p + 1 < n && input[p] == delim && std::isalpha(static_cast<unsigned char>(input[p + 1]))) {
            ++p;
            continue;
        }
        break;
    }

    if (wordEnds.empty()) {
        fail(ParseErrorKind::UNKNOWN_SERIES, input, "missing series code");
    }

    std::optional<SeriesResolution> resolution;
    size_t seriesEnd = pos;
    for (size_t k = wordEnds.size(); k > 0 && !resolution; --k) {
        std::string token = input.substr(pos, wordEnds[k - 1] - pos);
        resolution = resolveCompactSeries(publisher, token, registry, options);
        if (resolution) {
            seriesEnd = wordEnds[k - 1];
        }
    }

    if (!resolution) {
        fail(ParseErrorKind::UNKNOWN_SERIES, input,
             "unknown series '" + input.substr(pos, wordEnds.back() - pos) + "'" +
             (publisher ? " for " + publisherToString(*publisher) : ""));
    }

    spdlog::debug("PubID '{}': publisher={}, series={}{}", input,
                  publisherToString(resolution->publisher), resolution->entry->code,
                  resolution->viaAlias ? " (legacy alias)" : "");
    pos = seriesEnd;

    // Stage: "SP(IPD)" in SHORT, "SP.IPD." in MR
    Qualifiers qualifiers;
    if (style == Style::SHORT && pos < n && input[pos] == '(') {
        size_t close = input.find(')', pos);
        if (close == std::string::npos) {
            fail(ParseErrorKind::MALFORMED_DOCNUMBER, input, "unterminated stage code");
        }
        std::string code = input.substr(pos + 1, close - pos - 1);
        qualifiers.stage = stageFromCode(code);
        if (!qualifiers.stage) {
            fail(ParseErrorKind::MALFORMED_DOCNUMBER, input, "unknown stage code '" + code + "'");
        }
        pos = close + 1;
    } else if (style == Style::MR && pos < n && input[pos] == '.') {
        size_t next = input.find('.', pos + 1);
        if (next != std::string::npos) {
            auto stage = stageFromCode(input.substr(pos + 1, next - pos - 1));
            if (stage) {
                qualifiers.stage = stage;
                pos = next;
            }
        }
    }

    // Delimiter, or a docnumber glued to a series that allows it ("CRPL-F-B150")
    if (pos < n && input[pos] == delim) {
        ++pos;
    } else if (pos >= n || !std::isdigit(static_cast<unsigned char>(input[pos]))) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input, "missing document number");
    } else if (!resolution->entry->gluedDocNumber || qualifiers.stage) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input,
             "document number must be separated from series " + resolution->entry->code);
    }

    size_t docStart = pos;
    while (pos < n && isDocNumberChar(input[pos])) {
        ++pos;
    }
    std::string docNumber = input.substr(docStart, pos - docStart);
    if (!registry.matchesDocNumber(*resolution->entry, docNumber)) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input,
             "malformed document number '" + input.substr(docStart) + "'");
    }

    if (auto error = parseQualifierSuffix(input.substr(pos), {style}, qualifiers)) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input, *error);
    }

    return construct(input, *resolution, docNumber, qualifiers, registry);
}

/// Publisher long/abbreviated name at the start of text, followed by a space
std::optional<std::pair<Publisher, size_t>> matchPublisherName(const std::string& text) {
    for (Publisher publisher : allPublishers()) {
        for (const std::string& name : {publisherLongName(publisher), publisherAbbrevName(publisher)}) {
            if (utils::startsWith(text, name + " ")) {
                return std::make_pair(publisher, name.size() + 1);
            }
        }
    }
    return std::nullopt;
}

/**
 * LONG:   Addendum to National Institute of Standards and Technology Special
 *         Publication Initial Public Draft 800-38A Part 1, Revision 2 (ESP)
 * ABBREV: Add. to Natl. Inst. Stand. Technol. Spec. Publ. ... 800-38A Pt. 1, Rev. 2 (ESP)
 */
Identifier parseHuman(const std::string& input, const SeriesRegistry& registry) {
    Qualifiers qualifiers;
    size_t pos = parseAddendumPrefix(input, qualifiers.addendum);

    std::optional<Publisher> publisher;
    if (auto match = matchPublisherName(input.substr(pos))) {
        publisher = match->first;
        pos += match->second;
    }

    auto title = registry.matchTitle(publisher, input.substr(pos));
    if (!title) {
        fail(ParseErrorKind::UNKNOWN_SERIES, input,
             "unknown series title at '" + input.substr(pos) + "'");
    }
    pos += title->length;

    spdlog::debug("PubID '{}': publisher={}, series={} ({} title)", input,
                  publisherToString(title->resolution.publisher),
                  title->resolution.entry->code, styleToString(title->style));

    // Stage title between series title and docnumber
    if (pos < input.size() && input[pos] == ' ') {
        for (Stage stage : allStages()) {
            if (utils::startsWith(input.substr(pos + 1), stageTitle(stage) + " ")) {
                qualifiers.stage = stage;
                pos += 1 + stageTitle(stage).size();
                break;
            }
        }
    }

    if (pos >= input.size() || input[pos] != ' ') {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input, "missing document number");
    }
    ++pos;

    size_t docEnd = input.find_first_of(" ,(", pos);
    if (docEnd == std::string::npos) {
        docEnd = input.size();
    }
    std::string docNumber = input.substr(pos, docEnd - pos);
    if (!registry.matchesDocNumber(*title->resolution.entry, docNumber)) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input,
             "malformed document number '" + docNumber + "'");
    }

    if (auto error = parseQualifierSuffix(input.substr(docEnd), {Style::LONG, Style::ABBREV},
                                          qualifiers)) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, input, *error);
    }

    return construct(input, title->resolution, docNumber, qualifiers, registry);
}

} // namespace

ParseOptions ParseOptions::fromConfig() {
    auto& config = common::ConfigManager::getInstance();
    ParseOptions options;

    std::string name = config.getString(common::ConfigManager::DEFAULT_PUBLISHER, "NIST");
    if (auto publisher = publisherFromString(name)) {
        options.defaultPublisher = *publisher;
    } else {
        spdlog::warn("Unknown default publisher '{}' (using NIST)", name);
    }

    options.allowMissingPublisher =
        config.getBool(common::ConfigManager::ALLOW_MISSING_PUBLISHER, true);

    return options;
}

const ParseOptions& ParseOptions::defaults() {
    static const ParseOptions options = fromConfig();
    return options;
}

Style detectStyle(const std::string& text, const SeriesRegistry& registry) {
    std::optional<int> addendum;
    if (parseAddendumPrefix(text, addendum) > 0) {
        return utils::startsWith(text, "Add.") ? Style::ABBREV : Style::LONG;
    }

    for (Publisher publisher : allPublishers()) {
        if (utils::startsWith(text, publisherLongName(publisher) + " ")) {
            return Style::LONG;
        }
        if (utils::startsWith(text, publisherAbbrevName(publisher) + " ")) {
            return Style::ABBREV;
        }
    }

    if (auto title = registry.matchTitle(std::nullopt, text)) {
        return title->style;
    }

    return hasWhitespace(text) ? Style::SHORT : Style::MR;
}

Identifier parseIdentifier(const std::string& text,
                           const SeriesRegistry& registry,
                           const ParseOptions& options) {
    std::string input = utils::trim(text);
    if (input.empty()) {
        fail(ParseErrorKind::MALFORMED_DOCNUMBER, text, "empty identifier");
    }

    Style style = detectStyle(input, registry);
    spdlog::trace("Parsing PubID '{}' as {}", input, styleToString(style));

    if (style == Style::LONG || style == Style::ABBREV) {
        return parseHuman(input, registry);
    }
    return parseCompact(input, style, registry, options);
}

} // namespace pubid
