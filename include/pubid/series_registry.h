/**
 * @file series_registry.h
 * @brief Registry of publication series and their legacy aliases
 *
 * Maps a (publisher, series code) pair to the series metadata used for
 * rendering. Lookup is case- and punctuation-insensitive and covers:
 * - canonical codes per publisher ("SP", "FIPS PUB")
 * - series issued by both NBS and NIST (one entry, several publishers)
 * - legacy aliases, reified as SeriesAlias records ("NISTIR", "FIPS")
 *
 * The registry is read-only after construction and can be shared across
 * threads. Ambiguous sources are rejected when the registry is built, so a
 * token resolves to exactly one entry or to nothing.
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#pragma once

#include "pubid/publisher.h"
#include "pubid/style.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace pubid {

/**
 * @brief Metadata of one publication series
 */
struct SeriesEntry {
    std::string code;                   ///< Canonical short code, words separated by one space ("FIPS PUB")
    std::vector<Publisher> publishers;  ///< Organizations that issued the series
    std::string longTitle;              ///< "Special Publication"
    std::string abbrevTitle;            ///< "Spec. Publ."
    bool embedsOrganization = false;    ///< Titles already name the organization
    bool supportsParts = true;          ///< Identifiers may carry a part ("pt1")
    bool supportsVolumes = true;        ///< Identifiers may carry a volume ("v1")
    bool gluedDocNumber = false;        ///< Compact input may omit the space before the docnumber ("CRPL-F-B150")
    std::string docNumberPattern;       ///< ECMAScript regex; empty = generic docnumber grammar

    /// @brief True if the series was issued by the publisher
    bool isIssuedBy(Publisher publisher) const;

    /// @brief Code as written in MR form ("FIPS.PUB")
    std::string mrCode() const;
};

/**
 * @brief Legacy or alternative spelling of a series code
 *
 * Two flavours:
 * - impliedPublisher set: the token carries the organization itself
 *   ("NISTIR" means NIST IR) and resolves without a publisher token.
 * - impliedPublisher empty: a retired spelling valid for the listed
 *   publishers ("FIPS" means "FIPS PUB"); an empty list means every
 *   publisher of the target series.
 */
struct SeriesAlias {
    std::string token;
    std::vector<Publisher> publishers;
    std::optional<Publisher> impliedPublisher;
    std::string target;                 ///< Canonical code of the target entry
};

/**
 * @brief Source of registry data
 *
 * Decouples the registry from where the series table is authored.
 */
class ISeriesSource {
public:
    virtual ~ISeriesSource() = default;

    virtual std::vector<SeriesEntry> loadSeries() const = 0;

    virtual std::vector<SeriesAlias> loadAliases() const = 0;

    /// @brief Name used in log messages
    virtual std::string getName() const = 0;
};

/// @brief Outcome of a successful series lookup
struct SeriesResolution {
    Publisher publisher;
    const SeriesEntry* entry = nullptr;
    bool viaAlias = false;              ///< Resolved through a legacy alias
};

/// @brief Series title found at the start of a human-form string
struct TitleMatch {
    SeriesResolution resolution;
    size_t length = 0;                  ///< Characters consumed by the title
    Style style = Style::LONG;          ///< LONG or ABBREV, whichever title matched
};

/**
 * @brief Read-only lookup table of series
 */
class SeriesRegistry {
public:
    /**
     * @brief Build the registry from a source
     * @throws RegistryError if the source is malformed or ambiguous
     */
    explicit SeriesRegistry(const ISeriesSource& source);

    SeriesRegistry(const SeriesRegistry&) = delete;
    SeriesRegistry& operator=(const SeriesRegistry&) = delete;

    /**
     * @brief Process-wide registry over the built-in series table
     *
     * Created on first use; safe to call from several threads.
     */
    static const SeriesRegistry& defaultRegistry();

    /**
     * @brief Resolve a series token
     *
     * With a publisher hint, canonical codes are tried first, then aliases
     * valid for that publisher. Without a hint only publisher-implying
     * aliases ("NISTIR") can match.
     *
     * @param publisherHint Publisher named in the identifier, if any
     * @param token Series token in any case and punctuation ("fips.pub")
     * @return Resolution, or std::nullopt if nothing matches
     *
     * @example
     * auto r = registry.resolve(Publisher::NBS, "FIPS");
     * // r->entry->code == "FIPS PUB", r->viaAlias == true
     */
    std::optional<SeriesResolution> resolve(
        std::optional<Publisher> publisherHint,
        const std::string& token) const;

    /**
     * @brief Find the longest series title that prefixes text
     *
     * A title matches only when followed by a space or the end of text.
     * Without a hint only titles that embed the organization are tried.
     */
    std::optional<TitleMatch> matchTitle(
        std::optional<Publisher> publisherHint,
        const std::string& text) const;

    /**
     * @brief Exact canonical lookup (no aliases)
     * @return Entry, or nullptr if the publisher has no such series
     */
    const SeriesEntry* findByCode(Publisher publisher, const std::string& code) const;

    /**
     * @brief Check a document number against the series grammar
     */
    bool matchesDocNumber(const SeriesEntry& entry, const std::string& docNumber) const;

    const std::vector<SeriesEntry>& entries() const { return entries_; }

    const std::vector<SeriesAlias>& aliases() const { return aliases_; }

    /// @brief Generic docnumber grammar used when an entry has no pattern
    static const char* const GENERIC_DOCNUMBER_PATTERN;

private:
    using Key = std::pair<Publisher, std::string>;

    void addEntry(SeriesEntry entry);
    void addAlias(SeriesAlias alias);
    void addTitle(std::map<Key, size_t>& index, Publisher publisher,
                  const std::string& title, size_t entryIndex);

    std::vector<SeriesEntry> entries_;
    std::vector<SeriesAlias> aliases_;
    std::vector<std::regex> patterns_;              ///< Parallel to entries_

    std::map<Key, size_t> canonical_;               ///< (publisher, key) -> entry
    std::map<Key, size_t> aliasTargets_;            ///< (publisher, alias key) -> entry
    std::map<std::string, std::pair<Publisher, size_t>> impliedAliases_;  ///< key -> (publisher, entry)
    std::map<Key, size_t> longTitles_;              ///< (publisher, title) -> entry
    std::map<Key, size_t> abbrevTitles_;            ///< (publisher, title) -> entry

    static std::unique_ptr<SeriesRegistry> defaultInstance_;
    static std::once_flag defaultInitFlag_;
};

} // namespace pubid
