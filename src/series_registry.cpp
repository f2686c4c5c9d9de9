/**
 * @file series_registry.cpp
 * @brief Series registry implementation
 */

#include "pubid/series_registry.h"
#include "pubid/errors.h"
#include "pubid/series_sources.h"
#include "pubid/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace pubid {

const char* const SeriesRegistry::GENERIC_DOCNUMBER_PATTERN = "[0-9][0-9A-Z]*(-[0-9A-Z]+)*";

std::unique_ptr<SeriesRegistry> SeriesRegistry::defaultInstance_ = nullptr;
std::once_flag SeriesRegistry::defaultInitFlag_;

namespace {

/// Collapse runs of spaces/dots in a code to single spaces ("FIPS.PUB" -> "FIPS PUB")
std::string canonicalCode(const std::string& code) {
    std::vector<std::string> words;
    std::string word;
    for (char c : code) {
        if (c == ' ' || c == '.') {
            if (!word.empty()) {
                words.push_back(word);
                word.clear();
            }
        } else {
            word += c;
        }
    }
    if (!word.empty()) {
        words.push_back(word);
    }
    return utils::toUpperCase(utils::join(words, " "));
}

/// Series codes are letter words so the parser can tell them from docnumbers
bool isValidCode(const std::string& code) {
    if (code.empty() || code.front() == ' ' || code.back() == ' ') {
        return false;
    }
    for (char c : code) {
        if (!std::isalpha(static_cast<unsigned char>(c)) && c != '-' && c != ' ') {
            return false;
        }
    }
    return true;
}

std::string describe(const std::vector<Publisher>& publishers) {
    std::vector<std::string> names;
    for (Publisher p : publishers) {
        names.push_back(publisherToString(p));
    }
    return utils::join(names, ",");
}

} // namespace

bool SeriesEntry::isIssuedBy(Publisher publisher) const {
    return std::find(publishers.begin(), publishers.end(), publisher) != publishers.end();
}

std::string SeriesEntry::mrCode() const {
    return utils::replaceAll(code, " ", ".");
}

SeriesRegistry::SeriesRegistry(const ISeriesSource& source) {
    std::vector<SeriesEntry> series = source.loadSeries();
    std::vector<SeriesAlias> aliases = source.loadAliases();

    // entries_ must not reallocate once resolutions hand out pointers into it
    entries_.reserve(series.size());
    patterns_.reserve(series.size());

    for (auto& entry : series) {
        addEntry(std::move(entry));
    }
    for (auto& alias : aliases) {
        addAlias(std::move(alias));
    }

    spdlog::info("Series registry loaded from {}: {} series, {} aliases",
                 source.getName(), entries_.size(), aliases_.size());
}

const SeriesRegistry& SeriesRegistry::defaultRegistry() {
    std::call_once(defaultInitFlag_, []() {
        defaultInstance_.reset(new SeriesRegistry(BuiltinSeriesSource()));
    });
    return *defaultInstance_;
}

void SeriesRegistry::addEntry(SeriesEntry entry) {
    entry.code = canonicalCode(entry.code);

    if (!isValidCode(entry.code)) {
        throw RegistryError("invalid series code '" + entry.code + "'");
    }
    if (entry.publishers.empty()) {
        throw RegistryError("series '" + entry.code + "' has no publisher");
    }
    if (entry.longTitle.empty() || entry.abbrevTitle.empty()) {
        throw RegistryError("series '" + entry.code + "' is missing a title");
    }
    if (entry.embedsOrganization && entry.publishers.size() != 1) {
        throw RegistryError("series '" + entry.code +
                            "' embeds the organization name but lists publishers " +
                            describe(entry.publishers));
    }

    std::regex pattern;
    try {
        pattern = std::regex(entry.docNumberPattern.empty()
                                 ? std::string(GENERIC_DOCNUMBER_PATTERN)
                                 : entry.docNumberPattern);
    } catch (const std::regex_error& e) {
        throw RegistryError("series '" + entry.code + "' has an invalid docnumber pattern: " +
                            e.what());
    }

    size_t index = entries_.size();
    std::string key = utils::normalizeKey(entry.code);

    for (Publisher publisher : entry.publishers) {
        Key k{publisher, key};
        if (canonical_.count(k)) {
            throw RegistryError("duplicate series code '" + entry.code + "' for " +
                                publisherToString(publisher));
        }
        canonical_[k] = index;
        addTitle(longTitles_, publisher, entry.longTitle, index);
        if (entry.abbrevTitle != entry.longTitle) {
            addTitle(abbrevTitles_, publisher, entry.abbrevTitle, index);
        }
    }

    spdlog::debug("Registered series '{}' ({})", entry.code, describe(entry.publishers));

    entries_.push_back(std::move(entry));
    patterns_.push_back(std::move(pattern));
}

void SeriesRegistry::addTitle(std::map<Key, size_t>& index, Publisher publisher,
                              const std::string& title, size_t entryIndex) {
    Key k{publisher, title};
    auto clash = [&](const std::map<Key, size_t>& other) {
        auto it = other.find(k);
        return it != other.end() && it->second != entryIndex;
    };
    if (clash(longTitles_) || clash(abbrevTitles_)) {
        throw RegistryError("title '" + title + "' is used by more than one series of " +
                            publisherToString(publisher));
    }
    index[k] = entryIndex;
}

void SeriesRegistry::addAlias(SeriesAlias alias) {
    alias.target = canonicalCode(alias.target);
    std::string key = utils::normalizeKey(alias.token);
    std::string targetKey = utils::normalizeKey(alias.target);

    if (key.empty()) {
        throw RegistryError("alias for '" + alias.target + "' has an empty token");
    }

    if (alias.impliedPublisher) {
        Publisher publisher = *alias.impliedPublisher;
        auto it = canonical_.find(Key{publisher, targetKey});
        if (it == canonical_.end()) {
            throw RegistryError("alias '" + alias.token + "' targets unknown series '" +
                                alias.target + "' for " + publisherToString(publisher));
        }
        if (impliedAliases_.count(key)) {
            throw RegistryError("duplicate alias '" + alias.token + "'");
        }
        for (Publisher other : allPublishers()) {
            if (canonical_.count(Key{other, key})) {
                throw RegistryError("alias '" + alias.token + "' shadows a canonical series code");
            }
        }
        impliedAliases_[key] = {publisher, it->second};
    } else {
        std::vector<Publisher> publishers = alias.publishers;
        bool explicitPublishers = !publishers.empty();
        if (!explicitPublishers) {
            publishers = allPublishers();
        }

        bool registered = false;
        for (Publisher publisher : publishers) {
            auto it = canonical_.find(Key{publisher, targetKey});
            if (it == canonical_.end()) {
                if (explicitPublishers) {
                    throw RegistryError("alias '" + alias.token + "' targets unknown series '" +
                                        alias.target + "' for " + publisherToString(publisher));
                }
                continue;
            }
            Key k{publisher, key};
            if (canonical_.count(k) || aliasTargets_.count(k)) {
                throw RegistryError("alias '" + alias.token + "' is ambiguous for " +
                                    publisherToString(publisher));
            }
            aliasTargets_[k] = it->second;
            registered = true;
        }
        if (!registered) {
            throw RegistryError("alias '" + alias.token + "' targets unknown series '" +
                                alias.target + "'");
        }
    }

    spdlog::debug("Registered alias '{}' -> '{}'", alias.token, alias.target);
    aliases_.push_back(std::move(alias));
}

std::optional<SeriesResolution> SeriesRegistry::resolve(
    std::optional<Publisher> publisherHint,
    const std::string& token) const {

    std::string key = utils::normalizeKey(token);
    if (key.empty()) {
        return std::nullopt;
    }

    if (publisherHint) {
        auto canon = canonical_.find(Key{*publisherHint, key});
        if (canon != canonical_.end()) {
            return SeriesResolution{*publisherHint, &entries_[canon->second], false};
        }

        auto alias = aliasTargets_.find(Key{*publisherHint, key});
        if (alias != aliasTargets_.end()) {
            spdlog::debug("Series token '{}' resolved through legacy alias to '{}'",
                          token, entries_[alias->second].code);
            return SeriesResolution{*publisherHint, &entries_[alias->second], true};
        }
    }

    auto implied = impliedAliases_.find(key);
    if (implied != impliedAliases_.end() &&
        (!publisherHint || *publisherHint == implied->second.first)) {
        spdlog::debug("Series token '{}' implies publisher {}",
                      token, publisherToString(implied->second.first));
        return SeriesResolution{implied->second.first, &entries_[implied->second.second], true};
    }

    return std::nullopt;
}

std::optional<TitleMatch> SeriesRegistry::matchTitle(
    std::optional<Publisher> publisherHint,
    const std::string& text) const {

    std::optional<TitleMatch> best;

    auto scan = [&](const std::map<Key, size_t>& titles, Style style) {
        for (const auto& [key, index] : titles) {
            const SeriesEntry& entry = entries_[index];
            if (publisherHint ? key.first != *publisherHint : !entry.embedsOrganization) {
                continue;
            }
            const std::string& title = key.second;
            if (!utils::startsWith(text, title)) {
                continue;
            }
            if (text.size() != title.size() && text[title.size()] != ' ') {
                continue;
            }
            if (!best || title.size() > best->length) {
                best = TitleMatch{SeriesResolution{key.first, &entry, false}, title.size(), style};
            }
        }
    };

    scan(longTitles_, Style::LONG);
    scan(abbrevTitles_, Style::ABBREV);

    return best;
}

const SeriesEntry* SeriesRegistry::findByCode(Publisher publisher, const std::string& code) const {
    auto it = canonical_.find(Key{publisher, utils::normalizeKey(code)});
    if (it == canonical_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

bool SeriesRegistry::matchesDocNumber(const SeriesEntry& entry, const std::string& docNumber) const {
    if (docNumber.empty()) {
        return false;
    }
    for (size_t i = 0; i < entries_.size(); i++) {
        if (&entries_[i] == &entry) {
            return std::regex_match(docNumber, patterns_[i]);
        }
    }
    // Entry from another registry: fall back to its own pattern
    std::regex pattern(entry.docNumberPattern.empty()
                           ? std::string(GENERIC_DOCNUMBER_PATTERN)
                           : entry.docNumberPattern);
    return std::regex_match(docNumber, pattern);
}

} // namespace pubid
