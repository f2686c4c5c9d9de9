/**
 * @file series_sources.h
 * @brief Concrete series sources
 *
 *   - BuiltinSeriesSource: the series table compiled into the library
 *   - JsonSeriesSource: series and aliases supplied as a JSON document
 */

#pragma once

#include "pubid/series_registry.h"
#include <json/json.h>
#include <string>
#include <vector>

namespace pubid {

/**
 * @brief Built-in NIST/NBS series table
 */
class BuiltinSeriesSource : public ISeriesSource {
public:
    std::vector<SeriesEntry> loadSeries() const override;
    std::vector<SeriesAlias> loadAliases() const override;
    std::string getName() const override { return "builtin"; }
};

/**
 * @brief Series table read from a JSON document
 *
 * Expected shape:
 * @code
 * {
 *   "series": [
 *     {"code": "SP", "publishers": ["NBS", "NIST"],
 *      "long": "Special Publication", "abbrev": "Spec. Publ.",
 *      "embedsOrganization": false, "supportsParts": true,
 *      "supportsVolumes": true, "docNumberPattern": ""}
 *   ],
 *   "aliases": [
 *     {"token": "NISTIR", "impliedPublisher": "NIST", "target": "IR"},
 *     {"token": "FIPS", "publishers": [], "target": "FIPS PUB"}
 *   ]
 * }
 * @endcode
 *
 * Only "code", "publishers", "long" and "abbrev" are required for a series;
 * "token" and "target" for an alias.
 */
class JsonSeriesSource : public ISeriesSource {
public:
    /**
     * @brief Parse the document
     * @param document JSON text
     * @param name Name used in log messages
     * @throws RegistryError if the text is not valid JSON or a record is malformed
     */
    explicit JsonSeriesSource(const std::string& document, std::string name = "json");

    std::vector<SeriesEntry> loadSeries() const override { return series_; }
    std::vector<SeriesAlias> loadAliases() const override { return aliases_; }
    std::string getName() const override { return name_; }

private:
    static SeriesEntry seriesFromJson(const Json::Value& json);
    static SeriesAlias aliasFromJson(const Json::Value& json);
    static std::vector<Publisher> publishersFromJson(const Json::Value& json, const std::string& context);

    std::string name_;
    std::vector<SeriesEntry> series_;
    std::vector<SeriesAlias> aliases_;
};

/**
 * @brief Serialize a registry back into the JsonSeriesSource document shape
 */
Json::Value registryToJson(const SeriesRegistry& registry);

} // namespace pubid
