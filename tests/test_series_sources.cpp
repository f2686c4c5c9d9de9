/**
 * @file test_series_sources.cpp
 * @brief Unit tests for the built-in and JSON series sources
 */

#include <gtest/gtest.h>
#include "pubid/errors.h"
#include "pubid/identifier.h"
#include "pubid/series_sources.h"
#include <json/json.h>

using namespace pubid;

namespace {

const char* const SAMPLE_DOCUMENT = R"({
  "series": [
    {
      "code": "SP",
      "publishers": ["NIST", "NBS"],
      "long": "Special Publication",
      "abbrev": "Spec. Publ."
    },
    {
      "code": "TR",
      "publishers": ["NIST"],
      "long": "Technical Report",
      "abbrev": "Tech. Rep.",
      "supportsVolumes": false,
      "gluedDocNumber": true,
      "docNumberPattern": "[0-9]+"
    }
  ],
  "aliases": [
    { "token": "NISTTR", "target": "TR", "impliedPublisher": "NIST" },
    { "token": "SPUB", "target": "SP", "publishers": ["NBS"] }
  ]
})";

} // namespace

class JsonSeriesSourceTest : public ::testing::Test {
protected:
    JsonSeriesSource source{SAMPLE_DOCUMENT, "sample"};
};

TEST_F(JsonSeriesSourceTest, LoadsSeries) {
    auto series = source.loadSeries();
    ASSERT_EQ(series.size(), 2u);

    EXPECT_EQ(series[0].code, "SP");
    EXPECT_EQ(series[0].publishers.size(), 2u);
    EXPECT_EQ(series[0].longTitle, "Special Publication");
    EXPECT_TRUE(series[0].supportsParts);
    EXPECT_TRUE(series[0].supportsVolumes);
    EXPECT_TRUE(series[0].docNumberPattern.empty());

    EXPECT_FALSE(series[0].gluedDocNumber);
    EXPECT_FALSE(series[1].supportsVolumes);
    EXPECT_TRUE(series[1].gluedDocNumber);
    EXPECT_EQ(series[1].docNumberPattern, "[0-9]+");
    EXPECT_EQ(source.getName(), "sample");
}

TEST_F(JsonSeriesSourceTest, LoadsAliases) {
    auto aliases = source.loadAliases();
    ASSERT_EQ(aliases.size(), 2u);

    EXPECT_EQ(aliases[0].token, "NISTTR");
    ASSERT_TRUE(aliases[0].impliedPublisher.has_value());
    EXPECT_EQ(*aliases[0].impliedPublisher, Publisher::NIST);

    EXPECT_FALSE(aliases[1].impliedPublisher.has_value());
    ASSERT_EQ(aliases[1].publishers.size(), 1u);
    EXPECT_EQ(aliases[1].publishers[0], Publisher::NBS);
}

TEST_F(JsonSeriesSourceTest, RegistryFromDocument) {
    SeriesRegistry registry(source);

    auto implied = registry.resolve(std::nullopt, "NISTTR");
    ASSERT_TRUE(implied.has_value());
    EXPECT_EQ(implied->entry->code, "TR");

    EXPECT_TRUE(registry.resolve(Publisher::NBS, "SPUB").has_value());
    EXPECT_FALSE(registry.resolve(Publisher::NIST, "SPUB").has_value());

    // Identifiers can use a custom registry
    auto id = Identifier::parse("NISTTR 12", registry);
    EXPECT_EQ(id.toString(), "NIST TR 12");
    EXPECT_EQ(id.toString(Style::LONG),
              "National Institute of Standards and Technology Technical Report 12");

    EXPECT_EQ(Identifier::parse("NIST TR12", registry).toString(), "NIST TR 12");
    EXPECT_THROW(Identifier::parse("NIST SP800", registry), ParseError);
    EXPECT_THROW(Identifier::parse("NIST TR 12-1", registry), ParseError);
    EXPECT_THROW(Identifier::parse("NIST TN 12", registry), ParseError);
}

TEST(JsonSeriesSourceErrorTest, InvalidJson) {
    EXPECT_THROW(JsonSeriesSource("{ not json"), RegistryError);
}

TEST(JsonSeriesSourceErrorTest, MissingSeriesArray) {
    EXPECT_THROW(JsonSeriesSource(R"({"aliases": []})"), RegistryError);
    EXPECT_THROW(JsonSeriesSource(R"([1, 2])"), RegistryError);
}

TEST(JsonSeriesSourceErrorTest, MissingRequiredField) {
    EXPECT_THROW(JsonSeriesSource(R"({"series": [{"code": "SP", "publishers": ["NIST"],
                                                  "long": "Special Publication"}]})"),
                 RegistryError);
}

TEST(JsonSeriesSourceErrorTest, UnknownPublisher) {
    EXPECT_THROW(JsonSeriesSource(R"({"series": [{"code": "SP", "publishers": ["ANSI"],
                                                  "long": "L", "abbrev": "A"}]})"),
                 RegistryError);
}

TEST(JsonSeriesSourceErrorTest, WrongFieldType) {
    EXPECT_THROW(JsonSeriesSource(R"({"series": [{"code": "SP", "publishers": ["NIST"],
                                                  "long": "L", "abbrev": "A",
                                                  "supportsParts": "yes"}]})"),
                 RegistryError);
    EXPECT_THROW(JsonSeriesSource(R"({"series": [], "aliases": {}})"), RegistryError);
}

// =============================================================================
// Built-in table and export
// =============================================================================

TEST(BuiltinSeriesSourceTest, LoadsIntoRegistry) {
    BuiltinSeriesSource source;
    EXPECT_EQ(source.getName(), "builtin");

    SeriesRegistry registry(source);
    EXPECT_EQ(registry.entries().size(), source.loadSeries().size());
    EXPECT_EQ(registry.aliases().size(), source.loadAliases().size());
}

TEST(BuiltinSeriesSourceTest, ExportedDocumentRebuildsRegistry) {
    const SeriesRegistry& registry = SeriesRegistry::defaultRegistry();
    Json::Value exported = registryToJson(registry);

    ASSERT_TRUE(exported["series"].isArray());
    EXPECT_EQ(exported["series"].size(), registry.entries().size());

    Json::StreamWriterBuilder writer;
    JsonSeriesSource reloaded(Json::writeString(writer, exported), "exported");
    SeriesRegistry copy(reloaded);

    ASSERT_EQ(copy.entries().size(), registry.entries().size());
    for (size_t i = 0; i < copy.entries().size(); i++) {
        const SeriesEntry& a = registry.entries()[i];
        const SeriesEntry& b = copy.entries()[i];
        EXPECT_EQ(a.code, b.code);
        EXPECT_EQ(a.publishers, b.publishers);
        EXPECT_EQ(a.longTitle, b.longTitle);
        EXPECT_EQ(a.abbrevTitle, b.abbrevTitle);
        EXPECT_EQ(a.embedsOrganization, b.embedsOrganization);
        EXPECT_EQ(a.gluedDocNumber, b.gluedDocNumber);
        EXPECT_EQ(a.docNumberPattern, b.docNumberPattern);
    }

    auto r = copy.resolve(Publisher::NBS, "FIPS");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->entry->code, "FIPS PUB");
}
