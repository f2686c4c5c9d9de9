/**
 * @file test_vocabulary.cpp
 * @brief Unit tests for publisher, stage and style vocabularies and errors
 */

#include <gtest/gtest.h>
#include "pubid/errors.h"
#include "pubid/publisher.h"
#include "pubid/stage.h"
#include "pubid/style.h"

using namespace pubid;

// =============================================================================
// Publisher
// =============================================================================

TEST(PublisherTest, Names) {
    EXPECT_EQ(publisherToString(Publisher::NIST), "NIST");
    EXPECT_EQ(publisherToString(Publisher::NBS), "NBS");
    EXPECT_EQ(publisherLongName(Publisher::NIST), "National Institute of Standards and Technology");
    EXPECT_EQ(publisherLongName(Publisher::NBS), "National Bureau of Standards");
    EXPECT_EQ(publisherAbbrevName(Publisher::NIST), "Natl. Inst. Stand. Technol.");
    EXPECT_EQ(publisherAbbrevName(Publisher::NBS), "Natl. Bur. Stand.");
}

TEST(PublisherTest, FromString_CaseInsensitive) {
    EXPECT_EQ(publisherFromString("nist"), Publisher::NIST);
    EXPECT_EQ(publisherFromString("NBS"), Publisher::NBS);
    EXPECT_FALSE(publisherFromString("NISTIR").has_value());
    EXPECT_FALSE(publisherFromString("").has_value());
}

TEST(PublisherTest, AllPublishers_CurrentFirst) {
    const auto& publishers = allPublishers();
    ASSERT_EQ(publishers.size(), 2u);
    EXPECT_EQ(publishers[0], Publisher::NIST);
    EXPECT_EQ(publishers[1], Publisher::NBS);
}

// =============================================================================
// Stage
// =============================================================================

TEST(StageTest, CodesAndTitles) {
    EXPECT_EQ(stageToCode(Stage::IPD), "IPD");
    EXPECT_EQ(stageToCode(Stage::SPD), "2PD");
    EXPECT_EQ(stageToCode(Stage::TPD), "3PD");
    EXPECT_EQ(stageTitle(Stage::IPD), "Initial Public Draft");
    EXPECT_EQ(stageTitle(Stage::FPD), "Final Public Draft");
    EXPECT_EQ(stageTitle(Stage::WD), "Work-in-Progress Draft");
}

TEST(StageTest, FromCode) {
    EXPECT_EQ(stageFromCode("ipd"), Stage::IPD);
    EXPECT_EQ(stageFromCode("2PD"), Stage::SPD);
    EXPECT_FALSE(stageFromCode("XPD").has_value());
}

TEST(StageTest, CodeAndTitleAreInverse) {
    for (Stage stage : allStages()) {
        EXPECT_EQ(stageFromCode(stageToCode(stage)), stage);
        EXPECT_EQ(stageFromTitle(stageTitle(stage)), stage);
    }
}

// =============================================================================
// Style
// =============================================================================

TEST(StyleTest, Names) {
    EXPECT_EQ(styleToString(Style::LONG), "long");
    EXPECT_EQ(styleToString(Style::ABBREV), "abbrev");
    EXPECT_EQ(styleToString(Style::SHORT), "short");
    EXPECT_EQ(styleToString(Style::MR), "mr");
}

TEST(StyleTest, ParseStyle) {
    EXPECT_EQ(parseStyle("MR"), Style::MR);
    EXPECT_EQ(parseStyle(" abbrev "), Style::ABBREV);
    EXPECT_FALSE(parseStyle("medium").has_value());
    EXPECT_EQ(allStyles().size(), 4u);
}

// =============================================================================
// Errors
// =============================================================================

TEST(ErrorsTest, ParseErrorCarriesKindAndInput) {
    ParseError error(ParseErrorKind::UNKNOWN_SERIES, "NIST XX 1", "unknown series 'XX'");

    EXPECT_EQ(error.getKind(), ParseErrorKind::UNKNOWN_SERIES);
    EXPECT_EQ(error.getCode(), "UNKNOWN_SERIES");
    EXPECT_EQ(error.getInput(), "NIST XX 1");
    EXPECT_NE(std::string(error.what()).find("NIST XX 1"), std::string::npos);
}

TEST(ErrorsTest, HierarchyCatchableAsBase) {
    bool caught = false;
    try {
        throw InvalidModelError("revision and edition are mutually exclusive");
    } catch (const PubIdException& e) {
        caught = true;
        EXPECT_EQ(e.getCode(), "INVALID_MODEL");
    }
    EXPECT_TRUE(caught);

    EXPECT_THROW(throw RegistryError("bad"), std::runtime_error);
}

TEST(ErrorsTest, KindToString) {
    EXPECT_EQ(parseErrorKindToString(ParseErrorKind::MALFORMED_DOCNUMBER), "MALFORMED_DOCNUMBER");
}
