/**
 * @file test_renderer.cpp
 * @brief Unit tests for rendering identifiers in the four styles
 */

#include <gtest/gtest.h>
#include "pubid/identifier.h"
#include "pubid/renderer.h"

using namespace pubid;

namespace {

const std::string NIST_LONG = "National Institute of Standards and Technology";
const std::string NIST_ABBREV = "Natl. Inst. Stand. Technol.";

} // namespace

class RendererTest : public ::testing::Test {
protected:
    static Identifier sp(const std::string& docNumber, Qualifiers q = {}) {
        return Identifier(Publisher::NIST, "SP", docNumber, std::move(q));
    }
};

TEST_F(RendererTest, AllStyles_Revision) {
    Qualifiers q;
    q.revision = 5;
    auto id = sp("800-53", q);

    EXPECT_EQ(render(id, Style::SHORT), "NIST SP 800-53r5");
    EXPECT_EQ(render(id, Style::MR), "NIST.SP.800-53r5");
    EXPECT_EQ(render(id, Style::LONG), NIST_LONG + " Special Publication 800-53, Revision 5");
    EXPECT_EQ(render(id, Style::ABBREV), NIST_ABBREV + " Spec. Publ. 800-53, Rev. 5");
}

TEST_F(RendererTest, ToStringDefaultsToShort) {
    auto id = sp("800-53");
    EXPECT_EQ(id.toString(), render(id, Style::SHORT));
}

TEST_F(RendererTest, NbsPublisher) {
    Identifier id(Publisher::NBS, "CIRC", "13");
    EXPECT_EQ(render(id, Style::SHORT), "NBS CIRC 13");
    EXPECT_EQ(render(id, Style::LONG), "National Bureau of Standards Circular 13");
    EXPECT_EQ(render(id, Style::ABBREV), "Natl. Bur. Stand. Circ. 13");
}

TEST_F(RendererTest, PartAndRevision) {
    Qualifiers q;
    q.part = "1";
    q.revision = 4;
    auto id = sp("800-57", q);

    EXPECT_EQ(render(id, Style::SHORT), "NIST SP 800-57pt1r4");
    EXPECT_EQ(render(id, Style::LONG), NIST_LONG + " Special Publication 800-57 Part 1, Revision 4");
    EXPECT_EQ(render(id, Style::ABBREV), NIST_ABBREV + " Spec. Publ. 800-57 Pt. 1, Rev. 4");
}

TEST_F(RendererTest, Volume) {
    Qualifiers q;
    q.volume = 1;
    Identifier id(Publisher::NIST, "NCSTAR", "1-1C", q);

    EXPECT_EQ(render(id, Style::SHORT), "NIST NCSTAR 1-1Cv1");
    EXPECT_EQ(render(id, Style::MR), "NIST.NCSTAR.1-1Cv1");
    EXPECT_EQ(render(id, Style::LONG),
              NIST_LONG + " National Construction Safety Team Report 1-1C, Volume 1");
    EXPECT_EQ(render(id, Style::ABBREV), NIST_ABBREV + " Natl. Constr. Tm. Act Rpt. 1-1C, Vol. 1");
}

TEST_F(RendererTest, StageAndEdition) {
    Qualifiers q;
    q.stage = Stage::IPD;
    q.edition = 5;
    auto id = sp("800-53", q);

    EXPECT_EQ(render(id, Style::SHORT), "NIST SP(IPD) 800-53e5");
    EXPECT_EQ(render(id, Style::MR), "NIST.SP.IPD.800-53e5");
    EXPECT_EQ(render(id, Style::LONG),
              NIST_LONG + " Special Publication Initial Public Draft 800-53 Edition 5");
    EXPECT_EQ(render(id, Style::ABBREV),
              NIST_ABBREV + " Spec. Publ. Initial Public Draft 800-53 Ed. 5");
}

TEST_F(RendererTest, Addendum) {
    Qualifiers q;
    q.addendum = 1;
    auto id = sp("800-38A", q);

    EXPECT_EQ(render(id, Style::SHORT), "NIST SP 800-38A Addendum");
    EXPECT_EQ(render(id, Style::MR), "NIST.SP.800-38A.add-1");
    EXPECT_EQ(render(id, Style::LONG), "Addendum to " + NIST_LONG + " Special Publication 800-38A");
    EXPECT_EQ(render(id, Style::ABBREV), "Add. to " + NIST_ABBREV + " Spec. Publ. 800-38A");
}

TEST_F(RendererTest, Update) {
    Qualifiers q;
    q.revision = 4;
    q.update = Update{3, "2015"};
    auto id = sp("800-53", q);

    EXPECT_EQ(render(id, Style::SHORT), "NIST SP 800-53r4/Upd 3:2015");
    EXPECT_EQ(render(id, Style::MR), "NIST.SP.800-53r4.u3-2015");
    EXPECT_EQ(render(id, Style::LONG),
              NIST_LONG + " Special Publication 800-53, Revision 4 Update 3:2015");
    EXPECT_EQ(render(id, Style::ABBREV), NIST_ABBREV + " Spec. Publ. 800-53, Rev. 4 Upd. 3:2015");
}

TEST_F(RendererTest, Translation) {
    Qualifiers q;
    q.translation = "esp";
    Identifier id(Publisher::NIST, "IR", "8115", q);

    EXPECT_EQ(render(id, Style::SHORT), "NIST IR 8115(esp)");
    EXPECT_EQ(render(id, Style::MR), "NIST.IR.8115(esp)");
    EXPECT_EQ(render(id, Style::LONG), NIST_LONG + " Interagency or Internal Report 8115 (ESP)");
}

TEST_F(RendererTest, MultiWordSeries) {
    Identifier id(Publisher::NIST, "FIPS PUB", "140-3");
    EXPECT_EQ(render(id, Style::SHORT), "NIST FIPS PUB 140-3");
    EXPECT_EQ(render(id, Style::MR), "NIST.FIPS.PUB.140-3");
    EXPECT_EQ(render(id, Style::LONG),
              NIST_LONG + " Federal Information Processing Standards Publication 140-3");
}

TEST_F(RendererTest, OrganizationEmbeddingTitle) {
    Identifier id(Publisher::NIST, "CSWP", "12");
    EXPECT_EQ(render(id, Style::LONG), "NIST Cybersecurity White Paper 12");
    EXPECT_EQ(render(id, Style::ABBREV), "NIST Cybersecur. White Pap. 12");
    EXPECT_EQ(render(id, Style::SHORT), "NIST CSWP 12");
}

TEST_F(RendererTest, GluedSeriesRendersSpaced) {
    Identifier id(Publisher::NBS, "CRPL-F-B", "150");
    EXPECT_EQ(render(id, Style::SHORT), "NBS CRPL-F-B 150");
    EXPECT_EQ(render(id, Style::MR), "NBS.CRPL-F-B.150");
}
