/**
 * @file builtin_series.cpp
 * @brief Built-in NIST/NBS series table
 */

#include "pubid/series_sources.h"

namespace pubid {

namespace {

const std::vector<Publisher> BOTH = {Publisher::NBS, Publisher::NIST};
const std::vector<Publisher> NIST_ONLY = {Publisher::NIST};
const std::vector<Publisher> NBS_ONLY = {Publisher::NBS};

SeriesEntry series(const std::string& code,
                   const std::vector<Publisher>& publishers,
                   const std::string& longTitle,
                   const std::string& abbrevTitle) {
    SeriesEntry entry;
    entry.code = code;
    entry.publishers = publishers;
    entry.longTitle = longTitle;
    entry.abbrevTitle = abbrevTitle;
    return entry;
}

} // namespace

std::vector<SeriesEntry> BuiltinSeriesSource::loadSeries() const {
    std::vector<SeriesEntry> table = {
        // Series carried over from NBS to NIST
        series("SP", BOTH, "Special Publication", "Spec. Publ."),
        series("IR", BOTH, "Interagency or Internal Report", "Interagency or Internal Report"),
        series("TN", BOTH, "Technical Note", "Tech. Note"),
        series("HB", BOTH, "Handbook", "Handb."),
        series("MONO", BOTH, "Monograph", "Monogr."),
        series("FIPS PUB", BOTH, "Federal Information Processing Standards Publication",
               "Federal Inf. Process. Stds."),
        series("BSS", BOTH, "Building Science Series", "Bldg. Sci. Ser."),
        series("NSRDS", BOTH, "National Standard Reference Data Series",
               "Natl. Stand. Ref. Data Ser."),
        series("GCR", BOTH, "Grant/Contract Report", "Grant/Contract Rep."),

        // NIST
        series("NCSTAR", NIST_ONLY, "National Construction Safety Team Report",
               "Natl. Constr. Tm. Act Rpt."),
        series("AMS", NIST_ONLY, "Advanced Manufacturing Series", "Adv. Man. Ser."),
        series("TTB", NIST_ONLY, "Technology Transfer Brief", "Tech. Trans. Brief"),
        series("CSWP", NIST_ONLY, "NIST Cybersecurity White Paper", "NIST Cybersecur. White Pap."),
        series("OWMWP", NIST_ONLY, "NIST Office of Weights and Measures White Paper",
               "NIST OWM White Pap."),

        // NBS
        series("CIRC", NBS_ONLY, "Circular", "Circ."),
        series("LCIRC", NBS_ONLY, "Letter Circular", "Lett. Circ."),
        series("MP", NBS_ONLY, "Miscellaneous Publication", "Misc. Publ."),
        series("BMS", NBS_ONLY, "Building Materials and Structures Report",
               "Bldg. Mater. Struct. Rep."),
        series("RPT", NBS_ONLY, "Report", "Rep."),
        series("CRPL-F-B", NBS_ONLY, "CRPL Solar-Geophysical Data", "CRPL Solar-Geophysical Data"),
    };

    for (auto& entry : table) {
        if (entry.code == "CSWP" || entry.code == "OWMWP") {
            entry.embedsOrganization = true;
        } else if (entry.code == "FIPS PUB") {
            entry.supportsParts = false;
            entry.docNumberPattern = "[0-9]+(-[0-9]+)?";
        } else if (entry.code == "CRPL-F-B") {
            entry.supportsParts = false;
            entry.supportsVolumes = false;
            entry.gluedDocNumber = true;
            entry.docNumberPattern = "[0-9]+[A-Z]?";
        }
    }

    return table;
}

std::vector<SeriesAlias> BuiltinSeriesSource::loadAliases() const {
    return {
        // Compound codes carrying the organization
        {"NISTIR", {}, Publisher::NIST, "IR"},
        {"NBSIR", {}, Publisher::NBS, "IR"},
        {"NISTGCR", {}, Publisher::NIST, "GCR"},

        // Retired spellings
        {"FIPS", {}, std::nullopt, "FIPS PUB"},
        {"LC", NBS_ONLY, std::nullopt, "LCIRC"},
        {"HANDBOOK", {}, std::nullopt, "HB"},
    };
}

} // namespace pubid
