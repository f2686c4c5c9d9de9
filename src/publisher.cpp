/**
 * @file publisher.cpp
 * @brief Publisher vocabulary
 */

#include "pubid/publisher.h"
#include "pubid/utils/string_utils.h"

namespace pubid {

std::string publisherToString(Publisher publisher) {
    switch (publisher) {
        case Publisher::NIST: return "NIST";
        case Publisher::NBS:  return "NBS";
    }
    return "UNKNOWN";
}

std::string publisherLongName(Publisher publisher) {
    switch (publisher) {
        case Publisher::NIST: return "National Institute of Standards and Technology";
        case Publisher::NBS:  return "National Bureau of Standards";
    }
    return "";
}

std::string publisherAbbrevName(Publisher publisher) {
    switch (publisher) {
        case Publisher::NIST: return "Natl. Inst. Stand. Technol.";
        case Publisher::NBS:  return "Natl. Bur. Stand.";
    }
    return "";
}

std::optional<Publisher> publisherFromString(const std::string& token) {
    std::string upper = utils::toUpperCase(utils::trim(token));
    if (upper == "NIST") return Publisher::NIST;
    if (upper == "NBS") return Publisher::NBS;
    return std::nullopt;
}

const std::vector<Publisher>& allPublishers() {
    static const std::vector<Publisher> publishers = {Publisher::NIST, Publisher::NBS};
    return publishers;
}

} // namespace pubid
