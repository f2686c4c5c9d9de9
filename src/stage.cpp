/**
 * @file stage.cpp
 * @brief Stage vocabulary
 */

#include "pubid/stage.h"
#include "pubid/utils/string_utils.h"

namespace pubid {

std::string stageToCode(Stage stage) {
    switch (stage) {
        case Stage::IPD: return "IPD";
        case Stage::SPD: return "2PD";
        case Stage::TPD: return "3PD";
        case Stage::FPD: return "FPD";
        case Stage::PPD: return "PPD";
        case Stage::WD:  return "WD";
    }
    return "";
}

std::string stageTitle(Stage stage) {
    switch (stage) {
        case Stage::IPD: return "Initial Public Draft";
        case Stage::SPD: return "Second Public Draft";
        case Stage::TPD: return "Third Public Draft";
        case Stage::FPD: return "Final Public Draft";
        case Stage::PPD: return "Preliminary Public Draft";
        case Stage::WD:  return "Work-in-Progress Draft";
    }
    return "";
}

std::optional<Stage> stageFromCode(const std::string& code) {
    std::string upper = utils::toUpperCase(code);
    for (Stage stage : allStages()) {
        if (stageToCode(stage) == upper) {
            return stage;
        }
    }
    return std::nullopt;
}

std::optional<Stage> stageFromTitle(const std::string& title) {
    for (Stage stage : allStages()) {
        if (stageTitle(stage) == title) {
            return stage;
        }
    }
    return std::nullopt;
}

const std::vector<Stage>& allStages() {
    static const std::vector<Stage> stages = {
        Stage::IPD, Stage::SPD, Stage::TPD, Stage::FPD, Stage::PPD, Stage::WD
    };
    return stages;
}

} // namespace pubid
