/**
 * @file stage.h
 * @brief Draft stages of a publication
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pubid {

/**
 * @brief Draft-maturity stage, only present before final publication
 */
enum class Stage {
    IPD,    ///< Initial Public Draft
    SPD,    ///< Second Public Draft ("2PD")
    TPD,    ///< Third Public Draft ("3PD")
    FPD,    ///< Final Public Draft
    PPD,    ///< Preliminary Public Draft
    WD      ///< Work-in-Progress Draft
};

/// @brief Stage code as written in short and MR forms ("IPD", "2PD")
std::string stageToCode(Stage stage);

/// @brief Capitalized phrase used by the long and abbreviated forms
std::string stageTitle(Stage stage);

/**
 * @brief Look up a stage by code (case-insensitive)
 * @return Stage, or std::nullopt for an unknown code
 */
std::optional<Stage> stageFromCode(const std::string& code);

/**
 * @brief Look up a stage by its title (exact match)
 */
std::optional<Stage> stageFromTitle(const std::string& title);

/// @brief Every stage, in declaration order
const std::vector<Stage>& allStages();

} // namespace pubid
