/**
 * @file renderer.h
 * @brief Projection of an Identifier into its textual forms
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#pragma once

#include "pubid/identifier.h"
#include "pubid/style.h"
#include <string>

namespace pubid {

/**
 * @brief Render an identifier
 *
 * Total for every constructed Identifier. The result parses back to an
 * equal identifier.
 *
 * @param identifier Identifier to render
 * @param style Target style
 * @return PubID text, e.g. "NIST SP 800-53r5" (SHORT) or "NIST.SP.800-53r5" (MR)
 */
std::string render(const Identifier& identifier, Style style);

} // namespace pubid
