/**
 * @file parser.h
 * @brief PubID parser
 *
 * Accepts the four textual forms:
 *   - SHORT:  "NIST SP(IPD) 800-53r5", "NISTIR 8115", "NBS CRPL-F-B150"
 *   - MR:     "NIST.SP.IPD.800-53r5", "NIST.SP.800-38A.add-1"
 *   - LONG:   "Addendum to National Institute of Standards and Technology ..."
 *   - ABBREV: "Natl. Bur. Stand. Spec. Publ. 800-53, Rev. 5"
 *
 * Parsing is pure: it reads the registry and never modifies it. The
 * returned Identifier refers to the registry, which must outlive it.
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#pragma once

#include "pubid/identifier.h"
#include "pubid/publisher.h"
#include "pubid/series_registry.h"
#include "pubid/style.h"
#include <string>

namespace pubid {

/**
 * @brief Tuning of the compact-form parser
 */
struct ParseOptions {
    /// Publisher assumed when a compact identifier has no publisher token ("SP 800-53")
    Publisher defaultPublisher = Publisher::NIST;

    /// Reject compact identifiers without a publisher token (and without an implying alias)
    bool allowMissingPublisher = true;

    /**
     * @brief Options read from ConfigManager
     *
     * PUBID_DEFAULT_PUBLISHER (NIST|NBS), PUBID_ALLOW_MISSING_PUBLISHER (bool).
     * An unknown publisher name is logged and replaced by NIST.
     */
    static ParseOptions fromConfig();

    /**
     * @brief Process-wide options, read from ConfigManager on first use
     */
    static const ParseOptions& defaults();
};

/**
 * @brief Guess the style of a PubID string
 *
 * LONG/ABBREV when the text starts with an addendum prefix, a publisher
 * name or an organization-embedding series title; MR when it has no
 * whitespace; SHORT otherwise.
 */
Style detectStyle(const std::string& text, const SeriesRegistry& registry);

/**
 * @brief Parse a PubID
 *
 * @param text PubID in any style
 * @param registry Series registry
 * @param options Parser options
 * @return Populated identifier
 * @throws ParseError UNKNOWN_SERIES if the series cannot be resolved,
 *         MALFORMED_DOCNUMBER if the docnumber or a qualifier is malformed
 *         or the qualifiers violate a model invariant
 */
Identifier parseIdentifier(const std::string& text,
                           const SeriesRegistry& registry,
                           const ParseOptions& options);

Identifier parseIdentifier(const std::string& text,
                           SeriesRegistry&& registry,
                           const ParseOptions& options) = delete;

} // namespace pubid
