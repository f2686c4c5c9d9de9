/**
 * @file identifier.h
 * @brief Publication identifier (PubID) model
 *
 * An Identifier is a value object: publisher, series, document number and
 * an optional qualifier set. Publisher, series and docnumber are fixed at
 * construction; qualifiers can be changed through the setters, which keep
 * the model invariants (revision/edition and addendum/update are mutually
 * exclusive, the last write wins).
 *
 * An Identifier refers to the series entry of the registry it was built
 * with, so that registry must outlive it. Overloads taking a temporary
 * registry are deleted.
 *
 * @example
 * auto id = Identifier::parse("NIST SP 800-53r5");
 * id.toString(Style::MR);      // "NIST.SP.800-53r5"
 * id.setRevision(6);
 * id.toString(Style::SHORT);   // "NIST SP 800-53r6"
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#pragma once

#include "pubid/publisher.h"
#include "pubid/qualifiers.h"
#include "pubid/series_registry.h"
#include "pubid/stage.h"
#include "pubid/style.h"
#include <json/json.h>
#include <optional>
#include <string>

namespace pubid {

struct ParseOptions;

class Identifier {
public:
    /**
     * @brief Construct an identifier from its fields
     *
     * @param publisher Issuing organization
     * @param series Series code or legacy alias; may be prefixed by the
     *        publisher acronym ("NIST SP"), which must agree with publisher
     * @param docNumber Document number ("800-53")
     * @param qualifiers Optional qualifiers
     * @param registry Registry the series is resolved against
     * @throws InvalidModelError if the series is unknown for the publisher,
     *         the docnumber is malformed, or the qualifiers break an invariant
     */
    Identifier(Publisher publisher,
               const std::string& series,
               const std::string& docNumber,
               Qualifiers qualifiers = {},
               const SeriesRegistry& registry = SeriesRegistry::defaultRegistry());

    Identifier(Publisher publisher,
               const std::string& series,
               const std::string& docNumber,
               Qualifiers qualifiers,
               SeriesRegistry&& registry) = delete;

    /**
     * @brief Construct from an already resolved series entry
     * @throws InvalidModelError as above
     */
    Identifier(Publisher publisher,
               const SeriesEntry& series,
               const std::string& docNumber,
               Qualifiers qualifiers,
               const SeriesRegistry& registry);

    Identifier(Publisher publisher,
               const SeriesEntry& series,
               const std::string& docNumber,
               Qualifiers qualifiers,
               SeriesRegistry&& registry) = delete;

    /**
     * @brief Parse a PubID in any of the four styles
     * @throws ParseError (UNKNOWN_SERIES or MALFORMED_DOCNUMBER)
     */
    static Identifier parse(const std::string& text);

    static Identifier parse(const std::string& text, const SeriesRegistry& registry);

    static Identifier parse(const std::string& text, const SeriesRegistry& registry,
                            const ParseOptions& options);

    static Identifier parse(const std::string& text, SeriesRegistry&& registry) = delete;

    static Identifier parse(const std::string& text, SeriesRegistry&& registry,
                            const ParseOptions& options) = delete;

    /**
     * @brief Render in the requested style (SHORT by default)
     */
    std::string toString(Style style = Style::SHORT) const;

    /**
     * @brief Structured representation with the four rendered forms
     */
    Json::Value toJson() const;

    /// @name Accessors
    Publisher getPublisher() const { return publisher_; }
    const SeriesEntry& getSeries() const { return *series_; }
    const std::string& getDocNumber() const { return docNumber_; }
    const Qualifiers& getQualifiers() const { return qualifiers_; }
    const SeriesRegistry& getRegistry() const { return *registry_; }

    std::optional<Stage> getStage() const { return qualifiers_.stage; }
    const std::optional<std::string>& getPart() const { return qualifiers_.part; }
    std::optional<int> getVolume() const { return qualifiers_.volume; }
    std::optional<int> getVersion() const { return qualifiers_.version; }
    std::optional<int> getRevision() const { return qualifiers_.revision; }
    std::optional<int> getEdition() const { return qualifiers_.edition; }
    std::optional<int> getAddendum() const { return qualifiers_.addendum; }
    const std::optional<Update>& getUpdate() const { return qualifiers_.update; }
    const std::optional<std::string>& getTranslation() const { return qualifiers_.translation; }

    /// @name Mutators
    /// Each setter validates the new value and throws InvalidModelError,
    /// leaving the identifier unchanged, if it is rejected.
    void setStage(Stage stage);
    void setPart(const std::string& part);
    void setVolume(int volume);
    void setVersion(int version);
    void setRevision(int revision);         ///< Clears edition
    void setEdition(int edition);           ///< Clears revision
    void setAddendum(int addendum = 1);     ///< Clears update
    void setUpdate(const Update& update);   ///< Clears addendum
    void setTranslation(const std::string& languageCode);

    void clearStage() { qualifiers_.stage.reset(); }
    void clearPart() { qualifiers_.part.reset(); }
    void clearVolume() { qualifiers_.volume.reset(); }
    void clearVersion() { qualifiers_.version.reset(); }
    void clearRevision() { qualifiers_.revision.reset(); }
    void clearEdition() { qualifiers_.edition.reset(); }
    void clearAddendum() { qualifiers_.addendum.reset(); }
    void clearUpdate() { qualifiers_.update.reset(); }
    void clearTranslation() { qualifiers_.translation.reset(); }

    /// @brief Same publisher, series, docnumber and qualifiers
    bool operator==(const Identifier& other) const;
    bool operator!=(const Identifier& other) const {
        return !(*this == other);
    }

private:
    void validate() const;
    void replaceQualifiers(const Qualifiers& candidate);

    Publisher publisher_;
    const SeriesEntry* series_;
    std::string docNumber_;
    Qualifiers qualifiers_;
    const SeriesRegistry* registry_;
};

} // namespace pubid
