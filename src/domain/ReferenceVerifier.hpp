/**
 * @file ReferenceVerifier.hpp
 * @brief Verification outcome of a parsed reference and the port of one lookup source.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/CitationRecord.hpp"

namespace refsifter::domain {

/**
 * @enum VerificationStatus
 * @brief Where the lookup chain ended for one record.
 */
enum class VerificationStatus {
    Verified,   ///< A bibliographic source knows the work.
    LinkAlive,  ///< Only the record's own URL answered.
    LinkDead,   ///< The record's URL did not answer.
    NotFound    ///< No source knew the work and there was no URL to try.
};

inline std::string VerificationStatusToString(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::Verified: return "verified";
        case VerificationStatus::LinkAlive: return "link_alive";
        case VerificationStatus::LinkDead: return "link_dead";
        case VerificationStatus::NotFound: return "not_found";
    }
    return "unknown";
}

/**
 * @struct Verification
 * @brief Answer of the source that settled a record.
 */
struct Verification {
    VerificationStatus status = VerificationStatus::NotFound;
    std::string source;       ///< Name of the answering source; empty for NotFound.
    std::string link;         ///< Landing page of the matched work or the checked URL.
    std::string matchedTitle; ///< Title as the source knows it, when it reports one.
};

/**
 * @class ReferenceVerifier
 * @brief One lookup source in the verification chain.
 *
 * Implementations must be callable from several threads at once.
 */
class ReferenceVerifier {
public:
    virtual ~ReferenceVerifier() = default;

    /**
     * @brief Looks the record up.
     * @return An answer that ends the chain, or nullopt to let the next source try.
     */
    virtual std::optional<Verification> verify(const CitationRecord& record) = 0;

    /** @brief Source name for reports and logs. */
    virtual std::string name() const = 0;
};

} // namespace refsifter::domain
