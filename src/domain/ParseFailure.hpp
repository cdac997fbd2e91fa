/**
 * @file ParseFailure.hpp
 * @brief Per-candidate error kinds and the typed result returned for each candidate.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>

#include "domain/CitationRecord.hpp"

namespace refsifter::domain {

/**
 * @enum ParseErrorKind
 * @brief Why a candidate produced no record.
 */
enum class ParseErrorKind {
    MalformedCandidate,  ///< No tokens survived tokenization.
    TaggingUnavailable,  ///< Tagger failed, timed out or returned a bad sequence.
    Skipped              ///< Not attempted because the batch stopped on an earlier failure.
};

inline std::string ErrorKindToString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::MalformedCandidate: return "MalformedCandidateError";
        case ParseErrorKind::TaggingUnavailable: return "TaggingUnavailableError";
        case ParseErrorKind::Skipped: return "Skipped";
    }
    return "Unknown";
}

/**
 * @class MalformedCandidateError
 * @brief Thrown when a candidate has nothing to tag.
 */
class MalformedCandidateError : public std::runtime_error {
public:
    explicit MalformedCandidateError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class TaggingUnavailableError
 * @brief Thrown when the sequence tagger cannot label a candidate.
 */
class TaggingUnavailableError : public std::runtime_error {
public:
    explicit TaggingUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct ParseFailure
 * @brief Typed failure for one candidate, carrying its raw text.
 */
struct ParseFailure {
    ParseErrorKind kind = ParseErrorKind::MalformedCandidate;
    std::string message;
    std::string raw;
    size_t firstLine = 0;
    size_t lastLine = 0;
};

/** @brief Outcome for one candidate: a record or a typed failure. */
using ParseResult = std::variant<CitationRecord, ParseFailure>;

inline bool IsSuccess(const ParseResult& result) {
    return std::holds_alternative<CitationRecord>(result);
}

} // namespace refsifter::domain
