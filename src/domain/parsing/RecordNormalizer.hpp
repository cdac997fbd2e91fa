/**
 * @file RecordNormalizer.hpp
 * @brief Turns labeled spans into a normalized CitationRecord.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/CitationRecord.hpp"
#include "domain/ReferenceCandidate.hpp"
#include "domain/TokenFeatures.hpp"

namespace refsifter::domain::parsing {

/**
 * @class RecordNormalizer
 * @brief Cleans, splits and type-converts span text. Never fails.
 */
class RecordNormalizer {
public:
    /**
     * @brief Builds the record for one candidate.
     * @param spans Output of SpanAssembler for @p tokens.
     * @param tokens Labeled tokens of the candidate (offsets into candidate.text).
     * @param candidate The candidate the tokens were cut from.
     */
    CitationRecord normalize(const std::vector<FieldSpan>& spans,
                             const std::vector<LabeledToken>& tokens,
                             const ReferenceCandidate& candidate) const;

    /** @brief Trims whitespace, separator punctuation and unbalanced brackets/quotes; keeps a final '.'. */
    static std::string StripPunctuation(const std::string& text);

    /** @brief Splits an author field on ';', '&', "and" and name-level commas. */
    static std::vector<std::string> SplitAuthors(const std::string& text);

    /** @brief First run of exactly four digits. */
    static std::optional<int> ParseYear(const std::string& text);

    /** @brief Expands common journal/proceedings abbreviations word by word. */
    static std::string ExpandVenue(const std::string& venue);

    /** @brief Drops a leading "YYYY." and a trailing "arXiv ..." from a title. */
    static std::string CleanTitle(const std::string& title);

    static std::optional<std::string> ExtractDoi(const std::string& raw);
    static std::optional<std::string> ExtractUrl(const std::string& raw);
    static std::optional<std::string> ExtractPages(const std::string& text);
};

} // namespace refsifter::domain::parsing
