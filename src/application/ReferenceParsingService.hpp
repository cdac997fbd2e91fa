/**
 * @file ReferenceParsingService.hpp
 * @brief Pipeline orchestrator: reference-list text in, one typed result per reference out.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "application/TaggingAdapter.hpp"
#include "domain/ParseFailure.hpp"
#include "domain/ReferenceCandidate.hpp"
#include "domain/parsing/FeatureExtractor.hpp"
#include "domain/parsing/RecordNormalizer.hpp"
#include "domain/parsing/ReferenceSegmenter.hpp"

namespace refsifter::application {

/**
 * @class ReferenceParsingService
 * @brief Segments, tags and normalizes references on a small worker pool.
 *
 * Candidates share no mutable state, so a failure in one is recorded as a
 * ParseFailure for that candidate only. Output order always equals input order.
 * The service holds no per-run state; concurrent parse() calls are safe.
 */
class ReferenceParsingService {
public:
    /**
     * @struct Options
     * @brief Batch behaviour.
     */
    struct Options {
        size_t batchSize = 4;           ///< Candidates processed concurrently.
        /// false: candidates after the first failure become Skipped. Such a
        /// batch runs on a single worker regardless of batchSize.
        bool continueOnFailure = true;
        domain::parsing::ReferenceSegmenter::Options segmentation;
    };

    /**
     * @struct Summary
     * @brief Counts over a result list.
     */
    struct Summary {
        size_t total = 0;
        size_t parsed = 0;
        size_t malformed = 0;
        size_t taggingUnavailable = 0;
        size_t skipped = 0;
    };

    ReferenceParsingService(std::shared_ptr<TaggingAdapter> tagging, Options options);

    /**
     * @brief Parses a block of reference-list text.
     * @param rawText Caller text; may be empty.
     * @return One result per segmented candidate, in input order.
     */
    std::vector<domain::ParseResult> parse(const std::string& rawText) const;

    /** @brief Parses pre-split input. */
    std::vector<domain::ParseResult> parse(const domain::RawInput& input) const;

    /** @brief Runs one reference string through tagging and normalization, bypassing segmentation. */
    domain::ParseResult parseLine(const std::string& referenceText) const;

    static Summary Summarize(const std::vector<domain::ParseResult>& results);

    const Options& getOptions() const { return m_options; }

private:
    domain::ParseResult processCandidate(const domain::ReferenceCandidate& candidate) const;

    std::shared_ptr<TaggingAdapter> m_tagging;
    Options m_options;
    domain::parsing::ReferenceSegmenter m_segmenter;
    domain::parsing::FeatureExtractor m_extractor;
    domain::parsing::RecordNormalizer m_normalizer;
};

} // namespace refsifter::application
