/**
 * @file FeatureExtractor.hpp
 * @brief Tokenizes a candidate and derives per-token features for tagging.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/ReferenceCandidate.hpp"
#include "domain/TokenFeatures.hpp"

namespace refsifter::domain::parsing {

/**
 * @class FeatureExtractor
 * @brief Stateless, deterministic feature computation.
 */
class FeatureExtractor {
public:
    /**
     * @brief Splits text on whitespace; chunks without letters or digits are dropped.
     */
    static std::vector<Token> Tokenize(const std::string& text);

    /**
     * @brief Produces one feature vector per token of the candidate.
     * @throws MalformedCandidateError if the candidate has no tokens.
     */
    std::vector<TokenFeatureVector> extract(const ReferenceCandidate& candidate) const;

    /** @brief Collapsed character-class shape: runs of X, x, d, punctuation kept. */
    static std::string Shape(const std::string& text);

    static Capitalization Classify(const std::string& core);
    static LexicalClass Lexical(const std::string& lowerCore);
};

} // namespace refsifter::domain::parsing
