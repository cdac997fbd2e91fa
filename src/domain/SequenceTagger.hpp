/**
 * @file SequenceTagger.hpp
 * @brief Interface to the external sequence-labeling capability.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/FieldLabel.hpp"
#include "domain/TokenFeatures.hpp"

namespace refsifter::domain {

/**
 * @class SequenceTagger
 * @brief Abstract labeler: one feature vector in, one field label out, per token.
 *
 * Implementations must be callable from several threads at once.
 */
class SequenceTagger {
public:
    virtual ~SequenceTagger() = default;

    /**
     * @brief Labels every token of one reference string.
     * @param features Features of the candidate's tokens, in order.
     * @return The labels, or nullopt if the backend could not answer.
     */
    virtual std::optional<std::vector<FieldLabel>> tag(const std::vector<TokenFeatureVector>& features) = 0;

    /** @brief Backend name for logs. */
    virtual std::string name() const = 0;
};

} // namespace refsifter::domain
