/**
 * @file TaggingAdapter.hpp
 * @brief Sole boundary to the sequence tagger: bounded latency and output validation.
 */

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "domain/SequenceTagger.hpp"
#include "domain/TokenFeatures.hpp"

namespace refsifter::application {

/**
 * @class TaggingAdapter
 * @brief Calls a SequenceTagger with a per-call timeout and checks the label count.
 *
 * Every failure mode (no answer, exception, timeout, wrong length, invalid label)
 * surfaces as domain::TaggingUnavailableError so callers handle one error kind.
 */
class TaggingAdapter {
public:
    TaggingAdapter(std::shared_ptr<domain::SequenceTagger> tagger, std::chrono::milliseconds timeout);

    /**
     * @brief Labels the tokens of one candidate.
     * @throws domain::TaggingUnavailableError
     */
    std::vector<domain::LabeledToken> label(const std::vector<domain::TokenFeatureVector>& features) const;

    std::chrono::milliseconds getTimeout() const { return m_timeout; }
    std::string getBackendName() const { return m_tagger ? m_tagger->name() : "none"; }

private:
    std::shared_ptr<domain::SequenceTagger> m_tagger;
    std::chrono::milliseconds m_timeout;
};

} // namespace refsifter::application
