/**
 * @file TaggingAdapter.cpp
 * @brief Implementation of TaggingAdapter.
 */

#include "application/TaggingAdapter.hpp"

#include <future>
#include <optional>
#include <thread>

#include "domain/ParseFailure.hpp"

namespace refsifter::application {

using domain::FieldLabel;
using domain::TaggingUnavailableError;

namespace {
using LabelOutcome = std::optional<std::vector<FieldLabel>>;
}

TaggingAdapter::TaggingAdapter(std::shared_ptr<domain::SequenceTagger> tagger, std::chrono::milliseconds timeout)
    : m_tagger(std::move(tagger)), m_timeout(timeout) {}

std::vector<domain::LabeledToken> TaggingAdapter::label(const std::vector<domain::TokenFeatureVector>& features) const {
    if (!m_tagger) {
        throw TaggingUnavailableError("no sequence tagger configured");
    }

    // The backend call runs detached; on timeout it keeps only shared state alive.
    auto promise = std::make_shared<std::promise<LabelOutcome>>();
    std::future<LabelOutcome> future = promise->get_future();
    auto input = std::make_shared<const std::vector<domain::TokenFeatureVector>>(features);

    std::thread([tagger = m_tagger, input, promise]() {
        try {
            promise->set_value(tagger->tag(*input));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(m_timeout) != std::future_status::ready) {
        throw TaggingUnavailableError(m_tagger->name() + " timed out after " +
                                      std::to_string(m_timeout.count()) + " ms");
    }

    LabelOutcome labels;
    try {
        labels = future.get();
    } catch (const std::exception& e) {
        throw TaggingUnavailableError(m_tagger->name() + " failed: " + e.what());
    } catch (...) {
        throw TaggingUnavailableError(m_tagger->name() + " failed with a non-standard exception");
    }

    if (!labels) {
        throw TaggingUnavailableError(m_tagger->name() + " returned no labels");
    }
    if (labels->size() != features.size()) {
        throw TaggingUnavailableError(m_tagger->name() + " returned " + std::to_string(labels->size()) +
                                      " labels for " + std::to_string(features.size()) + " tokens");
    }

    std::vector<domain::LabeledToken> labeled;
    labeled.reserve(features.size());
    for (size_t i = 0; i < features.size(); ++i) {
        labeled.push_back(domain::LabeledToken{features[i].token, (*labels)[i]});
    }
    return labeled;
}

} // namespace refsifter::application
