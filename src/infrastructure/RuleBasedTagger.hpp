/**
 * @file RuleBasedTagger.hpp
 * @brief In-process heuristic labeler for common citation layouts.
 */

#pragma once

#include "domain/SequenceTagger.hpp"

namespace refsifter::infrastructure {

/**
 * @class RuleBasedTagger
 * @brief Deterministic labeler for author-year (APA/Chicago), LNCS and quoted-title (IEEE/MLA) layouts.
 *
 * Stateless; safe to share across threads. Used as the default backend and as the
 * reference behaviour when no statistical model is reachable.
 */
class RuleBasedTagger : public domain::SequenceTagger {
public:
    std::optional<std::vector<domain::FieldLabel>> tag(const std::vector<domain::TokenFeatureVector>& features) override;
    std::string name() const override { return "rules"; }
};

} // namespace refsifter::infrastructure
