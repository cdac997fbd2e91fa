/**
 * @file SpanAssembler.hpp
 * @brief Merges runs of identically labeled tokens into field spans.
 */

#pragma once

#include <vector>

#include "domain/TokenFeatures.hpp"

namespace refsifter::domain::parsing {

/**
 * @class SpanAssembler
 * @brief Single left-to-right pass; spans partition the tokens and alternate labels.
 */
class SpanAssembler {
public:
    static std::vector<FieldSpan> Assemble(const std::vector<LabeledToken>& tokens);
};

} // namespace refsifter::domain::parsing
