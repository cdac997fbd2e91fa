/**
 * @file ReferenceSegmenter.hpp
 * @brief Splits raw reference-list text into single-reference candidates.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/ReferenceCandidate.hpp"

namespace refsifter::domain::parsing {

/**
 * @class ReferenceSegmenter
 * @brief Line-oriented boundary detection for bibliography blocks.
 */
class ReferenceSegmenter {
public:
    /**
     * @struct Options
     * @brief Boundary heuristics that can be switched off individually.
     */
    struct Options {
        bool numberingMarkers = true; ///< "[1]", "1.", "1)", "(1)", bullets.
        bool hangingIndent = true;    ///< Base-indent lines start, deeper lines continue.
        bool flatLineBreaks = true;   ///< Terminal punctuation + reference-like opening.
    };

    ReferenceSegmenter() = default;
    explicit ReferenceSegmenter(Options options) : m_options(options) {}

    /**
     * @brief Segments the input into candidates in input order.
     * @return Empty for empty or blank input.
     */
    std::vector<ReferenceCandidate> segment(const RawInput& input) const;

    /** @brief True if the line opens with a numbering marker or bullet. */
    static bool StartsWithMarker(const std::string& line);

    const Options& getOptions() const { return m_options; }

private:
    Options m_options;
};

} // namespace refsifter::domain::parsing
