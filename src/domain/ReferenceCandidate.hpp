/**
 * @file ReferenceCandidate.hpp
 * @brief Raw caller input and the reference-sized chunks segmented out of it.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace refsifter::domain {

/**
 * @class RawInput
 * @brief Ordered, immutable lines of text submitted by the caller.
 */
class RawInput {
public:
    RawInput() = default;
    explicit RawInput(std::vector<std::string> lines) : m_lines(std::move(lines)) {}

    /** @brief Splits text on '\n', dropping a trailing '\r' from each line. */
    static RawInput FromText(const std::string& text);

    const std::vector<std::string>& getLines() const { return m_lines; }
    size_t lineCount() const { return m_lines.size(); }
    bool empty() const { return m_lines.empty(); }

private:
    std::vector<std::string> m_lines;
};

/**
 * @struct ReferenceCandidate
 * @brief One chunk of RawInput believed to hold a single citation.
 */
struct ReferenceCandidate {
    size_t firstLine = 0; ///< First source line (0-based, inclusive).
    size_t lastLine = 0;  ///< Last source line (0-based, inclusive).
    std::string text;     ///< Trimmed lines joined with single spaces.
};

} // namespace refsifter::domain
