/**
 * @file TitleKey.hpp
 * @brief Comparable keys and similarity scores for bibliographic titles.
 */

#pragma once

#include <string>

namespace refsifter::domain::parsing {

/**
 * @class TitleKey
 * @brief Case-, punctuation- and dash-insensitive title comparison.
 */
class TitleKey {
public:
    /**
     * @brief Lowercases ASCII, drops dashes and punctuation, collapses whitespace.
     *
     * Bytes of multi-byte UTF-8 letters are kept; General Punctuation
     * (U+2000-U+206F: curly quotes, en/em dashes) and U+2212 are removed.
     */
    static std::string Normalize(const std::string& title);

    /**
     * @brief Ratcliff/Obershelp similarity in [0, 1]: 2 * matched / (|a| + |b|).
     */
    static double Similarity(const std::string& a, const std::string& b);
};

} // namespace refsifter::domain::parsing
