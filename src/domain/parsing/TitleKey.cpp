#include "domain/parsing/TitleKey.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace refsifter::domain::parsing {

namespace {

std::string CollapseSpaces(const std::string& text) {
    std::stringstream ss(text);
    std::string word;
    std::string out;
    while (ss >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

struct Match {
    size_t a = 0;
    size_t b = 0;
    size_t size = 0;
};

Match LongestMatch(const std::string& a, size_t aLo, size_t aHi,
                   const std::string& b, size_t bLo, size_t bHi) {
    Match best{aLo, bLo, 0};
    std::vector<size_t> prev(bHi - bLo + 1, 0);
    std::vector<size_t> row(bHi - bLo + 1, 0);
    for (size_t i = aLo; i < aHi; ++i) {
        for (size_t j = bLo; j < bHi; ++j) {
            size_t k = j - bLo + 1;
            row[k] = (a[i] == b[j]) ? prev[k - 1] + 1 : 0;
            if (row[k] > best.size) {
                best = Match{i + 1 - row[k], j + 1 - row[k], row[k]};
            }
        }
        std::swap(prev, row);
        std::fill(row.begin(), row.end(), 0);
    }
    return best;
}

size_t MatchedCharacters(const std::string& a, size_t aLo, size_t aHi,
                         const std::string& b, size_t bLo, size_t bHi) {
    if (aLo >= aHi || bLo >= bHi) return 0;
    Match m = LongestMatch(a, aLo, aHi, b, bLo, bHi);
    if (m.size == 0) return 0;
    return m.size
        + MatchedCharacters(a, aLo, m.a, b, bLo, m.b)
        + MatchedCharacters(a, m.a + m.size, aHi, b, m.b + m.size, bHi);
}

} // namespace

std::string TitleKey::Normalize(const std::string& title) {
    std::string out;
    out.reserve(title.size());
    for (size_t i = 0; i < title.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(title[i]);
        if (c < 0x80) {
            if (std::isalnum(c)) out += static_cast<char>(std::tolower(c));
            else if (std::isspace(c)) out += ' ';
            continue;
        }
        // E2 80..81 xx: General Punctuation; E2 88 92: minus sign
        if (c == 0xE2 && i + 2 < title.size()) {
            unsigned char c1 = static_cast<unsigned char>(title[i + 1]);
            unsigned char c2 = static_cast<unsigned char>(title[i + 2]);
            if (c1 == 0x80 || c1 == 0x81 || (c1 == 0x88 && c2 == 0x92)) {
                if (c1 == 0x80 && c2 <= 0x8A) out += ' '; // U+2000-U+200A spaces
                i += 2;
                continue;
            }
        }
        out += static_cast<char>(c);
    }
    return CollapseSpaces(out);
}

double TitleKey::Similarity(const std::string& a, const std::string& b) {
    if (a.empty() && b.empty()) return 1.0;
    size_t matched = MatchedCharacters(a, 0, a.size(), b, 0, b.size());
    return 2.0 * static_cast<double>(matched) / static_cast<double>(a.size() + b.size());
}

} // namespace refsifter::domain::parsing
