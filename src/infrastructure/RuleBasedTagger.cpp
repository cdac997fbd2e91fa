/**
 * @file RuleBasedTagger.cpp
 * @brief Implementation of RuleBasedTagger.
 */

#include "infrastructure/RuleBasedTagger.hpp"

namespace refsifter::infrastructure {

using domain::Capitalization;
using domain::FieldLabel;
using domain::LexicalClass;
using domain::TokenFeatureVector;

namespace {

constexpr size_t kNone = static_cast<size_t>(-1);

bool IsYearCandidate(const TokenFeatureVector& f) {
    if (!f.isYearLike) return false;
    if (f.opensParen || f.index + 1 == f.tokenCount) return true;
    char p = f.trailingPunct;
    return p == '.' || p == ',' || p == ';' || p == ')' || p == ':';
}

bool LooksLikeNameStart(const TokenFeatureVector& f) {
    if (f.lexicalClass == LexicalClass::VenueKeyword) return false;
    if (f.isYearLike || f.isDoi || f.isUrl) return false;
    return f.capitalization == Capitalization::Capitalized ||
           f.capitalization == Capitalization::AllUpper ||
           f.capitalization == Capitalization::Mixed ||
           (f.letterCount > 0 && static_cast<unsigned char>(f.token.core.front()) >= 0x80);
}

bool StopsVenue(const TokenFeatureVector& f) {
    return f.isPageRange || f.isVolumeIssue || f.isDoi || f.isUrl ||
           f.lexicalClass == LexicalClass::Locator ||
           f.lexicalClass == LexicalClass::Editor ||
           f.lexicalClass == LexicalClass::Month ||
           f.digitDensity >= 0.5 || f.opensParen;
}

} // namespace

std::optional<std::vector<FieldLabel>> RuleBasedTagger::tag(const std::vector<TokenFeatureVector>& features) {
    const size_t n = features.size();
    std::vector<FieldLabel> labels(n, FieldLabel::Other);
    if (n == 0) return labels;

    size_t start = features[0].isNumberMarker ? 1 : 0;
    if (start >= n) return labels;

    size_t yearIdx = kNone;
    for (size_t i = start; i < n; ++i) {
        if (IsYearCandidate(features[i])) {
            yearIdx = i;
            break;
        }
    }

    // Authors: up to a parenthesized year (author-year styles), otherwise up to
    // the first sentence end, colon, or opening quote.
    size_t authorEnd = start;
    if (LooksLikeNameStart(features[start])) {
        bool authorYear = false;
        if (yearIdx != kNone && yearIdx > start) {
            // The name right before the year may end in '.' ("Smith, John. 2020.").
            authorYear = true;
            for (size_t i = start; i + 1 < yearIdx; ++i) {
                if (features[i].endsSentence || features[i].opensQuote || features[i].trailingPunct == ':') {
                    authorYear = false;
                    break;
                }
            }
        }

        if (authorYear) {
            authorEnd = yearIdx;
        } else {
            authorEnd = start;
            for (size_t i = start; i < n; ++i) {
                if (features[i].opensQuote && i > start) {
                    authorEnd = i;
                    break;
                }
                if (features[i].endsSentence || features[i].trailingPunct == ':') {
                    authorEnd = i + 1;
                    break;
                }
            }
            if (authorEnd == n) authorEnd = start; // no boundary: not an author list
        }
    }
    for (size_t i = start; i < authorEnd; ++i) {
        labels[i] = FieldLabel::Author;
    }

    size_t yearEnd = kNone;
    if (yearIdx != kNone && yearIdx >= authorEnd) {
        labels[yearIdx] = FieldLabel::Year;
        yearEnd = yearIdx + 1;
        if (features[yearIdx].opensParen && !features[yearIdx].closesParen) {
            for (size_t i = yearIdx + 1; i < n && i <= yearIdx + 3; ++i) {
                labels[i] = FieldLabel::Year;
                yearEnd = i + 1;
                if (features[i].closesParen) break;
            }
        }
    } else {
        yearIdx = kNone;
    }

    // Title directly follows the authors and an author-year date.
    size_t cursor = authorEnd;
    if (yearIdx == authorEnd) cursor = yearEnd;
    if (cursor < n && features[cursor].lexicalClass == LexicalClass::Preposition &&
        features[cursor].lowerCore == "in" && features[cursor].capitalization == Capitalization::Capitalized) {
        // "In Proceedings ..." right after authors: no title.
    } else if (cursor < n) {
        size_t titleEnd = cursor;
        if (features[cursor].opensQuote) {
            for (size_t i = cursor; i < n; ++i) {
                titleEnd = i + 1;
                if (features[i].closesQuote) break;
            }
        } else {
            titleEnd = n;
            for (size_t i = cursor; i < n; ++i) {
                if (i == yearIdx || features[i].isDoi || features[i].isUrl) {
                    titleEnd = i;
                    break;
                }
                if (features[i].endsSentence || features[i].trailingPunct == '?' || features[i].trailingPunct == '!') {
                    titleEnd = i + 1;
                    break;
                }
            }
            if (titleEnd == n) {
                while (titleEnd > cursor + 1 && features[titleEnd - 1].digitDensity >= 0.5) --titleEnd;
            }
        }
        for (size_t i = cursor; i < titleEnd; ++i) {
            if (labels[i] == FieldLabel::Other) labels[i] = FieldLabel::Title;
        }
        cursor = titleEnd;
    }

    // Venue: the run after the title, up to numbers and locators.
    while (cursor < n && labels[cursor] != FieldLabel::Other) ++cursor;
    if (cursor < n && features[cursor].lowerCore == "in") ++cursor;
    for (size_t i = cursor; i < n; ++i) {
        if (labels[i] != FieldLabel::Other || StopsVenue(features[i])) break;
        labels[i] = FieldLabel::Venue;
        if (features[i].trailingPunct == ':') break; // "New York: Publisher"
    }

    return labels;
}

} // namespace refsifter::infrastructure
