/**
 * @file TokenFeatures.hpp
 * @brief Tokens of a reference string and the features a tagger consumes.
 */

#pragma once

#include <cstddef>
#include <string>

#include "domain/FieldLabel.hpp"

namespace refsifter::domain {

/**
 * @struct Token
 * @brief Whitespace-delimited chunk of a candidate's text.
 */
struct Token {
    std::string text; ///< Chunk as it appears in the candidate.
    std::string core; ///< Chunk without surrounding punctuation.
    size_t begin = 0; ///< Byte offset into ReferenceCandidate::text.
    size_t end = 0;   ///< One past the last byte.
};

/**
 * @enum Capitalization
 * @brief Letter case pattern of a token core.
 */
enum class Capitalization {
    AllUpper,
    Capitalized,
    Lower,
    Mixed,
    NoLetters
};

/**
 * @enum LexicalClass
 * @brief Closed-class words that carry strong field evidence.
 */
enum class LexicalClass {
    None,
    Conjunction,  ///< and, und
    EtAl,         ///< et, al
    VenueKeyword, ///< journal, proceedings, conference, ...
    Preposition,  ///< in, of, on, ...
    Month,
    Editor,       ///< ed, eds, editor(s)
    Locator       ///< vol, no, pp, p
};

inline std::string CapitalizationToString(Capitalization c) {
    switch (c) {
        case Capitalization::AllUpper: return "upper";
        case Capitalization::Capitalized: return "capitalized";
        case Capitalization::Lower: return "lower";
        case Capitalization::Mixed: return "mixed";
        case Capitalization::NoLetters: return "none";
    }
    return "none";
}

inline std::string LexicalClassToString(LexicalClass c) {
    switch (c) {
        case LexicalClass::None: return "none";
        case LexicalClass::Conjunction: return "conjunction";
        case LexicalClass::EtAl: return "etal";
        case LexicalClass::VenueKeyword: return "venue";
        case LexicalClass::Preposition: return "preposition";
        case LexicalClass::Month: return "month";
        case LexicalClass::Editor: return "editor";
        case LexicalClass::Locator: return "locator";
    }
    return "none";
}

/**
 * @struct TokenFeatureVector
 * @brief Deterministic features of one token in its local context.
 */
struct TokenFeatureVector {
    Token token;
    size_t index = 0;
    size_t tokenCount = 0;
    double relativePosition = 0.0; ///< index / (tokenCount - 1), 0 for a single token.

    Capitalization capitalization = Capitalization::NoLetters;
    LexicalClass lexicalClass = LexicalClass::None;
    std::string shape;        ///< Collapsed character classes, e.g. "Xx," or "(d).".
    size_t letterCount = 0;
    size_t digitCount = 0;
    double digitDensity = 0.0; ///< digits / bytes of the core.

    char leadingPunct = '\0';  ///< First byte if it is punctuation.
    char trailingPunct = '\0'; ///< Last byte if it is punctuation.

    bool isYearLike = false;      ///< Four-digit year 1500-2099, optional letter suffix.
    bool isInitial = false;       ///< "J." or "J.-P."
    bool isPageRange = false;     ///< "1-10", "pp. 23--45" core
    bool isVolumeIssue = false;   ///< "12(3)"
    bool isNumberMarker = false;  ///< "[3]", "3." or "3)" at position 0
    bool isUrl = false;
    bool isDoi = false;
    bool opensQuote = false;
    bool closesQuote = false;
    bool opensParen = false;
    bool closesParen = false;
    bool endsSentence = false;    ///< Trailing '.', '?' or '!' on a non-initial.

    std::string lowerCore;
    std::string prevLowerCore; ///< Empty at position 0.
    std::string nextLowerCore; ///< Empty at the last position.
};

/**
 * @struct LabeledToken
 * @brief A token paired with its predicted field.
 */
struct LabeledToken {
    Token token;
    FieldLabel label = FieldLabel::Other;
};

/**
 * @struct FieldSpan
 * @brief Maximal run of same-label tokens, [startToken, endToken).
 */
struct FieldSpan {
    FieldLabel label = FieldLabel::Other;
    size_t startToken = 0;
    size_t endToken = 0;

    size_t length() const { return endToken - startToken; }
};

} // namespace refsifter::domain
