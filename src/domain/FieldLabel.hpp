/**
 * @file FieldLabel.hpp
 * @brief Value Object naming the bibliographic field a token belongs to.
 */

#pragma once

#include <optional>
#include <string>

namespace refsifter::domain {

/**
 * @enum FieldLabel
 * @brief Tag vocabulary shared by every sequence tagger backend.
 */
enum class FieldLabel {
    Author,
    Title,
    Year,
    Venue,
    Other
};

/**
 * @brief Canonical lowercase name used in logs and wire formats.
 */
inline std::string LabelToString(FieldLabel label) {
    switch (label) {
        case FieldLabel::Author: return "author";
        case FieldLabel::Title: return "title";
        case FieldLabel::Year: return "year";
        case FieldLabel::Venue: return "venue";
        case FieldLabel::Other: return "other";
    }
    return "other";
}

/**
 * @brief Parses a label name coming from an external backend.
 *
 * Accepts the canonical names (any case) and the AnyStyle field names.
 * @return nullopt for names outside the vocabulary (a malformed tag).
 */
std::optional<FieldLabel> LabelFromString(const std::string& name);

} // namespace refsifter::domain
