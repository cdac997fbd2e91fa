#include "domain/FieldLabel.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace refsifter::domain {

std::optional<FieldLabel> LabelFromString(const std::string& name) {
    static const std::unordered_map<std::string, FieldLabel> kLabels = {
        {"author", FieldLabel::Author},
        {"editor", FieldLabel::Author},
        {"title", FieldLabel::Title},
        {"year", FieldLabel::Year},
        {"date", FieldLabel::Year},
        {"venue", FieldLabel::Venue},
        {"container-title", FieldLabel::Venue},
        {"journal", FieldLabel::Venue},
        {"booktitle", FieldLabel::Venue},
        {"other", FieldLabel::Other},
        {"volume", FieldLabel::Other},
        {"pages", FieldLabel::Other},
        {"publisher", FieldLabel::Other},
        {"location", FieldLabel::Other},
        {"doi", FieldLabel::Other},
        {"url", FieldLabel::Other},
        {"note", FieldLabel::Other},
        {"edition", FieldLabel::Other},
        {"genre", FieldLabel::Other},
        {"citation-number", FieldLabel::Other}
    };

    std::string key = name;
    key.erase(0, key.find_first_not_of(" \t"));
    key.erase(key.find_last_not_of(" \t") + 1);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });

    auto it = kLabels.find(key);
    if (it == kLabels.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace refsifter::domain
