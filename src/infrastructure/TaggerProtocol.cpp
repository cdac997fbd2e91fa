#include "infrastructure/TaggerProtocol.hpp"

#include <iostream>

namespace refsifter::infrastructure {

using json = nlohmann::json;

json TaggerProtocol::BuildRequest(const std::vector<domain::TokenFeatureVector>& features) {
    json tokens = json::array();
    for (const auto& f : features) {
        json featureObject = {
            {"core", f.token.core},
            {"lower", f.lowerCore},
            {"prev", f.prevLowerCore},
            {"next", f.nextLowerCore},
            {"shape", f.shape},
            {"capitalization", domain::CapitalizationToString(f.capitalization)},
            {"lexical", domain::LexicalClassToString(f.lexicalClass)},
            {"position", f.relativePosition},
            {"letters", f.letterCount},
            {"digits", f.digitCount},
            {"digit_density", f.digitDensity},
            {"leading_punct", f.leadingPunct ? std::string(1, f.leadingPunct) : std::string()},
            {"trailing_punct", f.trailingPunct ? std::string(1, f.trailingPunct) : std::string()},
            {"year", f.isYearLike},
            {"initial", f.isInitial},
            {"page_range", f.isPageRange},
            {"volume_issue", f.isVolumeIssue},
            {"marker", f.isNumberMarker},
            {"url", f.isUrl},
            {"doi", f.isDoi},
            {"open_quote", f.opensQuote},
            {"close_quote", f.closesQuote},
            {"open_paren", f.opensParen},
            {"close_paren", f.closesParen},
            {"sentence_end", f.endsSentence}
        };
        tokens.push_back({
            {"text", f.token.text},
            {"index", f.index},
            {"features", std::move(featureObject)}
        });
    }
    return json{{"tokens", std::move(tokens)}};
}

std::optional<std::vector<domain::FieldLabel>> TaggerProtocol::ParseLabels(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error&) {
        size_t open = body.find('[');
        size_t close = body.rfind(']');
        if (open == std::string::npos || close == std::string::npos || close < open) {
            std::cerr << "[TaggerProtocol] Reply contains no JSON array" << std::endl;
            return std::nullopt;
        }
        try {
            parsed = json::parse(body.substr(open, close - open + 1));
        } catch (const json::parse_error& e) {
            std::cerr << "[TaggerProtocol] JSON Parse Error: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    const json* array = &parsed;
    if (parsed.is_object() && parsed.contains("labels")) {
        array = &parsed["labels"];
    }
    if (!array->is_array()) {
        std::cerr << "[TaggerProtocol] Reply has no label array" << std::endl;
        return std::nullopt;
    }

    std::vector<domain::FieldLabel> labels;
    labels.reserve(array->size());
    for (const auto& item : *array) {
        if (!item.is_string()) {
            std::cerr << "[TaggerProtocol] Non-string label in reply" << std::endl;
            return std::nullopt;
        }
        auto label = domain::LabelFromString(item.get<std::string>());
        if (!label) {
            std::cerr << "[TaggerProtocol] Unknown label '" << item.get<std::string>() << "'" << std::endl;
            return std::nullopt;
        }
        labels.push_back(*label);
    }
    return labels;
}

} // namespace refsifter::infrastructure
