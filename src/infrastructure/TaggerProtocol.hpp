/**
 * @file TaggerProtocol.hpp
 * @brief JSON exchange format shared by the out-of-process tagger backends.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/FieldLabel.hpp"
#include "domain/TokenFeatures.hpp"

namespace refsifter::infrastructure {

class TaggerProtocol {
public:
    /**
     * @brief {"tokens":[{"text":..., "index":..., "features":{...}}, ...]}
     */
    static nlohmann::json BuildRequest(const std::vector<domain::TokenFeatureVector>& features);

    /**
     * @brief Reads labels from {"labels":[...]} or a bare array.
     *
     * Leading/trailing noise around the JSON (banners, warnings) is tolerated by
     * falling back to the outermost [...] in the text.
     * @return nullopt for unparseable replies or unknown label names.
     */
    static std::optional<std::vector<domain::FieldLabel>> ParseLabels(const std::string& body);
};

} // namespace refsifter::infrastructure
