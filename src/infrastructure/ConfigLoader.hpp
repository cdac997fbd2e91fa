/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading pipeline settings from settings.json.
 *
 * Every key is optional; missing or mistyped keys keep their defaults.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>
#include "application/ReferenceParsingService.hpp"
#include "infrastructure/TaggerFactory.hpp"

namespace refsifter::infrastructure {

/**
 * @struct CatalogSettings
 * @brief Local catalog used for title matching; disabled when path is empty.
 */
struct CatalogSettings {
    std::string path;
    std::string titleColumn;
    double threshold = 0.85;
};

/**
 * @struct VerificationSettings
 * @brief Online lookup of parsed references; off unless enabled.
 */
struct VerificationSettings {
    bool enabled = false;
    std::string crossrefUrl = "https://api.crossref.org";
    std::string mailto;     ///< Contact for Crossref's polite pool.
    int timeoutMs = 10000;
    bool checkLinks = true; ///< Try the record's own URL when no source knows the work.
    size_t workers = 5;
};

/**
 * @struct Settings
 * @brief Everything the application reads from settings.json.
 */
struct Settings {
    application::ReferenceParsingService::Options parsing;
    TaggerSettings tagger;
    CatalogSettings catalog;
    VerificationSettings verification;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a file.
     * @param path Path to settings.json; a missing file yields defaults.
     */
    static Settings Load(const std::string& path);

    /** @brief Applies the keys present in a parsed document over defaults. */
    static Settings FromJson(const nlohmann::json& j);

    /** @brief Serializes settings back to the settings.json layout. */
    static nlohmann::json ToJson(const Settings& settings);
};

} // namespace refsifter::infrastructure
