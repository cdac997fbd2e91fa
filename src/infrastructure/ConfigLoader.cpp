/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace refsifter::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.is_object() || !j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

Settings ConfigLoader::FromJson(const nlohmann::json& j) {
    Settings settings;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object, using defaults" << std::endl;
        return settings;
    }

    int batchSize = static_cast<int>(settings.parsing.batchSize);
    ReadKey(j, "batch_size", batchSize);
    settings.parsing.batchSize = batchSize > 0 ? static_cast<size_t>(batchSize) : 1;
    ReadKey(j, "continue_on_failure", settings.parsing.continueOnFailure);

    if (j.contains("segmentation")) {
        const auto& seg = j["segmentation"];
        ReadKey(seg, "numbering_markers", settings.parsing.segmentation.numberingMarkers);
        ReadKey(seg, "hanging_indent", settings.parsing.segmentation.hangingIndent);
        ReadKey(seg, "flat_line_breaks", settings.parsing.segmentation.flatLineBreaks);
    }

    if (j.contains("tagger")) {
        const auto& tagger = j["tagger"];
        ReadKey(tagger, "backend", settings.tagger.backend);
        ReadKey(tagger, "timeout_ms", settings.tagger.timeoutMs);
        ReadKey(tagger, "host", settings.tagger.host);
        ReadKey(tagger, "port", settings.tagger.port);
        ReadKey(tagger, "path", settings.tagger.path);
        ReadKey(tagger, "command", settings.tagger.command);
        if (settings.tagger.timeoutMs <= 0) {
            std::cerr << "[ConfigLoader] tagger.timeout_ms must be positive, using 5000" << std::endl;
            settings.tagger.timeoutMs = 5000;
        }
    }

    if (j.contains("catalog")) {
        const auto& catalog = j["catalog"];
        ReadKey(catalog, "path", settings.catalog.path);
        ReadKey(catalog, "title_column", settings.catalog.titleColumn);
        ReadKey(catalog, "threshold", settings.catalog.threshold);
    }

    if (j.contains("verification")) {
        const auto& verification = j["verification"];
        ReadKey(verification, "enabled", settings.verification.enabled);
        ReadKey(verification, "crossref_url", settings.verification.crossrefUrl);
        ReadKey(verification, "mailto", settings.verification.mailto);
        ReadKey(verification, "timeout_ms", settings.verification.timeoutMs);
        ReadKey(verification, "check_links", settings.verification.checkLinks);
        int workers = static_cast<int>(settings.verification.workers);
        ReadKey(verification, "workers", workers);
        settings.verification.workers = workers > 0 ? static_cast<size_t>(workers) : 1;
        if (settings.verification.timeoutMs <= 0) {
            std::cerr << "[ConfigLoader] verification.timeout_ms must be positive, using 10000" << std::endl;
            settings.verification.timeoutMs = 10000;
        }
    }
    return settings;
}

Settings ConfigLoader::Load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return Settings{};
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return Settings{};
}

nlohmann::json ConfigLoader::ToJson(const Settings& settings) {
    return {
        {"batch_size", settings.parsing.batchSize},
        {"continue_on_failure", settings.parsing.continueOnFailure},
        {"segmentation", {
            {"numbering_markers", settings.parsing.segmentation.numberingMarkers},
            {"hanging_indent", settings.parsing.segmentation.hangingIndent},
            {"flat_line_breaks", settings.parsing.segmentation.flatLineBreaks}
        }},
        {"tagger", {
            {"backend", settings.tagger.backend},
            {"timeout_ms", settings.tagger.timeoutMs},
            {"host", settings.tagger.host},
            {"port", settings.tagger.port},
            {"path", settings.tagger.path},
            {"command", settings.tagger.command}
        }},
        {"catalog", {
            {"path", settings.catalog.path},
            {"title_column", settings.catalog.titleColumn},
            {"threshold", settings.catalog.threshold}
        }},
        {"verification", {
            {"enabled", settings.verification.enabled},
            {"crossref_url", settings.verification.crossrefUrl},
            {"mailto", settings.verification.mailto},
            {"timeout_ms", settings.verification.timeoutMs},
            {"check_links", settings.verification.checkLinks},
            {"workers", settings.verification.workers}
        }}
    };
}

} // namespace refsifter::infrastructure
