/**
 * @file TaggerFactory.hpp
 * @brief Builds the configured SequenceTagger backend.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/SequenceTagger.hpp"

namespace refsifter::infrastructure {

/**
 * @struct TaggerSettings
 * @brief Backend selection and connection parameters.
 */
struct TaggerSettings {
    std::string backend = "rules"; ///< "rules", "http" or "command".
    int timeoutMs = 5000;
    std::string host = "localhost";
    int port = 8080;
    std::string path = "/tag";
    std::string command = "anystyle-tagger";
};

class TaggerFactory {
public:
    /**
     * @brief Creates the backend named in the settings.
     *
     * Unknown backend names fall back to the rule-based tagger with a warning.
     */
    static std::shared_ptr<domain::SequenceTagger> Create(const TaggerSettings& settings);
};

} // namespace refsifter::infrastructure
