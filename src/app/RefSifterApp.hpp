/**
 * @file RefSifterApp.hpp
 * @brief Command-line front end: reads reference text, parses it, writes a report.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace refsifter::app {

/**
 * @class RefSifterApp
 * @brief Wires configuration, tagger backend and services, then runs one batch.
 */
class RefSifterApp {
public:
    /**
     * @struct CliOptions
     * @brief Parsed command line; unset optionals leave settings.json values alone.
     */
    struct CliOptions {
        std::string configPath = "settings.json";
        std::string format = "json";
        std::string outputPath;         ///< Empty: stdout.
        std::string inputPath = "-";    ///< "-": stdin.
        std::optional<std::string> catalogPath;
        std::optional<std::string> titleColumn;
        std::optional<std::string> backend;
        std::optional<size_t> workers;
        bool failFast = false;
        bool verify = false;
        bool showHelp = false;
    };

    /**
     * @brief Parses argv.
     * @return nullopt with @p error set on invalid usage.
     */
    static std::optional<CliOptions> ParseArguments(int argc, char* argv[], std::string& error);

    static std::string Usage(const std::string& program);

    /** @brief Overlays command-line choices on file settings. */
    static infrastructure::Settings ApplyOverrides(infrastructure::Settings settings, const CliOptions& options);

    explicit RefSifterApp(const infrastructure::Settings& settings);

    /**
     * @brief Renders results in the requested format ("json" or "csv").
     */
    std::string render(const std::vector<domain::ParseResult>& results, const std::string& format) const;

    /** @brief Reads input, parses, renders and writes. Returns the process exit code. */
    int run(const CliOptions& options);

    const application::AppServices& getServices() const { return m_services; }

private:
    application::AppServices m_services;
};

} // namespace refsifter::app
