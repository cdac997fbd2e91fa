/**
 * @file CommandSequenceTagger.cpp
 * @brief Implementation of CommandSequenceTagger.
 */

#include "infrastructure/CommandSequenceTagger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/wait.h>

#include "infrastructure/TaggerProtocol.hpp"

namespace refsifter::infrastructure {

namespace {

std::string GetTempFilePath() {
    static std::atomic<unsigned long> counter{0};
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "refsifter_" + std::to_string(now) + "_" + std::to_string(counter++) + ".json";
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

CommandSequenceTagger::CommandSequenceTagger(const std::string& command, int timeoutMs)
    : m_command(command), m_timeoutMs(timeoutMs) {}

bool CommandSequenceTagger::isAvailable() const {
    std::string tool = m_command.substr(0, m_command.find(' '));
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::optional<std::vector<domain::FieldLabel>> CommandSequenceTagger::tag(const std::vector<domain::TokenFeatureVector>& features) {
    const std::string requestPath = GetTempFilePath();
    {
        std::ofstream request(requestPath);
        if (!request.is_open()) {
            std::cerr << "[CommandSequenceTagger] Failed to open temp file: " << requestPath << std::endl;
            return std::nullopt;
        }
        request << TaggerProtocol::BuildRequest(features).dump();
    }

    // timeout(1) takes fractional seconds; it kills a hung tagger so the pipe closes.
    char seconds[32];
    std::snprintf(seconds, sizeof(seconds), "%.3f", m_timeoutMs / 1000.0);
    std::string cmd = std::string("timeout ") + seconds + " " + m_command + " < \"" + requestPath + "\" 2>/dev/null";

    std::string output;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::cerr << "[CommandSequenceTagger] popen failed for: " << m_command << std::endl;
        std::error_code ec;
        std::filesystem::remove(requestPath, ec);
        return std::nullopt;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output.append(buffer);
    }
    int status = pclose(pipe);

    std::error_code ec;
    std::filesystem::remove(requestPath, ec);

    if (status != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : status;
        if (code == 124) {
            std::cerr << "[CommandSequenceTagger] Command timed out after " << m_timeoutMs << " ms" << std::endl;
        } else {
            std::cerr << "[CommandSequenceTagger] Command exited with code: " << code << std::endl;
        }
        return std::nullopt;
    }
    return TaggerProtocol::ParseLabels(output);
}

} // namespace refsifter::infrastructure
