/**
 * @file HttpSequenceTagger.hpp
 * @brief Sequence tagger backed by a labeling service over HTTP.
 */

#pragma once

#include <string>

#include "domain/SequenceTagger.hpp"

namespace refsifter::infrastructure {

/**
 * @class HttpSequenceTagger
 * @brief POSTs the feature sequence as JSON and reads back one label per token.
 *
 * A new client is created per call, so one instance serves concurrent candidates.
 */
class HttpSequenceTagger : public domain::SequenceTagger {
public:
    HttpSequenceTagger(const std::string& host = "localhost", int port = 8080,
                       const std::string& path = "/tag", int timeoutMs = 5000);

    std::optional<std::vector<domain::FieldLabel>> tag(const std::vector<domain::TokenFeatureVector>& features) override;
    std::string name() const override { return "http://" + m_host + ":" + std::to_string(m_port) + m_path; }

    /** @brief GET on the service root; true on any 2xx. */
    bool isAlive() const;

private:
    std::string m_host;
    int m_port;
    std::string m_path;
    int m_timeoutMs;
};

} // namespace refsifter::infrastructure
