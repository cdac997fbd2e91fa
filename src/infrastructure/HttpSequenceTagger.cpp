#include "infrastructure/HttpSequenceTagger.hpp"

#include <httplib.h>
#include <iostream>

#include "infrastructure/TaggerProtocol.hpp"

namespace refsifter::infrastructure {

HttpSequenceTagger::HttpSequenceTagger(const std::string& host, int port, const std::string& path, int timeoutMs)
    : m_host(host), m_port(port), m_path(path), m_timeoutMs(timeoutMs) {}

std::optional<std::vector<domain::FieldLabel>> HttpSequenceTagger::tag(const std::vector<domain::TokenFeatureVector>& features) {
    httplib::Client cli(m_host, m_port);
    const time_t seconds = m_timeoutMs / 1000;
    const time_t micros = static_cast<time_t>(m_timeoutMs % 1000) * 1000;
    cli.set_connection_timeout(seconds, micros);
    cli.set_read_timeout(seconds, micros);
    cli.set_write_timeout(seconds, micros);

    auto request = TaggerProtocol::BuildRequest(features);
    auto res = cli.Post(m_path, request.dump(), "application/json");
    if (res && res->status == 200) {
        return TaggerProtocol::ParseLabels(res->body);
    }

    if (res) {
        std::cerr << "[HttpSequenceTagger] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[HttpSequenceTagger] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

bool HttpSequenceTagger::isAlive() const {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(2, 0);
    cli.set_read_timeout(2, 0);
    auto res = cli.Get("/");
    return res && res->status >= 200 && res->status < 300;
}

} // namespace refsifter::infrastructure
