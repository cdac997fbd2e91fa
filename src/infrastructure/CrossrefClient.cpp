#include "infrastructure/CrossrefClient.hpp"

#include <cctype>
#include <httplib.h>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace refsifter::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kSearchAttempts = 2;
}

CrossrefClient::CrossrefClient(const std::string& baseUrl, int timeoutMs, const std::string& mailto)
    : m_baseUrl(baseUrl), m_timeoutMs(timeoutMs), m_mailto(mailto) {
    while (!m_baseUrl.empty() && m_baseUrl.back() == '/') m_baseUrl.pop_back();
}

std::string CrossrefClient::UrlEncode(const std::string& value, bool keepSlash) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keepSlash && c == '/')) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return escaped.str();
}

std::optional<json> CrossrefClient::get(const std::string& pathAndQuery) const {
    httplib::Client cli(m_baseUrl);
    const time_t seconds = m_timeoutMs / 1000;
    const time_t micros = static_cast<time_t>(m_timeoutMs % 1000) * 1000;
    cli.set_connection_timeout(seconds, micros);
    cli.set_read_timeout(seconds, micros);
    cli.set_follow_location(true);

    std::string agent = "RefSifter/0.1";
    if (!m_mailto.empty()) agent += " (mailto:" + m_mailto + ")";
    httplib::Headers headers = {{"User-Agent", agent}, {"Accept", "application/json"}};

    auto res = cli.Get(pathAndQuery, headers);
    if (!res) {
        std::cerr << "[CrossrefClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[CrossrefClient] HTTP Error " << res->status << " for " << pathAndQuery << std::endl;
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].is_object()) {
            return body["message"];
        }
        std::cerr << "[CrossrefClient] Response without a message object" << std::endl;
    } catch (const json::parse_error& e) {
        std::cerr << "[CrossrefClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<json> CrossrefClient::fetchWork(const std::string& doi) const {
    if (doi.empty()) return std::nullopt;
    std::string path = "/works/" + UrlEncode(doi, true);
    if (!m_mailto.empty()) path += "?mailto=" + UrlEncode(m_mailto);
    return get(path);
}

std::optional<json> CrossrefClient::searchWorks(const std::string& bibliographic, const std::string& author,
                                                int rows) const {
    if (bibliographic.empty()) return std::nullopt;
    std::string path = "/works?query.bibliographic=" + UrlEncode(bibliographic) + "&rows=" + std::to_string(rows);
    if (!author.empty()) path += "&query.author=" + UrlEncode(author);
    if (!m_mailto.empty()) path += "&mailto=" + UrlEncode(m_mailto);

    for (int attempt = 1; attempt <= kSearchAttempts; ++attempt) {
        auto message = get(path);
        if (message) return message;
    }
    return std::nullopt;
}

} // namespace refsifter::infrastructure
