/**
 * @file CrossrefClient.hpp
 * @brief Low-level HTTP client for the Crossref works API.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace refsifter::infrastructure {

/**
 * @class CrossrefClient
 * @brief GETs /works resources and returns their "message" object.
 *
 * A new connection is made per call, so one instance serves concurrent lookups.
 */
class CrossrefClient {
public:
    /**
     * @param baseUrl Scheme, host and optional port, e.g. "https://api.crossref.org".
     * @param mailto Contact address sent for Crossref's polite pool; may be empty.
     */
    CrossrefClient(const std::string& baseUrl = "https://api.crossref.org", int timeoutMs = 10000,
                   const std::string& mailto = "");

    /** @brief GET /works/{doi}. nullopt on any failure, including 404. */
    std::optional<nlohmann::json> fetchWork(const std::string& doi) const;

    /**
     * @brief GET /works with a bibliographic query.
     * @param author Family name for query.author; omitted when empty.
     * @return The "message" object; a failed request is retried once.
     */
    std::optional<nlohmann::json> searchWorks(const std::string& bibliographic, const std::string& author,
                                              int rows = 2) const;

    const std::string& getBaseUrl() const { return m_baseUrl; }

    /** @brief Percent-encodes everything but unreserved characters and, when asked, '/'. */
    static std::string UrlEncode(const std::string& value, bool keepSlash = false);

private:
    std::optional<nlohmann::json> get(const std::string& pathAndQuery) const;

    std::string m_baseUrl;
    int m_timeoutMs;
    std::string m_mailto;
};

} // namespace refsifter::infrastructure
