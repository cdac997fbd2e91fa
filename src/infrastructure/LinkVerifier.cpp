#include "infrastructure/LinkVerifier.hpp"

#include <algorithm>
#include <httplib.h>
#include <iostream>

namespace refsifter::infrastructure {

namespace {

bool IsOk(const httplib::Result& res) {
    return res && res->status >= 200 && res->status < 400;
}

} // namespace

LinkVerifier::LinkVerifier(int timeoutMs) : m_timeoutMs(timeoutMs) {}

bool LinkVerifier::isReachable(const std::string& url) const {
    if (url.compare(0, 7, "http://") != 0 && url.compare(0, 8, "https://") != 0) return false;
    if (std::count(url.begin(), url.end(), '/') < 3) return false;

    // "scheme://host[:port]" and the rest
    size_t pathStart = url.find('/', url.find("://") + 3);
    const std::string origin = url.substr(0, pathStart);
    const std::string path = url.substr(pathStart);

    httplib::Client cli(origin);
    const time_t seconds = m_timeoutMs / 1000;
    const time_t micros = static_cast<time_t>(m_timeoutMs % 1000) * 1000;
    cli.set_connection_timeout(seconds, micros);
    cli.set_read_timeout(seconds, micros);
    cli.set_follow_location(true);
    httplib::Headers headers = {{"User-Agent", "Mozilla/5.0 (compatible; RefSifter/0.1)"}};

    auto head = cli.Head(path, headers);
    if (IsOk(head)) return true;

    // Many publisher sites reject HEAD.
    auto get = cli.Get(path, headers);
    if (IsOk(get)) return true;

    if (get) {
        std::cerr << "[LinkVerifier] HTTP " << get->status << " for " << url << std::endl;
    } else {
        std::cerr << "[LinkVerifier] Connection failed for " << url << ": " << static_cast<int>(get.error()) << std::endl;
    }
    return false;
}

std::optional<domain::Verification> LinkVerifier::verify(const domain::CitationRecord& record) {
    if (!record.getUrl()) return std::nullopt;

    domain::Verification verification;
    verification.status = isReachable(*record.getUrl()) ? domain::VerificationStatus::LinkAlive
                                                        : domain::VerificationStatus::LinkDead;
    verification.source = name();
    verification.link = *record.getUrl();
    return verification;
}

} // namespace refsifter::infrastructure
