/**
 * @file LinkVerifier.hpp
 * @brief Last verification step: is the record's own URL reachable?
 */

#pragma once

#include <string>

#include "domain/ReferenceVerifier.hpp"

namespace refsifter::infrastructure {

/**
 * @class LinkVerifier
 * @brief HEAD, then GET, on the record's URL, following redirects.
 *
 * Records without a URL pass to the next step. Any other record ends the
 * chain as LinkAlive or LinkDead.
 */
class LinkVerifier : public domain::ReferenceVerifier {
public:
    explicit LinkVerifier(int timeoutMs = 5000);

    std::optional<domain::Verification> verify(const domain::CitationRecord& record) override;
    std::string name() const override { return "Website"; }

    /**
     * @brief True when the URL answers 2xx or 3xx.
     *
     * URLs that are not http(s) or have fewer than three '/' (a bare site
     * root) are not requested and count as unreachable.
     */
    bool isReachable(const std::string& url) const;

private:
    int m_timeoutMs;
};

} // namespace refsifter::infrastructure
