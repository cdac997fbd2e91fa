/**
 * @file VerificationService.cpp
 * @brief Implementation of VerificationService and CatalogVerifier.
 */

#include "application/VerificationService.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>

namespace refsifter::application {

using domain::Verification;
using domain::VerificationStatus;

CatalogVerifier::CatalogVerifier(std::shared_ptr<const CatalogMatchService> catalog)
    : m_catalog(std::move(catalog)) {}

std::optional<Verification> CatalogVerifier::verify(const domain::CitationRecord& record) {
    if (!m_catalog) return std::nullopt;
    auto match = m_catalog->match(record);
    if (!match) return std::nullopt;

    Verification verification;
    verification.status = VerificationStatus::Verified;
    verification.source = name();
    verification.matchedTitle = match->title;
    return verification;
}

VerificationService::VerificationService(std::vector<std::shared_ptr<domain::ReferenceVerifier>> steps, size_t workers)
    : m_steps(std::move(steps)), m_workers(workers == 0 ? 1 : workers) {}

Verification VerificationService::verify(const domain::CitationRecord& record) const {
    for (const auto& step : m_steps) {
        try {
            if (auto answer = step->verify(record)) {
                return *answer;
            }
        } catch (const std::exception& e) {
            std::cerr << "[VerificationService] " << step->name() << " failed: " << e.what() << std::endl;
        }
    }
    return Verification{};
}

std::vector<std::optional<Verification>> VerificationService::verifyAll(const std::vector<domain::ParseResult>& results) const {
    std::vector<std::optional<Verification>> verifications(results.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            size_t index = next.fetch_add(1);
            if (index >= results.size()) return;
            if (!domain::IsSuccess(results[index])) continue;
            verifications[index] = verify(std::get<domain::CitationRecord>(results[index]));
        }
    };

    size_t workerCount = std::min(m_workers, results.size());
    if (workerCount <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    }

    Summary summary = Summarize(verifications);
    std::cerr << "[VerificationService] Verified " << summary.verified << "/" << summary.checked
              << " references (link only: " << summary.linkAlive << ", dead link: " << summary.linkDead
              << ", not found: " << summary.notFound << ")" << std::endl;
    return verifications;
}

VerificationService::Summary VerificationService::Summarize(const std::vector<std::optional<Verification>>& verifications) {
    Summary summary;
    for (const auto& verification : verifications) {
        if (!verification) continue;
        ++summary.checked;
        switch (verification->status) {
            case VerificationStatus::Verified: ++summary.verified; break;
            case VerificationStatus::LinkAlive: ++summary.linkAlive; break;
            case VerificationStatus::LinkDead: ++summary.linkDead; break;
            case VerificationStatus::NotFound: ++summary.notFound; break;
        }
    }
    return summary;
}

std::vector<std::string> VerificationService::getStepNames() const {
    std::vector<std::string> names;
    for (const auto& step : m_steps) names.push_back(step->name());
    return names;
}

} // namespace refsifter::application
