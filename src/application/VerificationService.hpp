/**
 * @file VerificationService.hpp
 * @brief Checks parsed references against lookup sources, first answer wins.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/CatalogMatchService.hpp"
#include "domain/ParseFailure.hpp"
#include "domain/ReferenceVerifier.hpp"

namespace refsifter::application {

/**
 * @class CatalogVerifier
 * @brief Verification step backed by the local catalog.
 */
class CatalogVerifier : public domain::ReferenceVerifier {
public:
    explicit CatalogVerifier(std::shared_ptr<const CatalogMatchService> catalog);

    std::optional<domain::Verification> verify(const domain::CitationRecord& record) override;
    std::string name() const override { return "Local catalog"; }

private:
    std::shared_ptr<const CatalogMatchService> m_catalog;
};

/**
 * @class VerificationService
 * @brief Runs each record through an ordered chain of ReferenceVerifier steps.
 *
 * The first step that answers settles the record; a record no step answers is
 * NotFound. A step that throws is logged and treated as having no answer.
 */
class VerificationService {
public:
    /**
     * @struct Summary
     * @brief Counts over the records that were verified.
     */
    struct Summary {
        size_t checked = 0;
        size_t verified = 0;
        size_t linkAlive = 0;
        size_t linkDead = 0;
        size_t notFound = 0;
    };

    /**
     * @param steps Lookup order, e.g. catalog, Crossref DOI, Crossref search, link check.
     * @param workers Records verified concurrently.
     */
    VerificationService(std::vector<std::shared_ptr<domain::ReferenceVerifier>> steps, size_t workers = 5);

    domain::Verification verify(const domain::CitationRecord& record) const;

    /**
     * @brief Verifies every successful result.
     * @return One entry per result, nullopt for failures, in input order.
     */
    std::vector<std::optional<domain::Verification>> verifyAll(const std::vector<domain::ParseResult>& results) const;

    static Summary Summarize(const std::vector<std::optional<domain::Verification>>& verifications);

    std::vector<std::string> getStepNames() const;

private:
    std::vector<std::shared_ptr<domain::ReferenceVerifier>> m_steps;
    size_t m_workers;
};

} // namespace refsifter::application
