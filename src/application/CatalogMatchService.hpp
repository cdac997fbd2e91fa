/**
 * @file CatalogMatchService.hpp
 * @brief Looks parsed titles up in a local catalog of known works.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/CitationRecord.hpp"

namespace refsifter::application {

/**
 * @struct CatalogMatch
 * @brief Best catalog entry for a title.
 */
struct CatalogMatch {
    std::string title; ///< Catalog title as stored.
    size_t row = 0;    ///< 0-based data row in the catalog.
    double score = 0.0;
};

/**
 * @class CatalogMatchService
 * @brief Fuzzy title matching: containment scores 1.0, otherwise a similarity ratio.
 */
class CatalogMatchService {
public:
    /** @brief Shortest normalized title that may count as contained in another. */
    static constexpr size_t MinContainmentLength = 8;

    CatalogMatchService(std::vector<std::string> titles, double threshold = 0.85);

    /** @brief Best entry at or above the threshold, if any. */
    std::optional<CatalogMatch> match(const std::string& title) const;

    std::optional<CatalogMatch> match(const domain::CitationRecord& record) const {
        return match(record.getTitle());
    }

    size_t size() const { return m_titles.size(); }
    double getThreshold() const { return m_threshold; }

private:
    std::vector<std::string> m_titles;
    std::vector<std::string> m_keys;
    double m_threshold;
};

} // namespace refsifter::application
