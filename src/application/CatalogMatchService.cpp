#include "application/CatalogMatchService.hpp"

#include "domain/parsing/TitleKey.hpp"

namespace refsifter::application {

using domain::parsing::TitleKey;

CatalogMatchService::CatalogMatchService(std::vector<std::string> titles, double threshold)
    : m_titles(std::move(titles)), m_threshold(threshold) {
    m_keys.reserve(m_titles.size());
    for (const auto& title : m_titles) {
        m_keys.push_back(TitleKey::Normalize(title));
    }
}

std::optional<CatalogMatch> CatalogMatchService::match(const std::string& title) const {
    const std::string query = TitleKey::Normalize(title);
    if (query.empty()) return std::nullopt;

    std::optional<CatalogMatch> best;
    for (size_t i = 0; i < m_keys.size(); ++i) {
        const std::string& key = m_keys[i];
        if (key.empty()) continue;

        double score;
        bool queryInKey = query.size() >= MinContainmentLength && key.find(query) != std::string::npos;
        bool keyInQuery = key.size() >= MinContainmentLength && query.find(key) != std::string::npos;
        if (queryInKey || keyInQuery || key == query) {
            score = 1.0;
        } else {
            score = TitleKey::Similarity(query, key);
        }

        if (!best || score > best->score) {
            best = CatalogMatch{m_titles[i], i, score};
            if (score >= 1.0) break;
        }
    }

    if (best && best->score >= m_threshold) {
        return best;
    }
    return std::nullopt;
}

} // namespace refsifter::application
