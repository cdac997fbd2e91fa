/**
 * @file BibliographicMatch.hpp
 * @brief Decides whether a title or author list found by a lookup source is the cited one.
 */

#pragma once

#include <string>
#include <vector>

namespace refsifter::domain::parsing {

/**
 * @struct PersonName
 * @brief Author as bibliographic services report it.
 */
struct PersonName {
    std::string family;
    std::string given;
};

/**
 * @class BibliographicMatch
 * @brief Tolerant title and author comparison for lookup results.
 */
class BibliographicMatch {
public:
    /** @brief Similarity at or above which two cleaned titles are the same work. */
    static constexpr double TitleRatioThreshold = 0.65;

    /**
     * @brief True when a looked-up title is the cited one.
     *
     * Both titles go through TitleKey::Normalize, then years (19xx, 20xx) and
     * the words arxiv, biorxiv, available, online and access are dropped.
     * A match is any of: the result contained in a much longer query, a
     * similarity ratio of at least TitleRatioThreshold, at most one query word
     * missing from a query of five words or more, or no query word missing.
     */
    static bool TitlesMatch(const std::string& query, const std::string& result);

    /**
     * @brief True when the cited first author appears among the result authors.
     *
     * Accepts "Family, G." and "G. Family". Very common family names also need
     * the first initial to agree. An empty query matches anything.
     */
    static bool AuthorMatches(const std::string& queryAuthor, const std::vector<PersonName>& resultAuthors);

    /** @brief Family name of "Family, Given" or "Given Family"; empty for empty input. */
    static std::string FamilyName(const std::string& author);
};

} // namespace refsifter::domain::parsing
