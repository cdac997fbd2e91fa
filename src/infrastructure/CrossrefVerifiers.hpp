/**
 * @file CrossrefVerifiers.hpp
 * @brief Verification steps backed by Crossref: DOI resolution and bibliographic search.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/ReferenceVerifier.hpp"
#include "infrastructure/CrossrefClient.hpp"

namespace refsifter::infrastructure {

/**
 * @class CrossrefDoiVerifier
 * @brief Resolves the record's DOI; the work counts only if its title matches the cited one.
 */
class CrossrefDoiVerifier : public domain::ReferenceVerifier {
public:
    explicit CrossrefDoiVerifier(std::shared_ptr<CrossrefClient> client);

    std::optional<domain::Verification> verify(const domain::CitationRecord& record) override;
    std::string name() const override { return "Crossref (DOI)"; }

private:
    std::shared_ptr<CrossrefClient> m_client;
};

/**
 * @class CrossrefSearchVerifier
 * @brief Searches by title and first author and accepts the first hit matching both.
 */
class CrossrefSearchVerifier : public domain::ReferenceVerifier {
public:
    /** @brief Titles up to this many bytes are too short to search on; the raw text is used instead. */
    static constexpr size_t MinTitleLength = 8;
    /** @brief Raw-text prefix searched when the title is too short. */
    static constexpr size_t RawQueryLength = 120;

    explicit CrossrefSearchVerifier(std::shared_ptr<CrossrefClient> client, int rows = 2);

    std::optional<domain::Verification> verify(const domain::CitationRecord& record) override;
    std::string name() const override { return "Crossref (Search)"; }

    /** @brief Text sent as the bibliographic query for a record. */
    static std::string QueryText(const domain::CitationRecord& record);

private:
    std::shared_ptr<CrossrefClient> m_client;
    int m_rows;
};

} // namespace refsifter::infrastructure
