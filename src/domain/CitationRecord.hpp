/**
 * @file CitationRecord.hpp
 * @brief Domain entity holding the normalized fields of one reference.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace refsifter::domain {

/**
 * @class CitationRecord
 * @brief Immutable structured citation produced by the normalizer.
 */
class CitationRecord {
public:
    /**
     * @struct Fields
     * @brief Normalized values; everything except raw may be empty.
     */
    struct Fields {
        std::string title;
        std::vector<std::string> authors; ///< Citation order.
        std::optional<int> year;
        std::optional<std::string> venue;
        std::optional<std::string> doi;
        std::optional<std::string> url;
        std::optional<std::string> pages;
    };

    CitationRecord(Fields fields, std::string raw)
        : m_fields(std::move(fields)), m_raw(std::move(raw)) {}

    const std::string& getTitle() const { return m_fields.title; }
    const std::vector<std::string>& getAuthors() const { return m_fields.authors; }
    const std::optional<int>& getYear() const { return m_fields.year; }
    const std::optional<std::string>& getVenue() const { return m_fields.venue; }
    const std::optional<std::string>& getDoi() const { return m_fields.doi; }
    const std::optional<std::string>& getUrl() const { return m_fields.url; }
    const std::optional<std::string>& getPages() const { return m_fields.pages; }

    /** @brief Original candidate text, verbatim. */
    const std::string& getRaw() const { return m_raw; }

    const Fields& getFields() const { return m_fields; }

    /** @brief First author's surname-ish leading word, empty without authors. */
    std::string getFirstAuthor() const {
        if (m_fields.authors.empty()) return {};
        const std::string& first = m_fields.authors.front();
        size_t cut = first.find_first_of(", ");
        return cut == std::string::npos ? first : first.substr(0, cut);
    }

private:
    Fields m_fields;
    std::string m_raw;
};

} // namespace refsifter::domain
