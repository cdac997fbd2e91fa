/**
 * @file CsvCatalogRepository.hpp
 * @brief Loads a local catalog of known works from a CSV file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace refsifter::infrastructure {

/**
 * @class CsvCatalogRepository
 * @brief RFC 4180 reader (quoted fields, doubled quotes, embedded newlines) with a header row.
 */
class CsvCatalogRepository {
public:
    /**
     * @brief Reads the file. A UTF-8 byte order mark is skipped.
     * @param error Receives the reason on failure.
     */
    bool load(const std::string& path, std::string& error);

    /** @brief Parses CSV text that is already in memory. */
    void loadFromString(const std::string& content);

    /** @brief Index of a header column, exact match. */
    std::optional<size_t> columnIndex(const std::string& name) const;

    /**
     * @brief Values of one column; the first column when name is empty or unknown.
     */
    std::vector<std::string> getColumn(const std::string& name) const;

    const std::vector<std::string>& getHeader() const { return m_header; }
    const std::vector<std::vector<std::string>>& getRows() const { return m_rows; }

    static std::vector<std::vector<std::string>> ParseCsv(const std::string& content);

private:
    std::vector<std::string> m_header;
    std::vector<std::vector<std::string>> m_rows;
};

} // namespace refsifter::infrastructure
