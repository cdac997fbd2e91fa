/**
 * @file CsvCatalogRepository.cpp
 * @brief Implementation of CsvCatalogRepository.
 */

#include "infrastructure/CsvCatalogRepository.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace refsifter::infrastructure {

std::vector<std::vector<std::string>> CsvCatalogRepository::ParseCsv(const std::string& content) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasData = false;

    size_t start = content.compare(0, 3, "\xEF\xBB\xBF") == 0 ? 3 : 0;
    for (size_t i = start; i < content.size(); ++i) {
        char c = content[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                inQuotes = true;
                rowHasData = true;
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                rowHasData = true;
                break;
            case '\r':
                break;
            case '\n':
                if (rowHasData || !field.empty()) {
                    row.push_back(std::move(field));
                    rows.push_back(std::move(row));
                }
                row.clear();
                field.clear();
                rowHasData = false;
                break;
            default:
                field += c;
                rowHasData = true;
                break;
        }
    }
    if (rowHasData || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

bool CsvCatalogRepository::load(const std::string& path, std::string& error) {
    if (!std::filesystem::exists(path)) {
        error = "catalog not found: " + path;
        return false;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "could not open catalog: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());

    std::cerr << "[CsvCatalogRepository] Loaded " << m_rows.size() << " entries from " << path << std::endl;
    return true;
}

void CsvCatalogRepository::loadFromString(const std::string& content) {
    auto rows = ParseCsv(content);
    m_header.clear();
    m_rows.clear();
    if (rows.empty()) return;

    m_header = std::move(rows.front());
    m_rows.assign(std::make_move_iterator(rows.begin() + 1), std::make_move_iterator(rows.end()));
}

std::optional<size_t> CsvCatalogRepository::columnIndex(const std::string& name) const {
    for (size_t i = 0; i < m_header.size(); ++i) {
        if (m_header[i] == name) return i;
    }
    return std::nullopt;
}

std::vector<std::string> CsvCatalogRepository::getColumn(const std::string& name) const {
    size_t column = 0;
    if (!name.empty()) {
        if (auto index = columnIndex(name)) {
            column = *index;
        } else {
            std::cerr << "[CsvCatalogRepository] Column '" << name << "' not found, using '"
                      << (m_header.empty() ? std::string() : m_header.front()) << "'" << std::endl;
        }
    }

    std::vector<std::string> values;
    values.reserve(m_rows.size());
    for (const auto& row : m_rows) {
        values.push_back(column < row.size() ? row[column] : std::string());
    }
    return values;
}

} // namespace refsifter::infrastructure
