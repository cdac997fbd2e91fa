/**
 * @file ResultExportService.hpp
 * @brief Renders parse results as JSON or a CSV report and writes them to disk.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "application/CatalogMatchService.hpp"
#include "domain/ParseFailure.hpp"
#include "domain/ReferenceVerifier.hpp"

namespace refsifter::application {

/**
 * @class ResultExportService
 * @brief Serialization of result lists for the surrounding application.
 */
class ResultExportService {
public:
    /** @brief Optional catalog match per result, parallel to the result list. */
    using MatchList = std::vector<std::optional<CatalogMatch>>;
    /** @brief Optional verification per result, parallel to the result list. */
    using VerificationList = std::vector<std::optional<domain::Verification>>;

    static nlohmann::json RecordToJson(const domain::CitationRecord& record);
    static nlohmann::json FailureToJson(const domain::ParseFailure& failure);
    static nlohmann::json VerificationToJson(const domain::Verification& verification);

    /**
     * @brief JSON array, one object per result, with "id" and "status" ("ok"/"error").
     */
    nlohmann::json toJson(const std::vector<domain::ParseResult>& results, const MatchList& matches = {},
                          const VerificationList& verifications = {}) const;

    /**
     * @brief CSV report with a header row and one row per result.
     */
    std::string toCsv(const std::vector<domain::ParseResult>& results, const MatchList& matches = {},
                      const VerificationList& verifications = {}) const;

    /**
     * @brief Writes content through a temp file and a rename.
     * @param error Receives the reason on failure.
     */
    bool writeAtomically(const std::string& path, const std::string& content, std::string& error) const;

    static std::string CsvEscape(const std::string& field);
};

} // namespace refsifter::application
