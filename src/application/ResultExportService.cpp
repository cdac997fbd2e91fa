/**
 * @file ResultExportService.cpp
 * @brief Implementation of ResultExportService.
 */

#include "application/ResultExportService.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace refsifter::application {

using json = nlohmann::json;

namespace {

std::string JoinAuthors(const std::vector<std::string>& authors) {
    std::string out;
    for (const auto& author : authors) {
        if (!out.empty()) out += "; ";
        out += author;
    }
    return out;
}

const std::optional<CatalogMatch>* MatchAt(const ResultExportService::MatchList& matches, size_t index) {
    if (index >= matches.size() || !matches[index]) return nullptr;
    return &matches[index];
}

const domain::Verification* VerificationAt(const ResultExportService::VerificationList& verifications, size_t index) {
    if (index >= verifications.size() || !verifications[index]) return nullptr;
    return &*verifications[index];
}

} // namespace

json ResultExportService::RecordToJson(const domain::CitationRecord& record) {
    json j = {
        {"title", record.getTitle()},
        {"authors", record.getAuthors()},
        {"year", nullptr},
        {"venue", nullptr},
        {"doi", nullptr},
        {"url", nullptr},
        {"pages", nullptr},
        {"raw", record.getRaw()}
    };
    if (record.getYear()) j["year"] = *record.getYear();
    if (record.getVenue()) j["venue"] = *record.getVenue();
    if (record.getDoi()) j["doi"] = *record.getDoi();
    if (record.getUrl()) j["url"] = *record.getUrl();
    if (record.getPages()) j["pages"] = *record.getPages();
    return j;
}

json ResultExportService::FailureToJson(const domain::ParseFailure& failure) {
    return {
        {"kind", domain::ErrorKindToString(failure.kind)},
        {"message", failure.message},
        {"raw", failure.raw},
        {"first_line", failure.firstLine + 1},
        {"last_line", failure.lastLine + 1}
    };
}

json ResultExportService::VerificationToJson(const domain::Verification& verification) {
    json j = {
        {"status", domain::VerificationStatusToString(verification.status)},
        {"source", nullptr},
        {"link", nullptr},
        {"matched_title", nullptr}
    };
    if (!verification.source.empty()) j["source"] = verification.source;
    if (!verification.link.empty()) j["link"] = verification.link;
    if (!verification.matchedTitle.empty()) j["matched_title"] = verification.matchedTitle;
    return j;
}

json ResultExportService::toJson(const std::vector<domain::ParseResult>& results, const MatchList& matches,
                                 const VerificationList& verifications) const {
    json out = json::array();
    for (size_t i = 0; i < results.size(); ++i) {
        json item = {{"id", i + 1}};
        if (domain::IsSuccess(results[i])) {
            item["status"] = "ok";
            item["record"] = RecordToJson(std::get<domain::CitationRecord>(results[i]));
        } else {
            item["status"] = "error";
            item["error"] = FailureToJson(std::get<domain::ParseFailure>(results[i]));
        }
        if (const auto* match = MatchAt(matches, i)) {
            item["catalog_match"] = {
                {"title", (*match)->title},
                {"row", (*match)->row + 1},
                {"score", (*match)->score}
            };
        }
        if (const auto* verification = VerificationAt(verifications, i)) {
            item["verification"] = VerificationToJson(*verification);
        }
        out.push_back(std::move(item));
    }
    return out;
}

std::string ResultExportService::CsvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string ResultExportService::toCsv(const std::vector<domain::ParseResult>& results, const MatchList& matches,
                                       const VerificationList& verifications) const {
    std::stringstream ss;
    ss << "id,status,error_kind,error,title,authors,year,venue,doi,url,pages,catalog_match,catalog_score,"
          "verification_status,verification_source,verification_link,raw\r\n";

    for (size_t i = 0; i < results.size(); ++i) {
        std::vector<std::string> row(17);
        row[0] = std::to_string(i + 1);
        if (domain::IsSuccess(results[i])) {
            const auto& record = std::get<domain::CitationRecord>(results[i]);
            row[1] = "ok";
            row[4] = record.getTitle();
            row[5] = JoinAuthors(record.getAuthors());
            if (record.getYear()) row[6] = std::to_string(*record.getYear());
            row[7] = record.getVenue().value_or("");
            row[8] = record.getDoi().value_or("");
            row[9] = record.getUrl().value_or("");
            row[10] = record.getPages().value_or("");
            row[16] = record.getRaw();
        } else {
            const auto& failure = std::get<domain::ParseFailure>(results[i]);
            row[1] = "error";
            row[2] = domain::ErrorKindToString(failure.kind);
            row[3] = failure.message;
            row[16] = failure.raw;
        }
        if (const auto* match = MatchAt(matches, i)) {
            std::stringstream score;
            score << std::fixed << std::setprecision(3) << (*match)->score;
            row[11] = (*match)->title;
            row[12] = score.str();
        }
        if (const auto* verification = VerificationAt(verifications, i)) {
            row[13] = domain::VerificationStatusToString(verification->status);
            row[14] = verification->source;
            row[15] = verification->link;
        }

        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) ss << ',';
            ss << CsvEscape(row[c]);
        }
        ss << "\r\n";
    }
    return ss.str();
}

bool ResultExportService::writeAtomically(const std::string& path, const std::string& content, std::string& error) const {
    fs::path finalPath = path;
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        error = std::string("could not create directories: ") + e.what();
        return false;
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            error = "could not open temp file: " + tempPath.string();
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "write failed: " + tempPath.string();
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        error = "rename failed: " + ec.message();
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace refsifter::application
