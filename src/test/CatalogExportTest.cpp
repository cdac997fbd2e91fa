#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "application/CatalogMatchService.hpp"
#include "application/ResultExportService.hpp"
#include "domain/parsing/TitleKey.hpp"
#include "infrastructure/CsvCatalogRepository.hpp"

using namespace refsifter::domain;
using refsifter::application::CatalogMatch;
using refsifter::application::CatalogMatchService;
using refsifter::application::ResultExportService;
using refsifter::domain::parsing::TitleKey;
using refsifter::infrastructure::CsvCatalogRepository;

namespace {

int g_failures = 0;

void Check(bool condition, const std::string& what) {
    if (condition) {
        std::cout << "[PASS] " << what << std::endl;
    } else {
        std::cout << "[FAIL] " << what << std::endl;
        ++g_failures;
    }
}

size_t CountOf(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) ++n;
    return n;
}

void TestTitleKey() {
    Check(TitleKey::Normalize("  A Study of Things. ") == "a study of things", "punctuation and case dropped");
    Check(TitleKey::Normalize("Deep\xE2\x80\x94Learning\xE2\x80\x82Now") == "deeplearning now",
          "em dash dropped, en space kept as space");
    Check(TitleKey::Normalize("Caf\xC3\xA9 Culture") == "caf\xC3\xA9 culture", "non-ASCII letters kept");

    Check(TitleKey::Similarity("abcd", "abcd") == 1.0, "identical strings score 1");
    Check(TitleKey::Similarity("abcd", "abce") == 0.75, "one changed character of four");
    Check(TitleKey::Similarity("abc", "xyz") == 0.0, "disjoint strings score 0");
    Check(TitleKey::Similarity("", "") == 1.0, "two empty strings are identical");
}

void TestCsvParsing() {
    CsvCatalogRepository repo;
    repo.loadFromString("\xEF\xBB\xBFid,Title\r\n"
                        "1,\"Deep, \"\"quoted\"\" title\"\r\n"
                        "2,\"Multi\nline\"\r\n"
                        "\r\n"
                        "3,Plain\n");
    Check(repo.getHeader().size() == 2 && repo.getHeader()[0] == "id", "BOM skipped in header");
    Check(repo.getRows().size() == 3, "blank line is not a row");

    auto titles = repo.getColumn("Title");
    Check(titles.size() == 3 && titles[0] == "Deep, \"quoted\" title", "quoted comma and doubled quotes");
    Check(titles.size() == 3 && titles[1] == "Multi\nline", "embedded newline kept");
    Check(repo.columnIndex("Title") == std::optional<size_t>(1), "column index found");

    auto fallback = repo.getColumn("Missing");
    Check(fallback.size() == 3 && fallback[2] == "3", "unknown column falls back to the first");

    std::string error;
    CsvCatalogRepository missing;
    Check(!missing.load("/nonexistent/catalog.csv", error) && !error.empty(), "missing catalog reports an error");
}

void TestCatalogMatching() {
    CatalogMatchService catalog({
        "A Study of Things",
        "Deep learning for parsing reference lists",
        "Graph"
    });

    auto exact = catalog.match("A study of things.");
    Check(exact && exact->row == 0 && exact->score == 1.0, "normalized exact match");

    auto contained = catalog.match("A Study of Things: Extended Edition");
    Check(contained && contained->row == 0 && contained->score == 1.0, "catalog title contained in query");

    auto fuzzy = catalog.match("Deep Learning for Parsing References");
    Check(fuzzy && fuzzy->row == 1 && fuzzy->score > 0.85 && fuzzy->score < 1.0, "close title matched fuzzily");

    Check(!catalog.match("Quantum chromodynamics on the lattice"), "unrelated title unmatched");
    Check(!catalog.match("Graph theory basics"), "short catalog key is not a containment match");
    Check(catalog.match("graph").has_value(), "short keys still match exactly");
    Check(!catalog.match("...").has_value(), "empty key never matches");

    CatalogMatchService strict({"Deep learning for parsing reference lists"}, 0.99);
    Check(!strict.match("Deep Learning for Parsing References"), "threshold respected");
}

std::vector<ParseResult> SampleResults() {
    CitationRecord::Fields fields;
    fields.title = "A Study of Things.";
    fields.authors = {"Smith, J.", "Doe, K."};
    fields.year = 2020;
    fields.venue = "Journal of Examples";
    fields.pages = "1-10";

    ParseFailure failure;
    failure.kind = ParseErrorKind::MalformedCandidate;
    failure.message = "candidate has no tokens: \".\"";
    failure.raw = ".";
    failure.firstLine = 2;
    failure.lastLine = 2;

    std::vector<ParseResult> results;
    results.emplace_back(CitationRecord(fields, "Smith, J., Doe, K. (2020). A Study of Things."));
    results.emplace_back(failure);
    return results;
}

void TestJsonExport() {
    ResultExportService exporter;
    auto results = SampleResults();
    ResultExportService::MatchList matches = {CatalogMatch{"A Study of Things", 0, 1.0}, std::nullopt};

    auto j = exporter.toJson(results, matches);
    Check(j.is_array() && j.size() == 2, "one JSON item per result");
    Check(j[0]["id"] == 1 && j[0]["status"] == "ok", "success item id and status");
    Check(j[0]["record"]["authors"].size() == 2 && j[0]["record"]["year"] == 2020, "record fields serialized");
    Check(j[0]["record"]["doi"].is_null(), "absent fields are null");
    Check(j[0]["catalog_match"]["row"] == 1, "catalog row is 1-based");
    Check(j[1]["status"] == "error" && j[1]["error"]["kind"] == "MalformedCandidateError", "failure kind");
    Check(j[1]["error"]["first_line"] == 3 && !j[1].contains("catalog_match"), "failure line is 1-based");
    Check(!j[0].contains("verification"), "no verification key without verification");

    Verification verified;
    verified.status = VerificationStatus::Verified;
    verified.source = "Crossref (DOI)";
    verified.link = "https://doi.org/10.1000/xyz";
    ResultExportService::VerificationList verifications = {verified, std::nullopt};
    auto withVerification = exporter.toJson(results, {}, verifications);
    Check(withVerification[0]["verification"]["status"] == "verified" &&
          withVerification[0]["verification"]["source"] == "Crossref (DOI)", "verification status and source");
    Check(withVerification[0]["verification"]["matched_title"].is_null(), "missing matched title is null");
    Check(!withVerification[1].contains("verification"), "failures carry no verification");

    std::string csv = exporter.toCsv(results, {}, verifications);
    Check(csv.find(",verified,Crossref (DOI),https://doi.org/10.1000/xyz,") != std::string::npos,
          "verification columns in the CSV row");
}

void TestCsvExport() {
    ResultExportService exporter;
    auto results = SampleResults();
    std::string csv = exporter.toCsv(results);

    Check(csv.rfind("id,status,error_kind,error,title,authors,year,venue,doi,url,pages,catalog_match,catalog_score,"
                    "verification_status,verification_source,verification_link,raw\r\n", 0) == 0,
          "CSV header row");
    Check(CountOf(csv, "\r\n") == 3, "header plus one row per result");
    Check(csv.find("\"Smith, J., Doe, K. (2020). A Study of Things.\"") != std::string::npos, "raw with commas quoted");
    Check(csv.find("Smith, J.; Doe, K.") != std::string::npos, "authors joined with semicolons");
    Check(csv.find("MalformedCandidateError") != std::string::npos, "failure kind in its column");

    Check(ResultExportService::CsvEscape("plain") == "plain", "plain field unquoted");
    Check(ResultExportService::CsvEscape("a\"b") == "\"a\"\"b\"", "quotes doubled");

    CsvCatalogRepository reread;
    reread.loadFromString(csv);
    Check(reread.getRows().size() == 2 && reread.getRows()[0].size() == 17, "report reads back as CSV");
}

void TestAtomicWrite() {
    namespace fs = std::filesystem;
    ResultExportService exporter;
    fs::path dir = fs::temp_directory_path() / "refsifter_export_test";
    fs::path target = dir / "nested" / "report.csv";

    std::string error;
    Check(exporter.writeAtomically(target.string(), "first", error), "write creates parent directories");
    Check(exporter.writeAtomically(target.string(), "second", error), "write replaces existing file");

    std::ifstream in(target);
    std::stringstream content;
    content << in.rdbuf();
    Check(content.str() == "second", "file holds the latest content");

    size_t leftovers = 0;
    for (const auto& entry : fs::directory_iterator(target.parent_path())) {
        if (entry.path().extension() == ".tmp") ++leftovers;
    }
    Check(leftovers == 0, "no temp files left behind");

    error.clear();
    Check(!exporter.writeAtomically("/proc/refsifter/report.csv", "x", error) && !error.empty(),
          "unwritable location reports an error");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

} // namespace

int main() {
    std::cout << "[Test] CatalogExport" << std::endl;
    TestTitleKey();
    TestCsvParsing();
    TestCatalogMatching();
    TestJsonExport();
    TestCsvExport();
    TestAtomicWrite();
    std::cout << "[Test] Completed with " << g_failures << " failure(s)." << std::endl;
    return g_failures == 0 ? 0 : 1;
}
