#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "app/RefSifterApp.hpp"

using refsifter::app::RefSifterApp;
using refsifter::infrastructure::Settings;

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

std::optional<RefSifterApp::CliOptions> Parse(std::vector<std::string> args, std::string& error) {
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return RefSifterApp::ParseArguments(static_cast<int>(argv.size()), argv.data(), error);
}

void TestArguments() {
    std::string error;
    auto options = Parse({"refsifter", "--format", "csv", "--workers", "3", "--fail-fast",
                          "--catalog", "known.csv", "refs.txt"}, error);
    Check(options.has_value(), "valid command line accepted");
    if (options) {
        Check(options->format == "csv" && options->inputPath == "refs.txt", "format and input read");
        Check(options->workers == std::optional<size_t>(3) && options->failFast, "workers and fail-fast read");
    }

    auto defaults = Parse({"refsifter"}, error);
    Check(defaults && defaults->inputPath == "-" && defaults->format == "json", "stdin and JSON by default");
    Check(defaults && !defaults->verify, "verification off by default");

    auto verify = Parse({"refsifter", "--verify"}, error);
    Check(verify && verify->verify &&
          RefSifterApp::ApplyOverrides(Settings{}, *verify).verification.enabled, "--verify enables verification");

    Check(!Parse({"refsifter", "--workers", "0"}, error) && !error.empty(), "zero workers rejected");
    Check(!Parse({"refsifter", "--format", "xml"}, error), "unknown format rejected");
    Check(!Parse({"refsifter", "--bogus"}, error), "unknown option rejected");
    Check(!Parse({"refsifter", "a.txt", "b.txt"}, error), "second input rejected");
    Check(!Parse({"refsifter", "--config"}, error) && error.find("--config") != std::string::npos,
          "missing option value reported");

    Settings settings;
    RefSifterApp::CliOptions overrides;
    overrides.backend = "http";
    overrides.workers = 7;
    overrides.failFast = true;
    Settings applied = RefSifterApp::ApplyOverrides(settings, overrides);
    Check(applied.tagger.backend == "http" && applied.parsing.batchSize == 7 &&
          !applied.parsing.continueOnFailure, "command line overrides settings");
}

void TestRunWithCatalog() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "refsifter_app_test";
    fs::create_directories(dir);

    fs::path catalog = dir / "catalog.csv";
    fs::path input = dir / "refs.txt";
    fs::path output = dir / "out" / "report.json";
    {
        std::ofstream out(catalog);
        out << "Key,Title\nk1,A Study of Things\nk2,Unrelated Work\n";
    }
    {
        std::ofstream out(input);
        out << "Smith, J. (2020). A Study of Things. Journal of Examples, 12(3), 1-10.\n\n.\n";
    }

    Settings settings;
    settings.catalog.path = catalog.string();
    settings.catalog.titleColumn = "Title";
    RefSifterApp application(settings);
    Check(application.getServices().catalogService != nullptr, "catalog loaded from settings");

    RefSifterApp::CliOptions options;
    options.inputPath = input.string();
    options.outputPath = output.string();
    Check(application.run(options) == 0, "run succeeds");

    std::ifstream in(output);
    std::stringstream content;
    content << in.rdbuf();
    auto report = nlohmann::json::parse(content.str());
    Check(report.is_array() && report.size() == 2, "report has one item per candidate");
    Check(report[0]["status"] == "ok" && report[0]["catalog_match"]["title"] == "A Study of Things",
          "parsed record matched in the catalog");
    Check(report[1]["status"] == "error", "stray line reported as an error");

    auto results = application.getServices().parsingService->parse("Doe, K. (2019). Another Study. Venue.");
    std::string csv = application.render(results, "csv");
    Check(csv.find("Another Study.") != std::string::npos, "CSV rendering");

    options.inputPath = (dir / "missing.txt").string();
    Check(application.run(options) == 1, "missing input fails");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

} // namespace

int main() {
    std::cout << "[Test] App" << std::endl;
    TestArguments();
    TestRunWithCatalog();
    std::cout << "[Test] Completed with " << g_failures << " failure(s)." << std::endl;
    return g_failures == 0 ? 0 : 1;
}
