/**
 * @file RefSifterApp.cpp
 * @brief Implementation of the RefSifterApp class.
 */
#include "app/RefSifterApp.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "infrastructure/CrossrefVerifiers.hpp"
#include "infrastructure/CsvCatalogRepository.hpp"
#include "infrastructure/LinkVerifier.hpp"
#include "infrastructure/TaggerFactory.hpp"

namespace refsifter::app {

namespace {

bool NeedsValue(int i, int argc, const std::string& flag, std::string& error) {
    if (i + 1 >= argc) {
        error = "missing value for " + flag;
        return false;
    }
    return true;
}

} // namespace

std::string RefSifterApp::Usage(const std::string& program) {
    std::stringstream ss;
    ss << "Usage: " << program << " [options] [INPUT|-]\n"
       << "  --config FILE         settings.json to read (default: ./settings.json)\n"
       << "  --format json|csv     output format (default: json)\n"
       << "  --output FILE         write the report to FILE instead of stdout\n"
       << "  --catalog FILE        CSV catalog of known titles to match against\n"
       << "  --title-column NAME   catalog column holding titles\n"
       << "  --backend NAME        tagger backend: rules, http, command\n"
       << "  --workers N           candidates processed concurrently\n"
       << "  --fail-fast           stop attempting references after the first failure\n"
       << "  --verify              look references up in the catalog, Crossref and their own URL\n"
       << "  --help                show this text\n";
    return ss.str();
}

std::optional<RefSifterApp::CliOptions> RefSifterApp::ParseArguments(int argc, char* argv[], std::string& error) {
    CliOptions options;
    bool inputSeen = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--config") {
            if (!NeedsValue(i, argc, arg, error)) return std::nullopt;
            options.configPath = argv[++i];
        } else if (arg == "--format") {
            if (!NeedsValue(i, argc, arg, error)) return std::nullopt;
            options.format = argv[++i];
            if (options.format != "json" && options.format != "csv") {
                error = "unknown format: " + options.format;
                return std::nullopt;
            }
        } else if (arg == "--output") {
            if (!NeedsValue(i, argc, arg, error)) return std::nullopt;
            options.outputPath = argv[++i];
        } else if (arg == "--catalog") {
            if (!NeedsValue(i, argc, arg, error)) return std::nullopt;
            options.catalogPath = argv[++i];
        } else if (arg == "--title-column") {
            if (!NeedsValue(i, argc, arg, error)) return std::nullopt;
            options.titleColumn = argv[++i];
        } else if (arg == "--backend") {
            if (!NeedsValue(i, argc, arg, error)) return std::nullopt;
            options.backend = argv[++i];
        } else if (arg == "--workers") {
            if (!NeedsValue(i, argc, arg, error)) return std::nullopt;
            try {
                int workers = std::stoi(argv[++i]);
                if (workers <= 0) throw std::out_of_range("workers");
                options.workers = static_cast<size_t>(workers);
            } catch (const std::exception&) {
                error = "--workers expects a positive integer";
                return std::nullopt;
            }
        } else if (arg == "--fail-fast") {
            options.failFast = true;
        } else if (arg == "--verify") {
            options.verify = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            error = "unknown option: " + arg;
            return std::nullopt;
        } else {
            if (inputSeen) {
                error = "only one input may be given";
                return std::nullopt;
            }
            options.inputPath = arg;
            inputSeen = true;
        }
    }
    return options;
}

infrastructure::Settings RefSifterApp::ApplyOverrides(infrastructure::Settings settings, const CliOptions& options) {
    if (options.catalogPath) settings.catalog.path = *options.catalogPath;
    if (options.titleColumn) settings.catalog.titleColumn = *options.titleColumn;
    if (options.backend) settings.tagger.backend = *options.backend;
    if (options.workers) settings.parsing.batchSize = *options.workers;
    if (options.failFast) settings.parsing.continueOnFailure = false;
    if (options.verify) settings.verification.enabled = true;
    return settings;
}

RefSifterApp::RefSifterApp(const infrastructure::Settings& settings) {
    auto tagger = infrastructure::TaggerFactory::Create(settings.tagger);
    auto tagging = std::make_shared<application::TaggingAdapter>(
        tagger, std::chrono::milliseconds(settings.tagger.timeoutMs));

    std::cerr << "[RefSifterApp] Tagger: " << tagging->getBackendName()
              << " (timeout " << tagging->getTimeout().count() << " ms)" << std::endl;
    m_services.parsingService = std::make_shared<application::ReferenceParsingService>(tagging, settings.parsing);
    m_services.exportService = std::make_unique<application::ResultExportService>();

    if (!settings.catalog.path.empty()) {
        infrastructure::CsvCatalogRepository repository;
        std::string error;
        if (repository.load(settings.catalog.path, error)) {
            m_services.catalogService = std::make_shared<application::CatalogMatchService>(
                repository.getColumn(settings.catalog.titleColumn), settings.catalog.threshold);
        } else {
            std::cerr << "[RefSifterApp] Catalog disabled: " << error << std::endl;
        }
    }

    if (settings.verification.enabled) {
        std::vector<std::shared_ptr<domain::ReferenceVerifier>> steps;
        if (m_services.catalogService) {
            steps.push_back(std::make_shared<application::CatalogVerifier>(m_services.catalogService));
        }
        auto crossref = std::make_shared<infrastructure::CrossrefClient>(
            settings.verification.crossrefUrl, settings.verification.timeoutMs, settings.verification.mailto);
        steps.push_back(std::make_shared<infrastructure::CrossrefDoiVerifier>(crossref));
        steps.push_back(std::make_shared<infrastructure::CrossrefSearchVerifier>(crossref));
        if (settings.verification.checkLinks) {
            steps.push_back(std::make_shared<infrastructure::LinkVerifier>(settings.verification.timeoutMs));
        }
        m_services.verificationService = std::make_unique<application::VerificationService>(
            std::move(steps), settings.verification.workers);
        std::cerr << "[RefSifterApp] Verification via " << settings.verification.crossrefUrl << std::endl;
    }
}

std::string RefSifterApp::render(const std::vector<domain::ParseResult>& results, const std::string& format) const {
    application::ResultExportService::MatchList matches;
    if (m_services.catalogService) {
        matches.reserve(results.size());
        for (const auto& result : results) {
            if (domain::IsSuccess(result)) {
                matches.push_back(m_services.catalogService->match(std::get<domain::CitationRecord>(result)));
            } else {
                matches.push_back(std::nullopt);
            }
        }
    }

    application::ResultExportService::VerificationList verifications;
    if (m_services.verificationService) {
        verifications = m_services.verificationService->verifyAll(results);
    }

    if (format == "csv") {
        return m_services.exportService->toCsv(results, matches, verifications);
    }
    return m_services.exportService->toJson(results, matches, verifications).dump(2) + "\n";
}

int RefSifterApp::run(const CliOptions& options) {
    std::string text;
    if (options.inputPath == "-") {
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        text = buffer.str();
    } else {
        std::ifstream file(options.inputPath, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "[RefSifterApp] Could not open input: " << options.inputPath << std::endl;
            return 1;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        text = buffer.str();
    }

    auto results = m_services.parsingService->parse(text);
    std::string report = render(results, options.format);

    if (options.outputPath.empty()) {
        std::cout << report;
        std::cout.flush();
        return 0;
    }

    std::string error;
    if (!m_services.exportService->writeAtomically(options.outputPath, report, error)) {
        std::cerr << "[RefSifterApp] Failed to write " << options.outputPath << ": " << error << std::endl;
        return 1;
    }
    std::cerr << "[RefSifterApp] Report written to " << options.outputPath << std::endl;
    return 0;
}

} // namespace refsifter::app
