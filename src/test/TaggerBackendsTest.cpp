#include <chrono>
#include <httplib.h>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "application/ReferenceParsingService.hpp"
#include "application/TaggingAdapter.hpp"
#include "domain/parsing/FeatureExtractor.hpp"
#include "infrastructure/CommandSequenceTagger.hpp"
#include "infrastructure/HttpSequenceTagger.hpp"
#include "infrastructure/RuleBasedTagger.hpp"
#include "infrastructure/TaggerFactory.hpp"
#include "infrastructure/TaggerProtocol.hpp"

using namespace refsifter::domain;
using namespace refsifter::infrastructure;
using refsifter::application::ReferenceParsingService;
using refsifter::application::TaggingAdapter;
using refsifter::domain::parsing::FeatureExtractor;

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

/**
 * Labeling service on a free local port. /tag answers "year" for tokens whose
 * features flag a year and "title" otherwise; /broken answers 500 and /slow
 * stalls before answering.
 */
class LocalTaggingService {
public:
    LocalTaggingService() {
        m_server.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
        m_server.Post("/tag", [](const httplib::Request& req, httplib::Response& res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.contains("tokens") || !body["tokens"].is_array()) {
                res.status = 400;
                return;
            }
            nlohmann::json labels = nlohmann::json::array();
            for (const auto& token : body["tokens"]) {
                if (!token.contains("features") || !token["features"].is_object()) {
                    res.status = 400;
                    return;
                }
                labels.push_back(token["features"].value("year", false) ? "year" : "title");
            }
            res.set_content(nlohmann::json{{"labels", labels}}.dump(), "application/json");
        });
        m_server.Post("/broken", [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
            res.set_content("model not loaded", "text/plain");
        });
        m_server.Post("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            res.set_content(R"({"labels": []})", "application/json");
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        while (!m_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~LocalTaggingService() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    int port() const { return m_port; }

private:
    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;
};

std::vector<TokenFeatureVector> Features(const std::string& text) {
    ReferenceCandidate candidate;
    candidate.text = text;
    return FeatureExtractor().extract(candidate);
}

void TestProtocol() {
    auto wrapped = TaggerProtocol::ParseLabels(R"({"labels": ["author", "title"]})");
    Check(wrapped && wrapped->size() == 2 && (*wrapped)[0] == FieldLabel::Author, "labels object parsed");

    auto bare = TaggerProtocol::ParseLabels(R"(["year", "container-title", "Pages"])");
    Check(bare && bare->size() == 3 && (*bare)[1] == FieldLabel::Venue && (*bare)[2] == FieldLabel::Other,
          "bare array with AnyStyle names parsed");

    auto noisy = TaggerProtocol::ParseLabels("loading model...\n[\"title\"]\ndone\n");
    Check(noisy && noisy->size() == 1 && (*noisy)[0] == FieldLabel::Title, "noise around the array tolerated");

    Check(!TaggerProtocol::ParseLabels(R"(["author", "shoe-size"])"), "unknown label rejected");
    Check(!TaggerProtocol::ParseLabels("not json at all"), "non-JSON rejected");
    Check(!TaggerProtocol::ParseLabels(R"({"labels": 3})"), "non-array labels rejected");
    Check(!TaggerProtocol::ParseLabels(R"([1, 2])"), "non-string labels rejected");

    Check(LabelFromString(" Editor ") == FieldLabel::Author, "editor maps to author");
    Check(LabelFromString("date") == FieldLabel::Year, "date maps to year");
    Check(!LabelFromString(""), "empty label name unknown");

    bool roundTrips = true;
    for (FieldLabel label : {FieldLabel::Author, FieldLabel::Title, FieldLabel::Year, FieldLabel::Venue, FieldLabel::Other}) {
        if (LabelFromString(LabelToString(label)) != label) roundTrips = false;
    }
    Check(roundTrips, "canonical label names parse back");

    auto request = TaggerProtocol::BuildRequest(Features("Smith, J. (2020)."));
    Check(request["tokens"].size() == 3, "one request entry per token");
    Check(request["tokens"][2]["text"] == "(2020)." && request["tokens"][2]["features"]["year"] == true,
          "request carries text and features");
    Check(request["tokens"][1]["index"] == 1, "request carries token index");
}

void TestCommandTagger() {
    auto features = Features("Alpha Beta");

    CommandSequenceTagger echo("printf '[\"title\",\"venue\"]'", 2000);
    auto labels = echo.tag(features);
    Check(labels && labels->size() == 2 && (*labels)[1] == FieldLabel::Venue, "command stdout parsed");

    CommandSequenceTagger failing("false", 2000);
    Check(!failing.tag(features), "non-zero exit gives no labels");

    CommandSequenceTagger cat("cat", 2000);
    Check(!cat.tag(features), "echoed request is not a label reply");
    Check(cat.isAvailable(), "cat is available");
    Check(!CommandSequenceTagger("refsifter-no-such-tool-xyz").isAvailable(), "missing tool unavailable");

    auto start = std::chrono::steady_clock::now();
    CommandSequenceTagger hung("sleep 5", 300);
    Check(!hung.tag(features), "hung command gives no labels");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Check(elapsed.count() < 3000, "hung command killed at its timeout");
}

void TestHttpTagger() {
    HttpSequenceTagger unreachable("127.0.0.1", 1, "/tag", 500);
    Check(!unreachable.tag(Features("Alpha Beta")), "unreachable service gives no labels");
    Check(!unreachable.isAlive(), "unreachable service is not alive");
    Check(unreachable.name() == "http://127.0.0.1:1/tag", "HTTP backend name");

    auto adapter = std::make_shared<TaggingAdapter>(std::make_shared<HttpSequenceTagger>("127.0.0.1", 1, "/tag", 500),
                                                    std::chrono::milliseconds(2000));
    ReferenceParsingService service(adapter, ReferenceParsingService::Options{});
    auto result = service.parseLine("Smith, J. (2020). A Study of Things.");
    Check(!IsSuccess(result) && std::get<ParseFailure>(result).kind == ParseErrorKind::TaggingUnavailable,
          "unreachable service surfaces as TaggingUnavailable");
}

void TestHttpTaggerAgainstService() {
    LocalTaggingService service;

    HttpSequenceTagger tagger("127.0.0.1", service.port(), "/tag", 2000);
    Check(tagger.isAlive(), "running service is alive");
    auto labels = tagger.tag(Features("Smith, J. (2020)."));
    Check(labels && labels->size() == 3, "service answers one label per token");
    Check(labels && (*labels)[0] == FieldLabel::Title && (*labels)[2] == FieldLabel::Year,
          "labels follow the features sent");

    HttpSequenceTagger broken("127.0.0.1", service.port(), "/broken", 2000);
    Check(!broken.tag(Features("Smith, J. (2020).")), "HTTP 500 gives no labels");

    auto adapter = std::make_shared<TaggingAdapter>(std::make_shared<HttpSequenceTagger>("127.0.0.1", service.port(), "/tag", 2000),
                                                    std::chrono::milliseconds(2000));
    ReferenceParsingService parsing(adapter, ReferenceParsingService::Options{});
    auto result = parsing.parseLine("A Study of Things 2020");
    Check(IsSuccess(result), "reference parsed through the service");
    if (IsSuccess(result)) {
        const auto& record = std::get<CitationRecord>(result);
        Check(record.getTitle() == "A Study of Things" && record.getYear() == 2020, "service labels reach the record");
    }

    auto slowAdapter = std::make_shared<TaggingAdapter>(std::make_shared<HttpSequenceTagger>("127.0.0.1", service.port(), "/slow", 5000),
                                                        std::chrono::milliseconds(300));
    ReferenceParsingService slowParsing(slowAdapter, ReferenceParsingService::Options{});
    auto start = std::chrono::steady_clock::now();
    auto slow = slowParsing.parseLine("A Study of Things 2020");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Check(!IsSuccess(slow) && std::get<ParseFailure>(slow).kind == ParseErrorKind::TaggingUnavailable &&
          std::get<ParseFailure>(slow).message.find("timed out") != std::string::npos,
          "slow service trips the tagging timeout");
    Check(elapsed.count() < 900, "slow service does not hold the candidate");
}

void TestFactory() {
    TaggerSettings settings;
    Check(TaggerFactory::Create(settings)->name() == "rules", "default backend is rules");

    settings.backend = "http";
    settings.port = 9999;
    std::ostringstream log;
    std::streambuf* previous = std::cerr.rdbuf(log.rdbuf());
    auto http = TaggerFactory::Create(settings);
    std::cerr.rdbuf(previous);
    Check(http->name() == "http://localhost:9999/tag", "http backend built");
    Check(log.str().find("WARNING") != std::string::npos, "unreachable http backend logs a warning");

    {
        LocalTaggingService service;
        settings.host = "127.0.0.1";
        settings.port = service.port();
        std::ostringstream quiet;
        previous = std::cerr.rdbuf(quiet.rdbuf());
        TaggerFactory::Create(settings);
        std::cerr.rdbuf(previous);
        Check(quiet.str().find("WARNING") == std::string::npos, "reachable http backend logs no warning");
    }

    settings.backend = "command";
    settings.command = "cat";
    Check(TaggerFactory::Create(settings)->name() == "command:cat", "command backend built");

    settings.backend = "crf-model";
    Check(TaggerFactory::Create(settings)->name() == "rules", "unknown backend falls back to rules");
}

void TestRuleLayouts() {
    auto adapter = std::make_shared<TaggingAdapter>(std::make_shared<RuleBasedTagger>(), std::chrono::milliseconds(2000));
    ReferenceParsingService service(adapter, ReferenceParsingService::Options{});

    auto ieee = service.parseLine(
        "[3] A. Author and B. Writer, \"Quoted Title of Paper,\" in Proc. Conf. Things, 2019, pp. 1-5.");
    Check(IsSuccess(ieee), "quoted-title reference parsed");
    if (IsSuccess(ieee)) {
        const auto& r = std::get<CitationRecord>(ieee);
        Check(r.getAuthors().size() == 2 && r.getAuthors()[0] == "A. Author" && r.getAuthors()[1] == "B. Writer",
              "quoted-title authors");
        Check(r.getTitle() == "Quoted Title of Paper", "quoted title without quotes");
        Check(r.getVenue() == std::optional<std::string>("Proceedings Conference Things"), "quoted-title venue");
        Check(r.getYear() == 2019 && r.getPages() == std::optional<std::string>("1-5"), "quoted-title year and pages");
    }

    auto lncs = service.parseLine(
        "Smith, J., Doe, K.: Title of the work. In: Proceedings of Things, pp. 1-10. Springer (2020)");
    Check(IsSuccess(lncs), "colon-style reference parsed");
    if (IsSuccess(lncs)) {
        const auto& r = std::get<CitationRecord>(lncs);
        Check(r.getAuthors().size() == 2 && r.getAuthors()[1] == "Doe, K.", "colon-style authors");
        Check(r.getTitle() == "Title of the work.", "colon-style title");
        Check(r.getVenue() == std::optional<std::string>("Proceedings of Things"), "colon-style venue");
        Check(r.getYear() == 2020 && r.getPages() == std::optional<std::string>("1-10"), "colon-style year and pages");
    }

    RuleBasedTagger tagger;
    auto features = Features("Smith, J. (2020). A Study of Things. Journal of Examples, 12(3), 1-10.");
    auto first = tagger.tag(features);
    auto second = tagger.tag(features);
    Check(first && second && *first == *second && first->size() == features.size(),
          "rule tagger is deterministic and complete");
}

} // namespace

int main() {
    std::cout << "[Test] TaggerBackends" << std::endl;
    TestProtocol();
    TestCommandTagger();
    TestHttpTagger();
    TestHttpTaggerAgainstService();
    TestFactory();
    TestRuleLayouts();
    std::cout << "[Test] Completed with " << g_failures << " failure(s)." << std::endl;
    return g_failures == 0 ? 0 : 1;
}
