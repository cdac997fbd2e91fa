/**
 * @file ReferenceParsingService.cpp
 * @brief Implementation of ReferenceParsingService.
 */

#include "application/ReferenceParsingService.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <optional>
#include <thread>

#include "domain/parsing/SpanAssembler.hpp"

namespace refsifter::application {

using domain::ParseErrorKind;
using domain::ParseFailure;
using domain::ParseResult;
using domain::ReferenceCandidate;

namespace {

ParseFailure MakeFailure(ParseErrorKind kind, const std::string& message, const ReferenceCandidate& candidate) {
    ParseFailure failure;
    failure.kind = kind;
    failure.message = message;
    failure.raw = candidate.text;
    failure.firstLine = candidate.firstLine;
    failure.lastLine = candidate.lastLine;
    return failure;
}

} // namespace

ReferenceParsingService::ReferenceParsingService(std::shared_ptr<TaggingAdapter> tagging, Options options)
    : m_tagging(std::move(tagging))
    , m_options(options)
    , m_segmenter(options.segmentation)
{
    if (m_options.batchSize == 0) {
        m_options.batchSize = 1;
    }
}

std::vector<ParseResult> ReferenceParsingService::parse(const std::string& rawText) const {
    return parse(domain::RawInput::FromText(rawText));
}

std::vector<ParseResult> ReferenceParsingService::parse(const domain::RawInput& input) const {
    const std::vector<ReferenceCandidate> candidates = m_segmenter.segment(input);
    if (candidates.empty()) {
        return {};
    }

    // One slot per candidate; each worker writes only the slots it claims.
    std::vector<std::optional<ParseResult>> slots(candidates.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> halted{false};

    auto worker = [&]() {
        while (true) {
            size_t index = next.fetch_add(1);
            if (index >= candidates.size()) return;

            const ReferenceCandidate& candidate = candidates[index];
            if (halted.load()) {
                slots[index] = MakeFailure(ParseErrorKind::Skipped,
                                           "not attempted: batch stopped after an earlier failure", candidate);
                continue;
            }

            ParseResult result = processCandidate(candidate);
            if (!domain::IsSuccess(result) && !m_options.continueOnFailure) {
                halted.store(true);
            }
            slots[index] = std::move(result);
        }
    };

    // Fail-fast runs on one worker so the Skipped set is the same on every run.
    size_t workerCount = m_options.continueOnFailure ? std::min(m_options.batchSize, candidates.size()) : 1;
    if (workerCount <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    }

    std::vector<ParseResult> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }

    Summary summary = Summarize(results);
    std::cerr << "[ReferenceParsingService] Parsed " << summary.parsed << "/" << summary.total
              << " references (malformed: " << summary.malformed
              << ", tagging unavailable: " << summary.taggingUnavailable
              << ", skipped: " << summary.skipped << ")" << std::endl;
    return results;
}

ParseResult ReferenceParsingService::parseLine(const std::string& referenceText) const {
    ReferenceCandidate candidate;
    std::string trimmed = referenceText;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);
    candidate.text = trimmed;
    return processCandidate(candidate);
}

ParseResult ReferenceParsingService::processCandidate(const ReferenceCandidate& candidate) const {
    try {
        auto features = m_extractor.extract(candidate);
        auto labeled = m_tagging->label(features);
        auto spans = domain::parsing::SpanAssembler::Assemble(labeled);
        return m_normalizer.normalize(spans, labeled, candidate);
    } catch (const domain::MalformedCandidateError& e) {
        std::cerr << "[ReferenceParsingService] Malformed candidate at line " << (candidate.firstLine + 1)
                  << ": " << e.what() << std::endl;
        return MakeFailure(ParseErrorKind::MalformedCandidate, e.what(), candidate);
    } catch (const domain::TaggingUnavailableError& e) {
        std::cerr << "[ReferenceParsingService] Tagging unavailable for line " << (candidate.firstLine + 1)
                  << ": " << e.what() << std::endl;
        return MakeFailure(ParseErrorKind::TaggingUnavailable, e.what(), candidate);
    }
}

ReferenceParsingService::Summary ReferenceParsingService::Summarize(const std::vector<ParseResult>& results) {
    Summary summary;
    summary.total = results.size();
    for (const auto& result : results) {
        if (domain::IsSuccess(result)) {
            ++summary.parsed;
            continue;
        }
        switch (std::get<ParseFailure>(result).kind) {
            case ParseErrorKind::MalformedCandidate: ++summary.malformed; break;
            case ParseErrorKind::TaggingUnavailable: ++summary.taggingUnavailable; break;
            case ParseErrorKind::Skipped: ++summary.skipped; break;
        }
    }
    return summary;
}

} // namespace refsifter::application
