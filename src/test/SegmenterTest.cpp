#include <iostream>
#include <string>
#include <vector>

#include "domain/ReferenceCandidate.hpp"
#include "domain/parsing/ReferenceSegmenter.hpp"

using refsifter::domain::RawInput;
using refsifter::domain::ReferenceCandidate;
using refsifter::domain::parsing::ReferenceSegmenter;

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

std::vector<ReferenceCandidate> Segment(const std::string& text, ReferenceSegmenter::Options options = {}) {
    ReferenceSegmenter segmenter(options);
    return segmenter.segment(RawInput::FromText(text));
}

void TestEmptyInput() {
    Check(Segment("").empty(), "empty input yields no candidates");
    Check(Segment("   \n\t\n\n").empty(), "blank lines yield no candidates");
}

void TestBlankLineSeparation() {
    auto c = Segment("Smith, J. (2020). A Study\nof Things. Journal.\n\nDoe, K. (2019). Other Work. Venue.");
    Check(c.size() == 2, "blank line separates two references");
    if (c.size() == 2) {
        Check(c[0].text == "Smith, J. (2020). A Study of Things. Journal.", "continuation line joined with a space");
        Check(c[0].firstLine == 0 && c[0].lastLine == 1, "first candidate covers lines 0-1");
        Check(c[1].firstLine == 3 && c[1].lastLine == 3, "second candidate starts after the blank line");
    }
}

void TestFlatOnePerLine() {
    auto c = Segment("Smith, J. (2020). A Study of Things. Journal of Examples, 12(3), 1-10.\n"
                     "Doe, K. (2019). Another Study. Review of Tests, 4, 5-6.\r\n"
                     "Roe, A. (2018). A third title that wraps\n"
                     "onto a second line. Venue.");
    Check(c.size() == 3, "terminal punctuation plus capitalized line starts a new reference");
    if (c.size() == 3) {
        Check(c[1].text == "Doe, K. (2019). Another Study. Review of Tests, 4, 5-6.", "CRLF is stripped");
        Check(c[2].text == "Roe, A. (2018). A third title that wraps onto a second line. Venue.",
              "line without terminal punctuation is continued");
    }
}

void TestNumberedMarkers() {
    auto c = Segment("[1] A. Author, \"Title of\nthe paper,\" Venue, 2020.\n[2] B. Author, \"Second,\" Venue, 2019.");
    Check(c.size() == 2, "bracketed numbers start references");

    auto d = Segment("1. Smith, J. A First Title.\nJournal of Things.\n2. Doe, K. Second Title.\n3) Roe, A. Third.");
    Check(d.size() == 3, "numbered list only breaks on markers");
    if (d.size() == 3) {
        Check(d[0].text == "1. Smith, J. A First Title. Journal of Things.", "unnumbered line stays with its reference");
    }
}

void TestHangingIndent() {
    auto c = Segment("Smith, J. (2020). A long title\n"
                     "    continues here. Journal.\n"
                     "Doe, K. (2019). Other\n"
                     "    More text here.");
    Check(c.size() == 2, "hanging indent groups indented lines");
    if (c.size() == 2) {
        Check(c[0].text == "Smith, J. (2020). A long title continues here. Journal.", "indented line appended");
        Check(c[1].firstLine == 2 && c[1].lastLine == 3, "base-indent line starts the next reference");
    }
}

void TestHyphenation() {
    auto c = Segment("Smith, J. (2020). A Study of exam-\nples in practice. Venue.");
    Check(c.size() == 1 && c[0].text == "Smith, J. (2020). A Study of examples in practice. Venue.",
          "line-end hyphenation is undone");

    auto d = Segment("Smith, J. (2020). Pages 1-\n10 of it. Venue.");
    Check(d.size() == 1 && d[0].text == "Smith, J. (2020). Pages 1- 10 of it. Venue.",
          "hyphen after a digit is kept");
}

void TestUnterminatedLastCandidate() {
    auto c = Segment("Smith, J. (2020). A Study.\n\nDoe, K. an unterminated tail");
    Check(c.size() == 2 && c[1].text == "Doe, K. an unterminated tail", "final candidate emitted at end of input");
}

void TestStrayCharacter() {
    auto c = Segment("Smith, J. (2020). A Study of Things. Journal of Examples, 12(3), 1-10.\n\n.");
    Check(c.size() == 2 && c[1].text == ".", "stray character after a blank line is its own candidate");
}

void TestOptionsDisableHeuristics() {
    ReferenceSegmenter::Options options;
    options.numberingMarkers = false;
    options.flatLineBreaks = false;
    auto c = Segment("[1] First reference.\n[2] Second reference.", options);
    Check(c.size() == 1, "disabled heuristics append every non-blank line");
}

void TestMarkerDetection() {
    Check(ReferenceSegmenter::StartsWithMarker("12. Smith"), "\"12. \" is a marker");
    Check(ReferenceSegmenter::StartsWithMarker("  [3] Doe"), "\"[3]\" is a marker");
    Check(ReferenceSegmenter::StartsWithMarker("(4) Roe"), "\"(4)\" is a marker");
    Check(ReferenceSegmenter::StartsWithMarker("- bullet"), "dash bullet is a marker");
    Check(!ReferenceSegmenter::StartsWithMarker("2020. Title"), "a year is not a marker");
    Check(!ReferenceSegmenter::StartsWithMarker("1.5 litres"), "a decimal is not a marker");
    Check(!ReferenceSegmenter::StartsWithMarker("Smith, J."), "a name is not a marker");
}

} // namespace

int main() {
    std::cout << "[Test] ReferenceSegmenter" << std::endl;
    TestEmptyInput();
    TestBlankLineSeparation();
    TestFlatOnePerLine();
    TestNumberedMarkers();
    TestHangingIndent();
    TestHyphenation();
    TestUnterminatedLastCandidate();
    TestStrayCharacter();
    TestOptionsDisableHeuristics();
    TestMarkerDetection();
    std::cout << "[Test] Completed with " << g_failures << " failure(s)." << std::endl;
    return g_failures == 0 ? 0 : 1;
}
