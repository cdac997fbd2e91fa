#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "domain/parsing/SpanAssembler.hpp"

using namespace refsifter::domain;
using refsifter::domain::parsing::SpanAssembler;

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

std::vector<LabeledToken> Labeled(const std::vector<FieldLabel>& labels) {
    std::vector<LabeledToken> tokens;
    for (size_t i = 0; i < labels.size(); ++i) {
        LabeledToken t;
        t.token.text = "t" + std::to_string(i);
        t.token.core = t.token.text;
        t.label = labels[i];
        tokens.push_back(t);
    }
    return tokens;
}

void TestBasics() {
    Check(SpanAssembler::Assemble({}).empty(), "no tokens, no spans");

    auto one = SpanAssembler::Assemble(Labeled({FieldLabel::Title}));
    Check(one.size() == 1 && one[0].startToken == 0 && one[0].endToken == 1, "single token span");

    auto spans = SpanAssembler::Assemble(Labeled({
        FieldLabel::Author, FieldLabel::Author, FieldLabel::Year,
        FieldLabel::Title, FieldLabel::Title, FieldLabel::Title,
        FieldLabel::Venue, FieldLabel::Author}));
    Check(spans.size() == 5, "maximal runs become spans");
    if (spans.size() == 5) {
        Check(spans[0].label == FieldLabel::Author && spans[0].length() == 2, "leading author run");
        Check(spans[2].startToken == 3 && spans[2].endToken == 6, "title run bounds");
        Check(spans[4].label == FieldLabel::Author && spans[4].startToken == 7,
              "a later run of an earlier label is its own span");
    }
}

// Every labeled sequence must come back as a partition with alternating labels.
void TestPartitionProperty() {
    std::mt19937 rng(20201);
    std::uniform_int_distribution<int> labelDist(0, 4);
    std::uniform_int_distribution<int> lengthDist(1, 40);
    const FieldLabel kLabels[] = {FieldLabel::Author, FieldLabel::Title, FieldLabel::Year,
                                  FieldLabel::Venue, FieldLabel::Other};

    bool partitioned = true;
    bool alternating = true;
    bool uniform = true;
    for (int round = 0; round < 500; ++round) {
        std::vector<FieldLabel> labels;
        int length = lengthDist(rng);
        for (int i = 0; i < length; ++i) labels.push_back(kLabels[labelDist(rng)]);

        auto spans = SpanAssembler::Assemble(Labeled(labels));
        size_t expectedStart = 0;
        for (size_t s = 0; s < spans.size(); ++s) {
            if (spans[s].startToken != expectedStart || spans[s].length() == 0) partitioned = false;
            if (s > 0 && spans[s].label == spans[s - 1].label) alternating = false;
            for (size_t i = spans[s].startToken; i < spans[s].endToken && i < labels.size(); ++i) {
                if (labels[i] != spans[s].label) uniform = false;
            }
            expectedStart = spans[s].endToken;
        }
        if (expectedStart != labels.size()) partitioned = false;
    }
    Check(partitioned, "spans partition the token sequence");
    Check(alternating, "adjacent spans never share a label");
    Check(uniform, "each span carries the label of all its tokens");
}

} // namespace

int main() {
    std::cout << "[Test] SpanAssembler" << std::endl;
    TestBasics();
    TestPartitionProperty();
    std::cout << "[Test] Completed with " << g_failures << " failure(s)." << std::endl;
    return g_failures == 0 ? 0 : 1;
}
