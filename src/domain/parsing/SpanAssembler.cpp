#include "domain/parsing/SpanAssembler.hpp"

namespace refsifter::domain::parsing {

std::vector<FieldSpan> SpanAssembler::Assemble(const std::vector<LabeledToken>& tokens) {
    std::vector<FieldSpan> spans;
    if (tokens.empty()) return spans;

    FieldSpan current{tokens[0].label, 0, 0};
    for (size_t i = 1; i < tokens.size(); ++i) {
        if (tokens[i].label != current.label) {
            current.endToken = i;
            spans.push_back(current);
            current = FieldSpan{tokens[i].label, i, i};
        }
    }
    current.endToken = tokens.size();
    spans.push_back(current);
    return spans;
}

} // namespace refsifter::domain::parsing
