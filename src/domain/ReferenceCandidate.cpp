#include "domain/ReferenceCandidate.hpp"

#include <sstream>

namespace refsifter::domain {

RawInput RawInput::FromText(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return RawInput(std::move(lines));
    }

    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return RawInput(std::move(lines));
}

} // namespace refsifter::domain
