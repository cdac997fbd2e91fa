#include "domain/parsing/ReferenceSegmenter.hpp"

#include <cctype>

namespace refsifter::domain::parsing {

namespace {

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\f\v") == std::string::npos;
}

size_t Indentation(const std::string& line) {
    size_t width = 0;
    for (char c : line) {
        if (c == ' ') width += 1;
        else if (c == '\t') width += 4;
        else break;
    }
    return width;
}

std::string Trimmed(const std::string& line) {
    size_t first = line.find_first_not_of(" \t\f\v");
    if (first == std::string::npos) return {};
    size_t last = line.find_last_not_of(" \t\f\v");
    return line.substr(first, last - first + 1);
}

bool EndsWithTerminal(const std::string& trimmed) {
    if (trimmed.empty()) return false;
    char last = trimmed.back();
    return last == '.' || last == '?' || last == '!';
}

bool OpensLikeReference(const std::string& trimmed) {
    if (trimmed.empty()) return false;
    unsigned char first = static_cast<unsigned char>(trimmed.front());
    if (first >= 0x80) return true; // non-ASCII (CJK names, accented capitals)
    return std::isupper(first) || std::isdigit(first) || first == '"' || first == '\'';
}

// Joins a continuation line, undoing "exam-" / "ple" hyphenation.
void AppendLine(std::string& text, const std::string& trimmed) {
    if (text.empty()) {
        text = trimmed;
        return;
    }
    if (text.size() >= 2 && text.back() == '-' &&
        std::isalpha(static_cast<unsigned char>(text[text.size() - 2])) &&
        std::islower(static_cast<unsigned char>(trimmed.front()))) {
        text.pop_back();
        text += trimmed;
        return;
    }
    text += ' ';
    text += trimmed;
}

} // namespace

bool ReferenceSegmenter::StartsWithMarker(const std::string& line) {
    std::string t = Trimmed(line);
    if (t.empty()) return false;

    // Bullets: "- ", "* ", "• " (U+2022 is E2 80 A2 in UTF-8)
    if ((t[0] == '-' || t[0] == '*') && t.size() > 1 && t[1] == ' ') return true;
    if (t.compare(0, 3, "\xE2\x80\xA2") == 0) return true;

    size_t pos = 0;
    char open = '\0';
    if (t[0] == '[' || t[0] == '(') {
        open = t[0];
        pos = 1;
    }
    size_t digitsStart = pos;
    while (pos < t.size() && std::isdigit(static_cast<unsigned char>(t[pos]))) ++pos;
    size_t digits = pos - digitsStart;
    if (digits == 0 || digits > 3 || pos >= t.size()) return false;

    char close = t[pos];
    if (open == '[') return close == ']';
    if (open == '(') return close == ')';
    if (close != '.' && close != ')') return false;
    // "12. Smith" is a marker; "12.5" or "2020." followed by nothing is not.
    return pos + 1 < t.size() && t[pos + 1] == ' ';
}

std::vector<ReferenceCandidate> ReferenceSegmenter::segment(const RawInput& input) const {
    std::vector<ReferenceCandidate> candidates;
    const auto& lines = input.getLines();

    ReferenceCandidate current;
    bool open = false;
    std::string previousTrimmed;

    // Hanging indent is decided per blank-line-delimited block.
    size_t blockBaseIndent = 0;
    bool blockHanging = false;
    bool blockNumbered = false;

    auto flush = [&]() {
        if (open && !current.text.empty()) {
            candidates.push_back(current);
        }
        current = ReferenceCandidate{};
        open = false;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (IsBlank(line)) {
            flush();
            previousTrimmed.clear();
            continue;
        }

        std::string trimmed = Trimmed(line);
        bool blockStart = !open;

        if (blockStart) {
            blockBaseIndent = Indentation(line);
            blockHanging = false;
            blockNumbered = m_options.numberingMarkers && StartsWithMarker(line);
            if (m_options.hangingIndent) {
                for (size_t j = i + 1; j < lines.size() && !IsBlank(lines[j]); ++j) {
                    if (Indentation(lines[j]) > blockBaseIndent) {
                        blockHanging = true;
                        break;
                    }
                }
            }
        }

        bool startsNew = blockStart;
        if (!startsNew && m_options.numberingMarkers && StartsWithMarker(line)) {
            startsNew = true;
        }
        if (!startsNew && blockHanging) {
            startsNew = Indentation(line) <= blockBaseIndent;
        } else if (!startsNew && !blockNumbered && m_options.flatLineBreaks) {
            // Numbered lists only break on markers.
            startsNew = EndsWithTerminal(previousTrimmed) && OpensLikeReference(trimmed);
        }

        if (startsNew && open) {
            candidates.push_back(current);
            current = ReferenceCandidate{};
        }
        if (startsNew || !open) {
            current.firstLine = i;
            open = true;
        }
        AppendLine(current.text, trimmed);
        current.lastLine = i;
        previousTrimmed = trimmed;
    }
    flush();

    return candidates;
}

} // namespace refsifter::domain::parsing
