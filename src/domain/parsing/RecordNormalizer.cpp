#include "domain/parsing/RecordNormalizer.hpp"

#include <cctype>
#include <map>
#include <regex>
#include <sstream>

namespace refsifter::domain::parsing {

namespace {

const std::string kLeadingStrip = ",;:.-";
const std::string kTrailingStrip = ",;:-";

void TrimSpaces(std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        s.clear();
        return;
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    s = s.substr(first, last - first + 1);
}

size_t Count(const std::string& s, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// One pass of bracket and quote balancing at the edges. Returns true if changed.
bool StripUnbalanced(std::string& s) {
    static const std::pair<char, char> kBrackets[] = {{'(', ')'}, {'[', ']'}, {'{', '}'}};
    for (const auto& [open, close] : kBrackets) {
        size_t opens = Count(s, std::string(1, open));
        size_t closes = Count(s, std::string(1, close));
        if (!s.empty() && s.front() == open && s.back() == close) {
            s = s.substr(1, s.size() - 2);
            return true;
        }
        if (!s.empty() && s.front() == open && opens > closes) {
            s.erase(0, 1);
            return true;
        }
        if (!s.empty() && s.back() == close && closes > opens) {
            s.pop_back();
            return true;
        }
    }

    static const std::pair<std::string, std::string> kQuotes[] = {
        {"\"", "\""}, {"\xE2\x80\x9C", "\xE2\x80\x9D"}, {"'", "'"}, {"\xE2\x80\x98", "\xE2\x80\x99"}
    };
    for (const auto& [open, close] : kQuotes) {
        if (s.size() >= open.size() + close.size() && StartsWith(s, open) && EndsWith(s, close)) {
            s = s.substr(open.size(), s.size() - open.size() - close.size());
            return true;
        }
        bool symmetric = open == close;
        if (StartsWith(s, open) && (symmetric ? Count(s, open) % 2 == 1 : Count(s, close) == 0)) {
            s.erase(0, open.size());
            return true;
        }
        if (EndsWith(s, close) && (symmetric ? Count(s, close) % 2 == 1 : Count(s, open) == 0)) {
            s.erase(s.size() - close.size());
            return true;
        }
    }
    return false;
}

std::string JoinSpanTexts(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!out.empty()) out += ' ';
        out += part;
    }
    return out;
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

size_t DigitRun(const std::string& s, size_t from) {
    size_t end = from;
    while (end < s.size() && IsDigit(s[end])) ++end;
    return end - from;
}

size_t SkipSpaces(const std::string& s, size_t from) {
    while (from < s.size() && IsSpace(s[from])) ++from;
    return from;
}

size_t FindIgnoreCase(const std::string& haystack, const std::string& lowerNeedle, size_t from = 0) {
    if (lowerNeedle.empty() || haystack.size() < lowerNeedle.size()) return std::string::npos;
    for (size_t i = from; i + lowerNeedle.size() <= haystack.size(); ++i) {
        size_t k = 0;
        while (k < lowerNeedle.size() &&
               std::tolower(static_cast<unsigned char>(haystack[i + k])) == lowerNeedle[k]) {
            ++k;
        }
        if (k == lowerNeedle.size()) return i;
    }
    return std::string::npos;
}

bool IsNameSuffix(const std::string& part) {
    static const std::regex kSuffix(R"(^(Jr\.?|Sr\.?|II|III|IV)$)");
    return std::regex_match(part, kSuffix);
}

bool IsInitials(const std::string& part) {
    // Initials never run past 32 bytes; longer parts skip the matcher.
    if (part.size() > 32) return false;
    static const std::regex kInitials(R"(^([A-Z][a-z]?\.(-?[A-Z][a-z]?\.)*|[A-Z]{1,3})( ([A-Z][a-z]?\.(-?[A-Z][a-z]?\.)*|[A-Z]))*$)");
    return std::regex_match(part, kInitials);
}

} // namespace

std::string RecordNormalizer::StripPunctuation(const std::string& text) {
    std::string s = text;
    bool changed = true;
    while (changed) {
        changed = false;
        TrimSpaces(s);
        while (!s.empty() && kLeadingStrip.find(s.front()) != std::string::npos) {
            s.erase(0, 1);
            changed = true;
        }
        while (!s.empty() && kTrailingStrip.find(s.back()) != std::string::npos) {
            s.pop_back();
            changed = true;
        }
        TrimSpaces(s);
        if (StripUnbalanced(s)) changed = true;
    }
    return s;
}

std::vector<std::string> RecordNormalizer::SplitAuthors(const std::string& text) {
    static const std::regex kEtAl(R"(\bet\.?\s+al\b\.?)", std::regex::icase);
    static const std::regex kSeparators(R"(\s*;\s*|\s*&\s*|\s+and\s+)", std::regex::icase);

    std::string cleaned = std::regex_replace(text, kEtAl, "");
    cleaned = std::regex_replace(cleaned, kSeparators, ";");

    std::vector<std::string> authors;
    std::stringstream pieces(cleaned);
    std::string piece;
    while (std::getline(pieces, piece, ';')) {
        std::vector<std::string> parts;
        std::stringstream commaParts(piece);
        std::string part;
        while (std::getline(commaParts, part, ',')) {
            TrimSpaces(part);
            if (!part.empty()) parts.push_back(part);
        }

        for (size_t i = 0; i < parts.size(); ++i) {
            std::string name = parts[i];
            while (i + 1 < parts.size() && (IsInitials(parts[i + 1]) || IsNameSuffix(parts[i + 1]))) {
                name += ", " + parts[++i];
            }
            name = StripPunctuation(name);
            if (!name.empty()) authors.push_back(name);
        }
    }
    return authors;
}

std::optional<int> RecordNormalizer::ParseYear(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        if (i - start == 4) {
            return std::stoi(text.substr(start, 4));
        }
    }
    return std::nullopt;
}

std::string RecordNormalizer::ExpandVenue(const std::string& venue) {
    static const std::map<std::string, std::string> kAbbreviations = {
        {"Am.", "American"}, {"Annu.", "Annual"}, {"Assoc.", "Association"},
        {"Biol.", "Biology"}, {"Chem.", "Chemistry"}, {"Comput.", "Computing"},
        {"Conf.", "Conference"}, {"Econ.", "Economics"}, {"Eng.", "Engineering"},
        {"Eur.", "European"}, {"Inf.", "Information"}, {"Int.", "International"},
        {"Intl.", "International"}, {"J.", "Journal"}, {"Learn.", "Learning"},
        {"Lett.", "Letters"}, {"Ling.", "Linguistics"}, {"Mach.", "Machine"},
        {"Med.", "Medicine"}, {"Natl.", "National"}, {"Phys.", "Physics"},
        {"Proc.", "Proceedings"}, {"Psychol.", "Psychology"}, {"Res.", "Research"},
        {"Rev.", "Review"}, {"Sci.", "Science"}, {"Soc.", "Society"},
        {"Symp.", "Symposium"}, {"Syst.", "Systems"}, {"Technol.", "Technology"},
        {"Trans.", "Transactions"}
    };

    std::stringstream ss(venue);
    std::string word;
    std::string out;
    while (ss >> word) {
        std::string tail;
        while (!word.empty() && (word.back() == ',' || word.back() == ':' || word.back() == ';')) {
            tail.insert(tail.begin(), word.back());
            word.pop_back();
        }
        auto it = kAbbreviations.find(word);
        if (it != kAbbreviations.end()) word = it->second;
        if (!out.empty()) out += ' ';
        out += word + tail;
    }
    return out;
}

std::string RecordNormalizer::CleanTitle(const std::string& title) {
    std::string cleaned = title;

    // Leading "2020." or "2020 " left over from an author-year layout.
    size_t first = cleaned.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && DigitRun(cleaned, first) == 4) {
        size_t end = first + 4;
        while (end < cleaned.size() && (cleaned[end] == '.' || IsSpace(cleaned[end]))) ++end;
        if (end > first + 4) cleaned.erase(0, end);
    }

    // Everything from an arXiv marker on, together with the '.' and spaces before it.
    size_t marker = FindIgnoreCase(cleaned, "arxiv");
    if (marker != std::string::npos) {
        size_t cut = marker;
        while (cut > 0 && IsSpace(cleaned[cut - 1])) --cut;
        if (cut > 0 && cleaned[cut - 1] == '.') --cut;
        if (cut > 0) cleaned.erase(cut);
    }
    return StripPunctuation(cleaned);
}

std::optional<std::string> RecordNormalizer::ExtractDoi(const std::string& raw) {
    static const std::regex kArxiv(R"(arXiv:(\d{4}\.\d{4,5}))", std::regex::icase);

    // 10.<4-9 digit registrant>/<suffix up to the next space>
    for (size_t at = raw.find("10."); at != std::string::npos; at = raw.find("10.", at + 1)) {
        size_t registrant = DigitRun(raw, at + 3);
        size_t slash = at + 3 + registrant;
        if (registrant < 4 || registrant > 9 || slash >= raw.size() || raw[slash] != '/') continue;
        size_t end = slash + 1;
        while (end < raw.size() && !IsSpace(raw[end])) ++end;
        if (end == slash + 1) continue;

        std::string doi = raw.substr(at, end - at);
        while (!doi.empty() && std::string(",.;)]}>\"'").find(doi.back()) != std::string::npos) {
            doi.pop_back();
        }
        return doi;
    }

    std::smatch m;
    if (std::regex_search(raw, m, kArxiv)) {
        return "10.48550/arXiv." + m.str(1);
    }
    return std::nullopt;
}

std::optional<std::string> RecordNormalizer::ExtractUrl(const std::string& raw) {
    for (size_t at = FindIgnoreCase(raw, "http"); at != std::string::npos; at = FindIgnoreCase(raw, "http", at + 1)) {
        size_t rest = at + 4;
        if (rest < raw.size() && (raw[rest] == 's' || raw[rest] == 'S')) ++rest;
        if (raw.compare(rest, 3, "://") != 0) continue;
        size_t end = rest + 3;
        while (end < raw.size() && !IsSpace(raw[end])) ++end;
        if (end == rest + 3) continue;

        std::string url = raw.substr(at, end - at);
        while (!url.empty() && std::string(" ,.;)]}>\"'").find(url.back()) != std::string::npos) {
            url.pop_back();
        }
        return url;
    }
    return std::nullopt;
}

std::optional<std::string> RecordNormalizer::ExtractPages(const std::string& text) {
    // "<1-6 digits> <dashes or en/em dash> <1-6 digits>", not part of a decimal, date or id.
    for (size_t i = 0; i < text.size(); ++i) {
        if (!IsDigit(text[i])) continue;
        if (i > 0 && (IsDigit(text[i - 1]) || text[i - 1] == '.' || text[i - 1] == '/')) continue;

        size_t firstLen = DigitRun(text, i);
        if (firstLen > 6) {
            i += firstLen - 1;
            continue;
        }
        size_t pos = SkipSpaces(text, i + firstLen);
        size_t afterDash = pos;
        while (afterDash < text.size() && text[afterDash] == '-') ++afterDash;
        if (afterDash == pos) {
            if (text.compare(pos, 3, "\xE2\x80\x93") == 0 || text.compare(pos, 3, "\xE2\x80\x94") == 0) {
                afterDash = pos + 3;
            } else {
                continue;
            }
        }
        size_t second = SkipSpaces(text, afterDash);
        size_t secondLen = DigitRun(text, second);
        if (secondLen == 0 || secondLen > 6) continue;
        size_t next = second + secondLen;
        if (next < text.size() && text[next] == '/') continue;
        return text.substr(i, firstLen) + "-" + text.substr(second, secondLen);
    }
    return std::nullopt;
}

CitationRecord RecordNormalizer::normalize(const std::vector<FieldSpan>& spans,
                                           const std::vector<LabeledToken>& tokens,
                                           const ReferenceCandidate& candidate) const {
    std::map<FieldLabel, std::vector<std::string>> byLabel;
    for (const auto& span : spans) {
        if (span.startToken >= span.endToken || span.endToken > tokens.size()) continue;
        size_t begin = tokens[span.startToken].token.begin;
        size_t end = tokens[span.endToken - 1].token.end;
        if (end > candidate.text.size() || begin >= end) continue;
        byLabel[span.label].push_back(StripPunctuation(candidate.text.substr(begin, end - begin)));
    }

    auto joined = [&byLabel](FieldLabel label) {
        auto it = byLabel.find(label);
        return it == byLabel.end() ? std::string() : JoinSpanTexts(it->second);
    };

    CitationRecord::Fields fields;
    fields.authors = SplitAuthors(joined(FieldLabel::Author));
    fields.year = ParseYear(joined(FieldLabel::Year));
    fields.title = CleanTitle(joined(FieldLabel::Title));

    std::string venue = StripPunctuation(ExpandVenue(joined(FieldLabel::Venue)));
    if (!venue.empty()) fields.venue = venue;

    fields.doi = ExtractDoi(candidate.text);
    fields.url = ExtractUrl(candidate.text);

    std::string locatorText = JoinSpanTexts({joined(FieldLabel::Venue), joined(FieldLabel::Other)});
    if (fields.url) {
        size_t at = locatorText.find(*fields.url);
        if (at != std::string::npos) locatorText.erase(at, fields.url->size());
    }
    if (fields.doi) {
        size_t at = locatorText.find(*fields.doi);
        if (at != std::string::npos) locatorText.erase(at, fields.doi->size());
    }
    fields.pages = ExtractPages(locatorText);

    return CitationRecord(std::move(fields), candidate.text);
}

} // namespace refsifter::domain::parsing
