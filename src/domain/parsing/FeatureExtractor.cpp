#include "domain/parsing/FeatureExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "domain/ParseFailure.hpp"

namespace refsifter::domain::parsing {

namespace {

bool IsWordByte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

bool IsSpace(unsigned char c) {
    return std::isspace(c) != 0;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool AllDigits(const std::string& s, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool IsYearCore(const std::string& core) {
    size_t len = core.size();
    if (len == 5 && std::islower(static_cast<unsigned char>(core[4]))) {
        len = 4; // 2020a
    }
    if (len != 4 || !AllDigits(core, 0, 4)) return false;
    int year = std::stoi(core.substr(0, 4));
    return year >= 1500 && year <= 2099;
}

// "J." "J.-P." "JK" is not an initial, "A" followed by nothing is not either.
bool IsInitialToken(const std::string& text) {
    std::string t = text;
    while (!t.empty() && (t.back() == ',' || t.back() == ';')) t.pop_back();
    if (t.size() < 2 || t.back() != '.') return false;
    size_t i = 0;
    while (i < t.size()) {
        if (!std::isupper(static_cast<unsigned char>(t[i]))) return false;
        ++i;
        if (i < t.size() && std::islower(static_cast<unsigned char>(t[i])) && i + 1 < t.size() && t[i + 1] == '.') {
            ++i; // "Th." style
        }
        if (i >= t.size() || t[i] != '.') return false;
        ++i;
        if (i < t.size() && t[i] == '-') ++i;
    }
    return true;
}

bool IsPageRangeCore(const std::string& core) {
    size_t dash = core.find_first_of("-\xE2");
    if (dash == std::string::npos || dash == 0) return false;
    if (!AllDigits(core, 0, dash)) return false;
    size_t rest = dash;
    if (core[rest] == '-') {
        while (rest < core.size() && core[rest] == '-') ++rest;
    } else if (core.compare(rest, 3, "\xE2\x80\x93") == 0 || core.compare(rest, 3, "\xE2\x80\x94") == 0) {
        rest += 3; // en/em dash
    } else {
        return false;
    }
    return AllDigits(core, rest, core.size());
}

bool IsVolumeIssueCore(const std::string& core) {
    size_t open = core.find('(');
    if (open == std::string::npos || open == 0 || core.back() != ')') return false;
    return AllDigits(core, 0, open) && open + 2 < core.size();
}

bool IsMarkerText(const std::string& text) {
    if (text.size() < 2) return false;
    size_t i = 0;
    char open = '\0';
    if (text[0] == '[' || text[0] == '(') {
        open = text[0];
        i = 1;
    }
    size_t digitsStart = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i == digitsStart || i - digitsStart > 3 || i + 1 != text.size()) return false;
    char close = text[i];
    if (open == '[') return close == ']';
    if (open == '(') return close == ')';
    return close == '.' || close == ')';
}

} // namespace

std::vector<Token> FeatureExtractor::Tokenize(const std::string& text) {
    std::vector<Token> tokens;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && IsSpace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos >= text.size()) break;
        size_t start = pos;
        while (pos < text.size() && !IsSpace(static_cast<unsigned char>(text[pos]))) ++pos;

        std::string chunk = text.substr(start, pos - start);
        size_t coreBegin = 0;
        while (coreBegin < chunk.size() && !IsWordByte(static_cast<unsigned char>(chunk[coreBegin]))) ++coreBegin;
        if (coreBegin == chunk.size()) {
            continue; // punctuation only
        }
        size_t coreEnd = chunk.size();
        while (coreEnd > coreBegin && !IsWordByte(static_cast<unsigned char>(chunk[coreEnd - 1]))) --coreEnd;

        Token token;
        token.text = chunk;
        token.core = chunk.substr(coreBegin, coreEnd - coreBegin);
        // Keep a closing parenthesis that belongs to the core: "12(3)"
        if (coreEnd < chunk.size() && chunk[coreEnd] == ')' && token.core.find('(') != std::string::npos) {
            token.core += ')';
        }
        token.begin = start;
        token.end = pos;
        tokens.push_back(std::move(token));
    }
    return tokens;
}

std::string FeatureExtractor::Shape(const std::string& text) {
    std::string shape;
    for (unsigned char c : text) {
        char cls;
        if (std::isupper(c)) cls = 'X';
        else if (std::islower(c) || c >= 0x80) cls = 'x';
        else if (std::isdigit(c)) cls = 'd';
        else cls = static_cast<char>(c);
        if (shape.empty() || shape.back() != cls) {
            shape.push_back(cls);
        }
    }
    return shape;
}

Capitalization FeatureExtractor::Classify(const std::string& core) {
    size_t upper = 0;
    size_t lower = 0;
    for (unsigned char c : core) {
        if (std::isupper(c)) ++upper;
        else if (std::islower(c)) ++lower;
    }
    if (upper == 0 && lower == 0) return Capitalization::NoLetters;
    if (lower == 0) return Capitalization::AllUpper;
    if (upper == 0) return Capitalization::Lower;
    if (upper == 1 && std::isupper(static_cast<unsigned char>(core.front()))) return Capitalization::Capitalized;
    return Capitalization::Mixed;
}

LexicalClass FeatureExtractor::Lexical(const std::string& lowerCore) {
    static const std::unordered_map<std::string, LexicalClass> kWords = {
        {"and", LexicalClass::Conjunction}, {"und", LexicalClass::Conjunction},
        {"et", LexicalClass::EtAl}, {"al", LexicalClass::EtAl},
        {"journal", LexicalClass::VenueKeyword}, {"proceedings", LexicalClass::VenueKeyword},
        {"proc", LexicalClass::VenueKeyword}, {"conference", LexicalClass::VenueKeyword},
        {"conf", LexicalClass::VenueKeyword}, {"symposium", LexicalClass::VenueKeyword},
        {"workshop", LexicalClass::VenueKeyword}, {"transactions", LexicalClass::VenueKeyword},
        {"trans", LexicalClass::VenueKeyword}, {"review", LexicalClass::VenueKeyword},
        {"letters", LexicalClass::VenueKeyword}, {"press", LexicalClass::VenueKeyword},
        {"university", LexicalClass::VenueKeyword}, {"magazine", LexicalClass::VenueKeyword},
        {"bulletin", LexicalClass::VenueKeyword}, {"annals", LexicalClass::VenueKeyword},
        {"quarterly", LexicalClass::VenueKeyword}, {"arxiv", LexicalClass::VenueKeyword},
        {"in", LexicalClass::Preposition}, {"of", LexicalClass::Preposition},
        {"on", LexicalClass::Preposition}, {"for", LexicalClass::Preposition},
        {"the", LexicalClass::Preposition}, {"to", LexicalClass::Preposition},
        {"january", LexicalClass::Month}, {"february", LexicalClass::Month},
        {"march", LexicalClass::Month}, {"april", LexicalClass::Month},
        {"may", LexicalClass::Month}, {"june", LexicalClass::Month},
        {"july", LexicalClass::Month}, {"august", LexicalClass::Month},
        {"september", LexicalClass::Month}, {"october", LexicalClass::Month},
        {"november", LexicalClass::Month}, {"december", LexicalClass::Month},
        {"jan", LexicalClass::Month}, {"feb", LexicalClass::Month},
        {"mar", LexicalClass::Month}, {"apr", LexicalClass::Month},
        {"jun", LexicalClass::Month}, {"jul", LexicalClass::Month},
        {"aug", LexicalClass::Month}, {"sep", LexicalClass::Month},
        {"oct", LexicalClass::Month}, {"nov", LexicalClass::Month},
        {"dec", LexicalClass::Month},
        {"ed", LexicalClass::Editor}, {"eds", LexicalClass::Editor},
        {"editor", LexicalClass::Editor}, {"editors", LexicalClass::Editor},
        {"vol", LexicalClass::Locator}, {"volume", LexicalClass::Locator},
        {"no", LexicalClass::Locator}, {"pp", LexicalClass::Locator},
        {"p", LexicalClass::Locator}, {"pages", LexicalClass::Locator}
    };
    auto it = kWords.find(lowerCore);
    return it == kWords.end() ? LexicalClass::None : it->second;
}

std::vector<TokenFeatureVector> FeatureExtractor::extract(const ReferenceCandidate& candidate) const {
    std::vector<Token> tokens = Tokenize(candidate.text);
    if (tokens.empty()) {
        throw MalformedCandidateError("candidate has no tokens: \"" + candidate.text + "\"");
    }

    std::vector<TokenFeatureVector> features;
    features.reserve(tokens.size());
    const size_t count = tokens.size();

    for (size_t i = 0; i < count; ++i) {
        const Token& token = tokens[i];
        TokenFeatureVector f;
        f.token = token;
        f.index = i;
        f.tokenCount = count;
        f.relativePosition = count > 1 ? static_cast<double>(i) / static_cast<double>(count - 1) : 0.0;

        f.lowerCore = ToLower(token.core);
        f.capitalization = Classify(token.core);
        f.lexicalClass = Lexical(f.lowerCore);
        f.shape = Shape(token.text);

        for (unsigned char c : token.core) {
            if (std::isdigit(c)) ++f.digitCount;
            else if (std::isalpha(c) || c >= 0x80) ++f.letterCount;
        }
        f.digitDensity = token.core.empty() ? 0.0
            : static_cast<double>(f.digitCount) / static_cast<double>(token.core.size());

        unsigned char first = static_cast<unsigned char>(token.text.front());
        unsigned char last = static_cast<unsigned char>(token.text.back());
        if (std::ispunct(first)) f.leadingPunct = static_cast<char>(first);
        if (std::ispunct(last)) f.trailingPunct = static_cast<char>(last);

        f.isYearLike = IsYearCore(token.core);
        f.isInitial = IsInitialToken(token.text);
        f.isPageRange = IsPageRangeCore(token.core);
        f.isVolumeIssue = IsVolumeIssueCore(token.core);
        f.isNumberMarker = (i == 0) && IsMarkerText(token.text);
        f.isUrl = f.lowerCore.rfind("http", 0) == 0 || f.lowerCore.rfind("www.", 0) == 0;
        f.isDoi = f.lowerCore.rfind("10.", 0) == 0 && token.core.find('/') != std::string::npos;
        if (f.lowerCore.rfind("doi", 0) == 0 && token.core.find("10.") != std::string::npos) f.isDoi = true;

        const std::string& t = token.text;
        f.opensQuote = t.front() == '"' || t.rfind("\xE2\x80\x9C", 0) == 0 || t.front() == '\'';
        f.closesQuote = t.find('"', 1) != std::string::npos || t.find("\xE2\x80\x9D") != std::string::npos;
        f.opensParen = t.front() == '(' || t.front() == '[';
        f.closesParen = !f.isVolumeIssue && (t.find(')') != std::string::npos || t.find(']') != std::string::npos);

        char terminal = '\0';
        size_t back = t.size();
        while (back > 0 && (t[back - 1] == '"' || t[back - 1] == ')' || t[back - 1] == '\'')) --back;
        if (back > 0) terminal = t[back - 1];
        f.endsSentence = (terminal == '.' || terminal == '?' || terminal == '!') && !f.isInitial;

        features.push_back(std::move(f));
    }

    for (size_t i = 0; i < count; ++i) {
        if (i > 0) features[i].prevLowerCore = features[i - 1].lowerCore;
        if (i + 1 < count) features[i].nextLowerCore = features[i + 1].lowerCore;
    }
    return features;
}

} // namespace refsifter::domain::parsing
