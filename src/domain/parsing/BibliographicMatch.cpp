#include "domain/parsing/BibliographicMatch.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

#include "domain/parsing/TitleKey.hpp"

namespace refsifter::domain::parsing {

namespace {

std::string Lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> Words(const std::string& text) {
    std::vector<std::string> words;
    std::stringstream ss(text);
    std::string word;
    while (ss >> word) words.push_back(word);
    return words;
}

bool IsYearWord(const std::string& word) {
    if (word.size() != 4 || !std::all_of(word.begin(), word.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    return word.compare(0, 2, "19") == 0 || word.compare(0, 2, "20") == 0;
}

// Normalized title without years and repository boilerplate.
std::string TitleCore(const std::string& title) {
    static const std::set<std::string> kNoise = {"arxiv", "biorxiv", "available", "online", "access"};
    std::string out;
    for (const auto& word : Words(TitleKey::Normalize(title))) {
        if (IsYearWord(word) || kNoise.count(word)) continue;
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

} // namespace

bool BibliographicMatch::TitlesMatch(const std::string& query, const std::string& result) {
    const std::string q = TitleCore(query);
    const std::string r = TitleCore(result);
    if (q.empty() || r.empty()) return false;

    if (static_cast<double>(q.size()) > static_cast<double>(r.size()) * 1.5 && q.find(r) != std::string::npos) {
        return true;
    }
    if (TitleKey::Similarity(q, r) >= TitleRatioThreshold) {
        return true;
    }

    static const std::set<std::string> kStopWords = {
        "a", "an", "the", "of", "in", "for", "with", "on", "at", "by", "and", "from", "to"
    };
    const auto queryWordList = Words(q);
    const auto resultWordList = Words(r);
    const std::set<std::string> queryWords(queryWordList.begin(), queryWordList.end());
    const std::set<std::string> resultWords(resultWordList.begin(), resultWordList.end());

    size_t missing = 0;
    for (const auto& word : queryWords) {
        if (!kStopWords.count(word) && !resultWords.count(word)) ++missing;
    }
    if (missing <= 1 && queryWords.size() >= 5) return true;
    if (missing == 0 && static_cast<double>(q.size()) > static_cast<double>(r.size()) * 0.3) return true;
    return false;
}

bool BibliographicMatch::AuthorMatches(const std::string& queryAuthor, const std::vector<PersonName>& resultAuthors) {
    const std::string query = Lower(Trim(queryAuthor));
    if (query.size() < 2) return true;

    std::string family;
    char initial = '\0';
    size_t comma = query.find(',');
    if (comma != std::string::npos) {
        family = Trim(query.substr(0, comma));
        std::string given = Trim(query.substr(comma + 1));
        given = Trim(given.substr(0, given.find(',')));
        if (!given.empty()) initial = given[0];
    } else {
        auto words = Words(query);
        family = words.back();
        if (words.size() > 1) initial = words.front()[0];
    }

    static const std::set<std::string> kCommonFamilies = {
        "wang", "chen", "lee", "li", "zhang", "liu", "lin", "yang", "huang", "wu", "smith", "jones"
    };
    const bool common = kCommonFamilies.count(family) > 0;

    for (const auto& author : resultAuthors) {
        const std::string resultFamily = Lower(Trim(author.family));
        const std::string resultGiven = Lower(Trim(author.given));
        const std::string resultFull = Trim(resultGiven + " " + resultFamily);
        if (family != resultFamily && resultFull.find(family) == std::string::npos) continue;

        if (common && initial != '\0' && !resultGiven.empty() && resultGiven[0] != initial) continue;
        return true;
    }
    return false;
}

std::string BibliographicMatch::FamilyName(const std::string& author) {
    const std::string trimmed = Trim(author);
    size_t comma = trimmed.find(',');
    if (comma != std::string::npos) return Trim(trimmed.substr(0, comma));
    auto words = Words(trimmed);
    return words.empty() ? std::string() : words.back();
}

} // namespace refsifter::domain::parsing
