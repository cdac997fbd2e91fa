#include "infrastructure/CrossrefVerifiers.hpp"

#include <iostream>
#include <vector>

#include "domain/parsing/BibliographicMatch.hpp"

namespace refsifter::infrastructure {

using domain::Verification;
using domain::VerificationStatus;
using domain::parsing::BibliographicMatch;
using domain::parsing::PersonName;
using json = nlohmann::json;

namespace {

std::string FirstTitle(const json& work) {
    if (work.contains("title") && work["title"].is_array() && !work["title"].empty() &&
        work["title"][0].is_string()) {
        return work["title"][0].get<std::string>();
    }
    return {};
}

std::string LandingPage(const json& work, const std::string& doi) {
    if (work.contains("URL") && work["URL"].is_string()) {
        return work["URL"].get<std::string>();
    }
    return "https://doi.org/" + doi;
}

std::vector<PersonName> Authors(const json& work) {
    std::vector<PersonName> names;
    if (!work.contains("author") || !work["author"].is_array()) return names;
    for (const auto& author : work["author"]) {
        if (!author.is_object()) continue;
        PersonName name;
        name.family = author.value("family", std::string());
        name.given = author.value("given", std::string());
        if (name.family.empty()) name.family = author.value("name", std::string());
        names.push_back(name);
    }
    return names;
}

} // namespace

CrossrefDoiVerifier::CrossrefDoiVerifier(std::shared_ptr<CrossrefClient> client)
    : m_client(std::move(client)) {}

std::optional<Verification> CrossrefDoiVerifier::verify(const domain::CitationRecord& record) {
    if (!record.getDoi()) return std::nullopt;
    const std::string& doi = *record.getDoi();

    auto work = m_client->fetchWork(doi);
    if (!work) return std::nullopt;

    const std::string title = FirstTitle(*work);
    if (!record.getTitle().empty() && !BibliographicMatch::TitlesMatch(record.getTitle(), title)) {
        std::cerr << "[CrossrefDoiVerifier] DOI " << doi << " resolves to a different title: " << title << std::endl;
        return std::nullopt;
    }

    Verification verification;
    verification.status = VerificationStatus::Verified;
    verification.source = name();
    verification.link = LandingPage(*work, doi);
    verification.matchedTitle = title;
    return verification;
}

CrossrefSearchVerifier::CrossrefSearchVerifier(std::shared_ptr<CrossrefClient> client, int rows)
    : m_client(std::move(client)), m_rows(rows) {}

std::string CrossrefSearchVerifier::QueryText(const domain::CitationRecord& record) {
    if (record.getTitle().size() > MinTitleLength) return record.getTitle();
    return record.getRaw().substr(0, RawQueryLength);
}

std::optional<Verification> CrossrefSearchVerifier::verify(const domain::CitationRecord& record) {
    const std::string query = QueryText(record);
    const std::string firstAuthor = record.getAuthors().empty() ? std::string() : record.getAuthors().front();

    auto message = m_client->searchWorks(query, BibliographicMatch::FamilyName(firstAuthor), m_rows);
    if (!message || !message->contains("items") || !(*message)["items"].is_array()) return std::nullopt;

    for (const auto& item : (*message)["items"]) {
        if (!item.is_object()) continue;
        const std::string title = FirstTitle(item);
        if (!BibliographicMatch::TitlesMatch(query, title)) continue;
        if (!BibliographicMatch::AuthorMatches(firstAuthor, Authors(item))) continue;

        Verification verification;
        verification.status = VerificationStatus::Verified;
        verification.source = name();
        verification.link = LandingPage(item, item.value("DOI", std::string()));
        verification.matchedTitle = title;
        return verification;
    }
    return std::nullopt;
}

} // namespace refsifter::infrastructure
