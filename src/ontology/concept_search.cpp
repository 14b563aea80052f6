#include <semgraph/ontology/concept_search.h>
#include <semgraph/util/string_util.h>
#include <algorithm>
#include <unordered_map>

namespace semgraph {
namespace ontology {

std::optional<SearchResult> ScoreConcept(const Concept& concept_value, const std::string& query) {
    std::string needle = ToLower(Trim(query));
    if (needle.empty()) {
        return std::nullopt;
    }

    auto result = [&](double score, MatchType type) {
        SearchResult r;
        r.item = concept_value;
        r.relevance_score = score;
        r.match_type = type;
        return r;
    };

    if (concept_value.label) {
        std::string label = ToLower(*concept_value.label);
        if (label == needle) {
            return result(RelevanceScores::kExactLabel, MatchType::Label);
        }
        if (StartsWith(label, needle)) {
            return result(RelevanceScores::kLabelPrefix, MatchType::Label);
        }
        if (label.find(needle) != std::string::npos) {
            return result(RelevanceScores::kLabelSubstring, MatchType::Label);
        }
    }
    if (ContainsIgnoreCase(LocalName(concept_value.iri), needle)) {
        return result(RelevanceScores::kLocalName, MatchType::Iri);
    }
    if (ContainsIgnoreCase(concept_value.iri, needle)) {
        return result(RelevanceScores::kIri, MatchType::Iri);
    }
    if (concept_value.comment && ContainsIgnoreCase(*concept_value.comment, needle)) {
        return result(RelevanceScores::kComment, MatchType::Comment);
    }
    return std::nullopt;
}

std::vector<SearchResult> SearchConcepts(const std::vector<Concept>& concepts,
                                         const std::string& query, size_t limit) {
    std::vector<SearchResult> results;
    if (limit == 0 || Trim(query).empty()) {
        return results;
    }

    // Best match per IRI
    std::unordered_map<std::string, size_t> index;
    for (const auto& concept_value : concepts) {
        auto match = ScoreConcept(concept_value, query);
        if (!match) {
            continue;
        }
        auto it = index.find(concept_value.iri);
        if (it == index.end()) {
            index.emplace(concept_value.iri, results.size());
            results.push_back(std::move(*match));
        } else if (match->relevance_score > results[it->second].relevance_score) {
            results[it->second] = std::move(*match);
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         if (a.relevance_score != b.relevance_score) {
                             return a.relevance_score > b.relevance_score;
                         }
                         const std::string label_a = a.item.label.value_or("");
                         const std::string label_b = b.item.label.value_or("");
                         if (label_a != label_b) {
                             return label_a < label_b;
                         }
                         return a.item.iri < b.item.iri;
                     });
    if (results.size() > limit) {
        results.resize(limit);
    }
    return results;
}

} // namespace ontology
} // namespace semgraph
