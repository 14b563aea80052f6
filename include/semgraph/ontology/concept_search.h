#pragma once

#include <optional>
#include <string>
#include <vector>
#include <semgraph/ontology/concept.h>

namespace semgraph {
namespace ontology {

// Relevance of each kind of match, best first
struct RelevanceScores {
    static constexpr double kExactLabel = 1.0;
    static constexpr double kLabelPrefix = 0.9;
    static constexpr double kLabelSubstring = 0.8;
    static constexpr double kLocalName = 0.7;
    static constexpr double kIri = 0.6;
    static constexpr double kComment = 0.5;
};

// Best match of query against one concept (case-insensitive); std::nullopt if
// nothing matches
std::optional<SearchResult> ScoreConcept(const Concept& concept_value, const std::string& query);

// Rank concepts against a free-text query. Each concept appears once with its best
// match; results are ordered by score, then label, then IRI, and capped at limit.
// An empty or blank query matches nothing.
std::vector<SearchResult> SearchConcepts(const std::vector<Concept>& concepts,
                                         const std::string& query, size_t limit);

} // namespace ontology
} // namespace semgraph
