#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace semgraph {
namespace ontology {

enum class ConceptType {
    Class,       // declared rdfs:Class or owl:Class
    Concept,     // declared skos:Concept
    Individual   // anything else that qualifies
};

std::string_view toString(ConceptType type);

// Derived view of a graph node that qualifies as a class, concept or individual.
// Recomputed from the published generation on every request.
struct Concept {
    std::string iri;
    std::optional<std::string> label;
    std::optional<std::string> comment;
    ConceptType concept_type = ConceptType::Individual;
    std::optional<std::string> source_context;
    std::vector<std::string> parent_concepts;
    std::vector<std::string> child_concepts;

    // Label, else the IRI segment after the last '#' or '/'
    std::string DisplayName() const;

    bool operator==(const Concept& other) const;
    bool operator!=(const Concept& other) const { return !(*this == other); }
};

struct Hierarchy {
    Concept subject;
    std::vector<Concept> ancestors;
    std::vector<Concept> descendants;
    std::vector<Concept> siblings;
};

enum class MatchType { Label, Comment, Iri };

std::string_view toString(MatchType type);

struct SearchResult {
    Concept item;
    double relevance_score = 0.0;
    MatchType match_type = MatchType::Label;
};

enum class NeighborDirection { Outgoing, Incoming, PredicateUsage };
enum class DisplayType { Resource, Property, Literal };

std::string_view toString(NeighborDirection direction);
std::string_view toString(DisplayType type);

// One edge next to a resource
struct Neighbor {
    NeighborDirection direction = NeighborDirection::Outgoing;
    std::string predicate;
    std::string display;
    DisplayType display_type = DisplayType::Resource;
    std::optional<std::string> step_iri;   // set when display is an IRI
    bool step_is_resource = false;

    bool operator==(const Neighbor& other) const {
        return direction == other.direction && predicate == other.predicate &&
               display == other.display && display_type == other.display_type &&
               step_iri == other.step_iri && step_is_resource == other.step_is_resource;
    }
};

enum class LexicalMatchType { Resource, Property };

std::string_view toString(LexicalMatchType type);

// Result of the substring search over subjects and predicates
struct LexicalMatch {
    std::string value;
    LexicalMatchType type = LexicalMatchType::Resource;
};

// One row per context
struct Taxonomy {
    std::string name;
    std::string description;
    std::string source_type;            // file, database, schema or external
    std::optional<std::string> format;  // ttl, rdf; unset for glossary and links
    size_t concepts_count = 0;
    size_t properties_count = 0;
};

struct TaxonomyStats {
    std::vector<Taxonomy> taxonomies;
    size_t total_concepts = 0;
    size_t total_properties = 0;
    std::map<std::string, size_t> concepts_by_type;
    size_t top_level_concepts = 0;
};

void to_json(nlohmann::json& j, const Concept& concept_value);
void to_json(nlohmann::json& j, const Hierarchy& hierarchy);
void to_json(nlohmann::json& j, const SearchResult& result);
void to_json(nlohmann::json& j, const Neighbor& neighbor);
void to_json(nlohmann::json& j, const LexicalMatch& match);
void to_json(nlohmann::json& j, const Taxonomy& taxonomy);
void to_json(nlohmann::json& j, const TaxonomyStats& stats);

} // namespace ontology
} // namespace semgraph
