#include <semgraph/ontology/concept.h>
#include <semgraph/util/string_util.h>

namespace semgraph {
namespace ontology {

namespace {

template <typename T>
nlohmann::json OptionalJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

std::string_view toString(ConceptType type) {
    switch (type) {
        case ConceptType::Class: return "class";
        case ConceptType::Concept: return "concept";
        case ConceptType::Individual: return "individual";
    }
    return "unknown";
}

std::string_view toString(MatchType type) {
    switch (type) {
        case MatchType::Label: return "label";
        case MatchType::Comment: return "comment";
        case MatchType::Iri: return "iri";
    }
    return "unknown";
}

std::string_view toString(NeighborDirection direction) {
    switch (direction) {
        case NeighborDirection::Outgoing: return "outgoing";
        case NeighborDirection::Incoming: return "incoming";
        case NeighborDirection::PredicateUsage: return "predicate";
    }
    return "unknown";
}

std::string_view toString(DisplayType type) {
    switch (type) {
        case DisplayType::Resource: return "resource";
        case DisplayType::Property: return "property";
        case DisplayType::Literal: return "literal";
    }
    return "unknown";
}

std::string_view toString(LexicalMatchType type) {
    return type == LexicalMatchType::Property ? "property" : "resource";
}

std::string Concept::DisplayName() const {
    if (label && !label->empty()) {
        return *label;
    }
    return std::string(LocalName(iri));
}

bool Concept::operator==(const Concept& other) const {
    return iri == other.iri && label == other.label && comment == other.comment &&
           concept_type == other.concept_type && source_context == other.source_context &&
           parent_concepts == other.parent_concepts && child_concepts == other.child_concepts;
}

void to_json(nlohmann::json& j, const Concept& concept_value) {
    j = nlohmann::json{
        {"iri", concept_value.iri},
        {"label", OptionalJson(concept_value.label)},
        {"comment", OptionalJson(concept_value.comment)},
        {"concept_type", std::string(toString(concept_value.concept_type))},
        {"source_context", OptionalJson(concept_value.source_context)},
        {"parent_concepts", concept_value.parent_concepts},
        {"child_concepts", concept_value.child_concepts},
    };
}

void to_json(nlohmann::json& j, const Hierarchy& hierarchy) {
    j = nlohmann::json{
        {"concept", hierarchy.subject},
        {"ancestors", hierarchy.ancestors},
        {"descendants", hierarchy.descendants},
        {"siblings", hierarchy.siblings},
    };
}

void to_json(nlohmann::json& j, const SearchResult& result) {
    j = nlohmann::json{
        {"concept", result.item},
        {"relevance_score", result.relevance_score},
        {"match_type", std::string(toString(result.match_type))},
    };
}

void to_json(nlohmann::json& j, const Neighbor& neighbor) {
    j = nlohmann::json{
        {"direction", std::string(toString(neighbor.direction))},
        {"predicate", neighbor.predicate},
        {"display", neighbor.display},
        {"display_type", std::string(toString(neighbor.display_type))},
        {"step_iri", OptionalJson(neighbor.step_iri)},
        {"step_is_resource", neighbor.step_is_resource},
    };
}

void to_json(nlohmann::json& j, const LexicalMatch& match) {
    j = nlohmann::json{{"value", match.value}, {"type", std::string(toString(match.type))}};
}

void to_json(nlohmann::json& j, const Taxonomy& taxonomy) {
    j = nlohmann::json{
        {"name", taxonomy.name},
        {"description", taxonomy.description},
        {"source_type", taxonomy.source_type},
        {"format", OptionalJson(taxonomy.format)},
        {"concepts_count", taxonomy.concepts_count},
        {"properties_count", taxonomy.properties_count},
    };
}

void to_json(nlohmann::json& j, const TaxonomyStats& stats) {
    j = nlohmann::json{
        {"taxonomies", stats.taxonomies},
        {"total_concepts", stats.total_concepts},
        {"total_properties", stats.total_properties},
        {"concepts_by_type", stats.concepts_by_type},
        {"top_level_concepts", stats.top_level_concepts},
    };
}

} // namespace ontology
} // namespace semgraph
