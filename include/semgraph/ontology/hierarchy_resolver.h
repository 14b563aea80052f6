#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <semgraph/ontology/concept.h>

namespace semgraph {
namespace ontology {

// HierarchyResolver: ancestor, descendant and sibling sets over a concept set.
//
// Closures are iterative depth-first walks with a visited set, so cycles in the
// underlying triples terminate and the subject never appears in its own closures.
// Edges to IRIs that are not concepts are not followed.
class HierarchyResolver {
public:
    explicit HierarchyResolver(std::vector<Concept> concepts);

    // std::nullopt if iri is not a concept
    std::optional<Hierarchy> Resolve(const std::string& iri) const;

    std::vector<Concept> Ancestors(const std::string& iri) const;
    std::vector<Concept> Descendants(const std::string& iri) const;
    std::vector<Concept> Siblings(const std::string& iri) const;

private:
    enum class Edge { Parent, Child };

    std::vector<Concept> Closure(const std::string& iri, Edge edge) const;
    const Concept* Find(const std::string& iri) const;

    std::vector<Concept> concepts_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace ontology
} // namespace semgraph
