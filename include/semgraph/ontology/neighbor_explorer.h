#pragma once

#include <memory>
#include <string>
#include <vector>
#include <semgraph/ontology/concept.h>
#include <semgraph/storage/graph_store.h>

namespace semgraph {
namespace ontology {

// NeighborExplorer: the edges directly attached to one resource in the union graph.
//
// Outgoing entries show the object of each triple with the resource as subject,
// Incoming entries the subject of each triple with it as object, and PredicateUsage
// entries both ends of each triple using it as predicate. Entries are deduplicated
// by (direction, predicate, display); scanning stops once limit entries exist.
class NeighborExplorer {
public:
    explicit NeighborExplorer(std::shared_ptr<const GraphStore> store)
        : store_(std::move(store)) {}

    std::vector<Neighbor> Explore(const std::string& iri, size_t limit) const;

    // Literal for non-IRIs; Property for IRIs used as a predicate or declared
    // rdf:Property; Resource otherwise
    DisplayType Classify(ValueId id) const;

private:
    std::shared_ptr<const GraphStore> store_;
};

} // namespace ontology
} // namespace semgraph
