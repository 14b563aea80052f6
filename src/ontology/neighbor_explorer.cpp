#include <semgraph/ontology/neighbor_explorer.h>
#include <semgraph/ontology/vocab.h>
#include <set>
#include <tuple>

namespace semgraph {
namespace ontology {

DisplayType NeighborExplorer::Classify(ValueId id) const {
    const Term* term = store_->TermOf(id);
    if (term == nullptr || !IsIri(*term)) {
        return DisplayType::Literal;
    }
    if (store_->IsPredicate(id)) {
        return DisplayType::Property;
    }
    auto rdf_type = store_->LookupIri(vocab::kRdfType);
    auto rdf_property = store_->LookupIri(vocab::kRdfProperty);
    if (rdf_type && rdf_property) {
        semgraph::TriplePattern pattern;
        pattern.subject = id;
        pattern.predicate = *rdf_type;
        pattern.object = *rdf_property;
        if (!store_->index().Lookup(pattern).empty()) {
            return DisplayType::Property;
        }
    }
    return DisplayType::Resource;
}

std::vector<Neighbor> NeighborExplorer::Explore(const std::string& iri, size_t limit) const {
    std::vector<Neighbor> neighbors;
    auto id = store_->LookupIri(iri);
    if (!id || limit == 0) {
        return neighbors;
    }

    std::set<std::tuple<NeighborDirection, std::string, std::string>> seen;
    auto add = [&](NeighborDirection direction, ValueId predicate, ValueId display) {
        const Term* predicate_term = store_->TermOf(predicate);
        const Term* display_term = store_->TermOf(display);
        if (predicate_term == nullptr || display_term == nullptr) {
            return;
        }
        Neighbor neighbor;
        neighbor.direction = direction;
        neighbor.predicate = LexicalForm(*predicate_term);
        neighbor.display = LexicalForm(*display_term);
        if (!seen.emplace(direction, neighbor.predicate, neighbor.display).second) {
            return;
        }
        neighbor.display_type = Classify(display);
        if (IsIri(*display_term)) {
            neighbor.step_iri = neighbor.display;
            neighbor.step_is_resource = true;
        }
        neighbors.push_back(std::move(neighbor));
    };
    auto full = [&]() { return neighbors.size() >= limit; };

    const TripleIndex& index = store_->index();

    semgraph::TriplePattern outgoing;
    outgoing.subject = *id;
    index.Scan(outgoing, [&](const IdTriple& t) {
        add(NeighborDirection::Outgoing, t.predicate, t.object);
        return !full();
    });

    if (!full()) {
        semgraph::TriplePattern incoming;
        incoming.object = *id;
        index.Scan(incoming, [&](const IdTriple& t) {
            add(NeighborDirection::Incoming, t.predicate, t.subject);
            return !full();
        });
    }

    if (!full()) {
        semgraph::TriplePattern usage;
        usage.predicate = *id;
        index.Scan(usage, [&](const IdTriple& t) {
            add(NeighborDirection::PredicateUsage, t.predicate, t.subject);
            if (full()) {
                return false;
            }
            add(NeighborDirection::PredicateUsage, t.predicate, t.object);
            return !full();
        });
    }

    return neighbors;
}

} // namespace ontology
} // namespace semgraph
