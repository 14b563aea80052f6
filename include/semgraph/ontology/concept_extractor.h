#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <semgraph/ontology/concept.h>
#include <semgraph/storage/graph_store.h>

namespace semgraph {
namespace ontology {

// Label and comment on the same resource count as conceptual status
inline bool IsDocumentedResource(bool has_label, bool has_comment) {
    return has_label && has_comment;
}

// ConceptExtractor: derives the Concept view of one graph generation.
//
// A term qualifies, within its context, if it is
//   - declared rdfs:Class, owl:Class, skos:Concept or skos:ConceptScheme,
//   - the subject or target of rdfs:subClassOf,
//   - the rdf:type of some other node, or
//   - documented with both a label and a comment or definition.
// Terms in the RDF, RDFS, SKOS and OWL namespaces never qualify.
//
// Parent edges are rdfs:subClassOf, skos:broader and rdf:type (objects outside the
// reserved namespaces). Child edges are filled in a second pass over the extracted
// set, once every parent list is known.
class ConceptExtractor {
public:
    explicit ConceptExtractor(std::shared_ptr<const GraphStore> store);

    // First pass over one context: concepts with parents, no children
    std::vector<Concept> ExtractContext(const Context& context) const;

    // One Concept per (context, term). A taxonomy selects the context whose display
    // name or key equals it; std::nullopt selects every context.
    std::vector<Concept> GetConceptsByTaxonomy(const std::optional<std::string>& taxonomy) const;

    // One Concept per IRI across all contexts: label and comment from the first
    // context that has them, parents and children unioned, strongest type
    std::vector<Concept> GetMergedConcepts() const;

    // Merged view of one IRI; std::nullopt if it is not a concept
    std::optional<Concept> GetConceptDetails(const std::string& iri) const;

    // Concepts grouped by source context ("Unassigned" when missing), groups and
    // members ordered by name
    std::map<std::string, std::vector<Concept>> GetGroupedConcepts(
        const std::optional<std::string>& taxonomy) const;

    // Concepts without parents, ordered by label
    std::vector<Concept> GetTopLevelConcepts(const std::optional<std::string>& taxonomy) const;

    // Distinct IRIs declared rdf:type rdf:Property in a context
    size_t CountDeclaredProperties(const Context& context) const;

    const GraphStore& store() const { return *store_; }

private:
    std::shared_ptr<const GraphStore> store_;
};

// Second pass: each concept lists the IRIs of the concepts naming it as parent
void FillChildConcepts(std::vector<Concept>& concepts);

// Context matches a taxonomy filter by display name or full key
bool MatchesTaxonomy(const Context& context, const std::optional<std::string>& taxonomy);

// Sort by label (falling back to the IRI), then IRI
void SortByLabel(std::vector<Concept>& concepts);

} // namespace ontology
} // namespace semgraph
