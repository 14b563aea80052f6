#pragma once

#include <optional>
#include <string>
#include <vector>
#include <semgraph/ontology/concept.h>
#include <semgraph/ontology/concept_extractor.h>
#include <semgraph/storage/context.h>

namespace semgraph {
namespace ontology {

// Source type label of a context: file, database, schema or external
std::string_view SourceTypeLabel(SourceKind kind);

// Fixed one-sentence description naming the source of a context
std::string DescribeContext(const Context& context);

// One Taxonomy row per context, in key order. Counts use the concept eligibility
// rule and the distinct IRIs declared rdf:Property.
std::vector<Taxonomy> GetTaxonomies(const ConceptExtractor& extractor);

// Totals over all taxonomies, plus a concept type histogram and the number of
// concepts without parents over the full per-context concept set
TaxonomyStats GetTaxonomyStats(const ConceptExtractor& extractor);

} // namespace ontology
} // namespace semgraph
