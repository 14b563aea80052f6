#pragma once

#include <string>
#include <vector>
#include <semgraph/ontology/concept.h>
#include <semgraph/storage/graph_store.h>

namespace semgraph {
namespace ontology {

// Case-insensitive substring search over the subjects and predicates of the union
// graph. Contexts are scanned in key order and their triples in file order; each
// IRI is reported once, as Property if it is used as a predicate anywhere, else as
// Resource. Blank-node subjects are skipped. The scan stops at limit matches.
std::vector<LexicalMatch> PrefixSearch(const GraphStore& store, const std::string& substring,
                                       size_t limit);

} // namespace ontology
} // namespace semgraph
