/**
 * Shared fixtures for semgraph tests: small graphs built from Turtle snippets.
 */

#pragma once

#include <semgraph/loader/source_loader.h>
#include <semgraph/storage/graph_store.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace semgraph {
namespace testing {

inline const std::string kPrefixes =
    "@prefix rdf: <http://www.w3.org/1999/02/22-rdf-syntax-ns#> .\n"
    "@prefix rdfs: <http://www.w3.org/2000/01/rdf-schema#> .\n"
    "@prefix owl: <http://www.w3.org/2002/07/owl#> .\n"
    "@prefix skos: <http://www.w3.org/2004/02/skos/core#> .\n"
    "@prefix xsd: <http://www.w3.org/2001/XMLSchema#> .\n"
    "@prefix x: <urn:x:> .\n";

// Taxonomy file named <stem>.ttl with the common prefixes prepended
inline SourceFile TurtleFile(const std::string& stem, const std::string& body) {
    return SourceFile{"/taxonomies/" + stem + ".ttl", kPrefixes + body};
}

inline std::shared_ptr<const GraphStore> BuildStore(const SourceSet& sources,
                                                    RebuildReport* report = nullptr) {
    auto store = RebuildGraph(sources, 1, report);
    EXPECT_TRUE(store.ok()) << store.status().ToString();
    if (!store.ok()) {
        return GraphStore::MakeEmpty();
    }
    return *store;
}

// One taxonomy context per (stem, body) pair
inline std::shared_ptr<const GraphStore> BuildTurtleStore(
    const std::vector<std::pair<std::string, std::string>>& files) {
    SourceSet sources;
    for (const auto& [stem, body] : files) {
        sources.taxonomy_files.push_back(TurtleFile(stem, body));
    }
    return BuildStore(sources);
}

// Animal taxonomy used across the query and ontology tests
inline const std::string kAnimals =
    "x:Animal a owl:Class ; rdfs:label \"Animal\" ; rdfs:comment \"A living organism\" .\n"
    "x:Mammal a owl:Class ; rdfs:subClassOf x:Animal ; rdfs:label \"Mammal\" .\n"
    "x:Bird a owl:Class ; rdfs:subClassOf x:Animal ; rdfs:label \"Bird\" .\n"
    "x:Dog a owl:Class ; rdfs:subClassOf x:Mammal ; rdfs:label \"Dog\" ;\n"
    "      rdfs:comment \"Domesticated canine\" .\n"
    "x:Cat a owl:Class ; rdfs:subClassOf x:Mammal ; rdfs:label \"Cat\" .\n"
    "x:hasOwner a rdf:Property ; rdfs:label \"has owner\" .\n"
    "x:age a rdf:Property .\n"
    "x:rex a x:Dog ; x:hasOwner x:alice ; x:age \"7\"^^xsd:integer .\n"
    "x:tom a x:Cat ; x:hasOwner x:bob ; x:age \"3\"^^xsd:integer .\n"
    "x:tweety a x:Bird ; x:age \"2\"^^xsd:integer .\n";

}  // namespace testing
}  // namespace semgraph
