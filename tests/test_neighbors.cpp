/**
 * Neighbor Explorer Tests
 *
 * Covers:
 * - Outgoing, incoming and predicate usage entries
 * - Display type classification (Resource, Property, Literal)
 * - Deduplication across contexts holding the same triple
 * - Limit and unknown IRIs
 */

#include "test_graphs.h"

#include <semgraph/ontology/neighbor_explorer.h>
#include <semgraph/ontology/vocab.h>
#include <gtest/gtest.h>
#include <algorithm>

using namespace semgraph;
using namespace semgraph::ontology;
using namespace semgraph::testing;

namespace {

size_t CountDirection(const std::vector<Neighbor>& neighbors, NeighborDirection direction) {
    return std::count_if(neighbors.begin(), neighbors.end(),
                         [&](const Neighbor& n) { return n.direction == direction; });
}

bool HasEntry(const std::vector<Neighbor>& neighbors, NeighborDirection direction,
              const std::string& predicate, const std::string& display) {
    return std::any_of(neighbors.begin(), neighbors.end(), [&](const Neighbor& n) {
        return n.direction == direction && n.predicate == predicate && n.display == display;
    });
}

}  // namespace

TEST(NeighborExplorerTest, SubclassEdgeSeenFromBothEnds) {
    // the same triple in two contexts still shows up once
    const std::string body = "x:Person rdfs:subClassOf x:Agent .\n";
    NeighborExplorer explorer(BuildTurtleStore({{"one", body}, {"two", body}}));

    auto person = explorer.Explore("urn:x:Person", 200);
    ASSERT_EQ(person.size(), 1u);
    Neighbor expected;
    expected.direction = NeighborDirection::Outgoing;
    expected.predicate = std::string(vocab::kRdfsSubClassOf);
    expected.display = "urn:x:Agent";
    expected.display_type = DisplayType::Resource;
    expected.step_iri = "urn:x:Agent";
    expected.step_is_resource = true;
    EXPECT_EQ(person[0], expected);

    auto agent = explorer.Explore("urn:x:Agent", 200);
    ASSERT_EQ(agent.size(), 1u);
    EXPECT_EQ(agent[0].direction, NeighborDirection::Incoming);
    EXPECT_EQ(agent[0].display, "urn:x:Person");
}

TEST(NeighborExplorerTest, ResourceNeighbors) {
    NeighborExplorer explorer(BuildTurtleStore({{"animals", kAnimals}}));
    auto rex = explorer.Explore("urn:x:rex", 200);

    EXPECT_EQ(CountDirection(rex, NeighborDirection::Outgoing), 3u);
    EXPECT_EQ(CountDirection(rex, NeighborDirection::Incoming), 0u);
    EXPECT_TRUE(HasEntry(rex, NeighborDirection::Outgoing, "urn:x:hasOwner", "urn:x:alice"));

    auto age = std::find_if(rex.begin(), rex.end(),
                            [](const Neighbor& n) { return n.predicate == "urn:x:age"; });
    ASSERT_NE(age, rex.end());
    EXPECT_EQ(age->display, "7");
    EXPECT_EQ(age->display_type, DisplayType::Literal);
    EXPECT_FALSE(age->step_iri.has_value());
    EXPECT_FALSE(age->step_is_resource);

    auto dog = explorer.Explore("urn:x:Dog", 200);
    EXPECT_TRUE(HasEntry(dog, NeighborDirection::Incoming, std::string(vocab::kRdfType),
                         "urn:x:rex"));
    EXPECT_TRUE(HasEntry(dog, NeighborDirection::Outgoing, std::string(vocab::kRdfsSubClassOf),
                         "urn:x:Mammal"));
}

TEST(NeighborExplorerTest, PredicateUsage) {
    NeighborExplorer explorer(BuildTurtleStore({{"animals", kAnimals}}));
    auto owner = explorer.Explore("urn:x:hasOwner", 200);

    EXPECT_EQ(CountDirection(owner, NeighborDirection::Outgoing), 2u);
    EXPECT_EQ(CountDirection(owner, NeighborDirection::PredicateUsage), 4u);
    for (const std::string end : {"urn:x:rex", "urn:x:alice", "urn:x:tom", "urn:x:bob"}) {
        EXPECT_TRUE(HasEntry(owner, NeighborDirection::PredicateUsage, "urn:x:hasOwner", end))
            << end;
    }
}

TEST(NeighborExplorerTest, LimitStopsTheScan) {
    NeighborExplorer explorer(BuildTurtleStore({{"animals", kAnimals}}));
    EXPECT_EQ(explorer.Explore("urn:x:hasOwner", 3).size(), 3u);
    EXPECT_TRUE(explorer.Explore("urn:x:hasOwner", 0).empty());
    EXPECT_TRUE(explorer.Explore("urn:x:unknown", 200).empty());
}

TEST(NeighborExplorerTest, ClassifyDisplayTypes) {
    auto store = BuildTurtleStore({{"animals", kAnimals + "x:declaredOnly a rdf:Property .\n"}});
    NeighborExplorer explorer(store);

    auto id = [&](const std::string& iri) {
        auto found = store->LookupIri(iri);
        EXPECT_TRUE(found.has_value()) << iri;
        return found.value_or(ValueId::makeUndefined());
    };
    EXPECT_EQ(explorer.Classify(id("urn:x:age")), DisplayType::Property);
    EXPECT_EQ(explorer.Classify(id("urn:x:declaredOnly")), DisplayType::Property);
    EXPECT_EQ(explorer.Classify(id("urn:x:Dog")), DisplayType::Resource);

    auto seven = store->Lookup(Literal("7", "", std::string(vocab::kXsdInteger)));
    ASSERT_TRUE(seven.has_value());
    EXPECT_EQ(explorer.Classify(*seven), DisplayType::Literal);
}
