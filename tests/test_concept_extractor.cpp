/**
 * Concept Extractor Tests
 *
 * Covers:
 * - Eligibility: declared classes, SKOS concepts, subclass edges, rdf:type targets,
 *   label + comment documentation
 * - Reserved namespaces never producing concepts
 * - Parent edges and the second-pass child links
 * - Per-context extraction (one concept per source) vs the merged view
 * - Grouping, top-level selection and declared property counts
 */

#include "test_graphs.h"

#include <semgraph/ontology/concept_extractor.h>
#include <gtest/gtest.h>
#include <algorithm>

using namespace semgraph;
using namespace semgraph::ontology;
using namespace semgraph::testing;

namespace {

const Concept* FindConcept(const std::vector<Concept>& concepts, const std::string& iri,
                           const std::string& context = "") {
    auto it = std::find_if(concepts.begin(), concepts.end(), [&](const Concept& c) {
        return c.iri == iri && (context.empty() || c.source_context == context);
    });
    return it == concepts.end() ? nullptr : &*it;
}

std::vector<std::string> Iris(const std::vector<Concept>& concepts) {
    std::vector<std::string> iris;
    for (const auto& c : concepts) {
        iris.push_back(c.iri);
    }
    return iris;
}

}  // namespace

TEST(ConceptExtractorTest, AnimalTaxonomy) {
    ConceptExtractor extractor(BuildTurtleStore({{"animals", kAnimals}}));
    auto concepts = extractor.GetConceptsByTaxonomy(std::nullopt);

    // instances, properties and their values do not qualify
    ASSERT_EQ(concepts.size(), 5u);
    EXPECT_EQ(FindConcept(concepts, "urn:x:rex"), nullptr);
    EXPECT_EQ(FindConcept(concepts, "urn:x:hasOwner"), nullptr);
    EXPECT_EQ(FindConcept(concepts, "urn:x:alice"), nullptr);

    const Concept* dog = FindConcept(concepts, "urn:x:Dog");
    ASSERT_NE(dog, nullptr);
    EXPECT_EQ(dog->label, "Dog");
    EXPECT_EQ(dog->comment, "Domesticated canine");
    EXPECT_EQ(dog->concept_type, ConceptType::Class);
    EXPECT_EQ(dog->source_context, "animals");
    EXPECT_EQ(dog->parent_concepts, (std::vector<std::string>{"urn:x:Mammal"}));
    EXPECT_TRUE(dog->child_concepts.empty());

    const Concept* mammal = FindConcept(concepts, "urn:x:Mammal");
    ASSERT_NE(mammal, nullptr);
    EXPECT_EQ(mammal->child_concepts, (std::vector<std::string>{"urn:x:Dog", "urn:x:Cat"}));

    const Concept* animal = FindConcept(concepts, "urn:x:Animal");
    ASSERT_NE(animal, nullptr);
    EXPECT_TRUE(animal->parent_concepts.empty());
    EXPECT_EQ(animal->child_concepts, (std::vector<std::string>{"urn:x:Mammal", "urn:x:Bird"}));
}

TEST(ConceptExtractorTest, SameClassInTwoSourcesYieldsOneConceptEach) {
    const std::string body =
        "x:Foo a owl:Class ; rdfs:subClassOf x:Bar .\n"
        "x:Bar a owl:Class .\n";
    ConceptExtractor extractor(BuildTurtleStore({{"first", body}, {"second", body}}));
    auto concepts = extractor.GetConceptsByTaxonomy(std::nullopt);

    ASSERT_EQ(concepts.size(), 4u);
    for (const std::string context : {"first", "second"}) {
        const Concept* foo = FindConcept(concepts, "urn:x:Foo", context);
        ASSERT_NE(foo, nullptr) << context;
        EXPECT_EQ(foo->parent_concepts, (std::vector<std::string>{"urn:x:Bar"}));

        const Concept* bar = FindConcept(concepts, "urn:x:Bar", context);
        ASSERT_NE(bar, nullptr) << context;
        EXPECT_NE(std::find(bar->child_concepts.begin(), bar->child_concepts.end(), "urn:x:Foo"),
                  bar->child_concepts.end());
    }

    auto only_first = extractor.GetConceptsByTaxonomy(std::string("first"));
    EXPECT_EQ(only_first.size(), 2u);
    auto by_key = extractor.GetConceptsByTaxonomy(std::string("urn:taxonomy:second"));
    EXPECT_EQ(by_key.size(), 2u);
    EXPECT_TRUE(extractor.GetConceptsByTaxonomy(std::string("missing")).empty());
}

TEST(ConceptExtractorTest, EligibilityRules) {
    ConceptExtractor extractor(BuildTurtleStore({{"rules",
        "x:Scheme a skos:ConceptScheme .\n"
        "x:term a skos:Concept ; skos:prefLabel \"Term\" ; skos:broader x:parentTerm .\n"
        "x:parentTerm a skos:Concept .\n"
        "x:documented rdfs:label \"Documented\" ; rdfs:comment \"Has both\" .\n"
        "x:defined skos:prefLabel \"Defined\" ; skos:definition \"A definition\" .\n"
        "x:labelOnly rdfs:label \"Only a label\" .\n"
        "x:child rdfs:subClassOf x:implicitParent .\n"
        "x:thing a x:Kind .\n"}}));
    auto concepts = extractor.GetConceptsByTaxonomy(std::nullopt);

    EXPECT_NE(FindConcept(concepts, "urn:x:Scheme"), nullptr);
    EXPECT_NE(FindConcept(concepts, "urn:x:documented"), nullptr);
    EXPECT_NE(FindConcept(concepts, "urn:x:defined"), nullptr);
    EXPECT_NE(FindConcept(concepts, "urn:x:child"), nullptr);
    EXPECT_NE(FindConcept(concepts, "urn:x:implicitParent"), nullptr);
    EXPECT_NE(FindConcept(concepts, "urn:x:Kind"), nullptr);
    EXPECT_EQ(FindConcept(concepts, "urn:x:labelOnly"), nullptr);
    EXPECT_EQ(FindConcept(concepts, "urn:x:thing"), nullptr);

    const Concept* term = FindConcept(concepts, "urn:x:term");
    ASSERT_NE(term, nullptr);
    EXPECT_EQ(term->concept_type, ConceptType::Concept);
    EXPECT_EQ(term->label, "Term");
    EXPECT_EQ(term->parent_concepts, (std::vector<std::string>{"urn:x:parentTerm"}));

    const Concept* defined = FindConcept(concepts, "urn:x:defined");
    ASSERT_NE(defined, nullptr);
    EXPECT_EQ(defined->concept_type, ConceptType::Individual);
    EXPECT_EQ(defined->comment, "A definition");
}

TEST(ConceptExtractorTest, ReservedNamespacesAreExcluded) {
    ConceptExtractor extractor(BuildTurtleStore({{"schema",
        "rdfs:Resource a rdfs:Class ; rdfs:label \"Resource\" ; rdfs:comment \"Everything\" .\n"
        "owl:Thing a owl:Class .\n"
        "skos:Concept rdfs:subClassOf owl:Thing .\n"
        "x:Widget a owl:Class ; rdfs:subClassOf owl:Thing .\n"}}));
    auto concepts = extractor.GetConceptsByTaxonomy(std::nullopt);

    EXPECT_EQ(Iris(concepts), (std::vector<std::string>{"urn:x:Widget"}));
    // the parent edge to a reserved term is kept even though owl:Thing is no concept
    EXPECT_EQ(concepts[0].parent_concepts,
              (std::vector<std::string>{"http://www.w3.org/2002/07/owl#Thing"}));
}

TEST(ConceptExtractorTest, FirstPassLeavesChildLinksEmpty) {
    ConceptExtractor extractor(BuildTurtleStore({{"animals", kAnimals}}));
    const Context* context = extractor.store().FindContext("urn:taxonomy:animals");
    ASSERT_NE(context, nullptr);

    // rex is not a concept, but the Dog class it instantiates is
    auto concepts = extractor.ExtractContext(*context);
    EXPECT_NE(FindConcept(concepts, "urn:x:Dog"), nullptr);
    EXPECT_TRUE(std::none_of(concepts.begin(), concepts.end(), [](const Concept& c) {
        return !c.child_concepts.empty();
    }));
}

TEST(ConceptExtractorTest, MergedViewUnionsContexts) {
    ConceptExtractor extractor(BuildTurtleStore({
        {"a", "x:Foo rdfs:subClassOf x:Bar .\n"},
        {"b", "x:Foo a owl:Class ; rdfs:label \"Foo\" ; rdfs:subClassOf x:Baz .\n"},
    }));

    auto merged = extractor.GetMergedConcepts();
    const Concept* foo = FindConcept(merged, "urn:x:Foo");
    ASSERT_NE(foo, nullptr);
    EXPECT_EQ(std::count_if(merged.begin(), merged.end(),
                            [](const Concept& c) { return c.iri == "urn:x:Foo"; }),
              1);
    EXPECT_EQ(foo->label, "Foo");
    EXPECT_EQ(foo->concept_type, ConceptType::Class);
    EXPECT_EQ(foo->source_context, "a");
    EXPECT_EQ(foo->parent_concepts, (std::vector<std::string>{"urn:x:Bar", "urn:x:Baz"}));

    auto details = extractor.GetConceptDetails("urn:x:Baz");
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->child_concepts, (std::vector<std::string>{"urn:x:Foo"}));
    EXPECT_FALSE(extractor.GetConceptDetails("urn:x:Nothing").has_value());
}

TEST(ConceptExtractorTest, GroupedAndTopLevel) {
    ConceptExtractor extractor(BuildTurtleStore({
        {"animals", kAnimals},
        {"plants", "x:Tree a owl:Class ; rdfs:label \"Tree\" .\n"
                   "x:Oak rdfs:subClassOf x:Tree ; rdfs:label \"Oak\" .\n"},
    }));

    auto grouped = extractor.GetGroupedConcepts(std::nullopt);
    ASSERT_EQ(grouped.size(), 2u);
    EXPECT_EQ(Iris(grouped.at("plants")), (std::vector<std::string>{"urn:x:Oak", "urn:x:Tree"}));
    EXPECT_EQ(Iris(grouped.at("animals")),
              (std::vector<std::string>{"urn:x:Animal", "urn:x:Bird", "urn:x:Cat", "urn:x:Dog",
                                        "urn:x:Mammal"}));

    auto top = extractor.GetTopLevelConcepts(std::nullopt);
    EXPECT_EQ(Iris(top), (std::vector<std::string>{"urn:x:Animal", "urn:x:Tree"}));

    auto top_plants = extractor.GetTopLevelConcepts(std::string("plants"));
    EXPECT_EQ(Iris(top_plants), (std::vector<std::string>{"urn:x:Tree"}));
}

TEST(ConceptExtractorTest, CountsDeclaredProperties) {
    ConceptExtractor extractor(BuildTurtleStore({{"animals", kAnimals}}));
    const Context* context = extractor.store().FindContext("urn:taxonomy:animals");
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(extractor.CountDeclaredProperties(*context), 2u);
}

TEST(ConceptTest, DisplayNameFallsBackToLocalName) {
    Concept labelled;
    labelled.iri = "urn:x:Dog";
    labelled.label = "Dog";
    EXPECT_EQ(labelled.DisplayName(), "Dog");

    Concept hashed;
    hashed.iri = "http://example.org/onto#Cat";
    EXPECT_EQ(hashed.DisplayName(), "Cat");

    Concept slashed;
    slashed.iri = "http://example.org/onto/Bird";
    EXPECT_EQ(slashed.DisplayName(), "Bird");
}
