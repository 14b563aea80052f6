/**
 * Taxonomy Listing and Statistics Tests
 *
 * Covers:
 * - One taxonomy row per context with source type, format and description
 * - Concept and declared property counts per context
 * - Totals equal the sum of the per-taxonomy counts
 * - Concept type histogram and top-level count
 * - JSON rendering of the stats
 */

#include "test_graphs.h"

#include <semgraph/ontology/concept_extractor.h>
#include <semgraph/ontology/taxonomy_stats.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <algorithm>

using namespace semgraph;
using namespace semgraph::ontology;
using namespace semgraph::testing;

class TaxonomyStatsTest : public ::testing::Test {
protected:
    void SetUp() override {
        SourceSet sources;
        sources.taxonomy_files.push_back(TurtleFile("animals", kAnimals));
        sources.builtin_schemas.push_back(SourceFile{
            "/schemas/core.rdf",
            "<?xml version=\"1.0\"?>\n"
            "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\"\n"
            "         xmlns:rdfs=\"http://www.w3.org/2000/01/rdf-schema#\">\n"
            "  <rdfs:Class rdf:about=\"urn:core:Asset\"/>\n"
            "  <rdf:Property rdf:about=\"urn:core:owner\"/>\n"
            "</rdf:RDF>\n"});
        sources.definitions.push_back(DefinitionRow{
            "finance", kPrefixes + "x:Revenue a skos:Concept ; skos:prefLabel \"Revenue\" .\n",
            "skos", true});

        GlossarySource glossary;
        glossary.name = "business";
        glossary.terms.push_back(GlossaryTerm{"cust", "Customer", "Buys things", std::nullopt, {}});
        glossary.terms.push_back(GlossaryTerm{"vip", "VIP", "Important customer", "cust", {}});
        sources.glossaries.push_back(glossary);

        sources.links.push_back(EntityLinkRow{"table", "sales", "urn:x:Revenue"});

        store_ = BuildStore(sources);
    }

    const Taxonomy* Find(const std::vector<Taxonomy>& taxonomies, const std::string& name) {
        auto it = std::find_if(taxonomies.begin(), taxonomies.end(),
                               [&](const Taxonomy& t) { return t.name == name; });
        return it == taxonomies.end() ? nullptr : &*it;
    }

    std::shared_ptr<const GraphStore> store_;
};

TEST_F(TaxonomyStatsTest, OneRowPerContext) {
    ConceptExtractor extractor(store_);
    auto taxonomies = GetTaxonomies(extractor);
    ASSERT_EQ(taxonomies.size(), 5u);

    const Taxonomy* animals = Find(taxonomies, "animals");
    ASSERT_NE(animals, nullptr);
    EXPECT_EQ(animals->source_type, "file");
    EXPECT_EQ(animals->format, "ttl");
    EXPECT_EQ(animals->concepts_count, 5u);
    EXPECT_EQ(animals->properties_count, 2u);
    EXPECT_EQ(animals->description, "Taxonomy loaded from file 'animals'.");

    const Taxonomy* core = Find(taxonomies, "core");
    ASSERT_NE(core, nullptr);
    EXPECT_EQ(core->source_type, "schema");
    EXPECT_EQ(core->format, "rdf");
    EXPECT_EQ(core->concepts_count, 1u);
    EXPECT_EQ(core->properties_count, 1u);

    const Taxonomy* finance = Find(taxonomies, "finance");
    ASSERT_NE(finance, nullptr);
    EXPECT_EQ(finance->source_type, "database");
    EXPECT_EQ(finance->format, "ttl");
    EXPECT_EQ(finance->concepts_count, 1u);

    const Taxonomy* business = Find(taxonomies, "business");
    ASSERT_NE(business, nullptr);
    EXPECT_EQ(business->source_type, "external");
    EXPECT_FALSE(business->format.has_value());
    EXPECT_EQ(business->concepts_count, 2u);

    const Taxonomy* links = Find(taxonomies, "semantic-links");
    ASSERT_NE(links, nullptr);
    EXPECT_EQ(links->source_type, "external");
    EXPECT_FALSE(links->format.has_value());
}

TEST_F(TaxonomyStatsTest, TotalsMatchTaxonomyRows) {
    ConceptExtractor extractor(store_);
    auto taxonomies = GetTaxonomies(extractor);
    auto stats = GetTaxonomyStats(extractor);

    size_t concepts = 0;
    size_t properties = 0;
    for (const auto& t : taxonomies) {
        concepts += t.concepts_count;
        properties += t.properties_count;
    }
    EXPECT_EQ(stats.total_concepts, concepts);
    EXPECT_EQ(stats.total_properties, properties);
    EXPECT_EQ(stats.taxonomies.size(), taxonomies.size());

    size_t by_type = 0;
    for (const auto& [type, count] : stats.concepts_by_type) {
        by_type += count;
    }
    EXPECT_EQ(by_type, stats.total_concepts);
    EXPECT_EQ(stats.concepts_by_type.at("class"), 6u);
    EXPECT_EQ(stats.concepts_by_type.at("concept"), 3u);
    EXPECT_GE(stats.top_level_concepts, 3u);
}

TEST_F(TaxonomyStatsTest, EmptyGraph) {
    ConceptExtractor extractor(GraphStore::MakeEmpty());
    auto stats = GetTaxonomyStats(extractor);
    EXPECT_TRUE(stats.taxonomies.empty());
    EXPECT_EQ(stats.total_concepts, 0u);
    EXPECT_EQ(stats.total_properties, 0u);
    EXPECT_TRUE(stats.concepts_by_type.empty());
    EXPECT_EQ(stats.top_level_concepts, 0u);
}

TEST_F(TaxonomyStatsTest, RendersAsJson) {
    ConceptExtractor extractor(store_);
    nlohmann::json j = GetTaxonomyStats(extractor);

    ASSERT_TRUE(j.contains("taxonomies"));
    EXPECT_EQ(j["taxonomies"].size(), 5u);
    EXPECT_EQ(j["total_concepts"].get<size_t>(), GetTaxonomyStats(extractor).total_concepts);
    EXPECT_TRUE(j["concepts_by_type"].is_object());
}

TEST(SourceTypeLabelTest, EveryKind) {
    EXPECT_EQ(SourceTypeLabel(SourceKind::TaxonomyFile), "file");
    EXPECT_EQ(SourceTypeLabel(SourceKind::UploadedModel), "database");
    EXPECT_EQ(SourceTypeLabel(SourceKind::BuiltinSchema), "schema");
    EXPECT_EQ(SourceTypeLabel(SourceKind::Glossary), "external");
    EXPECT_EQ(SourceTypeLabel(SourceKind::EntityLink), "external");
}
