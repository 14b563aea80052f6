/**
 * KnowledgeGraph Facade Tests
 *
 * Covers:
 * - Empty graph before the first rebuild
 * - Rebuild from a provider, skipped sources, idempotent rebuilds
 * - Failed provider keeps the previous generation
 * - Query defaults from EngineConfig and error kinds
 * - Browsing operations routed through the published snapshot
 * - Concurrent queries while rebuilds publish new generations
 */

#include "test_graphs.h"

#include <semgraph/engine/knowledge_graph.h>
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace semgraph;
using namespace semgraph::testing;

namespace {

const std::string kSubclassQuery =
    "PREFIX x: <urn:x:>\nSELECT ?c WHERE { ?c rdfs:subClassOf ?parent }";

// Fails every Collect() once broken is set
class FlakyProvider : public SourceProvider {
public:
    explicit FlakyProvider(SourceSet sources) : sources_(std::move(sources)) {}

    arrow::Result<SourceSet> Collect() override {
        if (broken) {
            return arrow::Status::IOError("definitions store unavailable");
        }
        return sources_;
    }

    std::atomic<bool> broken{false};

private:
    SourceSet sources_;
};

SourceSet AnimalSources() {
    SourceSet sources;
    sources.taxonomy_files.push_back(TurtleFile("animals", kAnimals));
    return sources;
}

}  // namespace

class KnowledgeGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto provider = std::make_unique<StaticSourceProvider>(AnimalSources());
        provider_ = provider.get();
        graph_ = std::make_unique<KnowledgeGraph>(EngineConfig{}, std::move(provider));
    }

    void RebuildOk() {
        auto report = graph_->Rebuild();
        ASSERT_TRUE(report.ok()) << report.status().ToString();
    }

    StaticSourceProvider* provider_ = nullptr;
    std::unique_ptr<KnowledgeGraph> graph_;
};

TEST_F(KnowledgeGraphTest, EmptyBeforeFirstRebuild) {
    EXPECT_EQ(graph_->Snapshot()->generation(), 0u);

    auto result = graph_->Query(kSubclassQuery);
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_TRUE(result->rows.empty());
    EXPECT_TRUE(graph_->GetTaxonomies().empty());
    EXPECT_TRUE(graph_->GetConceptsByTaxonomy().empty());
}

TEST_F(KnowledgeGraphTest, RebuildPublishesConcepts) {
    RebuildOk();
    EXPECT_EQ(graph_->Snapshot()->generation(), 1u);

    auto result = graph_->Query(kSubclassQuery);
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_EQ(result->rows.size(), 4u);

    auto taxonomies = graph_->GetTaxonomies();
    ASSERT_EQ(taxonomies.size(), 1u);
    EXPECT_EQ(taxonomies[0].name, "animals");
    EXPECT_EQ(graph_->GetConceptsByTaxonomy(std::string("animals")).size(), 5u);
    EXPECT_EQ(graph_->GetGroupedConcepts().at("animals").size(), 5u);
    ASSERT_EQ(graph_->GetTopLevelConcepts().size(), 1u);
    EXPECT_EQ(graph_->GetTopLevelConcepts()[0].iri, "urn:x:Animal");
}

TEST_F(KnowledgeGraphTest, SkippedSourceLeavesOthersQueryable) {
    provider_->mutable_sources().taxonomy_files.push_back(TurtleFile("broken", "x:s x:p .\n"));
    provider_->mutable_sources().taxonomy_files.push_back(
        TurtleFile("plants", "x:Tree a owl:Class ; rdfs:label \"Tree\" .\n"));

    auto report = graph_->Rebuild();
    ASSERT_TRUE(report.ok()) << report.status().ToString();
    ASSERT_EQ(report->skipped.size(), 1u);
    EXPECT_NE(report->skipped[0].find("urn:taxonomy:broken"), std::string::npos);
    EXPECT_EQ(report->contexts_loaded, 2u);

    EXPECT_TRUE(graph_->GetConceptDetails("urn:x:Dog").has_value());
    EXPECT_TRUE(graph_->GetConceptDetails("urn:x:Tree").has_value());
    EXPECT_EQ(graph_->GetTaxonomies().size(), 2u);
}

TEST_F(KnowledgeGraphTest, RebuildIsIdempotent) {
    RebuildOk();
    auto first = graph_->GetConceptsByTaxonomy();
    auto first_stats = graph_->GetTaxonomyStats();
    RebuildOk();

    EXPECT_EQ(graph_->Snapshot()->generation(), 2u);
    EXPECT_EQ(graph_->GetConceptsByTaxonomy(), first);
    EXPECT_EQ(graph_->GetTaxonomyStats().total_concepts, first_stats.total_concepts);
}

TEST(KnowledgeGraphProviderTest, FailedCollectKeepsPreviousGeneration) {
    auto provider = std::make_unique<FlakyProvider>(AnimalSources());
    FlakyProvider* flaky = provider.get();
    KnowledgeGraph graph(EngineConfig{}, std::move(provider));

    ASSERT_TRUE(graph.Rebuild().ok());
    flaky->broken = true;
    auto failed = graph.Rebuild();
    ASSERT_FALSE(failed.ok());
    EXPECT_TRUE(failed.status().IsIOError());

    EXPECT_EQ(graph.Snapshot()->generation(), 1u);
    EXPECT_TRUE(graph.GetConceptDetails("urn:x:Dog").has_value());
}

TEST(KnowledgeGraphProviderTest, NullProviderMeansNoSources) {
    KnowledgeGraph graph(EngineConfig{}, nullptr);
    auto report = graph.Rebuild();
    ASSERT_TRUE(report.ok()) << report.status().ToString();
    EXPECT_EQ(report->contexts_loaded, 0u);
    EXPECT_EQ(graph.Snapshot()->TotalTriples(), 0u);
}

TEST_F(KnowledgeGraphTest, QueryUsesConfigDefaults) {
    EngineConfig config;
    config.default_max_results = 3;
    KnowledgeGraph graph(config, std::make_unique<StaticSourceProvider>(AnimalSources()));
    ASSERT_TRUE(graph.Rebuild().ok());

    auto capped = graph.Query("SELECT ?s WHERE { ?s ?p ?o }");
    ASSERT_TRUE(capped.ok()) << capped.status().ToString();
    EXPECT_EQ(capped->rows.size(), 3u);

    auto wider = graph.Query("SELECT ?s WHERE { ?s ?p ?o }", 10);
    ASSERT_TRUE(wider.ok());
    EXPECT_EQ(wider->rows.size(), 10u);

    auto rejected = graph.Query("CLEAR DEFAULT");
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(ClassifyQueryError(rejected.status()), QueryErrorKind::Validation);

    auto no_rows = graph.Query("ASK { ?s ?p ?o }", 0);
    EXPECT_TRUE(no_rows.status().IsInvalid());

    auto plan = graph.Explain(kSubclassQuery);
    ASSERT_TRUE(plan.ok()) << plan.status().ToString();
}

TEST_F(KnowledgeGraphTest, BrowsingOperations) {
    RebuildOk();

    auto matches = graph_->PrefixSearch("owner");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].value, "urn:x:hasOwner");

    auto found = graph_->SearchConcepts("dog");
    ASSERT_FALSE(found.empty());
    EXPECT_EQ(found[0].item.iri, "urn:x:Dog");
    EXPECT_TRUE(graph_->SearchConcepts("dog", std::string("missing")).empty());
    EXPECT_EQ(graph_->SearchConcepts("urn:x", std::nullopt, 2).size(), 2u);

    auto hierarchy = graph_->GetConceptHierarchy("urn:x:Cat");
    ASSERT_TRUE(hierarchy.has_value());
    EXPECT_EQ(hierarchy->ancestors.size(), 2u);
    EXPECT_EQ(hierarchy->siblings.size(), 1u);
    EXPECT_FALSE(graph_->GetConceptHierarchy("urn:x:rex").has_value());

    auto neighbors = graph_->Neighbors("urn:x:rex");
    EXPECT_EQ(neighbors.size(), 3u);
    EXPECT_EQ(graph_->Neighbors("urn:x:rex", 1).size(), 1u);

    auto stats = graph_->GetTaxonomyStats();
    EXPECT_EQ(stats.total_concepts, 5u);
    EXPECT_EQ(stats.total_properties, 2u);
    EXPECT_EQ(stats.top_level_concepts, 1u);
}

TEST_F(KnowledgeGraphTest, ConcurrentQueriesDuringRebuild) {
    RebuildOk();

    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::atomic<int> queries{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            while (!done) {
                auto result = graph_->Query(kSubclassQuery);
                // every generation holds either the base taxonomy or base plus one class
                if (!result.ok() || (result->rows.size() != 4 && result->rows.size() != 5)) {
                    failures++;
                }
                queries++;
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        auto& files = provider_->mutable_sources().taxonomy_files;
        if (i % 2 == 0) {
            files.push_back(TurtleFile("extra", "x:Fish rdfs:subClassOf x:Animal .\n"));
        } else {
            files.pop_back();
        }
        auto report = graph_->Rebuild();
        EXPECT_TRUE(report.ok()) << report.status().ToString();
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_GT(queries.load(), 0);
    EXPECT_EQ(graph_->Snapshot()->generation(), 21u);
}
