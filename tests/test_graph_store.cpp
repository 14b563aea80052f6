/**
 * GraphStore, Loader and Rebuild Tests
 *
 * Covers:
 * - Context keys and display names per source kind
 * - Builder: overwrite by key, per-context dedup, union multiset index
 * - Loaders: taxonomy files, uploaded models, glossaries, entity links,
 *   blank nodes scoped per context
 * - Rebuild: failed sources are skipped, rebuild is idempotent
 * - GraphHandle: atomic publish, failed rebuild keeps the old generation,
 *   readers keep their snapshot while new generations are published
 * - DirectorySourceProvider over a temporary directory
 */

#include "test_graphs.h"
#include <semgraph/loader/source_provider.h>
#include <semgraph/ontology/vocab.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

using namespace semgraph;
using namespace semgraph::testing;

namespace fs = std::filesystem;

TEST(ContextKeyTest, KeysAndNames) {
    EXPECT_EQ(MakeContextKey(SourceKind::TaxonomyFile, "animals"), "urn:taxonomy:animals");
    EXPECT_EQ(MakeContextKey(SourceKind::UploadedModel, "sales"), "urn:semantic-model:sales");
    EXPECT_EQ(MakeContextKey(SourceKind::BuiltinSchema, "core"), "urn:schema:core");
    EXPECT_EQ(MakeContextKey(SourceKind::Glossary, "finance"), "urn:glossary:finance");
    EXPECT_EQ(MakeContextKey(SourceKind::EntityLink, "ignored"), "urn:semantic-links");

    EXPECT_EQ(SourceContextName("urn:taxonomy:animals"), "animals");
    EXPECT_EQ(SourceContextName("urn:semantic-model:sales"), "sales");
    EXPECT_EQ(SourceContextName("urn:semantic-links"), "semantic-links");
    EXPECT_EQ(SourceContextName("urn:other:thing"), "urn:other:thing");

    EXPECT_EQ(SourceKindFromKey("urn:schema:core"), SourceKind::BuiltinSchema);
    EXPECT_FALSE(SourceKindFromKey("http://example.org/").has_value());
}

TEST(GraphStoreBuilderTest, LaterDraftReplacesEarlierOne) {
    GraphStoreBuilder builder(3);

    ContextDraft first;
    first.key = "urn:taxonomy:a";
    first.triples.push_back(Triple::Make(Iri("urn:x:old"), Iri("urn:x:p"), Iri("urn:x:o")).ValueOrDie());
    builder.AddContext(first);

    ContextDraft second;
    second.key = "urn:taxonomy:a";
    second.triples.push_back(Triple::Make(Iri("urn:x:new"), Iri("urn:x:p"), Iri("urn:x:o")).ValueOrDie());
    builder.AddContext(second);
    EXPECT_EQ(builder.PendingContexts(), 1u);

    auto store = builder.Finish();
    ASSERT_TRUE(store.ok()) << store.status().ToString();
    EXPECT_EQ((*store)->generation(), 3u);
    ASSERT_EQ((*store)->contexts().size(), 1u);
    EXPECT_TRUE((*store)->LookupIri("urn:x:new").has_value());
    EXPECT_FALSE((*store)->LookupIri("urn:x:old").has_value());
}

TEST(GraphStoreBuilderTest, ContextsDedupButUnionKeepsDuplicates) {
    auto store = BuildTurtleStore({
        {"one", "x:Foo x:p x:Bar .\nx:Foo x:p x:Bar .\n"},
        {"two", "x:Foo x:p x:Bar .\n"},
    });

    const Context* one = store->FindContext("urn:taxonomy:one");
    const Context* two = store->FindContext("urn:taxonomy:two");
    ASSERT_NE(one, nullptr);
    ASSERT_NE(two, nullptr);
    EXPECT_EQ(one->Size(), 1u);
    EXPECT_EQ(two->Size(), 1u);
    EXPECT_EQ(one->format, RdfFormat::Turtle);

    // Union graph is the multiset of all context triples
    EXPECT_EQ(store->TotalTriples(), 2u);

    auto foo = store->LookupIri("urn:x:Foo");
    auto p = store->LookupIri("urn:x:p");
    ASSERT_TRUE(foo && p);
    semgraph::TriplePattern pattern;
    pattern.subject = *foo;
    EXPECT_EQ(store->index().Lookup(pattern).size(), 2u);
    EXPECT_TRUE(store->IsPredicate(*p));
    EXPECT_FALSE(store->IsPredicate(*foo));
}

TEST(TripleIndexTest, EveryBindingShapeUsesAPrefix) {
    auto store = BuildTurtleStore({{"g", "x:a x:p x:b .\nx:a x:q x:c .\nx:d x:p x:b .\n"}});
    auto a = *store->LookupIri("urn:x:a");
    auto p = *store->LookupIri("urn:x:p");
    auto b = *store->LookupIri("urn:x:b");

    semgraph::TriplePattern sp;
    sp.subject = a;
    sp.predicate = p;
    EXPECT_EQ(store->index().Lookup(sp).size(), 1u);

    semgraph::TriplePattern po;
    po.predicate = p;
    po.object = b;
    EXPECT_EQ(store->index().Lookup(po).size(), 2u);

    semgraph::TriplePattern os;
    os.object = b;
    os.subject = a;
    EXPECT_EQ(TripleIndex::SelectIndex(os), IndexType::OSP);
    EXPECT_EQ(store->index().Lookup(os).size(), 1u);

    EXPECT_EQ(store->index().Lookup(semgraph::TriplePattern{}).size(), 3u);
}

TEST(SourceLoaderTest, GlossaryTermsBecomeSkosConcepts) {
    GlossarySource glossary;
    glossary.name = "finance";
    glossary.terms.push_back({"rev", "Revenue", "Income from sales", std::nullopt, {"Sales"}});
    glossary.terms.push_back({"net", "Net revenue", "", std::string("rev"), {}});

    auto draft = LoadGlossary(glossary);
    ASSERT_TRUE(draft.ok()) << draft.status().ToString();
    EXPECT_EQ(draft->key, "urn:glossary:finance");
    EXPECT_EQ(draft->kind, SourceKind::Glossary);
    EXPECT_FALSE(draft->format.has_value());

    Term rev = Iri(GlossaryTermIri("finance", "rev"));
    Term net = Iri(GlossaryTermIri("finance", "net"));
    EXPECT_EQ(LexicalForm(rev), "urn:glossary:finance:rev");

    auto has = [&](const Term& s, std::string_view p, const Term& o) {
        return std::find(draft->triples.begin(), draft->triples.end(),
                         Triple{s, Iri(std::string(p)), o}) != draft->triples.end();
    };
    EXPECT_TRUE(has(rev, vocab::kRdfType, Iri(std::string(vocab::kSkosConcept))));
    EXPECT_TRUE(has(rev, vocab::kSkosPrefLabel, Literal("Revenue")));
    EXPECT_TRUE(has(rev, vocab::kSkosDefinition, Literal("Income from sales")));
    EXPECT_TRUE(has(rev, vocab::kSkosAltLabel, Literal("Sales")));
    EXPECT_TRUE(has(net, vocab::kSkosBroader, rev));

    GlossarySource bad;
    bad.name = "broken";
    bad.terms.push_back({"", "Nameless", "", std::nullopt, {}});
    EXPECT_TRUE(LoadGlossary(bad).status().IsInvalid());
}

TEST(SourceLoaderTest, EntityLinksUseSeeAlso) {
    auto draft = LoadEntityLinks({
        {"table", "orders", "urn:x:Order"},
        {"column", "", "urn:x:Ignored"},
    });
    ASSERT_TRUE(draft.ok());
    EXPECT_EQ(draft->key, "urn:semantic-links");
    ASSERT_EQ(draft->triples.size(), 1u);
    EXPECT_EQ(draft->triples[0].subject, Term(Iri("urn:entity:table:orders")));
    EXPECT_EQ(draft->triples[0].predicate.value, vocab::kRdfsSeeAlso);
    EXPECT_EQ(draft->triples[0].object, Term(Iri("urn:x:Order")));
}

TEST(SourceLoaderTest, UploadedModelsUseDeclaredFormat) {
    DefinitionRow row{"sales", kPrefixes + "x:Order a owl:Class .\n", "skos", true};
    auto draft = LoadUploadedModel(row);
    ASSERT_TRUE(draft.ok()) << draft.status().ToString();
    EXPECT_EQ(draft->key, "urn:semantic-model:sales");
    EXPECT_EQ(draft->format, RdfFormat::Turtle);
    EXPECT_EQ(draft->triples.size(), 1u);

    row.enabled = false;
    EXPECT_FALSE(LoadUploadedModel(row).ok());
}

TEST(SourceLoaderTest, BlankNodesStayWithinTheirContext) {
    const std::string body = "_:n x:name \"shared\" .\n";
    std::vector<arrow::Result<ContextDraft>> drafts;
    drafts.push_back(LoadTaxonomyFile(TurtleFile("foo", body)));
    drafts.push_back(LoadBuiltinSchema(SourceFile{"/schemas/foo.ttl", kPrefixes + body}));
    drafts.push_back(LoadUploadedModel(DefinitionRow{"foo", kPrefixes + body, "ttl", true}));
    drafts.push_back(LoadTaxonomyFile(TurtleFile("my-tax", body)));
    drafts.push_back(LoadTaxonomyFile(TurtleFile("my_tax", body)));

    std::set<std::string> subjects;
    for (const auto& draft : drafts) {
        ASSERT_TRUE(draft.ok()) << draft.status().ToString();
        ASSERT_EQ(draft->triples.size(), 1u);
        ASSERT_TRUE(IsBlank(draft->triples[0].subject));
        subjects.insert(LexicalForm(draft->triples[0].subject));
    }
    EXPECT_EQ(subjects.size(), drafts.size());

    EXPECT_EQ(BlankNodePrefix(SourceKind::TaxonomyFile, "my-tax"), "burn-3Ataxonomy-3Amy-2Dtax");
    EXPECT_EQ(BlankNodePrefix(SourceKind::TaxonomyFile, "my_tax").find('_'), std::string::npos);
    EXPECT_NE(BlankNodePrefix(SourceKind::TaxonomyFile, "foo"),
              BlankNodePrefix(SourceKind::BuiltinSchema, "foo"));
}

TEST(RebuildTest, FailedSourceIsSkippedOthersRemain) {
    SourceSet sources;
    sources.taxonomy_files.push_back(TurtleFile("good", "x:Foo a owl:Class .\n"));
    sources.taxonomy_files.push_back(TurtleFile("bad", "x:Foo a .\n"));
    sources.definitions.push_back({"disabled", "not even rdf", "ttl", false});
    sources.definitions.push_back({"model", kPrefixes + "x:Bar a owl:Class .\n", "ttl", true});
    sources.links.push_back({"table", "orders", "urn:x:Foo"});

    RebuildReport report;
    auto store = BuildStore(sources, &report);

    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].rfind("urn:taxonomy:bad", 0), 0u);
    EXPECT_EQ(report.contexts_loaded, 3u);

    EXPECT_EQ(store->FindContext("urn:taxonomy:bad"), nullptr);
    EXPECT_EQ(store->FindContext("urn:semantic-model:disabled"), nullptr);
    EXPECT_NE(store->FindContext("urn:taxonomy:good"), nullptr);
    EXPECT_NE(store->FindContext("urn:semantic-model:model"), nullptr);
    EXPECT_NE(store->FindContext("urn:semantic-links"), nullptr);

    // No triple of the failed source leaks into the vocabulary
    EXPECT_EQ(store->TotalTriples(), 3u);
}

TEST(RebuildTest, NoLinksMeansNoLinkContext) {
    SourceSet sources;
    sources.taxonomy_files.push_back(TurtleFile("only", "x:Foo a owl:Class .\n"));
    auto store = BuildStore(sources);
    EXPECT_EQ(store->FindContext(kSemanticLinksKey), nullptr);
}

TEST(RebuildTest, RebuildIsIdempotent) {
    SourceSet sources;
    sources.taxonomy_files.push_back(TurtleFile("animals", kAnimals));
    sources.builtin_schemas.push_back(TurtleFile("core", "x:Thing a rdfs:Class .\n"));

    auto first = BuildStore(sources);
    auto second = BuildStore(sources);
    ASSERT_EQ(first->contexts().size(), second->contexts().size());
    for (const auto& [key, context] : first->contexts()) {
        const Context* other = second->FindContext(key);
        ASSERT_NE(other, nullptr) << key;
        EXPECT_EQ(context.Size(), other->Size()) << key;
    }
    EXPECT_EQ(first->TotalTriples(), second->TotalTriples());
}

TEST(GraphHandleTest, PublishesNewGenerations) {
    GraphHandle handle;
    EXPECT_EQ(handle.Current()->generation(), 0u);
    EXPECT_TRUE(handle.Current()->Empty());

    SourceSet sources;
    sources.taxonomy_files.push_back(TurtleFile("animals", kAnimals));
    auto published = handle.Rebuild([&](uint64_t generation) {
        return RebuildGraph(sources, generation);
    });
    ASSERT_TRUE(published.ok()) << published.status().ToString();
    EXPECT_EQ((*published)->generation(), 1u);
    EXPECT_EQ(handle.Current(), *published);
}

TEST(GraphHandleTest, FailedRebuildKeepsCurrentGeneration) {
    GraphHandle handle;
    SourceSet sources;
    sources.taxonomy_files.push_back(TurtleFile("animals", kAnimals));
    ASSERT_TRUE(handle.Rebuild([&](uint64_t g) { return RebuildGraph(sources, g); }).ok());
    auto before = handle.Current();

    auto failed = handle.Rebuild([](uint64_t) -> arrow::Result<std::shared_ptr<const GraphStore>> {
        return arrow::Status::IOError("definitions store unavailable");
    });
    EXPECT_TRUE(failed.status().IsIOError());
    EXPECT_EQ(handle.Current(), before);
}

TEST(GraphHandleTest, ReadersKeepTheirSnapshotDuringRebuilds) {
    GraphHandle handle;
    SourceSet sources;
    sources.taxonomy_files.push_back(TurtleFile("animals", kAnimals));
    ASSERT_TRUE(handle.Rebuild([&](uint64_t g) { return RebuildGraph(sources, g); }).ok());

    auto pinned = handle.Current();
    const size_t pinned_triples = pinned->TotalTriples();

    std::atomic<bool> stop{false};
    std::atomic<size_t> torn_reads{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto snapshot = handle.Current();
                // A published generation is always complete
                size_t per_context = 0;
                for (const auto& [key, context] : snapshot->contexts()) {
                    per_context += context.Size();
                }
                if (per_context != snapshot->TotalTriples()) {
                    torn_reads++;
                }
            }
        });
    }

    for (int round = 0; round < 20; ++round) {
        SourceSet next = sources;
        next.taxonomy_files.push_back(
            TurtleFile("extra" + std::to_string(round), "x:R" + std::to_string(round) +
                                                            " a owl:Class .\n"));
        auto published = handle.Rebuild([&](uint64_t g) { return RebuildGraph(next, g); });
        ASSERT_TRUE(published.ok());
    }
    stop = true;
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(torn_reads.load(), 0u);
    EXPECT_EQ(handle.Current()->generation(), 21u);
    EXPECT_EQ(pinned->generation(), 1u);
    EXPECT_EQ(pinned->TotalTriples(), pinned_triples);
}

class DirectorySourceProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("semgraph_sources_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "taxonomies");
        fs::create_directories(root_ / "schemas");
    }

    void TearDown() override { fs::remove_all(root_); }

    void WriteFile(const fs::path& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    fs::path root_;
};

TEST_F(DirectorySourceProviderTest, ReadsRdfFilesInNameOrder) {
    WriteFile(root_ / "taxonomies" / "zoo.ttl", kPrefixes + "x:Zebra a owl:Class .\n");
    WriteFile(root_ / "taxonomies" / "animals.ttl", kPrefixes + kAnimals);
    WriteFile(root_ / "taxonomies" / "notes.txt", "not rdf");
    WriteFile(root_ / "schemas" / "core.rdf",
              "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\"/>");

    DirectorySourceProvider provider((root_ / "taxonomies").string(), (root_ / "schemas").string());
    provider.SetLinks({{"table", "orders", "urn:x:Animal"}});
    auto sources = provider.Collect();
    ASSERT_TRUE(sources.ok()) << sources.status().ToString();

    ASSERT_EQ(sources->taxonomy_files.size(), 2u);
    EXPECT_EQ(fs::path(sources->taxonomy_files[0].path).filename().string(), "animals.ttl");
    EXPECT_EQ(fs::path(sources->taxonomy_files[1].path).filename().string(), "zoo.ttl");
    ASSERT_EQ(sources->builtin_schemas.size(), 1u);
    EXPECT_EQ(sources->links.size(), 1u);

    auto store = BuildStore(*sources);
    EXPECT_NE(store->FindContext("urn:taxonomy:animals"), nullptr);
    EXPECT_NE(store->FindContext("urn:taxonomy:zoo"), nullptr);
    EXPECT_NE(store->FindContext("urn:schema:core"), nullptr);
}

TEST_F(DirectorySourceProviderTest, MissingDirectoryContributesNothing) {
    DirectorySourceProvider provider((root_ / "absent").string(), "");
    auto sources = provider.Collect();
    ASSERT_TRUE(sources.ok());
    EXPECT_TRUE(sources->taxonomy_files.empty());
    EXPECT_TRUE(sources->builtin_schemas.empty());
}
