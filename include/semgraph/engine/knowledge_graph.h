#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>
#include <semgraph/loader/source_loader.h>
#include <semgraph/loader/source_provider.h>
#include <semgraph/ontology/concept.h>
#include <semgraph/sparql/query_engine.h>
#include <semgraph/storage/graph_store.h>
#include <semgraph/util/config.h>

namespace semgraph {

// KnowledgeGraph: the read API over the published graph generation.
//
// Rebuild() collects sources from the provider, builds the next generation off to
// the side and publishes it with one pointer swap. Every read operation takes a
// snapshot of the current generation first and works on it to completion, so reads
// never block on a rebuild and never observe a partially built graph.
//
// Example:
//   KnowledgeGraph graph(config, std::make_unique<DirectorySourceProvider>(dir, schemas));
//   ARROW_RETURN_NOT_OK(graph.Rebuild().status());
//   ARROW_ASSIGN_OR_RAISE(auto result, graph.Query("SELECT ?s WHERE { ?s a ?t }"));
class KnowledgeGraph {
public:
    KnowledgeGraph(EngineConfig config, std::unique_ptr<SourceProvider> provider);

    // Collect sources and publish a new generation. Sources that fail to load are
    // skipped and listed in the report; only provider and internal failures fail
    // the rebuild, leaving the previous generation published.
    arrow::Result<RebuildReport> Rebuild();

    // Run a read-only SPARQL query; std::nullopt arguments take the config defaults
    arrow::Result<QueryResult> Query(const std::string& query_text,
                                     std::optional<size_t> max_results = std::nullopt,
                                     std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    arrow::Result<std::string> Explain(const std::string& query_text) const;

    std::vector<ontology::LexicalMatch> PrefixSearch(const std::string& text,
                                                     std::optional<size_t> limit = std::nullopt) const;

    std::vector<ontology::SearchResult> SearchConcepts(
        const std::string& text, const std::optional<std::string>& taxonomy = std::nullopt,
        std::optional<size_t> limit = std::nullopt) const;

    std::vector<ontology::Taxonomy> GetTaxonomies() const;

    std::vector<ontology::Concept> GetConceptsByTaxonomy(
        const std::optional<std::string>& taxonomy = std::nullopt) const;

    std::map<std::string, std::vector<ontology::Concept>> GetGroupedConcepts(
        const std::optional<std::string>& taxonomy = std::nullopt) const;

    std::vector<ontology::Concept> GetTopLevelConcepts(
        const std::optional<std::string>& taxonomy = std::nullopt) const;

    std::optional<ontology::Concept> GetConceptDetails(const std::string& iri) const;

    std::optional<ontology::Hierarchy> GetConceptHierarchy(const std::string& iri) const;

    std::vector<ontology::Neighbor> Neighbors(const std::string& iri,
                                              std::optional<size_t> limit = std::nullopt) const;

    ontology::TaxonomyStats GetTaxonomyStats() const;

    // Snapshot of the published generation
    std::shared_ptr<const GraphStore> Snapshot() const { return handle_.Current(); }

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::unique_ptr<SourceProvider> provider_;
    GraphHandle handle_;
};

} // namespace semgraph
