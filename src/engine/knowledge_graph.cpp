#include <semgraph/engine/knowledge_graph.h>
#include <semgraph/ontology/concept_extractor.h>
#include <semgraph/ontology/concept_search.h>
#include <semgraph/ontology/hierarchy_resolver.h>
#include <semgraph/ontology/lexical_search.h>
#include <semgraph/ontology/neighbor_explorer.h>
#include <semgraph/ontology/taxonomy_stats.h>
#include <semgraph/util/logging.h>

namespace semgraph {

SEMGRAPH_LOG_TAG(KnowledgeGraph);

KnowledgeGraph::KnowledgeGraph(EngineConfig config, std::unique_ptr<SourceProvider> provider)
    : config_(std::move(config)), provider_(std::move(provider)) {
    if (!provider_) {
        provider_ = std::make_unique<StaticSourceProvider>();
    }
}

arrow::Result<RebuildReport> KnowledgeGraph::Rebuild() {
    RebuildReport report;
    auto published = handle_.Rebuild(
        [&](uint64_t generation) -> arrow::Result<std::shared_ptr<const GraphStore>> {
            ARROW_ASSIGN_OR_RAISE(auto sources, provider_->Collect());
            return RebuildGraph(sources, generation, &report);
        });
    if (!published.ok()) {
        SEMGRAPH_LOG_ERROR(KnowledgeGraph) << "Rebuild failed: " << published.status().ToString();
        return published.status();
    }
    if (!report.skipped.empty()) {
        SEMGRAPH_LOG_WARN(KnowledgeGraph) << "Generation " << (*published)->generation()
                                          << " skipped " << report.skipped.size() << " sources";
    }
    return report;
}

arrow::Result<QueryResult> KnowledgeGraph::Query(
    const std::string& query_text, std::optional<size_t> max_results,
    std::optional<std::chrono::milliseconds> timeout) const {
    QueryOptions options;
    options.max_results = max_results.value_or(config_.default_max_results);
    options.timeout = timeout.value_or(config_.default_timeout);
    options.batch_size = config_.batch_size;
    options.deadline_check_interval = config_.deadline_check_interval;

    sparql::QueryEngine engine(handle_.Current());
    return engine.Execute(query_text, options);
}

arrow::Result<std::string> KnowledgeGraph::Explain(const std::string& query_text) const {
    QueryOptions options;
    options.max_results = config_.default_max_results;
    options.timeout = config_.default_timeout;
    options.batch_size = config_.batch_size;
    options.deadline_check_interval = config_.deadline_check_interval;

    sparql::QueryEngine engine(handle_.Current());
    return engine.Explain(query_text, options);
}

std::vector<ontology::LexicalMatch> KnowledgeGraph::PrefixSearch(
    const std::string& text, std::optional<size_t> limit) const {
    auto store = handle_.Current();
    return ontology::PrefixSearch(*store, text, limit.value_or(config_.prefix_search_limit));
}

std::vector<ontology::SearchResult> KnowledgeGraph::SearchConcepts(
    const std::string& text, const std::optional<std::string>& taxonomy,
    std::optional<size_t> limit) const {
    ontology::ConceptExtractor extractor(handle_.Current());
    auto concepts = taxonomy ? extractor.GetConceptsByTaxonomy(taxonomy)
                             : extractor.GetMergedConcepts();
    return ontology::SearchConcepts(concepts, text,
                                    limit.value_or(config_.concept_search_limit));
}

std::vector<ontology::Taxonomy> KnowledgeGraph::GetTaxonomies() const {
    ontology::ConceptExtractor extractor(handle_.Current());
    return ontology::GetTaxonomies(extractor);
}

std::vector<ontology::Concept> KnowledgeGraph::GetConceptsByTaxonomy(
    const std::optional<std::string>& taxonomy) const {
    ontology::ConceptExtractor extractor(handle_.Current());
    return extractor.GetConceptsByTaxonomy(taxonomy);
}

std::map<std::string, std::vector<ontology::Concept>> KnowledgeGraph::GetGroupedConcepts(
    const std::optional<std::string>& taxonomy) const {
    ontology::ConceptExtractor extractor(handle_.Current());
    return extractor.GetGroupedConcepts(taxonomy);
}

std::vector<ontology::Concept> KnowledgeGraph::GetTopLevelConcepts(
    const std::optional<std::string>& taxonomy) const {
    ontology::ConceptExtractor extractor(handle_.Current());
    return extractor.GetTopLevelConcepts(taxonomy);
}

std::optional<ontology::Concept> KnowledgeGraph::GetConceptDetails(const std::string& iri) const {
    ontology::ConceptExtractor extractor(handle_.Current());
    return extractor.GetConceptDetails(iri);
}

std::optional<ontology::Hierarchy> KnowledgeGraph::GetConceptHierarchy(
    const std::string& iri) const {
    ontology::ConceptExtractor extractor(handle_.Current());
    ontology::HierarchyResolver resolver(extractor.GetMergedConcepts());
    return resolver.Resolve(iri);
}

std::vector<ontology::Neighbor> KnowledgeGraph::Neighbors(const std::string& iri,
                                                          std::optional<size_t> limit) const {
    ontology::NeighborExplorer explorer(handle_.Current());
    return explorer.Explore(iri, limit.value_or(config_.neighbors_limit));
}

ontology::TaxonomyStats KnowledgeGraph::GetTaxonomyStats() const {
    ontology::ConceptExtractor extractor(handle_.Current());
    return ontology::GetTaxonomyStats(extractor);
}

} // namespace semgraph
