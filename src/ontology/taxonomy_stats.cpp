#include <semgraph/ontology/taxonomy_stats.h>

namespace semgraph {
namespace ontology {

std::string_view SourceTypeLabel(SourceKind kind) {
    switch (kind) {
        case SourceKind::TaxonomyFile: return "file";
        case SourceKind::UploadedModel: return "database";
        case SourceKind::BuiltinSchema: return "schema";
        case SourceKind::Glossary:
        case SourceKind::EntityLink:
            return "external";
    }
    return "external";
}

std::string DescribeContext(const Context& context) {
    const std::string name = context.Name();
    switch (context.kind) {
        case SourceKind::TaxonomyFile:
            return "Taxonomy loaded from file '" + name + "'.";
        case SourceKind::UploadedModel:
            return "Semantic model '" + name + "' uploaded to the definitions store.";
        case SourceKind::BuiltinSchema:
            return "Built-in schema '" + name + "'.";
        case SourceKind::Glossary:
            return "Business glossary '" + name + "'.";
        case SourceKind::EntityLink:
            return "Semantic links between catalog entities and concepts.";
    }
    return name;
}

std::vector<Taxonomy> GetTaxonomies(const ConceptExtractor& extractor) {
    std::vector<Taxonomy> taxonomies;
    for (const auto& [key, context] : extractor.store().contexts()) {
        Taxonomy taxonomy;
        taxonomy.name = context.Name();
        taxonomy.description = DescribeContext(context);
        taxonomy.source_type = std::string(SourceTypeLabel(context.kind));
        if (context.format && context.kind != SourceKind::Glossary &&
            context.kind != SourceKind::EntityLink) {
            taxonomy.format = std::string(FormatLabel(*context.format));
        }
        taxonomy.concepts_count = extractor.ExtractContext(context).size();
        taxonomy.properties_count = extractor.CountDeclaredProperties(context);
        taxonomies.push_back(std::move(taxonomy));
    }
    return taxonomies;
}

TaxonomyStats GetTaxonomyStats(const ConceptExtractor& extractor) {
    TaxonomyStats stats;
    stats.taxonomies = GetTaxonomies(extractor);
    for (const auto& taxonomy : stats.taxonomies) {
        stats.total_concepts += taxonomy.concepts_count;
        stats.total_properties += taxonomy.properties_count;
    }

    for (const auto& concept_value : extractor.GetConceptsByTaxonomy(std::nullopt)) {
        stats.concepts_by_type[std::string(toString(concept_value.concept_type))]++;
        if (concept_value.parent_concepts.empty()) {
            stats.top_level_concepts++;
        }
    }
    return stats;
}

} // namespace ontology
} // namespace semgraph
