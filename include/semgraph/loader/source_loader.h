#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <semgraph/parser/rdf_parser.h>
#include <semgraph/storage/context.h>
#include <semgraph/storage/graph_store.h>
#include <semgraph/types/term.h>

namespace semgraph {

// File-backed source item (taxonomy file or built-in schema), already read
struct SourceFile {
    std::string path;
    std::string text;
};

// Row of the uploaded definitions store
struct DefinitionRow {
    std::string name;
    std::string content;
    std::string format;   // declared format name ("skos", "rdfs", "ttl", ...)
    bool enabled = true;
};

struct GlossaryTerm {
    std::string id;
    std::string name;
    std::string definition;
    std::optional<std::string> parent_id;
    std::vector<std::string> synonyms;
};

// A glossary arrives either as extracted triples or as plain terms
struct GlossarySource {
    std::string name;
    std::vector<Triple> triples;
    std::vector<GlossaryTerm> terms;
};

// Governance association between a catalog entity and a semantic IRI
struct EntityLinkRow {
    std::string entity_type;
    std::string entity_id;
    std::string target_iri;
};

// Everything a rebuild reads, handed over by the collaborators
struct SourceSet {
    std::vector<SourceFile> taxonomy_files;
    std::vector<DefinitionRow> definitions;
    std::vector<SourceFile> builtin_schemas;
    std::vector<GlossarySource> glossaries;
    std::vector<EntityLinkRow> links;
};

// Outcome of one rebuild pass
struct RebuildReport {
    size_t contexts_loaded = 0;
    std::vector<std::string> skipped;   // "<key>: <reason>"
};

// One pure loader per source kind: text in, draft out. A failed parse yields an
// error and no triples.
arrow::Result<ContextDraft> LoadTaxonomyFile(const SourceFile& file);
arrow::Result<ContextDraft> LoadUploadedModel(const DefinitionRow& row);
arrow::Result<ContextDraft> LoadBuiltinSchema(const SourceFile& file);
arrow::Result<ContextDraft> LoadGlossary(const GlossarySource& glossary);
arrow::Result<ContextDraft> LoadEntityLinks(const std::vector<EntityLinkRow>& links);

// Blank node scope of one context: "b" followed by the context key with every
// non-alphanumeric byte written as -HH. Distinct keys give distinct prefixes, and
// no prefix contains '_'.
std::string BlankNodePrefix(SourceKind kind, const std::string& name);

// IRI of a glossary term: urn:glossary:<glossary>:<id>
std::string GlossaryTermIri(const std::string& glossary, const std::string& term_id);

// IRI of a linked catalog entity: urn:entity:<type>:<id>
std::string EntityIri(const std::string& entity_type, const std::string& entity_id);

// Load every item of sources into a new generation. Items that fail are logged and
// skipped; the rebuild itself only fails on internal errors (vocabulary capacity).
arrow::Result<std::shared_ptr<const GraphStore>> RebuildGraph(const SourceSet& sources,
                                                              uint64_t generation,
                                                              RebuildReport* report = nullptr);

} // namespace semgraph
