#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <semgraph/parser/rdf_parser.h>
#include <semgraph/storage/triple_index.h>
#include <semgraph/types/term.h>

namespace semgraph {

// Where the triples of a Context came from
enum class SourceKind {
    TaxonomyFile,    // urn:taxonomy:<stem>
    UploadedModel,   // urn:semantic-model:<name>
    BuiltinSchema,   // urn:schema:<stem>
    Glossary,        // urn:glossary:<name>
    EntityLink       // urn:semantic-links
};

constexpr std::string_view toString(SourceKind kind) {
    switch (kind) {
        case SourceKind::TaxonomyFile: return "TaxonomyFile";
        case SourceKind::UploadedModel: return "UploadedModel";
        case SourceKind::BuiltinSchema: return "BuiltinSchema";
        case SourceKind::Glossary: return "Glossary";
        case SourceKind::EntityLink: return "EntityLink";
    }
    return "Unknown";
}

// Reserved key of the governance link context
inline constexpr std::string_view kSemanticLinksKey = "urn:semantic-links";

// Fixed key prefix per source kind ("urn:taxonomy:", ...); the full key for EntityLink
std::string_view ContextKeyPrefix(SourceKind kind);

// Key for a named source item; EntityLink ignores name
std::string MakeContextKey(SourceKind kind, std::string_view name);

// Display name: the key without its scheme prefix ("urn:taxonomy:animals" -> "animals")
std::string SourceContextName(std::string_view key);

// Inverse of MakeContextKey's scheme; std::nullopt for keys of no known scheme
std::optional<SourceKind> SourceKindFromKey(std::string_view key);

// Parsed but not yet interned source item, produced by the loaders
struct ContextDraft {
    std::string key;
    SourceKind kind = SourceKind::TaxonomyFile;
    std::optional<RdfFormat> format;  // unset for glossary and link contexts
    std::vector<Triple> triples;
};

// Context: one named subgraph of a published generation.
//
// Triples are interned and deduplicated, kept in first-seen (file) order.
// Contexts are created by GraphStoreBuilder and never change afterwards.
struct Context {
    std::string key;
    SourceKind kind = SourceKind::TaxonomyFile;
    std::optional<RdfFormat> format;
    std::vector<IdTriple> triples;

    std::string Name() const { return SourceContextName(key); }
    size_t Size() const { return triples.size(); }
};

} // namespace semgraph
