#include <semgraph/loader/source_loader.h>
#include <semgraph/ontology/vocab.h>
#include <semgraph/util/logging.h>
#include <semgraph/util/string_util.h>
#include <cctype>

namespace semgraph {

SEMGRAPH_LOG_TAG(Loader);

namespace {

arrow::Result<ContextDraft> ParseIntoDraft(SourceKind kind, const std::string& name,
                                           RdfFormat format, const std::string& text) {
    ContextDraft draft;
    draft.key = MakeContextKey(kind, name);
    draft.kind = kind;
    draft.format = format;

    RdfParserConfig config;
    config.blank_node_prefix = BlankNodePrefix(kind, name);
    ARROW_ASSIGN_OR_RAISE(draft.triples, ParseRdfText(text, format, config));
    return draft;
}

arrow::Status AddTriple(std::vector<Triple>& out, Term s, std::string_view p, Term o) {
    ARROW_ASSIGN_OR_RAISE(auto triple,
                          Triple::Make(std::move(s), Term(Iri(std::string(p))), std::move(o)));
    out.push_back(std::move(triple));
    return arrow::Status::OK();
}

// Run one loader and stage its draft, or record why it was skipped
void StageOrSkip(const std::string& key, arrow::Result<ContextDraft> result,
                 GraphStoreBuilder& builder, RebuildReport& report) {
    if (!result.ok()) {
        SEMGRAPH_LOG_WARN(Loader) << "Skipping source " << key << ": "
                                  << result.status().ToString();
        report.skipped.push_back(key + ": " + result.status().ToString());
        return;
    }
    ContextDraft draft = result.MoveValueUnsafe();
    SEMGRAPH_LOG_DEBUG(Loader) << "Loaded " << draft.key << " (" << draft.triples.size()
                               << " triples)";
    builder.AddContext(std::move(draft));
}

} // namespace

std::string BlankNodePrefix(SourceKind kind, const std::string& name) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string prefix = "b";
    for (char c : MakeContextKey(kind, name)) {
        auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte)) {
            prefix.push_back(c);
        } else {
            prefix.push_back('-');
            prefix.push_back(kHex[byte >> 4]);
            prefix.push_back(kHex[byte & 0x0F]);
        }
    }
    return prefix;
}

std::string GlossaryTermIri(const std::string& glossary, const std::string& term_id) {
    return MakeContextKey(SourceKind::Glossary, glossary) + ":" + term_id;
}

std::string EntityIri(const std::string& entity_type, const std::string& entity_id) {
    return "urn:entity:" + entity_type + ":" + entity_id;
}

arrow::Result<ContextDraft> LoadTaxonomyFile(const SourceFile& file) {
    return ParseIntoDraft(SourceKind::TaxonomyFile, FileStem(file.path),
                          DetectFormat(file.path), file.text);
}

arrow::Result<ContextDraft> LoadBuiltinSchema(const SourceFile& file) {
    return ParseIntoDraft(SourceKind::BuiltinSchema, FileStem(file.path),
                          DetectFormat(file.path), file.text);
}

arrow::Result<ContextDraft> LoadUploadedModel(const DefinitionRow& row) {
    if (!row.enabled) {
        return arrow::Status::Invalid("Definition '", row.name, "' is disabled");
    }
    RdfFormat format = ParseFormatName(row.format).value_or(RdfFormat::RdfXml);
    return ParseIntoDraft(SourceKind::UploadedModel, row.name, format, row.content);
}

arrow::Result<ContextDraft> LoadGlossary(const GlossarySource& glossary) {
    ContextDraft draft;
    draft.key = MakeContextKey(SourceKind::Glossary, glossary.name);
    draft.kind = SourceKind::Glossary;
    draft.triples = glossary.triples;

    for (const GlossaryTerm& term : glossary.terms) {
        if (term.id.empty()) {
            return arrow::Status::Invalid("Glossary '", glossary.name, "' has a term without id");
        }
        Term subject(Iri(GlossaryTermIri(glossary.name, term.id)));
        auto& out = draft.triples;
        ARROW_RETURN_NOT_OK(AddTriple(out, subject, vocab::kRdfType,
                                      Term(Iri(std::string(vocab::kSkosConcept)))));
        if (!term.name.empty()) {
            ARROW_RETURN_NOT_OK(AddTriple(out, subject, vocab::kSkosPrefLabel,
                                          Term(Literal(term.name))));
        }
        if (!term.definition.empty()) {
            ARROW_RETURN_NOT_OK(AddTriple(out, subject, vocab::kSkosDefinition,
                                          Term(Literal(term.definition))));
        }
        for (const auto& synonym : term.synonyms) {
            ARROW_RETURN_NOT_OK(AddTriple(out, subject, vocab::kSkosAltLabel,
                                          Term(Literal(synonym))));
        }
        if (term.parent_id && !term.parent_id->empty()) {
            ARROW_RETURN_NOT_OK(AddTriple(out, subject, vocab::kSkosBroader,
                                          Term(Iri(GlossaryTermIri(glossary.name,
                                                                   *term.parent_id)))));
        }
    }
    return draft;
}

arrow::Result<ContextDraft> LoadEntityLinks(const std::vector<EntityLinkRow>& links) {
    ContextDraft draft;
    draft.key = std::string(kSemanticLinksKey);
    draft.kind = SourceKind::EntityLink;

    for (const EntityLinkRow& link : links) {
        if (link.entity_type.empty() || link.entity_id.empty() || link.target_iri.empty()) {
            SEMGRAPH_LOG_WARN(Loader) << "Ignoring incomplete semantic link (" << link.entity_type
                                      << ", " << link.entity_id << ", " << link.target_iri << ")";
            continue;
        }
        ARROW_RETURN_NOT_OK(AddTriple(draft.triples,
                                      Term(Iri(EntityIri(link.entity_type, link.entity_id))),
                                      vocab::kRdfsSeeAlso, Term(Iri(link.target_iri))));
    }
    return draft;
}

arrow::Result<std::shared_ptr<const GraphStore>> RebuildGraph(const SourceSet& sources,
                                                              uint64_t generation,
                                                              RebuildReport* report) {
    RebuildReport local_report;
    RebuildReport& out = report != nullptr ? *report : local_report;
    out = RebuildReport{};

    GraphStoreBuilder builder(generation);

    for (const auto& file : sources.taxonomy_files) {
        StageOrSkip(MakeContextKey(SourceKind::TaxonomyFile, FileStem(file.path)),
                    LoadTaxonomyFile(file), builder, out);
    }
    for (const auto& row : sources.definitions) {
        if (!row.enabled) {
            continue;
        }
        StageOrSkip(MakeContextKey(SourceKind::UploadedModel, row.name),
                    LoadUploadedModel(row), builder, out);
    }
    for (const auto& file : sources.builtin_schemas) {
        StageOrSkip(MakeContextKey(SourceKind::BuiltinSchema, FileStem(file.path)),
                    LoadBuiltinSchema(file), builder, out);
    }
    for (const auto& glossary : sources.glossaries) {
        StageOrSkip(MakeContextKey(SourceKind::Glossary, glossary.name),
                    LoadGlossary(glossary), builder, out);
    }
    if (!sources.links.empty()) {
        StageOrSkip(std::string(kSemanticLinksKey), LoadEntityLinks(sources.links), builder, out);
    }

    out.contexts_loaded = builder.PendingContexts();
    return builder.Finish();
}

} // namespace semgraph
