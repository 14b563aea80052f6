#include <semgraph/storage/context.h>
#include <semgraph/util/string_util.h>

namespace semgraph {

namespace {

constexpr std::string_view kTaxonomyPrefix = "urn:taxonomy:";
constexpr std::string_view kSemanticModelPrefix = "urn:semantic-model:";
constexpr std::string_view kSchemaPrefix = "urn:schema:";
constexpr std::string_view kGlossaryPrefix = "urn:glossary:";

} // namespace

std::string_view ContextKeyPrefix(SourceKind kind) {
    switch (kind) {
        case SourceKind::TaxonomyFile: return kTaxonomyPrefix;
        case SourceKind::UploadedModel: return kSemanticModelPrefix;
        case SourceKind::BuiltinSchema: return kSchemaPrefix;
        case SourceKind::Glossary: return kGlossaryPrefix;
        case SourceKind::EntityLink: return kSemanticLinksKey;
    }
    return kTaxonomyPrefix;
}

std::string MakeContextKey(SourceKind kind, std::string_view name) {
    if (kind == SourceKind::EntityLink) {
        return std::string(kSemanticLinksKey);
    }
    std::string key(ContextKeyPrefix(kind));
    key.append(name);
    return key;
}

std::optional<SourceKind> SourceKindFromKey(std::string_view key) {
    if (key == kSemanticLinksKey) return SourceKind::EntityLink;
    if (StartsWith(key, kTaxonomyPrefix)) return SourceKind::TaxonomyFile;
    if (StartsWith(key, kSemanticModelPrefix)) return SourceKind::UploadedModel;
    if (StartsWith(key, kSchemaPrefix)) return SourceKind::BuiltinSchema;
    if (StartsWith(key, kGlossaryPrefix)) return SourceKind::Glossary;
    return std::nullopt;
}

std::string SourceContextName(std::string_view key) {
    if (key == kSemanticLinksKey) {
        return "semantic-links";
    }
    auto kind = SourceKindFromKey(key);
    if (!kind) {
        return std::string(key);
    }
    return std::string(key.substr(ContextKeyPrefix(*kind).size()));
}

} // namespace semgraph
