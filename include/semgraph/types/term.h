#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <arrow/result.h>

namespace semgraph {

// TermKind - identifies RDF term kinds
enum class TermKind : uint8_t {
    IRI = 1,
    Literal = 2,
    BlankNode = 3
};

constexpr std::string_view toString(TermKind kind) {
    switch (kind) {
        case TermKind::IRI: return "IRI";
        case TermKind::Literal: return "Literal";
        case TermKind::BlankNode: return "BlankNode";
    }
    return "Unknown";
}

// Absolute IRI, stored without angle brackets. No relative resolution.
struct Iri {
    std::string value;

    Iri() = default;
    explicit Iri(std::string v) : value(std::move(v)) {}

    bool operator==(const Iri& other) const { return value == other.value; }
    bool operator!=(const Iri& other) const { return !(*this == other); }
    bool operator<(const Iri& other) const { return value < other.value; }
};

// Literal with an optional language tag or datatype IRI (at most one is set)
struct Literal {
    std::string value;
    std::string language;
    std::string datatype;

    Literal() = default;
    explicit Literal(std::string v, std::string lang = "", std::string dt = "")
        : value(std::move(v)), language(std::move(lang)), datatype(std::move(dt)) {}

    bool HasLanguage() const { return !language.empty(); }
    bool HasDatatype() const { return !datatype.empty(); }

    bool operator==(const Literal& other) const {
        return value == other.value && language == other.language &&
               datatype == other.datatype;
    }
    bool operator!=(const Literal& other) const { return !(*this == other); }
};

struct BlankNode {
    std::string id;

    BlankNode() = default;
    explicit BlankNode(std::string i) : id(std::move(i)) {}

    bool operator==(const BlankNode& other) const { return id == other.id; }
    bool operator!=(const BlankNode& other) const { return !(*this == other); }
};

// Closed tagged union over the three RDF term kinds
using Term = std::variant<Iri, Literal, BlankNode>;

TermKind KindOf(const Term& term);

inline bool IsIri(const Term& term) { return std::holds_alternative<Iri>(term); }
inline bool IsLiteral(const Term& term) { return std::holds_alternative<Literal>(term); }
inline bool IsBlank(const Term& term) { return std::holds_alternative<BlankNode>(term); }

// Plain string form: IRI text, literal lexical value, or blank node label
const std::string& LexicalForm(const Term& term);

// N-Triples serialization (<iri>, "value"@lang, "value"^^<dt>, _:id)
std::string ToNTriples(const Term& term);

// Triple: subject is IRI or blank node, predicate is IRI, object is any term
struct Triple {
    Term subject;
    Iri predicate;
    Term object;

    // Validating constructor: rejects literal subjects and non-IRI predicates
    static arrow::Result<Triple> Make(Term subject, Term predicate, Term object);

    bool operator==(const Triple& other) const {
        return subject == other.subject && predicate == other.predicate &&
               object == other.object;
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }

    std::string ToString() const;
};

} // namespace semgraph

namespace std {
template <>
struct hash<semgraph::Term> {
    size_t operator()(const semgraph::Term& term) const {
        size_t h = std::hash<std::string>()(semgraph::LexicalForm(term));
        h ^= std::hash<int>()(static_cast<int>(term.index())) + 0x9e3779b9 + (h << 6) + (h >> 2);
        if (const auto* lit = std::get_if<semgraph::Literal>(&term)) {
            h ^= std::hash<std::string>()(lit->language) + 0x9e3779b9 + (h << 6) + (h >> 2);
            h ^= std::hash<std::string>()(lit->datatype) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};

template <>
struct hash<semgraph::Triple> {
    size_t operator()(const semgraph::Triple& t) const {
        hash<semgraph::Term> term_hash;
        size_t h = term_hash(t.subject);
        h ^= std::hash<std::string>()(t.predicate.value) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= term_hash(t.object) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};
} // namespace std
