#include <semgraph/types/term.h>
#include <sstream>
#include <type_traits>

namespace semgraph {

namespace {

std::string EscapeLiteral(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace

TermKind KindOf(const Term& term) {
    return std::visit([](const auto& t) -> TermKind {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Iri>) {
            return TermKind::IRI;
        } else if constexpr (std::is_same_v<T, Literal>) {
            return TermKind::Literal;
        } else {
            return TermKind::BlankNode;
        }
    }, term);
}

const std::string& LexicalForm(const Term& term) {
    return std::visit([](const auto& t) -> const std::string& {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Iri>) {
            return t.value;
        } else if constexpr (std::is_same_v<T, Literal>) {
            return t.value;
        } else {
            return t.id;
        }
    }, term);
}

std::string ToNTriples(const Term& term) {
    return std::visit([](const auto& t) -> std::string {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Iri>) {
            return "<" + t.value + ">";
        } else if constexpr (std::is_same_v<T, Literal>) {
            std::string out = "\"" + EscapeLiteral(t.value) + "\"";
            if (t.HasLanguage()) {
                out += "@" + t.language;
            } else if (t.HasDatatype()) {
                out += "^^<" + t.datatype + ">";
            }
            return out;
        } else {
            return "_:" + t.id;
        }
    }, term);
}

arrow::Result<Triple> Triple::Make(Term subject, Term predicate, Term object) {
    if (IsLiteral(subject)) {
        return arrow::Status::Invalid("Triple subject must be an IRI or blank node, got literal ",
                                      ToNTriples(subject));
    }
    auto* pred = std::get_if<Iri>(&predicate);
    if (pred == nullptr) {
        return arrow::Status::Invalid("Triple predicate must be an IRI, got ",
                                      ToNTriples(predicate));
    }
    if (pred->value.empty()) {
        return arrow::Status::Invalid("Triple predicate IRI is empty");
    }
    Triple triple;
    triple.subject = std::move(subject);
    triple.predicate = std::move(*pred);
    triple.object = std::move(object);
    return triple;
}

std::string Triple::ToString() const {
    std::ostringstream oss;
    oss << ToNTriples(subject) << " " << ToNTriples(Term(predicate)) << " "
        << ToNTriples(object) << " .";
    return oss.str();
}

} // namespace semgraph
