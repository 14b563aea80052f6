#include <semgraph/sparql/ast.h>
#include <algorithm>
#include <sstream>
#include <type_traits>

namespace semgraph {
namespace sparql {

namespace {

void AddVariable(const std::string& name, std::vector<std::string>& out) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(name);
    }
}

void AddIfVariable(const RDFTerm& term, std::vector<std::string>& out) {
    if (const auto* var = std::get_if<Variable>(&term)) {
        AddVariable(var->name, out);
    }
}

void AppendModifiers(std::ostringstream& oss, const SolutionModifiers& modifiers) {
    if (!modifiers.order_by.empty()) {
        oss << " ORDER BY";
        for (const auto& key : modifiers.order_by) {
            oss << " " << key.ToString();
        }
    }
    if (modifiers.limit) {
        oss << " LIMIT " << *modifiers.limit;
    }
    if (modifiers.offset) {
        oss << " OFFSET " << *modifiers.offset;
    }
}

} // namespace

std::string ToString(const RDFTerm& term) {
    return std::visit([](const auto& t) -> std::string {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Variable>) {
            return t.ToString();
        } else {
            return ToNTriples(Term(t));
        }
    }, term);
}

std::optional<Term> AsConstant(const RDFTerm& term) {
    return std::visit([](const auto& t) -> std::optional<Term> {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Variable>) {
            return std::nullopt;
        } else {
            return Term(t);
        }
    }, term);
}

std::string TriplePattern::ToString() const {
    return sparql::ToString(subject) + " " + sparql::ToString(predicate) + " " +
           sparql::ToString(object);
}

std::string BasicGraphPattern::ToString() const {
    std::ostringstream oss;
    for (size_t i = 0; i < triples.size(); ++i) {
        if (i > 0) oss << " . ";
        oss << triples[i].ToString();
    }
    return oss.str();
}

std::string_view toString(ExprOperator op) {
    switch (op) {
        case ExprOperator::Constant: return "CONST";
        case ExprOperator::Equal: return "=";
        case ExprOperator::NotEqual: return "!=";
        case ExprOperator::LessThan: return "<";
        case ExprOperator::LessThanEqual: return "<=";
        case ExprOperator::GreaterThan: return ">";
        case ExprOperator::GreaterThanEqual: return ">=";
        case ExprOperator::In: return "IN";
        case ExprOperator::NotIn: return "NOT IN";
        case ExprOperator::And: return "&&";
        case ExprOperator::Or: return "||";
        case ExprOperator::Not: return "!";
        case ExprOperator::Plus: return "+";
        case ExprOperator::Minus: return "-";
        case ExprOperator::Multiply: return "*";
        case ExprOperator::Divide: return "/";
        case ExprOperator::Negate: return "NEG";
        case ExprOperator::Bound: return "BOUND";
        case ExprOperator::IsIRI: return "isIRI";
        case ExprOperator::IsLiteral: return "isLiteral";
        case ExprOperator::IsBlank: return "isBlank";
        case ExprOperator::IsNumeric: return "isNumeric";
        case ExprOperator::Str: return "STR";
        case ExprOperator::Lang: return "LANG";
        case ExprOperator::Datatype: return "DATATYPE";
        case ExprOperator::Regex: return "REGEX";
        case ExprOperator::StrLen: return "STRLEN";
        case ExprOperator::UCase: return "UCASE";
        case ExprOperator::LCase: return "LCASE";
        case ExprOperator::StrStarts: return "STRSTARTS";
        case ExprOperator::StrEnds: return "STRENDS";
        case ExprOperator::Contains: return "CONTAINS";
        case ExprOperator::Concat: return "CONCAT";
        case ExprOperator::LangMatches: return "LANGMATCHES";
        case ExprOperator::If: return "IF";
        case ExprOperator::Coalesce: return "COALESCE";
        case ExprOperator::Exists: return "EXISTS";
        case ExprOperator::NotExists: return "NOT EXISTS";
    }
    return "?";
}

std::string Expression::ToString() const {
    if (IsConstant()) {
        return constant ? sparql::ToString(*constant) : "UNDEF";
    }
    if (op == ExprOperator::Exists || op == ExprOperator::NotExists) {
        return std::string(toString(op)) + " { " +
               (exists_pattern ? exists_pattern->ToString() : "") + " }";
    }

    std::ostringstream oss;
    oss << toString(op) << "(";
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << (arguments[i] ? arguments[i]->ToString() : "null");
    }
    oss << ")";
    return oss.str();
}

std::string FilterClause::ToString() const {
    return "FILTER(" + (expr ? expr->ToString() : "") + ")";
}

std::string BindClause::ToString() const {
    return "BIND(" + (expr ? expr->ToString() : "") + " AS " + alias.ToString() + ")";
}

std::string ValuesClause::ToString() const {
    std::ostringstream oss;
    oss << "VALUES (";
    for (const auto& var : variables) {
        oss << var.ToString() << " ";
    }
    oss << ") { " << rows.size() << " rows }";
    return oss.str();
}

void QueryPattern::Merge(const QueryPattern& other) {
    if (other.bgp) {
        if (!bgp) {
            bgp = BasicGraphPattern();
        }
        bgp->triples.insert(bgp->triples.end(), other.bgp->triples.begin(),
                            other.bgp->triples.end());
    }
    filters.insert(filters.end(), other.filters.begin(), other.filters.end());
    binds.insert(binds.end(), other.binds.begin(), other.binds.end());
    optionals.insert(optionals.end(), other.optionals.begin(), other.optionals.end());
    unions.insert(unions.end(), other.unions.begin(), other.unions.end());
    values.insert(values.end(), other.values.begin(), other.values.end());
    minus_patterns.insert(minus_patterns.end(), other.minus_patterns.begin(),
                          other.minus_patterns.end());
}

std::string QueryPattern::ToString() const {
    std::ostringstream oss;
    if (bgp) {
        oss << bgp->ToString();
    }
    for (const auto& values_clause : values) {
        oss << " " << values_clause.ToString();
    }
    for (const auto& union_pattern : unions) {
        for (size_t i = 0; i < union_pattern.patterns.size(); ++i) {
            oss << (i == 0 ? " { " : " UNION { ") << union_pattern.patterns[i]->ToString() << " }";
        }
    }
    for (const auto& optional : optionals) {
        oss << " OPTIONAL { " << optional.pattern->ToString() << " }";
    }
    for (const auto& bind : binds) {
        oss << " " << bind.ToString();
    }
    for (const auto& minus : minus_patterns) {
        oss << " MINUS { " << minus.pattern->ToString() << " }";
    }
    for (const auto& filter : filters) {
        oss << " " << filter.ToString();
    }
    return oss.str();
}

std::string OrderBy::ToString() const {
    std::string inner = expr ? expr->ToString() : "";
    return direction == OrderDirection::Descending ? "DESC(" + inner + ")" : "ASC(" + inner + ")";
}

std::string SelectClause::ToString() const {
    std::ostringstream oss;
    oss << "SELECT ";
    if (distinct) oss << "DISTINCT ";
    if (IsSelectAll()) {
        oss << "*";
    }
    for (size_t i = 0; i < variables.size(); ++i) {
        if (i > 0) oss << " ";
        oss << variables[i].ToString();
    }
    return oss.str();
}

std::string SelectQuery::ToString() const {
    std::ostringstream oss;
    oss << select.ToString() << " WHERE { " << where.ToString() << " }";
    AppendModifiers(oss, modifiers);
    return oss.str();
}

std::string AskQuery::ToString() const {
    return "ASK { " + where.ToString() + " }";
}

std::string ConstructQuery::ToString() const {
    std::ostringstream oss;
    oss << "CONSTRUCT { ";
    for (const auto& triple : construct_template) {
        oss << triple.ToString() << " . ";
    }
    oss << "} WHERE { " << where.ToString() << " }";
    AppendModifiers(oss, modifiers);
    return oss.str();
}

std::string DescribeQuery::ToString() const {
    std::ostringstream oss;
    oss << "DESCRIBE";
    if (describe_all) {
        oss << " *";
    }
    for (const auto& resource : resources) {
        oss << " " << sparql::ToString(resource);
    }
    if (where) {
        oss << " WHERE { " << where->ToString() << " }";
    }
    AppendModifiers(oss, modifiers);
    return oss.str();
}

std::string Query::ToString() const {
    return std::visit([](const auto& body) { return body.ToString(); }, query_body);
}

void CollectVariables(const Expression& expr, std::vector<std::string>& out) {
    if (expr.IsConstant() && expr.constant) {
        AddIfVariable(*expr.constant, out);
    }
    for (const auto& arg : expr.arguments) {
        if (arg) {
            CollectVariables(*arg, out);
        }
    }
    if (expr.exists_pattern) {
        CollectVariables(*expr.exists_pattern, out);
    }
}

void CollectVariables(const QueryPattern& pattern, std::vector<std::string>& out) {
    if (pattern.bgp) {
        for (const auto& triple : pattern.bgp->triples) {
            AddIfVariable(triple.subject, out);
            AddIfVariable(triple.predicate, out);
            AddIfVariable(triple.object, out);
        }
    }
    for (const auto& values_clause : pattern.values) {
        for (const auto& var : values_clause.variables) {
            AddVariable(var.name, out);
        }
    }
    for (const auto& union_pattern : pattern.unions) {
        for (const auto& branch : union_pattern.patterns) {
            CollectVariables(*branch, out);
        }
    }
    for (const auto& optional : pattern.optionals) {
        CollectVariables(*optional.pattern, out);
    }
    for (const auto& bind : pattern.binds) {
        CollectVariables(*bind.expr, out);
        AddVariable(bind.alias.name, out);
    }
    for (const auto& minus : pattern.minus_patterns) {
        CollectVariables(*minus.pattern, out);
    }
    for (const auto& filter : pattern.filters) {
        CollectVariables(*filter.expr, out);
    }
}

} // namespace sparql
} // namespace semgraph
