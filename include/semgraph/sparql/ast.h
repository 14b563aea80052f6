#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <semgraph/types/term.h>

namespace semgraph {
namespace sparql {

struct QueryPattern;

// SPARQL variable (e.g., ?concept). Blank nodes of a WHERE clause are turned into
// hidden variables whose names start with '.', which SELECT * never projects.
struct Variable {
    std::string name;  // Without the '?' prefix

    Variable() = default;
    explicit Variable(std::string n) : name(std::move(n)) {}

    bool IsHidden() const { return !name.empty() && name[0] == '.'; }

    std::string ToString() const { return "?" + name; }
    bool operator==(const Variable& other) const { return name == other.name; }
};

// Term position of a pattern: a variable or a constant RDF term.
// BlankNode only survives in CONSTRUCT templates (fresh node per solution).
using RDFTerm = std::variant<Variable, Iri, Literal, BlankNode>;

std::string ToString(const RDFTerm& term);

inline bool IsVariable(const RDFTerm& term) { return std::holds_alternative<Variable>(term); }

// Constant part of a pattern term as a graph Term; std::nullopt for variables
std::optional<Term> AsConstant(const RDFTerm& term);

// Triple pattern: (subject, predicate, object)
struct TriplePattern {
    RDFTerm subject;
    RDFTerm predicate;
    RDFTerm object;

    TriplePattern() = default;
    TriplePattern(RDFTerm s, RDFTerm p, RDFTerm o)
        : subject(std::move(s)), predicate(std::move(p)), object(std::move(o)) {}

    std::string ToString() const;
};

// Basic Graph Pattern (BGP): a conjunction of triple patterns
struct BasicGraphPattern {
    std::vector<TriplePattern> triples;

    std::string ToString() const;
};

// FILTER / BIND expression operators
enum class ExprOperator {
    // Leaf: constant or variable stored in Expression::constant
    Constant,

    // Comparison
    Equal,           // =
    NotEqual,        // !=
    LessThan,        // <
    LessThanEqual,   // <=
    GreaterThan,     // >
    GreaterThanEqual,// >=
    In,              // IN
    NotIn,           // NOT IN

    // Logical
    And,             // &&
    Or,              // ||
    Not,             // !

    // Arithmetic
    Plus,            // +
    Minus,           // -
    Multiply,        // *
    Divide,          // /
    Negate,          // unary -

    // Term tests and accessors
    Bound,           // BOUND(?var)
    IsIRI,           // isIRI / isURI
    IsLiteral,       // isLiteral
    IsBlank,         // isBlank
    IsNumeric,       // isNumeric
    Str,             // STR
    Lang,            // LANG
    Datatype,        // DATATYPE
    Regex,           // REGEX(?text, "pattern" [, "flags"])

    // String functions
    StrLen,          // STRLEN
    UCase,           // UCASE
    LCase,           // LCASE
    StrStarts,       // STRSTARTS
    StrEnds,         // STRENDS
    Contains,        // CONTAINS
    Concat,          // CONCAT
    LangMatches,     // LANGMATCHES

    // Control
    If,              // IF(cond, a, b)
    Coalesce,        // COALESCE(a, b, ...)

    // Graph pattern tests
    Exists,          // EXISTS { pattern }
    NotExists        // NOT EXISTS { pattern }
};

std::string_view toString(ExprOperator op);

struct Expression {
    ExprOperator op = ExprOperator::Constant;
    std::vector<std::shared_ptr<Expression>> arguments;
    std::optional<RDFTerm> constant;               // For Constant leaves
    std::shared_ptr<QueryPattern> exists_pattern;  // For EXISTS/NOT EXISTS

    Expression() = default;
    explicit Expression(ExprOperator o) : op(o) {}
    explicit Expression(RDFTerm term) : op(ExprOperator::Constant), constant(std::move(term)) {}

    bool IsConstant() const { return op == ExprOperator::Constant; }

    std::string ToString() const;
};

struct FilterClause {
    std::shared_ptr<Expression> expr;

    FilterClause() = default;
    explicit FilterClause(std::shared_ptr<Expression> e) : expr(std::move(e)) {}

    std::string ToString() const;
};

// BIND(expression AS ?var)
struct BindClause {
    std::shared_ptr<Expression> expr;
    Variable alias;

    BindClause() = default;
    BindClause(std::shared_ptr<Expression> e, Variable a)
        : expr(std::move(e)), alias(std::move(a)) {}

    std::string ToString() const;
};

struct OptionalPattern {
    std::shared_ptr<QueryPattern> pattern;

    OptionalPattern() = default;
    explicit OptionalPattern(std::shared_ptr<QueryPattern> p) : pattern(std::move(p)) {}
};

struct UnionPattern {
    std::vector<std::shared_ptr<QueryPattern>> patterns;
};

// VALUES (?x ?y) { (a b) (UNDEF c) }; std::nullopt cells are UNDEF
struct ValuesClause {
    std::vector<Variable> variables;
    std::vector<std::vector<std::optional<RDFTerm>>> rows;

    std::string ToString() const;
};

struct MinusPattern {
    std::shared_ptr<QueryPattern> pattern;

    MinusPattern() = default;
    explicit MinusPattern(std::shared_ptr<QueryPattern> p) : pattern(std::move(p)) {}
};

// Group graph pattern. Plain nested groups are merged into their parent; the parts
// are evaluated as: BGP, VALUES, UNION, OPTIONAL, BIND, MINUS, then FILTER.
struct QueryPattern {
    std::optional<BasicGraphPattern> bgp;
    std::vector<FilterClause> filters;
    std::vector<BindClause> binds;
    std::vector<OptionalPattern> optionals;
    std::vector<UnionPattern> unions;
    std::vector<ValuesClause> values;
    std::vector<MinusPattern> minus_patterns;

    // Append every part of other to this pattern
    void Merge(const QueryPattern& other);

    std::string ToString() const;
};

enum class OrderDirection {
    Ascending,
    Descending
};

// ORDER BY key: ?var, ASC(expr), DESC(expr) or (expr)
struct OrderBy {
    std::shared_ptr<Expression> expr;
    OrderDirection direction = OrderDirection::Ascending;

    OrderBy() = default;
    OrderBy(std::shared_ptr<Expression> e, OrderDirection d) : expr(std::move(e)), direction(d) {}

    std::string ToString() const;
};

struct SelectClause {
    bool distinct = false;
    std::vector<Variable> variables;  // Empty means SELECT *

    bool IsSelectAll() const { return variables.empty(); }

    std::string ToString() const;
};

// Solution modifiers shared by SELECT, CONSTRUCT and DESCRIBE
struct SolutionModifiers {
    std::vector<OrderBy> order_by;
    std::optional<size_t> limit;
    std::optional<size_t> offset;
};

struct SelectQuery {
    SelectClause select;
    QueryPattern where;
    SolutionModifiers modifiers;

    std::string ToString() const;
};

struct AskQuery {
    QueryPattern where;

    std::string ToString() const;
};

struct ConstructQuery {
    std::vector<TriplePattern> construct_template;
    QueryPattern where;
    SolutionModifiers modifiers;

    std::string ToString() const;
};

// DESCRIBE <iri> ?var ... [WHERE { ... }]; DESCRIBE * describes every WHERE variable
struct DescribeQuery {
    std::vector<RDFTerm> resources;
    bool describe_all = false;
    std::optional<QueryPattern> where;
    SolutionModifiers modifiers;

    std::string ToString() const;
};

using QueryBody = std::variant<SelectQuery, AskQuery, ConstructQuery, DescribeQuery>;

struct Query {
    std::optional<std::string> base_iri;
    QueryBody query_body;

    Query() : query_body(SelectQuery()) {}

    std::string ToString() const;

    bool IsSelect() const { return std::holds_alternative<SelectQuery>(query_body); }
    bool IsAsk() const { return std::holds_alternative<AskQuery>(query_body); }
    bool IsConstruct() const { return std::holds_alternative<ConstructQuery>(query_body); }
    bool IsDescribe() const { return std::holds_alternative<DescribeQuery>(query_body); }
};

// Variables of a pattern in first-occurrence order, including nested groups
void CollectVariables(const QueryPattern& pattern, std::vector<std::string>& out);
void CollectVariables(const Expression& expr, std::vector<std::string>& out);

} // namespace sparql
} // namespace semgraph
