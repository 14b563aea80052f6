#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>
#include <semgraph/sparql/ast.h>

namespace semgraph {
namespace sparql {

// Token types for SPARQL lexical analysis
enum class TokenType {
    // Keywords
    PREFIX, BASE,
    SELECT, ASK, CONSTRUCT, DESCRIBE,
    WHERE, FILTER, BIND, OPTIONAL, UNION, ORDER, BY, ASC, DESC,
    DISTINCT, REDUCED, LIMIT, OFFSET, AS, VALUES, UNDEF,
    MINUS_KEYWORD, EXISTS, NOT_KEYWORD, IN,
    A,               // 'a' (rdf:type shorthand)

    // Recognized but not supported: rejected with a validation error
    GROUP, HAVING, GRAPH, FROM, NAMED, SERVICE,

    // Update forms: always rejected
    INSERT, DELETE, LOAD, CLEAR, DROP, CREATE, ADD, MOVE, COPY, WITH,
    // Words that only appear inside update forms
    DATA, ALL, DEFAULT, SILENT, INTO, TO, USING,

    // Built-in functions
    BOUND, ISIRI, ISURI, ISLITERAL, ISBLANK, ISNUMERIC, STR, LANG, DATATYPE, REGEX,

    // String functions
    STRLEN, UCASE, LCASE, STRSTARTS, STRENDS, CONTAINS, CONCAT, LANGMATCHES,

    // Control functions
    IF, COALESCE,

    // Aggregate functions (rejected)
    COUNT, SUM, AVG, MIN, MAX, GROUP_CONCAT, SAMPLE,

    // Operators
    LPAREN,          // (
    RPAREN,          // )
    LBRACE,          // {
    RBRACE,          // }
    LBRACKET,        // [
    RBRACKET,        // ]
    DOT,             // .
    SEMICOLON,       // ;
    COMMA,           // ,
    PIPE,            // | (property path alternative)
    CARET,           // ^ (property path inverse)
    QUESTION,        // ? (property path zero-or-one)

    EQUAL,           // =
    NOT_EQUAL,       // !=
    LESS_THAN,       // <
    LESS_EQUAL,      // <=
    GREATER_THAN,    // >
    GREATER_EQUAL,   // >=

    AND,             // &&
    OR,              // ||
    NOT,             // !

    PLUS,            // +
    MINUS,           // -
    MULTIPLY,        // *
    DIVIDE,          // /

    // Literals
    VARIABLE,        // ?name or $name
    IRI_REF,         // <http://example.org/...>
    STRING_LITERAL,  // "string" or 'string'
    INTEGER,         // 42
    DECIMAL,         // 3.14
    DOUBLE,          // 1.0e6
    BOOLEAN,         // true or false

    // Special
    PREFIX_LABEL,    // prefix:localName
    BLANK_NODE,      // _:label
    DATATYPE_MARKER, // ^^
    LANG_TAG,        // @en (text holds the tag without '@')

    END_OF_INPUT,
    ERROR
};

struct Token {
    TokenType type;
    std::string text;
    size_t line;
    size_t column;

    Token(TokenType t, std::string txt, size_t l, size_t c)
        : type(t), text(std::move(txt)), line(l), column(c) {}

    std::string ToString() const;
};

class SPARQLTokenizer {
public:
    explicit SPARQLTokenizer(std::string input);

    // Tokenize the entire input. Invalid on the first lexical error.
    arrow::Result<std::vector<Token>> Tokenize();

private:
    std::string input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char CurrentChar() const;
    char PeekChar(size_t offset = 1) const;
    bool IsAtEnd() const;

    void Advance();
    void SkipWhitespace();
    void SkipComment();

    Token ReadVariable();
    Token ReadIRI();
    Token ReadStringLiteral(char quote);
    Token ReadNumber();
    Token ReadLangTag();
    Token ReadKeywordOrPrefixedName();
    Token ReadOperator();

    bool IsWhitespace(char c) const;
    bool IsDigit(char c) const;
    bool IsAlpha(char c) const;
    bool IsAlphaNumeric(char c) const;
    bool IsNameChar(char c) const;

    Token MakeToken(TokenType type, std::string text);
    Token MakeError(std::string message);

    std::optional<TokenType> LookupKeyword(const std::string& text) const;
};

// Read-only SPARQL query parser (recursive descent).
//
// Accepts SELECT, ASK, CONSTRUCT and DESCRIBE. Update forms and the unsupported
// constructs (GRAPH, SERVICE, FROM, sub-SELECT, GROUP BY, aggregates, property paths)
// are rejected with Status::Invalid before any AST is returned.
class SPARQLParser {
public:
    explicit SPARQLParser(std::vector<Token> tokens);

    arrow::Result<Query> Parse();

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    std::string base_iri_;
    std::unordered_map<std::string, std::string> prefixes_;
    size_t blank_node_counter_ = 0;
    bool in_template_ = false;  // CONSTRUCT template keeps blank nodes as blank nodes

    // Token navigation
    const Token& CurrentToken() const;
    const Token& PeekToken(size_t offset = 1) const;
    bool IsAtEnd() const;
    void Advance();

    bool Match(TokenType type);
    bool Check(TokenType type) const;
    arrow::Status Expect(TokenType type, const std::string& message);

    arrow::Status Error(const std::string& message) const;

    // Update forms and unsupported constructs, checked over the whole token stream
    arrow::Status RejectUnsupportedTokens() const;

    arrow::Result<std::string> ParseBaseDeclaration();
    arrow::Status ParsePrefixDeclaration();
    arrow::Result<SelectQuery> ParseSelectQuery();
    arrow::Result<AskQuery> ParseAskQuery();
    arrow::Result<ConstructQuery> ParseConstructQuery();
    arrow::Result<DescribeQuery> ParseDescribeQuery();
    arrow::Result<SelectClause> ParseSelectClause(QueryPattern& where_binds);
    arrow::Result<std::vector<TriplePattern>> ParseConstructTemplate();
    arrow::Result<QueryPattern> ParseWhereClause();
    arrow::Status ParseTriplesBlock(std::vector<TriplePattern>& out);
    arrow::Status ParsePropertyList(const RDFTerm& subject, std::vector<TriplePattern>& out,
                                    TokenType terminator);
    arrow::Result<RDFTerm> ParseTermOrNode(std::vector<TriplePattern>& out);
    arrow::Result<RDFTerm> ParseRDFTerm();
    arrow::Result<RDFTerm> ParsePredicate();
    arrow::Result<FilterClause> ParseFilterClause();
    arrow::Result<BindClause> ParseBindClause();
    arrow::Result<std::shared_ptr<Expression>> ParseExpression();
    arrow::Result<std::shared_ptr<Expression>> ParseOrExpression();
    arrow::Result<std::shared_ptr<Expression>> ParseAndExpression();
    arrow::Result<std::shared_ptr<Expression>> ParseComparisonExpression();
    arrow::Result<std::shared_ptr<Expression>> ParseAdditiveExpression();
    arrow::Result<std::shared_ptr<Expression>> ParseMultiplicativeExpression();
    arrow::Result<std::shared_ptr<Expression>> ParseUnaryExpression();
    arrow::Result<std::shared_ptr<Expression>> ParsePrimaryExpression();
    arrow::Result<std::shared_ptr<Expression>> ParseBuiltInCall();
    arrow::Result<std::shared_ptr<Expression>> ParseExpressionList(
        std::shared_ptr<Expression> expr);
    arrow::Result<std::shared_ptr<QueryPattern>> ParseExistsPattern();
    arrow::Result<ValuesClause> ParseValuesClause();
    arrow::Result<std::optional<RDFTerm>> ParseDataValue();
    arrow::Result<std::vector<OrderBy>> ParseOrderByClause();
    arrow::Status ParseSolutionModifiers(SolutionModifiers& modifiers);

    arrow::Result<Variable> ParseVariable();
    arrow::Result<Iri> ParseIRI();
    arrow::Result<Literal> ParseLiteral();
    arrow::Result<std::string> ExpandPrefixedName(const std::string& prefixed_name);
    std::string ExpandRelativeIRI(const std::string& iri) const;

    // Hidden variable standing in for a WHERE-clause blank node
    RDFTerm BlankNodeTerm(const std::string& label);
    RDFTerm FreshBlankNodeTerm();
};

// Parse a SPARQL query. Syntax errors and rejected forms yield Status::Invalid.
arrow::Result<Query> ParseSPARQL(const std::string& query_text);

} // namespace sparql
} // namespace semgraph
