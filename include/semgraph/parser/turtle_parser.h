#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>
#include <semgraph/parser/rdf_parser.h>

namespace semgraph {

// Turtle parser (also accepts N-Triples, which is a subset).
// Supports:
// - Prefixes: @prefix, PREFIX
// - Base IRIs: @base, BASE
// - Blank nodes: _:b1, [ ... ], ( ... )
// - Property lists: subject predicate1 object1 ; predicate2 object2 .
// - Object lists: subject predicate object1 , object2 .
// - Special predicate 'a' for rdf:type
// - Literals with language tags and datatypes
// - Numeric literals (integer, decimal, double) and booleans
// - Multiline string literals (""" ... """, ''' ... ''')
// - \u and \U escapes
// - Comments
//
// Blank node labels are scoped to one document: every label is prefixed with
// RdfParserConfig::blank_node_prefix so that two documents using _:b1 do not
// share a node once merged.
class TurtleParser : public RdfParser {
public:
    explicit TurtleParser(const RdfParserConfig& config);

    arrow::Result<std::vector<Triple>> Parse(std::string_view text) override;

    size_t GetTriplesProcessed() const override { return triples_processed_; }
    size_t GetTriplesSkipped() const override { return triples_skipped_; }

private:
    // Statements
    arrow::Status ParseStatement();
    arrow::Status ParsePrefixDirective(bool sparql_style);
    arrow::Status ParseBaseDirective(bool sparql_style);
    arrow::Status ParseTriples();
    arrow::Status ParsePredicateObjectList(const Term& subject);
    arrow::Status ParseObjectList(const Term& subject, const Iri& predicate);

    // Terms
    arrow::Result<Term> ParseSubject();
    arrow::Result<Iri> ParseVerb();
    arrow::Result<Term> ParseObject();
    arrow::Result<Iri> ParseIri();
    arrow::Result<std::string> ParseIriRef();
    arrow::Result<std::string> ParsePrefixedName();
    arrow::Result<BlankNode> ParseBlankNodeLabel();
    arrow::Result<BlankNode> ParseBlankNodePropertyList();
    arrow::Result<Term> ParseCollection();
    arrow::Result<Literal> ParseRdfLiteral();
    arrow::Result<std::string> ParseString();
    arrow::Result<Literal> ParseNumber();

    arrow::Status Emit(Term subject, Iri predicate, Term object);

    // Character handling
    bool IsAtEnd() const { return pos_ >= text_.size(); }
    char CurrentChar() const { return IsAtEnd() ? '\0' : text_[pos_]; }
    char PeekChar(size_t offset = 1) const;
    void Advance(size_t n = 1);
    void SkipWhitespaceAndComments();
    bool MatchKeyword(std::string_view keyword, bool case_insensitive);
    arrow::Status Expect(char c, const char* context);
    void SkipToStatementEnd();

    arrow::Status Error(const std::string& message) const;

    std::string ResolveIri(const std::string& iri) const;
    BlankNode NewBlankNode();

    RdfParserConfig config_;
    std::string_view text_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    std::unordered_map<std::string, std::string> prefixes_;
    std::string base_iri_;

    std::vector<Triple> triples_;
    size_t triples_processed_ = 0;
    size_t triples_skipped_ = 0;
    size_t blank_node_counter_ = 0;
};

} // namespace semgraph
