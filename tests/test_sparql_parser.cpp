/**
 * SPARQL Parser Tests
 *
 * Covers:
 * - Tokenizer: variables, IRIs, prefixed names, literals, language tags
 * - SELECT / ASK / CONSTRUCT / DESCRIBE query forms
 * - Group patterns: OPTIONAL, UNION, MINUS, VALUES, BIND, FILTER, nested groups
 * - Solution modifiers
 * - Rejection of update forms and unsupported constructs before any AST is built
 */

#include <semgraph/ontology/vocab.h>
#include <semgraph/sparql/parser.h>
#include <gtest/gtest.h>

using namespace semgraph;
using namespace semgraph::sparql;

namespace {

Query ParseOk(const std::string& text) {
    auto parsed = ParseSPARQL(text);
    EXPECT_TRUE(parsed.ok()) << parsed.status().ToString();
    return parsed.ok() ? *parsed : Query();
}

void ExpectRejected(const std::string& text, const std::string& fragment) {
    auto parsed = ParseSPARQL(text);
    ASSERT_FALSE(parsed.ok()) << "accepted: " << text;
    EXPECT_TRUE(parsed.status().IsInvalid());
    EXPECT_NE(parsed.status().message().find(fragment), std::string::npos)
        << parsed.status().message();
}

}  // namespace

TEST(SPARQLTokenizerTest, BasicTokens) {
    SPARQLTokenizer tokenizer(
        "SELECT ?s $o WHERE { ?s <urn:x:p> ex:name ; a \"v\"@en . FILTER(?o >= 1.5) }");
    auto tokens = tokenizer.Tokenize();
    ASSERT_TRUE(tokens.ok()) << tokens.status().ToString();

    std::vector<TokenType> types;
    for (const auto& token : *tokens) {
        types.push_back(token.type);
    }
    std::vector<TokenType> expected = {
        TokenType::SELECT, TokenType::VARIABLE, TokenType::VARIABLE, TokenType::WHERE,
        TokenType::LBRACE, TokenType::VARIABLE, TokenType::IRI_REF, TokenType::PREFIX_LABEL,
        TokenType::SEMICOLON, TokenType::A, TokenType::STRING_LITERAL, TokenType::LANG_TAG,
        TokenType::DOT, TokenType::FILTER, TokenType::LPAREN, TokenType::VARIABLE,
        TokenType::GREATER_EQUAL, TokenType::DECIMAL, TokenType::RPAREN, TokenType::RBRACE,
        TokenType::END_OF_INPUT};
    EXPECT_EQ(types, expected);
}

TEST(SPARQLTokenizerTest, KeywordsAreCaseInsensitive) {
    SPARQLTokenizer tokenizer("select distinct ?x where { ?x a ?t } limit 5");
    auto tokens = tokenizer.Tokenize();
    ASSERT_TRUE(tokens.ok());
    EXPECT_EQ((*tokens)[0].type, TokenType::SELECT);
    EXPECT_EQ((*tokens)[1].type, TokenType::DISTINCT);
    EXPECT_EQ((*tokens)[3].type, TokenType::WHERE);
}

TEST(SPARQLTokenizerTest, LexicalErrors) {
    EXPECT_FALSE(SPARQLTokenizer("SELECT ?s WHERE { ?s ?p \"open }").Tokenize().ok());
    EXPECT_FALSE(SPARQLTokenizer("SELECT ?s WHERE { ?s ?p ?o } ~").Tokenize().ok());
}

TEST(SPARQLParserTest, SelectWithModifiers) {
    auto query = ParseOk(
        "PREFIX x: <urn:x:>\n"
        "SELECT DISTINCT ?s ?label WHERE {\n"
        "  ?s a x:Dog ; rdfs:label ?label .\n"
        "} ORDER BY DESC(?label) ?s LIMIT 10 OFFSET 2");

    ASSERT_TRUE(query.IsSelect());
    const auto& select = std::get<SelectQuery>(query.query_body);
    EXPECT_TRUE(select.select.distinct);
    ASSERT_EQ(select.select.variables.size(), 2u);
    EXPECT_EQ(select.select.variables[0].name, "s");

    ASSERT_TRUE(select.where.bgp.has_value());
    ASSERT_EQ(select.where.bgp->triples.size(), 2u);
    EXPECT_EQ(std::get<Iri>(select.where.bgp->triples[0].predicate).value, vocab::kRdfType);
    EXPECT_EQ(std::get<Iri>(select.where.bgp->triples[0].object).value, "urn:x:Dog");
    EXPECT_EQ(std::get<Iri>(select.where.bgp->triples[1].predicate).value, vocab::kRdfsLabel);

    ASSERT_EQ(select.modifiers.order_by.size(), 2u);
    EXPECT_EQ(select.modifiers.order_by[0].direction, OrderDirection::Descending);
    EXPECT_EQ(select.modifiers.order_by[1].direction, OrderDirection::Ascending);
    ASSERT_TRUE(select.modifiers.limit.has_value());
    EXPECT_EQ(*select.modifiers.limit, 10u);
    ASSERT_TRUE(select.modifiers.offset.has_value());
    EXPECT_EQ(*select.modifiers.offset, 2u);
}

TEST(SPARQLParserTest, SelectStarAndReduced) {
    auto star = ParseOk("SELECT * WHERE { ?s ?p ?o }");
    EXPECT_TRUE(std::get<SelectQuery>(star.query_body).select.IsSelectAll());

    auto reduced = ParseOk("SELECT REDUCED ?s WHERE { ?s ?p ?o }");
    EXPECT_TRUE(std::get<SelectQuery>(reduced.query_body).select.distinct);
}

TEST(SPARQLParserTest, SelectExpressionBecomesBind) {
    auto query = ParseOk("SELECT ?s (UCASE(?l) AS ?upper) WHERE { ?s rdfs:label ?l }");
    const auto& select = std::get<SelectQuery>(query.query_body);
    ASSERT_EQ(select.select.variables.size(), 2u);
    EXPECT_EQ(select.select.variables[1].name, "upper");
    ASSERT_EQ(select.where.binds.size(), 1u);
    EXPECT_EQ(select.where.binds[0].alias.name, "upper");
    EXPECT_EQ(select.where.binds[0].expr->op, ExprOperator::UCase);
}

TEST(SPARQLParserTest, GroupPatternParts) {
    auto query = ParseOk(
        "PREFIX x: <urn:x:>\n"
        "SELECT * WHERE {\n"
        "  ?s a ?type .\n"
        "  OPTIONAL { ?s rdfs:label ?label }\n"
        "  { ?s x:p ?v } UNION { ?s x:q ?v } UNION { ?s x:r ?v }\n"
        "  MINUS { ?s a x:Hidden }\n"
        "  VALUES (?type ?flag) { (x:Dog 1) (UNDEF 2) }\n"
        "  BIND(STRLEN(?label) AS ?len)\n"
        "  FILTER(BOUND(?label) && ?len > 2)\n"
        "  { ?s x:nested ?n }\n"
        "}");

    const auto& where = std::get<SelectQuery>(query.query_body).where;
    ASSERT_TRUE(where.bgp.has_value());
    // the plain nested group is merged into the outer BGP
    EXPECT_EQ(where.bgp->triples.size(), 2u);
    EXPECT_EQ(where.optionals.size(), 1u);
    ASSERT_EQ(where.unions.size(), 1u);
    EXPECT_EQ(where.unions[0].patterns.size(), 3u);
    EXPECT_EQ(where.minus_patterns.size(), 1u);
    ASSERT_EQ(where.values.size(), 1u);
    ASSERT_EQ(where.values[0].rows.size(), 2u);
    EXPECT_FALSE(where.values[0].rows[1][0].has_value());
    EXPECT_EQ(where.binds.size(), 1u);
    ASSERT_EQ(where.filters.size(), 1u);
    EXPECT_EQ(where.filters[0].expr->op, ExprOperator::And);
}

TEST(SPARQLParserTest, FilterExpressionsAndExists) {
    auto query = ParseOk(
        "SELECT ?s WHERE { ?s ?p ?o .\n"
        "  FILTER(REGEX(STR(?o), \"^dog\", \"i\"))\n"
        "  FILTER(?o IN (1, 2, 3))\n"
        "  FILTER NOT EXISTS { ?s rdfs:comment ?c }\n"
        "  FILTER(!isBlank(?s) || -?o < 0)\n"
        "}");

    const auto& filters = std::get<SelectQuery>(query.query_body).where.filters;
    ASSERT_EQ(filters.size(), 4u);
    EXPECT_EQ(filters[0].expr->op, ExprOperator::Regex);
    EXPECT_EQ(filters[0].expr->arguments.size(), 3u);
    EXPECT_EQ(filters[1].expr->op, ExprOperator::In);
    EXPECT_EQ(filters[2].expr->op, ExprOperator::NotExists);
    ASSERT_NE(filters[2].expr->exists_pattern, nullptr);
    EXPECT_TRUE(filters[2].expr->exists_pattern->bgp.has_value());
    EXPECT_EQ(filters[3].expr->op, ExprOperator::Or);
}

TEST(SPARQLParserTest, BlankNodesBecomeHiddenVariables) {
    auto query = ParseOk("SELECT * WHERE { _:b rdfs:label ?l . ?x ?p [ rdfs:label ?m ] }");
    const auto& where = std::get<SelectQuery>(query.query_body).where;
    ASSERT_TRUE(where.bgp.has_value());
    const auto* subject = std::get_if<Variable>(&where.bgp->triples[0].subject);
    ASSERT_NE(subject, nullptr);
    EXPECT_TRUE(subject->IsHidden());
}

TEST(SPARQLParserTest, AskConstructDescribe) {
    auto ask = ParseOk("ASK { ?s a owl:Class }");
    EXPECT_TRUE(ask.IsAsk());

    auto construct = ParseOk(
        "CONSTRUCT { ?s rdfs:label ?l . _:n rdfs:seeAlso ?s } WHERE { ?s skos:prefLabel ?l }");
    ASSERT_TRUE(construct.IsConstruct());
    const auto& templ = std::get<ConstructQuery>(construct.query_body).construct_template;
    ASSERT_EQ(templ.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<BlankNode>(templ[1].subject));

    auto construct_where = ParseOk("CONSTRUCT WHERE { ?s rdfs:label ?l }");
    EXPECT_EQ(std::get<ConstructQuery>(construct_where.query_body).construct_template.size(), 1u);

    auto describe = ParseOk("DESCRIBE <urn:x:Dog>");
    ASSERT_TRUE(describe.IsDescribe());
    EXPECT_FALSE(std::get<DescribeQuery>(describe.query_body).where.has_value());

    auto describe_all = ParseOk("DESCRIBE * WHERE { ?s a owl:Class }");
    EXPECT_TRUE(std::get<DescribeQuery>(describe_all.query_body).describe_all);
}

TEST(SPARQLParserTest, RejectsUpdateForms) {
    ExpectRejected("DELETE WHERE { ?s ?p ?o }", "DELETE");
    ExpectRejected("INSERT DATA { <urn:x:a> <urn:x:p> <urn:x:b> }", "INSERT");
    ExpectRejected("CLEAR ALL", "CLEAR");
    ExpectRejected("DROP GRAPH <urn:x:g>", "DROP");
    ExpectRejected("LOAD <http://example.org/data.ttl>", "LOAD");
    // an update keyword anywhere in the text rejects the whole request
    ExpectRejected("SELECT * WHERE { ?s ?p ?o } ; DELETE WHERE { ?s ?p ?o }",
                   "only read-only queries");
}

TEST(SPARQLParserTest, RejectsUnsupportedConstructs) {
    ExpectRejected("SELECT (COUNT(?s) AS ?n) WHERE { ?s ?p ?o }", "COUNT");
    ExpectRejected("SELECT ?s WHERE { ?s ?p ?o } GROUP BY ?s", "GROUP");
    ExpectRejected("SELECT ?s FROM <urn:x:g> WHERE { ?s ?p ?o }", "FROM");
    ExpectRejected("SELECT ?s WHERE { GRAPH ?g { ?s ?p ?o } }", "GRAPH");
    ExpectRejected("SELECT ?s WHERE { SERVICE <urn:x:e> { ?s ?p ?o } }", "SERVICE");
    ExpectRejected("SELECT ?s WHERE { { SELECT ?s WHERE { ?s ?p ?o } } }", "Sub-queries");
    ExpectRejected("SELECT ?s WHERE { ?s rdfs:subClassOf|skos:broader ?o }", "Property paths");
    ExpectRejected("DESCRIBE ?s", "requires a WHERE clause");
}

TEST(SPARQLParserTest, SyntaxErrors) {
    ExpectRejected("", "Expected SELECT");
    ExpectRejected("SELECT WHERE { ?s ?p ?o }", "Expected variables");
    ExpectRejected("SELECT ?s WHERE { ?s ?p ?o", "Expected '}'");
    ExpectRejected("SELECT ?s WHERE { ?s nope:p ?o }", "Undefined prefix");
    ExpectRejected("SELECT ?s WHERE { ?s ?p ?o } LIMIT 1 garbage", "Unexpected input");
    ExpectRejected("SELECT ?s WHERE { ?s ?p ?o FILTER(FOO(?o)) }", "");
}
