/**
 * Turtle / N-Triples Parser Tests
 *
 * Covers:
 * - Prefixes, 'a', predicate and object lists
 * - Literals: language tags, datatypes, numbers, booleans, long strings, escapes
 * - Blank nodes: labels, property lists, collections, per-document scoping
 * - Error reporting and skip_invalid_triples recovery
 * - Format detection from file names and declared format names
 */

#include <semgraph/ontology/vocab.h>
#include <semgraph/parser/rdf_parser.h>
#include <semgraph/parser/turtle_parser.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace semgraph;

namespace {

std::vector<Triple> ParseOk(const std::string& text, RdfParserConfig config = {}) {
    auto parsed = ParseRdfText(text, RdfFormat::Turtle, config);
    EXPECT_TRUE(parsed.ok()) << parsed.status().ToString();
    return parsed.ok() ? *parsed : std::vector<Triple>{};
}

bool Contains(const std::vector<Triple>& triples, const Term& s, const std::string& p,
              const Term& o) {
    return std::any_of(triples.begin(), triples.end(), [&](const Triple& t) {
        return t.subject == s && t.predicate.value == p && t.object == o;
    });
}

}  // namespace

TEST(TurtleParserTest, PrefixesAndPropertyLists) {
    auto triples = ParseOk(
        "@prefix ex: <http://example.org/> .\n"
        "PREFIX rdfs: <http://www.w3.org/2000/01/rdf-schema#>\n"
        "ex:Dog a rdfs:Class ;\n"
        "       rdfs:label \"Dog\"@en , \"Hund\"@de .\n");

    ASSERT_EQ(triples.size(), 3u);
    Term dog = Iri("http://example.org/Dog");
    EXPECT_TRUE(Contains(triples, dog, std::string(vocab::kRdfType),
                         Iri(std::string(vocab::kRdfsClass))));
    EXPECT_TRUE(Contains(triples, dog, std::string(vocab::kRdfsLabel), Literal("Dog", "en")));
    EXPECT_TRUE(Contains(triples, dog, std::string(vocab::kRdfsLabel), Literal("Hund", "de")));
}

TEST(TurtleParserTest, NTriplesIsAccepted) {
    auto parsed = ParseRdfText(
        "<urn:x:a> <urn:x:p> <urn:x:b> .\n"
        "<urn:x:a> <urn:x:q> \"v\"^^<http://www.w3.org/2001/XMLSchema#string> .\n",
        RdfFormat::NTriples);
    ASSERT_TRUE(parsed.ok()) << parsed.status().ToString();
    ASSERT_EQ(parsed->size(), 2u);
    EXPECT_EQ((*parsed)[1].object,
              Term(Literal("v", "", "http://www.w3.org/2001/XMLSchema#string")));
}

TEST(TurtleParserTest, NumbersBooleansAndStrings) {
    auto triples = ParseOk(
        "@prefix x: <urn:x:> .\n"
        "x:s x:int 42 ; x:dec 3.14 ; x:dbl 1.5e3 ; x:neg -7 ; x:flag true .\n"
        "x:s x:long \"\"\"line one\nline \"two\" end\"\"\" .\n"
        "x:s x:esc \"tab\\there \\u00e9\" .\n");

    Term s = Iri("urn:x:s");
    EXPECT_TRUE(Contains(triples, s, "urn:x:int", Literal("42", "", std::string(vocab::kXsdInteger))));
    EXPECT_TRUE(Contains(triples, s, "urn:x:dec", Literal("3.14", "", std::string(vocab::kXsdDecimal))));
    EXPECT_TRUE(Contains(triples, s, "urn:x:dbl", Literal("1.5e3", "", std::string(vocab::kXsdDouble))));
    EXPECT_TRUE(Contains(triples, s, "urn:x:neg", Literal("-7", "", std::string(vocab::kXsdInteger))));
    EXPECT_TRUE(Contains(triples, s, "urn:x:flag", Literal("true", "", std::string(vocab::kXsdBoolean))));
    EXPECT_TRUE(Contains(triples, s, "urn:x:long", Literal("line one\nline \"two\" end")));
    EXPECT_TRUE(Contains(triples, s, "urn:x:esc", Literal("tab\there \xC3\xA9")));
}

TEST(TurtleParserTest, BlankNodesAreScopedByPrefix) {
    RdfParserConfig config;
    config.blank_node_prefix = "doc1";
    auto triples = ParseOk(
        "@prefix x: <urn:x:> .\n"
        "_:b1 x:p x:o .\n"
        "x:s x:q [ x:r \"inner\" ] .\n",
        config);

    ASSERT_EQ(triples.size(), 3u);
    EXPECT_EQ(triples[0].subject, Term(BlankNode("doc1_l_b1")));

    const Term& anonymous = triples[1].subject;
    ASSERT_TRUE(IsBlank(anonymous));
    EXPECT_EQ(LexicalForm(anonymous).rfind("doc1_", 0), 0u);
    EXPECT_TRUE(Contains(triples, Iri("urn:x:s"), "urn:x:q", anonymous));
}

TEST(TurtleParserTest, LabeledAndAnonymousBlankNodesStayDistinct) {
    RdfParserConfig config;
    config.blank_node_prefix = "bfoo";
    auto triples = ParseOk(
        "@prefix x: <urn:x:> .\n"
        "_:g0 x:name \"labeled\" .\n"
        "x:a x:q [ x:name \"anon\" ] .\n",
        config);

    ASSERT_EQ(triples.size(), 3u);
    std::set<std::string> named;
    for (const auto& t : triples) {
        if (t.predicate.value == "urn:x:name") {
            named.insert(LexicalForm(t.subject));
        }
    }
    EXPECT_EQ(named.size(), 2u);
    EXPECT_TRUE(Contains(triples, BlankNode("bfoo_l_g0"), "urn:x:name", Literal("labeled")));
    EXPECT_TRUE(Contains(triples, BlankNode("bfoo_g0"), "urn:x:name", Literal("anon")));
}

TEST(TurtleParserTest, CollectionsBecomeFirstRestChains) {
    auto triples = ParseOk("@prefix x: <urn:x:> .\nx:s x:list ( x:a x:b ) .\n");

    // two cells of first/rest plus the link from x:s
    ASSERT_EQ(triples.size(), 5u);
    size_t firsts = std::count_if(triples.begin(), triples.end(), [](const Triple& t) {
        return t.predicate.value == vocab::kRdfFirst;
    });
    EXPECT_EQ(firsts, 2u);
    EXPECT_TRUE(std::any_of(triples.begin(), triples.end(), [](const Triple& t) {
        return t.predicate.value == vocab::kRdfRest &&
               t.object == Term(Iri(std::string(vocab::kRdfNil)));
    }));

    auto empty = ParseOk("@prefix x: <urn:x:> .\nx:s x:list () .\n");
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty[0].object, Term(Iri(std::string(vocab::kRdfNil))));
}

TEST(TurtleParserTest, BaseResolvesRelativeIris) {
    auto triples = ParseOk("@base <http://example.org/onto/> .\n<Dog> <label> \"d\" .\n");
    ASSERT_EQ(triples.size(), 1u);
    EXPECT_EQ(triples[0].subject, Term(Iri("http://example.org/onto/Dog")));
    EXPECT_EQ(triples[0].predicate.value, "http://example.org/onto/label");
}

TEST(TurtleParserTest, ErrorsReportLineNumbers) {
    auto parsed = ParseRdfText("@prefix x: <urn:x:> .\nx:s x:p .\n", RdfFormat::Turtle);
    ASSERT_FALSE(parsed.ok());
    EXPECT_TRUE(parsed.status().IsInvalid());
    EXPECT_NE(parsed.status().message().find("line 2"), std::string::npos);

    EXPECT_FALSE(ParseRdfText("undefined:s <urn:x:p> <urn:x:o> .", RdfFormat::Turtle).ok());
    EXPECT_FALSE(ParseRdfText("\"lit\" <urn:x:p> <urn:x:o> .", RdfFormat::Turtle).ok());
    EXPECT_FALSE(ParseRdfText("<urn:x:s> <urn:x:p> \"open .", RdfFormat::Turtle).ok());
}

TEST(TurtleParserTest, SkipInvalidStatementsKeepsTheRest) {
    RdfParserConfig config;
    config.skip_invalid_triples = true;
    TurtleParser parser(config);

    auto parsed = parser.Parse(
        "<urn:x:a> <urn:x:p> <urn:x:b> .\n"
        "<urn:x:a> <urn:x:p> .\n"
        "<urn:x:c> <urn:x:p> <urn:x:d> .\n");
    ASSERT_TRUE(parsed.ok()) << parsed.status().ToString();
    ASSERT_EQ(parsed->size(), 2u);
    EXPECT_EQ((*parsed)[1].subject, Term(Iri("urn:x:c")));
    EXPECT_EQ(parser.GetTriplesSkipped(), 1u);
    EXPECT_EQ(parser.GetTriplesProcessed(), 2u);
}

TEST(RdfFormatTest, DetectFromFileName) {
    EXPECT_EQ(DetectFormat("animals.ttl"), RdfFormat::Turtle);
    EXPECT_EQ(DetectFormat("animals.SKOS"), RdfFormat::Turtle);
    EXPECT_EQ(DetectFormat("dump.nt"), RdfFormat::NTriples);
    EXPECT_EQ(DetectFormat("schema.rdf"), RdfFormat::RdfXml);
    EXPECT_EQ(DetectFormat("schema.owl"), RdfFormat::RdfXml);
    EXPECT_EQ(DetectFormat("no_extension"), RdfFormat::RdfXml);

    EXPECT_TRUE(IsRdfFileName("a.ttl"));
    EXPECT_TRUE(IsRdfFileName("a.xml"));
    EXPECT_FALSE(IsRdfFileName("README.md"));
}

TEST(RdfFormatTest, DeclaredFormatNames) {
    EXPECT_EQ(ParseFormatName("skos"), RdfFormat::Turtle);
    EXPECT_EQ(ParseFormatName("ttl"), RdfFormat::Turtle);
    EXPECT_EQ(ParseFormatName("rdfs"), RdfFormat::RdfXml);
    EXPECT_EQ(ParseFormatName("xml"), RdfFormat::RdfXml);
    EXPECT_FALSE(ParseFormatName("csv").has_value());

    EXPECT_EQ(FormatLabel(RdfFormat::Turtle), "ttl");
    EXPECT_EQ(FormatLabel(RdfFormat::NTriples), "ttl");
    EXPECT_EQ(FormatLabel(RdfFormat::RdfXml), "rdf");
}
