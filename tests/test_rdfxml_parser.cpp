/**
 * RDF/XML Parser Tests
 *
 * Covers:
 * - rdf:Description and typed node elements
 * - rdf:about, rdf:ID with xml:base, rdf:nodeID
 * - Property attributes, rdf:resource, rdf:datatype, xml:lang inheritance
 * - Nested node elements and rdf:parseType Resource / Collection / Literal
 * - Malformed documents and undeclared prefixes
 */

#include <semgraph/ontology/vocab.h>
#include <semgraph/parser/rdf_parser.h>
#include <gtest/gtest.h>
#include <algorithm>

using namespace semgraph;

namespace {

const char* kHeader =
    "<?xml version=\"1.0\"?>\n"
    "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\"\n"
    "         xmlns:rdfs=\"http://www.w3.org/2000/01/rdf-schema#\"\n"
    "         xmlns:owl=\"http://www.w3.org/2002/07/owl#\"\n"
    "         xmlns:ex=\"http://example.org/\">\n";

std::vector<Triple> ParseXml(const std::string& body, RdfParserConfig config = {}) {
    auto parsed = ParseRdfText(std::string(kHeader) + body + "</rdf:RDF>\n",
                               RdfFormat::RdfXml, config);
    EXPECT_TRUE(parsed.ok()) << parsed.status().ToString();
    return parsed.ok() ? *parsed : std::vector<Triple>{};
}

bool Contains(const std::vector<Triple>& triples, const Term& s, std::string_view p,
              const Term& o) {
    return std::any_of(triples.begin(), triples.end(), [&](const Triple& t) {
        return t.subject == s && t.predicate.value == p && t.object == o;
    });
}

Term IriTerm(std::string_view iri) { return Term(Iri(std::string(iri))); }

}  // namespace

TEST(RdfXmlParserTest, TypedNodeElementsAndResources) {
    auto triples = ParseXml(
        "  <owl:Class rdf:about=\"http://example.org/Dog\">\n"
        "    <rdfs:label xml:lang=\"en\">Dog</rdfs:label>\n"
        "    <rdfs:subClassOf rdf:resource=\"http://example.org/Mammal\"/>\n"
        "  </owl:Class>\n");

    Term dog = Iri("http://example.org/Dog");
    ASSERT_EQ(triples.size(), 3u);
    EXPECT_TRUE(Contains(triples, dog, vocab::kRdfType, IriTerm(vocab::kOwlClass)));
    EXPECT_TRUE(Contains(triples, dog, vocab::kRdfsLabel, Literal("Dog", "en")));
    EXPECT_TRUE(Contains(triples, dog, vocab::kRdfsSubClassOf,
                         Iri("http://example.org/Mammal")));
}

TEST(RdfXmlParserTest, DescriptionWithPropertyAttributes) {
    auto triples = ParseXml(
        "  <rdf:Description rdf:about=\"http://example.org/rex\" ex:name=\"Rex\"\n"
        "                   rdf:type=\"http://example.org/Dog\">\n"
        "    <ex:age rdf:datatype=\"http://www.w3.org/2001/XMLSchema#integer\">7</ex:age>\n"
        "  </rdf:Description>\n");

    Term rex = Iri("http://example.org/rex");
    ASSERT_EQ(triples.size(), 3u);
    EXPECT_TRUE(Contains(triples, rex, "http://example.org/name", Literal("Rex")));
    EXPECT_TRUE(Contains(triples, rex, vocab::kRdfType, Iri("http://example.org/Dog")));
    EXPECT_TRUE(Contains(triples, rex, "http://example.org/age",
                         Literal("7", "", std::string(vocab::kXsdInteger))));
}

TEST(RdfXmlParserTest, LanguageIsInherited) {
    auto triples = ParseXml(
        "  <rdf:Description rdf:about=\"http://example.org/a\" xml:lang=\"de\">\n"
        "    <rdfs:label>Hund</rdfs:label>\n"
        "    <rdfs:comment xml:lang=\"en\">Dog</rdfs:comment>\n"
        "  </rdf:Description>\n");

    Term a = Iri("http://example.org/a");
    EXPECT_TRUE(Contains(triples, a, vocab::kRdfsLabel, Literal("Hund", "de")));
    EXPECT_TRUE(Contains(triples, a, vocab::kRdfsComment, Literal("Dog", "en")));
}

TEST(RdfXmlParserTest, IdResolvesAgainstBase) {
    auto triples = ParseXml(
        "  <rdf:Description xml:base=\"http://example.org/onto\" rdf:ID=\"Cat\">\n"
        "    <rdfs:label>Cat</rdfs:label>\n"
        "  </rdf:Description>\n");
    ASSERT_EQ(triples.size(), 1u);
    EXPECT_EQ(triples[0].subject, Term(Iri("http://example.org/onto#Cat")));
}

TEST(RdfXmlParserTest, NestedNodesAndBlankNodes) {
    RdfParserConfig config;
    config.blank_node_prefix = "doc";
    auto triples = ParseXml(
        "  <rdf:Description rdf:about=\"http://example.org/rex\">\n"
        "    <ex:owner>\n"
        "      <ex:Person rdf:about=\"http://example.org/alice\"/>\n"
        "    </ex:owner>\n"
        "    <ex:vet rdf:nodeID=\"v1\"/>\n"
        "    <ex:address rdf:parseType=\"Resource\">\n"
        "      <ex:city>Oslo</ex:city>\n"
        "    </ex:address>\n"
        "  </rdf:Description>\n"
        "  <rdf:Description rdf:nodeID=\"v1\" ex:name=\"Dr. Vet\"/>\n",
        config);

    Term rex = Iri("http://example.org/rex");
    Term alice = Iri("http://example.org/alice");
    EXPECT_TRUE(Contains(triples, alice, vocab::kRdfType, Iri("http://example.org/Person")));
    EXPECT_TRUE(Contains(triples, rex, "http://example.org/owner", alice));

    Term vet = BlankNode("doc_l_v1");
    EXPECT_TRUE(Contains(triples, rex, "http://example.org/vet", vet));
    EXPECT_TRUE(Contains(triples, vet, "http://example.org/name", Literal("Dr. Vet")));

    auto address = std::find_if(triples.begin(), triples.end(), [](const Triple& t) {
        return t.predicate.value == "http://example.org/address";
    });
    ASSERT_NE(address, triples.end());
    ASSERT_TRUE(IsBlank(address->object));
    EXPECT_TRUE(Contains(triples, address->object, "http://example.org/city", Literal("Oslo")));
}

TEST(RdfXmlParserTest, NodeIdsNeverMatchGeneratedNodes) {
    RdfParserConfig config;
    config.blank_node_prefix = "bfoo";
    auto triples = ParseXml(
        "  <rdf:Description rdf:nodeID=\"g0\" ex:name=\"labeled\"/>\n"
        "  <rdf:Description rdf:about=\"http://example.org/a\">\n"
        "    <ex:q rdf:parseType=\"Resource\">\n"
        "      <ex:name>anon</ex:name>\n"
        "    </ex:q>\n"
        "  </rdf:Description>\n",
        config);

    Term labeled = BlankNode("bfoo_l_g0");
    EXPECT_TRUE(Contains(triples, labeled, "http://example.org/name", Literal("labeled")));

    auto anon = std::find_if(triples.begin(), triples.end(), [](const Triple& t) {
        return t.predicate.value == "http://example.org/q";
    });
    ASSERT_NE(anon, triples.end());
    EXPECT_NE(anon->object, labeled);
    EXPECT_TRUE(Contains(triples, anon->object, "http://example.org/name", Literal("anon")));
    EXPECT_FALSE(Contains(triples, labeled, "http://example.org/name", Literal("anon")));
}

TEST(RdfXmlParserTest, CollectionsAndXmlLiterals) {
    auto triples = ParseXml(
        "  <rdf:Description rdf:about=\"http://example.org/list\">\n"
        "    <ex:members rdf:parseType=\"Collection\">\n"
        "      <rdf:Description rdf:about=\"http://example.org/a\"/>\n"
        "      <rdf:Description rdf:about=\"http://example.org/b\"/>\n"
        "    </ex:members>\n"
        "    <ex:note rdf:parseType=\"Literal\"><b>bold</b></ex:note>\n"
        "  </rdf:Description>\n");

    size_t firsts = std::count_if(triples.begin(), triples.end(), [](const Triple& t) {
        return t.predicate.value == vocab::kRdfFirst;
    });
    EXPECT_EQ(firsts, 2u);
    EXPECT_TRUE(std::any_of(triples.begin(), triples.end(), [](const Triple& t) {
        return t.predicate.value == vocab::kRdfRest && t.object == IriTerm(vocab::kRdfNil);
    }));

    auto note = std::find_if(triples.begin(), triples.end(), [](const Triple& t) {
        return t.predicate.value == "http://example.org/note";
    });
    ASSERT_NE(note, triples.end());
    const auto* literal = std::get_if<Literal>(&note->object);
    ASSERT_NE(literal, nullptr);
    EXPECT_EQ(literal->datatype, vocab::kRdfXmlLiteral);
    EXPECT_NE(literal->value.find("bold"), std::string::npos);
}

TEST(RdfXmlParserTest, BareNodeElementWithoutRdfWrapper) {
    auto parsed = ParseRdfText(
        "<owl:Class xmlns:owl=\"http://www.w3.org/2002/07/owl#\"\n"
        "           xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\"\n"
        "           rdf:about=\"http://example.org/Solo\"/>",
        RdfFormat::RdfXml);
    ASSERT_TRUE(parsed.ok()) << parsed.status().ToString();
    ASSERT_EQ(parsed->size(), 1u);
    EXPECT_EQ((*parsed)[0].object, IriTerm(vocab::kOwlClass));
}

TEST(RdfXmlParserTest, MalformedDocumentsAreInvalid) {
    auto broken = ParseRdfText(std::string(kHeader) + "<rdf:Description>", RdfFormat::RdfXml);
    ASSERT_FALSE(broken.ok());
    EXPECT_TRUE(broken.status().IsInvalid());

    auto undeclared = ParseRdfText(
        std::string(kHeader) + "<nope:Thing rdf:about=\"http://example.org/x\"/></rdf:RDF>",
        RdfFormat::RdfXml);
    EXPECT_TRUE(undeclared.status().IsInvalid());

    EXPECT_TRUE(ParseRdfText("", RdfFormat::RdfXml).status().IsInvalid());
}
