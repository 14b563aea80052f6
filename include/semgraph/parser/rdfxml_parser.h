#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>
#include <semgraph/parser/rdf_parser.h>

namespace tinyxml2 {
class XMLElement;
}

namespace semgraph {

// RDF/XML parser on top of the tinyxml2 DOM.
//
// tinyxml2 does not process namespaces, so xmlns declarations are tracked here in a
// scope stack together with xml:lang and xml:base. Supported: rdf:RDF root (or a
// bare node element), rdf:Description and typed node elements, rdf:about / rdf:ID /
// rdf:nodeID, property attributes, rdf:resource, rdf:datatype, xml:lang, nested node
// elements, rdf:parseType Resource / Literal / Collection, rdf:li.
class RdfXmlParser : public RdfParser {
public:
    explicit RdfXmlParser(const RdfParserConfig& config);

    arrow::Result<std::vector<Triple>> Parse(std::string_view text) override;

    size_t GetTriplesProcessed() const override { return triples_processed_; }
    size_t GetTriplesSkipped() const override { return triples_skipped_; }

private:
    struct Scope {
        std::map<std::string, std::string> namespaces;
        std::string language;
        std::string base;
    };

    arrow::Result<Term> ParseNodeElement(const tinyxml2::XMLElement* element, Scope scope);
    arrow::Status ParsePropertyElement(const tinyxml2::XMLElement* element,
                                       const Term& subject, Scope scope, int& li_counter);
    arrow::Result<Term> ParseCollectionItems(const tinyxml2::XMLElement* element,
                                             const Scope& scope);

    // Push xmlns, xml:lang and xml:base declarations of element into scope
    void EnterElement(const tinyxml2::XMLElement* element, Scope& scope) const;

    arrow::Result<std::string> ResolveQName(std::string_view qname, const Scope& scope,
                                            bool is_attribute) const;
    std::string ResolveReference(const std::string& ref, const Scope& scope) const;

    arrow::Status Emit(Term subject, std::string predicate, Term object);
    BlankNode NewBlankNode();
    BlankNode NamedBlankNode(const std::string& node_id) const;

    RdfParserConfig config_;
    std::vector<Triple> triples_;
    size_t triples_processed_ = 0;
    size_t triples_skipped_ = 0;
    size_t blank_node_counter_ = 0;
};

} // namespace semgraph
