#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <arrow/result.h>
#include <semgraph/types/term.h>

namespace semgraph {

// RDF serialization formats.
// Turtle is the SKOS profile; RdfXml is the RDFS/XML profile.
enum class RdfFormat {
    NTriples,   // N-Triples (.nt), parsed by the Turtle parser
    Turtle,     // Turtle (.ttl, .skos)
    RdfXml      // RDF/XML (.rdf, .xml, .owl and default)
};

constexpr std::string_view toString(RdfFormat format) {
    switch (format) {
        case RdfFormat::NTriples: return "ntriples";
        case RdfFormat::Turtle: return "turtle";
        case RdfFormat::RdfXml: return "rdfxml";
    }
    return "unknown";
}

// Short format label reported on taxonomies: "ttl" or "rdf"
constexpr std::string_view FormatLabel(RdfFormat format) {
    return format == RdfFormat::RdfXml ? "rdf" : "ttl";
}

struct RdfParserConfig {
    // Skip malformed statements instead of failing the whole document
    bool skip_invalid_triples = false;

    // Base IRI for relative references (empty: relative IRIs are kept verbatim)
    std::string base_iri;

    // Scope for every blank node of the document; must not contain '_'
    std::string blank_node_prefix = "genid";
};

// Base class for RDF parsers. Parsers work on already-read text and never do I/O.
class RdfParser {
public:
    virtual ~RdfParser() = default;

    static arrow::Result<std::unique_ptr<RdfParser>> Create(
        RdfFormat format,
        const RdfParserConfig& config = {});

    // Parse a whole document. Fails with Status::Invalid on the first malformed
    // statement unless skip_invalid_triples is set.
    virtual arrow::Result<std::vector<Triple>> Parse(std::string_view text) = 0;

    virtual size_t GetTriplesProcessed() const = 0;
    virtual size_t GetTriplesSkipped() const = 0;
};

// Detect RDF format from file extension (defaults to RDF/XML when ambiguous)
RdfFormat DetectFormat(std::string_view filename);

// Map a declared format name ("skos", "ttl", "rdfs", "xml", ...) to a format
std::optional<RdfFormat> ParseFormatName(std::string_view name);

// True for extensions the loaders accept (.ttl .skos .nt .rdf .xml .owl)
bool IsRdfFileName(std::string_view filename);

// Blank nodes of one document. Labeled nodes (_:x, rdf:nodeID) become
// "<prefix>_l_<label>" and parser-generated nodes ([], collections, nested RDF/XML
// nodes) become "<prefix>_g<n>", so the two never collide.
BlankNode LabeledBlankNode(const RdfParserConfig& config, std::string_view label);
BlankNode GeneratedBlankNode(const RdfParserConfig& config, size_t counter);

// Convenience: create a parser and parse text in one call
arrow::Result<std::vector<Triple>> ParseRdfText(
    std::string_view text,
    RdfFormat format,
    const RdfParserConfig& config = {});

} // namespace semgraph
