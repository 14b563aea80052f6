#include <semgraph/parser/rdf_parser.h>
#include <semgraph/parser/rdfxml_parser.h>
#include <semgraph/parser/turtle_parser.h>
#include <semgraph/util/string_util.h>

namespace semgraph {

arrow::Result<std::unique_ptr<RdfParser>> RdfParser::Create(
    RdfFormat format,
    const RdfParserConfig& config) {

    switch (format) {
        case RdfFormat::NTriples:
        case RdfFormat::Turtle:
            return std::unique_ptr<RdfParser>(new TurtleParser(config));
        case RdfFormat::RdfXml:
            return std::unique_ptr<RdfParser>(new RdfXmlParser(config));
    }
    return arrow::Status::Invalid("Unknown RDF format");
}

RdfFormat DetectFormat(std::string_view filename) {
    std::string lower = ToLower(filename);
    if (EndsWith(lower, ".ttl") || EndsWith(lower, ".skos")) {
        return RdfFormat::Turtle;
    }
    if (EndsWith(lower, ".nt")) {
        return RdfFormat::NTriples;
    }
    return RdfFormat::RdfXml;
}

std::optional<RdfFormat> ParseFormatName(std::string_view name) {
    std::string lower = ToLower(Trim(name));
    if (lower == "skos" || lower == "ttl" || lower == "turtle") {
        return RdfFormat::Turtle;
    }
    if (lower == "nt" || lower == "ntriples" || lower == "n-triples") {
        return RdfFormat::NTriples;
    }
    if (lower == "rdfs" || lower == "rdf" || lower == "xml" || lower == "owl" ||
        lower == "rdfxml" || lower == "rdf/xml") {
        return RdfFormat::RdfXml;
    }
    return std::nullopt;
}

bool IsRdfFileName(std::string_view filename) {
    std::string lower = ToLower(filename);
    for (const char* ext : {".ttl", ".skos", ".nt", ".rdf", ".xml", ".owl"}) {
        if (EndsWith(lower, ext)) {
            return true;
        }
    }
    return false;
}

BlankNode LabeledBlankNode(const RdfParserConfig& config, std::string_view label) {
    return BlankNode(config.blank_node_prefix + "_l_" + std::string(label));
}

BlankNode GeneratedBlankNode(const RdfParserConfig& config, size_t counter) {
    return BlankNode(config.blank_node_prefix + "_g" + std::to_string(counter));
}

arrow::Result<std::vector<Triple>> ParseRdfText(
    std::string_view text,
    RdfFormat format,
    const RdfParserConfig& config) {

    ARROW_ASSIGN_OR_RAISE(auto parser, RdfParser::Create(format, config));
    return parser->Parse(text);
}

} // namespace semgraph
