#pragma once

#include <string_view>

namespace semgraph {
namespace vocab {

// Core vocabulary namespaces
inline constexpr std::string_view kRdfNs = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view kRdfsNs = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr std::string_view kSkosNs = "http://www.w3.org/2004/02/skos/core#";
inline constexpr std::string_view kOwlNs = "http://www.w3.org/2002/07/owl#";
inline constexpr std::string_view kXsdNs = "http://www.w3.org/2001/XMLSchema#";
inline constexpr std::string_view kXmlNs = "http://www.w3.org/XML/1998/namespace";

// RDF
inline constexpr std::string_view kRdfType = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
inline constexpr std::string_view kRdfProperty = "http://www.w3.org/1999/02/22-rdf-syntax-ns#Property";
inline constexpr std::string_view kRdfFirst = "http://www.w3.org/1999/02/22-rdf-syntax-ns#first";
inline constexpr std::string_view kRdfRest = "http://www.w3.org/1999/02/22-rdf-syntax-ns#rest";
inline constexpr std::string_view kRdfNil = "http://www.w3.org/1999/02/22-rdf-syntax-ns#nil";
inline constexpr std::string_view kRdfLangString = "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
inline constexpr std::string_view kRdfXmlLiteral = "http://www.w3.org/1999/02/22-rdf-syntax-ns#XMLLiteral";

// RDFS
inline constexpr std::string_view kRdfsClass = "http://www.w3.org/2000/01/rdf-schema#Class";
inline constexpr std::string_view kRdfsSubClassOf = "http://www.w3.org/2000/01/rdf-schema#subClassOf";
inline constexpr std::string_view kRdfsLabel = "http://www.w3.org/2000/01/rdf-schema#label";
inline constexpr std::string_view kRdfsComment = "http://www.w3.org/2000/01/rdf-schema#comment";
inline constexpr std::string_view kRdfsSeeAlso = "http://www.w3.org/2000/01/rdf-schema#seeAlso";

// SKOS
inline constexpr std::string_view kSkosConcept = "http://www.w3.org/2004/02/skos/core#Concept";
inline constexpr std::string_view kSkosConceptScheme = "http://www.w3.org/2004/02/skos/core#ConceptScheme";
inline constexpr std::string_view kSkosBroader = "http://www.w3.org/2004/02/skos/core#broader";
inline constexpr std::string_view kSkosPrefLabel = "http://www.w3.org/2004/02/skos/core#prefLabel";
inline constexpr std::string_view kSkosAltLabel = "http://www.w3.org/2004/02/skos/core#altLabel";
inline constexpr std::string_view kSkosDefinition = "http://www.w3.org/2004/02/skos/core#definition";

// OWL
inline constexpr std::string_view kOwlClass = "http://www.w3.org/2002/07/owl#Class";

// XSD
inline constexpr std::string_view kXsdString = "http://www.w3.org/2001/XMLSchema#string";
inline constexpr std::string_view kXsdInteger = "http://www.w3.org/2001/XMLSchema#integer";
inline constexpr std::string_view kXsdDecimal = "http://www.w3.org/2001/XMLSchema#decimal";
inline constexpr std::string_view kXsdDouble = "http://www.w3.org/2001/XMLSchema#double";
inline constexpr std::string_view kXsdBoolean = "http://www.w3.org/2001/XMLSchema#boolean";

// True for IRIs inside the RDF, RDFS, SKOS or OWL namespaces
bool IsReservedNamespace(std::string_view iri);

// True for numeric XSD datatype IRIs
bool IsNumericDatatype(std::string_view datatype);

} // namespace vocab
} // namespace semgraph
