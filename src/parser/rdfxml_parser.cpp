#include <semgraph/parser/rdfxml_parser.h>
#include <semgraph/ontology/vocab.h>
#include <semgraph/util/string_util.h>
#include <tinyxml2.h>
#include <sstream>

namespace semgraph {

namespace {

constexpr std::string_view kRdfRdf = "http://www.w3.org/1999/02/22-rdf-syntax-ns#RDF";
constexpr std::string_view kRdfDescription = "http://www.w3.org/1999/02/22-rdf-syntax-ns#Description";
constexpr std::string_view kRdfAbout = "http://www.w3.org/1999/02/22-rdf-syntax-ns#about";
constexpr std::string_view kRdfId = "http://www.w3.org/1999/02/22-rdf-syntax-ns#ID";
constexpr std::string_view kRdfNodeId = "http://www.w3.org/1999/02/22-rdf-syntax-ns#nodeID";
constexpr std::string_view kRdfResource = "http://www.w3.org/1999/02/22-rdf-syntax-ns#resource";
constexpr std::string_view kRdfDatatype = "http://www.w3.org/1999/02/22-rdf-syntax-ns#datatype";
constexpr std::string_view kRdfParseType = "http://www.w3.org/1999/02/22-rdf-syntax-ns#parseType";
constexpr std::string_view kRdfLi = "http://www.w3.org/1999/02/22-rdf-syntax-ns#li";
constexpr std::string_view kRdfBagId = "http://www.w3.org/1999/02/22-rdf-syntax-ns#bagID";
constexpr std::string_view kRdfAboutEach = "http://www.w3.org/1999/02/22-rdf-syntax-ns#aboutEach";

bool IsNamespaceDeclaration(std::string_view name) {
    return name == "xmlns" || StartsWith(name, "xmlns:");
}

bool IsSyntaxAttribute(std::string_view iri) {
    return iri == kRdfAbout || iri == kRdfId || iri == kRdfNodeId || iri == kRdfResource ||
           iri == kRdfDatatype || iri == kRdfParseType || iri == kRdfBagId ||
           iri == kRdfAboutEach;
}

// Value of the attribute whose expanded name is rdf_iri, whatever prefix it uses
const char* FindRdfAttribute(const tinyxml2::XMLElement* element,
                             const std::map<std::string, std::string>& namespaces,
                             std::string_view rdf_iri) {
    for (const auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        std::string_view name = attr->Name();
        size_t colon = name.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        auto it = namespaces.find(std::string(name.substr(0, colon)));
        if (it == namespaces.end()) {
            continue;
        }
        std::string_view local = name.substr(colon + 1);
        if (rdf_iri.size() == it->second.size() + local.size() &&
            StartsWith(rdf_iri, it->second) && EndsWith(rdf_iri, local)) {
            return attr->Value();
        }
    }
    return nullptr;
}

// Concatenated character data of the direct text children
std::string CollectText(const tinyxml2::XMLElement* element) {
    std::string text;
    for (const auto* node = element->FirstChild(); node != nullptr; node = node->NextSibling()) {
        if (const auto* t = node->ToText()) {
            text += t->Value();
        }
    }
    return text;
}

bool HasChildElements(const tinyxml2::XMLElement* element) {
    return element->FirstChildElement() != nullptr;
}

} // namespace

RdfXmlParser::RdfXmlParser(const RdfParserConfig& config) : config_(config) {}

arrow::Result<std::vector<Triple>> RdfXmlParser::Parse(std::string_view text) {
    triples_.clear();
    triples_processed_ = 0;
    triples_skipped_ = 0;
    blank_node_counter_ = 0;

    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError err = doc.Parse(text.data(), text.size());
    if (err != tinyxml2::XML_SUCCESS) {
        std::ostringstream oss;
        oss << "RDF/XML parse error at line " << doc.ErrorLineNum() << ": " << doc.ErrorStr();
        return arrow::Status::Invalid(oss.str());
    }

    const tinyxml2::XMLElement* root = doc.RootElement();
    if (root == nullptr) {
        return arrow::Status::Invalid("RDF/XML document has no root element");
    }

    Scope scope;
    scope.base = config_.base_iri;
    EnterElement(root, scope);

    ARROW_ASSIGN_OR_RAISE(auto root_name, ResolveQName(root->Name(), scope, false));
    if (root_name != kRdfRdf) {
        // A single node element without an rdf:RDF wrapper
        Scope root_scope;
        root_scope.base = config_.base_iri;
        ARROW_RETURN_NOT_OK(ParseNodeElement(root, root_scope).status());
        return std::move(triples_);
    }

    for (const auto* child = root->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        size_t emitted_before = triples_.size();
        auto result = ParseNodeElement(child, scope);
        if (!result.ok()) {
            if (!config_.skip_invalid_triples) {
                return result.status();
            }
            triples_skipped_ += 1;
            triples_processed_ -= triples_.size() - emitted_before;
            triples_.resize(emitted_before);
        }
    }

    return std::move(triples_);
}

void RdfXmlParser::EnterElement(const tinyxml2::XMLElement* element, Scope& scope) const {
    for (const auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        std::string_view name = attr->Name();
        if (name == "xmlns") {
            scope.namespaces[""] = attr->Value();
        } else if (StartsWith(name, "xmlns:")) {
            scope.namespaces[std::string(name.substr(6))] = attr->Value();
        } else if (name == "xml:lang") {
            scope.language = attr->Value();
        } else if (name == "xml:base") {
            scope.base = ResolveReference(attr->Value(), scope);
        }
    }
}

arrow::Result<std::string> RdfXmlParser::ResolveQName(std::string_view qname,
                                                      const Scope& scope,
                                                      bool is_attribute) const {
    size_t colon = qname.find(':');
    std::string prefix = colon == std::string_view::npos ? "" : std::string(qname.substr(0, colon));
    std::string_view local = colon == std::string_view::npos ? qname : qname.substr(colon + 1);

    if (colon == std::string_view::npos && is_attribute) {
        return arrow::Status::Invalid("Unqualified attribute '", std::string(qname), "'");
    }

    auto it = scope.namespaces.find(prefix);
    if (it == scope.namespaces.end()) {
        return arrow::Status::Invalid("Undeclared namespace prefix '", prefix,
                                      "' in '", std::string(qname), "'");
    }
    return it->second + std::string(local);
}

std::string RdfXmlParser::ResolveReference(const std::string& ref, const Scope& scope) const {
    if (scope.base.empty() || ref.find(':') != std::string::npos) {
        return ref;
    }
    if (ref.empty()) {
        size_t hash = scope.base.find('#');
        return scope.base.substr(0, hash);
    }
    if (ref[0] == '#') {
        size_t hash = scope.base.find('#');
        return scope.base.substr(0, hash) + ref;
    }
    size_t slash = scope.base.rfind('/');
    if (slash != std::string::npos) {
        return scope.base.substr(0, slash + 1) + ref;
    }
    return scope.base + "/" + ref;
}

arrow::Result<Term> RdfXmlParser::ParseNodeElement(const tinyxml2::XMLElement* element,
                                                   Scope scope) {
    EnterElement(element, scope);

    // Subject
    Term subject;
    if (const char* about = FindRdfAttribute(element, scope.namespaces, kRdfAbout)) {
        subject = Iri(ResolveReference(about, scope));
    } else if (const char* id = FindRdfAttribute(element, scope.namespaces, kRdfId)) {
        subject = Iri(ResolveReference(std::string("#") + id, scope));
    } else if (const char* node_id = FindRdfAttribute(element, scope.namespaces, kRdfNodeId)) {
        subject = NamedBlankNode(node_id);
    } else {
        subject = NewBlankNode();
    }

    // Typed node element
    ARROW_ASSIGN_OR_RAISE(auto type_iri, ResolveQName(element->Name(), scope, false));
    if (type_iri != kRdfDescription) {
        ARROW_RETURN_NOT_OK(Emit(subject, std::string(vocab::kRdfType), Term(Iri(type_iri))));
    }

    // Property attributes
    for (const auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        std::string_view name = attr->Name();
        if (IsNamespaceDeclaration(name) || StartsWith(name, "xml:") ||
            name.find(':') == std::string_view::npos) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto predicate, ResolveQName(name, scope, true));
        if (IsSyntaxAttribute(predicate)) {
            continue;
        }
        if (predicate == vocab::kRdfType) {
            ARROW_RETURN_NOT_OK(Emit(subject, predicate,
                                     Term(Iri(ResolveReference(attr->Value(), scope)))));
        } else {
            ARROW_RETURN_NOT_OK(Emit(subject, predicate,
                                     Term(Literal(attr->Value(), scope.language, ""))));
        }
    }

    // Property elements
    int li_counter = 1;
    for (const auto* child = element->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        ARROW_RETURN_NOT_OK(ParsePropertyElement(child, subject, scope, li_counter));
    }

    return subject;
}

arrow::Status RdfXmlParser::ParsePropertyElement(const tinyxml2::XMLElement* element,
                                                 const Term& subject, Scope scope,
                                                 int& li_counter) {
    EnterElement(element, scope);

    ARROW_ASSIGN_OR_RAISE(auto predicate, ResolveQName(element->Name(), scope, false));
    if (predicate == kRdfLi) {
        predicate = std::string(vocab::kRdfNs) + "_" + std::to_string(li_counter++);
    }

    const char* parse_type = FindRdfAttribute(element, scope.namespaces, kRdfParseType);
    if (parse_type != nullptr) {
        std::string_view type = parse_type;
        if (type == "Resource") {
            BlankNode object = NewBlankNode();
            ARROW_RETURN_NOT_OK(Emit(subject, predicate, Term(object)));
            int nested_li = 1;
            for (const auto* child = element->FirstChildElement(); child != nullptr;
                 child = child->NextSiblingElement()) {
                ARROW_RETURN_NOT_OK(ParsePropertyElement(child, Term(object), scope, nested_li));
            }
            return arrow::Status::OK();
        }
        if (type == "Collection") {
            ARROW_ASSIGN_OR_RAISE(auto head, ParseCollectionItems(element, scope));
            return Emit(subject, predicate, std::move(head));
        }
        // parseType="Literal" and unknown parse types keep the raw XML content
        std::string xml;
        for (const auto* node = element->FirstChild(); node != nullptr; node = node->NextSibling()) {
            tinyxml2::XMLPrinter printer(nullptr, true);
            node->Accept(&printer);
            xml += printer.CStr();
        }
        return Emit(subject, predicate,
                    Term(Literal(xml, "", std::string(vocab::kRdfXmlLiteral))));
    }

    if (const char* resource = FindRdfAttribute(element, scope.namespaces, kRdfResource)) {
        return Emit(subject, predicate, Term(Iri(ResolveReference(resource, scope))));
    }
    if (const char* node_id = FindRdfAttribute(element, scope.namespaces, kRdfNodeId)) {
        return Emit(subject, predicate, Term(NamedBlankNode(node_id)));
    }

    if (HasChildElements(element)) {
        const auto* node = element->FirstChildElement();
        if (node->NextSiblingElement() != nullptr) {
            return arrow::Status::Invalid("Property element <", element->Name(),
                                          "> has more than one node element");
        }
        ARROW_ASSIGN_OR_RAISE(auto object, ParseNodeElement(node, scope));
        return Emit(subject, predicate, std::move(object));
    }

    // Empty property element with property attributes describes a blank node
    std::vector<std::pair<std::string, std::string>> property_attrs;
    for (const auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        std::string_view name = attr->Name();
        if (IsNamespaceDeclaration(name) || StartsWith(name, "xml:") ||
            name.find(':') == std::string_view::npos) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto attr_iri, ResolveQName(name, scope, true));
        if (!IsSyntaxAttribute(attr_iri)) {
            property_attrs.emplace_back(std::move(attr_iri), attr->Value());
        }
    }
    if (!property_attrs.empty()) {
        BlankNode object = NewBlankNode();
        ARROW_RETURN_NOT_OK(Emit(subject, predicate, Term(object)));
        for (auto& [attr_predicate, value] : property_attrs) {
            ARROW_RETURN_NOT_OK(Emit(Term(object), attr_predicate,
                                     Term(Literal(value, scope.language, ""))));
        }
        return arrow::Status::OK();
    }

    std::string text = CollectText(element);
    if (const char* datatype = FindRdfAttribute(element, scope.namespaces, kRdfDatatype)) {
        return Emit(subject, predicate,
                    Term(Literal(text, "", ResolveReference(datatype, scope))));
    }
    return Emit(subject, predicate, Term(Literal(text, scope.language, "")));
}

arrow::Result<Term> RdfXmlParser::ParseCollectionItems(const tinyxml2::XMLElement* element,
                                                       const Scope& scope) {
    std::vector<Term> items;
    for (const auto* child = element->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        ARROW_ASSIGN_OR_RAISE(auto item, ParseNodeElement(child, scope));
        items.push_back(std::move(item));
    }
    if (items.empty()) {
        return Term(Iri(std::string(vocab::kRdfNil)));
    }

    std::vector<BlankNode> cells;
    for (size_t i = 0; i < items.size(); ++i) {
        cells.push_back(NewBlankNode());
    }
    for (size_t i = 0; i < items.size(); ++i) {
        ARROW_RETURN_NOT_OK(Emit(Term(cells[i]), std::string(vocab::kRdfFirst), items[i]));
        Term next = i + 1 < items.size() ? Term(cells[i + 1])
                                         : Term(Iri(std::string(vocab::kRdfNil)));
        ARROW_RETURN_NOT_OK(Emit(Term(cells[i]), std::string(vocab::kRdfRest), std::move(next)));
    }
    return Term(cells.front());
}

arrow::Status RdfXmlParser::Emit(Term subject, std::string predicate, Term object) {
    ARROW_ASSIGN_OR_RAISE(auto triple,
                          Triple::Make(std::move(subject), Term(Iri(std::move(predicate))),
                                       std::move(object)));
    triples_.push_back(std::move(triple));
    triples_processed_++;
    return arrow::Status::OK();
}

BlankNode RdfXmlParser::NewBlankNode() {
    return GeneratedBlankNode(config_, blank_node_counter_++);
}

BlankNode RdfXmlParser::NamedBlankNode(const std::string& node_id) const {
    return LabeledBlankNode(config_, node_id);
}

} // namespace semgraph
