#include <semgraph/ontology/vocab.h>
#include <semgraph/util/string_util.h>

namespace semgraph {
namespace vocab {

bool IsReservedNamespace(std::string_view iri) {
    return StartsWith(iri, kRdfNs) || StartsWith(iri, kRdfsNs) ||
           StartsWith(iri, kSkosNs) || StartsWith(iri, kOwlNs);
}

bool IsNumericDatatype(std::string_view datatype) {
    if (!StartsWith(datatype, kXsdNs)) {
        return false;
    }
    std::string_view local = datatype.substr(kXsdNs.size());
    for (std::string_view name : {"integer", "decimal", "double", "float", "int", "long",
                                  "short", "byte", "nonNegativeInteger", "positiveInteger",
                                  "negativeInteger", "nonPositiveInteger", "unsignedInt",
                                  "unsignedLong", "unsignedShort", "unsignedByte"}) {
        if (local == name) {
            return true;
        }
    }
    return false;
}

} // namespace vocab
} // namespace semgraph
