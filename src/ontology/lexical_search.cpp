#include <semgraph/ontology/lexical_search.h>
#include <semgraph/util/string_util.h>
#include <unordered_set>

namespace semgraph {
namespace ontology {

std::vector<LexicalMatch> PrefixSearch(const GraphStore& store, const std::string& substring,
                                       size_t limit) {
    std::vector<LexicalMatch> matches;
    if (limit == 0) {
        return matches;
    }

    std::unordered_set<uint64_t> seen;
    auto consider = [&](ValueId id) {
        if (!seen.insert(id.getBits()).second) {
            return;
        }
        const Term* term = store.TermOf(id);
        if (term == nullptr || !IsIri(*term)) {
            return;
        }
        const std::string& value = LexicalForm(*term);
        if (!ContainsIgnoreCase(value, substring)) {
            return;
        }
        LexicalMatch match;
        match.value = value;
        match.type = store.IsPredicate(id) ? LexicalMatchType::Property
                                           : LexicalMatchType::Resource;
        matches.push_back(std::move(match));
    };

    for (const auto& [key, context] : store.contexts()) {
        for (const IdTriple& t : context.triples) {
            consider(t.subject);
            if (matches.size() >= limit) {
                return matches;
            }
            consider(t.predicate);
            if (matches.size() >= limit) {
                return matches;
            }
        }
    }
    return matches;
}

} // namespace ontology
} // namespace semgraph
