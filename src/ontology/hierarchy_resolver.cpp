#include <semgraph/ontology/hierarchy_resolver.h>
#include <algorithm>
#include <unordered_set>

namespace semgraph {
namespace ontology {

HierarchyResolver::HierarchyResolver(std::vector<Concept> concepts)
    : concepts_(std::move(concepts)) {
    for (size_t i = 0; i < concepts_.size(); ++i) {
        // First occurrence wins for repeated IRIs
        index_.emplace(concepts_[i].iri, i);
    }
}

const Concept* HierarchyResolver::Find(const std::string& iri) const {
    auto it = index_.find(iri);
    return it == index_.end() ? nullptr : &concepts_[it->second];
}

std::vector<Concept> HierarchyResolver::Closure(const std::string& iri, Edge edge) const {
    std::vector<Concept> result;
    const Concept* start = Find(iri);
    if (start == nullptr) {
        return result;
    }

    std::unordered_set<std::string> visited{iri};
    std::vector<const Concept*> stack{start};

    // Preorder walk; reverse push keeps siblings in list order
    while (!stack.empty()) {
        const Concept* node = stack.back();
        stack.pop_back();
        if (node != start) {
            result.push_back(*node);
        }

        const auto& next = edge == Edge::Parent ? node->parent_concepts : node->child_concepts;
        for (auto it = next.rbegin(); it != next.rend(); ++it) {
            if (!visited.insert(*it).second) {
                continue;
            }
            const Concept* target = Find(*it);
            if (target != nullptr) {
                stack.push_back(target);
            }
        }
    }
    return result;
}

std::vector<Concept> HierarchyResolver::Ancestors(const std::string& iri) const {
    return Closure(iri, Edge::Parent);
}

std::vector<Concept> HierarchyResolver::Descendants(const std::string& iri) const {
    return Closure(iri, Edge::Child);
}

std::vector<Concept> HierarchyResolver::Siblings(const std::string& iri) const {
    std::vector<Concept> siblings;
    const Concept* subject = Find(iri);
    if (subject == nullptr || subject->parent_concepts.empty()) {
        return siblings;
    }

    const auto& parents = subject->parent_concepts;
    std::unordered_set<std::string> seen{iri};
    for (const auto& candidate : concepts_) {
        if (seen.count(candidate.iri) > 0) {
            continue;
        }
        bool shares_parent = std::any_of(
            candidate.parent_concepts.begin(), candidate.parent_concepts.end(),
            [&](const std::string& parent) {
                return std::find(parents.begin(), parents.end(), parent) != parents.end();
            });
        if (shares_parent) {
            seen.insert(candidate.iri);
            siblings.push_back(candidate);
        }
    }
    return siblings;
}

std::optional<Hierarchy> HierarchyResolver::Resolve(const std::string& iri) const {
    const Concept* subject = Find(iri);
    if (subject == nullptr) {
        return std::nullopt;
    }
    Hierarchy hierarchy;
    hierarchy.subject = *subject;
    hierarchy.ancestors = Ancestors(iri);
    hierarchy.descendants = Descendants(iri);
    hierarchy.siblings = Siblings(iri);
    return hierarchy;
}

} // namespace ontology
} // namespace semgraph
