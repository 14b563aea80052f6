#include <semgraph/ontology/concept_extractor.h>
#include <semgraph/ontology/vocab.h>
#include <semgraph/util/logging.h>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace semgraph {
namespace ontology {

SEMGRAPH_LOG_TAG(ConceptExtractor);

namespace {

// IDs of the vocabulary terms the extractor looks for; unset when absent from the graph
struct VocabIds {
    std::optional<ValueId> rdf_type;
    std::optional<ValueId> rdf_property;
    std::optional<ValueId> rdfs_class;
    std::optional<ValueId> owl_class;
    std::optional<ValueId> rdfs_subclass_of;
    std::optional<ValueId> rdfs_label;
    std::optional<ValueId> rdfs_comment;
    std::optional<ValueId> skos_concept;
    std::optional<ValueId> skos_concept_scheme;
    std::optional<ValueId> skos_broader;
    std::optional<ValueId> skos_pref_label;
    std::optional<ValueId> skos_definition;

    explicit VocabIds(const GraphStore& store)
        : rdf_type(store.LookupIri(vocab::kRdfType)),
          rdf_property(store.LookupIri(vocab::kRdfProperty)),
          rdfs_class(store.LookupIri(vocab::kRdfsClass)),
          owl_class(store.LookupIri(vocab::kOwlClass)),
          rdfs_subclass_of(store.LookupIri(vocab::kRdfsSubClassOf)),
          rdfs_label(store.LookupIri(vocab::kRdfsLabel)),
          rdfs_comment(store.LookupIri(vocab::kRdfsComment)),
          skos_concept(store.LookupIri(vocab::kSkosConcept)),
          skos_concept_scheme(store.LookupIri(vocab::kSkosConceptScheme)),
          skos_broader(store.LookupIri(vocab::kSkosBroader)),
          skos_pref_label(store.LookupIri(vocab::kSkosPrefLabel)),
          skos_definition(store.LookupIri(vocab::kSkosDefinition)) {}
};

bool Is(const std::optional<ValueId>& expected, ValueId id) {
    return expected && *expected == id;
}

// Everything one context says about one IRI
struct TermFacts {
    bool declared_class = false;
    bool declared_concept = false;
    bool declared_scheme = false;
    bool subclass_edge = false;
    bool type_target = false;
    std::optional<std::string> rdfs_label;
    std::optional<std::string> pref_label;
    std::optional<std::string> rdfs_comment;
    std::optional<std::string> definition;
    std::vector<std::string> parents;

    void AddParent(const std::string& iri) {
        if (std::find(parents.begin(), parents.end(), iri) == parents.end()) {
            parents.push_back(iri);
        }
    }

    bool Eligible() const {
        bool has_label = rdfs_label || pref_label;
        bool has_comment = rdfs_comment || definition;
        return declared_class || declared_concept || declared_scheme || subclass_edge ||
               type_target || IsDocumentedResource(has_label, has_comment);
    }
};

void SetFirst(std::optional<std::string>& slot, const Term& value) {
    if (!slot && IsLiteral(value)) {
        slot = LexicalForm(value);
    }
}

int TypeStrength(ConceptType type) {
    switch (type) {
        case ConceptType::Class: return 2;
        case ConceptType::Concept: return 1;
        case ConceptType::Individual: return 0;
    }
    return 0;
}

void AppendUnique(std::vector<std::string>& out, const std::vector<std::string>& values) {
    for (const auto& value : values) {
        if (std::find(out.begin(), out.end(), value) == out.end()) {
            out.push_back(value);
        }
    }
}

} // namespace

bool MatchesTaxonomy(const Context& context, const std::optional<std::string>& taxonomy) {
    return !taxonomy || context.Name() == *taxonomy || context.key == *taxonomy;
}

void FillChildConcepts(std::vector<Concept>& concepts) {
    std::unordered_map<std::string, std::vector<size_t>> by_iri;
    for (size_t i = 0; i < concepts.size(); ++i) {
        by_iri[concepts[i].iri].push_back(i);
    }

    std::vector<std::unordered_set<std::string>> seen(concepts.size());
    for (auto& concept_value : concepts) {
        concept_value.child_concepts.clear();
    }
    for (const auto& child : concepts) {
        for (const auto& parent_iri : child.parent_concepts) {
            auto it = by_iri.find(parent_iri);
            if (it == by_iri.end()) {
                continue;
            }
            for (size_t parent : it->second) {
                if (concepts[parent].iri == child.iri) {
                    continue;
                }
                if (seen[parent].insert(child.iri).second) {
                    concepts[parent].child_concepts.push_back(child.iri);
                }
            }
        }
    }
}

void SortByLabel(std::vector<Concept>& concepts) {
    std::stable_sort(concepts.begin(), concepts.end(), [](const Concept& a, const Concept& b) {
        const std::string& key_a = a.label ? *a.label : a.iri;
        const std::string& key_b = b.label ? *b.label : b.iri;
        if (key_a != key_b) {
            return key_a < key_b;
        }
        return a.iri < b.iri;
    });
}

ConceptExtractor::ConceptExtractor(std::shared_ptr<const GraphStore> store)
    : store_(std::move(store)) {}

std::vector<Concept> ConceptExtractor::ExtractContext(const Context& context) const {
    const GraphStore& store = *store_;
    VocabIds ids(store);

    std::vector<ValueId> order;  // IRIs in first-seen order
    std::unordered_map<uint64_t, TermFacts> facts;
    auto touch = [&](ValueId id) -> TermFacts* {
        const Term* term = store.TermOf(id);
        if (term == nullptr || !IsIri(*term)) {
            return nullptr;
        }
        auto [it, inserted] = facts.try_emplace(id.getBits());
        if (inserted) {
            order.push_back(id);
        }
        return &it->second;
    };

    for (const IdTriple& t : context.triples) {
        TermFacts* subject = touch(t.subject);
        TermFacts* object = touch(t.object);
        if (subject == nullptr) {
            continue;
        }
        const Term* object_term = store.TermOf(t.object);
        if (object_term == nullptr) {
            continue;
        }

        if (Is(ids.rdf_type, t.predicate)) {
            if (Is(ids.rdfs_class, t.object) || Is(ids.owl_class, t.object)) {
                subject->declared_class = true;
            } else if (Is(ids.skos_concept, t.object)) {
                subject->declared_concept = true;
            } else if (Is(ids.skos_concept_scheme, t.object)) {
                subject->declared_scheme = true;
            }
            if (object != nullptr && t.object != t.subject &&
                !vocab::IsReservedNamespace(LexicalForm(*object_term))) {
                object->type_target = true;
                subject->AddParent(LexicalForm(*object_term));
            }
        } else if (Is(ids.rdfs_subclass_of, t.predicate)) {
            subject->subclass_edge = true;
            if (object != nullptr) {
                object->subclass_edge = true;
                subject->AddParent(LexicalForm(*object_term));
            }
        } else if (Is(ids.skos_broader, t.predicate)) {
            if (object != nullptr) {
                subject->AddParent(LexicalForm(*object_term));
            }
        } else if (Is(ids.rdfs_label, t.predicate)) {
            SetFirst(subject->rdfs_label, *object_term);
        } else if (Is(ids.skos_pref_label, t.predicate)) {
            SetFirst(subject->pref_label, *object_term);
        } else if (Is(ids.rdfs_comment, t.predicate)) {
            SetFirst(subject->rdfs_comment, *object_term);
        } else if (Is(ids.skos_definition, t.predicate)) {
            SetFirst(subject->definition, *object_term);
        }
    }

    std::vector<Concept> concepts;
    std::string source_context = context.Name();
    for (ValueId id : order) {
        const TermFacts& f = facts.at(id.getBits());
        const std::string& iri = LexicalForm(*store.TermOf(id));
        if (!f.Eligible() || vocab::IsReservedNamespace(iri)) {
            continue;
        }

        Concept concept_value;
        concept_value.iri = iri;
        concept_value.label = f.rdfs_label ? f.rdfs_label : f.pref_label;
        concept_value.comment = f.rdfs_comment ? f.rdfs_comment : f.definition;
        if (f.declared_class) {
            concept_value.concept_type = ConceptType::Class;
        } else if (f.declared_concept) {
            concept_value.concept_type = ConceptType::Concept;
        }
        if (!source_context.empty()) {
            concept_value.source_context = source_context;
        }
        concept_value.parent_concepts = f.parents;
        concepts.push_back(std::move(concept_value));
    }

    SEMGRAPH_LOG_TRACE(ConceptExtractor) << "Context " << context.key << ": "
                                         << concepts.size() << " concepts";
    return concepts;
}

std::vector<Concept> ConceptExtractor::GetConceptsByTaxonomy(
    const std::optional<std::string>& taxonomy) const {
    std::vector<Concept> concepts;
    for (const auto& [key, context] : store_->contexts()) {
        if (!MatchesTaxonomy(context, taxonomy)) {
            continue;
        }
        auto extracted = ExtractContext(context);
        concepts.insert(concepts.end(), std::make_move_iterator(extracted.begin()),
                        std::make_move_iterator(extracted.end()));
    }
    FillChildConcepts(concepts);
    return concepts;
}

std::vector<Concept> ConceptExtractor::GetMergedConcepts() const {
    std::vector<Concept> merged;
    std::unordered_map<std::string, size_t> index;

    for (const auto& [key, context] : store_->contexts()) {
        for (auto& concept_value : ExtractContext(context)) {
            auto it = index.find(concept_value.iri);
            if (it == index.end()) {
                index.emplace(concept_value.iri, merged.size());
                merged.push_back(std::move(concept_value));
                continue;
            }
            Concept& target = merged[it->second];
            if (!target.label) target.label = concept_value.label;
            if (!target.comment) target.comment = concept_value.comment;
            if (!target.source_context) target.source_context = concept_value.source_context;
            if (TypeStrength(concept_value.concept_type) > TypeStrength(target.concept_type)) {
                target.concept_type = concept_value.concept_type;
            }
            AppendUnique(target.parent_concepts, concept_value.parent_concepts);
        }
    }

    FillChildConcepts(merged);
    return merged;
}

std::optional<Concept> ConceptExtractor::GetConceptDetails(const std::string& iri) const {
    for (auto& concept_value : GetMergedConcepts()) {
        if (concept_value.iri == iri) {
            return std::move(concept_value);
        }
    }
    return std::nullopt;
}

std::map<std::string, std::vector<Concept>> ConceptExtractor::GetGroupedConcepts(
    const std::optional<std::string>& taxonomy) const {
    std::map<std::string, std::vector<Concept>> groups;
    for (auto& concept_value : GetConceptsByTaxonomy(taxonomy)) {
        std::string group = concept_value.source_context.value_or("Unassigned");
        groups[group].push_back(std::move(concept_value));
    }
    for (auto& [name, members] : groups) {
        SortByLabel(members);
    }
    return groups;
}

std::vector<Concept> ConceptExtractor::GetTopLevelConcepts(
    const std::optional<std::string>& taxonomy) const {
    std::vector<Concept> top_level;
    for (auto& concept_value : GetConceptsByTaxonomy(taxonomy)) {
        if (concept_value.parent_concepts.empty()) {
            top_level.push_back(std::move(concept_value));
        }
    }
    SortByLabel(top_level);
    return top_level;
}

size_t ConceptExtractor::CountDeclaredProperties(const Context& context) const {
    VocabIds ids(*store_);
    if (!ids.rdf_type || !ids.rdf_property) {
        return 0;
    }
    std::unordered_set<uint64_t> properties;
    for (const IdTriple& t : context.triples) {
        if (t.predicate == *ids.rdf_type && t.object == *ids.rdf_property) {
            const Term* subject = store_->TermOf(t.subject);
            if (subject != nullptr && IsIri(*subject)) {
                properties.insert(t.subject.getBits());
            }
        }
    }
    return properties.size();
}

} // namespace ontology
} // namespace semgraph
