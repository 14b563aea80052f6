#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <arrow/result.h>
#include <semgraph/types/term.h>
#include <semgraph/types/value_id.h>

namespace semgraph {

// Vocabulary: maps RDF terms to ValueIds and back for one graph generation.
//
// Terms are assigned dense sequential indices in insertion order. A vocabulary is
// filled by GraphStoreBuilder and frozen when the generation is published; after that
// it is only read, so lookups take no lock.
class Vocabulary {
public:
    Vocabulary() = default;

    // Add term, return its ValueId. Returns the existing ID if already present.
    arrow::Result<ValueId> AddTerm(const Term& term);

    // ValueId for term, or std::nullopt if the term is not in the vocabulary
    std::optional<ValueId> GetValueId(const Term& term) const;

    // Term for a VocabIndex ValueId. KeyError for unknown or foreign IDs.
    arrow::Result<Term> GetTerm(ValueId id) const;

    // Unchecked access for hot loops; nullptr if id is not a known vocab index
    const Term* Find(ValueId id) const;

    size_t Size() const { return terms_.size(); }

private:
    std::vector<Term> terms_;
    std::unordered_map<Term, uint64_t> index_;
};

// LocalVocabulary: query-scoped extension of a frozen Vocabulary.
//
// Terms computed during execution (BIND results, string functions) that are not in
// the generation vocabulary get LocalVocabIndex IDs here. A term already present in
// the base vocabulary always resolves to its base ID, so ValueId equality stays
// equivalent to term equality within one query.
class LocalVocabulary {
public:
    explicit LocalVocabulary(std::shared_ptr<const Vocabulary> base)
        : base_(std::move(base)) {}

    arrow::Result<ValueId> GetOrAdd(const Term& term);

    arrow::Result<Term> GetTerm(ValueId id) const;

    const Term* Find(ValueId id) const;

    const Vocabulary& base() const { return *base_; }

    size_t LocalSize() const { return terms_.size(); }

private:
    std::shared_ptr<const Vocabulary> base_;
    std::vector<Term> terms_;
    std::unordered_map<Term, uint64_t> index_;
};

} // namespace semgraph
