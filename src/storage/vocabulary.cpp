#include <semgraph/storage/vocabulary.h>

namespace semgraph {

// ============================================================================
// Vocabulary
// ============================================================================

arrow::Result<ValueId> Vocabulary::AddTerm(const Term& term) {
    auto it = index_.find(term);
    if (it != index_.end()) {
        return ValueId::makeFromVocabIndex(it->second);
    }

    uint64_t next = terms_.size();
    if (next > ValueId::maxIndex) {
        return arrow::Status::CapacityError("Vocabulary is full (", next, " terms)");
    }

    terms_.push_back(term);
    index_.emplace(term, next);
    return ValueId::makeFromVocabIndex(next);
}

std::optional<ValueId> Vocabulary::GetValueId(const Term& term) const {
    auto it = index_.find(term);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return ValueId::makeFromVocabIndex(it->second);
}

arrow::Result<Term> Vocabulary::GetTerm(ValueId id) const {
    const Term* term = Find(id);
    if (term == nullptr) {
        return arrow::Status::KeyError("ValueId not in vocabulary: ", id.ToString());
    }
    return *term;
}

const Term* Vocabulary::Find(ValueId id) const {
    if (!id.isVocabIndex() || id.getIndex() >= terms_.size()) {
        return nullptr;
    }
    return &terms_[id.getIndex()];
}

// ============================================================================
// LocalVocabulary
// ============================================================================

arrow::Result<ValueId> LocalVocabulary::GetOrAdd(const Term& term) {
    if (auto id = base_->GetValueId(term)) {
        return *id;
    }

    auto it = index_.find(term);
    if (it != index_.end()) {
        return ValueId::makeFromLocalVocabIndex(it->second);
    }

    uint64_t next = terms_.size();
    terms_.push_back(term);
    index_.emplace(term, next);
    return ValueId::makeFromLocalVocabIndex(next);
}

arrow::Result<Term> LocalVocabulary::GetTerm(ValueId id) const {
    const Term* term = Find(id);
    if (term == nullptr) {
        return arrow::Status::KeyError("ValueId not in local vocabulary: ", id.ToString());
    }
    return *term;
}

const Term* LocalVocabulary::Find(ValueId id) const {
    if (id.isLocalVocabIndex()) {
        if (id.getIndex() >= terms_.size()) {
            return nullptr;
        }
        return &terms_[id.getIndex()];
    }
    return base_->Find(id);
}

} // namespace semgraph
