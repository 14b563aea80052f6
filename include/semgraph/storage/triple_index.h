#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <arrow/api.h>
#include <semgraph/types/value_id.h>

namespace semgraph {

// Interned triple: (Subject, Predicate, Object) as ValueIds
struct IdTriple {
    ValueId subject;
    ValueId predicate;
    ValueId object;

    bool operator==(const IdTriple& other) const {
        return subject == other.subject && predicate == other.predicate &&
               object == other.object;
    }
    bool operator<(const IdTriple& other) const {
        if (subject != other.subject) return subject < other.subject;
        if (predicate != other.predicate) return predicate < other.predicate;
        return object < other.object;
    }

    static std::shared_ptr<arrow::Schema> Schema() {
        return arrow::schema({
            arrow::field("subject", arrow::uint64()),
            arrow::field("predicate", arrow::uint64()),
            arrow::field("object", arrow::uint64())
        });
    }

    static arrow::Result<std::shared_ptr<arrow::RecordBatch>> ToArrowBatch(
        const std::vector<IdTriple>& triples);
};

// Triple pattern over ValueIds; std::nullopt marks an unbound position
struct TriplePattern {
    std::optional<ValueId> subject;
    std::optional<ValueId> predicate;
    std::optional<ValueId> object;

    size_t BoundCount() const {
        return (subject ? 1 : 0) + (predicate ? 1 : 0) + (object ? 1 : 0);
    }

    bool Matches(const IdTriple& t) const {
        return (!subject || *subject == t.subject) &&
               (!predicate || *predicate == t.predicate) &&
               (!object || *object == t.object);
    }

    std::string ToString() const;
};

// Index type for triple storage
// SPO: Subject-Predicate-Object (S, SP, SPO and unbound scans)
// POS: Predicate-Object-Subject (P, PO)
// OSP: Object-Subject-Predicate (O, OS)
enum class IndexType {
    SPO,
    POS,
    OSP
};

// Contiguous run of triples inside one permutation
class TripleRange {
public:
    TripleRange() = default;
    TripleRange(const IdTriple* begin, const IdTriple* end) : begin_(begin), end_(end) {}

    const IdTriple* begin() const { return begin_; }
    const IdTriple* end() const { return end_; }
    size_t size() const { return static_cast<size_t>(end_ - begin_); }
    bool empty() const { return begin_ == end_; }
    const IdTriple& operator[](size_t i) const { return begin_[i]; }

private:
    const IdTriple* begin_ = nullptr;
    const IdTriple* end_ = nullptr;
};

// TripleIndex: immutable in-memory triple store with three sorted permutations.
//
// Every bound-position combination maps to a prefix of one permutation, so a lookup
// is a binary search returning a contiguous range with no residual filtering.
// Duplicates are kept: the index over a union graph is a multiset.
class TripleIndex {
public:
    TripleIndex() = default;

    static TripleIndex Build(std::vector<IdTriple> triples);

    static IndexType SelectIndex(const TriplePattern& pattern);

    TripleRange Lookup(const TriplePattern& pattern) const;

    size_t EstimateCardinality(const TriplePattern& pattern) const {
        return Lookup(pattern).size();
    }

    // Visit matching triples until fn returns false
    template <typename Fn>
    void Scan(const TriplePattern& pattern, Fn&& fn) const {
        for (const IdTriple& t : Lookup(pattern)) {
            if (!fn(t)) {
                return;
            }
        }
    }

    // True if id is used as a predicate anywhere
    bool IsPredicate(ValueId id) const;

    size_t TotalTriples() const { return spo_.size(); }

    // All triples in SPO order
    TripleRange All() const { return TripleRange(spo_.data(), spo_.data() + spo_.size()); }

private:
    const std::vector<IdTriple>& Permutation(IndexType type) const;

    std::vector<IdTriple> spo_;
    std::vector<IdTriple> pos_;
    std::vector<IdTriple> osp_;
};

} // namespace semgraph
