#include <semgraph/storage/triple_index.h>
#include <algorithm>
#include <array>
#include <sstream>

namespace semgraph {

namespace {

using Key = std::array<uint64_t, 3>;

Key KeyFor(const IdTriple& t, IndexType type) {
    switch (type) {
        case IndexType::SPO:
            return {t.subject.getBits(), t.predicate.getBits(), t.object.getBits()};
        case IndexType::POS:
            return {t.predicate.getBits(), t.object.getBits(), t.subject.getBits()};
        case IndexType::OSP:
            return {t.object.getBits(), t.subject.getBits(), t.predicate.getBits()};
    }
    return {0, 0, 0};
}

// Bound values of the pattern in permutation order; returns the prefix length
size_t PrefixFor(const TriplePattern& p, IndexType type, Key& prefix) {
    std::array<const std::optional<ValueId>*, 3> order = {&p.subject, &p.predicate, &p.object};
    if (type == IndexType::POS) {
        order = {&p.predicate, &p.object, &p.subject};
    } else if (type == IndexType::OSP) {
        order = {&p.object, &p.subject, &p.predicate};
    }
    size_t len = 0;
    for (const auto* slot : order) {
        if (!slot->has_value()) {
            break;
        }
        prefix[len++] = (*slot)->getBits();
    }
    return len;
}

void SortBy(std::vector<IdTriple>& triples, IndexType type) {
    std::sort(triples.begin(), triples.end(),
              [type](const IdTriple& a, const IdTriple& b) {
                  return KeyFor(a, type) < KeyFor(b, type);
              });
}

} // namespace

arrow::Result<std::shared_ptr<arrow::RecordBatch>> IdTriple::ToArrowBatch(
    const std::vector<IdTriple>& triples) {
    arrow::UInt64Builder subject_builder;
    arrow::UInt64Builder predicate_builder;
    arrow::UInt64Builder object_builder;

    ARROW_RETURN_NOT_OK(subject_builder.Reserve(triples.size()));
    ARROW_RETURN_NOT_OK(predicate_builder.Reserve(triples.size()));
    ARROW_RETURN_NOT_OK(object_builder.Reserve(triples.size()));

    for (const auto& t : triples) {
        subject_builder.UnsafeAppend(t.subject.getBits());
        predicate_builder.UnsafeAppend(t.predicate.getBits());
        object_builder.UnsafeAppend(t.object.getBits());
    }

    std::shared_ptr<arrow::Array> subjects, predicates, objects;
    ARROW_RETURN_NOT_OK(subject_builder.Finish(&subjects));
    ARROW_RETURN_NOT_OK(predicate_builder.Finish(&predicates));
    ARROW_RETURN_NOT_OK(object_builder.Finish(&objects));

    return arrow::RecordBatch::Make(Schema(), static_cast<int64_t>(triples.size()),
                                    {subjects, predicates, objects});
}

std::string TriplePattern::ToString() const {
    std::ostringstream oss;
    oss << "(" << (subject ? subject->ToString() : "?s") << ", "
        << (predicate ? predicate->ToString() : "?p") << ", "
        << (object ? object->ToString() : "?o") << ")";
    return oss.str();
}

TripleIndex TripleIndex::Build(std::vector<IdTriple> triples) {
    TripleIndex index;
    index.pos_ = triples;
    index.osp_ = triples;
    index.spo_ = std::move(triples);

    SortBy(index.spo_, IndexType::SPO);
    SortBy(index.pos_, IndexType::POS);
    SortBy(index.osp_, IndexType::OSP);
    return index;
}

IndexType TripleIndex::SelectIndex(const TriplePattern& pattern) {
    if (pattern.subject) {
        // S+O without P is an OSP prefix
        if (!pattern.predicate && pattern.object) {
            return IndexType::OSP;
        }
        return IndexType::SPO;
    }
    if (pattern.predicate) {
        return IndexType::POS;
    }
    if (pattern.object) {
        return IndexType::OSP;
    }
    return IndexType::SPO;
}

const std::vector<IdTriple>& TripleIndex::Permutation(IndexType type) const {
    switch (type) {
        case IndexType::SPO: return spo_;
        case IndexType::POS: return pos_;
        case IndexType::OSP: return osp_;
    }
    return spo_;
}

TripleRange TripleIndex::Lookup(const TriplePattern& pattern) const {
    IndexType type = SelectIndex(pattern);
    const auto& perm = Permutation(type);

    Key prefix{0, 0, 0};
    size_t len = PrefixFor(pattern, type, prefix);
    if (len == 0) {
        return TripleRange(perm.data(), perm.data() + perm.size());
    }

    auto less_than_prefix = [type, len](const IdTriple& t, const Key& key) {
        Key k = KeyFor(t, type);
        return std::lexicographical_compare(k.begin(), k.begin() + len,
                                            key.begin(), key.begin() + len);
    };
    auto prefix_less_than = [type, len](const Key& key, const IdTriple& t) {
        Key k = KeyFor(t, type);
        return std::lexicographical_compare(key.begin(), key.begin() + len,
                                            k.begin(), k.begin() + len);
    };

    auto lo = std::lower_bound(perm.begin(), perm.end(), prefix, less_than_prefix);
    auto hi = std::upper_bound(lo, perm.end(), prefix, prefix_less_than);
    return TripleRange(perm.data() + (lo - perm.begin()), perm.data() + (hi - perm.begin()));
}

bool TripleIndex::IsPredicate(ValueId id) const {
    TriplePattern pattern;
    pattern.predicate = id;
    return !Lookup(pattern).empty();
}

} // namespace semgraph
