#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>
#include <semgraph/storage/context.h>
#include <semgraph/storage/triple_index.h>
#include <semgraph/storage/vocabulary.h>

namespace semgraph {

// GraphStore: one immutable generation of the knowledge graph.
//
// Holds the contexts of the generation, the vocabulary all of their triples are
// interned in, and a SPO/POS/OSP index over the union graph (the multiset union of
// all context triples). Built by GraphStoreBuilder, read concurrently without locks.
class GraphStore {
public:
    // An empty generation with no contexts
    static std::shared_ptr<const GraphStore> MakeEmpty(uint64_t generation = 0);

    uint64_t generation() const { return generation_; }

    const Vocabulary& vocabulary() const { return *vocabulary_; }
    const std::shared_ptr<const Vocabulary>& shared_vocabulary() const { return vocabulary_; }

    // Contexts ordered by key
    const std::map<std::string, Context>& contexts() const { return contexts_; }

    const Context* FindContext(std::string_view key) const;

    // Index over the union graph
    const TripleIndex& index() const { return union_index_; }

    std::optional<ValueId> Lookup(const Term& term) const { return vocabulary_->GetValueId(term); }

    std::optional<ValueId> LookupIri(std::string_view iri) const {
        return Lookup(Term(Iri(std::string(iri))));
    }

    // Term for a vocabulary ID; nullptr for IDs of another generation
    const Term* TermOf(ValueId id) const { return vocabulary_->Find(id); }

    bool IsPredicate(ValueId id) const { return union_index_.IsPredicate(id); }

    size_t TotalTriples() const { return union_index_.TotalTriples(); }

    bool Empty() const { return contexts_.empty(); }

private:
    friend class GraphStoreBuilder;

    GraphStore() = default;

    uint64_t generation_ = 0;
    std::shared_ptr<const Vocabulary> vocabulary_;
    std::map<std::string, Context> contexts_;
    TripleIndex union_index_;
};

// GraphStoreBuilder: collects context drafts for the next generation off to the side.
//
// Usage:
//   GraphStoreBuilder builder(next_generation);
//   builder.AddContext(std::move(draft));  // later drafts with the same key replace earlier ones
//   ARROW_ASSIGN_OR_RAISE(auto store, builder.Finish());
class GraphStoreBuilder {
public:
    explicit GraphStoreBuilder(uint64_t generation) : generation_(generation) {}

    // Stage a context; an existing draft with the same key is overwritten
    void AddContext(ContextDraft draft);

    size_t PendingContexts() const { return drafts_.size(); }

    // Intern all staged contexts (in key order) and build the union index.
    // The builder is consumed.
    arrow::Result<std::shared_ptr<const GraphStore>> Finish();

private:
    uint64_t generation_;
    std::map<std::string, ContextDraft> drafts_;
};

// GraphHandle: the single swappable reference to the published generation.
//
// Readers take a snapshot with Current() and keep using it to completion, even while
// a newer generation is published. Rebuilds are serialized with each other; the
// store is built outside the publish lock so readers never wait on a build.
class GraphHandle {
public:
    using BuildFn = std::function<arrow::Result<std::shared_ptr<const GraphStore>>(uint64_t)>;

    GraphHandle();

    std::shared_ptr<const GraphStore> Current() const;

    // Run build with the next generation number and publish its result.
    // On failure the current generation stays published.
    arrow::Result<std::shared_ptr<const GraphStore>> Rebuild(const BuildFn& build);

private:
    void Publish(std::shared_ptr<const GraphStore> store);

    mutable std::shared_mutex publish_mutex_;
    std::mutex rebuild_mutex_;
    std::shared_ptr<const GraphStore> current_;
};

} // namespace semgraph
