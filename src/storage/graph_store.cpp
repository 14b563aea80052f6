#include <semgraph/storage/graph_store.h>
#include <semgraph/util/logging.h>
#include <unordered_set>

namespace semgraph {

SEMGRAPH_LOG_TAG(GraphStore);

namespace {

struct IdTripleHash {
    size_t operator()(const IdTriple& t) const {
        size_t h = std::hash<ValueId>()(t.subject);
        h ^= std::hash<ValueId>()(t.predicate) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<ValueId>()(t.object) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace

// ============================================================================
// GraphStore
// ============================================================================

std::shared_ptr<const GraphStore> GraphStore::MakeEmpty(uint64_t generation) {
    auto store = std::shared_ptr<GraphStore>(new GraphStore());
    store->generation_ = generation;
    store->vocabulary_ = std::make_shared<Vocabulary>();
    return store;
}

const Context* GraphStore::FindContext(std::string_view key) const {
    auto it = contexts_.find(std::string(key));
    return it == contexts_.end() ? nullptr : &it->second;
}

// ============================================================================
// GraphStoreBuilder
// ============================================================================

void GraphStoreBuilder::AddContext(ContextDraft draft) {
    auto it = drafts_.find(draft.key);
    if (it != drafts_.end()) {
        SEMGRAPH_LOG_WARN(GraphStore) << "Context " << draft.key
                                      << " loaded twice; keeping the later source";
        it->second = std::move(draft);
        return;
    }
    std::string key = draft.key;
    drafts_.emplace(std::move(key), std::move(draft));
}

arrow::Result<std::shared_ptr<const GraphStore>> GraphStoreBuilder::Finish() {
    auto vocabulary = std::make_shared<Vocabulary>();
    auto store = std::shared_ptr<GraphStore>(new GraphStore());
    store->generation_ = generation_;

    std::vector<IdTriple> all;
    for (auto& [key, draft] : drafts_) {
        Context context;
        context.key = key;
        context.kind = draft.kind;
        context.format = draft.format;
        context.triples.reserve(draft.triples.size());

        std::unordered_set<IdTriple, IdTripleHash> seen;
        for (const Triple& triple : draft.triples) {
            ARROW_ASSIGN_OR_RAISE(auto s, vocabulary->AddTerm(triple.subject));
            ARROW_ASSIGN_OR_RAISE(auto p, vocabulary->AddTerm(Term(triple.predicate)));
            ARROW_ASSIGN_OR_RAISE(auto o, vocabulary->AddTerm(triple.object));
            IdTriple id_triple{s, p, o};
            if (seen.insert(id_triple).second) {
                context.triples.push_back(id_triple);
            }
        }

        all.insert(all.end(), context.triples.begin(), context.triples.end());
        store->contexts_.emplace(key, std::move(context));
    }
    drafts_.clear();

    store->union_index_ = TripleIndex::Build(std::move(all));
    store->vocabulary_ = std::move(vocabulary);
    return std::shared_ptr<const GraphStore>(std::move(store));
}

// ============================================================================
// GraphHandle
// ============================================================================

GraphHandle::GraphHandle() : current_(GraphStore::MakeEmpty(0)) {}

std::shared_ptr<const GraphStore> GraphHandle::Current() const {
    std::shared_lock<std::shared_mutex> lock(publish_mutex_);
    return current_;
}

arrow::Result<std::shared_ptr<const GraphStore>> GraphHandle::Rebuild(const BuildFn& build) {
    std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);

    uint64_t next_generation = Current()->generation() + 1;
    ARROW_ASSIGN_OR_RAISE(auto store, build(next_generation));
    if (store == nullptr) {
        return arrow::Status::Invalid("Rebuild produced no graph");
    }

    Publish(store);
    SEMGRAPH_LOG_INFO(GraphStore) << "Published generation " << store->generation() << " with "
                                  << store->contexts().size() << " contexts, "
                                  << store->TotalTriples() << " triples";
    return store;
}

void GraphHandle::Publish(std::shared_ptr<const GraphStore> store) {
    std::unique_lock<std::shared_mutex> lock(publish_mutex_);
    current_ = std::move(store);
}

} // namespace semgraph
