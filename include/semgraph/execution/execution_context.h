#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <arrow/result.h>
#include <arrow/status.h>
#include <semgraph/storage/graph_store.h>
#include <semgraph/storage/vocabulary.h>
#include <semgraph/types/term.h>
#include <semgraph/types/value_id.h>

namespace semgraph {

// ExecutionContext: per-query state shared by all operators of one plan.
//
// Pins the graph generation the query runs against, owns the query-local vocabulary
// for computed terms, and carries the wall-clock deadline. Operators call Tick() in
// their inner loops; once the deadline has passed every call returns Cancelled and
// the whole plan unwinds.
class ExecutionContext {
public:
    using Clock = std::chrono::steady_clock;

    ExecutionContext(std::shared_ptr<const GraphStore> store, size_t batch_size,
                     std::chrono::milliseconds timeout, size_t check_interval = 256);

    const GraphStore& store() const { return *store_; }
    const std::shared_ptr<const GraphStore>& shared_store() const { return store_; }

    size_t batch_size() const { return batch_size_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    // Cancelled once the deadline has passed
    arrow::Status CheckDeadline() const;

    // Count rows of work; checks the deadline every check_interval rows
    arrow::Status Tick(size_t rows = 1);

    // Term for a generation or query-local ID; nullptr if unknown.
    // The pointer is invalidated by the next Intern().
    const Term* FindTerm(ValueId id) const { return local_vocab_.Find(id); }

    arrow::Result<Term> TermOf(ValueId id) const { return local_vocab_.GetTerm(id); }

    // Generation ID of term; std::nullopt if the graph does not contain it
    std::optional<ValueId> Lookup(const Term& term) const { return store_->Lookup(term); }

    // ID for a computed term: the generation ID if it exists, else a query-local one
    arrow::Result<ValueId> Intern(const Term& term) { return local_vocab_.GetOrAdd(term); }

private:
    std::shared_ptr<const GraphStore> store_;
    LocalVocabulary local_vocab_;
    size_t batch_size_;
    std::chrono::milliseconds timeout_;
    size_t check_interval_;
    size_t ticks_since_check_ = 0;
    Clock::time_point deadline_;
};

} // namespace semgraph
