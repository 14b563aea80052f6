#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <arrow/api.h>
#include <semgraph/execution/execution_context.h>
#include <semgraph/operators/operator.h>

namespace semgraph {

// Query execution statistics
struct QueryStats {
    double total_time_ms = 0.0;
    size_t total_rows_processed = 0;
    size_t total_batches_processed = 0;
    size_t rows_returned = 0;

    // Per-operator statistics
    std::vector<std::pair<std::string, OperatorStats>> operator_stats;

    std::string ToString() const;
};

// Query executor: pulls an operator pipeline and collects statistics
//
// Example usage:
//   ExecutionContext ctx(store, 1024, std::chrono::milliseconds(5000));
//   QueryExecutor executor(ctx);
//   ARROW_RETURN_NOT_OK(executor.ExecuteStreaming(plan, [&](const auto& batch) {
//       ...
//       return true;  // keep pulling
//   }));
//
class QueryExecutor {
public:
    // Called for each non-empty output batch; return false to stop pulling
    using BatchCallback =
        std::function<arrow::Result<bool>(const std::shared_ptr<arrow::RecordBatch>&)>;

    explicit QueryExecutor(ExecutionContext& ctx) : ctx_(&ctx) {}

    arrow::Status ExecuteStreaming(const std::shared_ptr<Operator>& root_operator,
                                   const BatchCallback& callback);

    // Collect up to max_rows rows; pulling stops as soon as the cap is reached
    arrow::Result<std::vector<BindingRow>> CollectRows(
        const std::shared_ptr<Operator>& root_operator,
        std::optional<size_t> max_rows = std::nullopt);

    // Execute and return results as Arrow Table
    arrow::Result<std::shared_ptr<arrow::Table>> Execute(
        const std::shared_ptr<Operator>& root_operator);

    const QueryStats& GetStats() const { return stats_; }

    // Operator tree, one operator per line, children indented
    std::string ExplainPlan(const std::shared_ptr<Operator>& root_operator) const;

private:
    void CollectStats(const std::shared_ptr<Operator>& op, const std::string& prefix = "");

    ExecutionContext* ctx_;
    QueryStats stats_;
};

} // namespace semgraph
