#include <semgraph/execution/executor.h>
#include <chrono>
#include <sstream>

namespace semgraph {

namespace {

void ExplainOperator(const std::shared_ptr<Operator>& op, size_t depth, std::ostringstream& oss) {
    if (!op) {
        return;
    }
    oss << std::string(depth * 2, ' ') << op->ToString() << "\n";
    for (const auto& child : op->Children()) {
        ExplainOperator(child, depth + 1, oss);
    }
}

} // namespace

std::string QueryStats::ToString() const {
    std::ostringstream oss;
    oss << "QueryStats{"
        << "time=" << total_time_ms << "ms"
        << ", rows_processed=" << total_rows_processed
        << ", batches=" << total_batches_processed
        << ", rows_returned=" << rows_returned
        << "}";
    return oss.str();
}

arrow::Status QueryExecutor::ExecuteStreaming(const std::shared_ptr<Operator>& root_operator,
                                              const BatchCallback& callback) {
    if (!root_operator) {
        return arrow::Status::Invalid("Cannot execute an empty plan");
    }

    stats_ = QueryStats();
    auto start = std::chrono::steady_clock::now();

    arrow::Status status = arrow::Status::OK();
    while (root_operator->HasNextBatch()) {
        status = ctx_->CheckDeadline();
        if (!status.ok()) break;

        auto batch_result = root_operator->GetNextBatch();
        if (!batch_result.ok()) {
            status = batch_result.status();
            break;
        }
        auto batch = *batch_result;
        if (!batch) {
            break;
        }
        if (batch->num_rows() == 0) {
            continue;
        }

        auto keep_going = callback(batch);
        if (!keep_going.ok()) {
            status = keep_going.status();
            break;
        }
        if (!*keep_going) {
            break;
        }
    }

    auto end = std::chrono::steady_clock::now();
    stats_.total_time_ms =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;
    CollectStats(root_operator);

    return status;
}

arrow::Result<std::vector<BindingRow>> QueryExecutor::CollectRows(
    const std::shared_ptr<Operator>& root_operator, std::optional<size_t> max_rows) {
    std::vector<BindingRow> rows;
    if (max_rows && *max_rows == 0) {
        return rows;
    }

    ARROW_RETURN_NOT_OK(ExecuteStreaming(
        root_operator,
        [&](const std::shared_ptr<arrow::RecordBatch>& batch) -> arrow::Result<bool> {
            ARROW_ASSIGN_OR_RAISE(auto batch_rows, BatchToRows(*batch));
            for (auto& row : batch_rows) {
                rows.push_back(std::move(row));
                if (max_rows && rows.size() >= *max_rows) {
                    return false;
                }
            }
            return true;
        }));

    stats_.rows_returned = rows.size();
    return rows;
}

arrow::Result<std::shared_ptr<arrow::Table>> QueryExecutor::Execute(
    const std::shared_ptr<Operator>& root_operator) {
    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;

    ARROW_RETURN_NOT_OK(ExecuteStreaming(
        root_operator, [&](const std::shared_ptr<arrow::RecordBatch>& batch) -> arrow::Result<bool> {
            stats_.rows_returned += static_cast<size_t>(batch->num_rows());
            batches.push_back(batch);
            return true;
        }));

    ARROW_ASSIGN_OR_RAISE(auto schema, root_operator->GetOutputSchema());
    if (batches.empty()) {
        return arrow::Table::MakeEmpty(schema);
    }
    return arrow::Table::FromRecordBatches(schema, batches);
}

std::string QueryExecutor::ExplainPlan(const std::shared_ptr<Operator>& root_operator) const {
    std::ostringstream oss;
    ExplainOperator(root_operator, 0, oss);
    return oss.str();
}

void QueryExecutor::CollectStats(const std::shared_ptr<Operator>& op, const std::string& prefix) {
    if (!op) {
        return;
    }
    const auto& op_stats = op->GetStats();
    stats_.operator_stats.emplace_back(prefix + op->ToString(), op_stats);
    stats_.total_rows_processed += op_stats.rows_processed;
    stats_.total_batches_processed += op_stats.batches_processed;

    for (const auto& child : op->Children()) {
        CollectStats(child, prefix + "  ");
    }
}

} // namespace semgraph
