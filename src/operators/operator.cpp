#include <semgraph/operators/operator.h>
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <sstream>

namespace semgraph {

std::string OperatorStats::ToString() const {
    std::ostringstream oss;
    oss << "OperatorStats{"
        << "rows=" << rows_processed
        << ", batches=" << batches_processed
        << ", time=" << execution_time_ms << "ms"
        << "}";
    return oss.str();
}

arrow::Result<std::shared_ptr<arrow::Table>> Operator::GetAllResults() {
    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;

    while (HasNextBatch()) {
        ARROW_ASSIGN_OR_RAISE(auto batch, GetNextBatch());
        if (!batch) {
            break;
        }
        batches.push_back(batch);
    }

    ARROW_ASSIGN_OR_RAISE(auto schema, GetOutputSchema());
    if (batches.empty()) {
        return arrow::Table::MakeEmpty(schema);
    }

    return arrow::Table::FromRecordBatches(schema, batches);
}

// ============================================================================
// UnaryOperator
// ============================================================================

arrow::Result<bool> UnaryOperator::PullInput(std::vector<BindingRow>* rows) {
    while (true) {
        ARROW_ASSIGN_OR_RAISE(auto batch, input_->GetNextBatch());
        if (!batch) {
            return false;
        }
        if (batch->num_rows() == 0) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(*rows, BatchToRows(*batch));
        return true;
    }
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> UnaryOperator::Emit(
    const VariableLayout& layout, const std::vector<BindingRow>& rows) {
    stats_.rows_processed += rows.size();
    stats_.batches_processed++;
    return RowsToBatch(layout, rows);
}

// ============================================================================
// ValuesOperator
// ============================================================================

ValuesOperator::ValuesOperator(ExecutionContext& ctx,
                               std::shared_ptr<const VariableLayout> layout,
                               std::vector<BindingRow> rows, std::string description)
    : ctx_(&ctx),
      layout_(std::move(layout)),
      rows_(std::move(rows)),
      description_(std::move(description)) {}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> ValuesOperator::GetNextBatch() {
    if (next_ >= rows_.size()) {
        return nullptr;
    }
    ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());

    size_t end = std::min(rows_.size(), next_ + ctx_->batch_size());
    std::vector<BindingRow> slice(rows_.begin() + static_cast<std::ptrdiff_t>(next_),
                                  rows_.begin() + static_cast<std::ptrdiff_t>(end));
    next_ = end;

    stats_.rows_processed += slice.size();
    stats_.batches_processed++;
    return RowsToBatch(*layout_, slice);
}

std::string ValuesOperator::ToString() const {
    std::ostringstream oss;
    oss << description_ << "(" << rows_.size() << " rows)";
    return oss.str();
}

// ============================================================================
// FilterOperator
// ============================================================================

FilterOperator::FilterOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                               std::shared_ptr<const VariableLayout> layout,
                               PredicateFn predicate, std::string predicate_description)
    : UnaryOperator(std::move(input)),
      ctx_(&ctx),
      layout_(std::move(layout)),
      predicate_(std::move(predicate)),
      predicate_description_(std::move(predicate_description)) {}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> FilterOperator::GetNextBatch() {
    ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());

    std::vector<BindingRow> input_rows;
    while (true) {
        ARROW_ASSIGN_OR_RAISE(bool has_input, PullInput(&input_rows));
        if (!has_input) {
            return nullptr;
        }

        std::vector<BindingRow> out;
        for (auto& row : input_rows) {
            ARROW_RETURN_NOT_OK(ctx_->Tick());
            ARROW_ASSIGN_OR_RAISE(bool keep, predicate_(row));
            if (keep) {
                out.push_back(std::move(row));
            }
        }
        if (!out.empty()) {
            return Emit(*layout_, out);
        }
    }
}

std::string FilterOperator::ToString() const {
    return "Filter(" + predicate_description_ + ")";
}

size_t FilterOperator::EstimateCardinality() const {
    return static_cast<size_t>(static_cast<double>(input_->EstimateCardinality()) * selectivity_);
}

// ============================================================================
// DistinctOperator
// ============================================================================

DistinctOperator::DistinctOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                                   std::shared_ptr<const VariableLayout> layout,
                                   std::vector<size_t> key_columns)
    : UnaryOperator(std::move(input)),
      ctx_(&ctx),
      layout_(std::move(layout)),
      key_columns_(std::move(key_columns)) {}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> DistinctOperator::GetNextBatch() {
    ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());

    std::vector<BindingRow> input_rows;
    while (true) {
        ARROW_ASSIGN_OR_RAISE(bool has_input, PullInput(&input_rows));
        if (!has_input) {
            return nullptr;
        }

        std::vector<BindingRow> out;
        for (auto& row : input_rows) {
            ARROW_RETURN_NOT_OK(ctx_->Tick());
            // Key: raw bits of the key columns
            std::string key;
            key.reserve(key_columns_.size() * sizeof(uint64_t));
            for (size_t col : key_columns_) {
                uint64_t bits = row[col].getBits();
                key.append(reinterpret_cast<const char*>(&bits), sizeof(bits));
            }
            if (seen_rows_.insert(std::move(key)).second) {
                out.push_back(std::move(row));
            }
        }
        if (!out.empty()) {
            return Emit(*layout_, out);
        }
    }
}

std::string DistinctOperator::ToString() const {
    std::ostringstream oss;
    oss << "Distinct(";
    for (size_t i = 0; i < key_columns_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "?" << layout_->names()[key_columns_[i]];
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// LimitOperator
// ============================================================================

LimitOperator::LimitOperator(std::shared_ptr<Operator> input,
                             std::shared_ptr<const VariableLayout> layout, size_t offset,
                             std::optional<size_t> limit)
    : UnaryOperator(std::move(input)),
      layout_(std::move(layout)),
      offset_(offset),
      limit_(limit) {}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> LimitOperator::GetNextBatch() {
    std::vector<BindingRow> input_rows;
    while (HasNextBatch()) {
        ARROW_ASSIGN_OR_RAISE(bool has_input, PullInput(&input_rows));
        if (!has_input) {
            return nullptr;
        }

        size_t begin = 0;
        if (rows_skipped_ < offset_) {
            size_t skip = std::min(offset_ - rows_skipped_, input_rows.size());
            rows_skipped_ += skip;
            begin = skip;
        }
        size_t end = input_rows.size();
        if (limit_) {
            end = std::min(end, begin + (*limit_ - rows_returned_));
        }
        if (begin >= end) {
            continue;
        }

        std::vector<BindingRow> out(std::make_move_iterator(input_rows.begin() + static_cast<std::ptrdiff_t>(begin)),
                                    std::make_move_iterator(input_rows.begin() + static_cast<std::ptrdiff_t>(end)));
        rows_returned_ += out.size();
        return Emit(*layout_, out);
    }
    return nullptr;
}

bool LimitOperator::HasNextBatch() const {
    if (limit_ && rows_returned_ >= *limit_) {
        return false;
    }
    return input_->HasNextBatch();
}

std::string LimitOperator::ToString() const {
    std::ostringstream oss;
    oss << "Limit(";
    if (limit_) {
        oss << *limit_;
    } else {
        oss << "all";
    }
    if (offset_ > 0) {
        oss << ", offset=" << offset_;
    }
    oss << ")";
    return oss.str();
}

size_t LimitOperator::EstimateCardinality() const {
    size_t input = input_->EstimateCardinality();
    size_t remaining = input > offset_ ? input - offset_ : 0;
    return limit_ ? std::min(remaining, *limit_) : remaining;
}

} // namespace semgraph
