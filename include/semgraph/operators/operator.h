#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <arrow/api.h>
#include <arrow/result.h>
#include <semgraph/execution/binding.h>
#include <semgraph/execution/execution_context.h>

namespace semgraph {

// Operator statistics for query profiling
struct OperatorStats {
    size_t rows_processed = 0;
    size_t batches_processed = 0;
    double execution_time_ms = 0.0;

    std::string ToString() const;
};

// Base class for all query operators.
//
// Operators are lazy and pull-based: GetNextBatch() computes at most about one batch
// of rows and returns nullptr once the operator is exhausted. Every operator of a plan
// emits the plan's full VariableLayout schema.
class Operator {
public:
    virtual ~Operator() = default;

    virtual arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const = 0;

    // Next batch of results, nullptr when no more data is available
    virtual arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() = 0;

    virtual bool HasNextBatch() const = 0;

    // Collect all batches into a single Arrow Table
    arrow::Result<std::shared_ptr<arrow::Table>> GetAllResults();

    virtual const OperatorStats& GetStats() const { return stats_; }

    // Human-readable description, used for EXPLAIN output and debug logging
    virtual std::string ToString() const = 0;

    // Estimated number of output rows, used for join ordering and EXPLAIN
    virtual size_t EstimateCardinality() const = 0;

    // Inputs of this operator, for plan printing
    virtual std::vector<std::shared_ptr<Operator>> Children() const { return {}; }

protected:
    OperatorStats stats_;
};

// Unary operator: takes one input operator
class UnaryOperator : public Operator {
public:
    explicit UnaryOperator(std::shared_ptr<Operator> input)
        : input_(std::move(input)) {}

    arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const override {
        return input_->GetOutputSchema();
    }

    bool HasNextBatch() const override { return input_->HasNextBatch(); }

    std::vector<std::shared_ptr<Operator>> Children() const override { return {input_}; }

protected:
    // Rows of the next non-empty input batch; false once the input is exhausted
    arrow::Result<bool> PullInput(std::vector<BindingRow>* rows);

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> Emit(
        const VariableLayout& layout, const std::vector<BindingRow>& rows);

    std::shared_ptr<Operator> input_;
};

// Leaf operator emitting a fixed list of solutions.
// A single all-unbound row is the seed every pattern plan starts from.
class ValuesOperator : public Operator {
public:
    ValuesOperator(ExecutionContext& ctx, std::shared_ptr<const VariableLayout> layout,
                   std::vector<BindingRow> rows, std::string description = "Values");

    arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const override {
        return layout_->schema();
    }
    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    bool HasNextBatch() const override { return next_ < rows_.size(); }
    std::string ToString() const override;
    size_t EstimateCardinality() const override { return rows_.size(); }

private:
    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    std::vector<BindingRow> rows_;
    std::string description_;
    size_t next_ = 0;
};

// Filter operator: keeps the rows for which the predicate holds
class FilterOperator : public UnaryOperator {
public:
    using PredicateFn = std::function<arrow::Result<bool>(const BindingRow&)>;

    FilterOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                   std::shared_ptr<const VariableLayout> layout, PredicateFn predicate,
                   std::string predicate_description);

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    std::string ToString() const override;
    size_t EstimateCardinality() const override;

private:
    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    PredicateFn predicate_;
    std::string predicate_description_;
    double selectivity_ = 0.5;
};

// Distinct operator: removes rows that repeat the values of the key columns.
// Keeps the first occurrence, so input order is preserved.
class DistinctOperator : public UnaryOperator {
public:
    DistinctOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                     std::shared_ptr<const VariableLayout> layout,
                     std::vector<size_t> key_columns);

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    std::string ToString() const override;
    size_t EstimateCardinality() const override { return input_->EstimateCardinality(); }

private:
    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    std::vector<size_t> key_columns_;
    std::unordered_set<std::string> seen_rows_;
};

// Limit operator: skips offset rows, then passes at most limit rows
class LimitOperator : public UnaryOperator {
public:
    LimitOperator(std::shared_ptr<Operator> input, std::shared_ptr<const VariableLayout> layout,
                  size_t offset, std::optional<size_t> limit);

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    bool HasNextBatch() const override;
    std::string ToString() const override;
    size_t EstimateCardinality() const override;

private:
    std::shared_ptr<const VariableLayout> layout_;
    size_t offset_;
    std::optional<size_t> limit_;
    size_t rows_skipped_ = 0;
    size_t rows_returned_ = 0;
};

} // namespace semgraph
