#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <semgraph/operators/operator.h>

namespace semgraph {

enum class ApplyMode {
    Inner,      // emit every sub-solution (VALUES, UNION)
    LeftOuter,  // emit every sub-solution, or the input row if there is none (OPTIONAL)
    Semi,       // emit the input row if at least one sub-solution exists
    Anti        // emit the input row if no sub-solution exists (MINUS)
};

std::string_view toString(ApplyMode mode);

// ApplyOperator: correlated evaluation of a group pattern for each input row.
//
// The factory builds a sub-plan seeded with one input row, so every sub-solution is
// compatible with that row and already extends it. Sub-plans are pulled lazily,
// one batch at a time, and Semi/Anti stop a sub-plan at its first solution.
//
// For Anti, shared_columns are the variables the sub-pattern can bind; an input row
// binding none of them shares no variable with the sub-pattern and is kept without
// evaluation.
class ApplyOperator : public UnaryOperator {
public:
    using SubplanFactory =
        std::function<arrow::Result<std::shared_ptr<Operator>>(const BindingRow& seed)>;

    ApplyOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                  std::shared_ptr<const VariableLayout> layout, SubplanFactory factory,
                  ApplyMode mode, std::string description,
                  std::vector<size_t> shared_columns = {});

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    bool HasNextBatch() const override { return !exhausted_; }
    std::string ToString() const override;
    size_t EstimateCardinality() const override { return input_->EstimateCardinality(); }

private:
    bool SharesColumn(const BindingRow& row) const;

    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    SubplanFactory factory_;
    ApplyMode mode_;
    std::string description_;
    std::vector<size_t> shared_columns_;

    std::vector<BindingRow> pending_;
    size_t pending_pos_ = 0;
    BindingRow current_;
    std::shared_ptr<Operator> subplan_;
    bool matched_ = false;
    bool exhausted_ = false;
};

// UnionOperator: concatenation of its branches, drained in order
class UnionOperator : public Operator {
public:
    UnionOperator(std::shared_ptr<const VariableLayout> layout,
                  std::vector<std::shared_ptr<Operator>> branches);

    arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const override {
        return layout_->schema();
    }
    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    bool HasNextBatch() const override { return current_ < branches_.size(); }
    std::string ToString() const override;
    size_t EstimateCardinality() const override;
    std::vector<std::shared_ptr<Operator>> Children() const override { return branches_; }

private:
    std::shared_ptr<const VariableLayout> layout_;
    std::vector<std::shared_ptr<Operator>> branches_;
    size_t current_ = 0;
};

} // namespace semgraph
