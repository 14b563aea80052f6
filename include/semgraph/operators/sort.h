#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <semgraph/operators/operator.h>
#include <semgraph/types/term.h>

namespace semgraph {

enum class SortDirection {
    Ascending,
    Descending
};

struct SortKey {
    // Key value for a row; std::nullopt sorts as unbound
    std::function<arrow::Result<std::optional<Term>>(const BindingRow&)> value;
    SortDirection direction = SortDirection::Ascending;
    std::string description;
};

/**
 * Sort Operator
 *
 * Implements ORDER BY. The only blocking operator: the whole input is materialized
 * on the first GetNextBatch() call, with the deadline checked while reading and
 * while computing keys, then emitted in batches. The sort is stable, so rows with
 * equal keys keep their input order.
 */
class SortOperator : public UnaryOperator {
public:
    // Three-way term comparison: negative, zero or positive
    using CompareFn = std::function<int(const std::optional<Term>&, const std::optional<Term>&)>;

    SortOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                 std::shared_ptr<const VariableLayout> layout, std::vector<SortKey> keys,
                 CompareFn compare);

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    bool HasNextBatch() const override { return !sorted_ || next_ < rows_.size(); }
    std::string ToString() const override;
    size_t EstimateCardinality() const override { return input_->EstimateCardinality(); }

private:
    arrow::Status MaterializeAndSort();

    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    std::vector<SortKey> keys_;
    CompareFn compare_;

    bool sorted_ = false;
    std::vector<BindingRow> rows_;
    size_t next_ = 0;
};

} // namespace semgraph
