#pragma once

#include <memory>
#include <string>
#include <vector>
#include <semgraph/operators/operator.h>
#include <semgraph/storage/triple_index.h>

namespace semgraph {

// One position of a triple pattern after planning
struct PatternSlot {
    enum class Kind {
        Constant,   // ValueId of a graph term
        Variable,   // column in the plan's VariableLayout
        Absent      // constant that does not occur in the graph: matches nothing
    };

    Kind kind = Kind::Absent;
    ValueId id;
    size_t column = 0;

    static PatternSlot Constant(ValueId id) { return PatternSlot{Kind::Constant, id, 0}; }
    static PatternSlot Variable(size_t column) { return PatternSlot{Kind::Variable, ValueId(), column}; }
    static PatternSlot Absent() { return PatternSlot{}; }
};

struct ScanPattern {
    PatternSlot subject;
    PatternSlot predicate;
    PatternSlot object;

    bool IsSatisfiable() const {
        return subject.kind != PatternSlot::Kind::Absent &&
               predicate.kind != PatternSlot::Kind::Absent &&
               object.kind != PatternSlot::Kind::Absent;
    }

    // Index pattern with constants and the variables already bound in row
    TriplePattern Resolve(const BindingRow& row) const;

    std::string ToString(const VariableLayout& layout) const;
};

// TripleScanOperator: index nested-loop join of one triple pattern against its input.
//
// For every input row the pattern's variables that the row already binds are
// substituted, the matching index range is looked up, and each triple extends the
// row. Ranges are consumed incrementally across GetNextBatch() calls, so a
// consumer that stops pulling stops the scan.
class TripleScanOperator : public UnaryOperator {
public:
    TripleScanOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                       std::shared_ptr<const VariableLayout> layout, ScanPattern pattern);

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    bool HasNextBatch() const override { return !exhausted_; }
    std::string ToString() const override;
    size_t EstimateCardinality() const override;

private:
    // Bind slot to value in row; false on a conflict with an existing binding
    static bool BindSlot(const PatternSlot& slot, ValueId value, BindingRow& row);

    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    ScanPattern pattern_;

    std::vector<BindingRow> pending_;
    size_t pending_pos_ = 0;
    BindingRow current_;
    TripleRange range_;
    size_t range_pos_ = 0;
    bool in_range_ = false;
    bool exhausted_ = false;
};

} // namespace semgraph
