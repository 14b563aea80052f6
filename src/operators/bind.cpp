#include <semgraph/operators/bind.h>
#include <sstream>

namespace semgraph {

BindOperator::BindOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                           std::shared_ptr<const VariableLayout> layout, ValueFn expression,
                           size_t alias_column, std::string expression_str)
    : UnaryOperator(std::move(input)),
      ctx_(&ctx),
      layout_(std::move(layout)),
      expression_(std::move(expression)),
      alias_column_(alias_column),
      expression_str_(std::move(expression_str)) {}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> BindOperator::GetNextBatch() {
    ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());

    std::vector<BindingRow> rows;
    ARROW_ASSIGN_OR_RAISE(bool has_input, PullInput(&rows));
    if (!has_input) {
        return nullptr;
    }

    for (auto& row : rows) {
        ARROW_RETURN_NOT_OK(ctx_->Tick());
        if (!row[alias_column_].isUndefined()) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto value, expression_(row));
        if (value) {
            ARROW_ASSIGN_OR_RAISE(row[alias_column_], ctx_->Intern(*value));
        }
    }

    return Emit(*layout_, rows);
}

std::string BindOperator::ToString() const {
    std::ostringstream oss;
    oss << "Bind(" << expression_str_ << " AS ?" << layout_->names()[alias_column_] << ")";
    return oss.str();
}

} // namespace semgraph
