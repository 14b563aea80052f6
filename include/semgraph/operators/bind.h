#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <semgraph/operators/operator.h>
#include <semgraph/types/term.h>

namespace semgraph {

/**
 * BIND Operator
 *
 * Implements BIND(expr AS ?var) and SELECT (expr AS ?var): evaluates an expression
 * per row and stores the result in the alias column.
 *
 * Example:
 *   SELECT ?c ?name WHERE {
 *     ?c rdfs:label ?label .
 *     BIND(UCASE(?label) AS ?name)
 *   }
 *
 * Computed terms that are not in the graph are interned in the query-local
 * vocabulary. An evaluation error leaves the alias unbound. A row that already
 * binds the alias keeps its value.
 */
class BindOperator : public UnaryOperator {
public:
    using ValueFn = std::function<arrow::Result<std::optional<Term>>(const BindingRow&)>;

    BindOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                 std::shared_ptr<const VariableLayout> layout, ValueFn expression,
                 size_t alias_column, std::string expression_str = "");

    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    std::string ToString() const override;
    size_t EstimateCardinality() const override { return input_->EstimateCardinality(); }

private:
    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    ValueFn expression_;
    size_t alias_column_;
    std::string expression_str_;
};

} // namespace semgraph
