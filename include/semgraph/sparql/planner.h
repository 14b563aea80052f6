#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <semgraph/execution/binding.h>
#include <semgraph/execution/execution_context.h>
#include <semgraph/operators/operator.h>
#include <semgraph/operators/scan.h>
#include <semgraph/sparql/ast.h>
#include <semgraph/sparql/expression_evaluator.h>

namespace semgraph {
namespace sparql {

// Physical query plan
struct PhysicalPlan {
    std::shared_ptr<Operator> root_operator;
    std::shared_ptr<const VariableLayout> layout;

    // Projected variables and their columns in layout
    std::vector<std::string> output_columns;
    std::vector<size_t> output_indices;

    std::string ToString() const {
        if (root_operator) {
            return root_operator->ToString();
        }
        return "Empty plan";
    }
};

// Query planner: converts a SPARQL AST into a lazy operator tree.
//
// Every plan shares one VariableLayout covering all variables of the query. A group
// pattern is planned as a pipeline seeded by a single row; OPTIONAL, UNION, VALUES,
// MINUS and EXISTS are correlated and plan their sub-patterns per input row, at
// execution time. The planner must therefore outlive the plans it returns.
//
// Planning errors (for example a projected expression over an unknown variable)
// are validation errors and are returned as Status::Invalid.
class QueryPlanner {
public:
    explicit QueryPlanner(ExecutionContext& ctx) : ctx_(&ctx) {}

    arrow::Result<PhysicalPlan> PlanSelectQuery(const SelectQuery& query);
    arrow::Result<PhysicalPlan> PlanAskQuery(const AskQuery& query);

    // Solutions of the WHERE clause; the template is instantiated by the caller
    arrow::Result<PhysicalPlan> PlanConstructQuery(const ConstructQuery& query);

    // Solutions of the WHERE clause (one empty solution without WHERE); output
    // columns are the described variables
    arrow::Result<PhysicalPlan> PlanDescribeQuery(const DescribeQuery& query);

    // Plan of a group pattern whose solutions extend seed
    arrow::Result<std::shared_ptr<Operator>> PlanGroupPattern(const QueryPattern& pattern,
                                                              const BindingRow& seed);

    // Plan a basic graph pattern on top of input; bound lists the columns the
    // input rows are known to bind
    arrow::Result<std::shared_ptr<Operator>> PlanBasicGraphPattern(
        std::shared_ptr<Operator> input, const BasicGraphPattern& bgp,
        std::vector<bool> bound);

    // Convert a pattern term to a scan slot
    arrow::Result<PatternSlot> TermToSlot(const RDFTerm& term) const;

    const std::shared_ptr<const VariableLayout>& layout() const { return layout_; }

private:
    arrow::Status InitLayout(std::vector<std::string> variables);

    arrow::Result<std::shared_ptr<Operator>> PlanValues(std::shared_ptr<Operator> input,
                                                        const ValuesClause& values);
    arrow::Result<std::shared_ptr<Operator>> PlanUnion(std::shared_ptr<Operator> input,
                                                       const UnionPattern& union_pattern);
    arrow::Result<std::shared_ptr<Operator>> PlanOptional(std::shared_ptr<Operator> input,
                                                          const OptionalPattern& optional);
    arrow::Result<std::shared_ptr<Operator>> PlanBind(std::shared_ptr<Operator> input,
                                                      const BindClause& bind);
    arrow::Result<std::shared_ptr<Operator>> PlanMinus(std::shared_ptr<Operator> input,
                                                       const MinusPattern& minus);
    arrow::Result<std::shared_ptr<Operator>> PlanFilter(std::shared_ptr<Operator> input,
                                                        const FilterClause& filter);
    arrow::Result<std::shared_ptr<Operator>> PlanOrderBy(std::shared_ptr<Operator> input,
                                                         const std::vector<OrderBy>& order_by);

    // ORDER BY, DISTINCT over key_columns, then OFFSET/LIMIT
    arrow::Result<std::shared_ptr<Operator>> PlanSolutionModifiers(
        std::shared_ptr<Operator> input, const SolutionModifiers& modifiers, bool distinct,
        const std::vector<size_t>& key_columns);

    // EXISTS { pattern } for one row
    arrow::Result<bool> HasSolution(const QueryPattern& pattern, const BindingRow& row);

    arrow::Result<std::vector<size_t>> ColumnsOf(const std::vector<std::string>& names) const;

    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    std::shared_ptr<ExpressionEvaluator> evaluator_;
};

// Greedy join ordering for the triple patterns of one BGP
class QueryOptimizer {
public:
    explicit QueryOptimizer(const GraphStore& store) : store_(&store) {}

    // Estimated matches of a pattern, counting its constants only. An Absent slot
    // makes the estimate zero.
    size_t EstimateCardinality(const ScanPattern& pattern) const;

    // Start with the smallest pattern, then repeatedly take the cheapest pattern
    // connected to an already bound variable (or the cheapest overall if none is).
    std::vector<size_t> SelectJoinOrder(const std::vector<ScanPattern>& patterns,
                                        std::vector<bool> bound) const;

private:
    const GraphStore* store_;
};

// Helper functions for planning
namespace planning {

// Variables SELECT * projects: non-hidden variables bound by the pattern, in
// first-occurrence order; variables used only in FILTER are left out
std::vector<std::string> ProjectableVariables(const QueryPattern& pattern);

// Variables a pattern can bind (FILTER-only variables excluded)
std::vector<std::string> BindableVariables(const QueryPattern& pattern);

} // namespace planning

} // namespace sparql
} // namespace semgraph
