#include <semgraph/sparql/planner.h>
#include <semgraph/operators/apply.h>
#include <semgraph/operators/bind.h>
#include <semgraph/operators/sort.h>
#include <semgraph/util/logging.h>
#include <algorithm>
#include <limits>
#include <sstream>
#include <tuple>

namespace semgraph {
namespace sparql {

SEMGRAPH_LOG_TAG(Planner);

namespace {

void AddName(const std::string& name, std::vector<std::string>& out) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(name);
    }
}

void AddTermVariable(const RDFTerm& term, std::vector<std::string>& out) {
    if (const auto* var = std::get_if<Variable>(&term)) {
        AddName(var->name, out);
    }
}

void CollectBindable(const QueryPattern& pattern, std::vector<std::string>& out) {
    if (pattern.bgp) {
        for (const auto& triple : pattern.bgp->triples) {
            AddTermVariable(triple.subject, out);
            AddTermVariable(triple.predicate, out);
            AddTermVariable(triple.object, out);
        }
    }
    for (const auto& values : pattern.values) {
        for (const auto& var : values.variables) {
            AddName(var.name, out);
        }
    }
    for (const auto& union_pattern : pattern.unions) {
        for (const auto& branch : union_pattern.patterns) {
            CollectBindable(*branch, out);
        }
    }
    for (const auto& optional : pattern.optionals) {
        CollectBindable(*optional.pattern, out);
    }
    for (const auto& bind : pattern.binds) {
        AddName(bind.alias.name, out);
    }
}

std::vector<size_t> SlotColumns(const ScanPattern& pattern) {
    std::vector<size_t> columns;
    for (const PatternSlot* slot : {&pattern.subject, &pattern.predicate, &pattern.object}) {
        if (slot->kind == PatternSlot::Kind::Variable) {
            columns.push_back(slot->column);
        }
    }
    return columns;
}

} // namespace

// ============================================================================
// planning helpers
// ============================================================================

namespace planning {

std::vector<std::string> BindableVariables(const QueryPattern& pattern) {
    std::vector<std::string> out;
    CollectBindable(pattern, out);
    return out;
}

std::vector<std::string> ProjectableVariables(const QueryPattern& pattern) {
    std::vector<std::string> out;
    for (auto& name : BindableVariables(pattern)) {
        if (!Variable(name).IsHidden()) {
            out.push_back(std::move(name));
        }
    }
    return out;
}

} // namespace planning

// ============================================================================
// QueryOptimizer
// ============================================================================

size_t QueryOptimizer::EstimateCardinality(const ScanPattern& pattern) const {
    if (!pattern.IsSatisfiable()) {
        return 0;
    }
    semgraph::TriplePattern constants;
    if (pattern.subject.kind == PatternSlot::Kind::Constant) constants.subject = pattern.subject.id;
    if (pattern.predicate.kind == PatternSlot::Kind::Constant) constants.predicate = pattern.predicate.id;
    if (pattern.object.kind == PatternSlot::Kind::Constant) constants.object = pattern.object.id;
    return store_->index().EstimateCardinality(constants);
}

std::vector<size_t> QueryOptimizer::SelectJoinOrder(const std::vector<ScanPattern>& patterns,
                                                    std::vector<bool> bound) const {
    std::vector<size_t> estimates;
    estimates.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        estimates.push_back(EstimateCardinality(pattern));
    }

    std::vector<size_t> order;
    std::vector<bool> used(patterns.size(), false);
    while (order.size() < patterns.size()) {
        size_t best = patterns.size();
        std::tuple<int, size_t, size_t> best_key{std::numeric_limits<int>::max(), 0, 0};

        for (size_t i = 0; i < patterns.size(); ++i) {
            if (used[i]) continue;
            size_t bound_columns = 0;
            for (size_t column : SlotColumns(patterns[i])) {
                if (column < bound.size() && bound[column]) bound_columns++;
            }
            // Empty patterns first, then connected ones, cheapest first
            int tier = estimates[i] == 0 ? 0 : (bound_columns > 0 ? 1 : 2);
            std::tuple<int, size_t, size_t> key{tier, estimates[i] / (1 + bound_columns), i};
            if (best == patterns.size() || key < best_key) {
                best = i;
                best_key = key;
            }
        }

        used[best] = true;
        order.push_back(best);
        for (size_t column : SlotColumns(patterns[best])) {
            if (column < bound.size()) bound[column] = true;
        }
    }
    return order;
}

// ============================================================================
// QueryPlanner
// ============================================================================

arrow::Status QueryPlanner::InitLayout(std::vector<std::string> variables) {
    layout_ = std::make_shared<const VariableLayout>(std::move(variables));
    evaluator_ = std::make_shared<ExpressionEvaluator>(
        *ctx_, layout_,
        [this](const QueryPattern& pattern, const BindingRow& row) {
            return HasSolution(pattern, row);
        });
    return arrow::Status::OK();
}

arrow::Result<std::vector<size_t>> QueryPlanner::ColumnsOf(
    const std::vector<std::string>& names) const {
    std::vector<size_t> columns;
    columns.reserve(names.size());
    for (const auto& name : names) {
        auto column = layout_->IndexOf(name);
        if (!column) {
            return arrow::Status::Invalid("Unknown variable ?", name);
        }
        columns.push_back(*column);
    }
    return columns;
}

arrow::Result<PatternSlot> QueryPlanner::TermToSlot(const RDFTerm& term) const {
    if (const auto* var = std::get_if<Variable>(&term)) {
        auto column = layout_->IndexOf(var->name);
        if (!column) {
            return arrow::Status::Invalid("Unknown variable ", var->ToString());
        }
        return PatternSlot::Variable(*column);
    }
    auto constant = AsConstant(term);
    if (!constant) {
        return PatternSlot::Absent();
    }
    auto id = ctx_->Lookup(*constant);
    if (!id) {
        return PatternSlot::Absent();
    }
    return PatternSlot::Constant(*id);
}

arrow::Result<PhysicalPlan> QueryPlanner::PlanSelectQuery(const SelectQuery& query) {
    std::vector<std::string> variables;
    CollectVariables(query.where, variables);
    for (const auto& var : query.select.variables) {
        AddName(var.name, variables);
    }
    for (const auto& key : query.modifiers.order_by) {
        CollectVariables(*key.expr, variables);
    }
    ARROW_RETURN_NOT_OK(InitLayout(std::move(variables)));

    PhysicalPlan plan;
    plan.layout = layout_;
    if (query.select.IsSelectAll()) {
        plan.output_columns = planning::ProjectableVariables(query.where);
    } else {
        for (const auto& var : query.select.variables) {
            plan.output_columns.push_back(var.name);
        }
    }
    ARROW_ASSIGN_OR_RAISE(plan.output_indices, ColumnsOf(plan.output_columns));

    ARROW_ASSIGN_OR_RAISE(auto root, PlanGroupPattern(query.where, layout_->EmptyRow()));
    ARROW_ASSIGN_OR_RAISE(plan.root_operator,
                          PlanSolutionModifiers(std::move(root), query.modifiers,
                                                query.select.distinct, plan.output_indices));
    return plan;
}

arrow::Result<PhysicalPlan> QueryPlanner::PlanAskQuery(const AskQuery& query) {
    std::vector<std::string> variables;
    CollectVariables(query.where, variables);
    ARROW_RETURN_NOT_OK(InitLayout(std::move(variables)));

    PhysicalPlan plan;
    plan.layout = layout_;
    ARROW_ASSIGN_OR_RAISE(auto root, PlanGroupPattern(query.where, layout_->EmptyRow()));
    plan.root_operator = std::make_shared<LimitOperator>(std::move(root), layout_, 0, 1);
    return plan;
}

arrow::Result<PhysicalPlan> QueryPlanner::PlanConstructQuery(const ConstructQuery& query) {
    std::vector<std::string> variables;
    CollectVariables(query.where, variables);
    std::vector<std::string> template_variables;
    for (const auto& triple : query.construct_template) {
        AddTermVariable(triple.subject, template_variables);
        AddTermVariable(triple.predicate, template_variables);
        AddTermVariable(triple.object, template_variables);
    }
    for (const auto& name : template_variables) {
        AddName(name, variables);
    }
    for (const auto& key : query.modifiers.order_by) {
        CollectVariables(*key.expr, variables);
    }
    ARROW_RETURN_NOT_OK(InitLayout(std::move(variables)));

    PhysicalPlan plan;
    plan.layout = layout_;
    plan.output_columns = std::move(template_variables);
    ARROW_ASSIGN_OR_RAISE(plan.output_indices, ColumnsOf(plan.output_columns));

    ARROW_ASSIGN_OR_RAISE(auto root, PlanGroupPattern(query.where, layout_->EmptyRow()));
    ARROW_ASSIGN_OR_RAISE(plan.root_operator,
                          PlanSolutionModifiers(std::move(root), query.modifiers, false, {}));
    return plan;
}

arrow::Result<PhysicalPlan> QueryPlanner::PlanDescribeQuery(const DescribeQuery& query) {
    std::vector<std::string> variables;
    if (query.where) {
        CollectVariables(*query.where, variables);
    }
    std::vector<std::string> described;
    if (query.describe_all && query.where) {
        described = planning::ProjectableVariables(*query.where);
    }
    for (const auto& resource : query.resources) {
        AddTermVariable(resource, described);
    }
    for (const auto& name : described) {
        AddName(name, variables);
    }
    for (const auto& key : query.modifiers.order_by) {
        CollectVariables(*key.expr, variables);
    }
    ARROW_RETURN_NOT_OK(InitLayout(std::move(variables)));

    PhysicalPlan plan;
    plan.layout = layout_;
    plan.output_columns = std::move(described);
    ARROW_ASSIGN_OR_RAISE(plan.output_indices, ColumnsOf(plan.output_columns));

    if (!query.where) {
        plan.root_operator = std::make_shared<ValuesOperator>(
            *ctx_, layout_, std::vector<BindingRow>{layout_->EmptyRow()}, "Describe");
        return plan;
    }
    ARROW_ASSIGN_OR_RAISE(auto root, PlanGroupPattern(*query.where, layout_->EmptyRow()));
    ARROW_ASSIGN_OR_RAISE(plan.root_operator,
                          PlanSolutionModifiers(std::move(root), query.modifiers, false, {}));
    return plan;
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanGroupPattern(
    const QueryPattern& pattern, const BindingRow& seed) {
    if (!layout_) {
        return arrow::Status::Invalid("Planner has no variable layout");
    }
    if (seed.size() != layout_->size()) {
        return arrow::Status::Invalid("Seed row does not match the variable layout");
    }

    std::shared_ptr<Operator> current = std::make_shared<ValuesOperator>(
        *ctx_, layout_, std::vector<BindingRow>{seed}, "Seed");

    std::vector<bool> bound(layout_->size(), false);
    for (size_t i = 0; i < seed.size(); ++i) {
        bound[i] = !seed[i].isUndefined();
    }

    // VALUES joins commutatively with the BGP; planned first so the scans see its
    // bindings
    for (const auto& values : pattern.values) {
        ARROW_ASSIGN_OR_RAISE(current, PlanValues(std::move(current), values));
        for (const auto& var : values.variables) {
            if (auto column = layout_->IndexOf(var.name)) {
                bound[*column] = true;
            }
        }
    }

    if (pattern.bgp && !pattern.bgp->triples.empty()) {
        ARROW_ASSIGN_OR_RAISE(current,
                              PlanBasicGraphPattern(std::move(current), *pattern.bgp, bound));
    }

    for (const auto& union_pattern : pattern.unions) {
        ARROW_ASSIGN_OR_RAISE(current, PlanUnion(std::move(current), union_pattern));
    }
    for (const auto& optional : pattern.optionals) {
        ARROW_ASSIGN_OR_RAISE(current, PlanOptional(std::move(current), optional));
    }
    for (const auto& bind : pattern.binds) {
        ARROW_ASSIGN_OR_RAISE(current, PlanBind(std::move(current), bind));
    }
    for (const auto& minus : pattern.minus_patterns) {
        ARROW_ASSIGN_OR_RAISE(current, PlanMinus(std::move(current), minus));
    }
    for (const auto& filter : pattern.filters) {
        ARROW_ASSIGN_OR_RAISE(current, PlanFilter(std::move(current), filter));
    }
    return current;
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanBasicGraphPattern(
    std::shared_ptr<Operator> input, const BasicGraphPattern& bgp, std::vector<bool> bound) {
    std::vector<ScanPattern> patterns;
    patterns.reserve(bgp.triples.size());
    for (const auto& triple : bgp.triples) {
        ScanPattern scan;
        ARROW_ASSIGN_OR_RAISE(scan.subject, TermToSlot(triple.subject));
        ARROW_ASSIGN_OR_RAISE(scan.predicate, TermToSlot(triple.predicate));
        ARROW_ASSIGN_OR_RAISE(scan.object, TermToSlot(triple.object));
        patterns.push_back(scan);
    }

    QueryOptimizer optimizer(ctx_->store());
    auto order = optimizer.SelectJoinOrder(patterns, std::move(bound));

    std::shared_ptr<Operator> current = std::move(input);
    for (size_t index : order) {
        SEMGRAPH_LOG_DEBUG(Planner) << "Scan " << patterns[index].ToString(*layout_)
                                    << " (estimate " << optimizer.EstimateCardinality(patterns[index])
                                    << ")";
        current = std::make_shared<TripleScanOperator>(std::move(current), *ctx_, layout_,
                                                       patterns[index]);
    }
    return current;
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanValues(
    std::shared_ptr<Operator> input, const ValuesClause& values) {
    std::vector<std::string> names;
    for (const auto& var : values.variables) {
        names.push_back(var.name);
    }
    ARROW_ASSIGN_OR_RAISE(auto columns, ColumnsOf(names));

    // Data rows as partial solutions; terms outside the graph get query-local IDs
    std::vector<BindingRow> data;
    data.reserve(values.rows.size());
    for (const auto& values_row : values.rows) {
        if (values_row.size() != columns.size()) {
            return arrow::Status::Invalid("VALUES row has ", values_row.size(),
                                          " values, expected ", columns.size());
        }
        BindingRow row = layout_->EmptyRow();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (!values_row[i]) {
                continue;
            }
            auto term = AsConstant(*values_row[i]);
            if (!term) {
                return arrow::Status::Invalid("VALUES data must be constant terms");
            }
            ARROW_ASSIGN_OR_RAISE(row[columns[i]], ctx_->Intern(*term));
        }
        data.push_back(std::move(row));
    }

    auto layout = layout_;
    ExecutionContext* ctx = ctx_;
    auto factory = [layout, ctx, data = std::move(data)](const BindingRow& seed)
        -> arrow::Result<std::shared_ptr<Operator>> {
        std::vector<BindingRow> merged;
        for (const auto& row : data) {
            if (!Compatible(seed, row)) {
                continue;
            }
            BindingRow out = seed;
            for (size_t i = 0; i < row.size(); ++i) {
                if (!row[i].isUndefined()) {
                    out[i] = row[i];
                }
            }
            merged.push_back(std::move(out));
        }
        return std::make_shared<ValuesOperator>(*ctx, layout, std::move(merged));
    };

    return std::make_shared<ApplyOperator>(std::move(input), *ctx_, layout_, std::move(factory),
                                           ApplyMode::Inner, values.ToString());
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanUnion(
    std::shared_ptr<Operator> input, const UnionPattern& union_pattern) {
    auto branches = union_pattern.patterns;
    auto factory = [this, branches](const BindingRow& seed)
        -> arrow::Result<std::shared_ptr<Operator>> {
        std::vector<std::shared_ptr<Operator>> plans;
        plans.reserve(branches.size());
        for (const auto& branch : branches) {
            ARROW_ASSIGN_OR_RAISE(auto plan, PlanGroupPattern(*branch, seed));
            plans.push_back(std::move(plan));
        }
        return std::make_shared<UnionOperator>(layout_, std::move(plans));
    };
    std::ostringstream description;
    description << "Union(" << branches.size() << " branches)";
    return std::make_shared<ApplyOperator>(std::move(input), *ctx_, layout_, std::move(factory),
                                           ApplyMode::Inner, description.str());
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanOptional(
    std::shared_ptr<Operator> input, const OptionalPattern& optional) {
    auto pattern = optional.pattern;
    auto factory = [this, pattern](const BindingRow& seed) {
        return PlanGroupPattern(*pattern, seed);
    };
    return std::make_shared<ApplyOperator>(std::move(input), *ctx_, layout_, std::move(factory),
                                           ApplyMode::LeftOuter,
                                           "Optional { " + pattern->ToString() + " }");
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanBind(std::shared_ptr<Operator> input,
                                                                const BindClause& bind) {
    auto column = layout_->IndexOf(bind.alias.name);
    if (!column) {
        return arrow::Status::Invalid("Unknown BIND target ", bind.alias.ToString());
    }
    auto evaluator = evaluator_;
    auto expr = bind.expr;
    auto value = [evaluator, expr](const BindingRow& row) {
        return evaluator->Evaluate(*expr, row);
    };
    return std::make_shared<BindOperator>(std::move(input), *ctx_, layout_, std::move(value),
                                          *column, expr->ToString());
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanMinus(std::shared_ptr<Operator> input,
                                                                 const MinusPattern& minus) {
    auto pattern = minus.pattern;
    ARROW_ASSIGN_OR_RAISE(auto shared_columns,
                          ColumnsOf(planning::BindableVariables(*pattern)));
    auto factory = [this, pattern](const BindingRow& seed) {
        return PlanGroupPattern(*pattern, seed);
    };
    return std::make_shared<ApplyOperator>(std::move(input), *ctx_, layout_, std::move(factory),
                                           ApplyMode::Anti,
                                           "Minus { " + pattern->ToString() + " }",
                                           std::move(shared_columns));
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanFilter(std::shared_ptr<Operator> input,
                                                                  const FilterClause& filter) {
    auto evaluator = evaluator_;
    auto expr = filter.expr;
    auto predicate = [evaluator, expr](const BindingRow& row) {
        return evaluator->EvaluateFilter(*expr, row);
    };
    return std::make_shared<FilterOperator>(std::move(input), *ctx_, layout_,
                                            std::move(predicate), expr->ToString());
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanOrderBy(
    std::shared_ptr<Operator> input, const std::vector<OrderBy>& order_by) {
    std::vector<SortKey> keys;
    keys.reserve(order_by.size());
    auto evaluator = evaluator_;
    for (const auto& order : order_by) {
        SortKey key;
        auto expr = order.expr;
        key.value = [evaluator, expr](const BindingRow& row) {
            return evaluator->Evaluate(*expr, row);
        };
        key.direction = order.direction == OrderDirection::Descending ? SortDirection::Descending
                                                                      : SortDirection::Ascending;
        key.description = order.ToString();
        keys.push_back(std::move(key));
    }
    return std::make_shared<SortOperator>(std::move(input), *ctx_, layout_, std::move(keys),
                                          CompareForOrder);
}

arrow::Result<std::shared_ptr<Operator>> QueryPlanner::PlanSolutionModifiers(
    std::shared_ptr<Operator> input, const SolutionModifiers& modifiers, bool distinct,
    const std::vector<size_t>& key_columns) {
    std::shared_ptr<Operator> current = std::move(input);
    if (!modifiers.order_by.empty()) {
        ARROW_ASSIGN_OR_RAISE(current, PlanOrderBy(std::move(current), modifiers.order_by));
    }
    if (distinct) {
        current = std::make_shared<DistinctOperator>(std::move(current), *ctx_, layout_,
                                                     key_columns);
    }
    if (modifiers.offset || modifiers.limit) {
        current = std::make_shared<LimitOperator>(std::move(current), layout_,
                                                  modifiers.offset.value_or(0), modifiers.limit);
    }
    return current;
}

arrow::Result<bool> QueryPlanner::HasSolution(const QueryPattern& pattern,
                                              const BindingRow& row) {
    ARROW_ASSIGN_OR_RAISE(auto plan, PlanGroupPattern(pattern, row));
    while (plan->HasNextBatch()) {
        ARROW_ASSIGN_OR_RAISE(auto batch, plan->GetNextBatch());
        if (!batch) {
            break;
        }
        if (batch->num_rows() > 0) {
            return true;
        }
    }
    return false;
}

} // namespace sparql
} // namespace semgraph
