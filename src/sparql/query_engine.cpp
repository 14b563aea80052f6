#include <semgraph/sparql/query_engine.h>
#include <semgraph/sparql/parser.h>
#include <semgraph/util/logging.h>
#include <semgraph/util/string_util.h>
#include <exception>
#include <unordered_set>

namespace semgraph {

SEMGRAPH_LOG_TAG(QueryEngine);

namespace {

constexpr std::string_view kValidationPrefix = "Query validation failed: ";
constexpr std::string_view kExecutionPrefix = "Query execution failed: ";

arrow::Status ValidationError(const arrow::Status& status) {
    return arrow::Status::Invalid(kValidationPrefix, status.message());
}

// Statuses raised while running a plan: timeouts pass through, the rest are
// execution failures
arrow::Status ExecutionFailure(const arrow::Status& status) {
    if (status.IsCancelled()) {
        return status;
    }
    if (status.IsExecutionError() && StartsWith(status.message(), kExecutionPrefix)) {
        return status;
    }
    return arrow::Status::ExecutionError(kExecutionPrefix, status.message());
}

// Planner errors: invalid queries are validation errors
arrow::Status PlanningFailure(const arrow::Status& status) {
    return status.IsInvalid() ? ValidationError(status) : ExecutionFailure(status);
}

std::optional<std::string> Stringify(ExecutionContext& ctx, ValueId id) {
    if (id.isUndefined()) {
        return std::nullopt;
    }
    const Term* term = ctx.FindTerm(id);
    if (term == nullptr) {
        return std::nullopt;
    }
    return LexicalForm(*term);
}

QueryRow TripleRow(const Triple& triple) {
    QueryRow row;
    row["subject"] = LexicalForm(triple.subject);
    row["predicate"] = triple.predicate.value;
    row["object"] = LexicalForm(triple.object);
    return row;
}

const std::vector<std::string>& TripleColumns() {
    static const std::vector<std::string> columns = {"subject", "predicate", "object"};
    return columns;
}

// Distinct triples, in first-seen order, up to a cap
class TripleCollector {
public:
    explicit TripleCollector(size_t cap) : cap_(cap) {}

    void Add(Triple triple) {
        if (Full() || !seen_.insert(triple).second) {
            return;
        }
        rows_.push_back(TripleRow(triple));
    }

    bool Full() const { return rows_.size() >= cap_; }

    std::vector<QueryRow> TakeRows() { return std::move(rows_); }

private:
    size_t cap_;
    std::unordered_set<Triple> seen_;
    std::vector<QueryRow> rows_;
};

// Term of a template position for one solution; std::nullopt if unbound
std::optional<Term> InstantiateTerm(const sparql::RDFTerm& term, const BindingRow& row,
                                    const sparql::PhysicalPlan& plan, ExecutionContext& ctx,
                                    size_t solution_index) {
    if (const auto* var = std::get_if<sparql::Variable>(&term)) {
        auto column = plan.layout->IndexOf(var->name);
        if (!column || row[*column].isUndefined()) {
            return std::nullopt;
        }
        const Term* value = ctx.FindTerm(row[*column]);
        if (value == nullptr) {
            return std::nullopt;
        }
        return *value;
    }
    if (const auto* blank = std::get_if<BlankNode>(&term)) {
        // Fresh blank node per solution
        return BlankNode(blank->id + "_" + std::to_string(solution_index));
    }
    return sparql::AsConstant(term);
}

} // namespace

std::string_view toString(QueryErrorKind kind) {
    switch (kind) {
        case QueryErrorKind::Validation: return "QueryValidationError";
        case QueryErrorKind::Timeout: return "QueryTimeoutError";
        case QueryErrorKind::Execution: return "QueryExecutionError";
    }
    return "Unknown";
}

std::optional<QueryErrorKind> ClassifyQueryError(const arrow::Status& status) {
    if (status.ok()) {
        return std::nullopt;
    }
    if (status.IsInvalid()) {
        return QueryErrorKind::Validation;
    }
    if (status.IsCancelled()) {
        return QueryErrorKind::Timeout;
    }
    return QueryErrorKind::Execution;
}

namespace sparql {

arrow::Result<QueryResult> QueryEngine::Execute(const std::string& query_text,
                                                const QueryOptions& options) {
    arrow::Result<QueryResult> result;
    try {
        result = Run(query_text, options);
    } catch (const std::exception& e) {
        result = arrow::Status::ExecutionError(kExecutionPrefix, e.what());
    }

    if (!result.ok()) {
        const auto& status = result.status();
        switch (*ClassifyQueryError(status)) {
            case QueryErrorKind::Validation:
                SEMGRAPH_LOG_DEBUG(QueryEngine) << "Rejected query: " << status.message();
                break;
            case QueryErrorKind::Timeout:
                SEMGRAPH_LOG_WARN(QueryEngine) << status.message() << " (generation "
                                               << store_->generation() << ")";
                break;
            case QueryErrorKind::Execution:
                SEMGRAPH_LOG_ERROR(QueryEngine) << status.message();
                break;
        }
    }
    return result;
}

arrow::Result<Query> QueryEngine::Validate(const std::string& query_text,
                                           const QueryOptions& options) const {
    if (Trim(query_text).empty()) {
        return arrow::Status::Invalid(kValidationPrefix, "empty query");
    }
    if (options.timeout.count() <= 0) {
        return arrow::Status::Invalid(kValidationPrefix, "timeout must be positive");
    }
    if (options.max_results == 0) {
        return arrow::Status::Invalid(kValidationPrefix, "max_results must be positive");
    }
    if (options.batch_size == 0) {
        return arrow::Status::Invalid(kValidationPrefix, "batch size must be positive");
    }

    auto parsed = ParseSPARQL(query_text);
    if (!parsed.ok()) {
        return ValidationError(parsed.status());
    }
    return parsed.MoveValueUnsafe();
}

arrow::Result<QueryResult> QueryEngine::Run(const std::string& query_text,
                                            const QueryOptions& options) {
    ARROW_ASSIGN_OR_RAISE(auto query, Validate(query_text, options));

    ExecutionContext ctx(store_, options.batch_size, options.timeout,
                         options.deadline_check_interval);
    SEMGRAPH_LOG_DEBUG(QueryEngine) << "Executing " << query.ToString() << " on generation "
                                    << store_->generation();

    if (const auto* select = std::get_if<SelectQuery>(&query.query_body)) {
        return RunSelect(*select, ctx, options);
    }
    if (const auto* ask = std::get_if<AskQuery>(&query.query_body)) {
        return RunAsk(*ask, ctx);
    }
    if (const auto* construct = std::get_if<ConstructQuery>(&query.query_body)) {
        return RunConstruct(*construct, ctx, options);
    }
    return RunDescribe(std::get<DescribeQuery>(query.query_body), ctx, options);
}

arrow::Result<std::string> QueryEngine::Explain(const std::string& query_text,
                                                const QueryOptions& options) {
    ARROW_ASSIGN_OR_RAISE(auto query, Validate(query_text, options));
    ExecutionContext ctx(store_, options.batch_size, options.timeout,
                         options.deadline_check_interval);
    QueryPlanner planner(ctx);

    arrow::Result<PhysicalPlan> plan;
    if (const auto* select = std::get_if<SelectQuery>(&query.query_body)) {
        plan = planner.PlanSelectQuery(*select);
    } else if (const auto* ask = std::get_if<AskQuery>(&query.query_body)) {
        plan = planner.PlanAskQuery(*ask);
    } else if (const auto* construct = std::get_if<ConstructQuery>(&query.query_body)) {
        plan = planner.PlanConstructQuery(*construct);
    } else {
        plan = planner.PlanDescribeQuery(std::get<DescribeQuery>(query.query_body));
    }
    if (!plan.ok()) {
        return PlanningFailure(plan.status());
    }

    QueryExecutor executor(ctx);
    return executor.ExplainPlan(plan->root_operator);
}

arrow::Result<QueryResult> QueryEngine::RunSelect(const SelectQuery& query,
                                                  ExecutionContext& ctx,
                                                  const QueryOptions& options) {
    QueryPlanner planner(ctx);
    auto planned = planner.PlanSelectQuery(query);
    if (!planned.ok()) {
        return PlanningFailure(planned.status());
    }
    const PhysicalPlan& plan = *planned;

    QueryExecutor executor(ctx);
    auto rows = executor.CollectRows(plan.root_operator, options.max_results);
    if (!rows.ok()) {
        return ExecutionFailure(rows.status());
    }

    QueryResult result;
    result.columns = plan.output_columns;
    result.rows.reserve(rows->size());
    for (const auto& row : *rows) {
        QueryRow out;
        for (size_t i = 0; i < plan.output_columns.size(); ++i) {
            out[plan.output_columns[i]] = Stringify(ctx, row[plan.output_indices[i]]);
        }
        result.rows.push_back(std::move(out));
    }
    result.stats = executor.GetStats();
    return result;
}

arrow::Result<QueryResult> QueryEngine::RunAsk(const AskQuery& query, ExecutionContext& ctx) {
    QueryPlanner planner(ctx);
    auto planned = planner.PlanAskQuery(query);
    if (!planned.ok()) {
        return PlanningFailure(planned.status());
    }

    QueryExecutor executor(ctx);
    auto rows = executor.CollectRows(planned->root_operator, 1);
    if (!rows.ok()) {
        return ExecutionFailure(rows.status());
    }

    QueryResult result;
    result.columns = {"ask"};
    QueryRow row;
    row["ask"] = std::string(rows->empty() ? "false" : "true");
    result.rows.push_back(std::move(row));
    result.stats = executor.GetStats();
    return result;
}

arrow::Result<QueryResult> QueryEngine::RunConstruct(const ConstructQuery& query,
                                                     ExecutionContext& ctx,
                                                     const QueryOptions& options) {
    QueryPlanner planner(ctx);
    auto planned = planner.PlanConstructQuery(query);
    if (!planned.ok()) {
        return PlanningFailure(planned.status());
    }
    const PhysicalPlan& plan = *planned;

    TripleCollector collector(options.max_results);
    size_t solution_index = 0;
    QueryExecutor executor(ctx);
    auto status = executor.ExecuteStreaming(
        plan.root_operator,
        [&](const std::shared_ptr<arrow::RecordBatch>& batch) -> arrow::Result<bool> {
            ARROW_ASSIGN_OR_RAISE(auto rows, BatchToRows(*batch));
            for (const auto& row : rows) {
                for (const auto& pattern : query.construct_template) {
                    auto s = InstantiateTerm(pattern.subject, row, plan, ctx, solution_index);
                    auto p = InstantiateTerm(pattern.predicate, row, plan, ctx, solution_index);
                    auto o = InstantiateTerm(pattern.object, row, plan, ctx, solution_index);
                    if (!s || !p || !o) {
                        continue;
                    }
                    // Ill-formed instantiations (literal subject, non-IRI predicate) are dropped
                    auto triple = Triple::Make(std::move(*s), std::move(*p), std::move(*o));
                    if (triple.ok()) {
                        collector.Add(triple.MoveValueUnsafe());
                    }
                }
                solution_index++;
                if (collector.Full()) {
                    return false;
                }
            }
            return true;
        });
    if (!status.ok()) {
        return ExecutionFailure(status);
    }

    QueryResult result;
    result.columns = TripleColumns();
    result.rows = collector.TakeRows();
    result.stats = executor.GetStats();
    result.stats.rows_returned = result.rows.size();
    return result;
}

arrow::Result<QueryResult> QueryEngine::RunDescribe(const DescribeQuery& query,
                                                    ExecutionContext& ctx,
                                                    const QueryOptions& options) {
    QueryPlanner planner(ctx);
    auto planned = planner.PlanDescribeQuery(query);
    if (!planned.ok()) {
        return PlanningFailure(planned.status());
    }
    const PhysicalPlan& plan = *planned;
    const GraphStore& store = ctx.store();

    TripleCollector collector(options.max_results);
    std::unordered_set<uint64_t> described;

    // Outgoing triples of one resource
    auto describe = [&](ValueId id) -> arrow::Status {
        if (id.isUndefined() || !described.insert(id.getBits()).second) {
            return arrow::Status::OK();
        }
        semgraph::TriplePattern pattern;
        pattern.subject = id;
        for (const IdTriple& t : store.index().Lookup(pattern)) {
            ARROW_RETURN_NOT_OK(ctx.Tick());
            const Term* s = store.TermOf(t.subject);
            const Term* p = store.TermOf(t.predicate);
            const Term* o = store.TermOf(t.object);
            if (s == nullptr || p == nullptr || o == nullptr) {
                return arrow::Status::Invalid("Triple refers to an unknown term");
            }
            auto triple = Triple::Make(*s, *p, *o);
            if (triple.ok()) {
                collector.Add(triple.MoveValueUnsafe());
            }
            if (collector.Full()) {
                break;
            }
        }
        return arrow::Status::OK();
    };

    // Constant resources once, variables per solution
    std::vector<ValueId> constants;
    for (const auto& resource : query.resources) {
        if (IsVariable(resource)) {
            continue;
        }
        auto term = AsConstant(resource);
        if (!term) {
            continue;
        }
        if (auto id = store.Lookup(*term)) {
            constants.push_back(*id);
        }
    }

    for (ValueId id : constants) {
        auto described_status = describe(id);
        if (!described_status.ok()) {
            return ExecutionFailure(described_status);
        }
    }

    QueryExecutor executor(ctx);
    auto status = executor.ExecuteStreaming(
        plan.root_operator,
        [&](const std::shared_ptr<arrow::RecordBatch>& batch) -> arrow::Result<bool> {
            if (collector.Full()) {
                return false;
            }
            ARROW_ASSIGN_OR_RAISE(auto rows, BatchToRows(*batch));
            for (const auto& row : rows) {
                for (size_t column : plan.output_indices) {
                    ARROW_RETURN_NOT_OK(describe(row[column]));
                    if (collector.Full()) {
                        return false;
                    }
                }
            }
            return !collector.Full();
        });
    if (!status.ok()) {
        return ExecutionFailure(status);
    }

    QueryResult result;
    result.columns = TripleColumns();
    result.rows = collector.TakeRows();
    result.stats = executor.GetStats();
    result.stats.rows_returned = result.rows.size();
    return result;
}

} // namespace sparql
} // namespace semgraph
