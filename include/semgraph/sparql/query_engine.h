#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>
#include <semgraph/execution/executor.h>
#include <semgraph/sparql/ast.h>
#include <semgraph/sparql/planner.h>
#include <semgraph/storage/graph_store.h>

namespace semgraph {

// Kinds of query failure reported to callers
enum class QueryErrorKind {
    Validation,  // rejected before execution (syntax, update forms, unsupported constructs)
    Timeout,     // deadline exceeded; no rows are returned
    Execution    // internal failure while running a valid query
};

std::string_view toString(QueryErrorKind kind);

// Kind of a failed query status; std::nullopt for OK
std::optional<QueryErrorKind> ClassifyQueryError(const arrow::Status& status);

// One result row: variable name -> stringified term, std::nullopt for unbound
using QueryRow = std::map<std::string, std::optional<std::string>>;

struct QueryResult {
    std::vector<std::string> columns;
    std::vector<QueryRow> rows;
    QueryStats stats;
};

struct QueryOptions {
    size_t max_results = 1000;
    std::chrono::milliseconds timeout{30000};
    size_t batch_size = 1024;
    size_t deadline_check_interval = 256;
};

namespace sparql {

// SPARQL query execution engine over one pinned graph generation.
//
// Row shapes:
//   SELECT     one row per solution, keyed by projected variable
//   ASK        exactly one row {"ask": "true" | "false"}
//   CONSTRUCT  one row per distinct derived triple {"subject", "predicate", "object"}
//   DESCRIBE   same shape as CONSTRUCT: the outgoing triples of each described resource
//
// At most max_results rows are produced and execution stops pulling as soon as the
// cap is reached. Errors follow QueryErrorKind: Status::Invalid for validation,
// Status::Cancelled for timeouts, Status::ExecutionError for everything else.
class QueryEngine {
public:
    explicit QueryEngine(std::shared_ptr<const GraphStore> store) : store_(std::move(store)) {}

    arrow::Result<QueryResult> Execute(const std::string& query_text,
                                       const QueryOptions& options);

    // Operator tree the query would run with
    arrow::Result<std::string> Explain(const std::string& query_text,
                                       const QueryOptions& options);

private:
    arrow::Result<QueryResult> Run(const std::string& query_text, const QueryOptions& options);
    arrow::Result<Query> Validate(const std::string& query_text,
                                  const QueryOptions& options) const;

    arrow::Result<QueryResult> RunSelect(const SelectQuery& query, ExecutionContext& ctx,
                                         const QueryOptions& options);
    arrow::Result<QueryResult> RunAsk(const AskQuery& query, ExecutionContext& ctx);
    arrow::Result<QueryResult> RunConstruct(const ConstructQuery& query, ExecutionContext& ctx,
                                            const QueryOptions& options);
    arrow::Result<QueryResult> RunDescribe(const DescribeQuery& query, ExecutionContext& ctx,
                                           const QueryOptions& options);

    std::shared_ptr<const GraphStore> store_;
};

} // namespace sparql
} // namespace semgraph
