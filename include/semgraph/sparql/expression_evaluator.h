#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <arrow/result.h>
#include <semgraph/execution/binding.h>
#include <semgraph/execution/execution_context.h>
#include <semgraph/sparql/ast.h>
#include <semgraph/types/term.h>

namespace semgraph {
namespace sparql {

// Decides EXISTS { pattern } for one row; supplied by the planner
using ExistsFn = std::function<arrow::Result<bool>(const QueryPattern& pattern, const BindingRow& row)>;

// Expression evaluator: computes FILTER, BIND and ORDER BY expressions row by row.
//
// Values are graph terms. A SPARQL type error (unbound variable, wrong operand kind,
// division by zero) evaluates to std::nullopt; a FILTER treats it as false, a BIND
// leaves its variable unbound. A failed Status is reserved for real failures such as
// an expired deadline inside an EXISTS sub-plan.
//
// REGEX runs on Arrow's RE2-backed string kernels, which match in time linear in
// the input.
class ExpressionEvaluator {
public:
    // REGEX arguments translated to an Arrow string kernel call, cached per flags and pattern
    struct RegexCall {
        std::string function;
        std::string pattern;
        bool ignore_case = false;
        bool valid = true;
    };

    ExpressionEvaluator(ExecutionContext& ctx, std::shared_ptr<const VariableLayout> layout,
                        ExistsFn exists = nullptr);

    arrow::Result<std::optional<Term>> Evaluate(const Expression& expr, const BindingRow& row);

    // Effective boolean value of expr; errors count as false
    arrow::Result<bool> EvaluateFilter(const Expression& expr, const BindingRow& row);

private:
    arrow::Result<std::optional<bool>> EvaluateBoolean(const Expression& expr, const BindingRow& row);
    arrow::Result<std::optional<Term>> EvaluateLogical(const Expression& expr, const BindingRow& row);
    arrow::Result<std::optional<Term>> EvaluateIn(const Expression& expr, const BindingRow& row);
    arrow::Result<std::optional<Term>> EvaluateFunction(const Expression& expr, const BindingRow& row);
    arrow::Result<std::optional<Term>> EvaluateRegex(const Term& text, const Term& pattern,
                                                     const std::optional<Term>& flags);

    std::optional<Term> VariableValue(const std::string& name, const BindingRow& row) const;

    ExecutionContext* ctx_;
    std::shared_ptr<const VariableLayout> layout_;
    ExistsFn exists_;
    std::unordered_map<std::string, RegexCall> regex_cache_;
};

Term MakeBooleanLiteral(bool value);

// Numeric value of a literal with a numeric XSD datatype
std::optional<double> NumericValue(const Term& term);

// Effective boolean value; std::nullopt where it is a type error
std::optional<bool> EffectiveBooleanValue(const Term& term);

// RDF term equality as used by '=', IN and !=; std::nullopt for incomparable terms
std::optional<bool> TermsEqual(const Term& a, const Term& b);

// ORDER BY ordering: unbound < blank nodes < IRIs < literals. Numeric literals
// compare by value, other literals by lexical form.
int CompareForOrder(const std::optional<Term>& a, const std::optional<Term>& b);

} // namespace sparql
} // namespace semgraph
