#include <semgraph/sparql/expression_evaluator.h>
#include <arrow/compute/api.h>
#include <arrow/scalar.h>
#include <arrow/util/int_util_overflow.h>
#include <semgraph/ontology/vocab.h>
#include <semgraph/util/string_util.h>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace semgraph {
namespace sparql {

namespace {

enum class NumericKind { Integer, Decimal, Double };

// String-like literal: no language tag, no datatype or xsd:string
bool IsSimpleString(const Literal& lit) {
    return lit.language.empty() && (lit.datatype.empty() || lit.datatype == vocab::kXsdString);
}

// Literal usable as a string argument (simple string or language-tagged)
const Literal* AsStringLiteral(const Term& term) {
    const auto* lit = std::get_if<Literal>(&term);
    if (lit == nullptr) {
        return nullptr;
    }
    if (IsSimpleString(*lit) || lit->HasLanguage()) {
        return lit;
    }
    return nullptr;
}

std::optional<NumericKind> NumericKindOf(const Term& term) {
    const auto* lit = std::get_if<Literal>(&term);
    if (lit == nullptr || !vocab::IsNumericDatatype(lit->datatype)) {
        return std::nullopt;
    }
    if (lit->datatype == vocab::kXsdDouble || EndsWith(lit->datatype, "#float")) {
        return NumericKind::Double;
    }
    if (lit->datatype == vocab::kXsdDecimal) {
        return NumericKind::Decimal;
    }
    return NumericKind::Integer;
}

std::optional<int64_t> IntegerValue(const Term& term) {
    const auto* lit = std::get_if<Literal>(&term);
    if (lit == nullptr) {
        return std::nullopt;
    }
    std::string_view text = lit->value;
    if (!text.empty() && text[0] == '+') {
        text.remove_prefix(1);
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string FormatDouble(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

Term MakeNumber(double value, NumericKind kind) {
    switch (kind) {
        case NumericKind::Integer:
            // Integers past the int64 range are reported as decimals
            if (value >= -9223372036854775808.0 && value < 9223372036854775808.0) {
                return Literal(std::to_string(static_cast<int64_t>(value)), "",
                               std::string(vocab::kXsdInteger));
            }
            [[fallthrough]];
        case NumericKind::Decimal:
            return Literal(FormatDouble(value), "", std::string(vocab::kXsdDecimal));
        case NumericKind::Double:
            break;
    }
    return Literal(FormatDouble(value), "", std::string(vocab::kXsdDouble));
}

// Maps SPARQL REGEX flags onto an Arrow string-matching kernel. 's' and 'm' become
// RE2 inline flags, 'q' selects literal matching. RE2 has no free-spacing mode, so
// 'x' and any other flag make the call invalid.
ExpressionEvaluator::RegexCall MakeRegexCall(const std::string& pattern, const std::string& flags) {
    ExpressionEvaluator::RegexCall call;
    call.function = "match_substring_regex";
    std::string inline_flags;
    bool literal = false;
    for (char c : flags) {
        switch (c) {
            case 'i': call.ignore_case = true; break;
            case 's':
            case 'm':
                if (inline_flags.find(c) == std::string::npos) {
                    inline_flags.push_back(c);
                }
                break;
            case 'q': literal = true; break;
            default:
                call.valid = false;
                return call;
        }
    }
    if (literal) {
        call.function = "match_substring";
        call.pattern = pattern;
    } else if (!inline_flags.empty()) {
        call.pattern = "(?" + inline_flags + ")" + pattern;
    } else {
        call.pattern = pattern;
    }
    return call;
}

arrow::Status EnsureComputeKernels() {
    static const arrow::Status status = arrow::compute::Initialize();
    return status;
}

Term MakeInteger(int64_t value) {
    return Literal(std::to_string(value), "", std::string(vocab::kXsdInteger));
}

Term MakeString(std::string value, std::string language = "") {
    return Literal(std::move(value), std::move(language));
}

size_t Utf8Length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

// Three-way comparison for <, <=, >, >=; std::nullopt for incomparable operands
std::optional<int> CompareValues(const Term& a, const Term& b) {
    auto na = NumericValue(a);
    auto nb = NumericValue(b);
    if (na && nb) {
        if (std::isnan(*na) || std::isnan(*nb)) {
            return std::nullopt;
        }
        return *na < *nb ? -1 : (*na > *nb ? 1 : 0);
    }

    const auto* la = std::get_if<Literal>(&a);
    const auto* lb = std::get_if<Literal>(&b);
    if (la && lb) {
        bool comparable = (IsSimpleString(*la) && IsSimpleString(*lb)) ||
                          (la->HasLanguage() && la->language == lb->language) ||
                          (!la->datatype.empty() && la->datatype == lb->datatype);
        if (!comparable) {
            return std::nullopt;
        }
        int cmp = la->value.compare(lb->value);
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }

    const auto* ia = std::get_if<Iri>(&a);
    const auto* ib = std::get_if<Iri>(&b);
    if (ia && ib) {
        int cmp = ia->value.compare(ib->value);
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    return std::nullopt;
}

int KindRank(const Term& term) {
    switch (KindOf(term)) {
        case TermKind::BlankNode: return 1;
        case TermKind::IRI: return 2;
        case TermKind::Literal: return 3;
    }
    return 4;
}

} // namespace

// ============================================================================
// Free helpers
// ============================================================================

Term MakeBooleanLiteral(bool value) {
    return Literal(value ? "true" : "false", "", std::string(vocab::kXsdBoolean));
}

std::optional<double> NumericValue(const Term& term) {
    const auto* lit = std::get_if<Literal>(&term);
    if (lit == nullptr || !vocab::IsNumericDatatype(lit->datatype) || lit->value.empty()) {
        return std::nullopt;
    }
    const char* begin = lit->value.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end != begin + lit->value.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> EffectiveBooleanValue(const Term& term) {
    const auto* lit = std::get_if<Literal>(&term);
    if (lit == nullptr) {
        return std::nullopt;
    }
    if (lit->datatype == vocab::kXsdBoolean) {
        if (lit->value == "true" || lit->value == "1") return true;
        if (lit->value == "false" || lit->value == "0") return false;
        return std::nullopt;
    }
    if (vocab::IsNumericDatatype(lit->datatype)) {
        auto value = NumericValue(term);
        if (!value) {
            return false;
        }
        return !std::isnan(*value) && *value != 0.0;
    }
    if (IsSimpleString(*lit) || lit->HasLanguage()) {
        return !lit->value.empty();
    }
    return std::nullopt;
}

std::optional<bool> TermsEqual(const Term& a, const Term& b) {
    auto na = NumericValue(a);
    auto nb = NumericValue(b);
    if (na && nb) {
        return *na == *nb;
    }

    const auto* la = std::get_if<Literal>(&a);
    const auto* lb = std::get_if<Literal>(&b);
    if (la && lb) {
        if (IsSimpleString(*la) && IsSimpleString(*lb)) {
            return la->value == lb->value;
        }
        return *la == *lb;
    }
    return a == b;
}

int CompareForOrder(const std::optional<Term>& a, const std::optional<Term>& b) {
    if (!a || !b) {
        return (a ? 1 : 0) - (b ? 1 : 0);
    }
    int rank_a = KindRank(*a);
    int rank_b = KindRank(*b);
    if (rank_a != rank_b) {
        return rank_a < rank_b ? -1 : 1;
    }

    auto na = NumericValue(*a);
    auto nb = NumericValue(*b);
    if (na && nb && *na != *nb) {
        return *na < *nb ? -1 : 1;
    }

    int cmp = LexicalForm(*a).compare(LexicalForm(*b));
    if (cmp != 0) {
        return cmp < 0 ? -1 : 1;
    }
    const auto* la = std::get_if<Literal>(&*a);
    const auto* lb = std::get_if<Literal>(&*b);
    if (la && lb) {
        if (la->language != lb->language) {
            return la->language < lb->language ? -1 : 1;
        }
        if (la->datatype != lb->datatype) {
            return la->datatype < lb->datatype ? -1 : 1;
        }
    }
    return 0;
}

// ============================================================================
// ExpressionEvaluator
// ============================================================================

ExpressionEvaluator::ExpressionEvaluator(ExecutionContext& ctx,
                                         std::shared_ptr<const VariableLayout> layout,
                                         ExistsFn exists)
    : ctx_(&ctx), layout_(std::move(layout)), exists_(std::move(exists)) {}

std::optional<Term> ExpressionEvaluator::VariableValue(const std::string& name,
                                                       const BindingRow& row) const {
    auto column = layout_->IndexOf(name);
    if (!column || row[*column].isUndefined()) {
        return std::nullopt;
    }
    const Term* term = ctx_->FindTerm(row[*column]);
    if (term == nullptr) {
        return std::nullopt;
    }
    return *term;
}

arrow::Result<bool> ExpressionEvaluator::EvaluateFilter(const Expression& expr,
                                                        const BindingRow& row) {
    ARROW_ASSIGN_OR_RAISE(auto value, EvaluateBoolean(expr, row));
    return value.value_or(false);
}

arrow::Result<std::optional<bool>> ExpressionEvaluator::EvaluateBoolean(const Expression& expr,
                                                                        const BindingRow& row) {
    ARROW_ASSIGN_OR_RAISE(auto value, Evaluate(expr, row));
    if (!value) {
        return std::optional<bool>();
    }
    return EffectiveBooleanValue(*value);
}

arrow::Result<std::optional<Term>> ExpressionEvaluator::Evaluate(const Expression& expr,
                                                                 const BindingRow& row) {
    switch (expr.op) {
        case ExprOperator::Constant: {
            if (!expr.constant) {
                return std::optional<Term>();
            }
            if (const auto* var = std::get_if<Variable>(&*expr.constant)) {
                return VariableValue(var->name, row);
            }
            return AsConstant(*expr.constant);
        }

        case ExprOperator::And:
        case ExprOperator::Or:
        case ExprOperator::Not:
            return EvaluateLogical(expr, row);

        case ExprOperator::Equal:
        case ExprOperator::NotEqual:
        case ExprOperator::LessThan:
        case ExprOperator::LessThanEqual:
        case ExprOperator::GreaterThan:
        case ExprOperator::GreaterThanEqual: {
            if (expr.arguments.size() != 2) {
                return arrow::Status::Invalid("Comparison requires two operands");
            }
            ARROW_ASSIGN_OR_RAISE(auto left, Evaluate(*expr.arguments[0], row));
            ARROW_ASSIGN_OR_RAISE(auto right, Evaluate(*expr.arguments[1], row));
            if (!left || !right) {
                return std::optional<Term>();
            }
            if (expr.op == ExprOperator::Equal || expr.op == ExprOperator::NotEqual) {
                auto equal = TermsEqual(*left, *right);
                if (!equal) {
                    return std::optional<Term>();
                }
                return std::optional<Term>(
                    MakeBooleanLiteral(expr.op == ExprOperator::Equal ? *equal : !*equal));
            }
            auto cmp = CompareValues(*left, *right);
            if (!cmp) {
                return std::optional<Term>();
            }
            bool result = false;
            switch (expr.op) {
                case ExprOperator::LessThan: result = *cmp < 0; break;
                case ExprOperator::LessThanEqual: result = *cmp <= 0; break;
                case ExprOperator::GreaterThan: result = *cmp > 0; break;
                case ExprOperator::GreaterThanEqual: result = *cmp >= 0; break;
                default: break;
            }
            return std::optional<Term>(MakeBooleanLiteral(result));
        }

        case ExprOperator::In:
        case ExprOperator::NotIn:
            return EvaluateIn(expr, row);

        case ExprOperator::Plus:
        case ExprOperator::Minus:
        case ExprOperator::Multiply:
        case ExprOperator::Divide: {
            if (expr.arguments.size() != 2) {
                return arrow::Status::Invalid("Arithmetic requires two operands");
            }
            ARROW_ASSIGN_OR_RAISE(auto left, Evaluate(*expr.arguments[0], row));
            ARROW_ASSIGN_OR_RAISE(auto right, Evaluate(*expr.arguments[1], row));
            if (!left || !right) {
                return std::optional<Term>();
            }
            auto kind_left = NumericKindOf(*left);
            auto kind_right = NumericKindOf(*right);
            auto a = NumericValue(*left);
            auto b = NumericValue(*right);
            if (!kind_left || !kind_right || !a || !b) {
                return std::optional<Term>();
            }
            NumericKind kind = std::max(*kind_left, *kind_right);

            if (kind == NumericKind::Integer && expr.op != ExprOperator::Divide) {
                auto ia = IntegerValue(*left);
                auto ib = IntegerValue(*right);
                if (ia && ib) {
                    int64_t result = 0;
                    bool overflow = false;
                    switch (expr.op) {
                        case ExprOperator::Plus:
                            overflow = arrow::internal::AddWithOverflow(*ia, *ib, &result);
                            break;
                        case ExprOperator::Minus:
                            overflow = arrow::internal::SubtractWithOverflow(*ia, *ib, &result);
                            break;
                        default:
                            overflow = arrow::internal::MultiplyWithOverflow(*ia, *ib, &result);
                            break;
                    }
                    if (!overflow) {
                        return std::optional<Term>(MakeInteger(result));
                    }
                    kind = NumericKind::Decimal;
                }
            }

            double result = 0.0;
            switch (expr.op) {
                case ExprOperator::Plus: result = *a + *b; break;
                case ExprOperator::Minus: result = *a - *b; break;
                case ExprOperator::Multiply: result = *a * *b; break;
                default:
                    if (*b == 0.0) {
                        return std::optional<Term>();
                    }
                    result = *a / *b;
                    if (kind == NumericKind::Integer) {
                        kind = NumericKind::Decimal;
                    }
                    break;
            }
            return std::optional<Term>(MakeNumber(result, kind));
        }

        case ExprOperator::Negate: {
            if (expr.arguments.size() != 1) {
                return arrow::Status::Invalid("Negation requires one operand");
            }
            ARROW_ASSIGN_OR_RAISE(auto operand, Evaluate(*expr.arguments[0], row));
            if (!operand) {
                return std::optional<Term>();
            }
            auto kind = NumericKindOf(*operand);
            if (!kind) {
                return std::optional<Term>();
            }
            if (*kind == NumericKind::Integer) {
                if (auto value = IntegerValue(*operand)) {
                    int64_t negated = 0;
                    if (!arrow::internal::SubtractWithOverflow(int64_t{0}, *value, &negated)) {
                        return std::optional<Term>(MakeInteger(negated));
                    }
                }
            }
            auto value = NumericValue(*operand);
            if (!value) {
                return std::optional<Term>();
            }
            return std::optional<Term>(MakeNumber(-*value, *kind));
        }

        case ExprOperator::Exists:
        case ExprOperator::NotExists: {
            if (!expr.exists_pattern) {
                return arrow::Status::Invalid("EXISTS without a graph pattern");
            }
            if (!exists_) {
                return arrow::Status::NotImplemented("EXISTS is not available in this context");
            }
            ARROW_ASSIGN_OR_RAISE(bool found, exists_(*expr.exists_pattern, row));
            return std::optional<Term>(
                MakeBooleanLiteral(expr.op == ExprOperator::Exists ? found : !found));
        }

        default:
            return EvaluateFunction(expr, row);
    }
}

arrow::Result<std::optional<Term>> ExpressionEvaluator::EvaluateLogical(const Expression& expr,
                                                                        const BindingRow& row) {
    if (expr.op == ExprOperator::Not) {
        if (expr.arguments.size() != 1) {
            return arrow::Status::Invalid("'!' requires one operand");
        }
        ARROW_ASSIGN_OR_RAISE(auto value, EvaluateBoolean(*expr.arguments[0], row));
        if (!value) {
            return std::optional<Term>();
        }
        return std::optional<Term>(MakeBooleanLiteral(!*value));
    }

    if (expr.arguments.size() != 2) {
        return arrow::Status::Invalid("Logical operator requires two operands");
    }
    ARROW_ASSIGN_OR_RAISE(auto left, EvaluateBoolean(*expr.arguments[0], row));

    // Short circuit; an error on one side is masked by a decisive other side
    bool is_and = expr.op == ExprOperator::And;
    if (left && *left != is_and) {
        return std::optional<Term>(MakeBooleanLiteral(*left));
    }
    ARROW_ASSIGN_OR_RAISE(auto right, EvaluateBoolean(*expr.arguments[1], row));
    if (right && *right != is_and) {
        return std::optional<Term>(MakeBooleanLiteral(*right));
    }
    if (!left || !right) {
        return std::optional<Term>();
    }
    return std::optional<Term>(MakeBooleanLiteral(is_and));
}

arrow::Result<std::optional<Term>> ExpressionEvaluator::EvaluateIn(const Expression& expr,
                                                                   const BindingRow& row) {
    if (expr.arguments.empty()) {
        return arrow::Status::Invalid("IN requires a left operand");
    }
    bool negate = expr.op == ExprOperator::NotIn;
    ARROW_ASSIGN_OR_RAISE(auto left, Evaluate(*expr.arguments[0], row));
    if (!left) {
        return std::optional<Term>();
    }

    bool saw_error = false;
    for (size_t i = 1; i < expr.arguments.size(); ++i) {
        ARROW_ASSIGN_OR_RAISE(auto candidate, Evaluate(*expr.arguments[i], row));
        if (!candidate) {
            saw_error = true;
            continue;
        }
        auto equal = TermsEqual(*left, *candidate);
        if (!equal) {
            saw_error = true;
        } else if (*equal) {
            return std::optional<Term>(MakeBooleanLiteral(!negate));
        }
    }
    if (saw_error) {
        return std::optional<Term>();
    }
    return std::optional<Term>(MakeBooleanLiteral(negate));
}

arrow::Result<std::optional<Term>> ExpressionEvaluator::EvaluateFunction(const Expression& expr,
                                                                         const BindingRow& row) {
    // BOUND inspects the variable itself, not its value
    if (expr.op == ExprOperator::Bound) {
        if (expr.arguments.size() != 1 || !expr.arguments[0]->constant ||
            !IsVariable(*expr.arguments[0]->constant)) {
            return arrow::Status::Invalid("BOUND requires a variable");
        }
        const auto& var = std::get<Variable>(*expr.arguments[0]->constant);
        return std::optional<Term>(MakeBooleanLiteral(VariableValue(var.name, row).has_value()));
    }

    // IF and COALESCE evaluate their arguments lazily
    if (expr.op == ExprOperator::If) {
        if (expr.arguments.size() != 3) {
            return arrow::Status::Invalid("IF requires three arguments");
        }
        ARROW_ASSIGN_OR_RAISE(auto condition, EvaluateBoolean(*expr.arguments[0], row));
        if (!condition) {
            return std::optional<Term>();
        }
        return Evaluate(*expr.arguments[*condition ? 1 : 2], row);
    }
    if (expr.op == ExprOperator::Coalesce) {
        for (const auto& arg : expr.arguments) {
            ARROW_ASSIGN_OR_RAISE(auto value, Evaluate(*arg, row));
            if (value) {
                return value;
            }
        }
        return std::optional<Term>();
    }

    std::vector<Term> args;
    args.reserve(expr.arguments.size());
    for (const auto& arg : expr.arguments) {
        ARROW_ASSIGN_OR_RAISE(auto value, Evaluate(*arg, row));
        if (!value) {
            return std::optional<Term>();
        }
        args.push_back(std::move(*value));
    }

    auto require = [&](size_t n) { return args.size() == n; };

    switch (expr.op) {
        case ExprOperator::IsIRI:
            if (!require(1)) break;
            return std::optional<Term>(MakeBooleanLiteral(IsIri(args[0])));
        case ExprOperator::IsLiteral:
            if (!require(1)) break;
            return std::optional<Term>(MakeBooleanLiteral(IsLiteral(args[0])));
        case ExprOperator::IsBlank:
            if (!require(1)) break;
            return std::optional<Term>(MakeBooleanLiteral(IsBlank(args[0])));
        case ExprOperator::IsNumeric:
            if (!require(1)) break;
            return std::optional<Term>(MakeBooleanLiteral(NumericValue(args[0]).has_value()));

        case ExprOperator::Str:
            if (!require(1) || IsBlank(args[0])) break;
            return std::optional<Term>(MakeString(LexicalForm(args[0])));

        case ExprOperator::Lang: {
            if (!require(1)) break;
            const auto* lit = std::get_if<Literal>(&args[0]);
            if (lit == nullptr) break;
            return std::optional<Term>(MakeString(lit->language));
        }

        case ExprOperator::Datatype: {
            if (!require(1)) break;
            const auto* lit = std::get_if<Literal>(&args[0]);
            if (lit == nullptr) break;
            if (lit->HasLanguage()) {
                return std::optional<Term>(Iri(std::string(vocab::kRdfLangString)));
            }
            if (lit->datatype.empty()) {
                return std::optional<Term>(Iri(std::string(vocab::kXsdString)));
            }
            return std::optional<Term>(Iri(lit->datatype));
        }

        case ExprOperator::Regex: {
            if (args.size() < 2 || args.size() > 3) break;
            std::optional<Term> flags;
            if (args.size() == 3) {
                flags = args[2];
            }
            return EvaluateRegex(args[0], args[1], flags);
        }

        case ExprOperator::StrLen: {
            if (!require(1)) break;
            const Literal* lit = AsStringLiteral(args[0]);
            if (lit == nullptr) break;
            return std::optional<Term>(MakeInteger(static_cast<int64_t>(Utf8Length(lit->value))));
        }

        case ExprOperator::UCase:
        case ExprOperator::LCase: {
            if (!require(1)) break;
            const Literal* lit = AsStringLiteral(args[0]);
            if (lit == nullptr) break;
            std::string value = expr.op == ExprOperator::UCase ? ToUpper(lit->value)
                                                               : ToLower(lit->value);
            return std::optional<Term>(MakeString(std::move(value), lit->language));
        }

        case ExprOperator::StrStarts:
        case ExprOperator::StrEnds:
        case ExprOperator::Contains: {
            if (!require(2)) break;
            const Literal* haystack = AsStringLiteral(args[0]);
            const Literal* needle = AsStringLiteral(args[1]);
            if (haystack == nullptr || needle == nullptr) break;
            if (needle->HasLanguage() && needle->language != haystack->language) break;
            bool result = false;
            if (expr.op == ExprOperator::StrStarts) {
                result = StartsWith(haystack->value, needle->value);
            } else if (expr.op == ExprOperator::StrEnds) {
                result = EndsWith(haystack->value, needle->value);
            } else {
                result = haystack->value.find(needle->value) != std::string::npos;
            }
            return std::optional<Term>(MakeBooleanLiteral(result));
        }

        case ExprOperator::Concat: {
            std::string value;
            std::optional<std::string> language;
            bool same_language = true;
            for (const auto& arg : args) {
                const Literal* lit = AsStringLiteral(arg);
                if (lit == nullptr) {
                    return std::optional<Term>();
                }
                value += lit->value;
                if (!language) {
                    language = lit->language;
                } else if (*language != lit->language) {
                    same_language = false;
                }
            }
            return std::optional<Term>(
                MakeString(std::move(value), same_language && language ? *language : ""));
        }

        case ExprOperator::LangMatches: {
            if (!require(2)) break;
            const Literal* tag = AsStringLiteral(args[0]);
            const Literal* range = AsStringLiteral(args[1]);
            if (tag == nullptr || range == nullptr) break;
            bool result = false;
            if (range->value == "*") {
                result = !tag->value.empty();
            } else {
                std::string t = ToLower(tag->value);
                std::string r = ToLower(range->value);
                result = t == r || StartsWith(t, r + "-");
            }
            return std::optional<Term>(MakeBooleanLiteral(result));
        }

        default:
            return arrow::Status::NotImplemented("Expression operator ", toString(expr.op),
                                                 " is not supported");
    }

    return std::optional<Term>();
}

arrow::Result<std::optional<Term>> ExpressionEvaluator::EvaluateRegex(
    const Term& text, const Term& pattern, const std::optional<Term>& flags) {
    const Literal* text_lit = AsStringLiteral(text);
    const Literal* pattern_lit = AsStringLiteral(pattern);
    if (text_lit == nullptr || pattern_lit == nullptr) {
        return std::optional<Term>();
    }

    std::string flag_text;
    if (flags) {
        const Literal* flags_lit = AsStringLiteral(*flags);
        if (flags_lit == nullptr) {
            return std::optional<Term>();
        }
        flag_text = flags_lit->value;
    }

    std::string cache_key = flag_text + "/" + pattern_lit->value;
    auto it = regex_cache_.find(cache_key);
    if (it == regex_cache_.end()) {
        auto call = MakeRegexCall(pattern_lit->value, flag_text);
        it = regex_cache_.emplace(std::move(cache_key), std::move(call)).first;
    }
    RegexCall& call = it->second;
    if (!call.valid) {
        return std::optional<Term>();
    }

    ARROW_RETURN_NOT_OK(EnsureComputeKernels());
    arrow::compute::MatchSubstringOptions options(call.pattern, call.ignore_case);
    auto input = std::make_shared<arrow::StringScalar>(text_lit->value);
    auto matched = arrow::compute::CallFunction(call.function, {arrow::Datum(input)}, &options);
    if (!matched.ok()) {
        if (matched.status().IsInvalid()) {
            // Pattern RE2 cannot compile: a type error for every row
            call.valid = false;
            return std::optional<Term>();
        }
        return matched.status();
    }
    const auto& result = matched->scalar_as<arrow::BooleanScalar>();
    return std::optional<Term>(MakeBooleanLiteral(result.is_valid && result.value));
}

} // namespace sparql
} // namespace semgraph
