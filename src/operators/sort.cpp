#include <semgraph/operators/sort.h>
#include <algorithm>
#include <chrono>
#include <numeric>
#include <sstream>

namespace semgraph {

SortOperator::SortOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                           std::shared_ptr<const VariableLayout> layout,
                           std::vector<SortKey> keys, CompareFn compare)
    : UnaryOperator(std::move(input)),
      ctx_(&ctx),
      layout_(std::move(layout)),
      keys_(std::move(keys)),
      compare_(std::move(compare)) {}

arrow::Status SortOperator::MaterializeAndSort() {
    auto start = std::chrono::steady_clock::now();

    std::vector<BindingRow> batch_rows;
    while (true) {
        ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());
        ARROW_ASSIGN_OR_RAISE(bool has_input, PullInput(&batch_rows));
        if (!has_input) {
            break;
        }
        for (auto& row : batch_rows) {
            rows_.push_back(std::move(row));
        }
    }

    // Key values are computed once per row, before sorting
    std::vector<std::vector<std::optional<Term>>> key_values(rows_.size());
    for (size_t i = 0; i < rows_.size(); ++i) {
        ARROW_RETURN_NOT_OK(ctx_->Tick());
        key_values[i].reserve(keys_.size());
        for (const auto& key : keys_) {
            ARROW_ASSIGN_OR_RAISE(auto value, key.value(rows_[i]));
            key_values[i].push_back(std::move(value));
        }
    }
    ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());

    std::vector<size_t> order(rows_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        for (size_t k = 0; k < keys_.size(); ++k) {
            int cmp = compare_(key_values[a][k], key_values[b][k]);
            if (cmp != 0) {
                return keys_[k].direction == SortDirection::Ascending ? cmp < 0 : cmp > 0;
            }
        }
        return false;
    });

    std::vector<BindingRow> sorted;
    sorted.reserve(rows_.size());
    for (size_t index : order) {
        sorted.push_back(std::move(rows_[index]));
    }
    rows_ = std::move(sorted);
    sorted_ = true;

    auto end = std::chrono::steady_clock::now();
    stats_.execution_time_ms =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;
    return arrow::Status::OK();
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> SortOperator::GetNextBatch() {
    if (!sorted_) {
        ARROW_RETURN_NOT_OK(MaterializeAndSort());
    }
    if (next_ >= rows_.size()) {
        return nullptr;
    }

    size_t end = std::min(rows_.size(), next_ + ctx_->batch_size());
    std::vector<BindingRow> out(rows_.begin() + static_cast<std::ptrdiff_t>(next_),
                                rows_.begin() + static_cast<std::ptrdiff_t>(end));
    next_ = end;
    return Emit(*layout_, out);
}

std::string SortOperator::ToString() const {
    std::ostringstream oss;
    oss << "Sort(";
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << (keys_[i].direction == SortDirection::Descending ? "DESC " : "ASC ")
            << keys_[i].description;
    }
    oss << ")";
    return oss.str();
}

} // namespace semgraph
