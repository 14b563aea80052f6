#include <semgraph/operators/apply.h>
#include <sstream>

namespace semgraph {

std::string_view toString(ApplyMode mode) {
    switch (mode) {
        case ApplyMode::Inner: return "Inner";
        case ApplyMode::LeftOuter: return "LeftOuter";
        case ApplyMode::Semi: return "Semi";
        case ApplyMode::Anti: return "Anti";
    }
    return "Unknown";
}

// ============================================================================
// ApplyOperator
// ============================================================================

ApplyOperator::ApplyOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                             std::shared_ptr<const VariableLayout> layout,
                             SubplanFactory factory, ApplyMode mode, std::string description,
                             std::vector<size_t> shared_columns)
    : UnaryOperator(std::move(input)),
      ctx_(&ctx),
      layout_(std::move(layout)),
      factory_(std::move(factory)),
      mode_(mode),
      description_(std::move(description)),
      shared_columns_(std::move(shared_columns)) {}

bool ApplyOperator::SharesColumn(const BindingRow& row) const {
    for (size_t column : shared_columns_) {
        if (!row[column].isUndefined()) {
            return true;
        }
    }
    return false;
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> ApplyOperator::GetNextBatch() {
    if (exhausted_) {
        return nullptr;
    }
    ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());

    const size_t batch_size = ctx_->batch_size();
    std::vector<BindingRow> out;

    while (out.size() < batch_size) {
        if (!subplan_) {
            if (pending_pos_ >= pending_.size()) {
                pending_pos_ = 0;
                ARROW_ASSIGN_OR_RAISE(bool has_input, PullInput(&pending_));
                if (!has_input) {
                    pending_.clear();
                    exhausted_ = true;
                    break;
                }
            }
            current_ = std::move(pending_[pending_pos_++]);
            ARROW_RETURN_NOT_OK(ctx_->Tick());

            if (mode_ == ApplyMode::Anti && !shared_columns_.empty() && !SharesColumn(current_)) {
                out.push_back(current_);
                continue;
            }
            ARROW_ASSIGN_OR_RAISE(subplan_, factory_(current_));
            matched_ = false;
        }

        ARROW_ASSIGN_OR_RAISE(auto batch, subplan_->GetNextBatch());
        if (!batch) {
            if (!matched_ && (mode_ == ApplyMode::LeftOuter || mode_ == ApplyMode::Anti)) {
                out.push_back(current_);
            }
            subplan_.reset();
            continue;
        }
        if (batch->num_rows() == 0) {
            continue;
        }
        matched_ = true;

        switch (mode_) {
            case ApplyMode::Inner:
            case ApplyMode::LeftOuter: {
                ARROW_ASSIGN_OR_RAISE(auto rows, BatchToRows(*batch));
                for (auto& row : rows) {
                    out.push_back(std::move(row));
                }
                break;
            }
            case ApplyMode::Semi:
                out.push_back(current_);
                subplan_.reset();
                break;
            case ApplyMode::Anti:
                subplan_.reset();
                break;
        }
    }

    if (out.empty()) {
        return nullptr;
    }
    return Emit(*layout_, out);
}

std::string ApplyOperator::ToString() const {
    std::ostringstream oss;
    oss << "Apply[" << toString(mode_) << "](" << description_ << ")";
    return oss.str();
}

// ============================================================================
// UnionOperator
// ============================================================================

UnionOperator::UnionOperator(std::shared_ptr<const VariableLayout> layout,
                             std::vector<std::shared_ptr<Operator>> branches)
    : layout_(std::move(layout)), branches_(std::move(branches)) {}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> UnionOperator::GetNextBatch() {
    while (current_ < branches_.size()) {
        ARROW_ASSIGN_OR_RAISE(auto batch, branches_[current_]->GetNextBatch());
        if (!batch) {
            current_++;
            continue;
        }
        if (batch->num_rows() == 0) {
            continue;
        }
        stats_.rows_processed += static_cast<size_t>(batch->num_rows());
        stats_.batches_processed++;
        return batch;
    }
    return nullptr;
}

std::string UnionOperator::ToString() const {
    std::ostringstream oss;
    oss << "Union(" << branches_.size() << " branches)";
    return oss.str();
}

size_t UnionOperator::EstimateCardinality() const {
    size_t total = 0;
    for (const auto& branch : branches_) {
        total += branch->EstimateCardinality();
    }
    return total;
}

} // namespace semgraph
