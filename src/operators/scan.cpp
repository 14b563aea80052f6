#include <semgraph/operators/scan.h>
#include <chrono>
#include <sstream>

namespace semgraph {

namespace {

std::optional<ValueId> ResolveSlot(const PatternSlot& slot, const BindingRow& row) {
    switch (slot.kind) {
        case PatternSlot::Kind::Constant:
            return slot.id;
        case PatternSlot::Kind::Variable:
            if (!row[slot.column].isUndefined()) {
                return row[slot.column];
            }
            return std::nullopt;
        case PatternSlot::Kind::Absent:
            break;
    }
    return std::nullopt;
}

void AppendSlot(std::ostringstream& oss, const PatternSlot& slot, const VariableLayout& layout) {
    switch (slot.kind) {
        case PatternSlot::Kind::Constant:
            oss << slot.id.ToString();
            break;
        case PatternSlot::Kind::Variable:
            oss << "?" << layout.names()[slot.column];
            break;
        case PatternSlot::Kind::Absent:
            oss << "<absent>";
            break;
    }
}

} // namespace

TriplePattern ScanPattern::Resolve(const BindingRow& row) const {
    TriplePattern pattern;
    pattern.subject = ResolveSlot(subject, row);
    pattern.predicate = ResolveSlot(predicate, row);
    pattern.object = ResolveSlot(object, row);
    return pattern;
}

std::string ScanPattern::ToString(const VariableLayout& layout) const {
    std::ostringstream oss;
    AppendSlot(oss, subject, layout);
    oss << " ";
    AppendSlot(oss, predicate, layout);
    oss << " ";
    AppendSlot(oss, object, layout);
    return oss.str();
}

TripleScanOperator::TripleScanOperator(std::shared_ptr<Operator> input, ExecutionContext& ctx,
                                       std::shared_ptr<const VariableLayout> layout,
                                       ScanPattern pattern)
    : UnaryOperator(std::move(input)),
      ctx_(&ctx),
      layout_(std::move(layout)),
      pattern_(pattern) {
    exhausted_ = !pattern_.IsSatisfiable();
}

bool TripleScanOperator::BindSlot(const PatternSlot& slot, ValueId value, BindingRow& row) {
    if (slot.kind != PatternSlot::Kind::Variable) {
        return true;
    }
    ValueId& cell = row[slot.column];
    if (cell.isUndefined()) {
        cell = value;
        return true;
    }
    // Repeated variable (?x ?p ?x) or a binding from the input row
    return cell == value;
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> TripleScanOperator::GetNextBatch() {
    if (exhausted_) {
        return nullptr;
    }
    ARROW_RETURN_NOT_OK(ctx_->CheckDeadline());

    auto start = std::chrono::steady_clock::now();
    const TripleIndex& index = ctx_->store().index();
    const size_t batch_size = ctx_->batch_size();

    std::vector<BindingRow> out;
    while (out.size() < batch_size) {
        if (!in_range_) {
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
            range_ = index.Lookup(pattern_.Resolve(current_));
            range_pos_ = 0;
            in_range_ = true;
        }

        while (range_pos_ < range_.size() && out.size() < batch_size) {
            const IdTriple& triple = range_[range_pos_++];
            ARROW_RETURN_NOT_OK(ctx_->Tick());

            BindingRow row = current_;
            if (BindSlot(pattern_.subject, triple.subject, row) &&
                BindSlot(pattern_.predicate, triple.predicate, row) &&
                BindSlot(pattern_.object, triple.object, row)) {
                out.push_back(std::move(row));
            }
        }
        if (range_pos_ >= range_.size()) {
            in_range_ = false;
        }
    }

    auto end = std::chrono::steady_clock::now();
    stats_.execution_time_ms +=
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;

    if (out.empty()) {
        return nullptr;
    }
    return Emit(*layout_, out);
}

std::string TripleScanOperator::ToString() const {
    std::ostringstream oss;
    oss << "TripleScan(" << pattern_.ToString(*layout_) << ")"
        << " [est. " << EstimateCardinality() << " rows]";
    return oss.str();
}

size_t TripleScanOperator::EstimateCardinality() const {
    if (!pattern_.IsSatisfiable()) {
        return 0;
    }
    // Constants only: variables bound by the input are unknown before execution
    TriplePattern constants = pattern_.Resolve(layout_->EmptyRow());
    return ctx_->store().index().EstimateCardinality(constants);
}

} // namespace semgraph
