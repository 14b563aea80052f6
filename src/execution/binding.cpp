#include <semgraph/execution/binding.h>
#include <algorithm>
#include <sstream>

namespace semgraph {

VariableLayout::VariableLayout(std::vector<std::string> names)
    : names_(std::move(names)) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    fields.reserve(names_.size());
    for (size_t i = 0; i < names_.size(); ++i) {
        index_.emplace(names_[i], i);
        fields.push_back(arrow::field(names_[i], arrow::uint64(), /*nullable=*/true));
    }
    schema_ = arrow::schema(fields);
}

std::optional<size_t> VariableLayout::IndexOf(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> RowsToBatch(
    const VariableLayout& layout, const std::vector<BindingRow>& rows) {
    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.reserve(layout.size());

    for (size_t col = 0; col < layout.size(); ++col) {
        arrow::UInt64Builder builder;
        ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(rows.size())));
        for (const auto& row : rows) {
            if (col >= row.size()) {
                return arrow::Status::Invalid("Binding row has ", row.size(),
                                              " columns, layout has ", layout.size());
            }
            const ValueId& id = row[col];
            if (id.isUndefined()) {
                builder.UnsafeAppendNull();
            } else {
                builder.UnsafeAppend(id.getBits());
            }
        }
        std::shared_ptr<arrow::Array> array;
        ARROW_RETURN_NOT_OK(builder.Finish(&array));
        columns.push_back(std::move(array));
    }

    return arrow::RecordBatch::Make(layout.schema(), static_cast<int64_t>(rows.size()),
                                    std::move(columns));
}

arrow::Result<std::vector<BindingRow>> BatchToRows(const arrow::RecordBatch& batch) {
    const int64_t num_rows = batch.num_rows();
    const int num_columns = batch.num_columns();

    std::vector<BindingRow> rows(static_cast<size_t>(num_rows),
                                 BindingRow(static_cast<size_t>(num_columns)));

    for (int col = 0; col < num_columns; ++col) {
        auto column = batch.column(col);
        if (column->type_id() != arrow::Type::UINT64) {
            return arrow::Status::TypeError("Binding column '", batch.schema()->field(col)->name(),
                                            "' is ", column->type()->ToString(),
                                            ", expected uint64");
        }
        const auto& ids = static_cast<const arrow::UInt64Array&>(*column);
        for (int64_t i = 0; i < num_rows; ++i) {
            if (!ids.IsNull(i)) {
                rows[static_cast<size_t>(i)][static_cast<size_t>(col)] = ValueId::fromBits(ids.Value(i));
            }
        }
    }

    return rows;
}

bool Compatible(const BindingRow& a, const BindingRow& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (!a[i].isUndefined() && !b[i].isUndefined() && a[i] != b[i]) {
            return false;
        }
    }
    return true;
}

std::string RowToString(const VariableLayout& layout, const BindingRow& row) {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < row.size() && i < layout.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "?" << layout.names()[i] << "=";
        if (row[i].isUndefined()) {
            oss << "UNDEF";
        } else {
            oss << row[i].ToString();
        }
    }
    oss << "}";
    return oss.str();
}

} // namespace semgraph
