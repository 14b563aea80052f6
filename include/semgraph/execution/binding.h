#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <arrow/api.h>
#include <semgraph/types/value_id.h>

namespace semgraph {

// One solution mapping: one ValueId per plan variable, undefined for unbound
using BindingRow = std::vector<ValueId>;

// VariableLayout: the column layout shared by every operator of one query plan.
//
// All operators output all plan variables, in the same order, as nullable uint64
// columns; a null cell is an unbound variable. Joins and unions therefore never
// have to reconcile schemas.
class VariableLayout {
public:
    explicit VariableLayout(std::vector<std::string> names);

    size_t size() const { return names_.size(); }
    const std::vector<std::string>& names() const { return names_; }
    const std::shared_ptr<arrow::Schema>& schema() const { return schema_; }

    std::optional<size_t> IndexOf(const std::string& name) const;

    // Row with every variable unbound
    BindingRow EmptyRow() const { return BindingRow(names_.size()); }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> index_;
    std::shared_ptr<arrow::Schema> schema_;
};

// Pack rows into a RecordBatch of the layout's schema
arrow::Result<std::shared_ptr<arrow::RecordBatch>> RowsToBatch(
    const VariableLayout& layout, const std::vector<BindingRow>& rows);

// Unpack a RecordBatch produced by RowsToBatch; null cells become undefined
arrow::Result<std::vector<BindingRow>> BatchToRows(const arrow::RecordBatch& batch);

// True if a and b agree on every variable bound in both
bool Compatible(const BindingRow& a, const BindingRow& b);

std::string RowToString(const VariableLayout& layout, const BindingRow& row);

} // namespace semgraph
