// EN: Assemble operation
// FR: Opération d'assemblage

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"

namespace MLC::Operations {

Assemble::Assemble(std::string node_uid, std::vector<std::string> field_names)
    : Operation(OperationKind::ASSEMBLE, std::move(node_uid)), field_names_(std::move(field_names)) {}

OperationOutput Assemble::call(const std::vector<OperationOutput>& inputs) const {
    if (inputs.size() != field_names_.size()) {
        throw ExecutionError(getName() + " expects " + std::to_string(field_names_.size()) + " field(s), got " +
                             std::to_string(inputs.size()) + ".");
    }
    
    Table result(field_names_);
    result.addOrigin(getNodeUid());
    if (inputs.empty()) {
        return result;
    }
    
    const size_t row_count = tableInput(inputs, 0, *this).getRowCount();
    std::vector<std::vector<nlohmann::json>> columns;
    for (size_t i = 0; i < inputs.size(); ++i) {
        const Table& field_table = tableInput(inputs, i, *this);
        if (field_table.getRowCount() != row_count) {
            throw ExecutionError("Field \"" + field_names_[i] + "\" of record set \"" + getNodeUid() + "\" has " +
                                 std::to_string(field_table.getRowCount()) + " value(s), expected " +
                                 std::to_string(row_count) + ".");
        }
        columns.push_back(field_table.getColumn(field_names_[i]));
    }
    
    for (size_t row = 0; row < row_count; ++row) {
        Row values;
        values.reserve(columns.size());
        for (auto& column : columns) {
            values.push_back(std::move(column[row]));
        }
        result.addRow(std::move(values));
    }
    return result;
}

} // namespace MLC::Operations
