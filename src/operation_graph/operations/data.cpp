// EN: Data operation
// FR: Opération de données littérales

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"

namespace MLC::Operations {

Data::Data(std::string node_uid, nlohmann::json records)
    : Operation(OperationKind::DATA, std::move(node_uid)), records_(std::move(records)) {}

OperationOutput Data::call(const std::vector<OperationOutput>& /*inputs*/) const {
    try {
        Table table = Table::fromRecords(records_);
        table.addOrigin(getNodeUid());
        return table;
    } catch (const std::invalid_argument& e) {
        throw ExecutionError(getName() + ": " + e.what());
    }
}

} // namespace MLC::Operations
