// EN: Operation base helpers
// FR: Utilitaires de base des opérations

#include "operation_graph/operation.hpp"
#include "core/issues.hpp"

namespace MLC::Operations {

std::string operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::DOWNLOAD: return "Download";
        case OperationKind::EXTRACT: return "Extract";
        case OperationKind::FILTER_FILES: return "FilterFiles";
        case OperationKind::CONCATENATE: return "Concatenate";
        case OperationKind::READ: return "Read";
        case OperationKind::DATA: return "Data";
        case OperationKind::JOIN: return "Join";
        case OperationKind::READ_FIELD: return "ReadField";
        case OperationKind::ASSEMBLE: return "Assemble";
        default: return "UNKNOWN";
    }
}

namespace {

template<typename T>
const T& typedInput(const std::vector<OperationOutput>& inputs, size_t index, const Operation& operation,
                    const std::string& expected) {
    if (index >= inputs.size()) {
        throw ExecutionError(operation.getName() + " expects an input at position " + std::to_string(index) +
                             " but received " + std::to_string(inputs.size()) + " input(s).");
    }
    const T* value = std::get_if<T>(&inputs[index]);
    if (!value) {
        throw ExecutionError(operation.getName() + " expects " + expected + " at position " +
                             std::to_string(index) + ".");
    }
    return *value;
}

} // namespace

const Table& tableInput(const std::vector<OperationOutput>& inputs, size_t index, const Operation& operation) {
    return typedInput<Table>(inputs, index, operation, "a table");
}

const std::filesystem::path& pathInput(const std::vector<OperationOutput>& inputs, size_t index,
                                       const Operation& operation) {
    return typedInput<std::filesystem::path>(inputs, index, operation, "a local path");
}

} // namespace MLC::Operations
