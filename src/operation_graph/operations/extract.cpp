// EN: Extract operation
// FR: Opération d'extraction

#include "operation_graph/operations.hpp"
#include "io/archive.hpp"

namespace MLC::Operations {

Extract::Extract(std::string node_uid, std::filesystem::path target_directory)
    : Operation(OperationKind::EXTRACT, std::move(node_uid)), target_directory_(std::move(target_directory)) {}

OperationOutput Extract::call(const std::vector<OperationOutput>& inputs) const {
    const auto& archive = pathInput(inputs, 0, *this);
    IO::extractTar(archive, target_directory_);
    return target_directory_;
}

} // namespace MLC::Operations
