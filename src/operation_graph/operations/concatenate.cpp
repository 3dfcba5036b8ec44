// EN: Concatenate operation
// FR: Opération de concaténation

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"

namespace MLC::Operations {

Concatenate::Concatenate(std::string node_uid) : Operation(OperationKind::CONCATENATE, std::move(node_uid)) {}

OperationOutput Concatenate::call(const std::vector<OperationOutput>& inputs) const {
    Table table({Graph::Vocabulary::FILE_PROPERTY_FILEPATH, Graph::Vocabulary::FILE_PROPERTY_FILENAME,
                 Graph::Vocabulary::FILE_PROPERTY_FULLPATH});
    
    auto addFile = [&table](const FilePath& file) {
        table.addRow({file.filepath.string(), file.filename, file.fullpath});
    };
    
    for (const auto& input : inputs) {
        if (const auto* files = std::get_if<std::vector<FilePath>>(&input)) {
            for (const auto& file : *files) {
                addFile(file);
            }
        } else if (const auto* path = std::get_if<std::filesystem::path>(&input)) {
            addFile({*path, path->filename().string(), path->filename().string()});
        } else {
            throw ExecutionError(getName() + " only concatenates file paths.");
        }
    }
    
    if (table.empty()) {
        throw ExecutionError("No path to concatenate.");
    }
    return table;
}

} // namespace MLC::Operations
