// EN: Read operation
// FR: Opération de lecture

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"
#include "io/file_reader.hpp"

namespace MLC::Operations {

Read::Read(std::string node_uid, std::string encoding_format)
    : Operation(OperationKind::READ, std::move(node_uid)), encoding_format_(std::move(encoding_format)) {}

OperationOutput Read::call(const std::vector<OperationOutput>& inputs) const {
    if (inputs.size() != 1) {
        throw ExecutionError(getName() + " expects exactly one input, got " + std::to_string(inputs.size()) + ".");
    }
    
    if (std::holds_alternative<std::filesystem::path>(inputs[0])) {
        Table table = IO::readTable(pathInput(inputs, 0, *this), encoding_format_);
        table.addOrigin(getNodeUid());
        return table;
    }
    
    // EN: FileSet: a table of paths. Non-tabular files are described by their paths only.
    // FR: FileSet : une table de chemins. Les fichiers non tabulaires sont décrits par leurs chemins seulement.
    const Table& paths = tableInput(inputs, 0, *this);
    if (!IO::isTabularFormat(encoding_format_)) {
        Table result = paths;
        result.addOrigin(getNodeUid());
        return result;
    }
    
    Table result;
    result.addOrigin(getNodeUid());
    for (size_t row = 0; row < paths.getRowCount(); ++row) {
        std::filesystem::path filepath = paths.at(row, Graph::Vocabulary::FILE_PROPERTY_FILEPATH).get<std::string>();
        Table content = IO::readTable(filepath, encoding_format_);
        for (const auto& column : paths.getColumns()) {
            const auto& value = paths.at(row, column);
            content.addColumn(column);
            for (size_t i = 0; i < content.getRowCount(); ++i) {
                content.set(i, column, value);
            }
        }
        result.append(content);
    }
    return result;
}

} // namespace MLC::Operations
