// EN: Operation base class - one unit of work of the operation graph and the values it exchanges
// FR: Classe de base des opérations - une unité de travail du graphe d'opérations et les valeurs échangées

#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "operation_graph/table.hpp"

namespace MLC::Operations {

// EN: A file selected by a FileSet
// FR: Un fichier sélectionné par un FileSet
struct FilePath {
    std::filesystem::path filepath;     // EN: Absolute local path / FR: Chemin local absolu
    std::string filename;               // EN: Last component / FR: Dernier composant
    std::string fullpath;               // EN: Path relative to the searched root / FR: Chemin relatif à la racine parcourue
    
    bool operator==(const FilePath& other) const {
        return filepath == other.filepath && filename == other.filename && fullpath == other.fullpath;
    }
};

// EN: Result of an operation: nothing, a local path, a list of files or a table
// FR: Résultat d'une opération : rien, un chemin local, une liste de fichiers ou une table
using OperationOutput = std::variant<std::monostate, std::filesystem::path, std::vector<FilePath>, Table>;

enum class OperationKind {
    DOWNLOAD,
    EXTRACT,
    FILTER_FILES,
    CONCATENATE,
    READ,
    DATA,
    JOIN,
    READ_FIELD,
    ASSEMBLE
};

std::string operationKindToString(OperationKind kind);

// EN: Abstract operation bound to the structural node it was compiled from.
// FR: Opération abstraite liée au nœud structurel dont elle est issue.
class Operation {
public:
    Operation(OperationKind kind, std::string node_uid) : kind_(kind), node_uid_(std::move(node_uid)) {}
    virtual ~Operation() = default;
    
    OperationKind getKind() const { return kind_; }
    const std::string& getNodeUid() const { return node_uid_; }
    
    // EN: "Kind(uid)", unique within a compiled graph
    // FR: "Kind(uid)", unique dans un graphe compilé
    std::string getName() const { return operationKindToString(kind_) + "(" + node_uid_ + ")"; }
    
    // EN: Run on the outputs of the direct predecessors, in edge order. Throws ExecutionError.
    // FR: S'exécute sur les sorties des prédécesseurs directs, dans l'ordre des arêtes. Lève ExecutionError.
    virtual OperationOutput call(const std::vector<OperationOutput>& inputs) const = 0;

private:
    OperationKind kind_;
    std::string node_uid_;
};

// EN: Typed access to a positional input; throws ExecutionError naming the operation on mismatch.
// FR: Accès typé à une entrée positionnelle ; lève ExecutionError nommant l'opération en cas d'écart.
const Table& tableInput(const std::vector<OperationOutput>& inputs, size_t index, const Operation& operation);
const std::filesystem::path& pathInput(const std::vector<OperationOutput>& inputs, size_t index,
                                       const Operation& operation);

} // namespace MLC::Operations
