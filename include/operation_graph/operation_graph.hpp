// EN: Operation graph - DAG of operations with ordered producer -> consumer edges
// FR: Graphe d'opérations - DAG d'opérations avec arêtes producteur -> consommateur ordonnées

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "operation_graph/operation.hpp"

namespace MLC::Operations {

using OperationId = size_t;

class OperationGraph {
public:
    OperationGraph() = default;
    
    OperationId addOperation(std::shared_ptr<const Operation> operation);
    
    // EN: Producer -> consumer. The consumer receives inputs in the order its edges were added.
    // FR: Producteur -> consommateur. Le consommateur reçoit ses entrées dans l'ordre d'ajout des arêtes.
    void addEdge(OperationId from, OperationId to);
    
    const Operation& getOperation(OperationId id) const { return *operations_.at(id); }
    size_t size() const { return operations_.size(); }
    const std::vector<OperationId>& getPredecessors(OperationId id) const { return predecessors_.at(id); }
    const std::vector<OperationId>& getSuccessors(OperationId id) const { return successors_.at(id); }
    
    // EN: Kahn's algorithm; throws ExecutionError naming the operations left on a cycle.
    // FR: Algorithme de Kahn ; lève ExecutionError en nommant les opérations restées sur un cycle.
    std::vector<OperationId> topologicalSort() const;
    
    // EN: Final operation producing each requested record set
    // FR: Opération finale produisant chaque record set demandé
    void setRecordSetOutput(const std::string& record_set, OperationId id) { outputs_[record_set] = id; }
    std::optional<OperationId> getRecordSetOutput(const std::string& record_set) const;

private:
    std::vector<std::shared_ptr<const Operation>> operations_;
    std::vector<std::vector<OperationId>> predecessors_;
    std::vector<std::vector<OperationId>> successors_;
    std::unordered_map<std::string, OperationId> outputs_;
};

} // namespace MLC::Operations
