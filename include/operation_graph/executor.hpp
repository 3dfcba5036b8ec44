// EN: Topological executor - runs each operation once, in dependency order, caching outputs
// FR: Exécuteur topologique - exécute chaque opération une fois, dans l'ordre des dépendances, en gardant les sorties

#pragma once

#include <optional>
#include <vector>

#include "operation_graph/operation_graph.hpp"

namespace MLC::Operations {

class Executor {
public:
    explicit Executor(const OperationGraph& graph);
    
    // EN: Execute the whole graph. Throws ExecutionError on the first failing operation.
    // FR: Exécute tout le graphe. Lève ExecutionError à la première opération en échec.
    void run();
    
    bool hasRun() const { return has_run_; }
    const OperationOutput& getOutput(OperationId id) const;
    
    // EN: Order in which operations were executed
    // FR: Ordre dans lequel les opérations ont été exécutées
    const std::vector<OperationId>& getExecutionOrder() const { return order_; }

private:
    const OperationGraph& graph_;
    std::vector<std::optional<OperationOutput>> outputs_;
    std::vector<OperationId> order_;
    bool has_run_{false};
};

} // namespace MLC::Operations
