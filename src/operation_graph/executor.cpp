// EN: Topological executor implementation
// FR: Implémentation de l'exécuteur topologique

#include "operation_graph/executor.hpp"
#include "core/issues.hpp"
#include "infrastructure/logging/logger.hpp"

#include <chrono>

namespace MLC::Operations {

namespace {
const std::string MODULE = "executor";
}

Executor::Executor(const OperationGraph& graph) : graph_(graph) {}

void Executor::run() {
    if (has_run_) {
        return;
    }
    order_ = graph_.topologicalSort();
    outputs_.assign(graph_.size(), std::nullopt);
    
    for (OperationId id : order_) {
        const Operation& operation = graph_.getOperation(id);
        
        std::vector<OperationOutput> inputs;
        for (OperationId predecessor : graph_.getPredecessors(id)) {
            inputs.push_back(*outputs_[predecessor]);
        }
        
        auto start = std::chrono::steady_clock::now();
        outputs_[id] = operation.call(inputs);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        
        std::unordered_map<std::string, std::string> metadata = {
            {"operation", operation.getName()},
            {"inputs", std::to_string(inputs.size())},
            {"duration_ms", std::to_string(elapsed.count())}
        };
        if (const auto* table = std::get_if<Table>(&*outputs_[id])) {
            metadata["rows"] = std::to_string(table->getRowCount());
        }
        LOG_DEBUG_META(MODULE, "Executed operation", metadata);
    }
    has_run_ = true;
}

const OperationOutput& Executor::getOutput(OperationId id) const {
    if (id >= outputs_.size() || !outputs_[id]) {
        throw ExecutionError("No output for operation " + std::to_string(id) + ": the graph has not run.");
    }
    return *outputs_[id];
}

} // namespace MLC::Operations
