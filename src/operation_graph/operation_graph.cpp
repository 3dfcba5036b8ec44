// EN: Operation graph implementation
// FR: Implémentation du graphe d'opérations

#include "operation_graph/operation_graph.hpp"
#include "core/issues.hpp"

#include <algorithm>
#include <queue>

namespace MLC::Operations {

OperationId OperationGraph::addOperation(std::shared_ptr<const Operation> operation) {
    OperationId id = operations_.size();
    operations_.push_back(std::move(operation));
    predecessors_.emplace_back();
    successors_.emplace_back();
    return id;
}

void OperationGraph::addEdge(OperationId from, OperationId to) {
    if (from >= operations_.size() || to >= operations_.size()) {
        throw ExecutionError("Edge between unknown operations " + std::to_string(from) + " -> " + std::to_string(to));
    }
    auto& successors = successors_[from];
    if (std::find(successors.begin(), successors.end(), to) != successors.end()) {
        return;
    }
    successors.push_back(to);
    predecessors_[to].push_back(from);
}

std::vector<OperationId> OperationGraph::topologicalSort() const {
    std::vector<OperationId> result;
    std::vector<size_t> in_degree(operations_.size(), 0);
    
    // EN: Calculate in-degrees
    // FR: Calculer les degrés entrants
    for (OperationId id = 0; id < operations_.size(); ++id) {
        in_degree[id] = predecessors_[id].size();
    }
    
    std::queue<OperationId> queue;
    for (OperationId id = 0; id < operations_.size(); ++id) {
        if (in_degree[id] == 0) {
            queue.push(id);
        }
    }
    
    while (!queue.empty()) {
        OperationId current = queue.front();
        queue.pop();
        result.push_back(current);
        
        for (OperationId dependent : successors_[current]) {
            if (--in_degree[dependent] == 0) {
                queue.push(dependent);
            }
        }
    }
    
    if (result.size() != operations_.size()) {
        std::string remaining;
        for (OperationId id = 0; id < operations_.size(); ++id) {
            if (in_degree[id] > 0) {
                if (!remaining.empty()) remaining += ", ";
                remaining += operations_[id]->getName();
            }
        }
        throw ExecutionError("The operation graph has a cycle between: " + remaining);
    }
    return result;
}

std::optional<OperationId> OperationGraph::getRecordSetOutput(const std::string& record_set) const {
    auto it = outputs_.find(record_set);
    if (it == outputs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace MLC::Operations
