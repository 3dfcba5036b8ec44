// EN: Operation graph compiler - lowers a validated structure graph into a DAG of operations
// FR: Compilateur du graphe d'opérations - transforme un graphe de structure validé en DAG d'opérations

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "io/fetcher.hpp"
#include "operation_graph/operation_graph.hpp"
#include "operation_graph/operations.hpp"
#include "structure_graph/structure_graph.hpp"

namespace MLC::Operations {

class Compiler {
public:
    // EN: `work_directory` receives extracted archives.
    // FR: `work_directory` reçoit les archives extraites.
    Compiler(std::shared_ptr<const Graph::StructureGraph> graph, std::shared_ptr<IO::Fetcher> fetcher,
             std::filesystem::path work_directory);
    
    // EN: One operation per (node, kind) needed by the requested record sets.
    //     Throws ExecutionError on unknown record sets or unsupported layouts.
    // FR: Une opération par (nœud, type) nécessaire aux record sets demandés.
    //     Lève ExecutionError pour un record set inconnu ou une disposition non supportée.
    std::shared_ptr<OperationGraph> compile(const std::vector<std::string>& record_sets);

private:
    OperationId getOrAdd(OperationKind kind, const std::string& uid,
                         const std::function<std::shared_ptr<const Operation>()>& factory);
    
    OperationId compileDownload(Graph::NodeId file_object);
    OperationId compileExtract(Graph::NodeId file_object);
    OperationId compileFileSet(Graph::NodeId file_set);
    OperationId compileRecordSet(Graph::NodeId record_set);
    
    // EN: Operation producing the table of a distribution or record set
    // FR: Opération produisant la table d'une distribution ou d'un record set
    OperationId compileTable(Graph::NodeId node);
    
    FieldSpec makeFieldSpec(Graph::NodeId field) const;
    
    std::shared_ptr<const Graph::StructureGraph> graph_;
    std::shared_ptr<IO::Fetcher> fetcher_;
    std::filesystem::path work_directory_;
    
    std::shared_ptr<OperationGraph> plan_;
    std::unordered_map<std::string, OperationId> compiled_;
    std::unordered_set<Graph::NodeId> in_progress_;
};

} // namespace MLC::Operations
