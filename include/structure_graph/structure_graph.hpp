// EN: Structure graph - arena of typed nodes with containment and reference edges
// FR: Graphe de structure - arène de nœuds typés avec arêtes de contenance et de référence

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "structure_graph/nodes.hpp"
#include "structure_graph/vocabulary.hpp"

namespace MLC::Graph {

// EN: How the upstream tables of a record set are combined
// FR: Comment les tables amont d'un record set sont combinées
struct JoinPlan {
    std::vector<NodeId> inputs;        // EN: Distinct upstream nodes, first-seen order / FR: Nœuds amont distincts, ordre de première apparition
    std::vector<NodeId> join_fields;   // EN: Fields defining each join, in chaining order / FR: Champs définissant chaque jointure, dans l'ordre de chaînage
    std::vector<NodeId> unconnected;   // EN: Inputs no join reaches / FR: Entrées qu'aucune jointure n'atteint
    
    bool isConnected() const { return unconnected.empty(); }
};

class StructureGraph {
public:
    StructureGraph() = default;
    
    // EN: Node access
    // FR: Accès aux nœuds
    NodeId getRoot() const { return 0; }
    const Node& getNode(NodeId id) const { return nodes_.at(id); }
    const std::vector<Node>& getNodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    std::optional<NodeId> findByUid(const std::string& uid) const;
    
    // EN: Name of the dataset and directory relative paths resolve against
    // FR: Nom du dataset et répertoire contre lequel se résolvent les chemins relatifs
    const std::string& getName() const;
    const std::filesystem::path& getBasePath() const { return base_path_; }
    
    // EN: Edges go from the referenced node to the referencing one (containment included).
    // FR: Les arêtes vont du nœud référencé vers le nœud référençant (contenance incluse).
    const std::vector<NodeId>& getPredecessors(NodeId id) const { return predecessors_.at(id); }
    const std::vector<NodeId>& getSuccessors(NodeId id) const { return successors_.at(id); }
    
    std::vector<NodeId> getDistributions() const;
    std::vector<NodeId> getRecordSets() const;
    std::optional<NodeId> findRecordSet(const std::string& name) const;
    std::vector<std::string> getRecordSetNames() const;
    
    // EN: Direct Field children of a record set or field
    // FR: Enfants Field directs d'un record set ou d'un champ
    std::vector<NodeId> getFields(NodeId parent) const;
    
    // EN: The record set owning a field or sub-field
    // FR: Le record set possédant un champ ou sous-champ
    NodeId getRecordSetOf(NodeId field) const;
    
    // EN: "[dataset(x) > record_set(y) > field(z)]"
    // FR: "[dataset(x) > record_set(y) > field(z)]"
    std::string getBreadcrumb(NodeId id) const;
    
    // EN: Data type declared on the field, else inherited from a predecessor field: a field it reads
    //     from first, then its parent field.
    // FR: Type de données déclaré sur le champ, sinon hérité d'un champ prédécesseur : un champ qu'il lit
    //     d'abord, puis son champ parent.
    std::optional<std::string> resolveDataTypeIri(NodeId field) const;
    
    // EN: Target node of a source/reference (distribution or record set), if it exists.
    // FR: Nœud cible d'une source/référence (distribution ou record set), s'il existe.
    std::optional<NodeId> resolveSource(const Source& source) const;
    
    // EN: Distinct upstream nodes of a record set and the joins chaining them.
    // FR: Nœuds amont distincts d'un record set et les jointures qui les chaînent.
    JoinPlan planJoins(NodeId record_set) const;
    
    // EN: Cycles between record sets reading from each other, as "a -> b -> a".
    // FR: Cycles entre record sets se lisant mutuellement, sous la forme "a -> b -> a".
    std::vector<std::string> findReferenceCycles() const;
    
    // EN: Cycles between distributions contained in each other (or in themselves), same format.
    // FR: Cycles entre distributions contenues les unes dans les autres (ou en elles-mêmes), même format.
    std::vector<std::string> findContainmentCycles() const;

private:
    friend class GraphBuilder;
    
    // EN: Every field of a record set, sub-fields included, depth first.
    // FR: Tous les champs d'un record set, sous-champs inclus, en profondeur d'abord.
    void collectFields(NodeId parent, std::vector<NodeId>& fields) const;
    
    // EN: Depth-first search from each root, one "a -> b -> a" entry per back edge.
    // FR: Recherche en profondeur depuis chaque racine, une entrée "a -> b -> a" par arc retour.
    std::vector<std::string> describeCycles(const std::vector<NodeId>& roots,
                                            const std::unordered_map<NodeId, std::vector<NodeId>>& dependencies) const;
    
    std::vector<Node> nodes_;
    std::unordered_map<std::string, NodeId> uid_index_;
    std::vector<std::vector<NodeId>> predecessors_;
    std::vector<std::vector<NodeId>> successors_;
    std::filesystem::path base_path_;
};

} // namespace MLC::Graph
