// EN: Node model of the structure graph - one variant per node type of the metadata document
// FR: Modèle de nœuds du graphe de structure - une variante par type de nœud du document de métadonnées

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/issues.hpp"
#include "structure_graph/source.hpp"

namespace MLC::Graph {

class StructureGraph;

// EN: Index of a node in the graph arena
// FR: Index d'un nœud dans l'arène du graphe
using NodeId = size_t;
inline constexpr NodeId NO_NODE = static_cast<NodeId>(-1);

enum class NodeKind {
    DATASET,
    FILE_OBJECT,
    FILE_SET,
    RECORD_SET,
    FIELD
};

// EN: Root of the document
// FR: Racine du document
struct DatasetNode {
    std::string description;
    std::string license;
    std::string citation;
    std::string url;
    std::string version;
    std::vector<std::string> creators;
    std::vector<std::string> contributors;
};

// EN: A concrete downloadable file
// FR: Un fichier concret téléchargeable
struct FileObjectNode {
    std::string description;
    std::string content_url;
    std::string encoding_format;
    std::string sha256;
    std::string md5;
    std::vector<std::string> contained_in;
};

// EN: A glob selecting zero or more files inside other distributions
// FR: Un glob sélectionnant zéro ou plusieurs fichiers dans d'autres distributions
struct FileSetNode {
    std::string description;
    std::string includes;
    std::string encoding_format;
    std::vector<std::string> contained_in;
};

// EN: A logical table, optionally with inline literal records
// FR: Une table logique, optionnellement avec des enregistrements littéraux en ligne
struct RecordSetNode {
    std::string description;
    std::optional<nlohmann::json> data;     // EN: Always an array when set / FR: Toujours un tableau si défini
    std::vector<std::string> keys;
};

// EN: A column (or a sub-field of a column)
// FR: Une colonne (ou un sous-champ d'une colonne)
struct FieldNode {
    std::string description;
    std::optional<std::string> data_type;   // EN: Expanded IRI as declared / FR: IRI étendue telle que déclarée
    std::optional<Source> source;
    std::optional<Source> references;
    bool is_sub_field{false};
};

using NodePayload = std::variant<DatasetNode, FileObjectNode, FileSetNode, RecordSetNode, FieldNode>;

// EN: Immutable node of the structure graph. Parent/children are ids into the graph arena.
// FR: Nœud immuable du graphe de structure. Parent/enfants sont des ids dans l'arène du graphe.
class Node {
public:
    Node(NodeId id, std::string uid, std::string name, NodeId parent, NodePayload payload,
         std::unordered_set<std::string> properties);
    
    NodeId getId() const { return id_; }
    const std::string& getUid() const { return uid_; }
    const std::string& getName() const { return name_; }
    NodeId getParent() const { return parent_; }
    const std::vector<NodeId>& getChildren() const { return children_; }
    NodeKind getKind() const;
    
    bool isDistribution() const;
    
    // EN: Whether the document defined a non-empty value for this key.
    // FR: Si le document a défini une valeur non vide pour cette clé.
    bool hasProperty(const std::string& key) const;
    
    template<typename T>
    const T& as() const { return std::get<T>(payload_); }
    
    template<typename T>
    const T* tryAs() const { return std::get_if<T>(&payload_); }
    
    // EN: Label used in breadcrumbs: dataset, distribution, record_set, field or sub_field.
    // FR: Libellé utilisé dans les fils d'Ariane : dataset, distribution, record_set, field ou sub_field.
    std::string getContextLabel() const;
    
    // EN: Validate mandatory/recommended properties and type constraints, appending issues.
    // FR: Valide les propriétés obligatoires/recommandées et les contraintes de type, en ajoutant des anomalies.
    void check(const StructureGraph& graph, Issues& issues) const;

private:
    friend class GraphBuilder;
    
    void assertHasMandatoryProperties(const StructureGraph& graph, Issues& issues,
                                      const std::vector<std::string>& keys) const;
    void assertHasOptionalProperties(const StructureGraph& graph, Issues& issues,
                                     const std::vector<std::string>& keys) const;
    void checkField(const StructureGraph& graph, Issues& issues) const;
    
    NodeId id_;
    std::string uid_;
    std::string name_;
    NodeId parent_;
    std::vector<NodeId> children_;
    NodePayload payload_;
    std::unordered_set<std::string> properties_;
};

} // namespace MLC::Graph
