// EN: Structure graph builder - parses the metadata document into typed nodes and validates them in one pass
// FR: Constructeur du graphe de structure - parse le document de métadonnées en nœuds typés et les valide en une passe

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "core/issues.hpp"
#include "structure_graph/structure_graph.hpp"
#include "structure_graph/vocabulary.hpp"

namespace MLC::Graph {

// EN: Builds a StructureGraph from a JSON document, appending every problem to the issue log.
//     build() throws ValidationError once the whole pass is done if any error was recorded.
// FR: Construit un StructureGraph depuis un document JSON, en ajoutant chaque problème au journal.
//     build() lève ValidationError une fois la passe complète terminée si une erreur a été enregistrée.
class GraphBuilder {
public:
    explicit GraphBuilder(Issues& issues);
    
    std::shared_ptr<StructureGraph> build(const nlohmann::json& document,
                                          const std::filesystem::path& base_path = {});

private:
    // EN: Parsing
    // FR: Parsing
    void parseDataset(const nlohmann::json& document);
    void parseDistribution(const nlohmann::json& value);
    void parseRecordSet(const nlohmann::json& value);
    void parseField(const nlohmann::json& value, NodeId parent, const std::string& parent_uid, bool is_sub_field);
    NodeId addNode(std::string uid, std::string name, NodeId parent, NodePayload payload,
                   std::unordered_set<std::string> properties);
    
    // EN: Reference resolution into edges
    // FR: Résolution des références en arêtes
    void resolveReferences();
    void resolveContainedIn(const Node& node, const std::vector<std::string>& containers);
    void resolveSourceEdge(const Node& node, const Source& source);
    void addEdge(NodeId from, NodeId to);
    
    // EN: Graph-level checks
    // FR: Vérifications au niveau du graphe
    void checkKeys();
    void checkCycles();
    void checkJoins();
    
    // EN: Helpers
    // FR: Utilitaires
    std::vector<std::string> expandedTypes(const nlohmann::json& value) const;
    std::unordered_set<std::string> presentProperties(const nlohmann::json& value) const;
    std::string childContext(const std::string& label, const std::string& name, NodeId parent) const;
    void reportBadType(const std::vector<std::string>& expected, const std::string& context);
    
    Issues& issues_;
    std::shared_ptr<StructureGraph> graph_;
    PrefixMap prefixes_;
};

// EN: Read text from string or number values and strings from a string or list of strings.
// FR: Lit du texte depuis une valeur chaîne ou numérique, et des chaînes depuis une chaîne ou liste de chaînes.
std::string jsonToText(const nlohmann::json& value);
std::vector<std::string> jsonToStringList(const nlohmann::json& value);

} // namespace MLC::Graph
