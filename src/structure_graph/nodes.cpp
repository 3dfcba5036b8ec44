// EN: Node model implementation - property checks per node type
// FR: Implémentation du modèle de nœuds - vérifications de propriétés par type de nœud

#include "structure_graph/nodes.hpp"
#include "structure_graph/structure_graph.hpp"
#include "structure_graph/vocabulary.hpp"

#include <sstream>

namespace MLC::Graph {

Node::Node(NodeId id, std::string uid, std::string name, NodeId parent, NodePayload payload,
           std::unordered_set<std::string> properties)
    : id_(id), uid_(std::move(uid)), name_(std::move(name)), parent_(parent),
      payload_(std::move(payload)), properties_(std::move(properties)) {}

NodeKind Node::getKind() const {
    switch (payload_.index()) {
        case 0: return NodeKind::DATASET;
        case 1: return NodeKind::FILE_OBJECT;
        case 2: return NodeKind::FILE_SET;
        case 3: return NodeKind::RECORD_SET;
        default: return NodeKind::FIELD;
    }
}

bool Node::isDistribution() const {
    NodeKind kind = getKind();
    return kind == NodeKind::FILE_OBJECT || kind == NodeKind::FILE_SET;
}

bool Node::hasProperty(const std::string& key) const {
    return properties_.count(key) > 0;
}

std::string Node::getContextLabel() const {
    switch (getKind()) {
        case NodeKind::DATASET: return "dataset";
        case NodeKind::FILE_OBJECT:
        case NodeKind::FILE_SET: return "distribution";
        case NodeKind::RECORD_SET: return "record_set";
        case NodeKind::FIELD: return as<FieldNode>().is_sub_field ? "sub_field" : "field";
    }
    return "node";
}

void Node::check(const StructureGraph& graph, Issues& issues) const {
    using namespace Vocabulary;
    
    switch (getKind()) {
        case NodeKind::DATASET:
            assertHasMandatoryProperties(graph, issues, {NAME});
            assertHasOptionalProperties(graph, issues, {CITATION, LICENSE, URL});
            break;
            
        case NodeKind::FILE_OBJECT:
            assertHasMandatoryProperties(graph, issues, {CONTENT_URL, ENCODING_FORMAT, NAME});
            if (!hasProperty(SHA256) && !hasProperty(MD5)) {
                issues.addWarning("Property \"" + propertyIri(SHA256) + "\" or \"" + propertyIri(MD5) +
                                  "\" is recommended, but does not exist.",
                                  graph.getBreadcrumb(id_));
            }
            break;
            
        case NodeKind::FILE_SET:
            assertHasMandatoryProperties(graph, issues, {INCLUDES, ENCODING_FORMAT, NAME});
            break;
            
        case NodeKind::RECORD_SET:
            assertHasMandatoryProperties(graph, issues, {NAME});
            assertHasOptionalProperties(graph, issues, {DESCRIPTION});
            break;
            
        case NodeKind::FIELD:
            assertHasMandatoryProperties(graph, issues, {NAME});
            assertHasOptionalProperties(graph, issues, {DESCRIPTION});
            checkField(graph, issues);
            break;
    }
}

void Node::assertHasMandatoryProperties(const StructureGraph& graph, Issues& issues,
                                        const std::vector<std::string>& keys) const {
    for (const auto& key : keys) {
        if (!hasProperty(key)) {
            issues.addError("Property \"" + Vocabulary::propertyIri(key) + "\" is mandatory, but does not exist.",
                            graph.getBreadcrumb(id_));
        }
    }
}

void Node::assertHasOptionalProperties(const StructureGraph& graph, Issues& issues,
                                       const std::vector<std::string>& keys) const {
    for (const auto& key : keys) {
        if (!hasProperty(key)) {
            issues.addWarning("Property \"" + Vocabulary::propertyIri(key) + "\" is recommended, but does not exist.",
                              graph.getBreadcrumb(id_));
        }
    }
}

void Node::checkField(const StructureGraph& graph, Issues& issues) const {
    const auto& field = as<FieldNode>();
    const std::string context = graph.getBreadcrumb(id_);
    const auto& record_set = graph.getNode(graph.getRecordSetOf(id_)).as<RecordSetNode>();
    const bool has_sub_fields = !graph.getFields(id_).empty();
    const bool inline_data = record_set.data.has_value();
    
    if (inline_data) {
        if (field.source) {
            issues.addError("Node \"" + uid_ + "\" belongs to a record set with inline data and cannot declare a source.",
                            context);
        }
    } else if (!field.source && !hasProperty(Vocabulary::SOURCE) && !has_sub_fields) {
        issues.addError("Node \"" + uid_ + "\" is a field and has no source.", context);
    }
    
    if (field.data_type && !dataTypeFromIri(*field.data_type)) {
        std::ostringstream oss;
        oss << "Unknown data type \"" << *field.data_type << "\". Allowed data types: [";
        auto allowed = allowedDataTypeIris();
        for (size_t i = 0; i < allowed.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "\"" << allowed[i] << "\"";
        }
        oss << "].";
        issues.addError(oss.str(), context);
        return;
    }
    
    // EN: Fields with sub-fields are nested objects and carry no scalar type.
    // FR: Les champs avec sous-champs sont des objets imbriqués sans type scalaire.
    if (!has_sub_fields && !graph.resolveDataTypeIri(id_)) {
        issues.addError("The field does not specify any " + Vocabulary::propertyIri(Vocabulary::DATA_TYPE) +
                        ", neither does any of its predecessor.",
                        context);
    }
}

} // namespace MLC::Graph
