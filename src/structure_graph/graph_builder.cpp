// EN: Structure graph builder implementation
// FR: Implémentation du constructeur du graphe de structure

#include "structure_graph/graph_builder.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace MLC::Graph {

namespace {

const std::string MODULE = "graph_builder";

std::string referenceError(const std::string& target, const std::string& uid) {
    return "There is a reference to node named \"" + target + "\" in node \"" + uid +
           "\", but this node doesn't exist.";
}

bool isEmptyValue(const nlohmann::json& value) {
    if (value.is_null()) return true;
    if (value.is_string()) return value.get<std::string>().empty();
    if (value.is_array() || value.is_object()) return value.empty();
    return false;
}

// EN: A single object or an array of objects as a list
// FR: Un objet seul ou un tableau d'objets sous forme de liste
std::vector<nlohmann::json> asList(const nlohmann::json& value) {
    if (value.is_array()) {
        return std::vector<nlohmann::json>(value.begin(), value.end());
    }
    if (value.is_null()) {
        return {};
    }
    return {value};
}

} // namespace

std::string jsonToText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    return "";
}

std::vector<std::string> jsonToStringList(const nlohmann::json& value) {
    std::vector<std::string> result;
    for (const auto& item : asList(value)) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        } else if (item.is_object() && item.contains(Vocabulary::NAME)) {
            result.push_back(jsonToText(item[Vocabulary::NAME]));
        }
    }
    return result;
}

GraphBuilder::GraphBuilder(Issues& issues) : issues_(issues) {}

std::shared_ptr<StructureGraph> GraphBuilder::build(const nlohmann::json& document,
                                                    const std::filesystem::path& base_path) {
    graph_ = std::make_shared<StructureGraph>();
    graph_->base_path_ = base_path;
    prefixes_ = PrefixMap();
    
    if (document.is_object() && document.contains(Vocabulary::CONTEXT)) {
        prefixes_.load(document[Vocabulary::CONTEXT]);
    }
    
    // EN: The root must be a named dataset, else nothing else can be checked.
    // FR: La racine doit être un dataset nommé, sinon rien d'autre ne peut être vérifié.
    auto root_types = expandedTypes(document);
    if (!document.is_object() ||
        std::find(root_types.begin(), root_types.end(), Vocabulary::TYPE_DATASET) == root_types.end()) {
        issues_.addError("No metadata is defined in the dataset");
        issues_.raiseIfErrors();
    }
    
    parseDataset(document);
    if (graph_->getName().empty()) {
        issues_.raiseIfErrors();
    }
    
    resolveReferences();
    for (const auto& node : graph_->nodes_) {
        node.check(*graph_, issues_);
    }
    checkKeys();
    checkCycles();
    checkJoins();
    
    for (const auto& warning : issues_.getWarnings()) {
        LOG_WARN(MODULE, warning.toString());
    }
    
    std::unordered_map<std::string, std::string> summary = {
        {"dataset", graph_->getName()},
        {"nodes", std::to_string(graph_->size())},
        {"errors", std::to_string(issues_.getErrors().size())},
        {"warnings", std::to_string(issues_.getWarnings().size())}
    };
    if (issues_.hasErrors()) {
        LOG_ERROR_META(MODULE, "Structure graph validation failed", summary);
    } else {
        LOG_INFO_META(MODULE, "Structure graph validated", summary);
    }
    issues_.raiseIfErrors();
    
    return graph_;
}

void GraphBuilder::parseDataset(const nlohmann::json& document) {
    DatasetNode dataset;
    dataset.description = jsonToText(document.value(Vocabulary::DESCRIPTION, nlohmann::json()));
    dataset.license = jsonToText(document.value(Vocabulary::LICENSE, nlohmann::json()));
    dataset.citation = jsonToText(document.value(Vocabulary::CITATION, nlohmann::json()));
    dataset.url = jsonToText(document.value(Vocabulary::URL, nlohmann::json()));
    dataset.version = jsonToText(document.value(Vocabulary::VERSION, nlohmann::json()));
    dataset.creators = jsonToStringList(document.value(Vocabulary::CREATOR, nlohmann::json()));
    dataset.contributors = jsonToStringList(document.value(Vocabulary::CONTRIBUTOR, nlohmann::json()));
    
    std::string name = jsonToText(document.value(Vocabulary::NAME, nlohmann::json()));
    NodeId id = addNode(name, name, NO_NODE, std::move(dataset), presentProperties(document));
    
    if (name.empty()) {
        // EN: Reported here since the pass stops right after.
        // FR: Rapporté ici car la passe s'arrête juste après.
        graph_->nodes_[id].check(*graph_, issues_);
        return;
    }
    
    for (const auto& distribution : asList(document.value(Vocabulary::DISTRIBUTION, nlohmann::json()))) {
        parseDistribution(distribution);
    }
    for (const auto& record_set : asList(document.value(Vocabulary::RECORD_SET, nlohmann::json()))) {
        parseRecordSet(record_set);
    }
}

void GraphBuilder::parseDistribution(const nlohmann::json& value) {
    std::string name = value.is_object() ? jsonToText(value.value(Vocabulary::NAME, nlohmann::json())) : "";
    std::string context = childContext("distribution", name, graph_->getRoot());
    if (!value.is_object()) {
        issues_.addError("Malformed distribution: " + value.dump() + ".", context);
        return;
    }
    
    auto types = expandedTypes(value);
    auto has_type = [&types](const std::string& type) {
        return std::find(types.begin(), types.end(), type) != types.end();
    };
    
    auto text = [&value](const std::string& key) {
        return jsonToText(value.value(key, nlohmann::json()));
    };
    
    if (has_type(Vocabulary::TYPE_FILE_OBJECT)) {
        FileObjectNode file_object;
        file_object.description = text(Vocabulary::DESCRIPTION);
        file_object.content_url = text(Vocabulary::CONTENT_URL);
        file_object.encoding_format = text(Vocabulary::ENCODING_FORMAT);
        file_object.sha256 = text(Vocabulary::SHA256);
        file_object.md5 = text(Vocabulary::MD5);
        file_object.contained_in = jsonToStringList(value.value(Vocabulary::CONTAINED_IN, nlohmann::json()));
        addNode(name, name, graph_->getRoot(), std::move(file_object), presentProperties(value));
    } else if (has_type(Vocabulary::TYPE_FILE_SET)) {
        FileSetNode file_set;
        file_set.description = text(Vocabulary::DESCRIPTION);
        file_set.includes = text(Vocabulary::INCLUDES);
        file_set.encoding_format = text(Vocabulary::ENCODING_FORMAT);
        file_set.contained_in = jsonToStringList(value.value(Vocabulary::CONTAINED_IN, nlohmann::json()));
        addNode(name, name, graph_->getRoot(), std::move(file_set), presentProperties(value));
    } else {
        reportBadType({Vocabulary::TYPE_FILE_OBJECT, Vocabulary::TYPE_FILE_SET}, context);
    }
}

void GraphBuilder::parseRecordSet(const nlohmann::json& value) {
    std::string name = value.is_object() ? jsonToText(value.value(Vocabulary::NAME, nlohmann::json())) : "";
    std::string context = childContext("record_set", name, graph_->getRoot());
    if (!value.is_object()) {
        issues_.addError("Malformed record set: " + value.dump() + ".", context);
        return;
    }
    auto types = expandedTypes(value);
    if (std::find(types.begin(), types.end(), Vocabulary::TYPE_RECORD_SET) == types.end()) {
        reportBadType({Vocabulary::TYPE_RECORD_SET}, context);
        return;
    }
    
    RecordSetNode record_set;
    record_set.description = jsonToText(value.value(Vocabulary::DESCRIPTION, nlohmann::json()));
    record_set.keys = jsonToStringList(value.value(Vocabulary::KEY, nlohmann::json()));
    
    auto data_it = value.find(Vocabulary::DATA);
    if (data_it != value.end() && !data_it->is_null()) {
        // EN: Inline data is either a JSON array or a string holding one.
        // FR: Les données en ligne sont un tableau JSON ou une chaîne en contenant un.
        nlohmann::json data = *data_it;
        if (data.is_string()) {
            data = nlohmann::json::parse(data.get<std::string>(), nullptr, false);
        }
        bool valid = data.is_array() &&
                     std::all_of(data.begin(), data.end(), [](const nlohmann::json& row) { return row.is_object(); });
        if (valid) {
            record_set.data = std::move(data);
        } else {
            issues_.addError("Malformed \"" + Vocabulary::propertyIri(Vocabulary::DATA) +
                             "\": expected a JSON array of objects.", context);
            record_set.data = nlohmann::json::array();
        }
    }
    
    NodeId id = addNode(name, name, graph_->getRoot(), std::move(record_set), presentProperties(value));
    for (const auto& field : asList(value.value(Vocabulary::FIELD, nlohmann::json()))) {
        parseField(field, id, name, false);
    }
}

void GraphBuilder::parseField(const nlohmann::json& value, NodeId parent, const std::string& parent_uid,
                              bool is_sub_field) {
    std::string name = value.is_object() ? jsonToText(value.value(Vocabulary::NAME, nlohmann::json())) : "";
    std::string context = childContext(is_sub_field ? "sub_field" : "field", name, parent);
    if (!value.is_object()) {
        issues_.addError("Malformed field: " + value.dump() + ".", context);
        return;
    }
    auto types = expandedTypes(value);
    if (std::find(types.begin(), types.end(), Vocabulary::TYPE_FIELD) == types.end()) {
        reportBadType({Vocabulary::TYPE_FIELD}, context);
        return;
    }
    
    FieldNode field;
    field.is_sub_field = is_sub_field;
    field.description = jsonToText(value.value(Vocabulary::DESCRIPTION, nlohmann::json()));
    auto data_types = jsonToStringList(value.value(Vocabulary::DATA_TYPE, nlohmann::json()));
    if (!data_types.empty()) {
        field.data_type = prefixes_.expand(data_types.front());
    }
    
    for (const auto& key : {Vocabulary::SOURCE, Vocabulary::REFERENCES}) {
        auto it = value.find(key);
        if (it == value.end() || it->is_null()) {
            continue;
        }
        std::string error;
        auto source = parseSource(*it, error);
        if (!source) {
            issues_.addError(error, context);
            continue;
        }
        (key == Vocabulary::SOURCE ? field.source : field.references) = std::move(*source);
    }
    
    std::string uid = parent_uid + "/" + name;
    NodeId id = addNode(uid, name, parent, std::move(field), presentProperties(value));
    for (const auto& sub_field : asList(value.value(Vocabulary::SUB_FIELD, nlohmann::json()))) {
        parseField(sub_field, id, uid, true);
    }
}

NodeId GraphBuilder::addNode(std::string uid, std::string name, NodeId parent, NodePayload payload,
                             std::unordered_set<std::string> properties) {
    NodeId id = graph_->nodes_.size();
    graph_->nodes_.emplace_back(id, uid, std::move(name), parent, std::move(payload), std::move(properties));
    graph_->predecessors_.emplace_back();
    graph_->successors_.emplace_back();
    
    if (parent != NO_NODE) {
        graph_->nodes_[parent].children_.push_back(id);
        addEdge(parent, id);
    }
    
    const Node& node = graph_->nodes_[id];
    if (!node.getName().empty()) {
        if (!graph_->uid_index_.emplace(uid, id).second) {
            issues_.addError("Duplicate node with the same identifier: \"" + uid + "\".",
                             graph_->getBreadcrumb(id));
        }
    }
    return id;
}

void GraphBuilder::resolveReferences() {
    for (const auto& node : graph_->nodes_) {
        if (const auto* file_object = node.tryAs<FileObjectNode>()) {
            resolveContainedIn(node, file_object->contained_in);
        } else if (const auto* file_set = node.tryAs<FileSetNode>()) {
            resolveContainedIn(node, file_set->contained_in);
        } else if (const auto* field = node.tryAs<FieldNode>()) {
            if (field->source) {
                resolveSourceEdge(node, *field->source);
            }
            if (field->references) {
                resolveSourceEdge(node, *field->references);
            }
        }
    }
}

void GraphBuilder::resolveContainedIn(const Node& node, const std::vector<std::string>& containers) {
    const std::string context = graph_->getBreadcrumb(node.getId());
    for (const auto& container_name : containers) {
        auto container = graph_->findByUid(container_name);
        if (!container) {
            issues_.addError(referenceError(container_name, node.getUid()), context);
            continue;
        }
        const Node& target = graph_->getNode(*container);
        if (!target.isDistribution()) {
            issues_.addError("Node \"" + node.getUid() + "\" is contained in \"" + container_name +
                             "\", which is not a distribution.", context);
            continue;
        }
        if (node.getKind() == NodeKind::FILE_SET && target.getKind() != NodeKind::FILE_OBJECT) {
            issues_.addError("FileSet \"" + node.getUid() + "\" must be contained in a FileObject, but \"" +
                             container_name + "\" is a FileSet.", context);
            continue;
        }
        addEdge(*container, node.getId());
    }
}

void GraphBuilder::resolveSourceEdge(const Node& node, const Source& source) {
    const std::string context = graph_->getBreadcrumb(node.getId());
    auto target = graph_->findByUid(source.node);
    if (!target) {
        issues_.addError(referenceError(source.node, node.getUid()), context);
        return;
    }
    const Node& target_node = graph_->getNode(*target);
    if (target_node.getKind() == NodeKind::RECORD_SET && source.column) {
        // EN: A column of a record set is one of its fields.
        // FR: Une colonne d'un record set est l'un de ses champs.
        std::string field_uid = source.node + "/" + *source.column;
        auto field = graph_->findByUid(field_uid);
        if (!field) {
            issues_.addError(referenceError(field_uid, node.getUid()), context);
            return;
        }
        addEdge(*field, node.getId());
        return;
    }
    if (!target_node.isDistribution() && target_node.getKind() != NodeKind::RECORD_SET) {
        issues_.addError("Node \"" + node.getUid() + "\" points to \"" + source.node +
                         "\", which is neither a distribution nor a record set.", context);
        return;
    }
    addEdge(*target, node.getId());
}

void GraphBuilder::addEdge(NodeId from, NodeId to) {
    auto& successors = graph_->successors_[from];
    if (std::find(successors.begin(), successors.end(), to) != successors.end()) {
        return;
    }
    successors.push_back(to);
    graph_->predecessors_[to].push_back(from);
}

void GraphBuilder::checkKeys() {
    for (NodeId id : graph_->getRecordSets()) {
        const Node& node = graph_->getNode(id);
        for (const auto& key : node.as<RecordSetNode>().keys) {
            auto field = graph_->findByUid(node.getUid() + "/" + key);
            if (!field || graph_->getNode(*field).getKind() != NodeKind::FIELD) {
                issues_.addError("Key \"" + key + "\" does not name any field of the record set.",
                                 graph_->getBreadcrumb(id));
            }
        }
    }
}

void GraphBuilder::checkCycles() {
    for (const auto& cycle : graph_->findReferenceCycles()) {
        issues_.addError("Record sets reference each other in a cycle: " + cycle + ".",
                         graph_->getBreadcrumb(graph_->getRoot()));
    }
    for (const auto& cycle : graph_->findContainmentCycles()) {
        issues_.addError("Distributions are contained in each other in a cycle: " + cycle + ".",
                         graph_->getBreadcrumb(graph_->getRoot()));
    }
}

void GraphBuilder::checkJoins() {
    for (NodeId id : graph_->getRecordSets()) {
        const Node& node = graph_->getNode(id);
        if (node.as<RecordSetNode>().data) {
            continue;
        }
        JoinPlan plan = graph_->planJoins(id);
        if (plan.isConnected()) {
            continue;
        }
        std::string unjoined;
        for (NodeId input : plan.unconnected) {
            if (!unjoined.empty()) unjoined += ", ";
            unjoined += "\"" + graph_->getNode(input).getUid() + "\"";
        }
        issues_.addError("The record set combines " + std::to_string(plan.inputs.size()) +
                         " sources but declares only " + std::to_string(plan.join_fields.size()) +
                         " join(s) connecting them. Add a field with both \"" +
                         Vocabulary::propertyIri(Vocabulary::SOURCE) + "\" and \"" +
                         Vocabulary::propertyIri(Vocabulary::REFERENCES) + "\" for: [" + unjoined + "].",
                         graph_->getBreadcrumb(id));
    }
}

std::vector<std::string> GraphBuilder::expandedTypes(const nlohmann::json& value) const {
    std::vector<std::string> types;
    if (!value.is_object()) {
        return types;
    }
    for (const auto& type : jsonToStringList(value.value(Vocabulary::TYPE, nlohmann::json()))) {
        types.push_back(prefixes_.expand(type));
    }
    return types;
}

std::unordered_set<std::string> GraphBuilder::presentProperties(const nlohmann::json& value) const {
    std::unordered_set<std::string> properties;
    for (const auto& [key, item] : value.items()) {
        if (!isEmptyValue(item)) {
            properties.insert(key);
        }
    }
    return properties;
}

std::string GraphBuilder::childContext(const std::string& label, const std::string& name, NodeId parent) const {
    std::string crumb = graph_->getBreadcrumb(parent);
    crumb.pop_back();
    return crumb + " > " + label + "(" + name + ")]";
}

void GraphBuilder::reportBadType(const std::vector<std::string>& expected, const std::string& context) {
    std::string list;
    for (const auto& type : expected) {
        if (!list.empty()) list += ", ";
        list += "\"" + type + "\"";
    }
    issues_.addError("Node should have an attribute `\"@type\" in [" + list + "]`.", context);
}

} // namespace MLC::Graph
