// EN: Structure graph queries - lookups, breadcrumbs, type inheritance, join planning and cycle search
// FR: Requêtes du graphe de structure - recherches, fils d'Ariane, héritage de type, plan de jointure et cycles

#include "structure_graph/structure_graph.hpp"

#include <algorithm>
#include <functional>
#include <unordered_set>

namespace MLC::Graph {

std::optional<NodeId> StructureGraph::findByUid(const std::string& uid) const {
    auto it = uid_index_.find(uid);
    if (it == uid_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& StructureGraph::getName() const {
    static const std::string empty_name;
    return nodes_.empty() ? empty_name : nodes_.front().getName();
}

std::vector<NodeId> StructureGraph::getDistributions() const {
    std::vector<NodeId> result;
    for (const auto& node : nodes_) {
        if (node.isDistribution()) {
            result.push_back(node.getId());
        }
    }
    return result;
}

std::vector<NodeId> StructureGraph::getRecordSets() const {
    std::vector<NodeId> result;
    for (const auto& node : nodes_) {
        if (node.getKind() == NodeKind::RECORD_SET) {
            result.push_back(node.getId());
        }
    }
    return result;
}

std::optional<NodeId> StructureGraph::findRecordSet(const std::string& name) const {
    auto id = findByUid(name);
    if (!id || nodes_[*id].getKind() != NodeKind::RECORD_SET) {
        return std::nullopt;
    }
    return id;
}

std::vector<std::string> StructureGraph::getRecordSetNames() const {
    std::vector<std::string> names;
    for (NodeId id : getRecordSets()) {
        names.push_back(nodes_[id].getName());
    }
    return names;
}

std::vector<NodeId> StructureGraph::getFields(NodeId parent) const {
    std::vector<NodeId> fields;
    for (NodeId child : nodes_.at(parent).getChildren()) {
        if (nodes_[child].getKind() == NodeKind::FIELD) {
            fields.push_back(child);
        }
    }
    return fields;
}

NodeId StructureGraph::getRecordSetOf(NodeId field) const {
    NodeId current = field;
    while (current != NO_NODE && nodes_.at(current).getKind() != NodeKind::RECORD_SET) {
        current = nodes_[current].getParent();
    }
    return current;
}

std::string StructureGraph::getBreadcrumb(NodeId id) const {
    std::vector<NodeId> chain;
    for (NodeId current = id; current != NO_NODE; current = nodes_.at(current).getParent()) {
        chain.push_back(current);
    }
    
    std::string crumb = "[";
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (it != chain.rbegin()) {
            crumb += " > ";
        }
        const Node& node = nodes_[*it];
        crumb += node.getContextLabel() + "(" + node.getName() + ")";
    }
    return crumb + "]";
}

std::optional<std::string> StructureGraph::resolveDataTypeIri(NodeId field) const {
    // EN: Depth first over predecessor fields: the fields it reads from, then the parent field
    // FR: En profondeur sur les champs prédécesseurs : les champs lus, puis le champ parent
    std::unordered_set<NodeId> visited;
    std::function<std::optional<std::string>(NodeId)> visit = [&](NodeId current) -> std::optional<std::string> {
        if (!visited.insert(current).second) {
            return std::nullopt;
        }
        const Node& node = nodes_.at(current);
        const auto* payload = node.tryAs<FieldNode>();
        if (!payload) {
            return std::nullopt;
        }
        if (payload->data_type) {
            return payload->data_type;
        }
        std::vector<NodeId> candidates;
        for (NodeId predecessor : predecessors_.at(current)) {
            if (predecessor != node.getParent()) {
                candidates.push_back(predecessor);
            }
        }
        if (node.getParent() != NO_NODE) {
            candidates.push_back(node.getParent());
        }
        for (NodeId candidate : candidates) {
            if (auto found = visit(candidate)) {
                return found;
            }
        }
        return std::nullopt;
    };
    return visit(field);
}

std::optional<NodeId> StructureGraph::resolveSource(const Source& source) const {
    auto id = findByUid(source.node);
    if (!id) {
        return std::nullopt;
    }
    const Node& node = nodes_[*id];
    if (!node.isDistribution() && node.getKind() != NodeKind::RECORD_SET) {
        return std::nullopt;
    }
    return id;
}

void StructureGraph::collectFields(NodeId parent, std::vector<NodeId>& fields) const {
    for (NodeId child : getFields(parent)) {
        fields.push_back(child);
        collectFields(child, fields);
    }
}

JoinPlan StructureGraph::planJoins(NodeId record_set) const {
    JoinPlan plan;
    std::vector<NodeId> fields;
    collectFields(record_set, fields);
    
    auto addInput = [&](NodeId id) {
        if (id != record_set && std::find(plan.inputs.begin(), plan.inputs.end(), id) == plan.inputs.end()) {
            plan.inputs.push_back(id);
        }
    };
    
    // EN: Sources first, then reference targets, each in declaration order
    // FR: Les sources d'abord, puis les cibles de références, chacune dans l'ordre de déclaration
    std::vector<std::pair<NodeId, std::pair<NodeId, NodeId>>> joins;
    for (NodeId id : fields) {
        const auto& field = nodes_[id].as<FieldNode>();
        if (field.source) {
            if (auto target = resolveSource(*field.source)) {
                addInput(*target);
            }
        }
    }
    for (NodeId id : fields) {
        const auto& field = nodes_[id].as<FieldNode>();
        if (!field.source || !field.references) {
            continue;
        }
        auto left = resolveSource(*field.source);
        auto right = resolveSource(*field.references);
        if (!left || !right || *left == *right || *right == record_set) {
            continue;
        }
        addInput(*right);
        joins.push_back({id, {*left, *right}});
    }
    
    if (plan.inputs.empty()) {
        return plan;
    }
    
    // EN: Grow the connected set from the first input, one join at a time
    // FR: Étend l'ensemble connecté depuis la première entrée, une jointure à la fois
    std::unordered_set<NodeId> connected{plan.inputs.front()};
    std::vector<bool> used(joins.size(), false);
    bool progress = true;
    while (progress) {
        progress = false;
        for (size_t i = 0; i < joins.size(); ++i) {
            if (used[i]) {
                continue;
            }
            auto [left, right] = joins[i].second;
            bool has_left = connected.count(left) > 0;
            bool has_right = connected.count(right) > 0;
            if (has_left == has_right) {
                continue;
            }
            connected.insert(has_left ? right : left);
            plan.join_fields.push_back(joins[i].first);
            used[i] = true;
            progress = true;
        }
    }
    
    for (NodeId input : plan.inputs) {
        if (connected.count(input) == 0) {
            plan.unconnected.push_back(input);
        }
    }
    return plan;
}

std::vector<std::string> StructureGraph::findReferenceCycles() const {
    std::vector<std::string> cycles;
    
    // EN: Record set -> record sets its fields read from or reference
    // FR: Record set -> record sets que ses champs lisent ou référencent
    std::unordered_map<NodeId, std::vector<NodeId>> dependencies;
    std::vector<NodeId> record_sets = getRecordSets();
    for (NodeId rs : record_sets) {
        std::vector<NodeId> fields;
        collectFields(rs, fields);
        auto& deps = dependencies[rs];
        for (NodeId id : fields) {
            const auto& field = nodes_[id].as<FieldNode>();
            for (const auto* pointer : {&field.source, &field.references}) {
                if (!*pointer) {
                    continue;
                }
                auto target = resolveSource(**pointer);
                if (target && nodes_[*target].getKind() == NodeKind::RECORD_SET &&
                    std::find(deps.begin(), deps.end(), *target) == deps.end()) {
                    deps.push_back(*target);
                }
            }
        }
    }
    
    return describeCycles(record_sets, dependencies);
}

std::vector<std::string> StructureGraph::findContainmentCycles() const {
    // EN: Distribution -> distributions it is contained in
    // FR: Distribution -> distributions qui la contiennent
    std::unordered_map<NodeId, std::vector<NodeId>> dependencies;
    std::vector<NodeId> distributions = getDistributions();
    for (NodeId id : distributions) {
        const Node& node = nodes_[id];
        const auto* file_object = node.tryAs<FileObjectNode>();
        const auto* file_set = node.tryAs<FileSetNode>();
        if (!file_object && !file_set) {
            continue;
        }
        const auto& containers = file_object ? file_object->contained_in : file_set->contained_in;
        auto& deps = dependencies[id];
        for (const auto& container_name : containers) {
            auto container = findByUid(container_name);
            if (container && nodes_[*container].isDistribution() &&
                std::find(deps.begin(), deps.end(), *container) == deps.end()) {
                deps.push_back(*container);
            }
        }
    }
    return describeCycles(distributions, dependencies);
}

std::vector<std::string> StructureGraph::describeCycles(
    const std::vector<NodeId>& roots, const std::unordered_map<NodeId, std::vector<NodeId>>& dependencies) const {
    std::vector<std::string> cycles;
    std::unordered_map<NodeId, int> colors; // 0=white, 1=gray, 2=black
    std::vector<NodeId> path;
    
    std::function<void(NodeId)> dfs = [&](NodeId node) {
        colors[node] = 1;
        path.push_back(node);
        
        auto deps = dependencies.find(node);
        if (deps != dependencies.end()) {
            for (NodeId dep : deps->second) {
                if (colors[dep] == 1) {
                    auto cycle_start = std::find(path.begin(), path.end(), dep);
                    std::string cycle_str;
                    for (auto it = cycle_start; it != path.end(); ++it) {
                        if (!cycle_str.empty()) cycle_str += " -> ";
                        cycle_str += nodes_[*it].getUid();
                    }
                    cycle_str += " -> " + nodes_[dep].getUid();
                    cycles.push_back(cycle_str);
                } else if (colors[dep] == 0) {
                    dfs(dep);
                }
            }
        }
        
        path.pop_back();
        colors[node] = 2;
    };
    
    for (NodeId root : roots) {
        if (colors[root] == 0) {
            dfs(root);
        }
    }
    return cycles;
}

} // namespace MLC::Graph
