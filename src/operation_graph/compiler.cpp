// EN: Operation graph compiler implementation
// FR: Implémentation du compilateur du graphe d'opérations

#include "operation_graph/compiler.hpp"
#include "core/issues.hpp"
#include "infrastructure/logging/logger.hpp"
#include "io/archive.hpp"
#include "io/file_reader.hpp"

#include <algorithm>

namespace MLC::Operations {

namespace {

const std::string MODULE = "compiler";

// EN: Directory name derived from a node uid
// FR: Nom de répertoire dérivé d'un uid de nœud
std::string directoryName(const std::string& uid) {
    std::string name = uid;
    std::replace_if(name.begin(), name.end(), [](char c) {
        return c == '/' || c == '\\' || c == ':' || c == '.';
    }, '_');
    return name;
}

} // namespace

Compiler::Compiler(std::shared_ptr<const Graph::StructureGraph> graph, std::shared_ptr<IO::Fetcher> fetcher,
                   std::filesystem::path work_directory)
    : graph_(std::move(graph)), fetcher_(std::move(fetcher)), work_directory_(std::move(work_directory)) {}

std::shared_ptr<OperationGraph> Compiler::compile(const std::vector<std::string>& record_sets) {
    plan_ = std::make_shared<OperationGraph>();
    compiled_.clear();
    in_progress_.clear();
    
    for (const auto& name : record_sets) {
        auto record_set = graph_->findRecordSet(name);
        if (!record_set) {
            std::string available;
            for (const auto& existing : graph_->getRecordSetNames()) {
                if (!available.empty()) available += ", ";
                available += "\"" + existing + "\"";
            }
            throw ExecutionError("Did not find any record set with the name \"" + name +
                                 "\". Possible record sets: [" + available + "]");
        }
        plan_->setRecordSetOutput(name, compileRecordSet(*record_set));
    }
    
    std::unordered_map<std::string, std::string> metadata = {
        {"dataset", graph_->getName()},
        {"record_sets", std::to_string(record_sets.size())},
        {"operations", std::to_string(plan_->size())}
    };
    LOG_DEBUG_META(MODULE, "Compiled operation graph", metadata);
    return plan_;
}

OperationId Compiler::getOrAdd(OperationKind kind, const std::string& uid,
                               const std::function<std::shared_ptr<const Operation>()>& factory) {
    std::string key = operationKindToString(kind) + "|" + uid;
    auto it = compiled_.find(key);
    if (it != compiled_.end()) {
        return it->second;
    }
    OperationId id = plan_->addOperation(factory());
    compiled_[key] = id;
    return id;
}

OperationId Compiler::compileDownload(Graph::NodeId file_object) {
    const auto& node = graph_->getNode(file_object);
    const auto& payload = node.as<Graph::FileObjectNode>();
    std::string key = operationKindToString(OperationKind::DOWNLOAD) + "|" + node.getUid();
    if (compiled_.count(key)) {
        return compiled_[key];
    }
    
    std::string checksum = !payload.sha256.empty() ? payload.sha256 : payload.md5;
    OperationId download = getOrAdd(OperationKind::DOWNLOAD, node.getUid(), [&] {
        return std::make_shared<Download>(node.getUid(), payload.content_url, checksum, fetcher_);
    });
    
    // EN: A file inside an archive is located in the container's extraction directory
    // FR: Un fichier dans une archive est recherché dans le répertoire d'extraction du conteneur
    if (!payload.contained_in.empty()) {
        auto container = graph_->findByUid(payload.contained_in.front());
        if (!container || graph_->getNode(*container).getKind() != Graph::NodeKind::FILE_OBJECT) {
            throw ExecutionError("Distribution \"" + node.getUid() + "\" must be contained in a FileObject.");
        }
        plan_->addEdge(compileExtract(*container), download);
    }
    return download;
}

OperationId Compiler::compileExtract(Graph::NodeId file_object) {
    const auto& node = graph_->getNode(file_object);
    const auto& payload = node.as<Graph::FileObjectNode>();
    if (!IO::isArchiveFormat(payload.encoding_format)) {
        throw ExecutionError("Distribution \"" + node.getUid() + "\" is used as a container but \"" +
                             payload.encoding_format + "\" is not an archive format.");
    }
    
    std::string key = operationKindToString(OperationKind::EXTRACT) + "|" + node.getUid();
    if (compiled_.count(key)) {
        return compiled_[key];
    }
    OperationId download = compileDownload(file_object);
    OperationId extract = getOrAdd(OperationKind::EXTRACT, node.getUid(), [&] {
        return std::make_shared<Extract>(node.getUid(), work_directory_ / "extracted" / directoryName(node.getUid()));
    });
    plan_->addEdge(download, extract);
    return extract;
}

OperationId Compiler::compileFileSet(Graph::NodeId file_set) {
    const auto& node = graph_->getNode(file_set);
    const auto& payload = node.as<Graph::FileSetNode>();
    std::string key = operationKindToString(OperationKind::READ) + "|" + node.getUid();
    if (compiled_.count(key)) {
        return compiled_[key];
    }
    
    OperationId filter = getOrAdd(OperationKind::FILTER_FILES, node.getUid(), [&] {
        return std::make_shared<FilterFiles>(node.getUid(), payload.includes, graph_->getBasePath());
    });
    for (const auto& container_name : payload.contained_in) {
        auto container = graph_->findByUid(container_name);
        if (!container || graph_->getNode(*container).getKind() != Graph::NodeKind::FILE_OBJECT) {
            throw ExecutionError("FileSet \"" + node.getUid() + "\" must be contained in a FileObject.");
        }
        plan_->addEdge(compileExtract(*container), filter);
    }
    
    OperationId concatenate = getOrAdd(OperationKind::CONCATENATE, node.getUid(), [&] {
        return std::make_shared<Concatenate>(node.getUid());
    });
    plan_->addEdge(filter, concatenate);
    
    OperationId read = getOrAdd(OperationKind::READ, node.getUid(), [&] {
        return std::make_shared<Read>(node.getUid(), payload.encoding_format);
    });
    plan_->addEdge(concatenate, read);
    return read;
}

OperationId Compiler::compileTable(Graph::NodeId id) {
    const auto& node = graph_->getNode(id);
    switch (node.getKind()) {
        case Graph::NodeKind::FILE_OBJECT: {
            const auto& payload = node.as<Graph::FileObjectNode>();
            if (!IO::isTabularFormat(payload.encoding_format)) {
                throw ExecutionError("Distribution \"" + node.getUid() + "\" with encoding format \"" +
                                     payload.encoding_format + "\" cannot be read as a table.");
            }
            OperationId download = compileDownload(id);
            OperationId read = getOrAdd(OperationKind::READ, node.getUid(), [&] {
                return std::make_shared<Read>(node.getUid(), payload.encoding_format);
            });
            plan_->addEdge(download, read);
            return read;
        }
        case Graph::NodeKind::FILE_SET:
            return compileFileSet(id);
        case Graph::NodeKind::RECORD_SET:
            return compileRecordSet(id);
        default:
            throw ExecutionError("Node \"" + node.getUid() + "\" does not hold a table.");
    }
}

OperationId Compiler::compileRecordSet(Graph::NodeId record_set) {
    const auto& node = graph_->getNode(record_set);
    const auto& payload = node.as<Graph::RecordSetNode>();
    std::string key = operationKindToString(OperationKind::ASSEMBLE) + "|" + node.getUid();
    if (compiled_.count(key)) {
        return compiled_[key];
    }
    if (!in_progress_.insert(record_set).second) {
        throw ExecutionError("Record set \"" + node.getUid() + "\" depends on itself.");
    }
    
    OperationId table;
    if (payload.data) {
        table = getOrAdd(OperationKind::DATA, node.getUid(), [&] {
            return std::make_shared<Data>(node.getUid(), *payload.data);
        });
    } else {
        Graph::JoinPlan joins = graph_->planJoins(record_set);
        if (joins.inputs.empty()) {
            throw ExecutionError("Record set \"" + node.getUid() +
                                 "\" has no field reading from a distribution or a record set.");
        }
        if (!joins.isConnected()) {
            throw ExecutionError("Record set \"" + node.getUid() + "\" combines sources that no join connects.");
        }
        
        // EN: Chain binary joins, each bringing one new upstream table in
        // FR: Chaîne les jointures binaires, chacune apportant une nouvelle table amont
        table = compileTable(joins.inputs.front());
        std::unordered_set<Graph::NodeId> connected{joins.inputs.front()};
        for (Graph::NodeId join_field : joins.join_fields) {
            const auto& field_node = graph_->getNode(join_field);
            const auto& field = field_node.as<Graph::FieldNode>();
            Graph::NodeId left = *graph_->resolveSource(*field.source);
            Graph::NodeId right = *graph_->resolveSource(*field.references);
            Graph::NodeId newcomer = connected.count(left) ? right : left;
            
            OperationId join = getOrAdd(OperationKind::JOIN, field_node.getUid(), [&] {
                return std::make_shared<Join>(field_node.getUid(), *field.source, *field.references);
            });
            plan_->addEdge(table, join);
            plan_->addEdge(compileTable(newcomer), join);
            connected.insert(newcomer);
            table = join;
        }
    }
    
    std::vector<std::string> field_names;
    std::vector<OperationId> field_operations;
    for (Graph::NodeId field : graph_->getFields(record_set)) {
        FieldSpec spec = makeFieldSpec(field);
        field_names.push_back(spec.name);
        OperationId read_field = getOrAdd(OperationKind::READ_FIELD, spec.uid, [&] {
            return std::make_shared<ReadField>(spec);
        });
        plan_->addEdge(table, read_field);
        field_operations.push_back(read_field);
    }
    
    OperationId assemble = getOrAdd(OperationKind::ASSEMBLE, node.getUid(), [&] {
        return std::make_shared<Assemble>(node.getUid(), field_names);
    });
    for (OperationId read_field : field_operations) {
        plan_->addEdge(read_field, assemble);
    }
    
    in_progress_.erase(record_set);
    return assemble;
}

FieldSpec Compiler::makeFieldSpec(Graph::NodeId field) const {
    const auto& node = graph_->getNode(field);
    const auto& payload = node.as<Graph::FieldNode>();
    
    FieldSpec spec;
    spec.name = node.getName();
    spec.uid = node.getUid();
    spec.source = payload.source;
    for (Graph::NodeId sub_field : graph_->getFields(field)) {
        spec.sub_fields.push_back(makeFieldSpec(sub_field));
    }
    if (spec.sub_fields.empty()) {
        if (auto iri = graph_->resolveDataTypeIri(field)) {
            spec.data_type = Graph::dataTypeFromIri(*iri);
        }
    }
    return spec;
}

} // namespace MLC::Operations
