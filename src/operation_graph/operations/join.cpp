// EN: Join operation
// FR: Opération de jointure

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"

#include <algorithm>
#include <unordered_map>

namespace MLC::Operations {

namespace {

// EN: Key cells compare by text so that "1" and 1 match
// FR: Les cellules clés se comparent par texte pour que "1" et 1 correspondent
std::string keyText(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string listColumns(const Table& table) {
    std::string list = "[";
    for (size_t i = 0; i < table.getColumnCount(); ++i) {
        if (i > 0) list += ", ";
        list += "\"" + table.getColumns()[i] + "\"";
    }
    return list + "]";
}

} // namespace

Join::Join(std::string node_uid, Graph::Source left, Graph::Source right)
    : Operation(OperationKind::JOIN, std::move(node_uid)), left_(std::move(left)), right_(std::move(right)) {}

OperationOutput Join::call(const std::vector<OperationOutput>& inputs) const {
    if (inputs.size() != 2) {
        throw ExecutionError("Unsupported: trying to join " + std::to_string(inputs.size()) + " tables in " +
                             getName() + ".");
    }
    if (!left_.column || !right_.column) {
        throw ExecutionError(getName() + " does not define a column name to join on.");
    }
    const std::string& left_key = *left_.column;
    const std::string& right_key = *right_.column;
    
    // EN: The topological order does not tell which input is which side: the left one holds the
    //     source node, with column presence deciding when origins do not
    // FR: L'ordre topologique ne dit pas quelle entrée est quel côté : celle de gauche contient le
    //     nœud source, la présence des colonnes tranchant quand les origines ne le font pas
    const Table* left = &tableInput(inputs, 0, *this);
    const Table* right = &tableInput(inputs, 1, *this);
    const bool first_is_left = left->hasOrigin(left_.node);
    const bool second_is_left = right->hasOrigin(left_.node);
    if (first_is_left != second_is_left) {
        if (second_is_left) {
            std::swap(left, right);
        }
    } else if (!left->hasColumn(left_key) || !right->hasColumn(right_key)) {
        std::swap(left, right);
    }
    if (!left->hasColumn(left_key)) {
        throw ExecutionError("Column \"" + left_key + "\" does not exist in node \"" + left_.node +
                             "\". Existing columns: " + listColumns(*left));
    }
    if (!right->hasColumn(right_key)) {
        throw ExecutionError("Column \"" + right_key + "\" does not exist in node \"" + right_.node +
                             "\". Existing columns: " + listColumns(*right));
    }
    
    // EN: Output columns: left ones, then right ones minus a same-named key, renamed on collision
    // FR: Colonnes de sortie : celles de gauche, puis celles de droite sans clé homonyme, renommées en cas de collision
    Table result(left->getColumns());
    for (const Table* side : {left, right}) {
        for (const auto& origin : side->getOrigins()) {
            result.addOrigin(origin);
        }
    }
    std::vector<std::pair<size_t, size_t>> right_mapping;
    for (size_t i = 0; i < right->getColumnCount(); ++i) {
        const std::string& column = right->getColumns()[i];
        if (column == right_key && right_key == left_key) {
            continue;
        }
        std::string name = result.hasColumn(column) ? right_.node + "/" + column : column;
        right_mapping.emplace_back(i, result.addColumn(name));
    }
    
    std::unordered_multimap<std::string, size_t> right_index;
    size_t right_key_index = *right->columnIndex(right_key);
    for (size_t row = 0; row < right->getRowCount(); ++row) {
        const auto& key = right->getRow(row)[right_key_index];
        if (!key.is_null()) {
            right_index.emplace(keyText(key), row);
        }
    }
    
    size_t left_key_index = *left->columnIndex(left_key);
    for (size_t row = 0; row < left->getRowCount(); ++row) {
        Row base = left->getRow(row);
        base.resize(result.getColumnCount(), nullptr);
        nlohmann::json& key = base[left_key_index];
        if (!key.is_null() && !left_.transforms.empty()) {
            key = Graph::applyTransforms(keyText(key), left_.transforms);
        }
        
        if (key.is_null()) {
            result.addRow(std::move(base));
            continue;
        }
        auto [begin, end] = right_index.equal_range(keyText(key));
        if (begin == end) {
            result.addRow(std::move(base));
            continue;
        }
        
        // EN: Multimap order is unspecified: keep right rows in table order
        // FR: L'ordre du multimap n'est pas spécifié : garder les lignes de droite dans l'ordre de la table
        std::vector<size_t> matches;
        for (auto it = begin; it != end; ++it) {
            matches.push_back(it->second);
        }
        std::sort(matches.begin(), matches.end());
        for (size_t match : matches) {
            Row joined = base;
            const Row& right_row = right->getRow(match);
            for (const auto& [from, to] : right_mapping) {
                joined[to] = right_row[from];
            }
            result.addRow(std::move(joined));
        }
    }
    return result;
}

} // namespace MLC::Operations
