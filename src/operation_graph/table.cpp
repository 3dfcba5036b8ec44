// EN: Table implementation
// FR: Implémentation de la table

#include "operation_graph/table.hpp"

#include <algorithm>
#include <stdexcept>

namespace MLC::Operations {

Table::Table(std::vector<std::string> columns) {
    for (const auto& column : columns) {
        addColumn(column);
    }
}

bool Table::hasColumn(const std::string& name) const {
    return index_.count(name) > 0;
}

std::optional<size_t> Table::columnIndex(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Table::addColumn(const std::string& name) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        return it->second;
    }
    size_t index = columns_.size();
    columns_.push_back(name);
    index_[name] = index;
    for (auto& row : rows_) {
        row.emplace_back(nullptr);
    }
    return index;
}

void Table::addRow(Row row) {
    if (row.size() > columns_.size()) {
        throw std::invalid_argument("Row has " + std::to_string(row.size()) + " cells but the table has " +
                                    std::to_string(columns_.size()) + " columns");
    }
    row.resize(columns_.size(), nullptr);
    rows_.push_back(std::move(row));
}

const nlohmann::json& Table::at(size_t row, const std::string& column) const {
    auto index = columnIndex(column);
    if (!index) {
        throw std::out_of_range("Unknown column: " + column);
    }
    return rows_.at(row)[*index];
}

void Table::set(size_t row, const std::string& column, nlohmann::json value) {
    auto index = columnIndex(column);
    if (!index) {
        throw std::out_of_range("Unknown column: " + column);
    }
    rows_.at(row)[*index] = std::move(value);
}

std::vector<nlohmann::json> Table::getColumn(const std::string& name) const {
    auto index = columnIndex(name);
    if (!index) {
        throw std::out_of_range("Unknown column: " + name);
    }
    std::vector<nlohmann::json> values;
    values.reserve(rows_.size());
    for (const auto& row : rows_) {
        values.push_back(row[*index]);
    }
    return values;
}

void Table::append(const Table& other) {
    std::vector<size_t> mapping;
    mapping.reserve(other.columns_.size());
    for (const auto& column : other.columns_) {
        mapping.push_back(addColumn(column));
    }
    for (const auto& origin : other.origins_) {
        addOrigin(origin);
    }
    for (const auto& other_row : other.rows_) {
        Row row(columns_.size(), nullptr);
        for (size_t i = 0; i < other_row.size(); ++i) {
            row[mapping[i]] = other_row[i];
        }
        rows_.push_back(std::move(row));
    }
}

nlohmann::json Table::rowToJson(size_t index) const {
    const Row& row = rows_.at(index);
    nlohmann::json object = nlohmann::json::object();
    for (size_t i = 0; i < columns_.size(); ++i) {
        object[columns_[i]] = row[i];
    }
    return object;
}

Table Table::fromRecords(const nlohmann::json& records) {
    Table table;
    if (!records.is_array()) {
        throw std::invalid_argument("Expected a JSON array of records");
    }
    for (const auto& record : records) {
        if (!record.is_object()) {
            throw std::invalid_argument("Expected a JSON object, got: " + record.dump());
        }
        for (const auto& [key, value] : record.items()) {
            table.addColumn(key);
        }
    }
    for (const auto& record : records) {
        Row row(table.columns_.size(), nullptr);
        for (const auto& [key, value] : record.items()) {
            row[table.index_[key]] = value;
        }
        table.rows_.push_back(std::move(row));
    }
    return table;
}

bool Table::hasOrigin(const std::string& uid) const {
    return std::find(origins_.begin(), origins_.end(), uid) != origins_.end();
}

void Table::addOrigin(const std::string& uid) {
    if (!hasOrigin(uid)) {
        origins_.push_back(uid);
    }
}

bool Table::operator==(const Table& other) const {
    return columns_ == other.columns_ && rows_ == other.rows_;
}

} // namespace MLC::Operations
