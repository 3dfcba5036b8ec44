// EN: In-memory table flowing between operations - ordered columns, rows of JSON cells
// FR: Table en mémoire circulant entre les opérations - colonnes ordonnées, lignes de cellules JSON

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace MLC::Operations {

using Row = std::vector<nlohmann::json>;

class Table {
public:
    Table() = default;
    explicit Table(std::vector<std::string> columns);
    
    // EN: Shape
    // FR: Forme
    const std::vector<std::string>& getColumns() const { return columns_; }
    size_t getRowCount() const { return rows_.size(); }
    size_t getColumnCount() const { return columns_.size(); }
    bool empty() const { return rows_.empty(); }
    
    bool hasColumn(const std::string& name) const;
    std::optional<size_t> columnIndex(const std::string& name) const;
    
    // EN: Add a column (filled with null) and return its index; an existing column is reused.
    // FR: Ajoute une colonne (remplie de null) et retourne son index ; une colonne existante est réutilisée.
    size_t addColumn(const std::string& name);
    
    // EN: Append a row. Short rows are padded with null, long rows throw std::invalid_argument.
    // FR: Ajoute une ligne. Les lignes courtes sont complétées par null, les longues lèvent std::invalid_argument.
    void addRow(Row row);
    
    const Row& getRow(size_t index) const { return rows_.at(index); }
    const std::vector<Row>& getRows() const { return rows_; }
    
    // EN: Cell access by column name; throws std::out_of_range on unknown column.
    // FR: Accès à une cellule par nom de colonne ; lève std::out_of_range si la colonne est inconnue.
    const nlohmann::json& at(size_t row, const std::string& column) const;
    void set(size_t row, const std::string& column, nlohmann::json value);
    
    std::vector<nlohmann::json> getColumn(const std::string& name) const;
    
    // EN: Append the rows of another table, aligning on column names.
    // FR: Ajoute les lignes d'une autre table, en s'alignant sur les noms de colonnes.
    void append(const Table& other);
    
    // EN: Row as a JSON object {column: value}
    // FR: Ligne sous forme d'objet JSON {colonne: valeur}
    nlohmann::json rowToJson(size_t index) const;
    
    // EN: Build from a JSON array of objects, columns in first-seen order.
    // FR: Construit depuis un tableau JSON d'objets, colonnes dans l'ordre de première apparition.
    static Table fromRecords(const nlohmann::json& records);
    
    // EN: Uids of the structural nodes whose data the table holds. Join uses them to tell its sides apart.
    // FR: Uids des nœuds structurels dont la table contient les données. Join s'en sert pour distinguer ses côtés.
    const std::vector<std::string>& getOrigins() const { return origins_; }
    bool hasOrigin(const std::string& uid) const;
    void addOrigin(const std::string& uid);
    
    // EN: Compares columns and rows only
    // FR: Compare seulement les colonnes et les lignes
    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<std::string> columns_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<Row> rows_;
    std::vector<std::string> origins_;
};

} // namespace MLC::Operations
