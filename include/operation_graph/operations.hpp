// EN: Concrete operations - fetch, extract, file selection, parsing, joins, field projection, assembly
// FR: Opérations concrètes - récupération, extraction, sélection de fichiers, parsing, jointures, projection, assemblage

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "io/fetcher.hpp"
#include "operation_graph/operation.hpp"
#include "structure_graph/source.hpp"
#include "structure_graph/vocabulary.hpp"

namespace MLC::Operations {

// EN: Fetch a FileObject. With an input (the extracted container directory) the file is looked up inside it.
// FR: Récupère un FileObject. Avec une entrée (répertoire du conteneur extrait) le fichier y est recherché.
class Download : public Operation {
public:
    Download(std::string node_uid, std::string url, std::string checksum, std::shared_ptr<IO::Fetcher> fetcher);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    std::string url_;
    std::string checksum_;
    std::shared_ptr<IO::Fetcher> fetcher_;
};

// EN: Unpack a downloaded archive into its own directory.
// FR: Extrait une archive téléchargée dans son propre répertoire.
class Extract : public Operation {
public:
    Extract(std::string node_uid, std::filesystem::path target_directory);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    std::filesystem::path target_directory_;
};

// EN: Select files matching a glob under each input directory (or the default root without inputs).
// FR: Sélectionne les fichiers correspondant à un glob sous chaque répertoire d'entrée (ou la racine par défaut).
class FilterFiles : public Operation {
public:
    FilterFiles(std::string node_uid, std::string includes, std::filesystem::path default_root);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    std::string includes_;
    std::filesystem::path default_root_;
};

// EN: One row per input file with the filepath, filename and fullpath columns.
// FR: Une ligne par fichier d'entrée avec les colonnes filepath, filename et fullpath.
class Concatenate : public Operation {
public:
    explicit Concatenate(std::string node_uid);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;
};

// EN: Parse a file (FileObject) or every file of a path table (FileSet) into one table.
// FR: Parse un fichier (FileObject) ou chaque fichier d'une table de chemins (FileSet) en une table.
class Read : public Operation {
public:
    Read(std::string node_uid, std::string encoding_format);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    std::string encoding_format_;
};

// EN: Literal records of a record set
// FR: Enregistrements littéraux d'un record set
class Data : public Operation {
public:
    Data(std::string node_uid, nlohmann::json records);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    nlohmann::json records_;
};

// EN: Order-independent left outer join of exactly two tables on left.column == right.column.
// FR: Jointure externe gauche indépendante de l'ordre de deux tables sur left.column == right.column.
class Join : public Operation {
public:
    Join(std::string node_uid, Graph::Source left, Graph::Source right);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    Graph::Source left_;
    Graph::Source right_;
};

// EN: What ReadField needs to know about a field
// FR: Ce que ReadField doit savoir d'un champ
struct FieldSpec {
    std::string name;
    std::string uid;
    std::optional<Graph::Source> source;        // EN: Unset for inline data / FR: Absent pour les données en ligne
    std::optional<Graph::DataType> data_type;   // EN: Unset for nested fields / FR: Absent pour les champs imbriqués
    std::vector<FieldSpec> sub_fields;
};

// EN: Project one field out of the record set table: transforms, then coercion to the data type.
// FR: Projette un champ hors de la table du record set : transformations puis conversion vers le type.
class ReadField : public Operation {
public:
    explicit ReadField(FieldSpec field);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    FieldSpec field_;
};

// EN: Combine single-column field tables into the record set table, in field order.
// FR: Combine les tables mono-colonne des champs en table du record set, dans l'ordre des champs.
class Assemble : public Operation {
public:
    Assemble(std::string node_uid, std::vector<std::string> field_names);
    OperationOutput call(const std::vector<OperationOutput>& inputs) const override;

private:
    std::vector<std::string> field_names_;
};

// EN: Glob over '/'-separated relative paths: "**" spans directories, '*' and '?' stay within one component.
// FR: Glob sur des chemins relatifs séparés par '/' : "**" traverse les répertoires, '*' et '?' restent dans un composant.
bool globMatch(const std::string& pattern, const std::string& path);

// EN: Convert a cell to a data type. Empty strings become null except for text types.
// FR: Convertit une cellule vers un type. Les chaînes vides deviennent null sauf pour les types texte.
nlohmann::json coerceValue(const nlohmann::json& value, Graph::DataType type, const std::string& field_uid);

} // namespace MLC::Operations
