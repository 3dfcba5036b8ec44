// EN: File readers - parse CSV, JSON and JSON-lines files into tables
// FR: Lecteurs de fichiers - parsent les fichiers CSV, JSON et JSON-lines en tables

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "operation_graph/table.hpp"

namespace MLC::IO {

// EN: Encoding formats understood by the readers
// FR: Formats d'encodage compris par les lecteurs
namespace EncodingFormat {
inline const std::string CSV = "text/csv";
inline const std::string JSON = "application/json";
inline const std::string JSON_LINES = "application/jsonlines";
inline const std::string NDJSON = "application/x-ndjson";
} // namespace EncodingFormat

struct CsvOptions {
    char delimiter = ',';
    char quote_char = '"';
};

// EN: Split one logical CSV row. Doubled quotes inside quoted fields are unescaped.
// FR: Découpe une ligne CSV logique. Les quotes doublées dans les champs quotés sont déséchappées.
std::vector<std::string> parseCsvRow(const std::string& row, const CsvOptions& options = {});

// EN: Whether every quote of the row is closed (a quoted field may span several lines).
// FR: Si toutes les quotes de la ligne sont fermées (un champ quoté peut couvrir plusieurs lignes).
bool isCsvRowComplete(const std::string& row, const CsvOptions& options = {});

// EN: Header row gives the columns; every value is kept as a string.
// FR: La ligne d'en-tête donne les colonnes ; chaque valeur est gardée comme chaîne.
Operations::Table readCsv(const std::filesystem::path& path, const CsvOptions& options = {});

// EN: An array of objects, or a single object read as one row.
// FR: Un tableau d'objets, ou un objet unique lu comme une ligne.
Operations::Table readJson(const std::filesystem::path& path);

// EN: One JSON object per non-empty line.
// FR: Un objet JSON par ligne non vide.
Operations::Table readJsonLines(const std::filesystem::path& path);

bool isTabularFormat(const std::string& encoding_format);

// EN: Dispatch on the encoding format; throws ExecutionError for anything not tabular.
// FR: Aiguille selon le format d'encodage ; lève ExecutionError pour tout format non tabulaire.
Operations::Table readTable(const std::filesystem::path& path, const std::string& encoding_format);

// EN: Whole file as raw bytes
// FR: Fichier entier en octets bruts
std::string readFileBytes(const std::filesystem::path& path);

} // namespace MLC::IO
