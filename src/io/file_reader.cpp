// EN: File readers implementation
// FR: Implémentation des lecteurs de fichiers

#include "io/file_reader.hpp"
#include "core/issues.hpp"

#include <fstream>
#include <iterator>

namespace MLC::IO {

namespace {

std::ifstream openOrThrow(const std::filesystem::path& path, std::ios::openmode mode = std::ios::in) {
    std::ifstream file(path, mode);
    if (!file.is_open()) {
        throw ExecutionError("Cannot open file: " + path.string());
    }
    return file;
}

void stripBom(std::string& line) {
    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
    }
}

void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

std::vector<std::string> parseCsvRow(const std::string& row, const CsvOptions& options) {
    std::vector<std::string> fields;
    if (row.empty()) {
        return fields;
    }
    
    size_t pos = 0;
    bool in_quotes = false;
    std::string current_field;
    
    while (pos < row.length()) {
        char c = row[pos];
        
        if (c == options.quote_char) {
            if (in_quotes && pos + 1 < row.length() && row[pos + 1] == options.quote_char) {
                // EN: Escaped quote within quoted field
                // FR: Quote échappée dans un champ quoté
                current_field += options.quote_char;
                pos += 2;
            } else {
                in_quotes = !in_quotes;
                pos++;
            }
        } else if (c == options.delimiter && !in_quotes) {
            fields.push_back(current_field);
            current_field.clear();
            pos++;
        } else {
            current_field += c;
            pos++;
        }
    }
    
    fields.push_back(current_field);
    return fields;
}

bool isCsvRowComplete(const std::string& row, const CsvOptions& options) {
    bool in_quotes = false;
    for (char c : row) {
        if (c == options.quote_char) {
            in_quotes = !in_quotes;
        }
    }
    return !in_quotes;
}

Operations::Table readCsv(const std::filesystem::path& path, const CsvOptions& options) {
    std::ifstream file = openOrThrow(path);
    Operations::Table table;
    bool header_read = false;
    size_t line_number = 0;
    std::string line;
    
    while (std::getline(file, line)) {
        ++line_number;
        stripCarriageReturn(line);
        
        // EN: Quoted fields may contain newlines: keep reading until quotes balance
        // FR: Les champs quotés peuvent contenir des retours à la ligne : lire jusqu'à équilibrer les quotes
        std::string row = line;
        std::string continuation;
        while (!isCsvRowComplete(row, options) && std::getline(file, continuation)) {
            ++line_number;
            stripCarriageReturn(continuation);
            row += "\n" + continuation;
        }
        if (!isCsvRowComplete(row, options)) {
            throw ExecutionError("Unterminated quoted field in " + path.string() + " at line " +
                                 std::to_string(line_number));
        }
        
        if (!header_read) {
            stripBom(row);
            for (const auto& column : parseCsvRow(row, options)) {
                table.addColumn(column);
            }
            header_read = true;
            continue;
        }
        if (row.empty()) {
            continue;
        }
        
        auto cells = parseCsvRow(row, options);
        if (cells.size() > table.getColumnCount()) {
            throw ExecutionError("Malformed CSV row at line " + std::to_string(line_number) + " of " +
                                 path.string() + ": expected " + std::to_string(table.getColumnCount()) +
                                 " cells, got " + std::to_string(cells.size()));
        }
        Operations::Row values(cells.begin(), cells.end());
        table.addRow(std::move(values));
    }
    return table;
}

Operations::Table readJson(const std::filesystem::path& path) {
    std::ifstream file = openOrThrow(path);
    nlohmann::json content = nlohmann::json::parse(file, nullptr, false);
    if (content.is_discarded()) {
        throw ExecutionError("Invalid JSON in file: " + path.string());
    }
    if (content.is_object()) {
        content = nlohmann::json::array({content});
    }
    try {
        return Operations::Table::fromRecords(content);
    } catch (const std::invalid_argument& e) {
        throw ExecutionError("Unsupported JSON layout in " + path.string() + ": " + e.what());
    }
}

Operations::Table readJsonLines(const std::filesystem::path& path) {
    std::ifstream file = openOrThrow(path);
    nlohmann::json records = nlohmann::json::array();
    size_t line_number = 0;
    std::string line;
    
    while (std::getline(file, line)) {
        ++line_number;
        stripCarriageReturn(line);
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        nlohmann::json record = nlohmann::json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            throw ExecutionError("Invalid JSON object at line " + std::to_string(line_number) + " of " +
                                 path.string());
        }
        records.push_back(std::move(record));
    }
    return Operations::Table::fromRecords(records);
}

bool isTabularFormat(const std::string& encoding_format) {
    return encoding_format == EncodingFormat::CSV || encoding_format == EncodingFormat::JSON ||
           encoding_format == EncodingFormat::JSON_LINES || encoding_format == EncodingFormat::NDJSON;
}

Operations::Table readTable(const std::filesystem::path& path, const std::string& encoding_format) {
    if (encoding_format == EncodingFormat::CSV) {
        return readCsv(path);
    }
    if (encoding_format == EncodingFormat::JSON) {
        return readJson(path);
    }
    if (encoding_format == EncodingFormat::JSON_LINES || encoding_format == EncodingFormat::NDJSON) {
        return readJsonLines(path);
    }
    throw ExecutionError("Unsupported encoding format \"" + encoding_format + "\" for file " + path.string() +
                         ". Supported formats: [" + EncodingFormat::CSV + ", " + EncodingFormat::JSON + ", " +
                         EncodingFormat::JSON_LINES + ", " + EncodingFormat::NDJSON + "].");
}

std::string readFileBytes(const std::filesystem::path& path) {
    std::ifstream file = openOrThrow(path, std::ios::in | std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace MLC::IO
