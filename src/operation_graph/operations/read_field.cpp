// EN: ReadField operation and value coercion
// FR: Opération ReadField et conversion des valeurs

#include "operation_graph/operations.hpp"
#include "core/issues.hpp"
#include "io/file_reader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <regex>

namespace MLC::Operations {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::string cellText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_binary()) {
        const auto& bytes = value.get_binary();
        return std::string(bytes.begin(), bytes.end());
    }
    return value.dump();
}

[[noreturn]] void conversionError(const nlohmann::json& value, Graph::DataType type, const std::string& field_uid) {
    throw ExecutionError("Cannot convert value " + (value.is_binary() ? std::string("<binary>") : value.dump()) +
                         " of field \"" + field_uid + "\" to " + Graph::dataTypeToString(type) + ".");
}

} // namespace

nlohmann::json coerceValue(const nlohmann::json& value, Graph::DataType type, const std::string& field_uid) {
    using Graph::DataType;
    
    if (value.is_null()) {
        return nullptr;
    }
    if (type == DataType::TEXT || type == DataType::URL) {
        return cellText(value);
    }
    if (value.is_string() && trim(value.get<std::string>()).empty()) {
        return nullptr;
    }
    
    switch (type) {
        case DataType::INTEGER: {
            if (value.is_number_integer()) {
                return value;
            }
            if (value.is_number_float()) {
                double number = value.get<double>();
                if (std::floor(number) == number) {
                    return static_cast<int64_t>(number);
                }
                conversionError(value, type, field_uid);
            }
            if (value.is_string()) {
                std::string text = trim(value.get<std::string>());
                char* end = nullptr;
                long long number = std::strtoll(text.c_str(), &end, 10);
                if (end && *end == '\0') {
                    return static_cast<int64_t>(number);
                }
            }
            conversionError(value, type, field_uid);
        }
        case DataType::FLOAT: {
            if (value.is_number()) {
                return value.get<double>();
            }
            if (value.is_string()) {
                std::string text = trim(value.get<std::string>());
                char* end = nullptr;
                double number = std::strtod(text.c_str(), &end);
                if (end && *end == '\0') {
                    return number;
                }
            }
            conversionError(value, type, field_uid);
        }
        case DataType::BOOLEAN: {
            if (value.is_boolean()) {
                return value;
            }
            if (value.is_number_integer() && (value.get<int64_t>() == 0 || value.get<int64_t>() == 1)) {
                return value.get<int64_t>() == 1;
            }
            if (value.is_string()) {
                std::string text = toLower(trim(value.get<std::string>()));
                if (text == "true" || text == "1" || text == "yes") return true;
                if (text == "false" || text == "0" || text == "no") return false;
            }
            conversionError(value, type, field_uid);
        }
        case DataType::DATE: {
            static const std::regex date_pattern(R"(^(\d{4})-(\d{2})-(\d{2}))");
            std::smatch match;
            std::string text = value.is_string() ? trim(value.get<std::string>()) : "";
            if (std::regex_search(text, match, date_pattern)) {
                int month = std::stoi(match[2].str());
                int day = std::stoi(match[3].str());
                if (month >= 1 && month <= 12 && day >= 1 && day <= 31) {
                    return match[0].str();
                }
            }
            conversionError(value, type, field_uid);
        }
        case DataType::IMAGE_OBJECT: {
            if (value.is_binary()) {
                return value;
            }
            // EN: A path to the image, else the bytes themselves
            // FR: Un chemin vers l'image, sinon les octets eux-mêmes
            std::string text = cellText(value);
            std::error_code ec;
            if (value.is_string() && std::filesystem::is_regular_file(text, ec)) {
                text = IO::readFileBytes(text);
            }
            return nlohmann::json::binary(std::vector<std::uint8_t>(text.begin(), text.end()));
        }
        default:
            conversionError(value, type, field_uid);
    }
}

ReadField::ReadField(FieldSpec field)
    : Operation(OperationKind::READ_FIELD, field.uid), field_(std::move(field)) {}

namespace {

// EN: Values of one field for every row of the table
// FR: Valeurs d'un champ pour chaque ligne de la table
std::vector<nlohmann::json> readValues(const FieldSpec& field, const Table& table, const std::string& operation) {
    std::vector<nlohmann::json> values(table.getRowCount(), nullptr);
    
    if (!field.sub_fields.empty()) {
        for (auto& value : values) {
            value = nlohmann::json::object();
        }
        for (const auto& sub_field : field.sub_fields) {
            auto sub_values = readValues(sub_field, table, operation);
            for (size_t row = 0; row < values.size(); ++row) {
                values[row][sub_field.name] = std::move(sub_values[row]);
            }
        }
        return values;
    }
    
    std::string column = field.name;
    if (field.source) {
        column = field.source->column.value_or(field.name);
        std::string qualified = field.source->node + "/" + column;
        if (table.hasColumn(qualified)) {
            column = qualified;
        }
    }
    
    const bool lazy_content = column == Graph::Vocabulary::FILE_PROPERTY_CONTENT && !table.hasColumn(column) &&
                              table.hasColumn(Graph::Vocabulary::FILE_PROPERTY_FILEPATH);
    if (!table.hasColumn(column) && !lazy_content) {
        std::string existing;
        for (const auto& name : table.getColumns()) {
            if (!existing.empty()) existing += ", ";
            existing += "\"" + name + "\"";
        }
        throw ExecutionError("Column \"" + column + "\" does not exist in node \"" +
                             (field.source ? field.source->node : field.uid) + "\" read by " + operation +
                             ". Existing columns: [" + existing + "]");
    }
    
    for (size_t row = 0; row < values.size(); ++row) {
        nlohmann::json value;
        if (lazy_content) {
            std::string bytes = IO::readFileBytes(
                table.at(row, Graph::Vocabulary::FILE_PROPERTY_FILEPATH).get<std::string>());
            value = nlohmann::json::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
        } else {
            value = table.at(row, column);
        }
        if (field.source && !field.source->transforms.empty() && !value.is_null()) {
            value = Graph::applyTransforms(cellText(value), field.source->transforms);
        }
        if (field.data_type) {
            value = coerceValue(value, *field.data_type, field.uid);
        }
        values[row] = std::move(value);
    }
    return values;
}

} // namespace

OperationOutput ReadField::call(const std::vector<OperationOutput>& inputs) const {
    if (inputs.size() != 1) {
        throw ExecutionError(getName() + " expects exactly one input, got " + std::to_string(inputs.size()) + ".");
    }
    const Table& table = tableInput(inputs, 0, *this);
    
    Table result({field_.name});
    for (auto& value : readValues(field_, table, getName())) {
        result.addRow({std::move(value)});
    }
    return result;
}

} // namespace MLC::Operations
