// EN: Vocabulary helpers implementation
// FR: Implémentation des utilitaires de vocabulaire

#include "structure_graph/vocabulary.hpp"

namespace MLC::Graph {

namespace Vocabulary {

std::string propertyIri(const std::string& key) {
    static const std::unordered_map<std::string, std::string> ml_commons_keys = {
        {INCLUDES, ML_COMMONS + INCLUDES},
        {DATA_TYPE, ML_COMMONS + DATA_TYPE},
        {SOURCE, ML_COMMONS + SOURCE},
        {REFERENCES, ML_COMMONS + REFERENCES},
        {FIELD, ML_COMMONS + FIELD},
        {SUB_FIELD, ML_COMMONS + SUB_FIELD},
        {RECORD_SET, ML_COMMONS + RECORD_SET},
        {DATA, ML_COMMONS + DATA},
        {APPLY_TRANSFORM, ML_COMMONS + APPLY_TRANSFORM},
    };
    auto it = ml_commons_keys.find(key);
    if (it != ml_commons_keys.end()) {
        return it->second;
    }
    return SCHEMA_ORG + key;
}

} // namespace Vocabulary

std::optional<DataType> dataTypeFromIri(const std::string& iri) {
    static const std::unordered_map<std::string, DataType> types = {
        {Vocabulary::SCHEMA_ORG + "Text", DataType::TEXT},
        {Vocabulary::SCHEMA_ORG + "URL", DataType::URL},
        {Vocabulary::SCHEMA_ORG + "Integer", DataType::INTEGER},
        {Vocabulary::SCHEMA_ORG + "Float", DataType::FLOAT},
        {Vocabulary::SCHEMA_ORG + "Number", DataType::FLOAT},
        {Vocabulary::SCHEMA_ORG + "Boolean", DataType::BOOLEAN},
        {Vocabulary::SCHEMA_ORG + "Date", DataType::DATE},
        {Vocabulary::SCHEMA_ORG + "ImageObject", DataType::IMAGE_OBJECT},
    };
    auto it = types.find(iri);
    if (it == types.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string dataTypeToString(DataType type) {
    switch (type) {
        case DataType::TEXT: return "Text";
        case DataType::URL: return "URL";
        case DataType::INTEGER: return "Integer";
        case DataType::FLOAT: return "Float";
        case DataType::BOOLEAN: return "Boolean";
        case DataType::DATE: return "Date";
        case DataType::IMAGE_OBJECT: return "ImageObject";
        default: return "UNKNOWN";
    }
}

std::vector<std::string> allowedDataTypeIris() {
    return {
        Vocabulary::SCHEMA_ORG + "Boolean",
        Vocabulary::SCHEMA_ORG + "Date",
        Vocabulary::SCHEMA_ORG + "Float",
        Vocabulary::SCHEMA_ORG + "ImageObject",
        Vocabulary::SCHEMA_ORG + "Integer",
        Vocabulary::SCHEMA_ORG + "Number",
        Vocabulary::SCHEMA_ORG + "Text",
        Vocabulary::SCHEMA_ORG + "URL",
    };
}

PrefixMap::PrefixMap() {
    prefixes_["sc"] = Vocabulary::SCHEMA_ORG;
    prefixes_["ml"] = Vocabulary::ML_COMMONS;
}

void PrefixMap::load(const nlohmann::json& context) {
    if (!context.is_object()) {
        return;
    }
    for (const auto& [prefix, value] : context.items()) {
        if (value.is_string() && !prefix.empty() && prefix.front() != '@') {
            prefixes_[prefix] = value.get<std::string>();
        }
    }
}

std::string PrefixMap::expand(const std::string& compact) const {
    size_t colon = compact.find(':');
    if (colon == std::string::npos) {
        return compact;
    }
    // EN: "https://..." stays as is: only a registered prefix is expanded.
    // FR: "https://..." reste tel quel : seul un préfixe enregistré est étendu.
    auto it = prefixes_.find(compact.substr(0, colon));
    if (it == prefixes_.end() || compact.compare(colon, 3, "://") == 0) {
        return compact;
    }
    return it->second + compact.substr(colon + 1);
}

} // namespace MLC::Graph
