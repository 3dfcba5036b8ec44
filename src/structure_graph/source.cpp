// EN: Source reference parsing and transform application
// FR: Parsing des références source et application des transformations

#include "structure_graph/source.hpp"
#include "structure_graph/vocabulary.hpp"

namespace MLC::Graph {

namespace {

// EN: "#{node}" or "#{node/column}". The node part may not contain '/', '#', '{' or '}'.
// FR: "#{node}" ou "#{node/column}". La partie nœud ne peut contenir ni '/', '#', '{' ni '}'.
const std::regex& referencePattern() {
    static const std::regex pattern(R"(^#\{([^/#{}]+)(?:/([^#{}]+))?\}$)");
    return pattern;
}

bool parseReference(const std::string& text, Source& source) {
    std::smatch match;
    if (!std::regex_match(text, match, referencePattern())) {
        return false;
    }
    source.raw = text;
    source.node = match[1].str();
    if (match[2].matched) {
        source.column = match[2].str();
    }
    return true;
}

bool parseTransform(const nlohmann::json& value, Source& source, std::string& error) {
    if (!value.is_object()) {
        error = "Malformed transform in source " + source.raw + ": expected an object.";
        return false;
    }
    auto regex_it = value.find(Vocabulary::REGEX);
    if (regex_it == value.end() || !regex_it->is_string()) {
        error = "Unsupported transform in source " + source.raw + ": " + value.dump() +
                ". Supported transforms: [\"regex\"].";
        return false;
    }
    try {
        source.transforms.push_back(makeRegexTransform(regex_it->get<std::string>()));
    } catch (const std::regex_error& e) {
        error = "Invalid regex \"" + regex_it->get<std::string>() + "\" in source " + source.raw + ": " + e.what();
        return false;
    }
    return true;
}

} // namespace

std::string Source::toString() const {
    if (!raw.empty()) {
        return raw;
    }
    return "#{" + node + (column ? "/" + *column : "") + "}";
}

Transform makeRegexTransform(const std::string& pattern) {
    Transform transform;
    transform.regex = pattern;
    transform.compiled = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    return transform;
}

std::optional<Source> parseSource(const nlohmann::json& value, std::string& error) {
    Source source;
    
    if (value.is_string()) {
        if (!parseReference(value.get<std::string>(), source)) {
            error = "Malformed source data: " + value.get<std::string>() + ".";
            return std::nullopt;
        }
        return source;
    }
    
    if (!value.is_object()) {
        error = "Malformed source data: " + value.dump() + ".";
        return std::nullopt;
    }
    
    auto data_it = value.find(Vocabulary::DATA);
    if (data_it == value.end() || !data_it->is_string()) {
        error = "Malformed source data: " + value.dump() + ". A source should define \"data\".";
        return std::nullopt;
    }
    if (!parseReference(data_it->get<std::string>(), source)) {
        error = "Malformed source data: " + data_it->get<std::string>() + ".";
        return std::nullopt;
    }
    
    auto transform_it = value.find(Vocabulary::APPLY_TRANSFORM);
    if (transform_it != value.end()) {
        if (transform_it->is_array()) {
            for (const auto& item : *transform_it) {
                if (!parseTransform(item, source, error)) {
                    return std::nullopt;
                }
            }
        } else if (!parseTransform(*transform_it, source, error)) {
            return std::nullopt;
        }
    }
    return source;
}

std::string applyTransform(const std::string& value, const Transform& transform) {
    if (!transform.compiled) {
        return value;
    }
    std::smatch match;
    if (!std::regex_search(value, match, *transform.compiled, std::regex_constants::match_continuous)) {
        return value;
    }
    for (size_t i = 1; i < match.size(); ++i) {
        if (match[i].matched && match[i].length() > 0) {
            return match[i].str();
        }
    }
    return value;
}

std::string applyTransforms(const std::string& value, const std::vector<Transform>& transforms) {
    std::string result = value;
    for (const auto& transform : transforms) {
        result = applyTransform(result, transform);
    }
    return result;
}

} // namespace MLC::Graph
