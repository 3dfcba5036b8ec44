// EN: YAML-backed settings store with ${VAR} expansion, environment overrides and rule checks.
// FR: Magasin de réglages adossé à YAML avec expansion ${VAR}, surcharges d'environnement et règles.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace MLC {

namespace {

const char* const MODULE = "config";

std::string joinList(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += separator;
        out += item;
    }
    return out;
}

bool looksLikeInteger(const std::string& text) {
    size_t start = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    return start < text.size() &&
           std::all_of(text.begin() + static_cast<long>(start), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

// EN: "http" + "read_timeout_ms" -> "MLC_HTTP_READ_TIMEOUT_MS".
// FR: "http" + "read_timeout_ms" -> "MLC_HTTP_READ_TIMEOUT_MS".
std::string environmentName(const std::string& prefix, const std::string& section, const std::string& key) {
    std::string name = prefix + section + "_" + key;
    for (auto& c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        c = std::isalnum(u) ? static_cast<char>(std::toupper(u)) : '_';
    }
    return name;
}

} // namespace

// ----------------------------------------------------------------------------
// ConfigValue
// ----------------------------------------------------------------------------

std::string ConfigValue::typeName() const {
    if (!storage_) {
        return "empty";
    }
    static const char* const names[] = {"bool", "int", "double", "string", "array"};
    return names[storage_->index()];
}

std::string ConfigValue::toString() const {
    if (!storage_) {
        return "<empty>";
    }
    if (auto b = tryAs<bool>()) return *b ? "true" : "false";
    if (auto i = tryAs<int>()) return std::to_string(*i);
    if (auto d = tryAs<double>()) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    if (auto s = tryAs<std::string>()) return *s;
    return "[" + joinList(std::get<std::vector<std::string>>(*storage_), ", ") + "]";
}

// ----------------------------------------------------------------------------
// Loading
// ----------------------------------------------------------------------------

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::map<std::string, Section> parsed;
    try {
        parsed = toSections(YAML::LoadFile(filename));
    } catch (const YAML::BadFile&) {
        LOG_ERROR(MODULE, "Cannot read configuration file " + filename);
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "Invalid configuration in " + filename + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(parsed);
    LOG_INFO(MODULE, "Loaded configuration from " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::map<std::string, Section> parsed;
    try {
        parsed = toSections(YAML::Load(yaml_content));
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, std::string("Invalid configuration: ") + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(parsed);
    return true;
}

std::map<std::string, ConfigManager::Section> ConfigManager::toSections(const YAML::Node& root) {
    std::map<std::string, Section> sections;
    if (root.IsNull()) {
        return sections;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("the document root must be a mapping of sections");
    }

    for (const auto& entry : root) {
        const auto name = entry.first.as<std::string>();
        if (!entry.second.IsMap()) {
            throw std::runtime_error("section '" + name + "' must be a mapping");
        }
        Section& section = sections[name];
        for (const auto& item : entry.second) {
            ConfigValue value = fromYaml(item.second);
            if (value.isValid()) {
                section[item.first.as<std::string>()] = value;
            }
        }
    }
    return sections;
}

ConfigValue ConfigManager::fromYaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return fromText(node.Scalar());
        case YAML::NodeType::Sequence: {
            std::vector<std::string> items;
            for (const auto& item : node) {
                items.push_back(expandVariables(item.as<std::string>()));
            }
            return ConfigValue(items);
        }
        case YAML::NodeType::Map:
            throw std::runtime_error("nested mappings are not supported below a section");
        default:
            return ConfigValue();
    }
}

// EN: Booleans, then integers, then decimals. Anything else is a string with ${VAR} expanded.
// FR: Booléens, puis entiers, puis décimaux. Le reste est une chaîne avec ${VAR} étendu.
ConfigValue ConfigManager::fromText(const std::string& text) {
    if (text == "true") return ConfigValue(true);
    if (text == "false") return ConfigValue(false);

    if (looksLikeInteger(text)) {
        try {
            return ConfigValue(std::stoi(text));
        } catch (const std::out_of_range&) {
        }
    }

    const bool numeric_chars = !text.empty() && text.find_first_of("0123456789") != std::string::npos &&
                               text.find_first_not_of("+-.0123456789eE") == std::string::npos;
    if (numeric_chars) {
        char* end = nullptr;
        double number = std::strtod(text.c_str(), &end);
        if (end == text.c_str() + text.size()) {
            return ConfigValue(number);
        }
    }

    return ConfigValue(expandVariables(text));
}

std::string ConfigManager::expandVariables(const std::string& text) {
    static const std::regex reference(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string expanded;
    size_t copied = 0;
    for (std::sregex_iterator it(text.begin(), text.end(), reference), end; it != end; ++it) {
        const auto& match = *it;
        const auto position = static_cast<size_t>(match.position());
        expanded.append(text, copied, position - copied);
        // EN: Unset variables stay as written.
        // FR: Les variables non définies restent telles quelles.
        const char* replacement = std::getenv(match[1].str().c_str());
        expanded += replacement ? replacement : match.str();
        copied = position + static_cast<size_t>(match.length());
    }
    expanded.append(text, copied, std::string::npos);
    return expanded;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    YAML::Emitter out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out << YAML::BeginMap;
        for (const auto& [name, section] : sections_) {
            out << YAML::Key << name << YAML::Value << YAML::BeginMap;
            for (const auto& [key, value] : section) {
                out << YAML::Key << key << YAML::Value;
                if (auto list = value.tryAs<std::vector<std::string>>()) {
                    out << YAML::Flow << *list;
                } else if (auto text = value.tryAs<std::string>()) {
                    out << YAML::DoubleQuoted << *text;
                } else {
                    out << value.toString();
                }
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }

    std::ofstream file(filename);
    if (!file || !(file << out.c_str() << '\n')) {
        LOG_ERROR(MODULE, "Cannot write configuration file " + filename);
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Overrides and validation
// ----------------------------------------------------------------------------

void ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, std::vector<std::string>> candidates;
    for (const auto& [name, section] : sections_) {
        for (const auto& entry : section) {
            candidates[name].push_back(entry.first);
        }
    }
    for (const auto& rule : rules_) {
        const auto dot = rule.key.find('.');
        if (dot != std::string::npos) {
            candidates[rule.key.substr(0, dot)].push_back(rule.key.substr(dot + 1));
        }
    }

    for (const auto& [name, keys] : candidates) {
        for (const auto& key : keys) {
            const char* raw = std::getenv(environmentName(prefix, name, key).c_str());
            if (raw == nullptr) {
                continue;
            }
            sections_[name][key] = fromText(raw);
            LOG_DEBUG(MODULE, "Environment override for " + name + "." + key);
        }
    }
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.insert(rules_.end(), rules.begin(), rules.end());
}

std::optional<std::string> ConfigManager::checkRule(const ValidationRule& rule, const ConfigValue& value) {
    // EN: An int satisfies a "double" rule.
    // FR: Un int satisfait une règle "double".
    const std::string actual = value.typeName();
    const bool type_ok = actual == rule.type || (rule.type == "double" && actual == "int");
    if (!type_ok) {
        return rule.key + " should be of type " + rule.type + " but is " + actual;
    }

    if (auto number = value.tryAs<int>() ? std::optional<double>(*value.tryAs<int>()) : value.tryAs<double>()) {
        if (rule.min_value && *number < *rule.min_value) {
            return rule.key + " is below its minimum (" + value.toString() + " < " +
                   ConfigValue(*rule.min_value).toString() + ")";
        }
        if (rule.max_value && *number > *rule.max_value) {
            return rule.key + " is above its maximum (" + value.toString() + " > " +
                   ConfigValue(*rule.max_value).toString() + ")";
        }
    }

    if (!rule.allowed_values.empty() &&
        std::find(rule.allowed_values.begin(), rule.allowed_values.end(), value.toString()) ==
            rule.allowed_values.end()) {
        return rule.key + " is '" + value.toString() + "', expected one of " + joinList(rule.allowed_values, "|");
    }
    return std::nullopt;
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : rules_) {
        const auto dot = rule.key.find('.');
        if (dot == std::string::npos) {
            errors.push_back("Validation rule key must be section.key: " + rule.key);
            continue;
        }
        const ConfigValue* value = find(rule.key.substr(0, dot), rule.key.substr(dot + 1));
        if (value == nullptr) {
            continue;
        }
        if (auto problem = checkRule(rule, *value)) {
            errors.push_back(*problem);
        }
    }
    return errors.empty();
}

// ----------------------------------------------------------------------------
// Access
// ----------------------------------------------------------------------------

const ConfigValue* ConfigManager::find(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it == sections_.end()) {
        return nullptr;
    }
    auto value_it = section_it->second.find(key);
    return value_it == section_it->second.end() ? nullptr : &value_it->second;
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ConfigValue* value = find(section, key);
    return value ? *value : ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section][key] = value;
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find(section, key) != nullptr;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    rules_.clear();
}

} // namespace MLC
