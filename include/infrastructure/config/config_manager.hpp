#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace YAML { class Node; }

namespace MLC {

// EN: One configuration entry. Holds a bool, an int, a double, a string or a list of strings.
// FR: Une entrée de configuration. Contient un bool, un int, un double, une chaîne ou une liste de chaînes.
class ConfigValue {
public:
    using Storage = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : storage_(Storage(value)) {}

    ConfigValue(const char* value) : storage_(Storage(std::string(value))) {}

    // EN: Typed access. Throws std::runtime_error when empty or holding another type.
    // FR: Accès typé. Lance std::runtime_error si vide ou d'un autre type.
    template<typename T>
    T as() const {
        if (!storage_) {
            throw std::runtime_error("Configuration value is not set");
        }
        if (!std::holds_alternative<T>(*storage_)) {
            throw std::runtime_error("Configuration value holds " + typeName() + ", not the requested type");
        }
        return std::get<T>(*storage_);
    }

    template<typename T>
    std::optional<T> tryAs() const {
        if (storage_ && std::holds_alternative<T>(*storage_)) {
            return std::get<T>(*storage_);
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& fallback) const {
        return tryAs<T>().value_or(fallback);
    }

    bool isValid() const { return storage_.has_value(); }

    // EN: Name of the held alternative ("bool", "int", "double", "string", "array" or "empty").
    // FR: Nom de l'alternative contenue ("bool", "int", "double", "string", "array" ou "empty").
    std::string typeName() const;

    std::string toString() const;

private:
    std::optional<Storage> storage_;
};

// EN: Process-wide settings for the loader and the CLI. Sections map to the top-level keys of a
//     YAML document (loader, http, logging).
// FR: Réglages globaux du chargeur et de la CLI. Les sections correspondent aux clés de premier
//     niveau d'un document YAML (loader, http, logging).
class ConfigManager {
public:
    struct ValidationRule {
        std::string key;  // "section.key"
        std::string type; // "bool", "int", "double", "string", "array"
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Replace the current settings with a YAML document. Returns false and keeps the
    //     previous settings if the document cannot be read or parsed.
    // FR: Remplace les réglages courants par un document YAML. Retourne false et conserve les
    //     réglages précédents si le document ne peut être lu ou parsé.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    bool saveToFile(const std::string& filename) const;

    // EN: MLC_HTTP_READ_TIMEOUT_MS overrides http.read_timeout_ms. Only keys already set or named
    //     by a validation rule are looked up.
    // FR: MLC_HTTP_READ_TIMEOUT_MS surcharge http.read_timeout_ms. Seules les clés déjà définies
    //     ou nommées par une règle de validation sont recherchées.
    void loadEnvironmentOverrides(const std::string& prefix = "MLC_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Check every set key that has a rule. Unset keys are not errors.
    // FR: Vérifie chaque clé définie ayant une règle. Les clés absentes ne sont pas des erreurs.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;

    void reset();

private:
    using Section = std::map<std::string, ConfigValue>;

    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    static std::map<std::string, Section> toSections(const YAML::Node& root);
    static ConfigValue fromYaml(const YAML::Node& node);
    static ConfigValue fromText(const std::string& text);
    static std::string expandVariables(const std::string& text);
    static std::optional<std::string> checkRule(const ValidationRule& rule, const ConfigValue& value);

    const ConfigValue* find(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    std::map<std::string, Section> sections_;
    std::vector<ValidationRule> rules_;
};

} // namespace MLC
