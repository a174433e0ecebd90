// EN: YAML-backed configuration manager for DQ-Scanner with environment overrides and validation rules.
// FR: Gestionnaire de configuration YAML pour DQ-Scanner avec surcharges d'environnement et règles de validation.

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace DQS {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) throw std::runtime_error("ConfigValue is empty");
        std::optional<T> typed = tryAs<T>();
        if (!typed) throw std::runtime_error("ConfigValue holds a " + typeName() + " value");
        return *typed;
    }

    // EN: Get value as specific type or return default if type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const;

    // EN: Check if value is valid (not empty).
    // FR: Vérifie si la valeur est valide (non vide).
    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

    // EN: "bool", "int", "double", "string", "array" or "empty"
    // FR: "bool", "int", "double", "string", "array" ou "empty"
    std::string typeName() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    std::vector<std::string> keys() const;

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML et validation.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values.
    // FR: Structure de règle de validation pour les valeurs de configuration.
    struct ValidationRule {
        std::string key;  // "section.key"
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file (replaces current sections).
    // FR: Charge la configuration depuis un fichier YAML (remplace les sections actuelles).
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string (replaces current sections).
    // FR: Charge la configuration depuis une chaîne YAML (remplace les sections actuelles).
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply PREFIX_SECTION_KEY=value environment variables as overrides.
    // FR: Applique les variables d'environnement PREFIX_SECTION_KEY=valeur comme surcharges.
    size_t loadEnvironmentOverrides(const std::string& prefix = "DQS_");

    // EN: Validation rules.
    // FR: Règles de validation.
    void addValidationRules(const std::vector<ValidationRule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    // EN: Value access, "default" section when no section is given.
    // FR: Accès aux valeurs, section "default" si aucune section n'est donnée.
    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;

    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données et règles de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Replace sections from a parsed YAML document. Caller holds the lock.
    // FR: Remplace les sections depuis un document YAML analysé. L'appelant détient le verrou.
    void loadSections(const YAML::Node& root);

    ConfigValue lookup(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET(key) DQS::ConfigManager::getInstance().get(key)
#define CONFIG_GET_SECTION(section, key) DQS::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(key, value) DQS::ConfigManager::getInstance().set(key, DQS::ConfigValue(value))
#define CONFIG_SET_SECTION(section, key, value) DQS::ConfigManager::getInstance().set(section, key, DQS::ConfigValue(value))

} // namespace DQS
