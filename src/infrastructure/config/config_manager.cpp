// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing YAML, les surcharges et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

extern char** environ;

namespace DQS {

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    if (const T* v = std::get_if<T>(&*value_)) {
        return *v;
    }
    return std::nullopt;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

std::string ConfigValue::typeName() const {
    if (!value_) {
        return "empty";
    }
    switch (value_->index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "double";
        case 3: return "string";
        default: return "array";
    }
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        loadSections(YAML::LoadFile(filename));

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        loadSections(YAML::Load(yaml_content));

        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::loadSections(const YAML::Node& root) {
    if (!root.IsNull() && !root.IsMap()) {
        throw std::runtime_error("top-level YAML node must be a mapping");
    }

    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : root) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    sections_ = std::move(loaded);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(item.as<std::string>());
        }
        return ConfigValue(array_value);
    }

    if (!node.IsScalar()) {
        return ConfigValue();
    }

    std::string str_val = node.as<std::string>();

    // EN: Quoted scalars stay strings.
    // FR: Les scalaires entre guillemets restent des chaînes.
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(str_val));
    }

    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    int int_val = 0;
    if (str_val.find_first_of(".eE") == std::string::npos && YAML::convert<int>::decode(node, int_val)) {
        return ConfigValue(int_val);
    }

    double double_val = 0.0;
    if (YAML::convert<double>::decode(node, double_val)) {
        return ConfigValue(double_val);
    }

    return ConfigValue(expandVariables(str_val));
}

// EN: DQS_LOGGING_LEVEL=debug overrides logging.level; the section is the first segment after the prefix.
// FR: DQS_LOGGING_LEVEL=debug surcharge logging.level ; la section est le premier segment après le préfixe.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t applied = 0;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        size_t eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string name = entry.substr(prefix.size(), eq_pos - prefix.size());
        std::string raw_value = entry.substr(eq_pos + 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        size_t sep = name.find('_');
        if (sep == std::string::npos || sep == 0 || sep + 1 >= name.size()) {
            LOG_WARN("config", "Ignoring malformed environment override: " + entry.substr(0, eq_pos));
            continue;
        }

        std::string section = name.substr(0, sep);
        std::string key = name.substr(sep + 1);

        ConfigValue value;
        try {
            value = parseYamlValue(YAML::Load(raw_value));
        } catch (const YAML::Exception&) {
            LOG_DEBUG("config", "Environment override kept as raw string: " + section + "." + key);
        }
        sections_[section].set(key, value.isValid() ? value : ConfigValue(raw_value));
        ++applied;
        LOG_INFO("config", "Environment override applied: " + section + "." + key);
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
    LOG_DEBUG("config", "Added " + std::to_string(rules.size()) + " validation rules");
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value = lookup(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get("default", key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(section, key);
}

ConfigValue ConfigManager::lookup(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set("default", key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    return has("default", key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::vector<std::string> names = getSectionNames();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (const auto& section_name : names) {
        const auto& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // EN: Integers are accepted where a double is expected
    // FR: Les entiers sont acceptés là où un double est attendu
    std::string actual = value.typeName();
    bool type_ok = rule.type.empty() || actual == rule.type || (rule.type == "double" && actual == "int");
    if (!type_ok) {
        error = "Configuration " + key + " must be of type " + rule.type + ", found " + actual;
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    std::string result = value;
    std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;

    while (std::regex_search(result, match, var_regex)) {
        const char* env_value = std::getenv(match[1].str().c_str());
        if (!env_value) {
            // Leave variable as-is if not found
            break;
        }
        result.replace(match.position(), match.length(), env_value);
    }

    return result;
}

// Explicit template instantiations for non-specialized methods only
template std::optional<bool> ConfigValue::tryAs<bool>() const;
template std::optional<int> ConfigValue::tryAs<int>() const;
template std::optional<double> ConfigValue::tryAs<double>() const;
template std::optional<std::string> ConfigValue::tryAs<std::string>() const;
template std::optional<std::vector<std::string>> ConfigValue::tryAs<std::vector<std::string>>() const;

template bool ConfigValue::asOrDefault<bool>(const bool&) const;
template int ConfigValue::asOrDefault<int>(const int&) const;
template double ConfigValue::asOrDefault<double>(const double&) const;
template std::string ConfigValue::asOrDefault<std::string>(const std::string&) const;
template std::vector<std::string> ConfigValue::asOrDefault<std::vector<std::string>>(const std::vector<std::string>&) const;

} // namespace DQS
