// EN: Command line parser implementation
// FR: Implémentation de l'analyseur de ligne de commande

#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace DQS::CLI {

const CliOptionValue* CliParseResult::find(const std::string& long_name) const {
    for (auto it = parsed_options.rbegin(); it != parsed_options.rend(); ++it) {
        if (it->option_name == long_name) {
            return &*it;
        }
    }
    return nullptr;
}

CliParser::CliParser()
    : program_name_("dqsctl")
    , help_header_("DQ-Scanner - JSON data quality checks against SQL DDL")
    , version_("1.0.0")
    , build_info_("") {
}

void CliParser::addOption(const CliOptionDefinition& option_def) {
    // EN: Validate option definition before adding
    // FR: Valider la définition d'option avant d'ajouter
    if (option_def.long_name.empty()) {
        throw std::invalid_argument("Option long name cannot be empty");
    }
    if (option_def.long_name == "help" || option_def.long_name == "version" ||
        options_by_long_name_.count(option_def.long_name) > 0) {
        throw std::invalid_argument("Option with long name '" + option_def.long_name + "' already exists");
    }
    if (option_def.short_name) {
        char short_name = *option_def.short_name;
        if (short_name == 'h' || short_name == 'V' || options_by_short_name_.count(short_name) > 0) {
            throw std::invalid_argument("Option with short name '-" + std::string(1, short_name) + "' already exists");
        }
    }

    option_definitions_.push_back(option_def);
    options_by_long_name_[option_def.long_name] = option_definitions_.size() - 1;
    if (option_def.short_name) {
        options_by_short_name_[*option_def.short_name] = option_definitions_.size() - 1;
    }
}

void CliParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        addOption(option_def);
    }
}

bool CliParser::hasOption(const std::string& long_name) const {
    return options_by_long_name_.count(long_name) > 0;
}

void CliParser::setVersionInfo(const std::string& version, const std::string& build_info) {
    version_ = version;
    build_info_ = build_info;
}

CliParseResult CliParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) { // EN: Skip program name / FR: Ignorer le nom du programme
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CliParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;

    auto fail = [&result](CliParseStatus status, const std::string& message) {
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
        result.errors.push_back(message);
    };

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];
        if (arg.empty()) continue;

        // EN: Check for help or version flags first
        // FR: Vérifier d'abord les drapeaux d'aide ou de version
        if (arg == "--help" || arg == "-h") {
            result.status = CliParseStatus::HELP_REQUESTED;
            result.errors.clear();
            result.help_text = generateHelpText();
            return result;
        }
        if (arg == "--version" || arg == "-V") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            result.errors.clear();
            result.version_text = generateVersionText();
            return result;
        }

        if (!CliUtils::isLongOption(arg) && !CliUtils::isShortOption(arg)) {
            result.positional_arguments.push_back(arg);
            continue;
        }

        const CliOptionDefinition* option_def = findDefinition(arg);
        if (!option_def) {
            fail(CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
            continue;
        }

        CliOptionValue option_value;
        option_value.option_name = option_def->long_name;
        option_value.config_path = option_def->config_path;

        // EN: Boolean options are flags and consume no value
        // FR: Les options booléennes sont des drapeaux et ne consomment pas de valeur
        if (option_def->type == CliOptionType::BOOLEAN) {
            option_value.raw_value = "true";
            option_value.config_value = ConfigValue(true);
        } else {
            if (i + 1 >= arguments.size()) {
                fail(CliParseStatus::MISSING_VALUE, "Option " + arg + " requires a value");
                continue;
            }

            const std::string& value = arguments[++i];
            std::string validation_error;
            if (!CliUtils::validateCliValue(value, *option_def, validation_error)) {
                fail(CliParseStatus::INVALID_VALUE, "Invalid value for option " + arg + ": " + validation_error);
                continue;
            }

            option_value.raw_value = value;
            option_value.config_value = CliUtils::parseCliValue(value, option_def->type);
        }

        result.overrides[option_value.config_path] = option_value.config_value;
        result.parsed_options.push_back(std::move(option_value));
    }

    return result;
}

const CliOptionDefinition* CliParser::findDefinition(const std::string& arg) const {
    std::string option_name = CliUtils::extractOptionName(arg);

    if (CliUtils::isLongOption(arg)) {
        auto it = options_by_long_name_.find(option_name);
        if (it != options_by_long_name_.end()) {
            return &option_definitions_[it->second];
        }
    } else if (CliUtils::isShortOption(arg) && arg.size() == 2) {
        auto it = options_by_short_name_.find(option_name[0]);
        if (it != options_by_short_name_.end()) {
            return &option_definitions_[it->second];
        }
    }
    return nullptr;
}

std::string CliParser::generateHelpText() const {
    std::ostringstream help;

    help << help_header_ << "\n\n";
    help << "Usage: " << program_name_ << " [OPTIONS] COMMAND\n\n";

    // EN: Group options by category
    // FR: Grouper les options par catégorie
    std::map<std::string, std::vector<const CliOptionDefinition*>> options_by_category;
    for (const auto& opt : option_definitions_) {
        if (!opt.hidden) {
            options_by_category[opt.category].push_back(&opt);
        }
    }

    for (const auto& category : options_by_category) {
        help << category.first << " Options:\n";
        for (const auto* opt : category.second) {
            help << CliUtils::formatOptionHelp(*opt) << "\n";
        }
        help << "\n";
    }

    help << "  -h, --help                  Show this help message\n";
    help << "  -V, --version               Show version information\n";

    if (!help_footer_.empty()) {
        help << "\n" << help_footer_ << "\n";
    }
    return help.str();
}

std::string CliParser::generateVersionText() const {
    std::ostringstream version;
    version << program_name_ << " " << version_;
    if (!build_info_.empty()) {
        version << " (" << build_info_ << ")";
    }
    version << "\n";
    return version.str();
}

size_t CliParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;

    for (const auto& option : result.parsed_options) {
        if (option.config_path.empty() || option.config_path[0] == '_') continue;

        auto path = CliUtils::splitConfigPath(option.config_path);
        if (!path) {
            LOG_WARN("cli", "Ignoring option --" + option.option_name +
                     " with invalid config path: " + option.config_path);
            continue;
        }

        config.set(path->first, path->second, option.config_value);
        applied++;
    }

    if (applied > 0) {
        LOG_DEBUG("cli", "Applied " + std::to_string(applied) + " command line override(s)");
    }
    return applied;
}

// EN: Utility functions implementation
// FR: Implémentation des fonctions utilitaires
namespace CliUtils {

std::string cliOptionTypeToString(CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: return "BOOLEAN";
        case CliOptionType::INTEGER: return "INTEGER";
        case CliOptionType::STRING: return "STRING";
        default: return "UNKNOWN";
    }
}

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        default: return "UNKNOWN";
    }
}

std::optional<std::pair<std::string, std::string>> splitConfigPath(const std::string& path) {
    size_t dot = path.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == path.size() ||
        path.find('.', dot + 1) != std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(path.substr(0, dot), path.substr(dot + 1));
}

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: {
            std::string lower = raw_value;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ConfigValue(lower == "true" || lower == "1" || lower == "yes" || lower == "on");
        }
        case CliOptionType::INTEGER:
            return ConfigValue(std::stoi(raw_value));
        case CliOptionType::STRING:
            return ConfigValue(raw_value);
        default:
            throw std::invalid_argument("Unknown CliOptionType");
    }
}

bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                      std::string& error_message) {
    switch (definition.type) {
        case CliOptionType::BOOLEAN:
            return true;

        case CliOptionType::INTEGER: {
            int value = 0;
            try {
                size_t consumed = 0;
                value = std::stoi(raw_value, &consumed);
                if (consumed != raw_value.size()) {
                    error_message = "Expected an integer";
                    return false;
                }
            } catch (const std::exception&) {
                error_message = "Expected an integer";
                return false;
            }
            if (definition.constraint == CliOptionConstraint::POSITIVE && value <= 0) {
                error_message = "Value must be positive";
                return false;
            }
            if (definition.constraint == CliOptionConstraint::NON_NEGATIVE && value < 0) {
                error_message = "Value must be non-negative";
                return false;
            }
            return true;
        }

        case CliOptionType::STRING: {
            if (definition.constraint == CliOptionConstraint::ENUM_VALUES &&
                definition.enum_values.count(raw_value) == 0) {
                error_message = "Value must be one of: ";
                bool first = true;
                for (const auto& valid_value : definition.enum_values) {
                    if (!first) error_message += ", ";
                    error_message += valid_value;
                    first = false;
                }
                return false;
            }
            return true;
        }
    }
    return true;
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    std::ostringstream help;

    // EN: Format option name(s)
    // FR: Formater le(s) nom(s) d'option
    std::string option_names = "  ";
    if (option.short_name) {
        option_names += "-" + std::string(1, *option.short_name) + ", ";
    } else {
        option_names += "    ";
    }
    option_names += "--" + option.long_name;

    if (option.type != CliOptionType::BOOLEAN) {
        option_names += " <" + cliOptionTypeToString(option.type) + ">";
    }

    size_t name_width = 30;
    if (option_names.length() > name_width - 2) {
        help << option_names << "\n" << std::string(name_width, ' ') << option.description;
    } else {
        help << std::left << std::setw(static_cast<int>(name_width)) << option_names << option.description;
    }

    if (option.default_value && !option.default_value->empty()) {
        help << " (default: " << *option.default_value << ")";
    }
    return help.str();
}

bool isShortOption(const std::string& arg) {
    return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' &&
           std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool isLongOption(const std::string& arg) {
    return arg.length() >= 3 && arg.compare(0, 2, "--") == 0 &&
           std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        return arg.substr(2);
    }
    if (isShortOption(arg)) {
        return arg.substr(1, 1);
    }
    return "";
}

} // namespace CliUtils

} // namespace DQS::CLI
