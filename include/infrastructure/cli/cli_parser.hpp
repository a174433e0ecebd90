// EN: Command line parser for DQ-Scanner - typed options, positional commands and configuration overrides
// FR: Analyseur de ligne de commande pour DQ-Scanner - options typées, commandes positionnelles et surcharges de configuration

#pragma once

#include "infrastructure/config/config_manager.hpp"

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace DQS::CLI {

// EN: CLI option value types
// FR: Types de valeur d'option CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Boolean flag / FR: Drapeau booléen
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING          // EN: String value / FR: Valeur chaîne
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    NON_NEGATIVE,   // EN: Must be non-negative (>=0) / FR: Doit être non-négatif (>=0)
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Unknown option provided / FR: Option inconnue fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_VALUE           // EN: Invalid value or constraint violation / FR: Valeur invalide ou violation de contrainte
};

// EN: CLI option definition. A config_path starting with '_' is a CLI-only value, never applied to configuration.
// FR: Définition d'option CLI. Un config_path commençant par '_' est une valeur CLI uniquement, jamais appliquée à la configuration.
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name (--json) / FR: Nom d'option long (--json)
    std::optional<char> short_name;                 // EN: Short option name (-j) / FR: Nom d'option court (-j)
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string config_path;                        // EN: e.g. "logging.level" / FR: ex: "logging.level"
    std::optional<std::string> default_value;       // EN: Shown in help only / FR: Affiché dans l'aide uniquement
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;
    std::string category = "General";
    bool hidden = false;
};

// EN: Parsed CLI option value
// FR: Valeur d'option CLI analysée
struct CliOptionValue {
    std::string option_name;                        // EN: Long name of the matched option / FR: Nom long de l'option reconnue
    std::string raw_value;
    ConfigValue config_value;
    std::string config_path;
};

// EN: CLI parsing result containing parsed options, positional arguments and status
// FR: Résultat d'analyse CLI contenant les options analysées, les arguments positionnels et le statut
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<CliOptionValue> parsed_options;
    std::vector<std::string> positional_arguments;
    std::vector<std::string> errors;
    std::unordered_map<std::string, ConfigValue> overrides;    // EN: config_path -> value, last occurrence wins / FR: config_path -> valeur, la dernière occurrence l'emporte

    std::string help_text;
    std::string version_text;

    bool ok() const { return status == CliParseStatus::SUCCESS; }

    // EN: Last value given for an option (by long name)
    // FR: Dernière valeur donnée pour une option (par nom long)
    const CliOptionValue* find(const std::string& long_name) const;
};

class CliParser {
public:
    CliParser();

    CliParser(const CliParser&) = delete;
    CliParser& operator=(const CliParser&) = delete;

    // EN: Option definition management (throws std::invalid_argument on duplicates)
    // FR: Gestion des définitions d'options (lance std::invalid_argument sur doublons)
    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);
    bool hasOption(const std::string& long_name) const;

    // EN: --help / -h and --version / -V are always recognised
    // FR: --help / -h et --version / -V sont toujours reconnus
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    void setProgramName(const std::string& program_name) { program_name_ = program_name; }
    void setHelpHeader(const std::string& header) { help_header_ = header; }
    void setHelpFooter(const std::string& footer) { help_footer_ = footer; }
    void setVersionInfo(const std::string& version, const std::string& build_info = "");

    // EN: Apply "section.key" overrides to the configuration; CLI-only paths are skipped.
    //     Returns the number of values applied.
    // FR: Applique les surcharges "section.clé" à la configuration ; les chemins CLI uniquement sont ignorés.
    //     Retourne le nombre de valeurs appliquées.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

private:
    std::string program_name_;
    std::string help_header_;
    std::string help_footer_;
    std::string version_;
    std::string build_info_;

    std::vector<CliOptionDefinition> option_definitions_;
    std::unordered_map<std::string, size_t> options_by_long_name_;
    std::unordered_map<char, size_t> options_by_short_name_;

    const CliOptionDefinition* findDefinition(const std::string& arg) const;
};

// EN: Utility functions for CLI operations
// FR: Fonctions utilitaires pour les opérations CLI
namespace CliUtils {

    std::string cliOptionTypeToString(CliOptionType type);
    std::string cliParseStatusToString(CliParseStatus status);

    // EN: "logging.level" -> {"logging", "level"}; nullopt if not exactly two non-empty parts
    // FR: "logging.level" -> {"logging", "level"} ; nullopt si pas exactement deux parties non vides
    std::optional<std::pair<std::string, std::string>> splitConfigPath(const std::string& path);

    ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type);
    bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                          std::string& error_message);

    std::string formatOptionHelp(const CliOptionDefinition& option);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);
    std::string extractOptionName(const std::string& arg);

} // namespace CliUtils

} // namespace DQS::CLI
