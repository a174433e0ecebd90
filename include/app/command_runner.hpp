// EN: dqsctl command runner - option parsing, configuration layering and command dispatch
// FR: Exécuteur de commandes dqsctl - analyse des options, superposition de configuration et aiguillage des commandes

#pragma once

#include "infrastructure/cli/cli_parser.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace DQS::App {

// EN: Process exit codes
// FR: Codes de sortie du processus
enum class ExitCode : int {
    OK = 0,
    OPERATION_ERROR = 1,       // EN: IO/JSON/SQL/generic failure / FR: Échec E/S, JSON, SQL ou générique
    USAGE_ERROR = 2            // EN: Bad arguments or configuration / FR: Arguments ou configuration invalides
};

// EN: Effective settings after defaults, config file, environment and command line
// FR: Paramètres effectifs après défauts, fichier de configuration, environnement et ligne de commande
struct RunSettings {
    std::string command;
    std::string json_file;
    std::string sql_file;
    std::string format = "json";
    bool detailed = false;
    std::string log_level = "info";
    std::string log_file;
    size_t preview_bytes = 1024;
    std::vector<std::string> extensions{"json"};
};

class CommandRunner {
public:
    CommandRunner(std::ostream& out, std::ostream& err);

    // EN: Run dqsctl with its arguments (program name excluded). Returns an ExitCode.
    // FR: Exécute dqsctl avec ses arguments (nom du programme exclu). Retourne un ExitCode.
    int run(const std::vector<std::string>& arguments);

    // EN: Built-in defaults, applied to keys missing from the loaded configuration
    // FR: Défauts intégrés, appliqués aux clés absentes de la configuration chargée
    static void applyDefaults(ConfigManager& config);
    static std::vector<ConfigManager::ValidationRule> validationRules();

private:
    std::ostream& out_;
    std::ostream& err_;
    CLI::CliParser parser_;

    void registerOptions();
    bool loadConfiguration(const CLI::CliParseResult& parsed, RunSettings& settings);
    void configureLogging(const RunSettings& settings);
    int usageError(const std::string& message);

    int runEmpty(const RunSettings& settings);
    int runNumeric(const RunSettings& settings);
    int runColumns(const RunSettings& settings);
    std::string acquireJson(const RunSettings& settings);
};

} // namespace DQS::App
