// EN: dqsctl command runner implementation
// FR: Implémentation de l'exécuteur de commandes dqsctl

#include "app/command_runner.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_error.hpp"
#include "io/json_file_source.hpp"
#include "report/result_serializer.hpp"
#include "scan/validation_orchestrator.hpp"
#include "schema/column_extractor.hpp"

#include <set>

namespace DQS::App {

namespace {

const std::set<std::string> kCommands = {"empty", "numeric", "columns", "config"};

const char* const kCommandsHelp =
    "Commands:\n"
    "  empty     --json FILE                 Scan for empty values\n"
    "  numeric   --json FILE --sql FILE      Scan for invalid numeric values\n"
    "  columns   --sql FILE                  Print the numeric columns of a DDL file\n"
    "  config                                Print the effective configuration\n"
    "\n"
    "Exit codes: 0 success, 1 operation error, 2 usage error";

CLI::CliOptionDefinition makeOption(const std::string& long_name, std::optional<char> short_name,
                                    CLI::CliOptionType type, const std::string& description,
                                    const std::string& config_path, const std::string& category) {
    CLI::CliOptionDefinition option;
    option.long_name = long_name;
    option.short_name = short_name;
    option.type = type;
    option.description = description;
    option.config_path = config_path;
    option.category = category;
    return option;
}

int toInt(ExitCode code) {
    return static_cast<int>(code);
}

} // namespace

CommandRunner::CommandRunner(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {
    registerOptions();
}

void CommandRunner::registerOptions() {
    parser_.setProgramName("dqsctl");
    parser_.setVersionInfo("1.0.0");
    parser_.setHelpFooter(kCommandsHelp);

    auto config = makeOption("config", 'c', CLI::CliOptionType::STRING,
                             "YAML configuration file", "_config_file", "General");

    auto json = makeOption("json", 'j', CLI::CliOptionType::STRING,
                           "JSON data file (array of records)", "_json_file", "Input");
    auto sql = makeOption("sql", 's', CLI::CliOptionType::STRING,
                          "SQL file whose first statement is a CREATE TABLE", "_sql_file", "Input");
    auto preview = makeOption("preview-bytes", std::nullopt, CLI::CliOptionType::INTEGER,
                              "Bytes of the JSON file echoed in debug logs", "input.preview_bytes", "Input");
    preview.constraint = CLI::CliOptionConstraint::NON_NEGATIVE;
    preview.default_value = "1024";

    auto format = makeOption("format", 'f', CLI::CliOptionType::STRING,
                             "Output format (json, text)", "output.format", "Output");
    format.constraint = CLI::CliOptionConstraint::ENUM_VALUES;
    format.enum_values = {"json", "text"};
    format.default_value = "json";
    auto detailed = makeOption("detailed", 'd', CLI::CliOptionType::BOOLEAN,
                               "List every finding in text reports", "output.detailed", "Output");

    auto log_level = makeOption("log-level", std::nullopt, CLI::CliOptionType::STRING,
                                "Logging level (debug, info, warn, error)", "logging.level", "Logging");
    log_level.constraint = CLI::CliOptionConstraint::ENUM_VALUES;
    log_level.enum_values = {"debug", "info", "warn", "error"};
    log_level.default_value = "info";
    auto log_file = makeOption("log-file", std::nullopt, CLI::CliOptionType::STRING,
                               "Write NDJSON logs to FILE instead of stderr", "logging.file", "Logging");

    parser_.addOptions({config, json, sql, preview, format, detailed, log_level, log_file});
}

int CommandRunner::run(const std::vector<std::string>& arguments) {
    CLI::CliParseResult parsed = parser_.parse(arguments);

    if (parsed.status == CLI::CliParseStatus::HELP_REQUESTED) {
        out_ << parsed.help_text;
        return toInt(ExitCode::OK);
    }
    if (parsed.status == CLI::CliParseStatus::VERSION_REQUESTED) {
        out_ << parsed.version_text;
        return toInt(ExitCode::OK);
    }
    if (!parsed.ok()) {
        for (const auto& error : parsed.errors) {
            err_ << "dqsctl: " << error << "\n";
        }
        return usageError("");
    }

    if (parsed.positional_arguments.size() != 1) {
        return usageError(parsed.positional_arguments.empty() ? "Missing command"
                                                              : "Expected a single command");
    }

    RunSettings settings;
    settings.command = parsed.positional_arguments.front();
    if (kCommands.count(settings.command) == 0) {
        return usageError("Unknown command: " + settings.command);
    }

    if (const auto* json = parsed.find("json")) settings.json_file = json->raw_value;
    if (const auto* sql = parsed.find("sql")) settings.sql_file = sql->raw_value;

    if (!loadConfiguration(parsed, settings)) {
        return toInt(ExitCode::USAGE_ERROR);
    }
    configureLogging(settings);

    if (settings.command == "config") {
        out_ << ConfigManager::getInstance().dump();
        return toInt(ExitCode::OK);
    }

    if (settings.command != "columns" && settings.json_file.empty()) {
        return usageError("Command '" + settings.command + "' requires --json FILE");
    }
    if (settings.command != "empty" && settings.sql_file.empty()) {
        return usageError("Command '" + settings.command + "' requires --sql FILE");
    }

    LOG_DEBUG("dqsctl", "Running command: " + settings.command);

    try {
        if (settings.command == "empty") return runEmpty(settings);
        if (settings.command == "numeric") return runNumeric(settings);
        return runColumns(settings);
    } catch (const CommandError& e) {
        LOG_ERROR("dqsctl", e.describe());
        err_ << "dqsctl: " << e.describe() << "\n";
        if (settings.format == "json") {
            out_ << Report::ResultSerializer::render(Report::ResultSerializer::errorToJson(e)) << "\n";
        }
        return toInt(ExitCode::OPERATION_ERROR);
    }
}

void CommandRunner::applyDefaults(ConfigManager& config) {
    auto set_default = [&config](const std::string& section, const std::string& key, const ConfigValue& value) {
        if (!config.has(section, key)) {
            config.set(section, key, value);
        }
    };

    set_default("logging", "level", ConfigValue(std::string("info")));
    set_default("logging", "file", ConfigValue(std::string()));
    set_default("output", "format", ConfigValue(std::string("json")));
    set_default("output", "detailed", ConfigValue(false));
    set_default("input", "preview_bytes", ConfigValue(1024));
    set_default("input", "extensions", ConfigValue(std::vector<std::string>{"json"}));
}

std::vector<ConfigManager::ValidationRule> CommandRunner::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"debug", "info", "warn", "error"};
    rules.push_back(level);

    ConfigManager::ValidationRule file;
    file.key = "logging.file";
    file.type = "string";
    rules.push_back(file);

    ConfigManager::ValidationRule format;
    format.key = "output.format";
    format.type = "string";
    format.allowed_values = {"json", "text"};
    rules.push_back(format);

    ConfigManager::ValidationRule detailed;
    detailed.key = "output.detailed";
    detailed.type = "bool";
    rules.push_back(detailed);

    ConfigManager::ValidationRule preview;
    preview.key = "input.preview_bytes";
    preview.type = "int";
    preview.min_value = 0;
    rules.push_back(preview);

    ConfigManager::ValidationRule extensions;
    extensions.key = "input.extensions";
    extensions.type = "array";
    rules.push_back(extensions);

    return rules;
}

// EN: Layering: config file, then built-in defaults for missing keys, then DQS_* environment, then flags.
// FR: Superposition : fichier de configuration, puis défauts intégrés, puis environnement DQS_*, puis options.
bool CommandRunner::loadConfiguration(const CLI::CliParseResult& parsed, RunSettings& settings) {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();

    if (const auto* config_file = parsed.find("config")) {
        if (!config.loadFromFile(config_file->raw_value)) {
            err_ << "dqsctl: Failed to load configuration file: " << config_file->raw_value << "\n";
            return false;
        }
    }

    applyDefaults(config);
    config.loadEnvironmentOverrides("DQS_");
    CLI::CliParser::applyOverrides(parsed, config);

    config.addValidationRules(validationRules());
    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            err_ << "dqsctl: " << error << "\n";
        }
        return false;
    }

    settings.log_level = config.get("logging", "level").asOrDefault<std::string>("info");
    settings.log_file = config.get("logging", "file").asOrDefault<std::string>("");
    settings.format = config.get("output", "format").asOrDefault<std::string>("json");
    settings.detailed = config.get("output", "detailed").asOrDefault<bool>(false);
    settings.preview_bytes = static_cast<size_t>(config.get("input", "preview_bytes").asOrDefault<int>(1024));
    settings.extensions = config.get("input", "extensions").asOrDefault<std::vector<std::string>>({"json"});
    return true;
}

void CommandRunner::configureLogging(const RunSettings& settings) {
    Logger& logger = Logger::getInstance();

    if (auto level = Logger::levelFromString(settings.log_level)) {
        logger.setLogLevel(*level);
    }

    if (settings.log_file.empty()) {
        logger.resetOutput();
    } else if (!logger.setOutputFile(settings.log_file)) {
        err_ << "dqsctl: Cannot open log file " << settings.log_file << ", logging to stderr\n";
    }
}

int CommandRunner::usageError(const std::string& message) {
    if (!message.empty()) {
        err_ << "dqsctl: " << message << "\n";
    }
    err_ << "Try 'dqsctl --help' for more information.\n";
    return toInt(ExitCode::USAGE_ERROR);
}

std::string CommandRunner::acquireJson(const RunSettings& settings) {
    IO::StaticFileSelector selector(settings.json_file);
    IO::JsonFileSource source(selector, settings.preview_bytes, IO::FileFilter{"JSON", settings.extensions});
    return source.acquire();
}

int CommandRunner::runEmpty(const RunSettings& settings) {
    Scan::ValidationOrchestrator orchestrator;
    Scan::EmptyScanResult result = orchestrator.findEmptyValues(acquireJson(settings));

    if (settings.format == "text") {
        out_ << Report::ResultSerializer::toTextReport(result, settings.detailed);
    } else {
        out_ << Report::ResultSerializer::render(Report::ResultSerializer::toJson(result)) << "\n";
    }
    return toInt(ExitCode::OK);
}

int CommandRunner::runNumeric(const RunSettings& settings) {
    // EN: The DDL file is read first so that SQL problems surface before JSON ones
    // FR: Le fichier DDL est lu en premier pour que les problèmes SQL précèdent ceux du JSON
    std::string sql_text = IO::readTextFile(settings.sql_file);
    std::string json_text = acquireJson(settings);

    Scan::ValidationOrchestrator orchestrator;
    Scan::NumericScanResult result = orchestrator.findInvalidNumericValues(json_text, sql_text);

    if (settings.format == "text") {
        out_ << Report::ResultSerializer::toTextReport(result, settings.detailed);
    } else {
        out_ << Report::ResultSerializer::render(Report::ResultSerializer::toJson(result)) << "\n";
    }
    return toInt(ExitCode::OK);
}

int CommandRunner::runColumns(const RunSettings& settings) {
    Schema::TableSchema schema = Schema::extractTableSchema(IO::readTextFile(settings.sql_file));

    if (settings.format == "text") {
        out_ << Report::ResultSerializer::toTextReport(schema);
    } else {
        out_ << Report::ResultSerializer::render(Report::ResultSerializer::toJson(schema)) << "\n";
    }
    return toInt(ExitCode::OK);
}

} // namespace DQS::App
