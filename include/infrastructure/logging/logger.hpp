// EN: Thread-safe NDJSON logger for DQ-Scanner with correlation IDs and metadata.
// FR: Logger NDJSON thread-safe pour DQ-Scanner avec IDs de corrélation et métadonnées.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace DQS {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();

    // EN: Set the minimum log level.
    // FR: Définit le niveau de log minimum.
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    bool setOutputFile(const std::string& filename);

    // EN: Go back to console output, closing any log file.
    // FR: Revient à la sortie console, en fermant le fichier de log.
    void resetOutput();

    // EN: Set correlation ID for all subsequent log entries.
    // FR: Définit l'ID de corrélation pour toutes les entrées suivantes.
    void setCorrelationId(const std::string& correlation_id);

    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    // EN: Log a message with specified level.
    // FR: Enregistre un message avec le niveau spécifié.
    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    // EN: Log convenience methods for different levels.
    // FR: Méthodes de log pratiques pour différents niveaux.
    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    // EN: Log convenience methods with metadata.
    // FR: Méthodes de log pratiques avec métadonnées.
    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    // EN: Flush all pending log entries to output.
    // FR: Vide toutes les entrées en attente vers la sortie.
    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Level name conversions ("debug", "INFO", ...).
    // FR: Conversions de nom de niveau ("debug", "INFO", ...).
    static std::string levelToString(LogLevel level);
    static std::optional<LogLevel> levelFromString(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // EN: Write a log entry to the configured output.
    // FR: Écrit une entrée de log vers la sortie configurée.
    void writeEntry(const LogEntry& entry);

    // EN: Format log entry as NDJSON string.
    // FR: Formate l'entrée de log en chaîne NDJSON.
    std::string formatAsNDJSON(const LogEntry& entry) const;

    // EN: Convert timestamp to ISO8601 format.
    // FR: Convertit le timestamp au format ISO8601.
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);

    // EN: Get current thread ID as string.
    // FR: Obtient l'ID du thread courant en chaîne.
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) DQS::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) DQS::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) DQS::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) DQS::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) DQS::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) DQS::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) DQS::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) DQS::Logger::getInstance().error(module, message, metadata)

} // namespace DQS
