// EN: Implementation of the Logger class. Provides thread-safe NDJSON logging with correlation IDs.
// FR: Implémentation de la classe Logger. Fournit un logging NDJSON thread-safe avec IDs de corrélation.

#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

namespace DQS {

// EN: Get the singleton logger instance.
// FR: Obtient l'instance singleton du logger.
Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// EN: Destructor ensures all logs are flushed.
// FR: Le destructeur assure que tous les logs sont vidés.
Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

// EN: Set output file and disable console output. Keeps the previous output on failure.
// FR: Définit le fichier de sortie et désactive la console. Conserve la sortie précédente en cas d'échec.
bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }
    if (log_file_) {
        log_file_->close();
    }
    log_file_ = std::move(file);
    console_output_ = false;
    return true;
}

void Logger::resetOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->close();
        log_file_.reset();
    }
    console_output_ = true;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

void Logger::clearGlobalMetadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_.clear();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    log(level, module, message, {});
}

// EN: Log message with specified level and metadata.
// FR: Enregistre un message avec le niveau spécifié et des métadonnées.
void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const std::unordered_map<std::string, std::string>& metadata) {
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) {
            return;
        }
        entry.correlation_id = correlation_id_;
        entry.metadata = metadata;

        // EN: Merge global metadata, preserving entry-specific metadata.
        // FR: Fusionne les métadonnées globales, préservant les métadonnées spécifiques à l'entrée.
        for (const auto& [key, value] : global_metadata_) {
            if (entry.metadata.find(key) == entry.metadata.end()) {
                entry.metadata[key] = value;
            }
        }
    }

    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.module = module;
    entry.thread_id = getThreadId();

    writeEntry(entry);
}

void Logger::debug(const std::string& module, const std::string& message) {
    log(LogLevel::DEBUG, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
    log(LogLevel::INFO, module, message);
}

void Logger::warn(const std::string& module, const std::string& message) {
    log(LogLevel::WARN, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
    log(LogLevel::ERROR, module, message);
}

void Logger::debug(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::DEBUG, module, message, metadata);
}

void Logger::info(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::INFO, module, message, metadata);
}

void Logger::warn(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::WARN, module, message, metadata);
}

void Logger::error(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::ERROR, module, message, metadata);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
    }
    if (console_output_) {
        std::clog.flush();
    }
}

// EN: Generate a UUID-like correlation ID for request tracing.
// FR: Génère un ID de corrélation similaire à UUID pour le traçage des requêtes.
std::string Logger::generateCorrelationId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << "-";
        }
        ss << dis(gen);
    }
    return ss.str();
}

void Logger::writeEntry(const LogEntry& entry) {
    std::string ndjson = formatAsNDJSON(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_ && log_file_->is_open()) {
        *log_file_ << ndjson << std::endl;
    }

    if (console_output_) {
        std::clog << ndjson << std::endl;
    }
}

// EN: Fixed fields first, then correlation ID and metadata.
// FR: Champs fixes d'abord, puis ID de corrélation et métadonnées.
std::string Logger::formatAsNDJSON(const LogEntry& entry) const {
    nlohmann::ordered_json line;
    line["timestamp"] = timestampToISO8601(entry.timestamp);
    line["level"] = levelToString(entry.level);
    line["message"] = entry.message;
    line["module"] = entry.module;
    line["thread_id"] = entry.thread_id;

    if (!entry.correlation_id.empty()) {
        line["correlation_id"] = entry.correlation_id;
    }

    for (const auto& [key, value] : entry.metadata) {
        if (!line.contains(key)) {
            line[key] = value;
        }
    }

    // EN: Replace invalid UTF-8 rather than throwing from a log call.
    // FR: Remplace l'UTF-8 invalide plutôt que de lever une exception depuis un log.
    return line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

std::optional<LogLevel> Logger::levelFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

std::string Logger::timestampToISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

std::string Logger::getThreadId() {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

} // namespace DQS
