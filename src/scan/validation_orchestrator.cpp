// EN: Validation orchestrator implementation
// FR: Implémentation de l'orchestrateur de validation

#include "scan/validation_orchestrator.hpp"
#include "scan/json_document.hpp"
#include "schema/column_extractor.hpp"
#include "infrastructure/logging/logger.hpp"

#include <chrono>
#include <set>

namespace DQS::Scan {

namespace {

int64_t elapsedMs(const std::chrono::high_resolution_clock::time_point& start_time) {
    auto end_time = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
}

std::string joinNames(const std::set<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

} // namespace

EmptyScanResult ValidationOrchestrator::findEmptyValues(const std::string& json_text) const {
    LOG_INFO("orchestrator", "Starting search for empty values.");
    auto start_time = std::chrono::high_resolution_clock::now();

    EmptyScanResult result;
    result.data = empty_scanner_.scan(json_text);
    result.duration_ms = elapsedMs(start_time);

    LOG_INFO("orchestrator", "Found " + std::to_string(result.data.size()) + " empty values in " +
             std::to_string(result.duration_ms) + "ms.");
    return result;
}

NumericScanResult ValidationOrchestrator::findInvalidNumericValues(const std::string& json_text,
                                                                   const std::string& sql_text) const {
    LOG_INFO("orchestrator", "Starting search for invalid numeric values.");
    auto start_time = std::chrono::high_resolution_clock::now();

    std::set<std::string> numeric_columns = Schema::extractNumericColumns(sql_text);
    LOG_INFO("orchestrator", "Identified numeric columns from SQL: [" + joinNames(numeric_columns) + "]");

    NumericScanResult result;
    result.data = numeric_scanner_.scan(parseJsonDocument(json_text), numeric_columns);
    result.duration_ms = elapsedMs(start_time);

    LOG_INFO("orchestrator", "Found " + std::to_string(result.data.size()) + " invalid numeric values in " +
             std::to_string(result.duration_ms) + "ms.");
    return result;
}

} // namespace DQS::Scan
