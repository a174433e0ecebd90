// EN: Validation orchestrator - sequences extraction and scans, timing and logging each operation
// FR: Orchestrateur de validation - enchaîne extraction et scans, chronomètre et journalise chaque opération

#pragma once

#include "scan/empty_value_scanner.hpp"
#include "scan/findings.hpp"
#include "scan/numeric_value_scanner.hpp"

#include <string>

namespace DQS::Scan {

// EN: Stateless entry points of the scanning core. Errors propagate as CommandError.
// FR: Points d'entrée sans état du cœur de scan. Les erreurs se propagent en CommandError.
class ValidationOrchestrator {
public:
    ValidationOrchestrator() = default;

    EmptyScanResult findEmptyValues(const std::string& json_text) const;

    // EN: The DDL is analysed before the JSON is parsed.
    // FR: Le DDL est analysé avant que le JSON soit lu.
    NumericScanResult findInvalidNumericValues(const std::string& json_text, const std::string& sql_text) const;

private:
    EmptyValueScanner empty_scanner_;
    NumericValueScanner numeric_scanner_;
};

} // namespace DQS::Scan
