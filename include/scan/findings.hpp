// EN: Scan findings and timed operation results for DQ-Scanner
// FR: Constats de scan et résultats d'opération chronométrés pour DQ-Scanner

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace DQS::Scan {

// EN: Field whose value is null or the empty string
// FR: Champ dont la valeur est null ou la chaîne vide
struct EmptyFinding {
    size_t index{0};        // EN: Zero-based record position / FR: Position de l'enregistrement (base 0)
    std::string key;

    EmptyFinding() = default;
    EmptyFinding(size_t record_index, const std::string& field_key)
        : index(record_index), key(field_key) {}

    bool operator==(const EmptyFinding& other) const {
        return index == other.index && key == other.key;
    }
};

// EN: Numeric column value that is neither a JSON number nor a float literal string
// FR: Valeur de colonne numérique qui n'est ni un nombre JSON ni une chaîne littérale flottante
struct NumericFinding {
    size_t index{0};
    std::string key;
    std::string value;      // EN: Original string, or compact JSON text for other types / FR: Chaîne originale, ou texte JSON compact pour les autres types

    NumericFinding() = default;
    NumericFinding(size_t record_index, const std::string& field_key, const std::string& offending_value)
        : index(record_index), key(field_key), value(offending_value) {}

    bool operator==(const NumericFinding& other) const {
        return index == other.index && key == other.key && value == other.value;
    }
};

// EN: Operation payload with its wall-clock duration in milliseconds
// FR: Charge utile d'une opération avec sa durée réelle en millisecondes
template<typename T>
struct OperationResult {
    T data;
    int64_t duration_ms{0};
};

using EmptyScanResult = OperationResult<std::vector<EmptyFinding>>;
using NumericScanResult = OperationResult<std::vector<NumericFinding>>;

} // namespace DQS::Scan
