// EN: Emptiness scanner - flags null and empty-string field values in an array of JSON records
// FR: Scanner de vacuité - signale les valeurs null et chaînes vides dans un tableau d'enregistrements JSON

#pragma once

#include "scan/findings.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace DQS::Scan {

class EmptyValueScanner {
public:
    EmptyValueScanner() = default;

    // EN: Parse and scan JSON text. Throws CommandError (Kind::JSON) on malformed input.
    // FR: Analyse et scanne un texte JSON. Lance CommandError (Kind::JSON) sur entrée malformée.
    std::vector<EmptyFinding> scan(const std::string& json_text) const;

    // EN: Disambiguates string literals towards the JSON text overload.
    // FR: Oriente les littéraux chaîne vers la surcharge texte JSON.
    std::vector<EmptyFinding> scan(const char* json_text) const { return scan(std::string(json_text)); }

    // EN: Scan an already parsed document, in record order then field insertion order.
    // FR: Scanne un document déjà analysé, dans l'ordre des enregistrements puis des champs.
    std::vector<EmptyFinding> scan(const nlohmann::ordered_json& document) const;

    // EN: null and "" are empty; whitespace-only strings are not.
    // FR: null et "" sont vides ; les chaînes composées d'espaces ne le sont pas.
    static bool isEmptyValue(const nlohmann::ordered_json& value);
};

} // namespace DQS::Scan
