// EN: Numeric conformance scanner - checks numeric DDL columns against JSON record values
// FR: Scanner de conformité numérique - vérifie les colonnes DDL numériques contre les valeurs JSON

#pragma once

#include "scan/findings.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <vector>

namespace DQS::Scan {

// EN: True when text is a 64-bit float literal: [+-] then inf, infinity, nan (any case)
//     or digits with an optional fraction and exponent. No whitespace, no hex.
// FR: Vrai si le texte est un littéral flottant 64 bits : [+-] puis inf, infinity, nan (toute casse)
//     ou des chiffres avec fraction et exposant optionnels. Pas d'espaces, pas d'hexadécimal.
bool isFloatLiteral(const std::string& text);

class NumericValueScanner {
public:
    NumericValueScanner() = default;

    // EN: Extract numeric columns from the DDL first (CommandError Kind::SQL), then parse and
    //     scan the JSON (CommandError Kind::JSON).
    // FR: Extrait d'abord les colonnes numériques du DDL (CommandError Kind::SQL), puis analyse
    //     et scanne le JSON (CommandError Kind::JSON).
    std::vector<NumericFinding> scan(const std::string& json_text, const std::string& sql_text) const;

    std::vector<NumericFinding> scan(const nlohmann::ordered_json& document,
                                     const std::set<std::string>& numeric_columns) const;

    // EN: True when a numeric column value conforms; otherwise offending receives its text.
    // FR: Vrai si une valeur de colonne numérique est conforme ; sinon offending reçoit son texte.
    static bool checkValue(const nlohmann::ordered_json& value, std::string& offending);
};

} // namespace DQS::Scan
