// EN: JSON document helpers shared by the scanners - parsing and record traversal
// FR: Helpers de document JSON partagés par les scanners - analyse et parcours des enregistrements

#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace DQS::Scan {

// EN: Parse JSON text keeping object field insertion order. Throws CommandError (Kind::JSON).
// FR: Analyse un texte JSON en conservant l'ordre d'insertion des champs. Lance CommandError (Kind::JSON).
nlohmann::ordered_json parseJsonDocument(const std::string& json_text);

// EN: Calls visit(index, record) for each object element of a top-level array.
//     A non-array document and non-object elements are skipped with a single warning.
//     Returns the number of records visited.
// FR: Appelle visit(index, record) pour chaque élément objet d'un tableau de premier niveau.
//     Un document non tableau et les éléments non objets sont ignorés avec un seul avertissement.
//     Retourne le nombre d'enregistrements visités.
size_t forEachRecord(const nlohmann::ordered_json& document, const std::string& module,
                     const std::function<void(size_t, const nlohmann::ordered_json&)>& visit);

} // namespace DQS::Scan
