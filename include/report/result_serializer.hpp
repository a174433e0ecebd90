// EN: Result serializer - JSON envelopes and human-readable reports for scan outcomes and errors
// FR: Sérialiseur de résultats - enveloppes JSON et rapports lisibles pour les résultats de scan et les erreurs

#pragma once

#include "infrastructure/system/command_error.hpp"
#include "scan/findings.hpp"
#include "schema/ddl_parser.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace DQS::Report {

class ResultSerializer {
public:
    // EN: {"data":[{"index":0,"key":"a"}],"duration_ms":3}
    // FR: {"data":[{"index":0,"key":"a"}],"duration_ms":3}
    static nlohmann::ordered_json toJson(const Scan::EmptyScanResult& result);

    // EN: {"data":[{"index":0,"key":"a","value":"five"}],"duration_ms":3}
    // FR: {"data":[{"index":0,"key":"a","value":"five"}],"duration_ms":3}
    static nlohmann::ordered_json toJson(const Scan::NumericScanResult& result);

    // EN: {"table":"t","columns":[{"name":"a","type":"INT","numeric":true}]}
    // FR: {"table":"t","columns":[{"name":"a","type":"INT","numeric":true}]}
    static nlohmann::ordered_json toJson(const Schema::TableSchema& schema);

    // EN: {"error":"<display string>","kind":"io|json|sql|generic"}
    // FR: {"error":"<chaîne d'affichage>","kind":"io|json|sql|generic"}
    static nlohmann::ordered_json errorToJson(const CommandError& error);

    // EN: Pretty-printed text of an envelope. Invalid UTF-8 taken from input files is written as U+FFFD.
    // FR: Texte indenté d'une enveloppe. L'UTF-8 invalide issu des fichiers d'entrée est écrit en U+FFFD.
    static std::string render(const nlohmann::ordered_json& envelope, int indent = 2);

    // EN: Text reports with counts grouped by key; detailed mode lists every finding.
    // FR: Rapports texte avec comptes groupés par clé ; le mode détaillé liste chaque constat.
    static std::string toTextReport(const Scan::EmptyScanResult& result, bool detailed = false);
    static std::string toTextReport(const Scan::NumericScanResult& result, bool detailed = false);
    static std::string toTextReport(const Schema::TableSchema& schema);
};

} // namespace DQS::Report
