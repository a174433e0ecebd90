// EN: Result serializer implementation
// FR: Implémentation du sérialiseur de résultats

#include "report/result_serializer.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace DQS::Report {

namespace {

// EN: Group findings by key, keys in order of first appearance
// FR: Groupe les constats par clé, clés dans l'ordre de première apparition
template<typename Finding>
std::vector<std::pair<std::string, std::vector<const Finding*>>> groupByKey(const std::vector<Finding>& findings) {
    std::vector<std::pair<std::string, std::vector<const Finding*>>> groups;
    for (const auto& finding : findings) {
        auto it = groups.begin();
        while (it != groups.end() && it->first != finding.key) ++it;
        if (it == groups.end()) {
            groups.emplace_back(finding.key, std::vector<const Finding*>{});
            it = groups.end() - 1;
        }
        it->second.push_back(&finding);
    }
    return groups;
}

void writeHeader(std::ostringstream& report, const std::string& title, size_t count, int64_t duration_ms) {
    report << "=== " << title << " ===\n";
    report << "Findings: " << count << "\n";
    report << "Scan Duration: " << duration_ms << "ms\n";
    report << "Overall Status: " << (count == 0 ? "CLEAN" : "ISSUES FOUND") << "\n";
}

} // namespace

nlohmann::ordered_json ResultSerializer::toJson(const Scan::EmptyScanResult& result) {
    nlohmann::ordered_json data = nlohmann::ordered_json::array();
    for (const auto& finding : result.data) {
        nlohmann::ordered_json item;
        item["index"] = finding.index;
        item["key"] = finding.key;
        data.push_back(std::move(item));
    }

    nlohmann::ordered_json envelope;
    envelope["data"] = std::move(data);
    envelope["duration_ms"] = result.duration_ms;
    return envelope;
}

nlohmann::ordered_json ResultSerializer::toJson(const Scan::NumericScanResult& result) {
    nlohmann::ordered_json data = nlohmann::ordered_json::array();
    for (const auto& finding : result.data) {
        nlohmann::ordered_json item;
        item["index"] = finding.index;
        item["key"] = finding.key;
        item["value"] = finding.value;
        data.push_back(std::move(item));
    }

    nlohmann::ordered_json envelope;
    envelope["data"] = std::move(data);
    envelope["duration_ms"] = result.duration_ms;
    return envelope;
}

nlohmann::ordered_json ResultSerializer::toJson(const Schema::TableSchema& schema) {
    nlohmann::ordered_json columns = nlohmann::ordered_json::array();
    for (const auto& column : schema.getColumns()) {
        nlohmann::ordered_json item;
        item["name"] = column.name;
        item["type"] = column.data_type;
        item["numeric"] = column.is_numeric;
        columns.push_back(std::move(item));
    }

    nlohmann::ordered_json envelope;
    envelope["table"] = schema.getName();
    envelope["columns"] = std::move(columns);
    return envelope;
}

nlohmann::ordered_json ResultSerializer::errorToJson(const CommandError& error) {
    nlohmann::ordered_json envelope;
    envelope["error"] = error.describe();
    envelope["kind"] = CommandError::kindToString(error.kind());
    return envelope;
}

std::string ResultSerializer::render(const nlohmann::ordered_json& envelope, int indent) {
    return envelope.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string ResultSerializer::toTextReport(const Scan::EmptyScanResult& result, bool detailed) {
    std::ostringstream report;
    writeHeader(report, "Empty Values Report", result.data.size(), result.duration_ms);

    if (!result.data.empty()) {
        report << "\n=== Findings Summary ===\n";
        for (const auto& group : groupByKey(result.data)) {
            report << "Field '" << group.first << "': " << group.second.size() << " empty value(s)\n";
            if (detailed) {
                for (const auto* finding : group.second) {
                    report << "  Record " << finding->index << "\n";
                }
            }
        }
    }

    return report.str();
}

std::string ResultSerializer::toTextReport(const Scan::NumericScanResult& result, bool detailed) {
    std::ostringstream report;
    writeHeader(report, "Numeric Values Report", result.data.size(), result.duration_ms);

    if (!result.data.empty()) {
        report << "\n=== Findings Summary ===\n";
        for (const auto& group : groupByKey(result.data)) {
            report << "Field '" << group.first << "': " << group.second.size() << " invalid value(s)\n";
            if (detailed) {
                for (const auto* finding : group.second) {
                    report << "  Record " << finding->index << " (value: '" << finding->value << "')\n";
                }
            }
        }
    }

    return report.str();
}

std::string ResultSerializer::toTextReport(const Schema::TableSchema& schema) {
    std::ostringstream report;
    report << "=== Table Schema ===\n";
    report << "Name: " << schema.getName() << "\n";
    report << "Columns: " << schema.getColumns().size() << "\n";
    report << "Numeric Columns: " << schema.numericColumnNames().size() << "\n";

    if (!schema.getColumns().empty()) {
        report << "\n=== Columns ===\n";
        for (const auto& column : schema.getColumns()) {
            report << column.name << ": " << (column.data_type.empty() ? "(untyped)" : column.data_type);
            if (column.is_numeric) {
                report << " [numeric]";
            }
            report << "\n";
        }
    }

    return report.str();
}

} // namespace DQS::Report
