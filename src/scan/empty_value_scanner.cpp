// EN: Emptiness scanner implementation
// FR: Implémentation du scanner de vacuité

#include "scan/empty_value_scanner.hpp"
#include "scan/json_document.hpp"

namespace DQS::Scan {

std::vector<EmptyFinding> EmptyValueScanner::scan(const std::string& json_text) const {
    return scan(parseJsonDocument(json_text));
}

std::vector<EmptyFinding> EmptyValueScanner::scan(const nlohmann::ordered_json& document) const {
    std::vector<EmptyFinding> findings;

    forEachRecord(document, "empty_scanner", [&findings](size_t index, const nlohmann::ordered_json& record) {
        for (auto it = record.begin(); it != record.end(); ++it) {
            if (isEmptyValue(it.value())) {
                findings.emplace_back(index, it.key());
            }
        }
    });

    return findings;
}

bool EmptyValueScanner::isEmptyValue(const nlohmann::ordered_json& value) {
    if (value.is_null()) return true;
    return value.is_string() && value.get_ref<const std::string&>().empty();
}

} // namespace DQS::Scan
