// EN: JSON document helpers implementation
// FR: Implémentation des helpers de document JSON

#include "scan/json_document.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_error.hpp"

#include <unordered_map>

namespace DQS::Scan {

nlohmann::ordered_json parseJsonDocument(const std::string& json_text) {
    try {
        return nlohmann::ordered_json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw CommandError::json(e.what());
    }
}

size_t forEachRecord(const nlohmann::ordered_json& document, const std::string& module,
                     const std::function<void(size_t, const nlohmann::ordered_json&)>& visit) {
    if (!document.is_array()) {
        std::unordered_map<std::string, std::string> metadata = {{"type", document.type_name()}};
        LOG_WARN_META(module, "JSON top level is not an array, nothing to scan", metadata);
        return 0;
    }

    size_t visited = 0;
    size_t skipped = 0;

    for (size_t index = 0; index < document.size(); ++index) {
        const auto& record = document[index];
        if (!record.is_object()) {
            skipped++;
            continue;
        }
        visit(index, record);
        visited++;
    }

    if (skipped > 0) {
        std::unordered_map<std::string, std::string> metadata = {
            {"skipped", std::to_string(skipped)},
            {"total", std::to_string(document.size())}
        };
        LOG_WARN_META(module, "Skipped non-object array elements", metadata);
    }
    return visited;
}

} // namespace DQS::Scan
