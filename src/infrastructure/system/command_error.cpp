// EN: CommandError implementation: kind-specific display strings.
// FR: Implémentation de CommandError : chaînes d'affichage spécifiques au type.

#include "infrastructure/system/command_error.hpp"

namespace DQS {

CommandError::CommandError(Kind kind, const std::string& detail)
    : std::runtime_error(formatMessage(kind, detail)), kind_(kind), detail_(detail) {}

std::string CommandError::formatMessage(Kind kind, const std::string& detail) {
    switch (kind) {
        case Kind::JSON: return "JSON parsing error: " + detail;
        case Kind::SQL:  return "SQL parsing error: " + detail;
        case Kind::IO:
        case Kind::GENERIC:
        default:         return detail;
    }
}

std::string CommandError::kindToString(Kind kind) {
    switch (kind) {
        case Kind::IO:      return "io";
        case Kind::JSON:    return "json";
        case Kind::SQL:     return "sql";
        case Kind::GENERIC: return "generic";
        default:            return "unknown";
    }
}

} // namespace DQS
