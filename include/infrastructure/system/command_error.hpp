// EN: Boundary error taxonomy for DQ-Scanner operations (I/O, JSON, SQL, generic).
// FR: Taxonomie des erreurs de frontière pour les opérations DQ-Scanner (E/S, JSON, SQL, générique).

#pragma once

#include <stdexcept>
#include <string>

namespace DQS {

// EN: Typed failure raised by scan and acquisition operations. Each kind keeps a single display string.
// FR: Échec typé levé par les opérations de scan et d'acquisition. Chaque type garde une chaîne d'affichage unique.
class CommandError : public std::runtime_error {
public:
    enum class Kind {
        IO,         // EN: Content acquisition failure / FR: Échec d'acquisition du contenu
        JSON,       // EN: Malformed JSON text / FR: Texte JSON malformé
        SQL,        // EN: Malformed DDL or missing CREATE TABLE / FR: DDL malformé ou CREATE TABLE manquant
        GENERIC     // EN: Catch-all (e.g. cancelled selection) / FR: Fourre-tout (ex: sélection annulée)
    };

    CommandError(Kind kind, const std::string& detail);

    static CommandError io(const std::string& detail) { return CommandError(Kind::IO, detail); }
    static CommandError json(const std::string& detail) { return CommandError(Kind::JSON, detail); }
    static CommandError sql(const std::string& detail) { return CommandError(Kind::SQL, detail); }
    static CommandError generic(const std::string& detail) { return CommandError(Kind::GENERIC, detail); }

    Kind kind() const noexcept { return kind_; }

    // EN: Raw detail without the kind prefix.
    // FR: Détail brut sans le préfixe de type.
    const std::string& detail() const noexcept { return detail_; }

    // EN: Human-readable string used at the boundary (same as what()).
    // FR: Chaîne lisible utilisée à la frontière (identique à what()).
    std::string describe() const { return what(); }

    static std::string kindToString(Kind kind);

private:
    static std::string formatMessage(Kind kind, const std::string& detail);

    Kind kind_;
    std::string detail_;
};

} // namespace DQS
