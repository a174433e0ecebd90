// EN: JSON file source - selects a .json file through a FileSelector and reads its whole text
// FR: Source de fichier JSON - sélectionne un fichier .json via un FileSelector et lit tout son texte

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace DQS::IO {

// EN: Named extension filter offered to the selector, e.g. {"JSON", {"json"}}
// FR: Filtre d'extensions nommé proposé au sélecteur, ex: {"JSON", {"json"}}
struct FileFilter {
    std::string name;
    std::vector<std::string> extensions;    // EN: Without the leading dot / FR: Sans le point initial

    // EN: Case-insensitive extension match
    // FR: Correspondance d'extension insensible à la casse
    bool matches(const std::filesystem::path& path) const;
};

// EN: File selection seam (dialog, command line argument, test double).
// FR: Point d'extension de sélection de fichier (dialogue, argument de ligne de commande, double de test).
class FileSelector {
public:
    virtual ~FileSelector() = default;

    // EN: Chosen file, or nullopt when the selection was cancelled.
    // FR: Fichier choisi, ou nullopt si la sélection a été annulée.
    virtual std::optional<std::filesystem::path> pickFile(const FileFilter& filter) = 0;
};

// EN: Selector returning a path fixed at construction (e.g. from the command line).
// FR: Sélecteur retournant un chemin fixé à la construction (ex: depuis la ligne de commande).
class StaticFileSelector : public FileSelector {
public:
    StaticFileSelector() = default;
    explicit StaticFileSelector(std::filesystem::path path) : path_(std::move(path)) {}

    std::optional<std::filesystem::path> pickFile(const FileFilter& filter) override;

private:
    std::optional<std::filesystem::path> path_;
};

class JsonFileSource {
public:
    static constexpr size_t DEFAULT_PREVIEW_BYTES = 1024;

    explicit JsonFileSource(FileSelector& selector,
                            size_t preview_bytes = DEFAULT_PREVIEW_BYTES,
                            FileFilter filter = FileFilter{"JSON", {"json"}});

    // EN: Select and read a JSON file.
    //     Throws CommandError: GENERIC when cancelled, IO when the file is unreadable or filtered out.
    // FR: Sélectionne et lit un fichier JSON.
    //     Lance CommandError : GENERIC si annulé, IO si le fichier est illisible ou hors filtre.
    std::string acquire();

    const FileFilter& getFilter() const { return filter_; }

private:
    FileSelector& selector_;
    size_t preview_bytes_;
    FileFilter filter_;
};

// EN: Read a whole file as text. Throws CommandError (Kind::IO).
// FR: Lit un fichier entier comme texte. Lance CommandError (Kind::IO).
std::string readTextFile(const std::filesystem::path& path);

} // namespace DQS::IO
