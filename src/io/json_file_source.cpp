// EN: JSON file source implementation
// FR: Implémentation de la source de fichier JSON

#include "io/json_file_source.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace DQS::IO {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

bool FileFilter::matches(const std::filesystem::path& path) const {
    std::string extension = path.extension().string();
    if (extension.empty()) return false;
    extension = toLower(extension.substr(1));

    return std::any_of(extensions.begin(), extensions.end(), [&extension](const std::string& allowed) {
        return toLower(allowed) == extension;
    });
}

std::optional<std::filesystem::path> StaticFileSelector::pickFile(const FileFilter& /*filter*/) {
    return path_;
}

JsonFileSource::JsonFileSource(FileSelector& selector, size_t preview_bytes, FileFilter filter)
    : selector_(selector), preview_bytes_(preview_bytes), filter_(std::move(filter)) {}

std::string JsonFileSource::acquire() {
    auto start_time = std::chrono::high_resolution_clock::now();
    LOG_INFO("json_source", "Attempting to open a JSON file.");

    std::optional<std::filesystem::path> path = selector_.pickFile(filter_);
    if (!path) {
        LOG_INFO("json_source", "User cancelled file selection.");
        throw CommandError::generic("File selection was canceled.");
    }

    LOG_INFO("json_source", "User selected file: " + path->string());

    if (!filter_.matches(*path)) {
        throw CommandError::io("File " + path->string() + " does not match the " + filter_.name + " filter");
    }

    std::string content = readTextFile(*path);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time);
    LOG_INFO("json_source", "File read successfully in " + std::to_string(duration.count()) + "ms.");

    if (preview_bytes_ > 0) {
        std::unordered_map<std::string, std::string> metadata = {
            {"bytes", std::to_string(content.size())},
            {"preview", content.substr(0, std::min(preview_bytes_, content.size()))}
        };
        LOG_DEBUG_META("json_source", "File content preview", metadata);
    }

    return content;
}

std::string readTextFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw CommandError::io(path.string() + ": Is a directory");
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw CommandError::io(path.string() + ": " + std::strerror(errno));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw CommandError::io("Failed to read " + path.string());
    }
    return buffer.str();
}

} // namespace DQS::IO
