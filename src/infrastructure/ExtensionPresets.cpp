/**
 * @file ExtensionPresets.cpp
 * @brief Implementation of ExtensionPresets.
 */

#include "infrastructure/ExtensionPresets.hpp"

namespace stablecopy::infrastructure {

const std::vector<ExtensionPresets::Preset>& ExtensionPresets::All() {
    static const std::vector<Preset> presets = {
        {"Slackware Packages", {".tgz", ".tbz", ".tlz", ".txz"}},
        {"Disk Images", {".iso", ".img", ".raw", ".qcow2", ".vdi", ".vmdk"}},
        {"Documents", {".pdf", ".txt", ".md", ".odt", ".doc", ".docx", ".rtf"}},
        {"Images", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".svg", ".heic"}},
        {"Audio", {".mp3", ".wav", ".aac", ".flac", ".ogg"}},
        {"Video", {".mp4", ".mkv", ".avi", ".mov", ".webm"}},
        {"Archives (General)", {".zip", ".rar", ".7z", ".tar", ".gz", ".bz2"}},
        {"Source Code", {".py", ".c", ".cpp", ".java", ".js", ".html", ".css", ".sh"}},
    };
    return presets;
}

std::optional<std::vector<std::string>> ExtensionPresets::Find(const std::string& category) {
    for (const auto& [name, extensions] : All()) {
        if (name == category) return extensions;
    }
    return std::nullopt;
}

const std::string& ExtensionPresets::DefaultCategory() {
    static const std::string name = "Slackware Packages";
    return name;
}

} // namespace stablecopy::infrastructure
