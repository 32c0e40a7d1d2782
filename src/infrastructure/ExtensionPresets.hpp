/**
 * @file ExtensionPresets.hpp
 * @brief Built-in named groups of file extensions.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stablecopy::infrastructure {

/**
 * @class ExtensionPresets
 * @brief Read-only table of categories such as "Slackware Packages" or "Disk Images".
 */
class ExtensionPresets {
public:
    using Preset = std::pair<std::string, std::vector<std::string>>;

    /** @brief All presets, in display order. */
    static const std::vector<Preset>& All();

    /** @brief Extensions of the named category, or nullopt if unknown. Exact name match. */
    static std::optional<std::vector<std::string>> Find(const std::string& category);

    /** @brief The category used when settings name no extensions. */
    static const std::string& DefaultCategory();
};

} // namespace stablecopy::infrastructure
