// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace stablecopy::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief <config home>/StableCopy/settings.json */
    static std::filesystem::path GetDefaultSettingsPath();

    /** @brief <data home>/StableCopy/backup_state.json */
    static std::filesystem::path GetDefaultLedgerPath();

    /** @brief Expands a leading "~" with $HOME and makes the result absolute. */
    static std::filesystem::path Resolve(const std::string& raw);
};

} // namespace stablecopy::infrastructure
