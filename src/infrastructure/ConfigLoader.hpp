/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the monitor configuration (settings.json).
 *
 * Keys absent from the document take the defaults of MonitorConfig. The result
 * is always validated, so callers receive either a usable config or a ConfigError.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/MonitorConfig.hpp"
#include "domain/OperationResult.hpp"

namespace stablecopy::infrastructure {

class ConfigLoader {
public:
    /** @brief Built-in defaults with the ledger at its default location. */
    static domain::MonitorConfig Defaults();

    /**
     * @brief Reads and validates @p settingsPath. A missing file yields Defaults().
     * @throws domain::ConfigError on unreadable/malformed JSON or invalid values.
     */
    static domain::MonitorConfig Load(const std::filesystem::path& settingsPath);

    /**
     * @brief Parses and validates a settings document held in memory.
     * @throws domain::ConfigError
     */
    static domain::MonitorConfig Parse(const std::string& jsonText);

    /** @brief Writes @p config as a settings document, atomically. */
    static domain::OperationResult Save(const domain::MonitorConfig& config, const std::filesystem::path& settingsPath);
};

} // namespace stablecopy::infrastructure
