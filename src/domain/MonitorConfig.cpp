/**
 * @file MonitorConfig.cpp
 * @brief Implementation of MonitorConfig validation.
 */

#include "domain/MonitorConfig.hpp"
#include <algorithm>
#include <string>
#include <system_error>

namespace stablecopy::domain {

namespace fs = std::filesystem;

bool MonitorConfig::matchesExtension(const std::string& extension) const {
    return std::find(fileExtensions.begin(), fileExtensions.end(), extension) != fileExtensions.end();
}

void MonitorConfig::validate() const {
    if (monitorDir.empty()) {
        throw ConfigError("monitor_dir is required");
    }
    std::error_code ec;
    if (!fs::is_directory(monitorDir, ec)) {
        throw ConfigError("monitor_dir '" + monitorDir.string() + "' is not an existing directory");
    }
    if (destBaseDir.empty()) {
        throw ConfigError("dest_base_dir is required");
    }
    if (destSubdirName.empty()) {
        throw ConfigError("dest_subdir_name is required");
    }
    if (fileExtensions.empty()) {
        throw ConfigError("file_extensions must not be empty");
    }
    for (const auto& ext : fileExtensions) {
        if (ext.size() < 2 || ext.front() != '.') {
            throw ConfigError("file extension '" + ext + "' must start with '.' and name a suffix");
        }
    }
    if (checkIntervalSeconds <= 0) {
        throw ConfigError("check_interval_seconds must be positive");
    }
    if (checkIntervalSeconds > kMaxCheckIntervalSeconds) {
        throw ConfigError("check_interval_seconds must not exceed " + std::to_string(kMaxCheckIntervalSeconds));
    }
    if (stableThresholdSeconds < 0) {
        throw ConfigError("stable_threshold_seconds must not be negative");
    }
    if (ledgerPath.empty()) {
        throw ConfigError("ledger_path is required");
    }
}

} // namespace stablecopy::domain
