/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/ExtensionPresets.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PathUtils.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace stablecopy::infrastructure {

namespace {

const char* kComponent = "ConfigLoader";

void AppendUnique(std::vector<std::string>& out, const std::vector<std::string>& values) {
    for (const auto& v : values) {
        if (std::find(out.begin(), out.end(), v) == out.end()) {
            out.push_back(v);
        }
    }
}

domain::MonitorConfig FromJson(const json& j) {
    if (!j.is_object()) {
        throw domain::ConfigError("settings document must be a JSON object");
    }

    domain::MonitorConfig config = ConfigLoader::Defaults();
    try {
        if (j.contains("monitor_dir")) {
            config.monitorDir = PathUtils::Resolve(j["monitor_dir"].get<std::string>());
        }
        if (j.contains("dest_base_dir")) {
            config.destBaseDir = PathUtils::Resolve(j["dest_base_dir"].get<std::string>());
        }
        if (j.contains("dest_subdir_name")) {
            config.destSubdirName = j["dest_subdir_name"].get<std::string>();
        }

        if (j.contains("file_extensions") || j.contains("categories")) {
            std::vector<std::string> extensions;
            if (j.contains("file_extensions")) {
                AppendUnique(extensions, j["file_extensions"].get<std::vector<std::string>>());
            }
            if (j.contains("categories")) {
                for (const auto& name : j["categories"].get<std::vector<std::string>>()) {
                    auto preset = ExtensionPresets::Find(name);
                    if (!preset) {
                        throw domain::ConfigError("unknown category '" + name + "'");
                    }
                    AppendUnique(extensions, *preset);
                }
            }
            config.fileExtensions = extensions;
        }

        if (j.contains("check_interval_seconds")) {
            config.checkIntervalSeconds = j["check_interval_seconds"].get<std::int64_t>();
        }
        if (j.contains("stable_threshold_seconds")) {
            config.stableThresholdSeconds = j["stable_threshold_seconds"].get<std::int64_t>();
        }
        if (j.contains("ledger_path")) {
            config.ledgerPath = PathUtils::Resolve(j["ledger_path"].get<std::string>());
        }
        if (j.contains("save_after_each_copy")) {
            config.saveAfterEachCopy = j["save_after_each_copy"].get<bool>();
        }
        if (j.contains("log_level")) {
            config.logLevel = j["log_level"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw domain::ConfigError(std::string("invalid settings value: ") + e.what());
    }

    if (!Logger::ParseLevel(config.logLevel)) {
        throw domain::ConfigError("unknown log_level '" + config.logLevel + "'");
    }
    config.validate();
    return config;
}

} // namespace

domain::MonitorConfig ConfigLoader::Defaults() {
    domain::MonitorConfig config;
    auto preset = ExtensionPresets::Find(ExtensionPresets::DefaultCategory());
    if (preset) config.fileExtensions = *preset;
    config.ledgerPath = PathUtils::GetDefaultLedgerPath();
    return config;
}

domain::MonitorConfig ConfigLoader::Parse(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw domain::ConfigError(std::string("malformed settings JSON: ") + e.what());
    }
    return FromJson(j);
}

domain::MonitorConfig ConfigLoader::Load(const fs::path& settingsPath) {
    std::error_code ec;
    if (!fs::exists(settingsPath, ec)) {
        Logger::Info(kComponent, "No settings at " + settingsPath.string() + ", using defaults.");
        domain::MonitorConfig config = Defaults();
        config.validate();
        return config;
    }

    std::ifstream f(settingsPath);
    if (!f.is_open()) {
        throw domain::ConfigError("cannot read " + settingsPath.string());
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    domain::MonitorConfig config = Parse(buffer.str());
    Logger::Info(kComponent, "Using configuration from " + settingsPath.string());
    return config;
}

domain::OperationResult ConfigLoader::Save(const domain::MonitorConfig& config, const fs::path& settingsPath) {
    json j;
    j["monitor_dir"] = config.monitorDir.string();
    j["dest_base_dir"] = config.destBaseDir.string();
    j["dest_subdir_name"] = config.destSubdirName;
    j["file_extensions"] = config.fileExtensions;
    j["check_interval_seconds"] = config.checkIntervalSeconds;
    j["stable_threshold_seconds"] = config.stableThresholdSeconds;
    j["ledger_path"] = config.ledgerPath.string();
    j["save_after_each_copy"] = config.saveAfterEachCopy;
    j["log_level"] = config.logLevel;

    domain::OperationResult result = AtomicFileWriter::Write(settingsPath, j.dump(4) + "\n");
    if (!result.ok) {
        Logger::Error(kComponent, Logger::Failure("Error writing settings.", settingsPath.string(), "save", result.message));
    } else {
        Logger::Info(kComponent, "Configuration saved to " + settingsPath.string());
    }
    return result;
}

} // namespace stablecopy::infrastructure
