#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "domain/MonitorConfig.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ExtensionPresets.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace stablecopy;
using infrastructure::ConfigLoader;
namespace fs = std::filesystem;

namespace {

fs::path ScratchDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "stablecopy-tests" / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir / "watch");
    return dir;
}

std::string BaseDocument(const fs::path& dir, const std::string& extra) {
    std::string doc = "{\n"
        "  \"monitor_dir\": \"" + (dir / "watch").string() + "\",\n"
        "  \"dest_base_dir\": \"" + (dir / "backup").string() + "\",\n"
        "  \"ledger_path\": \"" + (dir / "state.json").string() + "\"";
    if (!extra.empty()) doc += ",\n  " + extra;
    doc += "\n}";
    return doc;
}

bool Rejects(const std::string& text) {
    try {
        ConfigLoader::Parse(text);
    } catch (const domain::ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void testParseFullDocument() {
    fs::path dir = ScratchDir("config-parse");
    domain::MonitorConfig config = ConfigLoader::Parse(BaseDocument(dir,
        "\"dest_subdir_name\": \"kept\",\n"
        "  \"file_extensions\": [\".iso\"],\n"
        "  \"check_interval_seconds\": 10,\n"
        "  \"stable_threshold_seconds\": 25,\n"
        "  \"save_after_each_copy\": false,\n"
        "  \"log_level\": \"DEBUG\""));

    assert(config.monitorDir == dir / "watch");
    assert(config.destDir() == dir / "backup" / "kept");
    assert(config.fileExtensions.size() == 1 && config.fileExtensions[0] == ".iso");
    assert(config.checkIntervalSeconds == 10);
    assert(config.stableThresholdSeconds == 25);
    assert(!config.saveAfterEachCopy);
    assert(config.ledgerPath == dir / "state.json");
    assert(config.matchesExtension(".iso"));
    assert(!config.matchesExtension(".ISO"));

    fs::remove_all(dir);
}

void testDefaultsFillMissingKeys() {
    fs::path dir = ScratchDir("config-defaults");
    domain::MonitorConfig config = ConfigLoader::Parse(
        "{\"monitor_dir\": \"" + (dir / "watch").string() + "\"}");

    assert(config.destBaseDir == "/opt/stor0");
    assert(config.destSubdirName == "SavedCachedFiles");
    assert(config.checkIntervalSeconds == 300);
    assert(config.stableThresholdSeconds == 120);
    assert(config.saveAfterEachCopy);
    assert(config.fileExtensions == *infrastructure::ExtensionPresets::Find("Slackware Packages"));
    assert(config.ledgerPath == infrastructure::PathUtils::GetDefaultLedgerPath());

    fs::remove_all(dir);
}

void testCategoriesMergeWithoutDuplicates() {
    fs::path dir = ScratchDir("config-categories");
    domain::MonitorConfig config = ConfigLoader::Parse(BaseDocument(dir,
        "\"file_extensions\": [\".tgz\", \".custom\"],\n"
        "  \"categories\": [\"Slackware Packages\", \"Disk Images\"]"));

    // .tgz appears once even though both sources name it.
    std::size_t tgz = 0;
    for (const auto& ext : config.fileExtensions) {
        if (ext == ".tgz") ++tgz;
    }
    assert(tgz == 1);
    assert(config.fileExtensions[0] == ".tgz");
    assert(config.fileExtensions[1] == ".custom");
    assert(config.matchesExtension(".txz"));
    assert(config.matchesExtension(".qcow2"));
    assert(config.fileExtensions.size() == 2 + 3 + 6);

    fs::remove_all(dir);
}

void testInvalidDocumentsRejected() {
    fs::path dir = ScratchDir("config-invalid");

    assert(Rejects("{ not json"));
    assert(Rejects("[1, 2, 3]"));
    assert(Rejects(BaseDocument(dir, "\"file_extensions\": []")));
    assert(Rejects(BaseDocument(dir, "\"file_extensions\": [\"tgz\"]")));
    assert(Rejects(BaseDocument(dir, "\"file_extensions\": [\".\"]")));
    assert(Rejects(BaseDocument(dir, "\"check_interval_seconds\": 0")));
    assert(Rejects(BaseDocument(dir, "\"stable_threshold_seconds\": -1")));
    assert(Rejects(BaseDocument(dir, "\"check_interval_seconds\": \"fast\"")));
    assert(Rejects(BaseDocument(dir, "\"categories\": [\"Fonts\"]")));
    assert(Rejects(BaseDocument(dir, "\"log_level\": \"verbose\"")));
    assert(Rejects(BaseDocument(dir, "\"dest_subdir_name\": \"\"")));
    assert(Rejects("{\"monitor_dir\": \"" + (dir / "missing").string() + "\"}"));

    // A regular file is not a monitor directory.
    std::ofstream(dir / "plain") << "x";
    assert(Rejects("{\"monitor_dir\": \"" + (dir / "plain").string() + "\"}"));

    // Intervals beyond the supported bound would overflow the sleep deadline.
    assert(Rejects(BaseDocument(dir, "\"check_interval_seconds\": 10000000000")));
    assert(Rejects(BaseDocument(dir, "\"check_interval_seconds\": " +
                                std::to_string(domain::MonitorConfig::kMaxCheckIntervalSeconds + 1))));
    domain::MonitorConfig longest = ConfigLoader::Parse(BaseDocument(dir,
        "\"check_interval_seconds\": " + std::to_string(domain::MonitorConfig::kMaxCheckIntervalSeconds)));
    assert(longest.checkIntervalSeconds == domain::MonitorConfig::kMaxCheckIntervalSeconds);

    // Zero threshold is allowed.
    domain::MonitorConfig zero = ConfigLoader::Parse(BaseDocument(dir, "\"stable_threshold_seconds\": 0"));
    assert(zero.stableThresholdSeconds == 0);

    fs::remove_all(dir);
}

void testLoadAndSave() {
    fs::path dir = ScratchDir("config-file");

    // Missing settings file falls back to defaults (monitor dir /tmp exists on every host we run on).
    domain::MonitorConfig defaults = ConfigLoader::Load(dir / "absent.json");
    assert(defaults.monitorDir == "/tmp");

    domain::MonitorConfig original = ConfigLoader::Parse(BaseDocument(dir,
        "\"categories\": [\"Documents\"],\n  \"check_interval_seconds\": 7"));
    const fs::path settings = dir / "nested" / "settings.json";
    assert(ConfigLoader::Save(original, settings).ok);
    assert(!fs::exists(settings.string() + ".tmp"));

    domain::MonitorConfig loaded = ConfigLoader::Load(settings);
    assert(loaded.monitorDir == original.monitorDir);
    assert(loaded.destDir() == original.destDir());
    assert(loaded.fileExtensions == original.fileExtensions);
    assert(loaded.checkIntervalSeconds == 7);
    assert(loaded.ledgerPath == original.ledgerPath);

    std::ofstream(dir / "broken.json") << "{\"monitor_dir\": ";
    bool threw = false;
    try {
        ConfigLoader::Load(dir / "broken.json");
    } catch (const domain::ConfigError&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
}

void testPathResolution() {
    using infrastructure::PathUtils;
    const char* home = std::getenv("HOME");
    if (home && *home) {
        assert(PathUtils::Resolve("~/stash") == (fs::path(home) / "stash").lexically_normal());
    }
    assert(PathUtils::Resolve("/var/tmp/../tmp/") == "/var/tmp");
    assert(PathUtils::Resolve("relative").is_absolute());
    assert(PathUtils::GetDefaultLedgerPath().filename() == "backup_state.json");
    assert(PathUtils::GetDefaultSettingsPath().filename() == "settings.json");
}

void testLogLevels() {
    using infrastructure::Logger;
    using infrastructure::LogLevel;
    assert(Logger::ParseLevel("debug") == LogLevel::Debug);
    assert(Logger::ParseLevel("Info") == LogLevel::Info);
    assert(Logger::ParseLevel("WARN") == LogLevel::Warning);
    assert(Logger::ParseLevel("warning") == LogLevel::Warning);
    assert(Logger::ParseLevel("error") == LogLevel::Error);
    assert(!Logger::ParseLevel("trace"));

    assert(Logger::Failure("Error copying file.", "/w/a.tgz", "copy", "No space left") ==
           "Error copying file. path=/w/a.tgz op=copy cause=No space left");
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    testParseFullDocument();
    testDefaultsFillMissingKeys();
    testCategoriesMergeWithoutDuplicates();
    testInvalidDocumentsRejected();
    testLoadAndSave();
    testPathResolution();
    testLogLevels();

    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
