#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace stablecopy::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "StableCopy" / "settings.json";
}

fs::path PathUtils::GetDefaultLedgerPath() {
    return GetDataHome() / "StableCopy" / "backup_state.json";
}

fs::path PathUtils::Resolve(const std::string& raw) {
    fs::path p;
    if (!raw.empty() && raw[0] == '~' && (raw.size() == 1 || raw[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            p = fs::path(home) / (raw.size() > 2 ? raw.substr(2) : std::string());
        } else {
            p = raw;
        }
    } else {
        p = raw;
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(p, ec);
    fs::path normal = ec ? p.lexically_normal() : absolute.lexically_normal();
    // Drop a trailing separator so "dir/" and "dir" compare equal.
    if (!normal.has_filename() && normal != normal.root_path() && normal.has_parent_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // namespace stablecopy::infrastructure
