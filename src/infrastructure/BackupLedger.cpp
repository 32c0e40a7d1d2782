/**
 * @file BackupLedger.cpp
 * @brief Implementation of BackupLedger.
 */

#include "infrastructure/BackupLedger.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/Logger.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace stablecopy::infrastructure {

namespace {

const char* kComponent = "BackupLedger";

std::string FormatUtc(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::chrono::system_clock::time_point ParseUtc(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) {
        throw std::runtime_error("invalid recorded_at '" + text + "'");
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace

BackupLedger::BackupLedger(fs::path storePath) : m_storePath(std::move(storePath)) {}

bool BackupLedger::isAlreadyBackedUp(const std::string& relativePath, const std::string& contentHash) const {
    return m_entries.count(domain::LedgerKey{relativePath, contentHash}) != 0;
}

void BackupLedger::record(const std::string& relativePath, const std::string& contentHash) {
    m_entries[domain::LedgerKey{relativePath, contentHash}] = std::chrono::system_clock::now();
    m_dirty = true;
}

std::vector<domain::LedgerEntry> BackupLedger::entries() const {
    std::vector<domain::LedgerEntry> result;
    result.reserve(m_entries.size());
    for (const auto& [key, recordedAt] : m_entries) {
        result.push_back({key, recordedAt});
    }
    return result;
}

std::string BackupLedger::serialize() const {
    json entries = json::array();
    for (const auto& [key, recordedAt] : m_entries) {
        entries.push_back({
            {"path", key.relativePath},
            {"hash", key.contentHash},
            {"recorded_at", FormatUtc(recordedAt)}
        });
    }
    json doc = {
        {"version", kFormatVersion},
        {"entries", entries}
    };
    return doc.dump(2) + "\n";
}

domain::OperationResult BackupLedger::loadFromDisk() {
    std::error_code ec;
    if (!fs::exists(m_storePath, ec)) {
        m_entries.clear();
        m_dirty = false;
        Logger::Info(kComponent, "No ledger store at " + m_storePath.string() + ", a new one will be created on save.");
        return domain::OperationResult::success("no store");
    }

    std::map<domain::LedgerKey, std::chrono::system_clock::time_point> loaded;
    try {
        std::ifstream f(m_storePath);
        if (!f.is_open()) {
            throw std::runtime_error("cannot open for reading");
        }
        json doc = json::parse(f);

        int version = doc.at("version").get<int>();
        if (version != kFormatVersion) {
            throw std::runtime_error("unsupported ledger version " + std::to_string(version));
        }
        const json& list = doc.at("entries");
        if (!list.is_array()) {
            throw std::runtime_error("'entries' is not an array");
        }
        for (const auto& item : list) {
            domain::LedgerKey key{item.at("path").get<std::string>(), item.at("hash").get<std::string>()};
            if (key.relativePath.empty() || key.contentHash.empty()) {
                throw std::runtime_error("entry with empty path or hash");
            }
            loaded[key] = ParseUtc(item.at("recorded_at").get<std::string>());
        }
    } catch (const std::exception& e) {
        m_entries.clear();
        m_dirty = false;
        Logger::Error(kComponent, Logger::Failure("Failed to load ledger, continuing with an empty one.",
                                                  m_storePath.string(), "load", e.what()));
        return domain::OperationResult::failure(e.what());
    }

    m_entries = std::move(loaded);
    m_dirty = false;
    Logger::Info(kComponent, "Loaded " + std::to_string(m_entries.size()) + " entries from " + m_storePath.string());
    return domain::OperationResult::success();
}

domain::OperationResult BackupLedger::saveToDisk() {
    std::string content;
    try {
        content = serialize();
    } catch (const std::exception& e) {
        Logger::Error(kComponent, Logger::Failure("Failed to serialize ledger.", m_storePath.string(), "save", e.what()));
        return domain::OperationResult::failure(e.what());
    }

    domain::OperationResult written = AtomicFileWriter::Write(m_storePath, content);
    if (!written.ok) {
        Logger::Error(kComponent, Logger::Failure("Failed to save ledger; entries kept in memory.",
                                                  m_storePath.string(), "save", written.message));
        return written;
    }

    m_dirty = false;
    Logger::Info(kComponent, "Saved " + std::to_string(m_entries.size()) + " entries to " + m_storePath.string());
    return domain::OperationResult::success();
}

} // namespace stablecopy::infrastructure
