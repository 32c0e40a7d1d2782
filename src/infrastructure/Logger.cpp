/**
 * @file Logger.cpp
 * @brief Implementation of Logger.
 */

#include "infrastructure/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace stablecopy::infrastructure {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_writeMutex;

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

void Logger::SetLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::GetLevel() {
    return static_cast<LogLevel>(g_level.load());
}

std::optional<LogLevel> Logger::ParseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

void Logger::Debug(const std::string& component, const std::string& message) {
    Write(LogLevel::Debug, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
    Write(LogLevel::Info, component, message);
}

void Logger::Warning(const std::string& component, const std::string& message) {
    Write(LogLevel::Warning, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
    Write(LogLevel::Error, component, message);
}

std::string Logger::Failure(const std::string& what, const std::string& path,
                            const std::string& op, const std::string& cause) {
    std::ostringstream ss;
    ss << what << " path=" << path << " op=" << op << " cause=" << cause;
    return ss.str();
}

void Logger::Write(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToLocalTime(tt);

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " - " << LevelName(level)
         << " - [" << component << "] " << message;

    std::lock_guard<std::mutex> lock(g_writeMutex);
    if (level >= LogLevel::Warning) {
        std::cerr << line.str() << std::endl;
    } else {
        std::cout << line.str() << std::endl;
    }
}

} // namespace stablecopy::infrastructure
