/**
 * @file StableCopyApp.cpp
 * @brief Implementation of the StableCopyApp class.
 */
#include "app/StableCopyApp.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "application/BackupOrchestrator.hpp"
#include "domain/MonitorConfig.hpp"
#include "infrastructure/BackupLedger.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/Md5ContentHasher.hpp"
#include "infrastructure/PathUtils.hpp"

namespace stablecopy::app {

using infrastructure::Logger;

namespace {

const char* kComponent = "StableCopyApp";

// The only process-wide state: a signal handler cannot be given a context pointer.
std::atomic<application::ShutdownSignal*> g_activeShutdown{nullptr};

void HandleTerminationSignal(int) {
    application::ShutdownSignal* signal = g_activeShutdown.load();
    if (signal) {
        signal->notifyFromSignalHandler();
    }
}

} // namespace

void StableCopyApp::PrintUsage() {
    std::cout << "Usage: stablecopy [--config PATH] [--once] [--write-config PATH] [--help]\n"
              << "  --config PATH        settings file (default: "
              << infrastructure::PathUtils::GetDefaultSettingsPath().string() << ")\n"
              << "  --once               run a single scan cycle, save the ledger and exit\n"
              << "  --write-config PATH  write the effective configuration to PATH and exit\n"
              << "  --help               show this message\n";
}

std::optional<std::string> StableCopyApp::ParseArguments(const std::vector<std::string>& args) {
    m_options = Options{};
    m_options.configPath = infrastructure::PathUtils::GetDefaultSettingsPath();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            m_options.help = true;
        } else if (arg == "--once") {
            m_options.once = true;
        } else if (arg == "--config" || arg == "--write-config") {
            if (i + 1 >= args.size()) {
                return arg + " requires a path";
            }
            const std::filesystem::path value = infrastructure::PathUtils::Resolve(args[++i]);
            if (arg == "--config") {
                m_options.configPath = value;
            } else {
                m_options.writeConfigPath = value;
            }
        } else {
            return "unknown argument '" + arg + "'";
        }
    }
    return std::nullopt;
}

void StableCopyApp::InstallSignalHandlers() {
    g_activeShutdown.store(&m_shutdown);

    struct sigaction sa{};
    sa.sa_handler = HandleTerminationSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGTERM, &sa, &m_previousTerm);
    sigaction(SIGINT, &sa, &m_previousInt);

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &m_previousPipe);
}

void StableCopyApp::RestoreSignalHandlers() {
    sigaction(SIGTERM, &m_previousTerm, nullptr);
    sigaction(SIGINT, &m_previousInt, nullptr);
    sigaction(SIGPIPE, &m_previousPipe, nullptr);
    g_activeShutdown.store(nullptr);
}

int StableCopyApp::Run(const std::vector<std::string>& args) {
    if (auto usageError = ParseArguments(args)) {
        std::cerr << "stablecopy: " << *usageError << std::endl;
        PrintUsage();
        return kExitUsage;
    }
    if (m_options.help) {
        PrintUsage();
        return kExitOk;
    }

    domain::MonitorConfig config;
    try {
        config = infrastructure::ConfigLoader::Load(m_options.configPath);
    } catch (const domain::ConfigError& e) {
        Logger::Error(kComponent, Logger::Failure("Invalid configuration.", m_options.configPath.string(), "config", e.what()));
        return kExitUsage;
    }
    Logger::SetLevel(Logger::ParseLevel(config.logLevel).value_or(infrastructure::LogLevel::Info));

    if (m_options.writeConfigPath) {
        return infrastructure::ConfigLoader::Save(config, *m_options.writeConfigPath).ok ? kExitOk : kExitStartupFailure;
    }

    auto ledger = std::make_shared<infrastructure::BackupLedger>(config.ledgerPath);
    auto hasher = std::make_shared<infrastructure::Md5ContentHasher>();
    application::BackupOrchestrator orchestrator(config, ledger, hasher);

    try {
        orchestrator.initialize();
    } catch (const std::exception& e) {
        Logger::Error(kComponent, std::string("Failed to initialize: ") + e.what());
        return kExitStartupFailure;
    }

    // Installed before the first cycle so a signal during a copy still ends in a ledger save.
    InstallSignalHandlers();

    if (m_options.once) {
        try {
            const application::CycleReport report = orchestrator.runOnce(&m_shutdown);
            Logger::Info(kComponent, "Single cycle done: " + std::to_string(report.copied) + " copied, " +
                         std::to_string(report.deferred) + " deferred.");
        } catch (const std::exception& e) {
            Logger::Error(kComponent, std::string("Single cycle failed: ") + e.what());
        }
        const bool saved = ledger->saveToDisk().ok;
        RestoreSignalHandlers();
        return saved ? kExitOk : kExitStartupFailure;
    }

    orchestrator.run(m_shutdown);
    RestoreSignalHandlers();

    Logger::Info(kComponent, "Exiting.");
    return kExitOk;
}

} // namespace stablecopy::app
