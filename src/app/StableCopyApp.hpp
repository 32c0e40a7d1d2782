/**
 * @file StableCopyApp.hpp
 * @brief Main application class for StableCopy.
 */

#pragma once

#include <signal.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "application/ShutdownSignal.hpp"

namespace stablecopy::app {

/**
 * @class StableCopyApp
 * @brief Orchestrates the process lifecycle: arguments, configuration, signals, the poll loop and shutdown.
 */
class StableCopyApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitStartupFailure = 1;
    static constexpr int kExitUsage = 2;

    /**
     * @brief Runs the application until shutdown.
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

private:
    struct Options {
        std::filesystem::path configPath;
        std::optional<std::filesystem::path> writeConfigPath;
        bool once = false;
        bool help = false;
    };

    /**
     * @brief Parses command-line arguments (without the program name).
     * @return Error message, or nullopt on success.
     */
    std::optional<std::string> ParseArguments(const std::vector<std::string>& args);

    /** @brief Routes SIGINT/SIGTERM to m_shutdown and ignores SIGPIPE. */
    void InstallSignalHandlers();

    /** @brief Restores the dispositions saved by InstallSignalHandlers() and detaches m_shutdown. */
    void RestoreSignalHandlers();

    static void PrintUsage();

    Options m_options; ///< Parsed command line.
    application::ShutdownSignal m_shutdown; ///< Stop token shared with the poll loop.
    struct sigaction m_previousTerm{};
    struct sigaction m_previousInt{};
    struct sigaction m_previousPipe{};
};

} // namespace stablecopy::app
