/**
 * @file AtomicFileWriter.hpp
 * @brief Write-to-temp-then-rename file replacement.
 */

#pragma once
#include <filesystem>
#include <string>
#include "domain/OperationResult.hpp"

namespace stablecopy::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Replaces a file so readers only ever see the old or the new content.
 *
 * Content goes to "<target>.tmp", is flushed and fsync'd, then renamed over the
 * target, and the containing directory is fsync'd so the rename itself is
 * durable. The temp file is removed on every failure path.
 */
class AtomicFileWriter {
public:
    /** @brief Path of the temp artifact used for @p target. */
    static std::filesystem::path TempPathFor(const std::filesystem::path& target);

    /**
     * @brief Atomically replaces @p target with @p content.
     * Parent directories are created if needed.
     */
    static domain::OperationResult Write(const std::filesystem::path& target, const std::string& content);
};

} // namespace stablecopy::infrastructure
