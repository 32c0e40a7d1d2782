/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace stablecopy::infrastructure {

namespace fs = std::filesystem;

namespace {

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

bool SyncPath(const fs::path& path, int flags, std::string& error) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        error = std::strerror(errno);
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    if (!ok) error = std::strerror(errno);
    ::close(fd);
    return ok;
}

} // namespace

fs::path AtomicFileWriter::TempPathFor(const fs::path& target) {
    fs::path tempPath = target;
    tempPath += ".tmp";
    return tempPath;
}

domain::OperationResult AtomicFileWriter::Write(const fs::path& target, const std::string& content) {
    const fs::path tempPath = TempPathFor(target);

    // 1. Ensure directory exists
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return domain::OperationResult::failure("cannot create directory " +
                target.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!ofs.is_open()) {
            return domain::OperationResult::failure("cannot open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            RemoveQuietly(tempPath);
            return domain::OperationResult::failure("write failed on temp file " + tempPath.string());
        }
    }

    std::string syncError;
    if (!SyncPath(tempPath, O_RDONLY, syncError)) {
        RemoveQuietly(tempPath);
        return domain::OperationResult::failure("fsync failed on " + tempPath.string() + ": " + syncError);
    }

    // 3. Atomic Rename
    fs::rename(tempPath, target, ec);
    if (ec) {
        RemoveQuietly(tempPath);
        return domain::OperationResult::failure("rename to " + target.string() + " failed: " + ec.message());
    }

    // 4. Persist the directory entry so the rename survives a crash
    const fs::path directory = target.has_parent_path() ? target.parent_path() : fs::path(".");
    if (!SyncPath(directory, O_RDONLY | O_DIRECTORY, syncError)) {
        return domain::OperationResult::failure("fsync failed on directory " + directory.string() + ": " + syncError);
    }
    return domain::OperationResult::success();
}

} // namespace stablecopy::infrastructure
