/**
 * @file CandidateScanner.cpp
 * @brief Implementation of the CandidateScanner.
 */

#include "infrastructure/CandidateScanner.hpp"
#include <algorithm>
#include <system_error>
#include <utility>
#include "infrastructure/Logger.hpp"

namespace fs = std::filesystem;

namespace stablecopy::infrastructure {

namespace {
const char* kComponent = "CandidateScanner";
}

CandidateScanner::CandidateScanner(fs::path monitorDir, std::vector<std::string> extensions)
    : m_monitorDir(std::move(monitorDir)), m_extensions(std::move(extensions)) {}

bool CandidateScanner::matchesExtension(const fs::path& path) const {
    const std::string ext = path.extension().string();
    return std::find(m_extensions.begin(), m_extensions.end(), ext) != m_extensions.end();
}

std::optional<std::uint64_t> CandidateScanner::ReadFileSize(const fs::path& path, std::string& error) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        error = ec.message();
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

ScanResult CandidateScanner::scan() const {
    ScanResult result;

    std::error_code ec;
    fs::directory_iterator it(m_monitorDir, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        if (!matchesExtension(entry.path())) {
            continue;
        }

        std::error_code typeEc;
        const bool regular = entry.is_regular_file(typeEc);
        if (typeEc) {
            Logger::Warning(kComponent, Logger::Failure("Cannot stat entry, skipping this cycle.",
                                                        entry.path().string(), "stat", typeEc.message()));
            continue;
        }
        if (!regular) {
            continue;
        }

        domain::CandidateFile candidate;
        candidate.path = entry.path().string();
        std::string sizeError;
        candidate.size = ReadFileSize(entry.path(), sizeError);
        if (!candidate.size) {
            Logger::Warning(kComponent, Logger::Failure("Cannot read size.", candidate.path, "stat", sizeError));
        }
        result.files.push_back(std::move(candidate));
    }

    if (ec) {
        result.listed = false;
        result.error = ec.message();
        result.files.clear();
        Logger::Error(kComponent, Logger::Failure("Error listing directory.", m_monitorDir.string(), "list", ec.message()));
        return result;
    }

    std::sort(result.files.begin(), result.files.end(),
              [](const domain::CandidateFile& a, const domain::CandidateFile& b) { return a.path < b.path; });
    return result;
}

} // namespace stablecopy::infrastructure
