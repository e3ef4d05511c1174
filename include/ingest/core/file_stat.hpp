#pragma once

#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"

#include <cstdint>
#include <filesystem>

namespace ingest {

enum class EntryType {
    Regular,
    Directory,
    Symlink,
    Other       ///< Block/char devices, pipes, sockets
};

struct FileStat {
    EntryType type = EntryType::Other;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;          ///< Permission bits only
    TimePoint created_at{};          ///< Birth time when the filesystem reports one, else mtime
    TimePoint modified_at{};
    FileIdentity identity;
};

/**
 * @brief statx wrapper that reports errors as classified Results
 *
 * With follow_symlinks == false this behaves like lstat.
 */
Result<FileStat> stat_path(const std::filesystem::path& path, bool follow_symlinks = false);

/// Error for a failed syscall, classified through classify_errno().
Error error_from_errno(int error_number, const std::string& context);

} // namespace ingest
