#pragma once

#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace ingest::transfer {

/// Suffix of the temporary file a copy writes before the final rename.
inline constexpr const char* kPartSuffix = ".TBPART";

struct CopyJob {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::size_t buffer_size = 1024 * 1024;
    bool verify = true;

    std::function<void(std::uint64_t bytes_copied)> on_progress;
    std::function<void()> on_verifying;
    std::function<bool()> should_stop;     ///< Polled before every chunk
};

struct CopyOutcome {
    std::uint64_t bytes = 0;
    std::string checksum;      ///< FNV-1a of the source bytes
    bool verified = false;
};

struct CopyFailure {
    FileErrorKind kind = FileErrorKind::Other;
    std::string message;
    bool stopped = false;      ///< should_stop() fired; not a real failure
};

using CopyResult = Result<CopyOutcome, CopyFailure>;

/**
 * @brief Copies one file through a temp file and an atomic rename
 *
 *   source --read/hash--> <destination>.TBPART --fsync, verify--> rename
 *
 * The source is only ever opened read-only. Any failure or stop removes
 * the temp file, so the destination either holds the complete file or is
 * left as it was.
 *
 * Subclass to inject faults: copy() is the whole operation, on_chunk() runs
 * after each chunk lands in the temp file.
 */
class FileCopier {
public:
    virtual ~FileCopier() = default;

    virtual CopyResult copy(const CopyJob& job);

protected:
    virtual void on_chunk(const CopyJob& job, std::uint64_t bytes_copied);
};

std::filesystem::path part_path_for(const std::filesystem::path& destination);

/**
 * @brief Removes *.TBPART files under @p root older than @p max_age
 *
 * Younger temp files may belong to a copy still running in another
 * process and are left alone. Returns the number of files removed.
 */
Result<std::size_t> cleanup_orphaned_parts(const std::filesystem::path& root,
                                           std::chrono::hours max_age,
                                           TimePoint now = Clock::now());

} // namespace ingest::transfer
