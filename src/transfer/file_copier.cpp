#include "ingest/transfer/file_copier.hpp"

#include "ingest/core/checksum.hpp"
#include "ingest/core/file_stat.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

namespace ingest::transfer {
namespace fs = std::filesystem;

namespace {

CopyResult fail(FileErrorKind kind, std::string message) {
    return Err<CopyOutcome, CopyFailure>(CopyFailure{kind, std::move(message), false});
}

CopyResult fail_errno(int error_number, const std::string& what, const fs::path& path) {
    return fail(classify_errno(error_number), what + " " + path.string() + ": " + std::strerror(error_number));
}

CopyResult stopped() {
    return Err<CopyOutcome, CopyFailure>(CopyFailure{FileErrorKind::Other, "copy stopped", true});
}

/// Owns a descriptor; closes it on scope exit unless close() was called.
class Descriptor {
public:
    explicit Descriptor(int fd) noexcept : fd_(fd) {}
    ~Descriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    /// Returns 0 or the errno of a failed close.
    int close() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0 ? 0 : errno;
    }

private:
    int fd_;
};

/// Unlinks the temp file on scope exit unless released.
class PartFileGuard {
public:
    explicit PartFileGuard(fs::path path) : path_(std::move(path)) {}
    ~PartFileGuard() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
            if (ec) {
                spdlog::warn("[Transfer] could not remove temp file path={} error={}", path_.string(), ec.message());
            }
        }
    }

    PartFileGuard(const PartFileGuard&) = delete;
    PartFileGuard& operator=(const PartFileGuard&) = delete;

    void release() noexcept { released_ = true; }

private:
    fs::path path_;
    bool released_ = false;
};

ssize_t read_some(int fd, char* buffer, std::size_t size) {
    ssize_t n;
    do {
        n = ::read(fd, buffer, size);
    } while (n < 0 && errno == EINTR);
    return n;
}

bool write_fully(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

fs::path part_path_for(const fs::path& destination) {
    fs::path part = destination;
    part += kPartSuffix;
    return part;
}

void FileCopier::on_chunk(const CopyJob&, std::uint64_t) {}

CopyResult FileCopier::copy(const CopyJob& job) {
    const fs::path part_path = part_path_for(job.destination);
    const std::size_t buffer_size = job.buffer_size == 0 ? 64 * 1024 : job.buffer_size;

    std::error_code ec;
    fs::create_directories(job.destination.parent_path(), ec);
    if (ec) {
        return fail(classify_errno(ec.value()),
                    "Cannot create directory " + job.destination.parent_path().string() + ": " + ec.message());
    }

    Descriptor input(::open(job.source.c_str(), O_RDONLY | O_CLOEXEC));
    if (!input.valid()) {
        return fail_errno(errno, "Cannot open source", job.source);
    }

    struct stat source_stat{};
    if (::fstat(input.get(), &source_stat) != 0) {
        return fail_errno(errno, "Cannot stat source", job.source);
    }

    Descriptor output(::open(part_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!output.valid()) {
        return fail_errno(errno, "Cannot create", part_path);
    }
    PartFileGuard guard(part_path);

    std::vector<char> buffer(buffer_size);
    Fnv1a64 source_hash;
    std::uint64_t copied = 0;

    while (true) {
        if (job.should_stop && job.should_stop()) {
            return stopped();
        }

        const ssize_t n = read_some(input.get(), buffer.data(), buffer.size());
        if (n < 0) {
            return fail_errno(errno, "Read failed on", job.source);
        }
        if (n == 0) {
            break;
        }

        source_hash.update(buffer.data(), static_cast<std::size_t>(n));
        if (!write_fully(output.get(), buffer.data(), static_cast<std::size_t>(n))) {
            return fail_errno(errno, "Write failed on", part_path);
        }

        copied += static_cast<std::uint64_t>(n);
        on_chunk(job, copied);
        if (job.on_progress) {
            job.on_progress(copied);
        }
    }

    if (::fsync(output.get()) != 0) {
        return fail_errno(errno, "fsync failed on", part_path);
    }

    const std::string checksum = source_hash.hex_digest();
    if (job.verify) {
        if (job.on_verifying) {
            job.on_verifying();
        }

        Descriptor readback(::open(part_path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!readback.valid()) {
            return fail_errno(errno, "Cannot reopen", part_path);
        }
        Fnv1a64 written_hash;
        while (true) {
            if (job.should_stop && job.should_stop()) {
                return stopped();
            }
            const ssize_t n = read_some(readback.get(), buffer.data(), buffer.size());
            if (n < 0) {
                return fail_errno(errno, "Verify read failed on", part_path);
            }
            if (n == 0) {
                break;
            }
            written_hash.update(buffer.data(), static_cast<std::size_t>(n));
        }

        if (written_hash.hex_digest() != checksum) {
            spdlog::warn("[Transfer] checksum mismatch source={} expected={} actual={}",
                         job.source.string(), checksum, written_hash.hex_digest());
            return fail(FileErrorKind::ChecksumMismatch,
                        "Checksum mismatch for " + job.source.string() + ": expected " + checksum
                        + ", wrote " + written_hash.hex_digest());
        }
    }

    if (::fchmod(output.get(), source_stat.st_mode & 07777) != 0) {
        spdlog::warn("[Transfer] cannot copy permissions path={} error={}", part_path.string(), std::strerror(errno));
    }
    const struct timespec times[2] = {source_stat.st_atim, source_stat.st_mtim};
    if (::futimens(output.get(), times) != 0) {
        spdlog::warn("[Transfer] cannot copy timestamps path={} error={}", part_path.string(), std::strerror(errno));
    }

    if (const int close_error = output.close(); close_error != 0) {
        return fail_errno(close_error, "Close failed on", part_path);
    }

    if (::rename(part_path.c_str(), job.destination.c_str()) != 0) {
        return fail_errno(errno, "Cannot rename into", job.destination);
    }
    guard.release();

    return CopyResult(OkValue<CopyOutcome>(CopyOutcome{copied, checksum, job.verify}));
}

Result<std::size_t> cleanup_orphaned_parts(const fs::path& root, std::chrono::hours max_age, TimePoint now) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Err<std::size_t>(ErrorCode::NotFound, "Not a directory: " + root.string());
    }

    std::size_t removed = 0;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err<std::size_t>(ErrorCode::Io, "Cannot walk " + root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const fs::path& entry = it->path();
        const std::string name = entry.filename().string();
        const std::string suffix = kPartSuffix;
        if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }

        const auto info = stat_path(entry);
        if (info.is_error() || info.value().type != EntryType::Regular) {
            continue;
        }
        if (now - info.value().modified_at < max_age) {
            continue;
        }

        std::error_code remove_ec;
        if (fs::remove(entry, remove_ec)) {
            ++removed;
            spdlog::info("[Transfer] removed orphaned temp file path={}", entry.string());
        } else if (remove_ec) {
            spdlog::warn("[Transfer] cannot remove orphaned temp file path={} error={}", entry.string(), remove_ec.message());
        }
    }
    if (ec) {
        spdlog::warn("[Transfer] orphan scan interrupted root={} error={}", root.string(), ec.message());
    }

    return Ok(removed);
}

} // namespace ingest::transfer
