#include "ingest/core/file_stat.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

#include <cerrno>
#include <cstring>

namespace ingest {
namespace {

constexpr unsigned int kStatxMask = STATX_TYPE | STATX_MODE | STATX_INO | STATX_SIZE
                                  | STATX_MTIME | STATX_BTIME;

TimePoint to_time_point(const struct statx_timestamp& ts) {
    return Clock::from_time_t(static_cast<std::time_t>(ts.tv_sec))
         + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ts.tv_nsec));
}

EntryType type_of(std::uint16_t mode) {
    if (S_ISREG(mode)) return EntryType::Regular;
    if (S_ISDIR(mode)) return EntryType::Directory;
    if (S_ISLNK(mode)) return EntryType::Symlink;
    return EntryType::Other;
}

} // namespace

Error error_from_errno(int error_number, const std::string& context) {
    return Error{to_error_code(classify_errno(error_number)),
                 context + ": " + std::strerror(error_number)};
}

Result<FileStat> stat_path(const std::filesystem::path& path, bool follow_symlinks) {
    struct statx st{};
    const int flags = follow_symlinks ? 0 : AT_SYMLINK_NOFOLLOW;
    if (::statx(AT_FDCWD, path.c_str(), flags, kStatxMask, &st) != 0) {
        return Err<FileStat>(error_from_errno(errno, "stat " + path.string()));
    }

    FileStat info;
    info.type = type_of(st.stx_mode);
    info.size = static_cast<std::uint64_t>(st.stx_size);
    info.mode = static_cast<std::uint32_t>(st.stx_mode & 07777);
    info.modified_at = to_time_point(st.stx_mtime);
    info.created_at = (st.stx_mask & STATX_BTIME) ? to_time_point(st.stx_btime) : info.modified_at;
    info.identity = FileIdentity{
        static_cast<std::uint64_t>(makedev(st.stx_dev_major, st.stx_dev_minor)),
        static_cast<std::uint64_t>(st.stx_ino)
    };
    return Ok(info);
}

} // namespace ingest
