#include "ingest/device/device_scanner.hpp"

#include "ingest/core/file_stat.hpp"

#include <spdlog/spdlog.h>

#include <stack>
#include <system_error>
#include <unordered_set>

namespace ingest::device {
namespace fs = std::filesystem;

Result<ScanResult> DeviceScanner::scan(const fs::path& mount_path, const ScanOptions& options) const {
    const auto started = std::chrono::steady_clock::now();

    const auto root_stat = stat_path(mount_path, true);
    if (root_stat.is_error()) {
        return Err<ScanResult>(ErrorCode::NotFound, "Cannot scan root: " + root_stat.error().message);
    }
    if (root_stat.value().type != EntryType::Directory) {
        return Err<ScanResult>(ErrorCode::Validation, "Scan root is not a directory: " + mount_path.string());
    }

    ScanResult result;
    std::unordered_set<FileIdentity, FileIdentityHash> visited;
    visited.insert(root_stat.value().identity);

    std::stack<fs::path> pending;
    pending.push(mount_path);

    while (!pending.empty()) {
        if (options.cancel != nullptr && options.cancel->load()) {
            result.cancelled = true;
            spdlog::info("[Scan] cancelled root={} files={}", mount_path.string(), result.files.size());
            break;
        }

        const fs::path directory = std::move(pending.top());
        pending.pop();

        std::error_code ec;
        fs::directory_iterator it(directory, ec);
        if (ec) {
            ++result.errors;
            spdlog::warn("[Scan] cannot open directory path={} error={}", directory.string(), ec.message());
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path entry = it->path();

            const auto stat = stat_path(entry);
            if (stat.is_error()) {
                ++result.errors;
                spdlog::warn("[Scan] cannot stat path={} error={}", entry.string(), stat.error().message);
                continue;
            }
            const FileStat& st = stat.value();

            if (st.type == EntryType::Symlink) {
                ++result.skipped_symlinks;
                spdlog::debug("[Scan] skipping symlink path={}", entry.string());
                continue;
            }
            if (st.type == EntryType::Other) {
                ++result.skipped_special;
                spdlog::debug("[Scan] skipping special file path={}", entry.string());
                continue;
            }

            if (!visited.insert(st.identity).second) {
                ++result.skipped_duplicates;
                spdlog::debug("[Scan] already visited path={}", entry.string());
                continue;
            }

            if (st.type == EntryType::Directory) {
                pending.push(entry);
                continue;
            }

            if (options.filter && !options.filter->matches(entry)) {
                ++result.filtered_out;
                continue;
            }

            ScannedFile file;
            file.path = entry;
            file.size_bytes = st.size;
            file.created_at = st.created_at;
            file.modified_at = st.modified_at;
            file.identity = st.identity;

            result.total_size += file.size_bytes;
            result.files.push_back(std::move(file));
        }

        if (ec) {
            ++result.errors;
            spdlog::warn("[Scan] directory listing interrupted path={} error={}", directory.string(), ec.message());
        }
    }

    result.file_count = result.files.size();
    result.scan_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    spdlog::info("[Scan] root={} files={} bytes={} symlinks={} duplicates={} errors={} time={}ms",
                 mount_path.string(), result.file_count, result.total_size, result.skipped_symlinks,
                 result.skipped_duplicates, result.errors, result.scan_time_ms);
    return Ok(std::move(result));
}

} // namespace ingest::device
