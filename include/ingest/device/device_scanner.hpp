#pragma once

#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"
#include "ingest/device/device_enumerator.hpp"
#include "ingest/device/removable.hpp"
#include "ingest/events/event_bus.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ingest::device {

/**
 * @brief Case-insensitive extension allowlist
 *
 * Only applied when enabled; a disabled filter accepts every file.
 */
struct ExtensionFilter {
    bool enabled = false;
    std::vector<std::string> extensions;   ///< With leading dot, e.g. ".jpg"

    [[nodiscard]] bool matches(const std::filesystem::path& file) const;

    static ExtensionFilter from_config(const IngestConfig& config);
};

struct ScanOptions {
    std::optional<ExtensionFilter> filter;
    const std::atomic<bool>* cancel = nullptr;   ///< Checked between directories
};

struct ScanResult {
    std::vector<ScannedFile> files;
    std::uint64_t total_size = 0;
    std::size_t file_count = 0;
    std::int64_t scan_time_ms = 0;

    std::size_t skipped_symlinks = 0;
    std::size_t skipped_special = 0;
    std::size_t skipped_duplicates = 0;
    std::size_t filtered_out = 0;
    std::size_t errors = 0;
    bool cancelled = false;
};

/**
 * @brief Enumerates removable devices, scans mount points and watches for
 * hot-plug changes
 *
 * Monitoring polls the enumerator on a single steady_timer driven by a
 * private io_context thread. Detection latency is bounded by the poll
 * interval. The device snapshot lives on that thread only.
 */
class DeviceScanner {
public:
    using DeviceCallback = std::function<void(const Device&)>;

    explicit DeviceScanner(std::shared_ptr<DeviceEnumerator> enumerator = std::make_shared<SysfsDeviceEnumerator>(),
                           RemovablePredicate predicate = default_removable_predicate,
                           events::EventBus* bus = nullptr);
    ~DeviceScanner();

    DeviceScanner(const DeviceScanner&) = delete;
    DeviceScanner& operator=(const DeviceScanner&) = delete;

    Result<std::vector<Device>> list_devices() const;
    Result<std::vector<Device>> list_removable() const;

    /**
     * @brief Iteratively walks @p mount_path for regular files
     *
     * Symlinks and special files are skipped, every (device, inode) pair is
     * visited once, and unreadable entries are logged and counted instead of
     * failing the scan. Only a missing or non-directory root is an error.
     */
    Result<ScanResult> scan(const std::filesystem::path& mount_path, const ScanOptions& options = {}) const;

    /**
     * @brief Starts polling; the current device set becomes the baseline
     *
     * Callbacks run on the polling thread. A remount (same id, different
     * mount points) is reported as on_removed followed by on_added.
     */
    Result<void> start(std::chrono::milliseconds poll_interval,
                       DeviceCallback on_added,
                       DeviceCallback on_removed);

    /// Idempotent; safe to call from inside a callback.
    void stop();

    [[nodiscard]] bool is_monitoring() const noexcept { return monitoring_.load(); }

    void set_removable_predicate(RemovablePredicate predicate);

private:
    void schedule_poll();
    void poll_once();
    void join_poll_thread();

    std::shared_ptr<DeviceEnumerator> enumerator_;
    RemovablePredicate predicate_;
    mutable std::mutex predicate_mutex_;
    events::EventBus* bus_;

    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::thread poll_thread_;
    std::atomic<std::thread::id> poll_thread_id_{};   ///< Set by the poll thread itself
    std::mutex lifecycle_mutex_;
    std::atomic<bool> monitoring_{false};

    std::chrono::milliseconds poll_interval_{2000};
    DeviceCallback on_added_;
    DeviceCallback on_removed_;
    std::map<std::string, Device> snapshot_;
};

} // namespace ingest::device
