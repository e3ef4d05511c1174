#include "ingest/device/device_scanner.hpp"
#include "ingest/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>

namespace ingest::device {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void invoke_safely(const DeviceScanner::DeviceCallback& callback, const Device& device, const char* what) {
    if (!callback) {
        return;
    }
    try {
        callback(device);
    } catch (const std::exception& e) {
        spdlog::error("[Devices] {} callback threw for id={}: {}", what, device.id, e.what());
    }
}

} // namespace

bool ExtensionFilter::matches(const std::filesystem::path& file) const {
    if (!enabled) {
        return true;
    }
    const std::string extension = lowercase(file.extension().string());
    if (extension.empty()) {
        return false;
    }
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& allowed) { return lowercase(allowed) == extension; });
}

ExtensionFilter ExtensionFilter::from_config(const IngestConfig& config) {
    return ExtensionFilter{config.transfer_only_media_files, config.media_extensions};
}

DeviceScanner::DeviceScanner(std::shared_ptr<DeviceEnumerator> enumerator,
                             RemovablePredicate predicate,
                             events::EventBus* bus)
    : enumerator_(std::move(enumerator)),
      predicate_(predicate ? std::move(predicate) : RemovablePredicate(default_removable_predicate)),
      bus_(bus),
      timer_(io_) {}

DeviceScanner::~DeviceScanner() {
    stop();
    join_poll_thread();
}

Result<std::vector<Device>> DeviceScanner::list_devices() const {
    if (!enumerator_) {
        return Err<std::vector<Device>>(ErrorCode::InvalidState, "No device enumerator configured");
    }
    return enumerator_->list_devices();
}

Result<std::vector<Device>> DeviceScanner::list_removable() const {
    auto all = list_devices();
    if (all.is_error()) {
        return all;
    }

    RemovablePredicate predicate;
    {
        std::lock_guard lock(predicate_mutex_);
        predicate = predicate_;
    }

    std::vector<Device> removable;
    for (auto& device : all.value()) {
        if (predicate(device)) {
            removable.push_back(std::move(device));
        }
    }
    return Ok(std::move(removable));
}

void DeviceScanner::set_removable_predicate(RemovablePredicate predicate) {
    std::lock_guard lock(predicate_mutex_);
    predicate_ = predicate ? std::move(predicate) : RemovablePredicate(default_removable_predicate);
}

Result<void> DeviceScanner::start(std::chrono::milliseconds poll_interval,
                                  DeviceCallback on_added,
                                  DeviceCallback on_removed) {
    std::lock_guard lock(lifecycle_mutex_);
    if (monitoring_.load()) {
        return Err<void>(ErrorCode::InvalidState, "Already monitoring devices");
    }
    if (poll_interval.count() <= 0) {
        return Err<void>(ErrorCode::Validation, "poll interval must be positive");
    }

    join_poll_thread();

    auto baseline = list_removable();
    if (baseline.is_error()) {
        return Err<void>(baseline.error());
    }

    snapshot_.clear();
    for (auto& device : baseline.value()) {
        snapshot_.emplace(device.id, std::move(device));
    }

    poll_interval_ = poll_interval;
    on_added_ = std::move(on_added);
    on_removed_ = std::move(on_removed);

    io_.restart();
    monitoring_.store(true);
    schedule_poll();
    poll_thread_ = std::thread([this]() {
        poll_thread_id_.store(std::this_thread::get_id());
        io_.run();
    });

    spdlog::info("[Devices] monitoring started interval={}ms baseline={}",
                 poll_interval_.count(), snapshot_.size());
    return Ok();
}

void DeviceScanner::stop() {
    const bool on_poll_thread = std::this_thread::get_id() == poll_thread_id_.load();
    if (!monitoring_.exchange(false)) {
        return;
    }

    if (on_poll_thread) {
        // Cannot join ourselves; poll_once() clears the snapshot on its way out.
        timer_.cancel();
        spdlog::info("[Devices] monitoring stopped from callback");
        return;
    }

    std::lock_guard lock(lifecycle_mutex_);
    boost::asio::post(io_, [this]() { timer_.cancel(); });
    join_poll_thread();
    snapshot_.clear();
    on_added_ = nullptr;
    on_removed_ = nullptr;
    spdlog::info("[Devices] monitoring stopped");
}

void DeviceScanner::join_poll_thread() {
    if (poll_thread_.joinable() && std::this_thread::get_id() != poll_thread_id_.load()) {
        poll_thread_.join();
        poll_thread_id_.store(std::thread::id{});
    }
}

void DeviceScanner::schedule_poll() {
    timer_.expires_after(poll_interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !monitoring_.load()) {
            return;
        }
        poll_once();
        if (monitoring_.load()) {
            schedule_poll();
        }
    });
}

void DeviceScanner::poll_once() {
    if (!monitoring_.load()) {
        return;
    }

    auto listed = list_removable();

    // stop() may have run while the enumerator was busy.
    if (!monitoring_.load()) {
        snapshot_.clear();
        return;
    }
    if (listed.is_error()) {
        spdlog::warn("[Devices] poll failed: {}", listed.error().message);
        return;
    }

    std::map<std::string, Device> current;
    for (auto& device : listed.value()) {
        current.emplace(device.id, std::move(device));
    }

    std::vector<Device> removed;
    std::vector<Device> added;
    for (const auto& [id, previous] : snapshot_) {
        const auto it = current.find(id);
        if (it == current.end()) {
            removed.push_back(previous);
        } else if (it->second.mount_points != previous.mount_points) {
            removed.push_back(previous);
            added.push_back(it->second);
        }
    }
    for (const auto& [id, device] : current) {
        if (snapshot_.find(id) == snapshot_.end()) {
            added.push_back(device);
        }
    }

    snapshot_ = std::move(current);

    for (const auto& device : removed) {
        if (!monitoring_.load()) break;
        spdlog::info("[Devices] removed id={} name={}", device.id, device.display_name);
        invoke_safely(on_removed_, device, "removed");
        if (bus_ != nullptr) {
            bus_->emit(events::DeviceRemovedEvent{device});
        }
    }
    for (const auto& device : added) {
        if (!monitoring_.load()) break;
        spdlog::info("[Devices] added id={} name={} mounts={}", device.id, device.display_name,
                     device.mount_points.size());
        invoke_safely(on_added_, device, "added");
        if (bus_ != nullptr) {
            bus_->emit(events::DeviceAddedEvent{device});
        }
    }

    if (!monitoring_.load()) {
        snapshot_.clear();
    }
}

} // namespace ingest::device
