#pragma once

#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ingest::device {

/**
 * @brief Source of the current device list
 *
 * DeviceScanner polls whatever implementation it is given; a push-based
 * backend (udev monitor, DiskArbitration) can implement the same call.
 */
class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;

    virtual Result<std::vector<Device>> list_devices() = 0;
};

/**
 * @brief Linux enumerator built on /proc/self/mounts and /sys/block
 *
 * One Device per mounted block device (partition); bind mounts of the same
 * device are folded into its mount_points. Removable flag, vendor, model
 * and bus class come from the owning disk in sysfs.
 */
class SysfsDeviceEnumerator : public DeviceEnumerator {
public:
    explicit SysfsDeviceEnumerator(std::filesystem::path mounts_file = "/proc/self/mounts",
                                   std::filesystem::path sys_block = "/sys/block");

    Result<std::vector<Device>> list_devices() override;

private:
    [[nodiscard]] std::string owning_disk(const std::string& partition) const;
    [[nodiscard]] BusClass bus_class_of(const std::string& disk) const;
    [[nodiscard]] std::string read_attribute(const std::string& disk, const std::string& attribute) const;

    std::filesystem::path mounts_file_;
    std::filesystem::path sys_block_;
};

/// Decodes the octal escapes (\040 for space) used in /proc/self/mounts.
std::string unescape_mount_field(const std::string& field);

bool is_pseudo_filesystem(const std::string& fstype);

} // namespace ingest::device
