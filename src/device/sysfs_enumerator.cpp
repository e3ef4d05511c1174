#include "ingest/device/device_enumerator.hpp"

#include <spdlog/spdlog.h>

#include <sys/statvfs.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace ingest::device {
namespace fs = std::filesystem;

namespace {

const std::unordered_set<std::string>& system_mount_points() {
    static const std::unordered_set<std::string> points = {
        "/", "/boot", "/boot/efi", "/usr", "/var"
    };
    return points;
}

std::string trim(std::string text) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
    text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
    return text;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

bool is_pseudo_filesystem(const std::string& fstype) {
    static const std::unordered_set<std::string> pseudo = {
        "proc", "sysfs", "devtmpfs", "devpts", "tmpfs", "cgroup", "cgroup2", "pstore",
        "securityfs", "bpf", "autofs", "mqueue", "hugetlbfs", "configfs", "debugfs",
        "tracefs", "nsfs", "ramfs", "fusectl", "fuse.portal", "overlay", "squashfs",
        "efivarfs", "binfmt_misc", "rpc_pipefs"
    };
    return pseudo.count(fstype) != 0;
}

std::string unescape_mount_field(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string octal = field.substr(i + 1, 3);
            if (std::all_of(octal.begin(), octal.end(), [](char c) { return c >= '0' && c <= '7'; })) {
                out.push_back(static_cast<char>(std::stoi(octal, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

SysfsDeviceEnumerator::SysfsDeviceEnumerator(fs::path mounts_file, fs::path sys_block)
    : mounts_file_(std::move(mounts_file)),
      sys_block_(std::move(sys_block)) {}

Result<std::vector<Device>> SysfsDeviceEnumerator::list_devices() {
    std::ifstream mounts(mounts_file_);
    if (!mounts) {
        return Err<std::vector<Device>>(ErrorCode::Io, "Failed to read " + mounts_file_.string());
    }

    // Keyed by device node so bind mounts fold into one Device, in a
    // stable order for diffing.
    std::map<std::string, Device> by_node;

    std::string line;
    while (std::getline(mounts, line)) {
        if (line.empty()) continue;
        std::istringstream ls(line);
        std::string node, mount_point, fstype, options;
        if (!(ls >> node >> mount_point >> fstype >> options)) continue;
        if (is_pseudo_filesystem(fstype)) continue;
        if (node.rfind("/dev/", 0) != 0) continue;
        if (node.rfind("/dev/loop", 0) == 0 || node.rfind("/dev/ram", 0) == 0) continue;

        mount_point = unescape_mount_field(mount_point);

        auto [it, inserted] = by_node.try_emplace(node);
        Device& device = it->second;
        if (inserted) {
            const std::string partition = fs::path(node).filename().string();
            const std::string disk = owning_disk(partition);

            device.id = partition;
            device.device_path = node;
            device.filesystem = fstype;
            device.removable = read_attribute(disk, "removable") == "1";
            device.vendor = read_attribute(disk, "device/vendor");
            device.model = read_attribute(disk, "device/model");
            device.bus_class = bus_class_of(disk);

            struct statvfs vfs{};
            if (::statvfs(mount_point.c_str(), &vfs) == 0) {
                device.capacity_bytes = static_cast<std::uint64_t>(vfs.f_blocks) * vfs.f_frsize;
                device.free_bytes = static_cast<std::uint64_t>(vfs.f_bavail) * vfs.f_frsize;
            } else {
                const auto sectors = read_attribute(disk, "size");
                if (!sectors.empty() && std::all_of(sectors.begin(), sectors.end(),
                                                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
                    device.capacity_bytes = std::stoull(sectors) * 512ULL;
                }
            }

            const std::string label = trim(device.vendor + " " + device.model);
            device.display_name = label.empty()
                ? fs::path(mount_point).filename().string()
                : label;
            if (device.display_name.empty()) {
                device.display_name = partition;
            }
        }

        device.mount_points.emplace_back(mount_point);
        if (system_mount_points().count(mount_point) != 0) {
            device.is_system = true;
        }
    }

    std::vector<Device> devices;
    devices.reserve(by_node.size());
    for (auto& [node, device] : by_node) {
        devices.push_back(std::move(device));
    }
    spdlog::trace("[Devices] enumerated count={}", devices.size());
    return Ok(std::move(devices));
}

std::string SysfsDeviceEnumerator::owning_disk(const std::string& partition) const {
    std::error_code ec;
    if (fs::exists(sys_block_ / partition, ec)) {
        return partition;
    }

    // sdb1 -> sdb, nvme0n1p2 -> nvme0n1, mmcblk0p1 -> mmcblk0
    std::string disk = partition;
    while (!disk.empty() && std::isdigit(static_cast<unsigned char>(disk.back()))) {
        disk.pop_back();
    }
    if (disk.size() > 1 && disk.back() == 'p'
        && std::isdigit(static_cast<unsigned char>(disk[disk.size() - 2]))) {
        disk.pop_back();
    }
    if (!disk.empty() && fs::exists(sys_block_ / disk, ec)) {
        return disk;
    }
    return partition;
}

BusClass SysfsDeviceEnumerator::bus_class_of(const std::string& disk) const {
    std::error_code ec;
    const fs::path resolved = fs::canonical(sys_block_ / disk, ec);
    const std::string sys_path = ec ? std::string() : resolved.string();

    if (contains(sys_path, "/usb")) return BusClass::Usb;
    if (disk.rfind("mmcblk", 0) == 0 || contains(sys_path, "/mmc")) return BusClass::SdCard;
    if (disk.rfind("nvme", 0) == 0 || contains(sys_path, "/nvme")) return BusClass::Nvme;
    if (contains(sys_path, "/ata")) return BusClass::Sata;
    if (contains(sys_path, "/virtio") || contains(sys_path, "/virtual/")) return BusClass::Virtual;
    if (contains(sys_path, "/host") && contains(sys_path, "/target")) return BusClass::Scsi;
    return BusClass::Unknown;
}

std::string SysfsDeviceEnumerator::read_attribute(const std::string& disk, const std::string& attribute) const {
    std::ifstream in(sys_block_ / disk / attribute);
    if (!in) {
        return {};
    }
    std::string value;
    std::getline(in, value);
    return trim(value);
}

} // namespace ingest::device
