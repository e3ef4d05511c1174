#include "ingest/device/removable.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ingest::device {
namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool mentions_usb_or_card(const Device& device) {
    const std::string haystack = lowercase(device.display_name + " " + device.vendor + " " + device.model);
    return haystack.find("usb") != std::string::npos
        || haystack.find("card") != std::string::npos;
}

} // namespace

bool default_removable_predicate(const Device& device) {
    if (!device.removable || device.is_system) {
        return false;
    }

    switch (device.bus_class) {
        case BusClass::Sata:
        case BusClass::Ata:
            return false;
        case BusClass::Scsi:
            return mentions_usb_or_card(device);
        default:
            return true;
    }
}

} // namespace ingest::device
