#pragma once

#include "ingest/core/types.hpp"

#include <functional>

namespace ingest::device {

/**
 * @brief Decides whether a device counts as "truly removable" media
 *
 * Bus reporting differs between controllers and platforms, so hosts may
 * replace the default rule set.
 */
using RemovablePredicate = std::function<bool(const Device&)>;

/**
 * @brief Default heuristic
 *
 * Requires the removable flag and a non-system device. SATA/ATA is
 * excluded, SCSI only passes when its name or model mentions USB or Card,
 * and every other bus is accepted. Not authoritative: some card readers
 * present themselves as plain SCSI.
 */
bool default_removable_predicate(const Device& device);

} // namespace ingest::device
