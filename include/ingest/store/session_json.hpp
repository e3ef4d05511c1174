#pragma once

#include "ingest/core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace ingest {

// nlohmann ADL hooks. Enums are written as their lowercase names and time
// points as nanoseconds since the Unix epoch. from_json throws on unknown
// enum names or missing required keys.

void to_json(nlohmann::json& j, const FileTransferRecord& record);
void from_json(const nlohmann::json& j, FileTransferRecord& record);

void to_json(nlohmann::json& j, const TransferSession& session);
void from_json(const nlohmann::json& j, TransferSession& session);

std::int64_t to_epoch_ns(TimePoint time) noexcept;
TimePoint from_epoch_ns(std::int64_t ns) noexcept;

} // namespace ingest
