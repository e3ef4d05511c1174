#pragma once

#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"

#include <filesystem>
#include <string>

namespace ingest::transfer {

/// <destination_root>/ingest_<session-id>.manifest
std::filesystem::path manifest_path_for(const std::filesystem::path& destination_root,
                                        const std::string& session_id);

/**
 * @brief Writes the plain-text checksum ledger of a session
 *
 * Format: '#' header lines, then one line per complete file:
 *   <path relative to destination root>\t<checksum>\t<size>
 * Files copied without verification carry "-" as checksum. Written to a
 * temp file and renamed into place.
 */
Result<std::filesystem::path> write_manifest(const TransferSession& session,
                                             TimePoint generated_at = Clock::now());

} // namespace ingest::transfer
