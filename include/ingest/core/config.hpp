#pragma once

#include "ingest/core/result.hpp"
#include "ingest/core/retry.hpp"
#include "ingest/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace ingest {

inline constexpr std::uint64_t kKiB = 1024ULL;
inline constexpr std::uint64_t kMiB = 1024ULL * kKiB;
inline constexpr std::uint64_t kGiB = 1024ULL * kMiB;

inline constexpr std::size_t kMinBufferSize = 1024;
inline constexpr std::size_t kMaxBufferSize = 10 * 1024 * 1024;
inline constexpr std::size_t kMinConcurrency = 1;
inline constexpr std::size_t kMaxConcurrency = 10;
inline constexpr std::size_t kMaxFilesPerTransfer = 100000;

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    std::string file;                       ///< Empty disables the file sink
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

/**
 * @brief Naming and folder layout rules consumed by PathResolver
 *
 * Formats use strftime tokens (%Y %m %d %H %M %S).
 */
struct PathConfig {
    bool keep_folder_structure = false;
    bool create_date_folders = false;
    std::string date_folder_format = "%Y/%m/%d";
    bool create_device_folders = false;
    std::string device_folder_template = "{device_name}";
    bool add_timestamp_to_filename = false;
    bool keep_original_filename = true;
    std::string filename_template = "{original}_{timestamp}";
    std::string timestamp_format = "%Y%m%d_%H%M%S";
};

/**
 * @brief One size class of the transfer engine
 *
 * Files smaller than max_file_size fall into this tier; the last tier
 * catches everything else.
 */
struct BufferTier {
    std::string name;
    std::uint64_t max_file_size = std::numeric_limits<std::uint64_t>::max();
    std::size_t buffer_size = 1024 * 1024;
    std::chrono::milliseconds progress_interval{200};
    std::size_t concurrency = 3;
};

std::vector<BufferTier> default_buffer_tiers();

struct IngestConfig {
    std::vector<std::string> media_extensions;
    bool transfer_only_media_files = false;

    PathConfig path;

    ConflictPolicy conflict_policy = ConflictPolicy::Ask;
    bool verify_checksums = true;
    bool generate_manifest = false;

    std::vector<BufferTier> buffer_tiers = default_buffer_tiers();
    std::size_t max_concurrency = 3;
    std::chrono::milliseconds progress_interval{100};
    double space_margin = 0.10;
    std::chrono::milliseconds poll_interval{2000};
    RetryPolicy retry;
    std::size_t history_retention_days = 30;
    std::chrono::hours orphan_max_age{24};

    LoggingConfig logging;

    IngestConfig();
};

std::vector<std::string> default_media_extensions();

/// Picks the tier for a file of @p size bytes. @p tiers must not be empty.
const BufferTier& select_tier(const std::vector<BufferTier>& tiers, std::uint64_t size);

Result<void> validate_config(const IngestConfig& config);

/// Reads a partial document; keys that are absent keep their defaults.
Result<IngestConfig> config_from_json(const nlohmann::json& document);
nlohmann::json config_to_json(const IngestConfig& config);

Result<IngestConfig> load_config(const std::filesystem::path& path);
Result<void> save_config(const IngestConfig& config, const std::filesystem::path& path);

} // namespace ingest
