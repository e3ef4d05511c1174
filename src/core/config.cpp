#include "ingest/core/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace ingest {
namespace {

using nlohmann::json;

template<typename T>
void read_if_present(const json& node, const char* key, T& target) {
    if (node.contains(key)) {
        target = node.at(key).get<T>();
    }
}

void read_millis(const json& node, const char* key, std::chrono::milliseconds& target) {
    if (node.contains(key)) {
        target = std::chrono::milliseconds(node.at(key).get<std::int64_t>());
    }
}

PathConfig path_from_json(const json& node, PathConfig path) {
    read_if_present(node, "keep_folder_structure", path.keep_folder_structure);
    read_if_present(node, "create_date_folders", path.create_date_folders);
    read_if_present(node, "date_folder_format", path.date_folder_format);
    read_if_present(node, "create_device_folders", path.create_device_folders);
    read_if_present(node, "device_folder_template", path.device_folder_template);
    read_if_present(node, "add_timestamp_to_filename", path.add_timestamp_to_filename);
    read_if_present(node, "keep_original_filename", path.keep_original_filename);
    read_if_present(node, "filename_template", path.filename_template);
    read_if_present(node, "timestamp_format", path.timestamp_format);
    return path;
}

json path_to_json(const PathConfig& path) {
    return json{
        {"keep_folder_structure", path.keep_folder_structure},
        {"create_date_folders", path.create_date_folders},
        {"date_folder_format", path.date_folder_format},
        {"create_device_folders", path.create_device_folders},
        {"device_folder_template", path.device_folder_template},
        {"add_timestamp_to_filename", path.add_timestamp_to_filename},
        {"keep_original_filename", path.keep_original_filename},
        {"filename_template", path.filename_template},
        {"timestamp_format", path.timestamp_format},
    };
}

BufferTier tier_from_json(const json& node) {
    BufferTier tier;
    read_if_present(node, "name", tier.name);
    read_if_present(node, "max_file_size", tier.max_file_size);
    read_if_present(node, "buffer_size", tier.buffer_size);
    read_millis(node, "progress_interval_ms", tier.progress_interval);
    read_if_present(node, "concurrency", tier.concurrency);
    return tier;
}

json tier_to_json(const BufferTier& tier) {
    return json{
        {"name", tier.name},
        {"max_file_size", tier.max_file_size},
        {"buffer_size", tier.buffer_size},
        {"progress_interval_ms", tier.progress_interval.count()},
        {"concurrency", tier.concurrency},
    };
}

} // namespace

std::vector<BufferTier> default_buffer_tiers() {
    return {
        {"small", 100 * kMiB, 1 * 1024 * 1024, std::chrono::milliseconds(200), 3},
        {"medium", 1 * kGiB, 4 * 1024 * 1024, std::chrono::milliseconds(500), 3},
        {"large", 10 * kGiB, 8 * 1024 * 1024, std::chrono::milliseconds(1000), 2},
        {"xlarge", std::numeric_limits<std::uint64_t>::max(), 10 * 1024 * 1024, std::chrono::milliseconds(2000), 1},
    };
}

std::vector<std::string> default_media_extensions() {
    return {
        ".mp4", ".mov", ".avi", ".mkv", ".m4v", ".mpg", ".mpeg",
        ".jpg", ".jpeg", ".png", ".raw", ".cr2", ".nef", ".arw", ".dng",
        ".wav", ".mp3", ".aac", ".flac", ".m4a",
    };
}

IngestConfig::IngestConfig() : media_extensions(default_media_extensions()) {}

const BufferTier& select_tier(const std::vector<BufferTier>& tiers, std::uint64_t size) {
    for (const auto& tier : tiers) {
        if (size < tier.max_file_size) {
            return tier;
        }
    }
    return tiers.back();
}

Result<void> validate_config(const IngestConfig& config) {
    if (config.buffer_tiers.empty()) {
        return Err<void>(ErrorCode::Validation, "buffer_tiers must not be empty");
    }

    std::uint64_t previous = 0;
    for (const auto& tier : config.buffer_tiers) {
        if (tier.buffer_size < kMinBufferSize || tier.buffer_size > kMaxBufferSize) {
            return Err<void>(ErrorCode::Validation,
                "buffer_size of tier '" + tier.name + "' must be between 1KB and 10MB");
        }
        if (tier.concurrency < kMinConcurrency || tier.concurrency > kMaxConcurrency) {
            return Err<void>(ErrorCode::Validation,
                "concurrency of tier '" + tier.name + "' must be between 1 and 10");
        }
        if (tier.max_file_size <= previous) {
            return Err<void>(ErrorCode::Validation, "buffer tier thresholds must be increasing");
        }
        previous = tier.max_file_size;
    }

    if (config.max_concurrency < kMinConcurrency || config.max_concurrency > kMaxConcurrency) {
        return Err<void>(ErrorCode::Validation, "max_concurrency must be between 1 and 10");
    }
    if (config.progress_interval.count() <= 0 || config.poll_interval.count() <= 0) {
        return Err<void>(ErrorCode::Validation, "intervals must be positive");
    }
    if (config.space_margin < 0.0) {
        return Err<void>(ErrorCode::Validation, "space_margin must not be negative");
    }
    if (config.retry.max_attempts == 0 || config.retry.multiplier < 1.0) {
        return Err<void>(ErrorCode::Validation, "retry policy needs at least one attempt and a multiplier >= 1");
    }
    for (const auto& extension : config.media_extensions) {
        if (extension.size() < 2 || extension.front() != '.') {
            return Err<void>(ErrorCode::Validation, "media extension must start with '.': " + extension);
        }
    }
    return Ok();
}

Result<IngestConfig> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<IngestConfig>(ErrorCode::Validation, "config document must be a JSON object");
    }

    IngestConfig config;
    try {
        read_if_present(document, "media_extensions", config.media_extensions);
        read_if_present(document, "transfer_only_media_files", config.transfer_only_media_files);
        if (document.contains("path")) {
            config.path = path_from_json(document.at("path"), config.path);
        }
        if (document.contains("conflict_policy")) {
            const auto text = document.at("conflict_policy").get<std::string>();
            const auto policy = parse_conflict_policy(text);
            if (!policy) {
                return Err<IngestConfig>(ErrorCode::Validation, "unknown conflict_policy: " + text);
            }
            config.conflict_policy = *policy;
        }
        read_if_present(document, "verify_checksums", config.verify_checksums);
        read_if_present(document, "generate_manifest", config.generate_manifest);
        if (document.contains("buffer_tiers")) {
            config.buffer_tiers.clear();
            for (const auto& node : document.at("buffer_tiers")) {
                config.buffer_tiers.push_back(tier_from_json(node));
            }
        }
        read_if_present(document, "max_concurrency", config.max_concurrency);
        read_millis(document, "progress_interval_ms", config.progress_interval);
        read_if_present(document, "space_margin", config.space_margin);
        read_millis(document, "poll_interval_ms", config.poll_interval);
        if (document.contains("retry")) {
            const auto& retry = document.at("retry");
            read_if_present(retry, "max_attempts", config.retry.max_attempts);
            read_millis(retry, "initial_delay_ms", config.retry.initial_delay);
            read_millis(retry, "max_delay_ms", config.retry.max_delay);
            read_if_present(retry, "multiplier", config.retry.multiplier);
        }
        read_if_present(document, "history_retention_days", config.history_retention_days);
        if (document.contains("orphan_max_age_hours")) {
            config.orphan_max_age = std::chrono::hours(document.at("orphan_max_age_hours").get<std::int64_t>());
        }
        if (document.contains("logging")) {
            const auto& logging = document.at("logging");
            read_if_present(logging, "level", config.logging.level);
            read_if_present(logging, "pattern", config.logging.pattern);
            read_if_present(logging, "file", config.logging.file);
            read_if_present(logging, "max_file_size", config.logging.max_file_size);
            read_if_present(logging, "max_files", config.logging.max_files);
        }
    } catch (const json::exception& e) {
        return Err<IngestConfig>(ErrorCode::Validation, std::string("malformed config: ") + e.what());
    }

    if (auto valid = validate_config(config); valid.is_error()) {
        return Err<IngestConfig>(valid.error());
    }
    return Ok(std::move(config));
}

json config_to_json(const IngestConfig& config) {
    json tiers = json::array();
    for (const auto& tier : config.buffer_tiers) {
        tiers.push_back(tier_to_json(tier));
    }

    return json{
        {"media_extensions", config.media_extensions},
        {"transfer_only_media_files", config.transfer_only_media_files},
        {"path", path_to_json(config.path)},
        {"conflict_policy", to_string(config.conflict_policy)},
        {"verify_checksums", config.verify_checksums},
        {"generate_manifest", config.generate_manifest},
        {"buffer_tiers", tiers},
        {"max_concurrency", config.max_concurrency},
        {"progress_interval_ms", config.progress_interval.count()},
        {"space_margin", config.space_margin},
        {"poll_interval_ms", config.poll_interval.count()},
        {"retry", {
            {"max_attempts", config.retry.max_attempts},
            {"initial_delay_ms", config.retry.initial_delay.count()},
            {"max_delay_ms", config.retry.max_delay.count()},
            {"multiplier", config.retry.multiplier},
        }},
        {"history_retention_days", config.history_retention_days},
        {"orphan_max_age_hours", config.orphan_max_age.count()},
        {"logging", {
            {"level", config.logging.level},
            {"pattern", config.logging.pattern},
            {"file", config.logging.file},
            {"max_file_size", config.logging.max_file_size},
            {"max_files", config.logging.max_files},
        }},
    };
}

Result<IngestConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<IngestConfig>(ErrorCode::NotFound, "Failed to open config file: " + path.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        return Err<IngestConfig>(ErrorCode::Validation,
            "Failed to parse config file " + path.string() + ": " + e.what());
    }

    auto config = config_from_json(document);
    if (config.is_ok()) {
        spdlog::debug("[Config] loaded path={}", path.string());
    }
    return config;
}

Result<void> save_config(const IngestConfig& config, const std::filesystem::path& path) {
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorCode::Io, "Failed to open config file for writing: " + path.string());
    }
    output << config_to_json(config).dump(2) << '\n';
    if (!output) {
        return Err<void>(ErrorCode::Io, "Failed to write config file: " + path.string());
    }
    return Ok();
}

} // namespace ingest
