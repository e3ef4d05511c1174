#include "ingest/preflight/preflight_validator.hpp"

#include "ingest/core/file_stat.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <system_error>

namespace ingest::preflight {
namespace fs = std::filesystem;

namespace {

fs::path canonical_or_normal(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return path::normalize_root(path);
    }
    return path::normalize_root(canonical);
}

bool same_second(TimePoint a, TimePoint b) {
    return std::chrono::floor<std::chrono::seconds>(a) == std::chrono::floor<std::chrono::seconds>(b);
}

ValidationResult reject(ValidationResult result, WarningType type, std::string message) {
    result.is_valid = false;
    result.can_proceed = false;
    result.hard_error = message;
    result.warnings.push_back(ValidationWarning{type, std::move(message)});
    return result;
}

} // namespace

Result<std::uint64_t> available_space(const fs::path& path) {
    fs::path existing = path.empty() ? fs::current_path() : fs::absolute(path);
    std::error_code ec;
    while (!fs::exists(existing, ec)) {
        if (!existing.has_relative_path()) {
            break;
        }
        existing = existing.parent_path();
    }

    const fs::space_info info = fs::space(existing, ec);
    if (ec) {
        return Err<std::uint64_t>(ErrorCode::Io,
            "Cannot query free space at " + existing.string() + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(info.available));
}

PreflightValidator::PreflightValidator(path::PathResolver resolver,
                                       double space_margin,
                                       std::size_t max_files,
                                       SpaceQuery space_query)
    : resolver_(std::move(resolver)),
      space_margin_(space_margin),
      max_files_(max_files),
      space_query_(space_query ? std::move(space_query) : SpaceQuery(available_space)) {}

PreflightValidator PreflightValidator::from_config(const IngestConfig& config) {
    return PreflightValidator(path::PathResolver(config.path), config.space_margin);
}

Result<ValidationResult> PreflightValidator::validate(const TransferRequest& request) const {
    ValidationResult result;

    const fs::path source_root = canonical_or_normal(request.source_root);
    const fs::path destination_root = canonical_or_normal(request.destination_root);

    std::error_code ec;
    if (fs::exists(destination_root, ec)) {
        if (!fs::is_directory(destination_root, ec)) {
            return Err<ValidationResult>(ErrorCode::Validation,
                "Destination is not a directory: " + destination_root.string());
        }
        fs::directory_iterator listing(destination_root, ec);
        if (ec) {
            return Err<ValidationResult>(ErrorCode::Permission,
                "Destination is not readable: " + destination_root.string() + ": " + ec.message());
        }
    }

    if (source_root == destination_root) {
        spdlog::info("[Preflight] rejected same directory root={}", source_root.string());
        return Ok(reject(std::move(result), WarningType::SameDirectory,
                         "Source and destination are the same directory"));
    }
    if (path::is_strict_descendant(source_root, destination_root)) {
        spdlog::info("[Preflight] rejected destination={} inside source={}",
                     destination_root.string(), source_root.string());
        return Ok(reject(std::move(result), WarningType::NestedDestInSource,
                         "Destination is inside the source directory"));
    }
    if (path::is_strict_descendant(destination_root, source_root)) {
        spdlog::info("[Preflight] rejected source={} inside destination={}",
                     source_root.string(), destination_root.string());
        return Ok(reject(std::move(result), WarningType::NestedSourceInDest,
                         "Source is inside the destination directory"));
    }

    if (request.files.size() > max_files_) {
        result.is_valid = false;
        result.can_proceed = false;
        result.hard_error = "Too many files in one transfer: " + std::to_string(request.files.size())
                          + " (limit " + std::to_string(max_files_) + ")";
        spdlog::info("[Preflight] {}", *result.hard_error);
        return Ok(std::move(result));
    }

    const std::size_t unreadable = inspect_files(request, result);

    if (!result.conflicts.empty()) {
        result.warnings.push_back(ValidationWarning{WarningType::FileConflicts,
            std::to_string(result.conflicts.size()) + " file(s) already exist at the destination"});
        result.requires_confirmation = request.conflict_policy == ConflictPolicy::Ask;
    }
    if (unreadable > 0) {
        result.warnings.push_back(ValidationWarning{WarningType::UnreadableSources,
            std::to_string(unreadable) + " source file(s) could not be read"});
    }

    auto available = space_query_(request.destination_root);
    if (available.is_error()) {
        return Err<ValidationResult>(available.error());
    }
    result.space_available_bytes = available.value();

    const auto margin = static_cast<std::uint64_t>(
        std::ceil(static_cast<double>(result.space_required_bytes) * space_margin_));
    const std::uint64_t needed = result.space_required_bytes + margin;
    if (result.space_available_bytes < needed) {
        const std::string message = "Not enough free space: need " + std::to_string(needed)
                                  + " bytes, " + std::to_string(result.space_available_bytes) + " available";
        result.can_proceed = false;
        result.hard_error = message;
        result.warnings.push_back(ValidationWarning{WarningType::InsufficientSpace, message});
    }

    spdlog::info("[Preflight] files={} conflicts={} required={} available={} can_proceed={}",
                 request.files.size(), result.conflicts.size(), result.space_required_bytes,
                 result.space_available_bytes, result.can_proceed);
    return Ok(std::move(result));
}

std::size_t PreflightValidator::inspect_files(const TransferRequest& request, ValidationResult& result) const {
    std::size_t unreadable = 0;

    for (const auto& file : request.files) {
        const auto source_stat = stat_path(file.path, true);
        if (source_stat.is_error()) {
            ++unreadable;
            spdlog::warn("[Preflight] cannot stat source path={} error={}",
                         file.path.string(), source_stat.error().message);
        }

        if (file.size_hint) {
            result.space_required_bytes += *file.size_hint;
        } else if (source_stat.is_ok()) {
            result.space_required_bytes += source_stat.value().size;
        }

        path::SourceFile source{file.path, request.source_root, std::nullopt, std::nullopt};
        if (source_stat.is_ok()) {
            source.created_at = source_stat.value().created_at;
            source.modified_at = source_stat.value().modified_at;
        }

        const auto resolved = resolver_.resolve(source, request.destination_root, request.device_name);
        // Anything at the destination counts, dangling symlinks included.
        const auto entry = stat_path(resolved.destination_path);
        if (entry.is_error()) {
            continue;
        }
        const auto target = stat_path(resolved.destination_path, true);
        const FileStat& existing = target.is_ok() ? target.value() : entry.value();

        ConflictInfo conflict;
        conflict.file_name = resolved.file_name;
        conflict.source_path = file.path;
        conflict.destination_path = resolved.destination_path;
        conflict.destination_size = existing.size;
        conflict.destination_mtime = existing.modified_at;
        if (source_stat.is_ok()) {
            conflict.source_size = source_stat.value().size;
            conflict.source_mtime = source_stat.value().modified_at;
        } else if (file.size_hint) {
            conflict.source_size = *file.size_hint;
        }

        const bool identical = source_stat.is_ok()
                            && conflict.source_size == conflict.destination_size
                            && same_second(conflict.source_mtime, conflict.destination_mtime);
        if (identical) {
            conflict.suggested_resolution = ConflictPolicy::Skip;
        } else if (request.conflict_policy == ConflictPolicy::Ask) {
            conflict.suggested_resolution = ConflictPolicy::Rename;
        } else {
            conflict.suggested_resolution = request.conflict_policy;
        }

        result.conflicts.push_back(std::move(conflict));
    }

    return unreadable;
}

} // namespace ingest::preflight
