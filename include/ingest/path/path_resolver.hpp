#pragma once

#include "ingest/core/config.hpp"
#include "ingest/core/types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ingest::path {

/**
 * @brief What the resolver needs to know about one source file
 */
struct SourceFile {
    std::filesystem::path path;
    std::filesystem::path source_root;   ///< Used when keeping folder structure
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> modified_at;
};

struct ResolvedPath {
    std::filesystem::path directory;
    std::string file_name;
    std::filesystem::path destination_path;
};

/**
 * @brief Maps a source file onto its destination under a root
 *
 * Pure and reentrant: never touches the filesystem. The produced
 * destination_path is always a strict descendant of the normalized
 * destination root, whatever the source path contains.
 *
 * Layout: <root>/<relative dirs>/<date folder>/<device folder>/<file name>
 */
class PathResolver {
public:
    using ClockFn = std::function<TimePoint()>;

    explicit PathResolver(PathConfig config, ClockFn clock = {});

    [[nodiscard]] ResolvedPath resolve(const SourceFile& source,
                                       const std::filesystem::path& destination_root,
                                       const std::optional<std::string>& device_name = std::nullopt) const;

    [[nodiscard]] const PathConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::filesystem::path relative_directory(const SourceFile& source) const;
    [[nodiscard]] std::string file_name_for(const SourceFile& source, TimePoint stamp) const;

    PathConfig config_;
    ClockFn clock_;
};

/// Removes <>:"/\|?* and control characters, and trims spaces and dots.
std::string sanitize_component(std::string_view name);

/// Absolute, lexically normal form without a trailing separator.
std::filesystem::path normalize_root(const std::filesystem::path& root);

/// True when @p candidate lies strictly below @p root (both normalized).
bool is_strict_descendant(const std::filesystem::path& root, const std::filesystem::path& candidate);

/// strftime rendering in local time.
std::string format_time(TimePoint time, const std::string& format);

/**
 * @brief First free "name_N.ext" variant of @p desired
 *
 * @p exists is supplied by the caller so this stays free of filesystem
 * access. Returns @p desired itself when it is free, nullopt when every
 * candidate up to @p max_attempts is taken.
 */
std::optional<std::filesystem::path> unique_destination(const std::filesystem::path& desired,
                                         const std::function<bool(const std::filesystem::path&)>& exists,
                                         std::size_t max_attempts = 10000);

} // namespace ingest::path
