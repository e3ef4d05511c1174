#include "ingest/path/path_resolver.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

namespace ingest::path {
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kIllegalCharacters = "<>:\"/\\|?*";
constexpr const char* kUnnamedFile = "unnamed_file";
constexpr const char* kUnknownDevice = "Unknown Device";

void replace_all(std::string& text, std::string_view token, std::string_view replacement) {
    if (token.empty()) {
        return;
    }
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
}

std::vector<std::string> split_folders(const std::string& rendered) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : rendered) {
        if (c == '/' || c == '\\') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string trim_separators(std::string text) {
    const auto is_sep = [](char c) { return c == '_' || c == '-' || c == ' '; };
    while (!text.empty() && is_sep(text.front())) {
        text.erase(text.begin());
    }
    while (!text.empty() && is_sep(text.back())) {
        text.pop_back();
    }
    return text;
}

} // namespace

std::string sanitize_component(std::string_view name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (char c : name) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
            continue;
        }
        if (kIllegalCharacters.find(c) != std::string_view::npos) {
            continue;
        }
        cleaned.push_back(c);
    }

    while (!cleaned.empty() && cleaned.front() == ' ') {
        cleaned.erase(cleaned.begin());
    }
    while (!cleaned.empty() && (cleaned.back() == ' ' || cleaned.back() == '.')) {
        cleaned.pop_back();
    }
    return cleaned;
}

fs::path normalize_root(const fs::path& root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        absolute = fs::path("/") / root.relative_path();
    }
    absolute = absolute.lexically_normal();
    if (absolute.has_relative_path() && !absolute.has_filename()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

bool is_strict_descendant(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (root_it->empty()) {
            continue;
        }
        if (candidate_it == candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }

    bool has_more = false;
    for (; candidate_it != candidate.end(); ++candidate_it) {
        const auto& part = *candidate_it;
        if (part == "..") {
            return false;
        }
        if (!part.empty() && part != ".") {
            has_more = true;
        }
    }
    return has_more;
}

std::string format_time(TimePoint time, const std::string& format) {
    const std::time_t raw = Clock::to_time_t(time);
    std::tm local{};
    localtime_r(&raw, &local);
    std::ostringstream out;
    out << std::put_time(&local, format.c_str());
    return out.str();
}

std::optional<fs::path> unique_destination(const fs::path& desired,
                                           const std::function<bool(const fs::path&)>& exists,
                                           std::size_t max_attempts) {
    if (!exists(desired)) {
        return desired;
    }

    const auto parent = desired.parent_path();
    const auto stem = desired.stem().string();
    const auto extension = desired.extension().string();
    for (std::size_t counter = 1; counter <= max_attempts; ++counter) {
        fs::path candidate = parent / (stem + "_" + std::to_string(counter) + extension);
        if (!exists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

PathResolver::PathResolver(PathConfig config, ClockFn clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {}

ResolvedPath PathResolver::resolve(const SourceFile& source,
                                   const fs::path& destination_root,
                                   const std::optional<std::string>& device_name) const {
    const fs::path root = normalize_root(destination_root);
    const TimePoint stamp = source.created_at.value_or(source.modified_at.value_or(clock_()));

    fs::path relative = relative_directory(source);

    if (config_.create_date_folders) {
        for (const auto& part : split_folders(format_time(stamp, config_.date_folder_format))) {
            const auto folder = sanitize_component(part);
            if (!folder.empty()) {
                relative /= folder;
            }
        }
    }

    if (config_.create_device_folders && device_name) {
        std::string rendered = config_.device_folder_template;
        replace_all(rendered, "{device_name}", *device_name);
        auto folder = sanitize_component(rendered);
        if (folder.empty()) {
            folder = kUnknownDevice;
        }
        relative /= folder;
    }

    const std::string name = file_name_for(source, stamp);

    fs::path directory = (root / relative).lexically_normal();
    if (directory.has_relative_path() && !directory.has_filename()) {
        directory = directory.parent_path();
    }
    fs::path destination = (directory / name).lexically_normal();

    if (!is_strict_descendant(root, destination)) {
        directory = root;
        destination = root / name;
    }

    return ResolvedPath{directory, name, destination};
}

fs::path PathResolver::relative_directory(const SourceFile& source) const {
    if (!config_.keep_folder_structure || source.source_root.empty()) {
        return {};
    }

    const fs::path relative = source.path.lexically_normal()
        .lexically_relative(source.source_root.lexically_normal())
        .parent_path();

    fs::path cleaned;
    for (const auto& part : relative) {
        if (part == "..") {
            // Source escaped its root: flatten rather than mirror the escape.
            return {};
        }
        const auto folder = sanitize_component(part.string());
        if (!folder.empty()) {
            cleaned /= folder;
        }
    }
    return cleaned;
}

std::string PathResolver::file_name_for(const SourceFile& source, TimePoint stamp) const {
    const fs::path original = source.path.filename();
    std::string stem = original.stem().string();
    std::string extension = sanitize_component(original.extension().string());
    if (original == "." || original == "..") {
        stem.clear();
        extension.clear();
    }

    std::string name;
    if (config_.add_timestamp_to_filename) {
        std::string rendered = config_.filename_template;
        replace_all(rendered, "{original}", config_.keep_original_filename ? stem : std::string());
        replace_all(rendered, "{timestamp}", format_time(stamp, config_.timestamp_format));
        name = trim_separators(sanitize_component(rendered));
    } else {
        name = sanitize_component(stem);
    }

    if (name.empty()) {
        name = kUnnamedFile;
    }
    if (!extension.empty() && extension != ".") {
        name += extension;
    }

    name = sanitize_component(name);
    return name.empty() ? std::string(kUnnamedFile) : name;
}

} // namespace ingest::path
