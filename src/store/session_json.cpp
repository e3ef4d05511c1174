#include "ingest/store/session_json.hpp"

#include <stdexcept>
#include <string>

namespace ingest {
namespace {

using nlohmann::json;

template<typename Enum, typename Parser>
Enum parse_enum(const json& j, const char* key, Parser parser) {
    const auto text = j.at(key).get<std::string>();
    const auto parsed = parser(text);
    if (!parsed) {
        throw std::invalid_argument(std::string("unknown value '") + text + "' for " + key);
    }
    return *parsed;
}

void put_time(json& j, const char* key, const std::optional<TimePoint>& time) {
    if (time) {
        j[key] = to_epoch_ns(*time);
    }
}

std::optional<TimePoint> get_time(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return from_epoch_ns(it->get<std::int64_t>());
}

template<typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

std::int64_t to_epoch_ns(TimePoint time) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

TimePoint from_epoch_ns(std::int64_t ns) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ns)));
}

void to_json(json& j, const FileTransferRecord& record) {
    j = json{
        {"source_path", record.source_path},
        {"destination_path", record.destination_path},
        {"file_name", record.file_name},
        {"size_bytes", record.size_bytes},
        {"bytes_transferred", record.bytes_transferred},
        {"percentage", record.percentage},
        {"status", to_string(record.status)},
        {"checksum_verified", record.checksum_verified},
        {"error_message", record.error_message}
    };
    if (record.checksum) {
        j["checksum"] = *record.checksum;
    }
    if (record.error_kind) {
        j["error_kind"] = to_string(*record.error_kind);
    }
    put_time(j, "started_at", record.started_at);
    put_time(j, "completed_at", record.completed_at);
}

void from_json(const json& j, FileTransferRecord& record) {
    record.source_path = j.at("source_path").get<std::string>();
    record.destination_path = j.value("destination_path", std::string{});
    record.file_name = j.value("file_name", std::string{});
    record.size_bytes = j.value("size_bytes", std::uint64_t{0});
    record.bytes_transferred = j.value("bytes_transferred", std::uint64_t{0});
    record.percentage = j.value("percentage", 0.0);
    record.status = parse_enum<FileStatus>(j, "status", parse_file_status);
    record.checksum = get_optional<std::string>(j, "checksum");
    record.checksum_verified = j.value("checksum_verified", false);
    record.error_kind.reset();
    if (j.contains("error_kind")) {
        record.error_kind = parse_enum<FileErrorKind>(j, "error_kind", parse_file_error_kind);
    }
    record.error_message = j.value("error_message", std::string{});
    record.started_at = get_time(j, "started_at");
    record.completed_at = get_time(j, "completed_at");
}

void to_json(json& j, const TransferSession& session) {
    j = json{
        {"id", session.id},
        {"device_id", session.device_id},
        {"device_name", session.device_name},
        {"source_root", session.source_root},
        {"destination_root", session.destination_root},
        {"start_time", to_epoch_ns(session.start_time)},
        {"status", to_string(session.status)},
        {"file_count", session.file_count},
        {"total_bytes", session.total_bytes},
        {"files", session.files},
        {"error_message", session.error_message}
    };
    put_time(j, "end_time", session.end_time);
    if (session.retry_of) {
        j["retry_of"] = *session.retry_of;
    }
    if (session.manifest_path) {
        j["manifest_path"] = *session.manifest_path;
    }
}

void from_json(const json& j, TransferSession& session) {
    session.id = j.at("id").get<std::string>();
    session.device_id = j.value("device_id", std::string{});
    session.device_name = j.value("device_name", std::string{});
    session.source_root = j.value("source_root", std::string{});
    session.destination_root = j.value("destination_root", std::string{});
    session.start_time = from_epoch_ns(j.at("start_time").get<std::int64_t>());
    session.end_time = get_time(j, "end_time");
    session.status = parse_enum<SessionStatus>(j, "status", parse_session_status);
    session.files = j.value("files", std::vector<FileTransferRecord>{});
    session.file_count = j.value("file_count", session.files.size());
    session.total_bytes = j.value("total_bytes", std::uint64_t{0});
    session.error_message = j.value("error_message", std::string{});
    session.retry_of = get_optional<std::string>(j, "retry_of");
    session.manifest_path = get_optional<std::string>(j, "manifest_path");
}

} // namespace ingest
