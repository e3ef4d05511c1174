#include "ingest/transfer/manifest.hpp"

#include "ingest/path/path_resolver.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace ingest::transfer {
namespace fs = std::filesystem;

fs::path manifest_path_for(const fs::path& destination_root, const std::string& session_id) {
    return destination_root / ("ingest_" + session_id + ".manifest");
}

Result<fs::path> write_manifest(const TransferSession& session, TimePoint generated_at) {
    const fs::path root(session.destination_root);
    const fs::path target = manifest_path_for(root, session.id);
    fs::path temp = target;
    temp += ".tmp";

    std::size_t listed = 0;
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<fs::path>(ErrorCode::Io, "Cannot create manifest " + temp.string());
        }

        out << "# ingest manifest\n"
            << "# session: " << session.id << '\n'
            << "# device: " << session.device_name << '\n'
            << "# source: " << session.source_root << '\n'
            << "# generated: " << path::format_time(generated_at, "%Y-%m-%dT%H:%M:%S") << '\n'
            << "# checksum: fnv1a64\n";

        for (const auto& record : session.files) {
            if (record.status != FileStatus::Complete) {
                continue;
            }
            const fs::path relative = fs::path(record.destination_path).lexically_relative(root);
            out << (relative.empty() ? record.destination_path : relative.generic_string()) << '\t'
                << record.checksum.value_or("-") << '\t'
                << record.size_bytes << '\n';
            ++listed;
        }

        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(temp, ec);
            return Err<fs::path>(ErrorCode::Io, "Cannot write manifest " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(temp, cleanup);
        return Err<fs::path>(ErrorCode::Io, "Cannot move manifest into place: " + ec.message());
    }

    spdlog::info("[Transfer] manifest written session={} path={} files={}", session.id, target.string(), listed);
    return Ok(target);
}

} // namespace ingest::transfer
