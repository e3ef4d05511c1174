#include "ingest/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace ingest {

Result<void> configure_logging(const LoggingConfig& config) {
    const auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        return Err<void>(ErrorCode::Validation, "unknown log level: " + config.level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            return Err<void>(ErrorCode::Io, std::string("failed to open log file: ") + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("ingest", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(config.pattern);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] level={} file={}", config.level,
                  config.file.empty() ? std::string("<none>") : config.file);
    return Ok();
}

} // namespace ingest
