#include "ingest/core/config.hpp"
#include "ingest/core/logging.hpp"
#include "ingest/device/device_scanner.hpp"
#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/events/progress_channel.hpp"
#include "ingest/path/path_resolver.hpp"
#include "ingest/preflight/preflight_validator.hpp"
#include "ingest/store/session_store.hpp"
#include "ingest/transfer/transfer_engine.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted.store(true);
    }
}

struct Options {
    std::string command;
    std::optional<fs::path> config_path;
    fs::path source;
    fs::path destination;
    std::optional<std::string> device_name;
    fs::path journal = "ingest_sessions.jsonl";
    std::optional<ingest::ConflictPolicy> policy;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n\n"
              << "Commands:\n"
              << "  devices     List removable devices\n"
              << "  scan        Scan --source for files\n"
              << "  validate    Preflight a copy of --source into --dest\n"
              << "  transfer    Copy --source into --dest\n"
              << "  history     List recorded sessions\n"
              << "  watch       Report devices as they come and go (Ctrl+C to stop)\n\n"
              << "Options:\n"
              << "  --config <file>        JSON configuration\n"
              << "  --source <dir>         Source folder or mount point\n"
              << "  --dest <dir>           Destination root\n"
              << "  --device-name <name>   Name used for device folders\n"
              << "  --journal <file>       Session journal (default: ingest_sessions.jsonl)\n"
              << "  --policy <p>           ask | skip | rename | overwrite\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    if (argc < 2) {
        return std::nullopt;
    }

    Options options;
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            spdlog::error("Missing value for {}", arg);
            return std::nullopt;
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--source") {
            options.source = value;
        } else if (arg == "--dest") {
            options.destination = value;
        } else if (arg == "--device-name") {
            options.device_name = value;
        } else if (arg == "--journal") {
            options.journal = value;
        } else if (arg == "--policy") {
            options.policy = ingest::parse_conflict_policy(value);
            if (!options.policy) {
                spdlog::error("Unknown conflict policy: {}", value);
                return std::nullopt;
            }
        } else {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        }
    }
    return options;
}

int list_devices(ingest::device::DeviceScanner& scanner) {
    auto devices = scanner.list_removable();
    if (devices.is_error()) {
        spdlog::error("Cannot list devices: {}", devices.error().message);
        return 1;
    }
    if (devices.value().empty()) {
        std::cout << "No removable devices\n";
    }
    for (const auto& device : devices.value()) {
        std::cout << device.id << "  " << device.display_name << "  " << ingest::to_string(device.bus_class)
                  << "  " << device.capacity_bytes << " bytes";
        for (const auto& mount : device.mount_points) {
            std::cout << "  " << mount.string();
        }
        std::cout << '\n';
    }
    return 0;
}

std::optional<ingest::device::ScanResult> scan_source(const ingest::device::DeviceScanner& scanner,
                                                      const ingest::IngestConfig& config,
                                                      const fs::path& source) {
    ingest::device::ScanOptions options;
    options.filter = ingest::device::ExtensionFilter::from_config(config);
    options.cancel = &g_interrupted;

    auto scanned = scanner.scan(source, options);
    if (scanned.is_error()) {
        spdlog::error("Scan failed: {}", scanned.error().message);
        return std::nullopt;
    }
    return scanned.value();
}

int print_validation(const ingest::ValidationResult& result) {
    std::cout << "valid=" << result.is_valid << " can_proceed=" << result.can_proceed
              << " confirm=" << result.requires_confirmation
              << " required=" << result.space_required_bytes
              << " available=" << result.space_available_bytes << '\n';
    for (const auto& warning : result.warnings) {
        std::cout << "  [" << ingest::to_string(warning.type) << "] " << warning.message << '\n';
    }
    for (const auto& conflict : result.conflicts) {
        std::cout << "  conflict " << conflict.destination_path.string()
                  << " suggest=" << ingest::to_string(conflict.suggested_resolution) << '\n';
    }
    return result.can_proceed ? 0 : 2;
}

ingest::TransferRequest make_request(const Options& options,
                                     const ingest::IngestConfig& config,
                                     const ingest::device::ScanResult& scan) {
    ingest::TransferRequest request;
    request.source_root = options.source;
    request.destination_root = options.destination;
    request.conflict_policy = options.policy.value_or(config.conflict_policy);
    request.device_name = options.device_name;
    for (const auto& file : scan.files) {
        request.files.push_back(ingest::RequestedFile{file.path, file.size_bytes});
    }
    return request;
}

void drain_progress(ingest::events::ProgressChannel& channel) {
    while (auto message = channel.try_next()) {
        std::visit([](const auto& event) {
            using T = std::decay_t<decltype(event)>;
            if constexpr (std::is_same_v<T, ingest::events::TransferProgressEvent>) {
                std::cout << "\r" << event.completed_count << "/" << event.total_files << " files  "
                          << static_cast<int>(event.percentage) << "%   " << std::flush;
            } else if constexpr (std::is_same_v<T, ingest::events::SessionFinishedEvent>) {
                std::cout << "\nsession " << event.session_id << " " << ingest::to_string(event.status)
                          << ": " << event.completed_files << " complete, " << event.failed_files
                          << " failed, " << event.skipped_files << " skipped\n";
            }
        }, *message);
    }
}

int run_transfer(const Options& options,
                 const ingest::IngestConfig& config,
                 ingest::device::DeviceScanner& scanner,
                 ingest::store::SessionStore& store,
                 ingest::events::EventBus& bus) {
    auto scan = scan_source(scanner, config, options.source);
    if (!scan) {
        return 1;
    }

    const auto validator = ingest::preflight::PreflightValidator::from_config(config);
    auto validation = validator.validate(make_request(options, config, *scan));
    if (validation.is_error()) {
        spdlog::error("Preflight failed: {}", validation.error().message);
        return 1;
    }
    if (!validation.value().can_proceed) {
        return print_validation(validation.value());
    }

    ingest::events::ProgressChannel channel(bus);
    ingest::transfer::TransferEngine engine(config, store, bus);

    ingest::transfer::SessionSpec spec;
    spec.device_name = options.device_name;
    spec.source_root = options.source;
    spec.destination_root = options.destination;
    spec.conflict_policy = options.policy;
    for (const auto& file : scan->files) {
        spec.files.push_back(file.path);
    }
    if (validation.value().requires_confirmation) {
        // Without an interactive prompt, every conflict takes the suggested resolution.
        for (const auto& conflict : validation.value().conflicts) {
            spec.decisions[conflict.source_path.string()] = conflict.suggested_resolution;
        }
    }

    auto started = engine.start(spec);
    if (started.is_error()) {
        spdlog::error("Cannot start transfer: {}", started.error().message);
        return 1;
    }

    bool cancel_sent = false;
    while (!engine.wait_for(std::chrono::milliseconds(100))) {
        drain_progress(channel);
        if (g_interrupted.load() && !cancel_sent) {
            if (auto cancelled = engine.cancel(); cancelled.is_error()) {
                spdlog::warn("Cancel failed: {}", cancelled.error().message);
            }
            cancel_sent = true;
        }
    }
    drain_progress(channel);

    auto session = store.get_session(started.value());
    if (session.is_error()) {
        spdlog::error("Session lookup failed: {}", session.error().message);
        return 1;
    }
    return session.value().status == ingest::SessionStatus::Complete ? 0 : 3;
}

int show_history(const ingest::store::SessionStore& store) {
    for (const auto& session : store.get_all_sessions()) {
        std::cout << session.id << "  " << ingest::to_string(session.status)
                  << "  " << ingest::path::format_time(session.start_time, "%Y-%m-%d %H:%M:%S")
                  << "  " << session.device_name
                  << "  " << session.count_with_status(ingest::FileStatus::Complete) << "/" << session.file_count
                  << " files";
        if (session.retry_of) {
            std::cout << "  (retry of " << *session.retry_of << ")";
        }
        std::cout << '\n';
    }
    const auto stats = store.stats();
    std::cout << stats.sessions << " sessions, " << stats.bytes_transferred << " bytes transferred\n";
    return 0;
}

int watch_devices(ingest::device::DeviceScanner& scanner, const ingest::IngestConfig& config) {
    auto started = scanner.start(
        config.poll_interval,
        [](const ingest::Device& device) { std::cout << "+ " << device.id << "  " << device.display_name << '\n'; },
        [](const ingest::Device& device) { std::cout << "- " << device.id << "  " << device.display_name << '\n'; });
    if (started.is_error()) {
        spdlog::error("Cannot watch devices: {}", started.error().message);
        return 1;
    }
    while (!g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    scanner.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 1;
    }

    ingest::IngestConfig config;
    if (options->config_path) {
        auto loaded = ingest::load_config(*options->config_path);
        if (loaded.is_error()) {
            std::cerr << "Cannot load config: " << loaded.error().message << '\n';
            return 1;
        }
        config = loaded.value();
    }
    if (auto logging = ingest::configure_logging(config.logging); logging.is_error()) {
        std::cerr << "Cannot configure logging: " << logging.error().message << '\n';
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ingest::events::EventBus bus;
    ingest::events::LoggerComponent logger(bus);
    ingest::events::MetricsComponent metrics(bus);
    ingest::device::DeviceScanner scanner(std::make_shared<ingest::device::SysfsDeviceEnumerator>(),
                                          ingest::device::default_removable_predicate, &bus);

    const auto& command = options->command;
    if (command == "devices") {
        return list_devices(scanner);
    }
    if (command == "watch") {
        return watch_devices(scanner, config);
    }

    if (command == "scan" || command == "validate" || command == "transfer") {
        if (options->source.empty()) {
            spdlog::error("--source is required for {}", command);
            return 1;
        }
    }
    if (command == "scan") {
        auto scan = scan_source(scanner, config, options->source);
        if (!scan) {
            return 1;
        }
        for (const auto& file : scan->files) {
            std::cout << file.path.string() << "  " << file.size_bytes << '\n';
        }
        std::cout << scan->file_count << " files, " << scan->total_size << " bytes in "
                  << scan->scan_time_ms << "ms\n";
        return 0;
    }

    if ((command == "validate" || command == "transfer") && options->destination.empty()) {
        spdlog::error("--dest is required for {}", command);
        return 1;
    }
    if (command == "validate") {
        auto scan = scan_source(scanner, config, options->source);
        if (!scan) {
            return 1;
        }
        const auto validator = ingest::preflight::PreflightValidator::from_config(config);
        auto result = validator.validate(make_request(*options, config, *scan));
        if (result.is_error()) {
            spdlog::error("Preflight failed: {}", result.error().message);
            return 1;
        }
        return print_validation(result.value());
    }

    if (command == "transfer" || command == "history") {
        try {
            ingest::store::SessionStore store(options->journal);
            if (store.recovered_sessions() > 0) {
                spdlog::warn("{} interrupted session(s) from a previous run were closed", store.recovered_sessions());
            }

            int code = 0;
            if (command == "transfer") {
                code = run_transfer(*options, config, scanner, store, bus);
                metrics.print_stats();
            } else {
                code = show_history(store);
            }

            const auto cutoff = ingest::Clock::now()
                - std::chrono::hours(24 * static_cast<std::int64_t>(config.history_retention_days));
            auto pruned = store.delete_sessions_older_than(cutoff);
            if (pruned.is_error()) {
                spdlog::warn("History cleanup failed: {}", pruned.error().message);
            }
            return code;
        } catch (const ingest::store::StoreCorruptedError& e) {
            spdlog::error("Session journal is corrupted: {}", e.what());
            return 1;
        } catch (const ingest::store::StoreIoError& e) {
            spdlog::error("Session journal unavailable: {}", e.what());
            return 1;
        }
    }

    print_usage(argv[0]);
    return 1;
}
