/**
 * @file app_context.cpp
 * @brief AppContext wiring and lifecycle.
 */

#include "app/app_context.hpp"
#include "telemetry/json_sink.hpp"

namespace archetype {

namespace {

ProbeEnvironment probe_environment(const DeviceConfig& devices) {
    ProbeEnvironment env;
    env.root = devices.sysfs_root;
    env.nvidia_smi = devices.nvidia_smi;
    env.clinfo = devices.clinfo;
    return env;
}

std::unique_ptr<ILogSink> make_telemetry_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty()) return std::make_unique<NullSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "telemetry",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

}  // anonymous namespace

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty()) return std::make_unique<StdoutSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "archetype",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

std::vector<std::unique_ptr<IDeviceProbe>> make_configured_probes(const DeviceConfig& devices) {
    if (devices.mock) return make_mock_probes();

    ProbeSelection selection;
    selection.native = devices.native_probe;
    selection.vendor_bridge = devices.vendor_bridge_probe;
    selection.open_compute = devices.open_compute_probe;
    selection.unified_memory = devices.unified_memory_probe;
    return make_system_probes(probe_environment(devices), selection);
}

AppContext::AppContext(Options opts)
    : config_(std::move(opts.config))
    , logger_(opts.log_sink ? std::move(opts.log_sink) : make_log_sink(config_.telemetry),
              parse_log_level(config_.telemetry.log_level).value_or(LogLevel::Info))
    , metrics_(opts.telemetry_sink ? std::move(opts.telemetry_sink)
                                   : make_telemetry_sink(config_.telemetry))
    , catalog_(logger_,
               opts.cpu_probe ? std::move(opts.cpu_probe)
                              : std::make_unique<CpuProbe>(probe_environment(config_.devices)),
               &metrics_)
    , selector_(catalog_, engine_, logger_, &metrics_)
    , store_(opts.store ? std::move(opts.store)
                        : std::make_unique<JsonFileMetadataStore>(config_.storage.model_dir / "metadata"))
    , units_(builders_, selector_, engine_, *store_, logger_,
             UnitRegistry::Options{config_.storage.model_dir}, &metrics_)
    , broadcaster_(logger_)
    , jobs_(units_, broadcaster_, logger_,
            JobCoordinator::Options{config_.training.max_concurrent_jobs,
                                    config_.training.default_epochs,
                                    config_.training.default_batch_size,
                                    std::chrono::milliseconds(config_.training.epoch_yield_ms)},
            &metrics_)
    , hub_(broadcaster_, logger_, ConnectionHub::Options{config_.server.max_streams})
    , api_(ApiServices{config_, catalog_, selector_, builders_, units_, jobs_, hub_, logger_,
                       std::chrono::system_clock::now(), opts.proc_root})
    , server_(router_, logger_,
              HttpServer::Options{config_.server.host,
                                  config_.server.port,
                                  config_.server.worker_threads,
                                  config_.server.max_streams,
                                  config_.server.max_request_bytes,
                                  10000,
                                  config_.server.stream_send_timeout_ms}) {
    auto probes = opts.probes ? std::move(*opts.probes) : make_configured_probes(config_.devices);
    for (auto& probe : probes) {
        catalog_.register_probe(std::move(probe));
    }
    api_.install(router_);
}

AppContext::~AppContext() {
    stop();
}

Result<uint16_t> AppContext::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Already running"};
    }

    logger_.info("archetype starting: " + config_.server.host + ":"
                 + std::to_string(config_.server.port));

    auto devices = catalog_.discover();
    logger_.info("Discovered " + std::to_string(devices.size()) + " device(s)");

    auto preference = parse_preference(config_.devices.preference).value_or(DevicePreference::Auto);
    auto selected = selector_.apply_preference(preference);
    if (!selected) {
        logger_.warn("Preference " + std::string{to_string(preference)} + " not satisfiable: "
                     + selected.error().message + "; falling back to auto");
        selected = selector_.auto_select();
    }
    if (selected) {
        logger_.info("Active device: " + selected->id + " (" + selected->name + ")");
    } else {
        logger_.error("No device could be selected: " + selected.error().message);
    }

    auto restored = units_.restore();
    if (restored > 0) {
        logger_.info("Restored " + std::to_string(restored) + " model(s) from "
                     + config_.storage.model_dir.string());
    }

    auto port = server_.listen();
    if (!port) {
        running_ = false;
        return port.error();
    }
    server_.serve();
    logger_.info("HTTP server listening on " + config_.server.host + ":" + std::to_string(*port));
    return *port;
}

void AppContext::stop() {
    bool was_running = running_.exchange(false);
    if (was_running) logger_.info("archetype stopping...");

    hub_.close_all();
    server_.stop();
    jobs_.shutdown();

    metrics_.flush();
    if (was_running) logger_.info("archetype stopped.");
    logger_.flush();
}

}  // namespace archetype
