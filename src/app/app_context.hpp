/**
 * @file app_context.hpp
 * @brief AppContext: owns and wires every service component.
 *
 * Construction order is dependency order:
 *   Config → Logger → Telemetry → DeviceCatalog → Engine → DeviceSelector
 *   → Builders → MetadataStore → UnitRegistry → ProgressBroadcaster
 *   → JobCoordinator → ConnectionHub → Router → HttpServer
 *
 * Destruction runs in reverse, after stop() has drained the server and jobs.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "device/device_catalog.hpp"
#include "device/device_selector.hpp"
#include "device/probe.hpp"
#include "engine/numeric_engine.hpp"
#include "model/metadata_store.hpp"
#include "model/model_builder.hpp"
#include "model/unit_registry.hpp"
#include "server/api.hpp"
#include "server/connection_hub.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "telemetry/metrics_collector.hpp"
#include "training/job_coordinator.hpp"
#include "training/progress_broadcaster.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace archetype {

class AppContext {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;          ///< built from config.telemetry when null
        std::unique_ptr<ILogSink> telemetry_sink;    ///< telemetry.ndjson under log_dir when null
        std::optional<std::vector<std::unique_ptr<IDeviceProbe>>> probes;  ///< overrides config.devices
        std::unique_ptr<IDeviceProbe> cpu_probe;
        std::unique_ptr<IMetadataStore> store;       ///< <model_dir>/metadata when null
        std::filesystem::path proc_root = "/proc";
    };

    explicit AppContext(Options opts);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Discover devices, apply the configured preference, restore units, then listen.
    Result<uint16_t> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Accessors ───────────────────────────
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    Logger& logger() noexcept { return logger_; }
    DeviceCatalog& catalog() noexcept { return catalog_; }
    DeviceSelector& selector() noexcept { return selector_; }
    UnitRegistry& units() noexcept { return units_; }
    JobCoordinator& jobs() noexcept { return jobs_; }
    ConnectionHub& hub() noexcept { return hub_; }
    HttpServer& server() noexcept { return server_; }
    MetricsCollector& metrics() noexcept { return metrics_; }

private:
    Config config_;
    Logger logger_;
    MetricsCollector metrics_;

    DeviceCatalog catalog_;
    CpuReferenceEngine engine_;
    DeviceSelector selector_;

    ModelBuilderRegistry builders_;
    std::unique_ptr<IMetadataStore> store_;
    UnitRegistry units_;

    ProgressBroadcaster broadcaster_;
    JobCoordinator jobs_;

    ConnectionHub hub_;
    Router router_;
    ApiController api_;
    HttpServer server_;

    std::atomic<bool> running_{false};
};

/// Build the log sink described by the telemetry section.
[[nodiscard]] std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry);

/// Accelerator probes described by the devices section (mock or system).
[[nodiscard]] std::vector<std::unique_ptr<IDeviceProbe>> make_configured_probes(const DeviceConfig& devices);

}  // namespace archetype
