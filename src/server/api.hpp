/**
 * @file api.hpp
 * @brief REST routes under /api/v1 plus the two push streams.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "device/device_catalog.hpp"
#include "device/device_selector.hpp"
#include "model/model_builder.hpp"
#include "model/unit_registry.hpp"
#include "server/connection_hub.hpp"
#include "server/router.hpp"
#include "training/job_coordinator.hpp"

#include <filesystem>

namespace archetype {

inline constexpr std::string_view kServiceName = "archetype";
inline constexpr std::string_view kServiceVersion = "1.0.0";
inline constexpr std::string_view kApiPrefix = "/api/v1";

/**
 * @brief The components a request may touch. All references outlive the router.
 */
struct ApiServices {
    const Config& config;
    DeviceCatalog& catalog;
    DeviceSelector& selector;
    ModelBuilderRegistry& builders;
    UnitRegistry& units;
    JobCoordinator& jobs;
    ConnectionHub& hub;
    Logger& logger;
    Timestamp started_at = std::chrono::system_clock::now();
    std::filesystem::path proc_root = "/proc";
};

class ApiController {
public:
    explicit ApiController(ApiServices services);

    /// Register every route on @p router.
    void install(Router& router);

private:
    // ── Info ──
    HttpResponse root() const;
    HttpResponse health() const;
    HttpResponse health_detailed() const;

    // ── Devices ──
    HttpResponse list_devices() const;
    HttpResponse discover_devices();
    HttpResponse current_device();
    HttpResponse auto_select();
    HttpResponse set_preference(const HttpRequest& request);
    HttpResponse benchmark(const HttpRequest& request);
    HttpResponse get_device(const std::string& id) const;
    HttpResponse select_device(const std::string& id);

    // ── Plugins ──
    HttpResponse list_plugins() const;
    HttpResponse get_plugin(const std::string& id) const;
    HttpResponse enable_plugin(const std::string& id, bool enabled);

    // ── Models ──
    HttpResponse create_model(const HttpRequest& request);
    HttpResponse list_models(const HttpRequest& request) const;
    HttpResponse get_model(const std::string& id) const;
    HttpResponse update_model(const std::string& id, const HttpRequest& request);
    HttpResponse delete_model(const std::string& id);
    HttpResponse export_model(const std::string& id, const HttpRequest& request);

    // ── Training ──
    HttpResponse start_training(const HttpRequest& request);
    HttpResponse list_trainings(const HttpRequest& request) const;
    HttpResponse training_status(const std::string& id) const;
    HttpResponse delete_training(const std::string& id);
    HttpResponse control_training(const std::string& id, std::string_view action);
    HttpResponse training_metrics(const std::string& id) const;

    // ── Streams ──
    HttpResponse connection_stream();
    HttpResponse training_stream(const std::string& id);

    ApiServices svc_;
};

}  // namespace archetype
