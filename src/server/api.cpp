/**
 * @file api.cpp
 * @brief ApiController route handlers.
 */

#include "server/api.hpp"
#include "device/host_files.hpp"

#include <algorithm>
#include <charconv>
#include <thread>

namespace archetype {

namespace {

HttpResponse ok(const nlohmann::json& body) {
    return HttpResponse::json(200, body);
}

HttpResponse bad_request(std::string_view message) {
    return HttpResponse::error(400, to_string(ErrorCode::InvalidArgument), message);
}

/// Required string member of a JSON object body.
Result<std::string> require_string(const nlohmann::json& body, const char* key) {
    if (!body.is_object() || !body.contains(key) || !body.at(key).is_string()) {
        return Error{ErrorCode::InvalidArgument, std::string{"Field '"} + key + "' must be a string"};
    }
    return body.at(key).get<std::string>();
}

/// Optional object member; absent or null reads as @p fallback.
Result<nlohmann::json> optional_object(const nlohmann::json& body, const char* key,
                                       nlohmann::json fallback) {
    if (!body.contains(key) || body.at(key).is_null()) return fallback;
    if (!body.at(key).is_object()) {
        return Error{ErrorCode::InvalidArgument, std::string{"Field '"} + key + "' must be an object"};
    }
    return body.at(key);
}

Result<size_t> query_uint(const HttpRequest& request, const char* key, size_t fallback) {
    auto raw = request.query_param(key);
    if (!raw) return fallback;
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return Error{ErrorCode::InvalidArgument, std::string{"Query parameter '"} + key
                                                 + "' must be a non-negative integer"};
    }
    return value;
}

nlohmann::json device_list_json(const std::vector<Device>& devices) {
    auto arr = nlohmann::json::array();
    for (const auto& d : devices) arr.push_back(d);
    return arr;
}

}  // anonymous namespace

ApiController::ApiController(ApiServices services) : svc_(std::move(services)) {}

void ApiController::install(Router& router) {
    const std::string p{kApiPrefix};

    router.add("GET", "/", [this](const HttpRequest&, const PathParams&) { return root(); });
    router.add("GET", p + "/health", [this](const HttpRequest&, const PathParams&) { return health(); });
    router.add("GET", p + "/health/detailed",
               [this](const HttpRequest&, const PathParams&) { return health_detailed(); });

    // Literal device routes come before /devices/{id}
    router.add("GET", p + "/devices",
               [this](const HttpRequest&, const PathParams&) { return list_devices(); });
    router.add("POST", p + "/devices/discover",
               [this](const HttpRequest&, const PathParams&) { return discover_devices(); });
    router.add("GET", p + "/devices/current",
               [this](const HttpRequest&, const PathParams&) { return current_device(); });
    router.add("POST", p + "/devices/auto-select",
               [this](const HttpRequest&, const PathParams&) { return auto_select(); });
    router.add("POST", p + "/devices/preference",
               [this](const HttpRequest& r, const PathParams&) { return set_preference(r); });
    router.add("GET", p + "/devices/benchmark",
               [this](const HttpRequest& r, const PathParams&) { return benchmark(r); });
    router.add("GET", p + "/devices/{id}",
               [this](const HttpRequest&, const PathParams& a) { return get_device(a.at("id")); });
    router.add("POST", p + "/devices/{id}/select",
               [this](const HttpRequest&, const PathParams& a) { return select_device(a.at("id")); });

    router.add("GET", p + "/plugins",
               [this](const HttpRequest&, const PathParams&) { return list_plugins(); });
    router.add("GET", p + "/plugins/{id}",
               [this](const HttpRequest&, const PathParams& a) { return get_plugin(a.at("id")); });
    router.add("POST", p + "/plugins/{id}/enable",
               [this](const HttpRequest&, const PathParams& a) { return enable_plugin(a.at("id"), true); });
    router.add("POST", p + "/plugins/{id}/disable",
               [this](const HttpRequest&, const PathParams& a) { return enable_plugin(a.at("id"), false); });

    router.add("POST", p + "/models",
               [this](const HttpRequest& r, const PathParams&) { return create_model(r); });
    router.add("GET", p + "/models",
               [this](const HttpRequest& r, const PathParams&) { return list_models(r); });
    router.add("GET", p + "/models/{id}",
               [this](const HttpRequest&, const PathParams& a) { return get_model(a.at("id")); });
    router.add("PUT", p + "/models/{id}",
               [this](const HttpRequest& r, const PathParams& a) { return update_model(a.at("id"), r); });
    router.add("DELETE", p + "/models/{id}",
               [this](const HttpRequest&, const PathParams& a) { return delete_model(a.at("id")); });
    router.add("POST", p + "/models/{id}/export",
               [this](const HttpRequest& r, const PathParams& a) { return export_model(a.at("id"), r); });

    router.add("POST", p + "/training/start",
               [this](const HttpRequest& r, const PathParams&) { return start_training(r); });
    router.add("GET", p + "/training",
               [this](const HttpRequest& r, const PathParams&) { return list_trainings(r); });
    router.add("GET", p + "/training/{id}",
               [this](const HttpRequest&, const PathParams& a) { return training_status(a.at("id")); });
    router.add("DELETE", p + "/training/{id}",
               [this](const HttpRequest&, const PathParams& a) { return delete_training(a.at("id")); });
    for (std::string_view action : {"stop", "pause", "resume"}) {
        router.add("POST", p + "/training/{id}/" + std::string{action},
                   [this, action](const HttpRequest&, const PathParams& a) {
                       return control_training(a.at("id"), action);
                   });
    }
    router.add("GET", p + "/training/{id}/metrics",
               [this](const HttpRequest&, const PathParams& a) { return training_metrics(a.at("id")); });

    router.add("GET", "/ws", [this](const HttpRequest&, const PathParams&) { return connection_stream(); });
    router.add("GET", "/ws/training/{id}",
               [this](const HttpRequest&, const PathParams& a) { return training_stream(a.at("id")); });
}

// ─────────────────────────────────────────────
// Info
// ─────────────────────────────────────────────

HttpResponse ApiController::root() const {
    return ok({
        {"name", std::string{kServiceName}},
        {"version", std::string{kServiceVersion}},
        {"status", "running"},
        {"health", std::string{kApiPrefix} + "/health"},
        {"websocket", "/ws"}
    });
}

HttpResponse ApiController::health() const {
    auto now = std::chrono::system_clock::now();
    auto devices = svc_.catalog.list_all();
    size_t gpu_count = 0;
    for (const auto& d : devices) {
        if (!d.is_cpu()) ++gpu_count;
    }

    double memory_percent = 0.0;
    if (auto mem = host::parse_meminfo(svc_.proc_root / "meminfo"); mem && mem->total_kb > 0) {
        memory_percent = 100.0 * static_cast<double>(mem->total_kb - std::min(mem->available_kb, mem->total_kb))
                       / static_cast<double>(mem->total_kb);
    }

    // Two /proc/stat samples 100 ms apart
    double cpu_percent = 0.0;
    if (auto before = host::read_cpu_times(svc_.proc_root / "stat")) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (auto after = host::read_cpu_times(svc_.proc_root / "stat")) {
            cpu_percent = host::cpu_busy_percent(*before, *after);
        }
    }

    return ok({
        {"status", "healthy"},
        {"version", std::string{kServiceVersion}},
        {"uptime", std::chrono::duration<double>(now - svc_.started_at).count()},
        {"timestamp", format_iso8601(now)},
        {"gpu_available", gpu_count > 0},
        {"gpu_count", gpu_count},
        {"memory_usage_percent", memory_percent},
        {"cpu_usage_percent", cpu_percent}
    });
}

HttpResponse ApiController::health_detailed() const {
    auto current = svc_.selector.current();
    auto jobs = svc_.jobs.list();
    size_t enabled = 0;
    auto plugins = svc_.builders.list();
    for (const auto& m : plugins) {
        if (m.enabled) ++enabled;
    }

    nlohmann::json device_component{
        {"initialized", !svc_.catalog.empty()},
        {"device_count", svc_.catalog.list_all().size()},
        {"probe_count", svc_.catalog.probe_count()},
        {"device", current ? nlohmann::json(current->id) : nlohmann::json()}
    };
    return ok({
        {"status", "healthy"},
        {"components", {
            {"device_manager", device_component},
            {"model_registry", {{"initialized", true}, {"active_models", svc_.units.count()}}},
            {"training_engine", {{"initialized", true},
                                 {"active_trainings", svc_.jobs.active_count()},
                                 {"total_trainings", jobs.size()}}},
            {"plugin_manager", {{"loaded_plugins", plugins.size()}, {"enabled_plugins", enabled}}},
            {"streams", {{"active", svc_.hub.active_streams()}}}
        }}
    });
}

// ─────────────────────────────────────────────
// Devices
// ─────────────────────────────────────────────

HttpResponse ApiController::list_devices() const {
    auto devices = svc_.catalog.list_all();
    auto current = svc_.selector.current();
    auto preference = svc_.selector.active_preference();
    return ok({
        {"devices", device_list_json(devices)},
        {"current_device", current ? nlohmann::json(current->id) : nlohmann::json()},
        {"preference", preference ? nlohmann::json(std::string{to_string(*preference)}) : nlohmann::json()},
        {"total_devices", devices.size()}
    });
}

HttpResponse ApiController::discover_devices() {
    auto devices = svc_.catalog.discover();
    return ok({{"devices", device_list_json(devices)}, {"total_devices", devices.size()}});
}

HttpResponse ApiController::current_device() {
    auto device = svc_.selector.refresh_current();
    if (!device) return HttpResponse::from_error(device.error());
    return ok(*device);
}

HttpResponse ApiController::auto_select() {
    auto device = svc_.selector.auto_select();
    if (!device) return HttpResponse::from_error(device.error());
    return ok({{"status", "selected"}, {"device_id", device->id}, {"device", *device}});
}

HttpResponse ApiController::set_preference(const HttpRequest& request) {
    auto body = request.json_body();
    if (!body) return HttpResponse::from_error(body.error());
    auto name = require_string(*body, "preference");
    if (!name) return HttpResponse::from_error(name.error());

    auto preference = parse_preference(*name);
    if (!preference) return bad_request("Unknown device preference: " + *name);

    auto device = svc_.selector.apply_preference(*preference);
    if (!device) return HttpResponse::from_error(device.error());
    return ok({
        {"status", "selected"},
        {"preference", std::string{to_string(*preference)}},
        {"device_id", device->id},
        {"device", *device}
    });
}

HttpResponse ApiController::benchmark(const HttpRequest& request) {
    BenchmarkConfig config = svc_.config.benchmark;
    auto size = query_uint(request, "matrix_size", config.matrix_size);
    if (!size) return HttpResponse::from_error(size.error());
    auto iterations = query_uint(request, "iterations", config.iterations);
    if (!iterations) return HttpResponse::from_error(iterations.error());
    if (*size > 4096 || *iterations > 1000) {
        return bad_request("Benchmark limited to matrix_size <= 4096 and iterations <= 1000");
    }
    config.matrix_size = static_cast<uint32_t>(*size);
    config.iterations = static_cast<uint32_t>(*iterations);

    auto report = svc_.selector.benchmark(config);
    if (!report) return HttpResponse::from_error(report.error());
    return ok(*report);
}

HttpResponse ApiController::get_device(const std::string& id) const {
    auto device = svc_.catalog.get(id);
    if (!device) return HttpResponse::from_error(device.error());
    return ok(*device);
}

HttpResponse ApiController::select_device(const std::string& id) {
    auto device = svc_.selector.select_by_id(id);
    if (!device) return HttpResponse::from_error(device.error());
    return ok({{"status", "selected"}, {"device_id", device->id}, {"device", *device}});
}

// ─────────────────────────────────────────────
// Plugins
// ─────────────────────────────────────────────

HttpResponse ApiController::list_plugins() const {
    auto manifests = svc_.builders.list();
    auto arr = nlohmann::json::array();
    for (const auto& m : manifests) arr.push_back(m);
    return ok({{"plugins", arr}, {"total", manifests.size()}});
}

HttpResponse ApiController::get_plugin(const std::string& id) const {
    auto manifest = svc_.builders.get(id);
    if (!manifest) return HttpResponse::from_error(manifest.error());
    return ok(*manifest);
}

HttpResponse ApiController::enable_plugin(const std::string& id, bool enabled) {
    auto manifest = svc_.builders.set_enabled(id, enabled);
    if (!manifest) return HttpResponse::from_error(manifest.error());
    svc_.logger.info(std::string{enabled ? "Enabled" : "Disabled"} + " plugin " + id);
    return ok({{"status", enabled ? "enabled" : "disabled"}, {"plugin_id", id}});
}

// ─────────────────────────────────────────────
// Models
// ─────────────────────────────────────────────

HttpResponse ApiController::create_model(const HttpRequest& request) {
    auto body = request.json_body();
    if (!body) return HttpResponse::from_error(body.error());

    auto name = require_string(*body, "name");
    if (!name) return HttpResponse::from_error(name.error());
    auto type = require_string(*body, "model_type");
    if (!type) return HttpResponse::from_error(type.error());
    auto architecture = optional_object(*body, "architecture", nlohmann::json::object());
    if (!architecture) return HttpResponse::from_error(architecture.error());
    auto hyperparameters = optional_object(*body, "hyperparameters", nlohmann::json::object());
    if (!hyperparameters) return HttpResponse::from_error(hyperparameters.error());

    auto meta = svc_.units.create(*name, *type, *architecture, *hyperparameters);
    if (!meta) return HttpResponse::from_error(meta.error());
    return ok(*meta);
}

HttpResponse ApiController::list_models(const HttpRequest& request) const {
    auto skip = query_uint(request, "skip", 0);
    if (!skip) return HttpResponse::from_error(skip.error());
    auto limit = query_uint(request, "limit", 100);
    if (!limit) return HttpResponse::from_error(limit.error());

    auto arr = nlohmann::json::array();
    for (const auto& meta : svc_.units.list(*skip, *limit)) arr.push_back(meta);
    return ok({{"models", arr}, {"total", svc_.units.count()}});
}

HttpResponse ApiController::get_model(const std::string& id) const {
    auto meta = svc_.units.get(id);
    if (!meta) return HttpResponse::from_error(meta.error());
    return ok(*meta);
}

HttpResponse ApiController::update_model(const std::string& id, const HttpRequest& request) {
    auto body = request.json_body();
    if (!body) return HttpResponse::from_error(body.error());
    auto meta = svc_.units.update(id, *body);
    if (!meta) return HttpResponse::from_error(meta.error());
    return ok({{"status", "updated"}, {"model_id", id}, {"model", *meta}});
}

HttpResponse ApiController::delete_model(const std::string& id) {
    auto removed = svc_.units.remove(id);
    if (!removed) return HttpResponse::from_error(removed.error());
    return ok({{"status", "deleted"}, {"model_id", id}});
}

HttpResponse ApiController::export_model(const std::string& id, const HttpRequest& request) {
    auto format = request.query_param("format");
    if (!format) {
        auto body = request.json_body();
        if (!body) return HttpResponse::from_error(body.error());
        auto from_body = require_string(*body, "format");
        if (!from_body) return bad_request("Export format is required (?format=pt|pth|bin|json)");
        format = *from_body;
    }

    auto path = svc_.units.export_unit(id, *format);
    if (!path) return HttpResponse::from_error(path.error());
    return ok({{"export_path", path->string()}, {"format", *format}});
}

// ─────────────────────────────────────────────
// Training
// ─────────────────────────────────────────────

HttpResponse ApiController::start_training(const HttpRequest& request) {
    auto body = request.json_body();
    if (!body) return HttpResponse::from_error(body.error());

    auto model_id = require_string(*body, "model_id");
    if (!model_id) return HttpResponse::from_error(model_id.error());
    auto dataset = optional_object(*body, "dataset_config", nlohmann::json::object());
    if (!dataset) return HttpResponse::from_error(dataset.error());
    auto training = optional_object(*body, "training_config", nlohmann::json::object());
    if (!training) return HttpResponse::from_error(training.error());
    auto validation = optional_object(*body, "validation_config", nullptr);
    if (!validation) return HttpResponse::from_error(validation.error());

    auto id = svc_.jobs.start(*model_id, *dataset, *training, *validation);
    if (!id) return HttpResponse::from_error(id.error());

    auto status = svc_.jobs.status(*id);
    if (!status) return HttpResponse::from_error(status.error());
    return ok(to_snapshot_json(*status, SnapshotDetail::Summary));
}

HttpResponse ApiController::list_trainings(const HttpRequest& request) const {
    std::optional<JobState> filter;
    if (auto status = request.query_param("status")) {
        filter = parse_job_state(*status);
        if (!filter) return bad_request("Unknown training status: " + *status);
    }

    auto arr = nlohmann::json::array();
    auto jobs = svc_.jobs.list(filter);
    for (const auto& job : jobs) arr.push_back(to_snapshot_json(job, SnapshotDetail::Summary));
    return ok({{"trainings", arr}, {"total", jobs.size()}});
}

HttpResponse ApiController::training_status(const std::string& id) const {
    auto job = svc_.jobs.status(id);
    if (!job) return HttpResponse::from_error(job.error());
    return ok(to_snapshot_json(*job, SnapshotDetail::Full));
}

HttpResponse ApiController::delete_training(const std::string& id) {
    auto removed = svc_.jobs.remove(id);
    if (!removed) return HttpResponse::from_error(removed.error());
    return ok({{"status", "deleted"}, {"training_id", id}});
}

HttpResponse ApiController::control_training(const std::string& id, std::string_view action) {
    Result<void> result;
    std::string_view outcome;
    if (action == "stop") {
        result = svc_.jobs.stop(id);
        outcome = "stopped";
    } else if (action == "pause") {
        result = svc_.jobs.pause(id);
        outcome = "paused";
    } else {
        result = svc_.jobs.resume(id);
        outcome = "resumed";
    }
    if (!result) return HttpResponse::from_error(result.error());
    return ok({{"status", std::string{outcome}}, {"training_id", id}});
}

HttpResponse ApiController::training_metrics(const std::string& id) const {
    auto metrics = svc_.jobs.metrics(id);
    if (!metrics) return HttpResponse::from_error(metrics.error());
    return ok(*metrics);
}

// ─────────────────────────────────────────────
// Streams
// ─────────────────────────────────────────────

HttpResponse ApiController::connection_stream() {
    auto response = svc_.hub.open_connection_stream();
    if (!response) return HttpResponse::from_error(response.error());
    return std::move(*response);
}

HttpResponse ApiController::training_stream(const std::string& id) {
    auto response = svc_.hub.open_job_stream(id);
    if (!response) return HttpResponse::from_error(response.error());
    return std::move(*response);
}

}  // namespace archetype
