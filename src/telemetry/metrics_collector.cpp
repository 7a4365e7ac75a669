/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace archetype {

namespace {

nlohmann::json event_header(std::string_view event) {
    return nlohmann::json{
        {"event", event},
        {"ts", format_iso8601(std::chrono::system_clock::now())}
    };
}

std::string dump_event(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_discovery(const std::vector<Device>& devices, uint32_t failed_probes) {
    auto j = event_header("device_discovery");
    j["device_count"] = devices.size();
    j["failed_probes"] = failed_probes;
    auto ids = nlohmann::json::array();
    for (const auto& dev : devices) {
        ids.push_back({{"id", dev.id}, {"score", dev.performance_score}});
    }
    j["devices"] = std::move(ids);
    emit(dump_event(j));
}

void MetricsCollector::record_device_selected(const Device& device, std::string_view reason) {
    auto j = event_header("device_selected");
    j["device"] = device.id;
    j["backend"] = to_string(device.backend);
    j["score"] = device.performance_score;
    j["reason"] = reason;
    emit(dump_event(j));
}

void MetricsCollector::record_job_event(const JobId& job, const UnitId& unit,
                                        JobState state, uint32_t epoch) {
    auto j = event_header("job_state_change");
    j["job"] = job;
    j["unit"] = unit;
    j["state"] = to_string(state);
    j["epoch"] = epoch;
    emit(dump_event(j));
}

void MetricsCollector::record_unit_event(const UnitId& unit, std::string_view event_type,
                                         UnitType type) {
    auto j = event_header("unit_" + std::string{event_type});
    j["unit"] = unit;
    j["type"] = to_string(type);
    emit(dump_event(j));
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    auto j = event_header(event);
    j["data"] = nlohmann::json::parse(json_payload, nullptr, false);
    emit(dump_event(j));
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t MetricsCollector::event_count() const {
    std::lock_guard lock(write_mutex_);
    return events_;
}

}  // namespace archetype
