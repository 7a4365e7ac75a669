/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "device/device.hpp"

#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace archetype {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Every event carries "event" and "ts" keys; the rest depends on the kind.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_discovery(const std::vector<Device>& devices, uint32_t failed_probes);
    void record_device_selected(const Device& device, std::string_view reason);
    void record_job_event(const JobId& job, const UnitId& unit, JobState state, uint32_t epoch);
    void record_unit_event(const UnitId& unit, std::string_view event_type, UnitType type);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    /// Number of events emitted so far.
    [[nodiscard]] uint64_t event_count() const;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t events_{0};

    void emit(std::string_view json_line);
};

}  // namespace archetype
