/**
 * @file device.hpp
 * @brief Compute device descriptor and its JSON projection.
 */

#pragma once

#include "core/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace archetype {

/**
 * @brief One discoverable compute resource.
 *
 * Built fresh on every discovery pass. Only the utilization fields
 * (memory, temperature, power, load) are refreshed in place, and only for
 * the currently selected device.
 */
struct Device {
    DeviceId id;                              ///< "<backend-tag>:<index>"
    std::string name;
    Vendor vendor{Vendor::Unknown};
    BackendKind backend{BackendKind::CpuFallback};

    uint32_t compute_units{0};
    uint64_t total_memory_mb{0};
    uint64_t available_memory_mb{0};

    std::optional<float> temperature_celsius;
    std::optional<float> power_watts;
    std::optional<float> utilization_percent;

    std::string driver_version;
    std::optional<std::string> compute_capability;

    uint32_t performance_score{0};            ///< [0, 1000]
    bool is_discrete{false};
    bool supports_fp16{false};
    bool supports_int8{false};
    uint32_t max_work_group_size{1};

    [[nodiscard]] float memory_usage_percent() const noexcept {
        if (total_memory_mb == 0) return 0.0f;
        auto used = total_memory_mb > available_memory_mb
            ? total_memory_mb - available_memory_mb : 0;
        return 100.0f * static_cast<float>(used) / static_cast<float>(total_memory_mb);
    }

    [[nodiscard]] bool is_cpu() const noexcept {
        return backend == BackendKind::CpuFallback;
    }
};

/**
 * @brief Live counters re-sampled for the selected device.
 */
struct DeviceUtilization {
    uint64_t available_memory_mb{0};
    std::optional<uint64_t> total_memory_mb;
    std::optional<float> temperature_celsius;
    std::optional<float> power_watts;
    std::optional<float> utilization_percent;
};

void apply_utilization(Device& device, const DeviceUtilization& util);

void to_json(nlohmann::json& j, const Device& device);

}  // namespace archetype
