/**
 * @file device.cpp
 * @brief Device helpers.
 */

#include "device/device.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace archetype {

void apply_utilization(Device& device, const DeviceUtilization& util) {
    if (util.total_memory_mb) device.total_memory_mb = *util.total_memory_mb;
    device.available_memory_mb = std::min(util.available_memory_mb, device.total_memory_mb);
    if (util.temperature_celsius) device.temperature_celsius = util.temperature_celsius;
    if (util.power_watts) device.power_watts = util.power_watts;
    if (util.utilization_percent) device.utilization_percent = util.utilization_percent;
}

void to_json(nlohmann::json& j, const Device& device) {
    j = nlohmann::json{
        {"device_id", device.id},
        {"name", device.name},
        {"vendor", to_string(device.vendor)},
        {"backend", to_string(device.backend)},
        {"compute_units", device.compute_units},
        {"total_memory_mb", device.total_memory_mb},
        {"available_memory_mb", device.available_memory_mb},
        {"memory_usage_percent", device.memory_usage_percent()},
        {"temperature", nullptr},
        {"power_usage", nullptr},
        {"utilization", nullptr},
        {"driver_version", device.driver_version},
        {"compute_capability", nullptr},
        {"performance_score", device.performance_score},
        {"is_discrete", device.is_discrete},
        {"supports_fp16", device.supports_fp16},
        {"supports_int8", device.supports_int8},
        {"max_work_group_size", device.max_work_group_size}
    };
    if (device.temperature_celsius) j["temperature"] = *device.temperature_celsius;
    if (device.power_watts) j["power_usage"] = *device.power_watts;
    if (device.utilization_percent) j["utilization"] = *device.utilization_percent;
    if (device.compute_capability) j["compute_capability"] = *device.compute_capability;
}

}  // namespace archetype
