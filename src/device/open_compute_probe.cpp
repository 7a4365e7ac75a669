/**
 * @file open_compute_probe.cpp
 * @brief OpenComputeProbe: OpenCL devices via `clinfo --raw`.
 *
 * Raw output tags each property with its platform and device:
 *   [NV/0]  CL_DEVICE_NAME               NVIDIA GeForce RTX 3080
 *   [NV/0]  CL_DEVICE_TYPE               CL_DEVICE_TYPE_GPU
 *   [NV/*]  CL_PLATFORM_NAME             NVIDIA CUDA
 * Platform-wide rows ("/*") are ignored.
 */

#include "device/probe.hpp"
#include "device/host_files.hpp"
#include "device/scoring.hpp"

#include <map>

namespace archetype {

namespace {

struct RawDevice {
    std::map<std::string, std::string, std::less<>> properties;

    [[nodiscard]] std::string_view get(std::string_view key) const {
        auto it = properties.find(key);
        return it == properties.end() ? std::string_view{} : std::string_view{it->second};
    }
};

/// Group raw rows by device tag, preserving first-seen order.
std::vector<RawDevice> parse_raw(std::string_view output) {
    std::vector<std::string> order;
    std::map<std::string, RawDevice> by_tag;

    for (const auto& row : host::split(output, '\n')) {
        auto line = host::trim(row);
        if (!line.starts_with('[')) continue;
        auto close = line.find(']');
        if (close == std::string_view::npos) continue;

        std::string tag{line.substr(1, close - 1)};
        if (tag.ends_with("/*")) continue;

        auto rest = host::trim(line.substr(close + 1));
        auto space = rest.find_first_of(" \t");
        std::string key{rest.substr(0, space)};
        std::string value = space == std::string_view::npos
            ? std::string{} : std::string{host::trim(rest.substr(space))};

        auto [it, inserted] = by_tag.try_emplace(tag);
        if (inserted) order.push_back(tag);
        it->second.properties.emplace(std::move(key), std::move(value));
    }

    std::vector<RawDevice> devices;
    devices.reserve(order.size());
    for (const auto& tag : order) devices.push_back(std::move(by_tag[tag]));
    return devices;
}

}  // anonymous namespace

OpenComputeProbe::OpenComputeProbe(ProbeEnvironment env) : env_(std::move(env)) {}

Result<std::vector<Device>> OpenComputeProbe::probe() {
    auto output = env_.runner->run(env_.clinfo + " --raw");
    if (!output) return output.error();

    std::vector<Device> devices;
    uint32_t index = 0;
    for (const auto& raw : parse_raw(*output)) {
        auto type = raw.get("CL_DEVICE_TYPE");
        bool is_gpu = type.find("GPU") != std::string_view::npos;
        bool is_accel = type.find("ACCELERATOR") != std::string_view::npos;
        if (!is_gpu && !is_accel) continue;

        Device dev;
        dev.id = "opencl:" + std::to_string(index++);
        dev.name = std::string{raw.get("CL_DEVICE_NAME")};
        dev.vendor = host::vendor_from_name(raw.get("CL_DEVICE_VENDOR"));
        if (dev.vendor == Vendor::Unknown) dev.vendor = host::vendor_from_name(dev.name);
        dev.backend = BackendKind::OpenCompute;
        dev.compute_units = static_cast<uint32_t>(
            host::parse_uint(raw.get("CL_DEVICE_MAX_COMPUTE_UNITS")).value_or(0));
        dev.total_memory_mb = host::parse_uint(raw.get("CL_DEVICE_GLOBAL_MEM_SIZE")).value_or(0)
                              / (1024 * 1024);
        dev.available_memory_mb = dev.total_memory_mb;
        dev.driver_version = std::string{raw.get("CL_DRIVER_VERSION")};
        dev.max_work_group_size = static_cast<uint32_t>(
            host::parse_uint(raw.get("CL_DEVICE_MAX_WORK_GROUP_SIZE")).value_or(1));
        dev.is_discrete = raw.get("CL_DEVICE_HOST_UNIFIED_MEMORY").find("CL_TRUE")
                          == std::string_view::npos;

        auto extensions = raw.get("CL_DEVICE_EXTENSIONS");
        dev.supports_fp16 = extensions.find("cl_khr_fp16") != std::string_view::npos;
        dev.supports_int8 = extensions.find("cl_khr_integer_dot_product") != std::string_view::npos;

        dev.performance_score = score_open_compute(dev.total_memory_mb, dev.compute_units, is_gpu);
        devices.push_back(std::move(dev));
    }
    return devices;
}

}  // namespace archetype
