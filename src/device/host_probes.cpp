/**
 * @file host_probes.cpp
 * @brief UnifiedMemoryProbe and CpuProbe: devices backed by host memory.
 */

#include "device/probe.hpp"
#include "device/host_files.hpp"
#include "device/scoring.hpp"

#include <algorithm>
#include <thread>

namespace archetype {

namespace {

std::optional<float> read_thermal_zone(const ProbeEnvironment& env) {
    auto line = host::read_file_line(env.resolve("/sys/class/thermal/thermal_zone0/temp"));
    auto milli = host::parse_uint(line);
    if (!milli) return std::nullopt;
    return static_cast<float>(*milli) / 1000.0f;
}

std::optional<DeviceUtilization> sample_host_memory(const ProbeEnvironment& env) {
    auto mem = host::parse_meminfo(env.resolve("/proc/meminfo"));
    if (!mem) return std::nullopt;
    DeviceUtilization util;
    util.total_memory_mb = mem->total_kb / 1024;
    util.available_memory_mb = mem->available_kb / 1024;
    util.temperature_celsius = read_thermal_zone(env);
    return util;
}

std::string kernel_release(const ProbeEnvironment& env) {
    return std::string{host::trim(host::read_file_line(env.resolve("/proc/sys/kernel/osrelease")))};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// UnifiedMemoryProbe
// ─────────────────────────────────────────────

UnifiedMemoryProbe::UnifiedMemoryProbe(ProbeEnvironment env) : env_(std::move(env)) {}

Result<std::vector<Device>> UnifiedMemoryProbe::probe() {
    // compatible is a NUL-separated string list
    auto compatible = host::read_file(env_.resolve("/proc/device-tree/compatible"));
    if (!compatible || compatible->find("apple,") == std::string::npos) {
        return std::vector<Device>{};
    }

    auto mem = host::parse_meminfo(env_.resolve("/proc/meminfo"));
    auto cpu = host::parse_cpuinfo(env_.resolve("/proc/cpuinfo"));

    Device dev;
    dev.id = "unified:0";
    auto model = host::read_file(env_.resolve("/proc/device-tree/model"));
    dev.name = model ? std::string{host::trim(*model)} : std::string{"Apple Silicon"};
    if (dev.name.empty()) dev.name = "Apple Silicon";
    dev.vendor = Vendor::Apple;
    dev.backend = BackendKind::UnifiedMemory;
    dev.compute_units = cpu ? cpu->logical_cores : std::thread::hardware_concurrency();
    if (mem) {
        dev.total_memory_mb = mem->total_kb / 1024;
        dev.available_memory_mb = mem->available_kb / 1024;
    }
    dev.driver_version = kernel_release(env_);
    dev.is_discrete = false;
    dev.supports_fp16 = true;
    dev.supports_int8 = true;
    dev.max_work_group_size = 1024;
    dev.performance_score = score_unified_memory(dev.total_memory_mb, dev.compute_units);
    return std::vector<Device>{std::move(dev)};
}

std::optional<DeviceUtilization> UnifiedMemoryProbe::sample(const Device& /*device*/) {
    return sample_host_memory(env_);
}

// ─────────────────────────────────────────────
// CpuProbe
// ─────────────────────────────────────────────

CpuProbe::CpuProbe(ProbeEnvironment env) : env_(std::move(env)) {}

Result<std::vector<Device>> CpuProbe::probe() {
    auto cpu = host::parse_cpuinfo(env_.resolve("/proc/cpuinfo"));
    if (!cpu) {
        return Error{ErrorCode::BackendProbeFailure, "Unable to read /proc/cpuinfo"};
    }
    auto mem = host::parse_meminfo(env_.resolve("/proc/meminfo"));

    Device dev;
    dev.id = "cpu:0";
    dev.name = cpu->model_name.empty() ? std::string{"Host CPU"} : cpu->model_name;
    dev.vendor = host::vendor_from_name(dev.name);
    dev.backend = BackendKind::CpuFallback;
    dev.compute_units = cpu->logical_cores;
    if (mem) {
        dev.total_memory_mb = mem->total_kb / 1024;
        dev.available_memory_mb = mem->available_kb / 1024;
    }
    dev.temperature_celsius = read_thermal_zone(env_);
    dev.driver_version = kernel_release(env_);
    dev.is_discrete = false;
    dev.supports_fp16 = cpu->has_flag("f16c") || cpu->has_flag("avx512_fp16")
                     || cpu->has_flag("fphp");
    dev.supports_int8 = cpu->has_flag("avx512_vnni") || cpu->has_flag("avx_vnni")
                     || cpu->has_flag("asimddp");
    dev.max_work_group_size = 1;
    dev.performance_score = score_cpu(dev.compute_units, dev.total_memory_mb);
    return std::vector<Device>{std::move(dev)};
}

std::optional<DeviceUtilization> CpuProbe::sample(const Device& /*device*/) {
    return sample_host_memory(env_);
}

Device make_fallback_cpu_device() {
    Device dev;
    dev.id = "cpu:0";
    dev.name = "Host CPU";
    dev.backend = BackendKind::CpuFallback;
    dev.compute_units = std::max(1u, std::thread::hardware_concurrency());
    dev.max_work_group_size = 1;
    dev.performance_score = score_cpu(dev.compute_units, 0);
    return dev;
}

}  // namespace archetype
