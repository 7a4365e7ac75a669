/**
 * @file native_probe.cpp
 * @brief NativeAccelProbe: vendor-native accelerators via nvidia-smi.
 *
 * One CSV row per GPU:
 *   index, name, memory.total [MiB], memory.used [MiB], temperature.gpu,
 *   power.draw [W], driver_version, compute_cap, utilization.gpu [%]
 */

#include "device/probe.hpp"
#include "device/host_files.hpp"
#include "device/scoring.hpp"

namespace archetype {

namespace {

constexpr size_t kQueryColumns = 9;

constexpr const char* kQueryArgs =
    " --query-gpu=index,name,memory.total,memory.used,temperature.gpu,"
    "power.draw,driver_version,compute_cap,utilization.gpu"
    " --format=csv,noheader,nounits";

constexpr const char* kSampleArgs =
    " --query-gpu=memory.total,memory.used,temperature.gpu,power.draw,utilization.gpu"
    " --format=csv,noheader,nounits";

std::vector<std::string> split_csv_row(std::string_view line) {
    auto cells = host::split(line, ',');
    for (auto& cell : cells) cell = std::string{host::trim(cell)};
    return cells;
}

std::optional<Device> parse_row(std::string_view line) {
    auto cells = split_csv_row(line);
    if (cells.size() < kQueryColumns) return std::nullopt;

    auto index = host::parse_uint(cells[0]);
    auto total = host::parse_uint(cells[2]);
    if (!index || !total) return std::nullopt;
    auto used = host::parse_uint(cells[3]).value_or(0);

    Device dev;
    dev.id = "cuda:" + std::to_string(*index);
    dev.name = cells[1];
    dev.vendor = Vendor::Nvidia;
    dev.backend = BackendKind::NativeAccel;
    dev.total_memory_mb = *total;
    dev.available_memory_mb = *total > used ? *total - used : 0;
    dev.temperature_celsius = host::parse_float(cells[4]);
    dev.power_watts = host::parse_float(cells[5]);
    dev.driver_version = cells[6];
    dev.utilization_percent = host::parse_float(cells[8]);
    dev.is_discrete = true;
    dev.max_work_group_size = 1024;

    auto capability = parse_compute_capability(cells[7]);
    if (capability) {
        dev.compute_capability = cells[7];
        auto level = capability->major * 10 + capability->minor;
        dev.supports_fp16 = level >= 53;
        dev.supports_int8 = level >= 61;
    }
    dev.performance_score = score_native_accel(dev.total_memory_mb, dev.compute_units, capability);
    return dev;
}

}  // anonymous namespace

NativeAccelProbe::NativeAccelProbe(ProbeEnvironment env) : env_(std::move(env)) {}

Result<std::vector<Device>> NativeAccelProbe::probe() {
    auto output = env_.runner->run(env_.nvidia_smi + kQueryArgs);
    if (!output) return output.error();

    std::vector<Device> devices;
    for (const auto& line : host::split(*output, '\n')) {
        if (host::trim(line).empty()) continue;
        if (auto dev = parse_row(line)) {
            devices.push_back(std::move(*dev));
        }
    }
    return devices;
}

std::optional<DeviceUtilization> NativeAccelProbe::sample(const Device& device) {
    auto colon = device.id.find(':');
    if (colon == std::string::npos) return std::nullopt;

    auto output = env_.runner->run(env_.nvidia_smi + " --id=" + device.id.substr(colon + 1)
                                   + kSampleArgs);
    if (!output) return std::nullopt;

    auto cells = split_csv_row(host::trim(*output));
    if (cells.size() < 5) return std::nullopt;
    auto total = host::parse_uint(cells[0]);
    auto used = host::parse_uint(cells[1]);
    if (!total || !used) return std::nullopt;

    DeviceUtilization util;
    util.total_memory_mb = *total;
    util.available_memory_mb = *total > *used ? *total - *used : 0;
    util.temperature_celsius = host::parse_float(cells[2]);
    util.power_watts = host::parse_float(cells[3]);
    util.utilization_percent = host::parse_float(cells[4]);
    return util;
}

}  // namespace archetype
