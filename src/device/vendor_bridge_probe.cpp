/**
 * @file vendor_bridge_probe.cpp
 * @brief VendorBridgeProbe: display-class PCI devices under /sys/class/drm.
 *
 * Layout read per card:
 *   cardN/device/vendor                  PCI vendor id
 *   cardN/device/class                   PCI class (0x03xxxx = display)
 *   cardN/device/product_name            optional marketing name
 *   cardN/device/mem_info_vram_total     bytes, amdgpu only
 *   cardN/device/mem_info_vram_used      bytes, amdgpu only
 *   cardN/device/gpu_busy_percent        optional
 *   cardN/device/hwmon/hwmonM/temp1_input     millidegrees
 *   cardN/device/hwmon/hwmonM/power1_average  microwatts
 */

#include "device/probe.hpp"
#include "device/host_files.hpp"
#include "device/scoring.hpp"

#include <algorithm>
#include <regex>

namespace archetype {

namespace {

namespace fs = std::filesystem;

constexpr uint64_t kMiB = 1024 * 1024;

std::optional<uint32_t> card_index(const std::string& entry) {
    static const std::regex pattern{R"(card(\d+))"};
    std::smatch match;
    if (!std::regex_match(entry, match, pattern)) return std::nullopt;
    return static_cast<uint32_t>(std::stoul(match[1].str()));
}

std::optional<fs::path> first_hwmon(const fs::path& device_dir) {
    std::error_code ec;
    auto hwmon_dir = device_dir / "hwmon";
    if (!fs::is_directory(hwmon_dir, ec)) return std::nullopt;
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(hwmon_dir, ec)) {
        entries.push_back(entry.path());
    }
    if (entries.empty()) return std::nullopt;
    std::sort(entries.begin(), entries.end());
    return entries.front();
}

void read_sensors(const fs::path& device_dir, DeviceUtilization& util) {
    auto busy = host::parse_float(host::read_file_line(device_dir / "gpu_busy_percent"));
    if (busy) util.utilization_percent = *busy;

    auto hwmon = first_hwmon(device_dir);
    if (!hwmon) return;
    if (auto temp = host::parse_uint(host::read_file_line(*hwmon / "temp1_input"))) {
        util.temperature_celsius = static_cast<float>(*temp) / 1000.0f;
    }
    if (auto power = host::parse_uint(host::read_file_line(*hwmon / "power1_average"))) {
        util.power_watts = static_cast<float>(*power) / 1'000'000.0f;
    }
}

std::string vendor_label(Vendor vendor) {
    switch (vendor) {
        case Vendor::Nvidia: return "NVIDIA";
        case Vendor::Amd:    return "AMD";
        case Vendor::Intel:  return "Intel";
        case Vendor::Apple:  return "Apple";
        case Vendor::Unknown: break;
    }
    return "Unknown";
}

}  // anonymous namespace

VendorBridgeProbe::VendorBridgeProbe(ProbeEnvironment env) : env_(std::move(env)) {}

Result<std::vector<Device>> VendorBridgeProbe::probe() {
    auto drm_dir = env_.resolve("/sys/class/drm");
    std::error_code ec;
    if (!fs::is_directory(drm_dir, ec)) {
        return Error{ErrorCode::BackendProbeFailure, "No DRM class directory: " + drm_dir.string()};
    }

    std::vector<std::pair<uint32_t, fs::path>> cards;
    for (const auto& entry : fs::directory_iterator(drm_dir, ec)) {
        if (auto index = card_index(entry.path().filename().string())) {
            cards.emplace_back(*index, entry.path());
        }
    }
    std::sort(cards.begin(), cards.end());

    auto system_mem = host::parse_meminfo(env_.resolve("/proc/meminfo"));

    std::vector<Device> devices;
    for (const auto& [index, card_path] : cards) {
        auto device_dir = card_path / "device";
        auto pci_class = host::parse_uint(host::read_file_line(device_dir / "class"));
        if (!pci_class || ((*pci_class >> 16) & 0xff) != 0x03) continue;

        auto pci_vendor = host::parse_uint(host::read_file_line(device_dir / "vendor"));
        Device dev;
        dev.id = "drm:" + std::to_string(index);
        dev.vendor = pci_vendor ? host::vendor_from_pci_id(*pci_vendor) : Vendor::Unknown;
        dev.backend = BackendKind::VendorBridge;

        auto product = host::trim(host::read_file_line(device_dir / "product_name"));
        if (!product.empty()) {
            dev.name = std::string{product};
        } else {
            auto pci_device = host::trim(host::read_file_line(device_dir / "device"));
            dev.name = vendor_label(dev.vendor) + " GPU";
            if (!pci_device.empty()) dev.name += " (" + std::string{pci_device} + ")";
        }

        auto vram_total = host::parse_uint(host::read_file_line(device_dir / "mem_info_vram_total"));
        auto vram_used = host::parse_uint(host::read_file_line(device_dir / "mem_info_vram_used"));
        uint64_t vram_mb = vram_total ? *vram_total / kMiB : 0;

        dev.is_discrete = vram_mb > 0 || dev.vendor != Vendor::Intel;
        if (vram_mb > 0) {
            dev.total_memory_mb = vram_mb;
            uint64_t used_mb = vram_used ? *vram_used / kMiB : 0;
            dev.available_memory_mb = vram_mb > used_mb ? vram_mb - used_mb : 0;
        } else if (!dev.is_discrete && system_mem) {
            // Integrated parts share system memory
            dev.total_memory_mb = system_mem->total_kb / 1024;
            dev.available_memory_mb = system_mem->available_kb / 1024;
        }

        std::error_code link_ec;
        auto driver = fs::read_symlink(device_dir / "driver", link_ec);
        if (!link_ec) dev.driver_version = driver.filename().string();

        DeviceUtilization sensors;
        read_sensors(device_dir, sensors);
        dev.temperature_celsius = sensors.temperature_celsius;
        dev.power_watts = sensors.power_watts;
        dev.utilization_percent = sensors.utilization_percent;

        dev.supports_fp16 = dev.is_discrete;
        dev.max_work_group_size = 256;
        dev.performance_score = score_vendor_bridge(vram_mb, dev.is_discrete);
        devices.push_back(std::move(dev));
    }
    return devices;
}

std::optional<DeviceUtilization> VendorBridgeProbe::sample(const Device& device) {
    auto colon = device.id.find(':');
    if (colon == std::string::npos) return std::nullopt;
    auto device_dir = env_.resolve("/sys/class/drm") / ("card" + device.id.substr(colon + 1)) / "device";

    DeviceUtilization util;
    auto vram_total = host::parse_uint(host::read_file_line(device_dir / "mem_info_vram_total"));
    auto vram_used = host::parse_uint(host::read_file_line(device_dir / "mem_info_vram_used"));
    if (vram_total && vram_used) {
        uint64_t total_mb = *vram_total / kMiB;
        uint64_t used_mb = *vram_used / kMiB;
        util.total_memory_mb = total_mb;
        util.available_memory_mb = total_mb > used_mb ? total_mb - used_mb : 0;
    } else if (auto mem = host::parse_meminfo(env_.resolve("/proc/meminfo")); mem && !device.is_discrete) {
        util.available_memory_mb = mem->available_kb / 1024;
    } else {
        util.available_memory_mb = device.available_memory_mb;
    }
    read_sensors(device_dir, util);
    return util;
}

}  // namespace archetype
