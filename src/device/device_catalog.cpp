/**
 * @file device_catalog.cpp
 * @brief DeviceCatalog implementation.
 */

#include "device/device_catalog.hpp"
#include "device/scoring.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <exception>

namespace archetype {

DeviceCatalog::DeviceCatalog(Logger& logger,
                             std::unique_ptr<IDeviceProbe> cpu_probe,
                             MetricsCollector* metrics)
    : logger_(logger)
    , metrics_(metrics)
    , cpu_probe_(cpu_probe ? std::move(cpu_probe)
                           : std::make_unique<CpuProbe>(ProbeEnvironment{})) {}

void DeviceCatalog::register_probe(std::unique_ptr<IDeviceProbe> probe) {
    std::lock_guard lock(probes_mutex_);
    probes_.push_back(std::move(probe));
    std::stable_sort(probes_.begin(), probes_.end(),
                     [](const auto& a, const auto& b) { return a->kind() < b->kind(); });
}

std::vector<DeviceCatalog::Entry> DeviceCatalog::run_probe(IDeviceProbe& probe, uint32_t& failures) {
    std::vector<Entry> found;
    try {
        auto result = probe.probe();
        if (!result) {
            ++failures;
            logger_.warn("Device probe " + std::string{probe.name()} + " failed: "
                         + result.error().message);
            return found;
        }
        for (auto& dev : *result) {
            found.push_back(Entry{std::move(dev), &probe});
        }
    } catch (const std::exception& e) {
        ++failures;
        logger_.warn("Device probe " + std::string{probe.name()} + " threw: " + e.what());
        found.clear();
    }
    return found;
}

std::vector<Device> DeviceCatalog::discover() {
    std::lock_guard probe_lock(probes_mutex_);

    std::vector<Entry> fresh;
    uint32_t failures = 0;

    for (auto& probe : probes_) {
        auto found = run_probe(*probe, failures);
        for (auto& entry : found) {
            if (entry.device.is_cpu()) {
                logger_.warn("Ignoring CPU device " + entry.device.id + " reported by "
                             + std::string{probe->name()});
                continue;
            }
            entry.device.performance_score =
                std::min(entry.device.performance_score, kMaxPerformanceScore);
            fresh.push_back(std::move(entry));
        }
        logger_.debug("Probe " + std::string{probe->name()} + " contributed "
                      + std::to_string(found.size()) + " device(s)");
    }

    // CPU runs last and always contributes exactly one device
    auto cpu_found = run_probe(*cpu_probe_, failures);
    auto cpu_it = std::find_if(cpu_found.begin(), cpu_found.end(),
                               [](const Entry& e) { return e.device.is_cpu(); });
    if (cpu_it != cpu_found.end()) {
        cpu_it->device.performance_score =
            std::min(cpu_it->device.performance_score, kMaxPerformanceScore);
        fresh.push_back(std::move(*cpu_it));
    } else {
        logger_.warn("CPU probe yielded no device; using default CPU entry");
        fresh.push_back(Entry{make_fallback_cpu_device(), nullptr});
    }

    std::vector<Device> snapshot;
    snapshot.reserve(fresh.size());
    for (const auto& entry : fresh) snapshot.push_back(entry.device);

    {
        std::unique_lock lock(entries_mutex_);
        entries_ = std::move(fresh);
    }

    logger_.info("Discovered " + std::to_string(snapshot.size()) + " device(s), "
                 + std::to_string(failures) + " probe failure(s)");
    if (metrics_) metrics_->record_discovery(snapshot, failures);
    return snapshot;
}

std::vector<Device> DeviceCatalog::list_all() const {
    std::shared_lock lock(entries_mutex_);
    std::vector<Device> devices;
    devices.reserve(entries_.size());
    for (const auto& entry : entries_) devices.push_back(entry.device);
    return devices;
}

Result<Device> DeviceCatalog::get(const DeviceId& id) const {
    std::shared_lock lock(entries_mutex_);
    for (const auto& entry : entries_) {
        if (entry.device.id == id) return entry.device;
    }
    return Error{ErrorCode::DeviceNotFound, "Device not found: " + id};
}

bool DeviceCatalog::empty() const {
    std::shared_lock lock(entries_mutex_);
    return entries_.empty();
}

size_t DeviceCatalog::probe_count() const {
    std::lock_guard lock(probes_mutex_);
    return probes_.size() + 1;
}

Result<Device> DeviceCatalog::refresh_utilization(const DeviceId& id) {
    IDeviceProbe* source = nullptr;
    Device device;
    {
        std::shared_lock lock(entries_mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.device.id == id; });
        if (it == entries_.end()) {
            return Error{ErrorCode::DeviceNotFound, "Device not found: " + id};
        }
        source = it->source;
        device = it->device;
    }
    if (!source) return device;

    std::optional<DeviceUtilization> util;
    try {
        util = source->sample(device);
    } catch (const std::exception& e) {
        logger_.warn("Utilization sample for " + id + " failed: " + e.what());
    }
    if (!util) return device;

    std::unique_lock lock(entries_mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.device.id == id; });
    if (it == entries_.end()) return device;
    apply_utilization(it->device, *util);
    return it->device;
}

}  // namespace archetype
