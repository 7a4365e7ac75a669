/**
 * @file device_catalog.hpp
 * @brief DeviceCatalog: discovers and tracks compute devices.
 *
 * Discovery runs every registered probe in priority order, then the
 * catalog-owned CPU probe. A probe that errors or throws contributes zero
 * devices; discovery itself never fails. The resulting catalog always holds
 * exactly one CPU_FALLBACK device.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "device/device.hpp"
#include "device/probe.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace archetype {

class MetricsCollector;

class DeviceCatalog {
public:
    /// @param cpu_probe  dedicated host probe; a default CpuProbe on "/" when null.
    DeviceCatalog(Logger& logger,
                  std::unique_ptr<IDeviceProbe> cpu_probe = nullptr,
                  MetricsCollector* metrics = nullptr);

    DeviceCatalog(const DeviceCatalog&) = delete;
    DeviceCatalog& operator=(const DeviceCatalog&) = delete;

    /// Add an accelerator probe. Probes run in BackendKind order, then registration order.
    void register_probe(std::unique_ptr<IDeviceProbe> probe);

    /// Full refresh; replaces the previous catalog wholesale.
    std::vector<Device> discover();

    [[nodiscard]] std::vector<Device> list_all() const;

    [[nodiscard]] Result<Device> get(const DeviceId& id) const;

    [[nodiscard]] bool empty() const;

    [[nodiscard]] size_t probe_count() const;

    /// Re-sample live counters of one device through the probe that produced it.
    Result<Device> refresh_utilization(const DeviceId& id);

private:
    struct Entry {
        Device device;
        IDeviceProbe* source{nullptr};
    };

    std::vector<Entry> run_probe(IDeviceProbe& probe, uint32_t& failures);

    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex probes_mutex_;  ///< serializes discovery passes and probe registration
    std::vector<std::unique_ptr<IDeviceProbe>> probes_;
    std::unique_ptr<IDeviceProbe> cpu_probe_;

    mutable std::shared_mutex entries_mutex_;
    std::vector<Entry> entries_;
};

}  // namespace archetype
