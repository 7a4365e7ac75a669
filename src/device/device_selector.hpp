/**
 * @file device_selector.hpp
 * @brief DeviceSelector: preference policy over the catalog and the active device slot.
 *
 * Owns the single "current device" slot. Every successful selection rebinds
 * the numeric engine; units already built keep their old binding.
 * Selection and unit creation serialize on the same mutex through
 * with_active_device().
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "device/device.hpp"
#include "device/device_catalog.hpp"
#include "engine/numeric_engine.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace archetype {

class MetricsCollector;

struct BenchmarkReport {
    DeviceId device;
    uint32_t matrix_size{0};
    uint32_t iterations{0};
    double total_time_s{0.0};
    double average_time_s{0.0};
    double gflops{0.0};
};

void to_json(nlohmann::json& j, const BenchmarkReport& report);

/// Highest score, ties to the earliest catalog entry. nullopt on an empty list.
[[nodiscard]] std::optional<Device> pick_best(const std::vector<Device>& devices);

/// Devices that satisfy a preference, in catalog order.
[[nodiscard]] std::vector<Device> filter_by_preference(const std::vector<Device>& devices,
                                                       DevicePreference preference);

class DeviceSelector {
public:
    DeviceSelector(DeviceCatalog& catalog, INumericEngine& engine, Logger& logger,
                   MetricsCollector* metrics = nullptr);

    DeviceSelector(const DeviceSelector&) = delete;
    DeviceSelector& operator=(const DeviceSelector&) = delete;

    /// Discrete non-CPU devices first, else the best device overall.
    Result<Device> auto_select();

    /// PreferenceUnsatisfiable when a vendor/class filter matches nothing.
    Result<Device> apply_preference(DevicePreference preference);

    /// DeviceNotFound when absent from the current catalog.
    Result<Device> select_by_id(const DeviceId& id);

    [[nodiscard]] std::optional<Device> current() const;

    [[nodiscard]] std::optional<DevicePreference> active_preference() const;

    /// Re-sample utilization of the current device.
    Result<Device> refresh_current();

    /**
     * @brief Run @p func with the active device while holding the selection lock.
     *
     * Auto-selects first when nothing is selected yet.
     */
    template <typename F>
    auto with_active_device(F&& func) -> decltype(func(std::declval<const Device&>()));

    /// Timed N×N matmuls on the engine bound to the current device.
    Result<BenchmarkReport> benchmark(const BenchmarkConfig& config);

private:
    Result<Device> auto_select_locked();
    Result<Device> commit_locked(Device device, std::string_view reason);
    void ensure_catalog();

    DeviceCatalog& catalog_;
    INumericEngine& engine_;
    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex mutex_;
    std::optional<Device> current_;
    std::optional<DevicePreference> preference_;
};

// ── Template implementations ─────────────────

template <typename F>
auto DeviceSelector::with_active_device(F&& func) -> decltype(func(std::declval<const Device&>())) {
    std::lock_guard lock(mutex_);
    if (!current_) {
        auto selected = auto_select_locked();
        if (!selected) return selected.error();
    }
    return func(*current_);
}

}  // namespace archetype
