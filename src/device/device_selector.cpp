/**
 * @file device_selector.cpp
 * @brief DeviceSelector implementation.
 */

#include "device/device_selector.hpp"
#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <random>

namespace archetype {

void to_json(nlohmann::json& j, const BenchmarkReport& report) {
    j = nlohmann::json{
        {"device", report.device},
        {"matrix_size", report.matrix_size},
        {"iterations", report.iterations},
        {"total_time", report.total_time_s},
        {"average_time", report.average_time_s},
        {"gflops", report.gflops}
    };
}

std::optional<Device> pick_best(const std::vector<Device>& devices) {
    const Device* best = nullptr;
    for (const auto& dev : devices) {
        // strict comparison keeps the first of equal scores
        if (!best || dev.performance_score > best->performance_score) best = &dev;
    }
    if (!best) return std::nullopt;
    return *best;
}

std::vector<Device> filter_by_preference(const std::vector<Device>& devices,
                                         DevicePreference preference) {
    std::vector<Device> out;
    for (const auto& dev : devices) {
        bool keep = false;
        switch (preference) {
            case DevicePreference::Auto:       keep = true; break;
            case DevicePreference::GpuOnly:    keep = !dev.is_cpu(); break;
            case DevicePreference::CpuOnly:    keep = dev.is_cpu(); break;
            case DevicePreference::NvidiaOnly: keep = !dev.is_cpu() && dev.vendor == Vendor::Nvidia; break;
            case DevicePreference::AmdOnly:    keep = !dev.is_cpu() && dev.vendor == Vendor::Amd; break;
            case DevicePreference::IntelOnly:  keep = !dev.is_cpu() && dev.vendor == Vendor::Intel; break;
        }
        if (keep) out.push_back(dev);
    }
    return out;
}

DeviceSelector::DeviceSelector(DeviceCatalog& catalog, INumericEngine& engine, Logger& logger,
                               MetricsCollector* metrics)
    : catalog_(catalog), engine_(engine), logger_(logger), metrics_(metrics) {}

void DeviceSelector::ensure_catalog() {
    if (catalog_.empty()) catalog_.discover();
}

Result<Device> DeviceSelector::commit_locked(Device device, std::string_view reason) {
    engine_.bind(device);
    current_ = device;
    logger_.info("Selected device " + device.id + " (" + device.name + ", score "
                 + std::to_string(device.performance_score) + ") via " + std::string{reason});
    if (metrics_) metrics_->record_device_selected(device, reason);
    return device;
}

Result<Device> DeviceSelector::auto_select_locked() {
    ensure_catalog();
    auto devices = catalog_.list_all();

    std::vector<Device> discrete;
    for (const auto& dev : devices) {
        if (dev.is_discrete && !dev.is_cpu()) discrete.push_back(dev);
    }
    auto best = discrete.empty() ? pick_best(devices) : pick_best(discrete);
    if (!best) {
        return Error{ErrorCode::DeviceNotFound, "No devices available"};
    }
    return commit_locked(std::move(*best), "auto");
}

Result<Device> DeviceSelector::auto_select() {
    std::lock_guard lock(mutex_);
    return auto_select_locked();
}

Result<Device> DeviceSelector::apply_preference(DevicePreference preference) {
    std::lock_guard lock(mutex_);
    if (preference == DevicePreference::Auto) {
        auto selected = auto_select_locked();
        if (selected) preference_ = preference;
        return selected;
    }

    ensure_catalog();
    auto matching = filter_by_preference(catalog_.list_all(), preference);
    auto best = pick_best(matching);
    if (!best) {
        return Error{ErrorCode::PreferenceUnsatisfiable,
                     "No device satisfies preference " + std::string{to_string(preference)}};
    }
    preference_ = preference;
    return commit_locked(std::move(*best), to_string(preference));
}

Result<Device> DeviceSelector::select_by_id(const DeviceId& id) {
    std::lock_guard lock(mutex_);
    auto device = catalog_.get(id);
    if (!device) return device.error();
    return commit_locked(std::move(*device), "manual");
}

std::optional<Device> DeviceSelector::current() const {
    std::lock_guard lock(mutex_);
    return current_;
}

std::optional<DevicePreference> DeviceSelector::active_preference() const {
    std::lock_guard lock(mutex_);
    return preference_;
}

Result<Device> DeviceSelector::refresh_current() {
    std::optional<DeviceId> id;
    {
        std::lock_guard lock(mutex_);
        if (!current_) return Error{ErrorCode::NotFound, "No device selected"};
        id = current_->id;
    }
    auto refreshed = catalog_.refresh_utilization(*id);
    if (!refreshed) return refreshed.error();

    std::lock_guard lock(mutex_);
    if (current_ && current_->id == refreshed->id) current_ = *refreshed;
    return refreshed;
}

Result<BenchmarkReport> DeviceSelector::benchmark(const BenchmarkConfig& config) {
    if (config.matrix_size == 0 || config.iterations == 0) {
        return Error{ErrorCode::InvalidArgument, "Benchmark needs matrix_size and iterations > 0"};
    }
    auto device = with_active_device([](const Device& d) -> Result<Device> { return d; });
    if (!device) return device.error();

    const size_t n = config.matrix_size;
    std::mt19937 rng(1234);
    Tensor a = Tensor::randn({n, n}, 1.0f, rng);
    Tensor b = Tensor::randn({n, n}, 1.0f, rng);

    try {
        // warm-up pass is excluded from timing
        (void)engine_.matmul(a, b);

        auto start = std::chrono::steady_clock::now();
        for (uint32_t i = 0; i < config.iterations; ++i) {
            (void)engine_.matmul(a, b);
        }
        auto end = std::chrono::steady_clock::now();

        BenchmarkReport report;
        report.device = device->id;
        report.matrix_size = config.matrix_size;
        report.iterations = config.iterations;
        report.total_time_s = std::chrono::duration<double>(end - start).count();
        report.average_time_s = report.total_time_s / config.iterations;
        double flops = 2.0 * static_cast<double>(n) * n * n;
        report.gflops = report.average_time_s > 0.0 ? flops / report.average_time_s / 1e9 : 0.0;
        return report;
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, std::string{"Benchmark failed: "} + e.what()};
    }
}

}  // namespace archetype
