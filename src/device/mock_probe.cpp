/**
 * @file mock_probe.cpp
 * @brief MockProbe implementation and probe factories.
 */

#include "device/probe.hpp"

#include <stdexcept>

namespace archetype {

MockProbe::MockProbe(BackendKind kind, std::vector<Device> devices)
    : kind_(kind),
      name_("mock-" + std::string{to_string(kind)}),
      devices_(std::move(devices)) {}

Result<std::vector<Device>> MockProbe::probe() {
    std::lock_guard lock(mutex_);
    ++probe_count_;
    switch (failure_) {
        case FailureMode::ReturnError:
            return Error{ErrorCode::BackendProbeFailure, name_ + ": injected failure"};
        case FailureMode::Throw:
            throw std::runtime_error(name_ + ": injected exception");
        case FailureMode::None:
            break;
    }
    return devices_;
}

std::optional<DeviceUtilization> MockProbe::sample(const Device& /*device*/) {
    std::lock_guard lock(mutex_);
    return utilization_;
}

void MockProbe::set_devices(std::vector<Device> devices) {
    std::lock_guard lock(mutex_);
    devices_ = std::move(devices);
}

void MockProbe::set_failure(FailureMode mode) {
    std::lock_guard lock(mutex_);
    failure_ = mode;
}

void MockProbe::set_utilization(DeviceUtilization util) {
    std::lock_guard lock(mutex_);
    utilization_ = util;
}

size_t MockProbe::probe_count() const {
    std::lock_guard lock(mutex_);
    return probe_count_;
}

// ─────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────

std::vector<std::unique_ptr<IDeviceProbe>> make_mock_probes() {
    Device rtx;
    rtx.id = "cuda:0";
    rtx.name = "Mock RTX 4090";
    rtx.vendor = Vendor::Nvidia;
    rtx.backend = BackendKind::NativeAccel;
    rtx.compute_units = 128;
    rtx.total_memory_mb = 24576;
    rtx.available_memory_mb = 22000;
    rtx.driver_version = "mock";
    rtx.compute_capability = "8.9";
    rtx.performance_score = 900;
    rtx.is_discrete = true;
    rtx.supports_fp16 = true;
    rtx.supports_int8 = true;
    rtx.max_work_group_size = 1024;

    Device radeon;
    radeon.id = "drm:1";
    radeon.name = "Mock Radeon RX 7900";
    radeon.vendor = Vendor::Amd;
    radeon.backend = BackendKind::VendorBridge;
    radeon.compute_units = 96;
    radeon.total_memory_mb = 20480;
    radeon.available_memory_mb = 20000;
    radeon.driver_version = "mock";
    radeon.performance_score = 650;
    radeon.is_discrete = true;
    radeon.supports_fp16 = true;
    radeon.max_work_group_size = 256;

    std::vector<std::unique_ptr<IDeviceProbe>> probes;
    probes.push_back(std::make_unique<MockProbe>(BackendKind::NativeAccel, std::vector<Device>{rtx}));
    probes.push_back(std::make_unique<MockProbe>(BackendKind::VendorBridge, std::vector<Device>{radeon}));
    return probes;
}

std::vector<std::unique_ptr<IDeviceProbe>> make_system_probes(
    const ProbeEnvironment& env, const ProbeSelection& selection) {
    std::vector<std::unique_ptr<IDeviceProbe>> probes;
    if (selection.native) probes.push_back(std::make_unique<NativeAccelProbe>(env));
    if (selection.vendor_bridge) probes.push_back(std::make_unique<VendorBridgeProbe>(env));
    if (selection.open_compute) probes.push_back(std::make_unique<OpenComputeProbe>(env));
    if (selection.unified_memory) probes.push_back(std::make_unique<UnifiedMemoryProbe>(env));
    return probes;
}

}  // namespace archetype
