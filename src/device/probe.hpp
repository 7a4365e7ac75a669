/**
 * @file probe.hpp
 * @brief Device discovery backends.
 *
 * Each backend enumerates the devices visible through one discovery path and
 * scores them with its own heuristics. Probes read an injectable filesystem
 * root and run external tools through an injectable ICommandRunner, so the
 * same code runs against the live system or a fake tree in tests.
 *
 * Data sources:
 *   nvidia-smi                     -> native accelerator (cuda:N)
 *   /sys/class/drm/card*           -> vendor bridge (drm:N)
 *   clinfo --raw                   -> open compute (opencl:N)
 *   /proc/device-tree/compatible   -> unified memory SoC (unified:0)
 *   /proc/cpuinfo, /proc/meminfo   -> host CPU (cpu:0)
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "device/device.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archetype {

// ─────────────────────────────────────────────
// Command Runner
// ─────────────────────────────────────────────

/**
 * @brief Runs an external tool and captures its standard output.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /// Error when the tool cannot be started or exits non-zero.
    virtual Result<std::string> run(const std::string& command) = 0;
};

/**
 * @brief popen()-based runner; stderr is discarded.
 */
class PopenCommandRunner : public ICommandRunner {
public:
    Result<std::string> run(const std::string& command) override;
};

/**
 * @brief Everything a probe may touch on the host.
 */
struct ProbeEnvironment {
    std::filesystem::path root = "/";
    std::shared_ptr<ICommandRunner> runner = std::make_shared<PopenCommandRunner>();
    std::string nvidia_smi = "nvidia-smi";
    std::string clinfo = "clinfo";

    /// Map an absolute host path into the probe root.
    [[nodiscard]] std::filesystem::path resolve(std::string_view absolute) const;
};

// ─────────────────────────────────────────────
// IDeviceProbe
// ─────────────────────────────────────────────

/**
 * @brief One discovery backend.
 *
 * probe() may return an error or throw; the catalog absorbs both and treats
 * the backend as contributing zero devices.
 */
class IDeviceProbe {
public:
    virtual ~IDeviceProbe() = default;

    [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual Result<std::vector<Device>> probe() = 0;

    /// Re-read live counters for a device this probe produced.
    virtual std::optional<DeviceUtilization> sample(const Device& /*device*/) {
        return std::nullopt;
    }
};

// ─────────────────────────────────────────────
// Concrete Probes
// ─────────────────────────────────────────────

class NativeAccelProbe : public IDeviceProbe {
public:
    explicit NativeAccelProbe(ProbeEnvironment env);

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::NativeAccel; }
    [[nodiscard]] std::string_view name() const noexcept override { return "native-accel"; }

    Result<std::vector<Device>> probe() override;
    std::optional<DeviceUtilization> sample(const Device& device) override;

private:
    ProbeEnvironment env_;
};

class VendorBridgeProbe : public IDeviceProbe {
public:
    explicit VendorBridgeProbe(ProbeEnvironment env);

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::VendorBridge; }
    [[nodiscard]] std::string_view name() const noexcept override { return "vendor-bridge"; }

    Result<std::vector<Device>> probe() override;
    std::optional<DeviceUtilization> sample(const Device& device) override;

private:
    ProbeEnvironment env_;
};

class OpenComputeProbe : public IDeviceProbe {
public:
    explicit OpenComputeProbe(ProbeEnvironment env);

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::OpenCompute; }
    [[nodiscard]] std::string_view name() const noexcept override { return "open-compute"; }

    Result<std::vector<Device>> probe() override;

private:
    ProbeEnvironment env_;
};

class UnifiedMemoryProbe : public IDeviceProbe {
public:
    explicit UnifiedMemoryProbe(ProbeEnvironment env);

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::UnifiedMemory; }
    [[nodiscard]] std::string_view name() const noexcept override { return "unified-memory"; }

    Result<std::vector<Device>> probe() override;
    std::optional<DeviceUtilization> sample(const Device& device) override;

private:
    ProbeEnvironment env_;
};

/**
 * @brief Host processor probe. Always yields exactly one device.
 */
class CpuProbe : public IDeviceProbe {
public:
    explicit CpuProbe(ProbeEnvironment env);

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::CpuFallback; }
    [[nodiscard]] std::string_view name() const noexcept override { return "cpu"; }

    Result<std::vector<Device>> probe() override;
    std::optional<DeviceUtilization> sample(const Device& device) override;

private:
    ProbeEnvironment env_;
};

/// The CPU entry used when even the CPU probe cannot read the host.
[[nodiscard]] Device make_fallback_cpu_device();

// ─────────────────────────────────────────────
// MockProbe
// ─────────────────────────────────────────────

/**
 * @brief Scripted probe for testing and demos.
 *
 * Returns a configured device list, or fails (by error or by exception)
 * when told to.
 */
class MockProbe : public IDeviceProbe {
public:
    enum class FailureMode : uint8_t { None, ReturnError, Throw };

    explicit MockProbe(BackendKind kind, std::vector<Device> devices = {});

    [[nodiscard]] BackendKind kind() const noexcept override { return kind_; }
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    Result<std::vector<Device>> probe() override;
    std::optional<DeviceUtilization> sample(const Device& device) override;

    // Test helpers
    void set_devices(std::vector<Device> devices);
    void set_failure(FailureMode mode);
    void set_utilization(DeviceUtilization util);
    [[nodiscard]] size_t probe_count() const;

private:
    BackendKind kind_;
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<Device> devices_;
    FailureMode failure_{FailureMode::None};
    std::optional<DeviceUtilization> utilization_;
    size_t probe_count_{0};
};

/**
 * @brief Fixed two-GPU device set used by `devices.mock = true`.
 */
[[nodiscard]] std::vector<std::unique_ptr<IDeviceProbe>> make_mock_probes();

/**
 * @brief The four accelerator probes in priority order (CPU is owned by the catalog).
 */
struct ProbeSelection {
    bool native = true;
    bool vendor_bridge = true;
    bool open_compute = true;
    bool unified_memory = true;
};

[[nodiscard]] std::vector<std::unique_ptr<IDeviceProbe>> make_system_probes(
    const ProbeEnvironment& env, const ProbeSelection& selection);

}  // namespace archetype
