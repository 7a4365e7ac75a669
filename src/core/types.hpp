/**
 * @file types.hpp
 * @brief Fundamental types used throughout archetype.
 *
 * Defines identity aliases and the closed enumerations shared by the device,
 * model and training layers, together with their string conversions.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace archetype {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using DeviceId = std::string;
using UnitId = std::string;
using JobId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Device Vocabulary
// ─────────────────────────────────────────────

enum class Vendor : uint8_t {
    Nvidia,
    Amd,
    Intel,
    Apple,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(Vendor vendor) noexcept {
    switch (vendor) {
        case Vendor::Nvidia:  return "NVIDIA";
        case Vendor::Amd:     return "AMD";
        case Vendor::Intel:   return "INTEL";
        case Vendor::Apple:   return "APPLE";
        case Vendor::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

/**
 * @brief Discovery backend a device was surfaced through.
 *
 * Declaration order is the fixed probe priority order.
 */
enum class BackendKind : uint8_t {
    NativeAccel,      ///< Vendor-native accelerator runtime (nvidia-smi)
    VendorBridge,     ///< Vendor-neutral kernel interface (DRM sysfs)
    OpenCompute,      ///< OpenCL platforms (clinfo)
    UnifiedMemory,    ///< Shared CPU/GPU memory SoCs
    CpuFallback       ///< Host processor, always present
};

[[nodiscard]] constexpr std::string_view to_string(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::NativeAccel:   return "NATIVE_ACCEL";
        case BackendKind::VendorBridge:  return "VENDOR_BRIDGE";
        case BackendKind::OpenCompute:   return "OPEN_COMPUTE";
        case BackendKind::UnifiedMemory: return "UNIFIED_MEMORY";
        case BackendKind::CpuFallback:   return "CPU_FALLBACK";
    }
    return "UNKNOWN";
}

enum class DevicePreference : uint8_t {
    Auto,
    GpuOnly,
    CpuOnly,
    NvidiaOnly,
    AmdOnly,
    IntelOnly
};

[[nodiscard]] constexpr std::string_view to_string(DevicePreference pref) noexcept {
    switch (pref) {
        case DevicePreference::Auto:       return "auto";
        case DevicePreference::GpuOnly:    return "gpu_only";
        case DevicePreference::CpuOnly:    return "cpu_only";
        case DevicePreference::NvidiaOnly: return "nvidia_only";
        case DevicePreference::AmdOnly:    return "amd_only";
        case DevicePreference::IntelOnly:  return "intel_only";
    }
    return "auto";
}

/**
 * @brief Parse a preference name (case-insensitive, '-' and '_' interchangeable).
 */
[[nodiscard]] std::optional<DevicePreference> parse_preference(std::string_view text);

// ─────────────────────────────────────────────
// Model Vocabulary
// ─────────────────────────────────────────────

enum class UnitType : uint8_t {
    Mlp,
    Rnn,
    Cnn
};

[[nodiscard]] constexpr std::string_view to_string(UnitType type) noexcept {
    switch (type) {
        case UnitType::Mlp: return "mlp";
        case UnitType::Rnn: return "rnn";
        case UnitType::Cnn: return "cnn";
    }
    return "unknown";
}

[[nodiscard]] std::optional<UnitType> parse_unit_type(std::string_view text);

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

enum class JobState : uint8_t {
    Initializing,
    Running,
    Paused,
    Stopping,
    Completed,
    Cancelled,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Initializing: return "initializing";
        case JobState::Running:      return "running";
        case JobState::Paused:       return "paused";
        case JobState::Stopping:     return "stopping";
        case JobState::Completed:    return "completed";
        case JobState::Cancelled:    return "cancelled";
        case JobState::Failed:       return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::Completed
        || state == JobState::Cancelled
        || state == JobState::Failed;
}

[[nodiscard]] std::optional<JobState> parse_job_state(std::string_view text);

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// Random RFC 4122 version-4 identifier.
[[nodiscard]] std::string generate_uuid();

/// ISO 8601 UTC timestamp with millisecond precision.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

/// Seconds since the Unix epoch, fractional.
[[nodiscard]] double to_unix_seconds(Timestamp ts) noexcept;

}  // namespace archetype
