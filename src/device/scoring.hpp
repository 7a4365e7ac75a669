/**
 * @file scoring.hpp
 * @brief Per-backend performance heuristics.
 *
 * Scores are relative rankings in [0, 1000], not measured throughput.
 * Each backend weighs the facts it can observe; CPU scores are capped so a
 * large host never outranks a working accelerator.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace archetype {

inline constexpr uint32_t kMaxPerformanceScore = 1000;
inline constexpr uint32_t kMaxCpuScore = 300;

struct ComputeCapability {
    uint32_t major{0};
    uint32_t minor{0};
};

/// Parse "8.6" style capability strings.
[[nodiscard]] std::optional<ComputeCapability> parse_compute_capability(std::string_view text);

[[nodiscard]] uint32_t score_native_accel(uint64_t memory_mb, uint32_t compute_units,
                                          std::optional<ComputeCapability> capability);

[[nodiscard]] uint32_t score_vendor_bridge(uint64_t memory_mb, bool discrete);

[[nodiscard]] uint32_t score_open_compute(uint64_t memory_mb, uint32_t compute_units, bool is_gpu);

[[nodiscard]] uint32_t score_unified_memory(uint64_t memory_mb, uint32_t compute_units);

[[nodiscard]] uint32_t score_cpu(uint32_t cores, uint64_t memory_mb);

}  // namespace archetype
