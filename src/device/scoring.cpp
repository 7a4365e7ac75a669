/**
 * @file scoring.cpp
 * @brief Per-backend performance heuristics.
 */

#include "device/scoring.hpp"

#include <algorithm>
#include <charconv>

namespace archetype {

namespace {

uint32_t clamp_score(double raw, uint32_t cap = kMaxPerformanceScore) {
    if (raw <= 0.0) return 0;
    return static_cast<uint32_t>(std::min(raw, static_cast<double>(cap)));
}

double gigabytes(uint64_t memory_mb) {
    return static_cast<double>(memory_mb) / 1024.0;
}

}  // anonymous namespace

std::optional<ComputeCapability> parse_compute_capability(std::string_view text) {
    auto dot = text.find('.');
    if (dot == std::string_view::npos) return std::nullopt;

    ComputeCapability cap;
    auto major = text.substr(0, dot);
    auto minor = text.substr(dot + 1);
    auto [p1, ec1] = std::from_chars(major.data(), major.data() + major.size(), cap.major);
    auto [p2, ec2] = std::from_chars(minor.data(), minor.data() + minor.size(), cap.minor);
    if (ec1 != std::errc{} || ec2 != std::errc{}) return std::nullopt;
    return cap;
}

uint32_t score_native_accel(uint64_t memory_mb, uint32_t compute_units,
                            std::optional<ComputeCapability> capability) {
    double score = 25.0 * gigabytes(memory_mb) + 3.0 * compute_units;
    if (capability) {
        score += 4.0 * (10.0 * capability->major + capability->minor);
    }
    return clamp_score(score);
}

uint32_t score_vendor_bridge(uint64_t memory_mb, bool discrete) {
    double score = 25.0 * gigabytes(memory_mb);
    if (discrete) score += 150.0;
    return clamp_score(score);
}

uint32_t score_open_compute(uint64_t memory_mb, uint32_t compute_units, bool is_gpu) {
    double score = 20.0 * gigabytes(memory_mb) + 4.0 * compute_units;
    if (is_gpu) score += 100.0;
    return clamp_score(score);
}

uint32_t score_unified_memory(uint64_t memory_mb, uint32_t compute_units) {
    return clamp_score(10.0 * gigabytes(memory_mb) + 5.0 * compute_units + 200.0);
}

uint32_t score_cpu(uint32_t cores, uint64_t memory_mb) {
    return clamp_score(8.0 * cores + 2.0 * gigabytes(memory_mb), kMaxCpuScore);
}

}  // namespace archetype
