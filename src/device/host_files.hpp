/**
 * @file host_files.hpp
 * @brief Helpers for reading /proc and /sys style files.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archetype::host {

/// First line of a file, empty when unreadable.
[[nodiscard]] std::string read_file_line(const std::filesystem::path& path);

[[nodiscard]] std::vector<std::string> read_file_lines(const std::filesystem::path& path);

/// Whole file, or nullopt when it cannot be opened.
[[nodiscard]] std::optional<std::string> read_file(const std::filesystem::path& path);

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

[[nodiscard]] std::vector<std::string> split(std::string_view text, char delimiter);

/// Integer in decimal or 0x-prefixed hex; nullopt on garbage.
[[nodiscard]] std::optional<uint64_t> parse_uint(std::string_view text);

/// Float, tolerating "[N/A]" style placeholders by returning nullopt.
[[nodiscard]] std::optional<float> parse_float(std::string_view text);

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

[[nodiscard]] std::optional<MemInfo> parse_meminfo(const std::filesystem::path& path);

/// Aggregate jiffies from the first line of /proc/stat.
struct CpuTimes {
    uint64_t user{0}, nice{0}, system{0}, idle{0};
    uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
};

[[nodiscard]] std::optional<CpuTimes> read_cpu_times(const std::filesystem::path& path);

/// Busy share between two samples, 0-100.
[[nodiscard]] float cpu_busy_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept;

struct CpuInfo {
    uint32_t logical_cores{0};
    std::string model_name;
    std::vector<std::string> flags;

    [[nodiscard]] bool has_flag(std::string_view flag) const;
};

[[nodiscard]] std::optional<CpuInfo> parse_cpuinfo(const std::filesystem::path& path);

/// PCI vendor id (0x10de, 0x1002, 0x8086) to vendor.
[[nodiscard]] Vendor vendor_from_pci_id(uint64_t pci_vendor) noexcept;

/// Best-effort vendor from a free-form vendor or product string.
[[nodiscard]] Vendor vendor_from_name(std::string_view name);

}  // namespace archetype::host
