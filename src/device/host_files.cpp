/**
 * @file host_files.cpp
 * @brief Helpers for reading /proc and /sys style files.
 */

#include "device/host_files.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace archetype::host {

std::string read_file_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) return std::nullopt;
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

std::string_view trim(std::string_view text) noexcept {
    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\0';
    };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

std::vector<std::string> split(std::string_view text, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<uint64_t> parse_uint(std::string_view text) {
    text = trim(text);
    int base = 10;
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty()) return std::nullopt;
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::optional<float> parse_float(std::string_view text) {
    text = trim(text);
    if (text.empty() || text.front() == '[') return std::nullopt;
    try {
        size_t consumed = 0;
        float value = std::stof(std::string{text}, &consumed);
        if (consumed == 0) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<MemInfo> parse_meminfo(const std::filesystem::path& path) {
    auto lines = read_file_lines(path);
    if (lines.empty()) return std::nullopt;

    MemInfo info;
    uint64_t free_kb = 0;
    for (const auto& line : lines) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        } else if (line.starts_with("MemFree:")) {
            std::istringstream iss(line.substr(8));
            iss >> free_kb;
        }
    }
    if (info.total_kb == 0) return std::nullopt;
    // Kernels before 3.14 have no MemAvailable
    if (info.available_kb == 0) info.available_kb = free_kb;
    return info;
}

std::optional<CpuTimes> read_cpu_times(const std::filesystem::path& path) {
    auto line = read_file_line(path);
    if (!line.starts_with("cpu ")) return std::nullopt;

    // Format: "cpu user nice system idle iowait irq softirq steal ..."
    CpuTimes times;
    std::string label;
    std::istringstream iss(line);
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

float cpu_busy_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept {
    auto total = [](const CpuTimes& t) {
        return t.user + t.nice + t.system + t.idle + t.iowait + t.irq + t.softirq + t.steal;
    };
    auto active = [](const CpuTimes& t) {
        return t.user + t.nice + t.system + t.irq + t.softirq + t.steal;
    };

    auto prev_total = total(prev);
    auto curr_total = total(curr);
    if (curr_total <= prev_total) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = active(curr) >= active(prev) ? active(curr) - active(prev) : 0;
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

bool CpuInfo::has_flag(std::string_view flag) const {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

std::optional<CpuInfo> parse_cpuinfo(const std::filesystem::path& path) {
    auto lines = read_file_lines(path);
    if (lines.empty()) return std::nullopt;

    CpuInfo info;
    for (const auto& line : lines) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        auto key = trim(std::string_view{line}.substr(0, colon));
        auto value = trim(std::string_view{line}.substr(colon + 1));

        if (key == "processor") {
            ++info.logical_cores;
        } else if (info.model_name.empty()
                   && (key == "model name" || key == "Model" || key == "Hardware")) {
            info.model_name = std::string{value};
        } else if (info.flags.empty() && (key == "flags" || key == "Features")) {
            std::istringstream iss{std::string{value}};
            std::string flag;
            while (iss >> flag) info.flags.push_back(flag);
        }
    }
    if (info.logical_cores == 0) return std::nullopt;
    return info;
}

Vendor vendor_from_pci_id(uint64_t pci_vendor) noexcept {
    switch (pci_vendor) {
        case 0x10de: return Vendor::Nvidia;
        case 0x1002: return Vendor::Amd;
        case 0x8086: return Vendor::Intel;
        case 0x106b: return Vendor::Apple;
        default:     return Vendor::Unknown;
    }
}

Vendor vendor_from_name(std::string_view name) {
    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("nvidia") != std::string::npos) return Vendor::Nvidia;
    if (lower.find("advanced micro") != std::string::npos
        || lower.find("amd") != std::string::npos) return Vendor::Amd;
    if (lower.find("intel") != std::string::npos) return Vendor::Intel;
    if (lower.find("apple") != std::string::npos) return Vendor::Apple;
    return Vendor::Unknown;
}

}  // namespace archetype::host
