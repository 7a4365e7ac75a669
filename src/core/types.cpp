/**
 * @file types.cpp
 * @brief Parsers and small helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace archetype {

namespace {

std::string normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '-') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

}  // anonymous namespace

std::optional<DevicePreference> parse_preference(std::string_view text) {
    auto key = normalize(text);
    constexpr std::array prefs = {
        DevicePreference::Auto, DevicePreference::GpuOnly, DevicePreference::CpuOnly,
        DevicePreference::NvidiaOnly, DevicePreference::AmdOnly, DevicePreference::IntelOnly
    };
    for (auto pref : prefs) {
        if (key == to_string(pref)) return pref;
    }
    return std::nullopt;
}

std::optional<UnitType> parse_unit_type(std::string_view text) {
    auto key = normalize(text);
    if (key == "mlp") return UnitType::Mlp;
    if (key == "rnn") return UnitType::Rnn;
    if (key == "cnn") return UnitType::Cnn;
    return std::nullopt;
}

std::optional<JobState> parse_job_state(std::string_view text) {
    auto key = normalize(text);
    constexpr std::array states = {
        JobState::Initializing, JobState::Running, JobState::Paused, JobState::Stopping,
        JobState::Completed, JobState::Cancelled, JobState::Failed
    };
    for (auto state : states) {
        if (key == to_string(state)) return state;
    }
    return std::nullopt;
}

std::string generate_uuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string format_iso8601(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t_ts, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

double to_unix_seconds(Timestamp ts) noexcept {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

}  // namespace archetype
