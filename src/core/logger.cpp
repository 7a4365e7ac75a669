/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace archetype {

std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    log(level, message, nlohmann::json());
}

void Logger::log(LogLevel level, std::string_view message, const nlohmann::json& fields) {
    if (level < min_level_.load()) return;

    // Invalid UTF-8 is replaced rather than thrown on.
    auto dump = [](const nlohmann::json& value) {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    };

    std::string line = R"({"level":")" + std::string(to_string(level)) + R"(",)"
        + R"("ts":")" + format_iso8601(std::chrono::system_clock::now()) + R"(",)"
        + R"("msg":)" + dump(nlohmann::json(std::string(message)));
    if (fields.is_object()) {
        for (const auto& [key, value] : fields.items()) {
            if (key == "level" || key == "ts" || key == "msg") continue;
            line += "," + dump(nlohmann::json(key)) + ":" + dump(value);
        }
    }
    line += "}";

    std::lock_guard lock(mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_.load(); }

}  // namespace archetype
