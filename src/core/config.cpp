/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/types.hpp"

#include <toml++/toml.hpp>

namespace archetype {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            config.server.host = server["host"].value_or(std::string{"127.0.0.1"});
            config.server.port = static_cast<uint16_t>(
                server["port"].value_or(int64_t{8000}));
            config.server.worker_threads = static_cast<uint32_t>(
                server["worker_threads"].value_or(int64_t{8}));
            config.server.max_request_bytes = static_cast<uint64_t>(
                server["max_request_bytes"].value_or(int64_t{1048576}));
            config.server.max_streams = static_cast<uint32_t>(
                server["max_streams"].value_or(int64_t{32}));
            config.server.stream_send_timeout_ms = static_cast<uint32_t>(
                server["stream_send_timeout_ms"].value_or(int64_t{2000}));
        }

        // [devices]
        if (auto devices = tbl["devices"]; devices.is_table()) {
            config.devices.preference = devices["preference"].value_or(std::string{"auto"});
            config.devices.native_probe = devices["native_probe"].value_or(true);
            config.devices.vendor_bridge_probe = devices["vendor_bridge_probe"].value_or(true);
            config.devices.open_compute_probe = devices["open_compute_probe"].value_or(true);
            config.devices.unified_memory_probe = devices["unified_memory_probe"].value_or(true);
            config.devices.sysfs_root = devices["sysfs_root"].value_or(std::string{"/"});
            config.devices.nvidia_smi = devices["nvidia_smi"].value_or(std::string{"nvidia-smi"});
            config.devices.clinfo = devices["clinfo"].value_or(std::string{"clinfo"});
            config.devices.mock = devices["mock"].value_or(false);

            if (!parse_preference(config.devices.preference)) {
                return Error{ErrorCode::InvalidArgument,
                             "Unknown device preference: " + config.devices.preference};
            }
        }

        // [training]
        if (auto training = tbl["training"]; training.is_table()) {
            config.training.max_concurrent_jobs = static_cast<uint32_t>(
                training["max_concurrent_jobs"].value_or(int64_t{4}));
            config.training.default_epochs = static_cast<uint32_t>(
                training["default_epochs"].value_or(int64_t{100}));
            config.training.default_batch_size = static_cast<uint32_t>(
                training["default_batch_size"].value_or(int64_t{32}));
            config.training.epoch_yield_ms = static_cast<uint32_t>(
                training["epoch_yield_ms"].value_or(int64_t{10}));
        }

        // [storage]
        if (auto storage = tbl["storage"]; storage.is_table()) {
            config.storage.model_dir = storage["model_dir"].value_or(std::string{"./models"});
        }

        // [benchmark]
        if (auto bench = tbl["benchmark"]; bench.is_table()) {
            config.benchmark.matrix_size = static_cast<uint32_t>(
                bench["matrix_size"].value_or(int64_t{256}));
            config.benchmark.iterations = static_cast<uint32_t>(
                bench["iterations"].value_or(int64_t{10}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace archetype
