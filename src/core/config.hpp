/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace archetype {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    uint32_t worker_threads = 8;
    uint64_t max_request_bytes = 1048576;
    uint32_t max_streams = 32;
    uint32_t stream_send_timeout_ms = 2000;
};

struct DeviceConfig {
    std::string preference = "auto";    ///< auto, gpu_only, cpu_only, nvidia_only, amd_only, intel_only
    bool native_probe = true;
    bool vendor_bridge_probe = true;
    bool open_compute_probe = true;
    bool unified_memory_probe = true;
    std::filesystem::path sysfs_root = "/";
    std::string nvidia_smi = "nvidia-smi";
    std::string clinfo = "clinfo";
    bool mock = false;
};

struct TrainingConfig {
    uint32_t max_concurrent_jobs = 4;
    uint32_t default_epochs = 100;
    uint32_t default_batch_size = 32;
    uint32_t epoch_yield_ms = 10;
};

struct StorageConfig {
    std::filesystem::path model_dir = "./models";
};

struct BenchmarkConfig {
    uint32_t matrix_size = 256;
    uint32_t iterations = 10;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    ServerConfig server;
    DeviceConfig devices;
    TrainingConfig training;
    StorageConfig storage;
    BenchmarkConfig benchmark;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace archetype
