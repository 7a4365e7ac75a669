/**
 * @file main.cpp
 * @brief archetype service entry point.
 *
 * Loads configuration, applies CLI overrides, then runs the AppContext
 * until SIGINT or SIGTERM.
 */

#include "app/app_context.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace archetype;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║             archetype v1.0.0              ║
  ║   Local Device-Aware Training Service     ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> log_dir;
    std::optional<std::string> log_level;
    std::optional<std::string> preference;
    bool list_devices = false;
};

void print_usage() {
    std::cout << "Usage: archetype [OPTIONS]\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --host <addr>          HTTP bind address\n"
              << "  --port <port>          HTTP port\n"
              << "  --log-dir <path>       Log output directory (empty logs to stdout)\n"
              << "  --log-level <level>    debug, info, warn or error\n"
              << "  --preference <pref>    auto, gpu_only, cpu_only, nvidia_only, amd_only, intel_only\n"
              << "  --list-devices         Discover devices, print them as JSON, then exit\n"
              << "  --help, -h             Show this help message\n";
}

std::optional<uint16_t> parse_port(std::string_view text) {
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return port;
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--host" && has_value) {
            args.host = argv[++i];
        } else if (arg == "--port" && has_value) {
            args.port = parse_port(argv[++i]);
            if (!args.port) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            args.log_level = argv[++i];
        } else if (arg == "--preference" && has_value) {
            args.preference = argv[++i];
        } else if (arg == "--list-devices") {
            args.list_devices = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

int list_devices(const Config& config) {
    Logger logger(std::make_unique<NullSink>());
    DeviceCatalog catalog(logger);
    for (auto& probe : make_configured_probes(config.devices)) {
        catalog.register_probe(std::move(probe));
    }
    auto devices = nlohmann::json::array();
    for (const auto& device : catalog.discover()) devices.push_back(device);
    std::cout << devices.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) return 2;

    // Load configuration
    auto config_result = load_config(args->config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args->host) config.server.host = *args->host;
    if (args->port) config.server.port = *args->port;
    if (args->log_dir) config.telemetry.log_dir = *args->log_dir;
    if (args->log_level) {
        if (!parse_log_level(*args->log_level)) {
            std::cerr << "Unknown log level: " << *args->log_level << std::endl;
            return 2;
        }
        config.telemetry.log_level = *args->log_level;
    }
    if (args->preference) {
        if (!parse_preference(*args->preference)) {
            std::cerr << "Unknown device preference: " << *args->preference << std::endl;
            return 2;
        }
        config.devices.preference = *args->preference;
    }

    if (args->list_devices) {
        return list_devices(config);
    }

    print_banner();

    AppContext::Options opts;
    opts.config = config;
    AppContext app(std::move(opts));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto port = app.start();
    if (!port) {
        std::cerr << "Failed to start: " << port.error().message << std::endl;
        return 1;
    }
    std::cout << "Listening on http://" << config.server.host << ":" << *port
              << " (Ctrl+C to stop)" << std::endl;

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    app.logger().info("Shutdown requested. Cleaning up...");
    app.stop();
    return 0;
}
