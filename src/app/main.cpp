/**
 * @file main.cpp
 * @brief EdgeSentinel daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Config (TOML + EDGE_SENTINEL_* env) → Logger → EdgeRuntime → wait for
 * SIGINT/SIGTERM → graceful shutdown.
 */

#include "core/config.hpp"
#include "core/log_sink.hpp"
#include "core/logger.hpp"
#include "runtime/edge_runtime.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace edge_sentinel;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_signal_number = 0;

void signal_handler(int signal) {
    g_signal_number = signal;
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║           EdgeSentinel v1.0.0             ║
  ║   Self-healing runtime for edge devices   ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/edge_sentinel.toml";
    std::string device_id;
    std::string log_dir;
    bool once = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--device-id" && i + 1 < argc) {
            args.device_id = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: edge_sentinel [OPTIONS]\n"
                      << "  --config <path>     Configuration file (default: config/edge_sentinel.toml)\n"
                      << "  --device-id <id>    Device identifier\n"
                      << "  --log-dir <path>    Log output directory (default: stdout)\n"
                      << "  --once              Start, emit one heartbeat, shut down\n"
                      << "  --help, -h          Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (auto env_result = apply_env_overrides(config); !env_result) {
        std::cerr << "Invalid environment override: " << env_result.error().message << std::endl;
        return 2;
    }

    // Apply CLI overrides
    if (!args.device_id.empty()) config.device.id = args.device_id;
    if (!args.log_dir.empty()) config.logging.dir = args.log_dir;

    auto level = parse_log_level(config.logging.level);
    if (!level) {
        std::cerr << level.error().message << "; using info" << std::endl;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.logging.dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.logging.dir, "edge_sentinel",
                                                  config.logging.max_file_size_mb,
                                                  config.logging.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    EdgeRuntime::Options options;
    options.config = std::move(config);
    options.log_sink = std::move(log_sink);
    options.log_level = level ? *level : LogLevel::Info;
    EdgeRuntime runtime(std::move(options));
    auto& logger = runtime.logger();

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = runtime.start(); !started) {
        logger.error("Runtime failed to start: " + started.error().message);
        return 1;
    }

    if (args.once) {
        if (auto sampled = runtime.health().sample_now(); !sampled) {
            logger.warn("No health sample for the heartbeat: " + sampled.error().message);
        }
        runtime.emit_heartbeat();
        runtime.shutdown();
        return 0;
    }

    logger.info("Waiting for SIGINT/SIGTERM. Press Ctrl+C to shutdown.");
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger.warn("Signal " + std::to_string(static_cast<int>(g_signal_number))
                + " received, shutting down");
    runtime.shutdown();
    return 0;
}
