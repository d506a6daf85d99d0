/**
 * @file main.cpp
 * @brief Footfall entry point
 *
 * Threaded layout:
 * - Worker thread (PipelineRunner): reads frames, detects, tracks and keeps sessions
 * - Main thread: monitors the run, handles signals and config reloads
 */

#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"
#include "footfall/core/types.hpp"

#include "footfall/pipeline/publisher.hpp"
#include "footfall/pipeline/runner.hpp"
#include "footfall/pipeline/scene.hpp"
#include "footfall/session/session_report.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true, std::memory_order_release);
    } else if (signal == SIGHUP) {
        g_reload_requested.store(true, std::memory_order_release);
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Path to configuration file (default: config/default.yaml)\n"
              << "  --help             Show this help message\n"
              << "  --version          Show version information\n"
              << "\n"
              << "Configuration can also be overridden via command line:\n"
              << "  --capture.source=file --capture.uri=walkway.mp4\n"
              << "  --detection.backend=dnn --detection.model_path=models/person.xml\n"
              << "  --tracking.similarity_threshold=0.7\n"
              << "  --report.path=sessions.yaml\n"
              << "\n"
              << "Send SIGHUP to reload the configuration file (scene and tracking settings).\n"
              << std::endl;
}

void print_version() {
    std::cout << "Footfall v1.0.0\n"
              << "Build type: "
#ifdef NDEBUG
              << "Release"
#else
              << "Debug"
#endif
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace footfall;

    // Parse command line for --help and --version first
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        }
    }

    // Load configuration
    Config& config = global_config();

    std::string config_path = "config/default.yaml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        }
    }

    if (!config.load(config_path)) {
        std::cerr << "Failed to load configuration from: " << config_path << std::endl;
        return 1;
    }

    // Apply command-line overrides
    config.parse_args(argc, argv);

    // Initialize logging
    if (!Logger::init(config.get_string("logging.file", ""),
                      parse_log_level(config.get_string("logging.console_level", "info")),
                      parse_log_level(config.get_string("logging.file_level", "debug")))) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    LOG_INFO("=== Footfall Starting ===");
    LOG_INFO("Configuration loaded from: {}", config_path);

    // Install signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    // ========================================================================
    // Scene
    // ========================================================================

    SceneRegistry scene;
    scene.load(config);

    config.on_change("*", [&scene, &config](const std::string& /* key */) {
        scene.load(config);
    });

    // ========================================================================
    // Runner
    // ========================================================================

    SnapshotPublisher publisher;
    PipelineRunner runner(scene, publisher);

    runner.state_machine().on_state_change([](RunState old_state, RunState new_state) {
        LOG_INFO("Run state: {} -> {}", to_string(old_state), to_string(new_state));
    });

    if (!runner.initialize(config)) {
        LOG_ERROR("Failed to initialize pipeline runner");
        Logger::shutdown();
        return 1;
    }

    runner.start();

    // ========================================================================
    // Main Loop (Monitoring)
    // ========================================================================

    LOG_INFO("Entering main loop");
    LOG_INFO("Press Ctrl+C to stop");

    auto last_log = Clock::now();
    const auto status_interval = std::chrono::seconds(config.get_int("runner.status_interval_s", 30));

    while (!g_shutdown_requested.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (g_reload_requested.exchange(false, std::memory_order_acq_rel)) {
            LOG_INFO("Reload requested");
            if (!config.reload()) {
                LOG_WARN("Reload failed, keeping current scene");
            }
        }

        if (!runner.is_running()) {
            LOG_INFO("Run ended: {}", runner.state_machine().state_string());
            break;
        }

        auto now = Clock::now();
        if (now - last_log > status_interval) {
            RunnerStats stats = runner.get_stats();
            LOG_INFO("System status: state={}, frames={}, sessions={} ({} active)",
                     runner.state_machine().state_string(), stats.frames_processed,
                     stats.total_sessions, stats.active_sessions);
            last_log = now;
        }
    }

    // ========================================================================
    // Shutdown
    // ========================================================================

    LOG_INFO("Shutting down...");
    runner.stop();

    bool failed = runner.state() == RunState::ERROR;

    FrameSnapshotPtr last = publisher.latest();
    std::vector<Session> sessions = last ? last->sessions : std::vector<Session>{};

    size_t closed = 0;
    for (const auto& session : sessions) {
        if (session.state() == SessionState::CLOSED) {
            closed++;
        }
    }
    RunnerStats stats = runner.get_stats();
    LOG_INFO("Summary: frames={}, entries={}, exits={}, sessions={} ({} closed)",
             stats.frames_processed, stats.entries, stats.exits, sessions.size(), closed);

    std::string report_path = config.get_string("report.path", "");
    if (!report_path.empty() && !write_report(report_path, sessions)) {
        failed = true;
    }

    Logger::flush();
    Logger::shutdown();

    std::cout << "Footfall stopped." << std::endl;
    return failed ? 1 : 0;
}
