/**
 * Trilobot v0.8 - Avoider Daemon
 *
 * Main entry point for the obstacle avoidance loop.
 *
 * Responsibilities:
 * - Load configuration (JSON)
 * - Bring up the frame source (VL53L5CX frames, replayed from a recording)
 * - Run the MotionController until SIGINT/SIGTERM or sensor failure
 * - Leave the motors stopped on every exit path
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <string>
#include <getopt.h>

#include "config_store.h"
#include "error_handler.h"
#include "logger.h"
#include "logging_actuator.h"
#include "motion_controller.h"
#include "pacer.h"
#include "replay_sensor.h"
#include "sensor_frame_source.h"

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --replay FILE [options]\n"
              << "Options:\n"
              << "  --config PATH       Load configuration from JSON file\n"
              << "  --replay PATH       Play back recorded VL53L5CX frames (JSON)\n"
              << "  --dry-run           Run the decision loop with the drive disabled\n"
              << "  --save-config PATH  Write the effective configuration and exit\n"
              << "  --log-level LEVEL   Set log level: DEBUG, INFO, WARN, ERROR (default: INFO)\n"
              << "  --log-file PATH     Log to file (in addition to stdout)\n"
              << "  -q, --quiet         No console logging (use with --log-file)\n"
              << "  -h, --help          Show this help\n";
}

int main(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config",      required_argument, 0, 'c'},
        {"replay",      required_argument, 0, 'r'},
        {"dry-run",     no_argument,       0, 'd'},
        {"save-config", required_argument, 0, 's'},
        {"log-level",   required_argument, 0, 'l'},
        {"log-file",    required_argument, 0, 'f'},
        {"quiet",       no_argument,       0, 'q'},
        {"help",        no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    std::string config_path;
    std::string replay_path;
    std::string save_path;
    std::string log_level = "INFO";
    std::string log_file;
    bool dry_run = false;
    bool quiet = false;

    int opt;
    while ((opt = getopt_long(argc, argv, "c:r:ds:l:f:qh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            config_path = optarg;
            break;
        case 'r':
            replay_path = optarg;
            break;
        case 'd':
            dry_run = true;
            break;
        case 's':
            save_path = optarg;
            break;
        case 'l':
            log_level = optarg;
            break;
        case 'f':
            log_file = optarg;
            break;
        case 'q':
            quiet = true;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!Logger::instance().setLevel(log_level)) {
        std::cerr << "Unknown log level: " << log_level << std::endl;
        return 1;
    }
    if (!log_file.empty()) {
        if (!Logger::instance().openFile(log_file)) {
            std::cerr << "Warning: Could not open log file: " << log_file << std::endl;
        }
    }

    if (quiet) {
        Logger::instance().setConsole(false);
    }

    LOG_INFO("Main", "Trilobot v0.8 avoider starting...");

    ConfigStore config;
    if (!config_path.empty() && !config.load(config_path)) {
        LOG_ERROR("Main", "Configuration rejected: %s", config.lastError().c_str());
        return 1;
    }
    if (dry_run) {
        config.drive_enabled = false;
    }

    if (!save_path.empty()) {
        if (!config.save(save_path)) {
            LOG_ERROR("Main", "Could not save configuration: %s", config.lastError().c_str());
            return 1;
        }
        LOG_INFO("Main", "Configuration written to %s", save_path.c_str());
        return 0;
    }

    if (config.isUltrasonic()) {
        LOG_ERROR("Main", "Ultrasonic configuration needs a board driver; this build only replays ToF frames");
        return 1;
    }
    if (replay_path.empty()) {
        LOG_ERROR("Main", "No VL53L5CX driver in this build, use --replay");
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ReplaySensor sensor;
    if (!sensor.loadFromFile(replay_path)) {
        LOG_ERROR("Main", "Replay file rejected: %s", sensor.lastError().c_str());
        return 1;
    }

    LOG_INFO("Main", "Units: %s, collision threshold %d %s",
             config.units.c_str(), config.collision_threshold, config.units.c_str());

    SystemPacer pacer(g_shutdown);
    LoggingActuator actuator;
    ErrorHandler errors;
    SensorFrameSource source(sensor, pacer, config.tof, config.tof_ready_wait_ms);

    if (!source.init()) {
        LOG_ERROR("Main", "Frame source initialization failed");
        actuator.setMotorSpeeds(0.0f, 0.0f);
        return 1;
    }

    MotionController controller(source, actuator, pacer, errors, config.motionProfile(),
                                TurnDecisionEngine(config.turnPolicy()),
                                ZoneAverager(config.averagingMode()));

    RunResult result = controller.run();
    source.shutdown();

    if (result == RunResult::SENSOR_FAILURE) {
        LOG_ERROR("Main", "Stopped on sensor failure");
        return 2;
    }

    LOG_INFO("Main", "Exiting by Ctrl/C");
    return 0;
}
