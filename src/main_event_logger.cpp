/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: main_event_logger.cpp

    Description:
        Entry point of the event logger executable. Collects lifecycle events
        until SIGINT/SIGTERM, then drains in-flight connections, exports a
        final snapshot to <output-dir>/logger_data_<timestamp>.json and prints
        the summary.

    Command-Line Interface:
        $ ./benchsched_logger --port 5001 --output-dir logs --export-interval 30

*******************************************************************************/

#include "common/logger.h"
#include "event_logger/event_logger_server.h"
#include "event_logger/event_store.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <signal.h>
#include <thread>

using namespace benchsched;

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --host ADDR             Bind address (default: all interfaces)\n"
              << "  --port PORT             Listen port (default: 5001)\n"
              << "  --output-dir DIR        Snapshot directory (default: logs)\n"
              << "  --export-interval SEC   Periodic export, 0 = at shutdown only (default: 0)\n"
              << "  --read-timeout-ms MS    Per-connection read timeout (default: 2000)\n"
              << "  --log-level LEVEL       debug, info, warning or error (default: info)\n"
              << "  --help                  Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    EventLoggerConfig config;
    LogLevel log_level = LogLevel::INFO;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--host" && i + 1 < argc) {
                config.bind_host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                config.listen_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--output-dir" && i + 1 < argc) {
                config.output_dir = argv[++i];
            } else if (arg == "--export-interval" && i + 1 < argc) {
                config.export_interval_sec = std::stoi(argv[++i]);
            } else if (arg == "--read-timeout-ms" && i + 1 < argc) {
                config.read_timeout_ms = std::stoi(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                log_level = Logger::parse_level(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    Logger::set_level(log_level);
    Logger::set_component("event-logger");
    Logger::info("=== Benchmark Event Logger ===");

    EventStore store;
    EventLoggerServer server(config, store);

    if (!server.start()) {
        Logger::error("Failed to start event logger");
        return 1;
    }

    Logger::info("Event logger running. Press Ctrl+C to stop.");

    while (!shutdown_requested && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Shutting down...");
    server.stop();

    std::string path;
    try {
        path = server.export_snapshot();
    } catch (const std::exception& e) {
        Logger::error(std::string("Final snapshot export threw: ") + e.what());
    }
    if (path.empty()) {
        Logger::error("Final snapshot export failed");
    }
    store.print_summary();

    Logger::info("Accepted " + std::to_string(server.events_accepted()) + " events, rejected " +
                 std::to_string(server.events_rejected()) + ", served " +
                 std::to_string(server.queries_served()) + " queries");

    return path.empty() ? 1 : 0;
}
