/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: main_scheduler.cpp

    Description:
        Entry point of the scheduler executable. Seeds the task set, starts
        the scheduler server and prints statistics until SIGINT/SIGTERM.

    Command-Line Interface:
        $ ./benchsched_scheduler
        (port 5000, the default 13-task mix, LIFO pop order, no event logger)

        $ ./benchsched_scheduler --tasks matmul,primes --pop-order fifo \
              --logger-host kh02 --logger-port 5001

    Exit Codes:
        0: clean shutdown
        1: bad arguments or the server could not start

*******************************************************************************/

#include "common/logger.h"
#include "common/message.h"
#include "scheduler/scheduler.h"
#include "scheduler/scheduler_state.h"
#include "tasks/task_catalog.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
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
              << "  --host ADDR            Bind address (default: all interfaces)\n"
              << "  --port PORT            Listen port (default: 5000)\n"
              << "  --tasks LIST           Comma-separated task types, e.g. matmul,primes\n"
              << "                         (default: 3 array, 2 fileIO, 3 matmul, 5 primes)\n"
              << "  --shuffle              Shuffle the task set before serving it\n"
              << "  --seed N               Shuffle seed (default: random)\n"
              << "  --pop-order ORDER      lifo or fifo (default: lifo)\n"
              << "  --strict-finish        Count a FINISH with no in-flight task as a protocol error\n"
              << "  --logger-host HOST     Event logger host (default: no events)\n"
              << "  --logger-port PORT     Event logger port (default: 5001)\n"
              << "  --stats-interval SEC   Statistics period, 0 to disable (default: 5)\n"
              << "  --log-level LEVEL      debug, info, warning or error (default: info)\n"
              << "  --help                 Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    SchedulerConfig config;
    std::string task_list;
    bool shuffle = false;
    bool seed_given = false;
    unsigned int seed = 0;
    PopOrder pop_order = PopOrder::LIFO;
    int stats_interval_sec = 5;
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
            } else if (arg == "--tasks" && i + 1 < argc) {
                task_list = argv[++i];
            } else if (arg == "--shuffle") {
                shuffle = true;
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
                seed_given = true;
            } else if (arg == "--pop-order" && i + 1 < argc) {
                std::string order = argv[++i];
                if (!pop_order_from_string(order, pop_order)) {
                    std::cerr << "Invalid pop order: " << order << "\n";
                    return 1;
                }
            } else if (arg == "--strict-finish") {
                config.strict_finish = true;
            } else if (arg == "--logger-host" && i + 1 < argc) {
                config.events.host = argv[++i];
            } else if (arg == "--logger-port" && i + 1 < argc) {
                config.events.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--stats-interval" && i + 1 < argc) {
                stats_interval_sec = std::stoi(argv[++i]);
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
    Logger::set_component("scheduler");
    Logger::info("=== Benchmark Task Scheduler ===");

    std::vector<TaskSpec> tasks;
    try {
        tasks = task_list.empty() ? default_task_set() : parse_task_list(task_list);
    } catch (const std::exception& e) {
        Logger::error(std::string("Invalid task list: ") + e.what());
        return 1;
    }

    if (shuffle) {
        std::mt19937 rng(seed_given ? seed : std::random_device{}());
        std::shuffle(tasks.begin(), tasks.end(), rng);
    }

    SchedulerState state(std::move(tasks), pop_order);
    Scheduler scheduler(config, state);

    if (!scheduler.start()) {
        Logger::error("Failed to start scheduler");
        return 1;
    }

    if (config.events.host.empty()) {
        Logger::info("No event logger configured; lifecycle events disabled");
    } else {
        Logger::info("Sending lifecycle events to " + config.events.host + ":" +
                     std::to_string(config.events.port));
    }
    Logger::info("Scheduler running. Press Ctrl+C to stop.");

    auto last_stats = std::chrono::steady_clock::now();
    while (!shutdown_requested && scheduler.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (stats_interval_sec > 0 &&
            std::chrono::steady_clock::now() - last_stats >= std::chrono::seconds(stats_interval_sec)) {
            scheduler.print_statistics();
            last_stats = std::chrono::steady_clock::now();
        }
    }

    Logger::info("Shutting down...");
    scheduler.stop();
    scheduler.print_statistics();
    Logger::info("Scheduler stopped");

    return 0;
}
