/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: main_worker.cpp

    Description:
        Entry point of the node worker executable. Runs the worker loop on
        the main thread until the scheduler answers REST.

    Command-Line Interface:
        $ ./benchsched_worker --scheduler kh01 --port 5000 \
              --logger-host kh02 --io-file /tmp/io_test_file

        The fileIO task needs an existing file of at least 4 KiB; it comes
        from --io-file or, failing that, the IO_FILE_PATH environment
        variable.

    Signals:
        SIGINT/SIGTERM stop the loop before the next request. A task that is
        already running is never interrupted, so the worker exits once it
        has reported that task.

    Exit Codes:
        0: scheduler sent REST (or stopped by signal between tasks)
        1: bad arguments, scheduler unreachable, registration refused or
           an unexpected internal error
        2: task failed or scheduler sent an unknown task type

*******************************************************************************/

#include "common/errors.h"
#include "common/logger.h"
#include "worker/worker.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
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
              << "  --scheduler HOST       Scheduler host (default: localhost)\n"
              << "  --port PORT            Scheduler port (default: 5000)\n"
              << "  --hostname NAME        Node id reported to the scheduler (default: gethostname)\n"
              << "  --logger-host HOST     Event logger host (default: no events)\n"
              << "  --logger-port PORT     Event logger port (default: 5001)\n"
              << "  --io-file PATH         Backing file for fileIO (default: $IO_FILE_PATH)\n"
              << "  --log-level LEVEL      debug, info, warning or error (default: info)\n"
              << "  --help                 Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    WorkerConfig config;
    LogLevel log_level = LogLevel::INFO;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--scheduler" && i + 1 < argc) {
                config.scheduler_host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                config.scheduler_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--hostname" && i + 1 < argc) {
                config.hostname = argv[++i];
            } else if (arg == "--logger-host" && i + 1 < argc) {
                config.events.host = argv[++i];
            } else if (arg == "--logger-port" && i + 1 < argc) {
                config.events.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--io-file" && i + 1 < argc) {
                config.io_file_path = argv[++i];
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

    if (config.io_file_path.empty()) {
        const char* env_path = std::getenv("IO_FILE_PATH");
        if (env_path) {
            config.io_file_path = env_path;
        }
    }

    Logger::set_level(log_level);
    Logger::set_component("worker");
    Logger::info("=== Benchmark Node Worker ===");

    Worker worker(config);

    // run() blocks the main thread, so the signal flag is forwarded from a
    // watcher thread.
    std::atomic<bool> finished(false);
    std::thread watcher([&worker, &finished]() {
        while (!finished) {
            if (shutdown_requested) {
                Logger::info("Shutdown requested; stopping after the current task");
                worker.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    int exit_code = 0;
    try {
        exit_code = worker.run() ? 0 : 1;
    } catch (const ExecutionError& e) {
        Logger::error(e.what());
        exit_code = 2;
    } catch (const ProtocolError& e) {
        Logger::error(std::string("Protocol error: ") + e.what());
        exit_code = 2;
    } catch (const std::exception& e) {
        Logger::error(std::string("Worker failed: ") + e.what());
        exit_code = 1;
    }

    finished = true;
    watcher.join();

    Logger::info("Worker " + worker.hostname() + " exiting after " +
                 std::to_string(worker.tasks_completed()) + " tasks");
    return exit_code;
}
