/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: logger.h

    Description:
        Diagnostic logging for every process in the system (scheduler, node
        workers, event logger). Header-only apart from the static members in
        logger.cpp.

        Core Features:
        - Thread-safe output (one process-wide mutex)
        - Level filtering (DEBUG, INFO, WARNING, ERROR) checked before locking
        - Millisecond timestamps so lines from different nodes can be lined up
        - Optional component tag ("scheduler", "worker", "event-logger")

    Naming Note:
        This is NOT the event logger service. The service that ingests
        TASK_ASSIGNED / TASK_FINISHED events lives in event_logger/ and is
        called EventStore / EventLoggerServer in code. This class only prints
        diagnostics to stdout.

    Output Format:
        [2025-11-20 14:32:15.123] [INFO] [scheduler] Assigned task 'matmul' to node-1
        [2025-11-20 14:32:15.124] [WARN] Node 10.0.0.4 sent FINISH with no task

    Typical Usage:
        #include "common/logger.h"
        using namespace benchsched;

        Logger::set_level(Logger::parse_level("debug"));
        Logger::set_component("worker");
        Logger::info("Registered with scheduler");

*******************************************************************************/

//==============================================================================
// TABLE OF CONTENTS
//==============================================================================
//
// 1. INCLUDE DEPENDENCIES
// 2. LOG LEVEL ENUMERATION
// 3. LOGGER CLASS
//    3.1 Private Static Members
//    3.2 Timestamp / Level Helpers
//    3.3 Configuration (set_level, parse_level, set_component)
//    3.4 Core Logging (log) and Convenience Methods
//
//==============================================================================

#ifndef LOGGER_H
#define LOGGER_H

//==============================================================================
// SECTION 1: INCLUDE DEPENDENCIES
//==============================================================================

#include <string>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace benchsched {

//==============================================================================
// SECTION 2: LOG LEVEL ENUMERATION
//==============================================================================
//
// Ordered by severity so that filtering is a single integer comparison:
// a message is printed when level >= current_level_.
//
//==============================================================================

enum class LogLevel {
    DEBUG = 0,      // Per-message protocol traces, raw event text
    INFO = 1,       // Registrations, assignments, completions (default)
    WARNING = 2,    // Protocol anomalies that are tolerated
    ERROR = 3       // Failed sockets, failed tasks, unusable messages
};

//==============================================================================
// SECTION 3: LOGGER CLASS
//==============================================================================

class Logger {
private:
    //--------------------------------------------------------------------------
    // 3.1 Private Static Members
    //--------------------------------------------------------------------------
    //
    // current_level_ is written once at startup (from --log-level) and read by
    // every thread afterwards; component_ likewise. mutex_ serializes the
    // actual write to std::cout so lines from concurrent connection handlers
    // never interleave.
    //
    static LogLevel current_level_;
    static std::string component_;
    static std::mutex mutex_;

    //--------------------------------------------------------------------------
    // 3.2 Timestamp / Level Helpers
    //--------------------------------------------------------------------------

    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm;
        localtime_r(&time, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
        }
    }

public:
    //--------------------------------------------------------------------------
    // 3.3 Configuration
    //--------------------------------------------------------------------------

    static void set_level(LogLevel level) {
        current_level_ = level;
    }

    static LogLevel get_level() {
        return current_level_;
    }

    // parse_level()
    // -------------
    // Maps the --log-level flag value to a LogLevel. Case-insensitive; accepts
    // "warn" as an alias for "warning". Unrecognized input falls back to INFO
    // so a typo on the command line never silences errors.
    static LogLevel parse_level(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
        if (lower == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    // Tag printed after the level on every line. Empty tag prints nothing.
    static void set_component(const std::string& component) {
        std::lock_guard<std::mutex> lock(mutex_);
        component_ = component;
    }

    //--------------------------------------------------------------------------
    // 3.4 Core Logging
    //--------------------------------------------------------------------------

    static void log(LogLevel level, const std::string& message) {
        if (level < current_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[" << get_timestamp() << "] "
                  << "[" << level_to_string(level) << "] ";
        if (!component_.empty()) {
            std::cout << "[" << component_ << "] ";
        }
        std::cout << message << std::endl;
    }

    static void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    static void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    static void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    static void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }
};

} // namespace benchsched

#endif // LOGGER_H
