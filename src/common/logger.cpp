/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: logger.cpp

    Description:
        Static member definitions for the diagnostic Logger (common/logger.h).
        Compiled once into benchsched_core so the scheduler, the node workers
        and the event logger each share a single level, tag and output mutex
        per process.

*******************************************************************************/

#include "common/logger.h"

namespace benchsched {

// INFO by default: registrations, assignments and completions are visible,
// per-message traces are not. Overridden with --log-level.
LogLevel Logger::current_level_ = LogLevel::INFO;

// No tag until main() names the process.
std::string Logger::component_;

std::mutex Logger::mutex_;

} // namespace benchsched
