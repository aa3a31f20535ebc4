/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: task.cpp

    Description:
        Task type name mapping and the shared parameter helper of the Task
        base class.

*******************************************************************************/

#include "tasks/task.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace benchsched {

std::string task_type_to_string(TaskType type) {
    switch (type) {
        case TaskType::MATMUL:
            return "matmul";
        case TaskType::PRIMES:
            return "primes";
        case TaskType::ARRAY:
            return "array";
        case TaskType::FILEIO:
            return "fileIO";
        default:
            return "unknown";
    }
}

bool task_type_from_string(const std::string& name, TaskType& out) {
    if (name == "matmul") {
        out = TaskType::MATMUL;
    } else if (name == "primes") {
        out = TaskType::PRIMES;
    } else if (name == "array") {
        out = TaskType::ARRAY;
    } else if (name == "fileIO") {
        out = TaskType::FILEIO;
    } else {
        return false;
    }
    return true;
}

long long Task::param_as_count(const TaskParams& params, const std::string& key) const {
    auto it = params.find(key);
    if (it == params.end()) {
        throw std::invalid_argument("missing parameter '" + key + "'");
    }
    double value = it->second;
    if (!std::isfinite(value) || value < 0) {
        throw std::invalid_argument("parameter '" + key + "' must be a non-negative number");
    }
    // 2^63 itself is not representable as long long.
    if (value >= static_cast<double>(std::numeric_limits<long long>::max())) {
        throw std::invalid_argument("parameter '" + key + "' is out of range");
    }
    return static_cast<long long>(value);
}

} // namespace benchsched
