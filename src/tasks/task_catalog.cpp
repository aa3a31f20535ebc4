/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: task_catalog.cpp

    Description:
        TaskCatalog dispatch and the scheduler's task-set seeding helpers.

*******************************************************************************/

#include "tasks/task_catalog.h"
#include "tasks/benchmark_tasks.h"
#include "common/errors.h"
#include "common/logger.h"

#include <chrono>
#include <sstream>

namespace benchsched {

//==============================================================================
// SECTION 1: CATALOG CONSTRUCTION
//==============================================================================

TaskCatalog TaskCatalog::with_default_tasks(const std::string& io_file_path) {
    TaskCatalog catalog;
    catalog.register_task(std::make_unique<MatmulTask>());
    catalog.register_task(std::make_unique<PrimesTask>());
    catalog.register_task(std::make_unique<ArraySortTask>());
    catalog.register_task(std::make_unique<FileIoTask>(io_file_path));
    return catalog;
}

void TaskCatalog::register_task(std::unique_ptr<Task> task) {
    if (!task) return;
    std::string name = task->name();
    tasks_[name] = std::move(task);
}

bool TaskCatalog::contains(const std::string& task_name) const {
    return tasks_.find(task_name) != tasks_.end();
}

std::vector<std::string> TaskCatalog::task_names() const {
    std::vector<std::string> names;
    names.reserve(tasks_.size());
    for (const auto& [name, task] : tasks_) {
        names.push_back(name);
    }
    return names;
}

const std::vector<std::string>& TaskCatalog::parameter_names(const std::string& task_name) const {
    auto it = tasks_.find(task_name);
    if (it == tasks_.end()) {
        throw UnknownTaskError(task_name);
    }
    return it->second->parameter_names();
}

//==============================================================================
// SECTION 2: DISPATCH
//==============================================================================
//
// execute()
// ---------
// 1. Look the task up (UnknownTaskError if absent).
// 2. Check the parameter schema before starting the clock, so a missing
//    parameter is reported without any partial work.
// 3. Time run() with steady_clock; anything it throws becomes ExecutionError.
//
// Once run() has started it is never interrupted.
//
//==============================================================================

double TaskCatalog::execute(const std::string& task_name, const TaskParams& params) {
    auto it = tasks_.find(task_name);
    if (it == tasks_.end()) {
        throw UnknownTaskError(task_name);
    }
    Task& task = *it->second;

    for (const auto& required : task.parameter_names()) {
        if (params.find(required) == params.end()) {
            throw ExecutionError(task_name, "missing parameter '" + required + "'");
        }
    }

    Logger::debug("Running task '" + task_name + "'");
    auto start = std::chrono::steady_clock::now();
    try {
        task.run(params);
    } catch (const ExecutionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExecutionError(task_name, e.what());
    }
    auto end = std::chrono::steady_clock::now();

    return std::chrono::duration<double>(end - start).count();
}

//==============================================================================
// SECTION 3: SEEDING HELPERS
//==============================================================================

TaskParams default_parameters(TaskType type) {
    switch (type) {
        case TaskType::MATMUL:
            return {{"size", 425}};
        case TaskType::PRIMES:
            return {{"max_n", 2400000}};
        case TaskType::ARRAY:
            return {{"array_size", 5000000}};
        case TaskType::FILEIO:
            return {{"num_rw", 1000000}};
        default:
            return {};
    }
}

TaskSpec make_task_spec(TaskType type) {
    return TaskSpec(type, default_parameters(type));
}

std::vector<TaskSpec> default_task_set() {
    std::vector<TaskSpec> tasks;
    for (int i = 0; i < 3; ++i) tasks.push_back(make_task_spec(TaskType::ARRAY));
    for (int i = 0; i < 2; ++i) tasks.push_back(make_task_spec(TaskType::FILEIO));
    for (int i = 0; i < 3; ++i) tasks.push_back(make_task_spec(TaskType::MATMUL));
    for (int i = 0; i < 5; ++i) tasks.push_back(make_task_spec(TaskType::PRIMES));
    return tasks;
}

std::vector<TaskSpec> parse_task_list(const std::string& csv) {
    std::vector<TaskSpec> tasks;
    std::stringstream ss(csv);
    std::string item;

    while (std::getline(ss, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        size_t last = item.find_last_not_of(" \t");
        std::string name = item.substr(first, last - first + 1);

        TaskType type;
        if (!task_type_from_string(name, type)) {
            throw UnknownTaskError(name);
        }
        tasks.push_back(make_task_spec(type));
    }
    return tasks;
}

} // namespace benchsched
