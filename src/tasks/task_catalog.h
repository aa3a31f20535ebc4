/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: task_catalog.h

    Description:
        Name -> Task lookup used by node workers, plus the seeding helpers
        used by the scheduler (default parameters per type, the default task
        set, and parsing of a --tasks list).

        The catalog is pure dispatch: it holds no run state besides the Task
        objects it owns. execute() is the only entry point the worker uses:

            double elapsed = catalog.execute("primes", {{"max_n", 2400000}});

        Failure Modes:
        - name not registered          -> UnknownTaskError
        - parameter missing / invalid  -> ExecutionError
        - body throws                  -> ExecutionError (message preserved)

*******************************************************************************/

#ifndef TASK_CATALOG_H
#define TASK_CATALOG_H

#include "tasks/task.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace benchsched {

class TaskCatalog {
private:
    std::map<std::string, std::unique_ptr<Task>> tasks_;

public:
    TaskCatalog() = default;

    TaskCatalog(const TaskCatalog&) = delete;
    TaskCatalog& operator=(const TaskCatalog&) = delete;
    TaskCatalog(TaskCatalog&&) = default;
    TaskCatalog& operator=(TaskCatalog&&) = default;

    // Catalog with matmul, primes, array and fileIO registered. fileIO works
    // against io_file_path (may be empty; the task then fails when run).
    static TaskCatalog with_default_tasks(const std::string& io_file_path);

    // Registers (or replaces) the task under task->name().
    void register_task(std::unique_ptr<Task> task);

    bool contains(const std::string& task_name) const;
    std::vector<std::string> task_names() const;

    // Parameter schema of a registered task. Throws UnknownTaskError.
    const std::vector<std::string>& parameter_names(const std::string& task_name) const;

    // Runs the named task and returns its wall-clock duration in seconds.
    double execute(const std::string& task_name, const TaskParams& params);
};

//==============================================================================
// SEEDING HELPERS
//==============================================================================

// Default parameter bag for a task type:
//   matmul {size: 425}, primes {max_n: 2400000},
//   array {array_size: 5000000}, fileIO {num_rw: 1000000}
TaskParams default_parameters(TaskType type);

TaskSpec make_task_spec(TaskType type);

// The standard 13-task mix: 3 x array, 2 x fileIO, 3 x matmul, 5 x primes.
std::vector<TaskSpec> default_task_set();

// "matmul,primes,primes" -> three specs with default parameters. Whitespace
// around names is ignored, empty entries are skipped. Throws UnknownTaskError
// on a name outside the vocabulary.
std::vector<TaskSpec> parse_task_list(const std::string& csv);

} // namespace benchsched

#endif // TASK_CATALOG_H
