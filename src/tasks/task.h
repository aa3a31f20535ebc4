/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: task.h

    Description:
        Task vocabulary shared by every component: the four benchmark task
        types, their parameter bag, the immutable TaskSpec handed out by the
        scheduler, and the abstract Task interface that the catalog dispatches
        to on the worker side.

        Wire Names:
            TaskType::MATMUL  <-> "matmul"
            TaskType::PRIMES  <-> "primes"
            TaskType::ARRAY   <-> "array"
            TaskType::FILEIO  <-> "fileIO"

        These strings appear in TASK|ASSIGN replies, in event logger messages
        (TASK field) and in instance ids ("matmul_3"), so they must never
        change.

    Task Interface:
        A Task is a named executable unit with a parameter schema (the list of
        parameter names it needs). Concrete bodies live in benchmark_tasks.h;
        TaskCatalog owns them and measures wall-clock time around run().

        class MyTask : public Task {
        public:
            MyTask() : Task("mytask", {"n"}) {}
            void run(const TaskParams& params) override { ... }
        };

*******************************************************************************/

#ifndef TASK_H
#define TASK_H

#include <map>
#include <string>
#include <vector>

namespace benchsched {

//==============================================================================
// TASK TYPES
//==============================================================================

enum class TaskType {
    MATMUL = 0,
    PRIMES = 1,
    ARRAY = 2,
    FILEIO = 3
};

// Parameter bag: name -> number. Integral values stay integral on the wire.
using TaskParams = std::map<std::string, double>;

std::string task_type_to_string(TaskType type);

// Returns false (and leaves out untouched) for names outside the vocabulary.
bool task_type_from_string(const std::string& name, TaskType& out);

//==============================================================================
// TASK SPEC
//==============================================================================
//
// One unit of work in the scheduler's waiting queue. Created when the task set
// is seeded and copied (never mutated) from there on: into the in-flight map,
// into the finished list, into the ASSIGN reply.
//
//==============================================================================

struct TaskSpec {
    TaskType type;
    TaskParams parameters;

    TaskSpec() : type(TaskType::MATMUL) {}
    TaskSpec(TaskType t, const TaskParams& params) : type(t), parameters(params) {}

    std::string name() const { return task_type_to_string(type); }

    bool operator==(const TaskSpec& other) const {
        return type == other.type && parameters == other.parameters;
    }
    bool operator!=(const TaskSpec& other) const { return !(*this == other); }

    // Ordering only exists so specs can live in sorted containers (tests
    // compare assigned and seeded multisets).
    bool operator<(const TaskSpec& other) const {
        if (type != other.type) return type < other.type;
        return parameters < other.parameters;
    }
};

//==============================================================================
// TASK INTERFACE
//==============================================================================

class Task {
protected:
    std::string name_;
    std::vector<std::string> parameter_names_;

public:
    Task(const std::string& name, const std::vector<std::string>& parameter_names)
        : name_(name), parameter_names_(parameter_names) {}

    virtual ~Task() = default;

    const std::string& name() const { return name_; }

    // Parameter schema: every name listed here must be present in the bag
    // passed to run(). TaskCatalog checks this before dispatching.
    const std::vector<std::string>& parameter_names() const { return parameter_names_; }

    // Runs the body to completion. Throws on failure (any std::exception;
    // the catalog rewraps it as ExecutionError).
    virtual void run(const TaskParams& params) = 0;

protected:
    // Reads a parameter as a non-negative integer count. Throws
    // std::invalid_argument for negative values.
    long long param_as_count(const TaskParams& params, const std::string& key) const;
};

} // namespace benchsched

#endif // TASK_H
