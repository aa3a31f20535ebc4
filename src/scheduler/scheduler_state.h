/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: scheduler_state.h

    Description:
        The scheduler's shared mutable state: waiting queue, in-flight
        assignments, node registry and finished list, all behind one mutex.
        Constructed once at scheduler startup and handed to the network
        layer by reference; there is no process-wide instance.

    Locking:
        A single state_mutex_ covers every member below. Popping a task and
        recording it as in flight happen under the same lock acquisition, so
        two concurrent requests can never receive the same TaskSpec, and
        there is no lock ordering to get wrong.

    Task Lifecycle:

        waiting_ --request_task()--> in_flight_[node] --finish_task()--> finished_

        A node that disappears after assignment keeps its entry in
        in_flight_ forever. There is no timeout and no re-queue.

*******************************************************************************/

#ifndef SCHEDULER_STATE_H
#define SCHEDULER_STATE_H

#include "tasks/task.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace benchsched {

// Which end of the waiting queue request_task() takes from. LIFO takes the
// most recently seeded task first.
enum class PopOrder {
    LIFO,
    FIFO
};

std::string pop_order_to_string(PopOrder order);
bool pop_order_from_string(const std::string& name, PopOrder& out);

struct NodeIdentity {
    std::string id;
    std::chrono::system_clock::time_point registered_at;
};

struct FinishedTask {
    std::string node;
    TaskSpec task;
    double duration;       // as reported by the node, seconds
};

class SchedulerState {
private:
    mutable std::mutex state_mutex_;

    std::vector<TaskSpec> waiting_;
    std::map<std::string, TaskSpec> in_flight_;
    std::map<std::string, NodeIdentity> nodes_;
    std::vector<FinishedTask> finished_;

    size_t total_tasks_;
    PopOrder pop_order_;
    bool completion_logged_;

    uint64_t unmatched_finishes_;

public:
    SchedulerState(std::vector<TaskSpec> tasks, PopOrder order);

    // Adds node_id to the registry. Returns true if it was new; a repeat
    // registration is logged and otherwise ignored.
    bool register_node(const std::string& node_id);

    // Pops one task for node_id and records it as in flight. Returns
    // nullopt when the queue is empty (the caller answers REST).
    // A node that never registered is registered here.
    // Throws ProtocolError if node_id already has a task in flight; nothing
    // is popped in that case.
    std::optional<TaskSpec> request_task(const std::string& node_id);

    // Moves node_id's in-flight task to the finished list. Returns false
    // (and logs) when node_id has nothing in flight.
    bool finish_task(const std::string& node_id, double duration);

    // Same move, but a FINISH with nothing in flight throws
    // UnmatchedFinishError and is not counted in unmatched_finishes().
    void finish_task_strict(const std::string& node_id, double duration);

    bool is_complete() const;
    size_t total_tasks() const { return total_tasks_; }
    size_t waiting_count() const;
    size_t in_flight_count() const;
    size_t finished_count() const;
    size_t registered_count() const;
    uint64_t unmatched_finishes() const;

    std::optional<TaskSpec> in_flight_for(const std::string& node_id) const;
    std::vector<FinishedTask> finished_tasks() const;

    // {"total", "waiting", "in_flight": {node: task}, "finished",
    //  "registered_nodes": [...], "complete"}
    nlohmann::json status_json() const;

    // status_json() as compact text for STATUS|REPORT. Node ids are raw
    // bytes from the wire; invalid UTF-8 is replaced with U+FFFD.
    std::string status_report() const;

private:
    // Caller holds state_mutex_.
    void record_finish(std::map<std::string, TaskSpec>::iterator it, double duration);
    void log_completion_if_done();
};

} // namespace benchsched

#endif // SCHEDULER_STATE_H
