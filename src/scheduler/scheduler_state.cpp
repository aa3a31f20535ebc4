/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: scheduler_state.cpp

    Description:
        Queue / assignment state machine for the scheduler
        (scheduler_state.h).

*******************************************************************************/

#include "scheduler/scheduler_state.h"
#include "common/errors.h"
#include "common/logger.h"

#include <sstream>

namespace benchsched {

std::string pop_order_to_string(PopOrder order) {
    return order == PopOrder::FIFO ? "fifo" : "lifo";
}

bool pop_order_from_string(const std::string& name, PopOrder& out) {
    if (name == "lifo" || name == "LIFO") {
        out = PopOrder::LIFO;
    } else if (name == "fifo" || name == "FIFO") {
        out = PopOrder::FIFO;
    } else {
        return false;
    }
    return true;
}

//==============================================================================
// SECTION 1: CONSTRUCTION
//==============================================================================

SchedulerState::SchedulerState(std::vector<TaskSpec> tasks, PopOrder order)
    : waiting_(std::move(tasks)),
      total_tasks_(0),
      pop_order_(order),
      completion_logged_(false),
      unmatched_finishes_(0) {
    total_tasks_ = waiting_.size();
    Logger::info("Seeded " + std::to_string(total_tasks_) + " tasks (pop order " +
                 pop_order_to_string(pop_order_) + ")");
}

//==============================================================================
// SECTION 2: NODE REGISTRY
//==============================================================================

bool SchedulerState::register_node(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (nodes_.count(node_id)) {
        Logger::info("Node " + node_id + " re-registered");
        return false;
    }

    nodes_[node_id] = NodeIdentity{node_id, std::chrono::system_clock::now()};
    Logger::info("Node " + node_id + " registered (" +
                 std::to_string(nodes_.size()) + " total)");
    return true;
}

//==============================================================================
// SECTION 3: ASSIGNMENT
//==============================================================================

std::optional<TaskSpec> SchedulerState::request_task(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (!nodes_.count(node_id)) {
        nodes_[node_id] = NodeIdentity{node_id, std::chrono::system_clock::now()};
        Logger::info("Node " + node_id + " registered implicitly on task request");
    }

    auto current = in_flight_.find(node_id);
    if (current != in_flight_.end()) {
        throw ProtocolError("Node " + node_id + " requested a task while '" +
                            current->second.name() + "' is still in flight");
    }

    if (waiting_.empty()) {
        Logger::debug("No tasks left for " + node_id);
        return std::nullopt;
    }

    TaskSpec task;
    if (pop_order_ == PopOrder::LIFO) {
        task = waiting_.back();
        waiting_.pop_back();
    } else {
        task = waiting_.front();
        waiting_.erase(waiting_.begin());
    }

    in_flight_[node_id] = task;
    Logger::info("Assigned " + task.name() + " to " + node_id + " (" +
                 std::to_string(waiting_.size()) + " waiting)");
    return task;
}

bool SchedulerState::finish_task(const std::string& node_id, double duration) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto it = in_flight_.find(node_id);
    if (it == in_flight_.end()) {
        unmatched_finishes_++;
        Logger::warning("FINISH from " + node_id + " with no in-flight task; ignored");
        return false;
    }

    record_finish(it, duration);
    return true;
}

void SchedulerState::finish_task_strict(const std::string& node_id, double duration) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto it = in_flight_.find(node_id);
    if (it == in_flight_.end()) {
        throw UnmatchedFinishError(node_id);
    }
    record_finish(it, duration);
}

void SchedulerState::record_finish(std::map<std::string, TaskSpec>::iterator it,
                                   double duration) {
    const std::string node_id = it->first;
    finished_.push_back(FinishedTask{node_id, it->second, duration});
    in_flight_.erase(it);

    std::ostringstream ss;
    ss << "Node " << node_id << " finished " << finished_.back().task.name()
       << " in " << duration << "s (" << finished_.size() << "/" << total_tasks_ << ")";
    Logger::info(ss.str());

    log_completion_if_done();
}

void SchedulerState::log_completion_if_done() {
    if (!completion_logged_ && finished_.size() == total_tasks_) {
        completion_logged_ = true;
        Logger::info("ALL TASKS COMPLETED (" + std::to_string(total_tasks_) + " tasks)");
    }
}

//==============================================================================
// SECTION 4: QUERIES
//==============================================================================

bool SchedulerState::is_complete() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return finished_.size() == total_tasks_;
}

size_t SchedulerState::waiting_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return waiting_.size();
}

size_t SchedulerState::in_flight_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return in_flight_.size();
}

size_t SchedulerState::finished_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return finished_.size();
}

size_t SchedulerState::registered_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return nodes_.size();
}

uint64_t SchedulerState::unmatched_finishes() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return unmatched_finishes_;
}

std::optional<TaskSpec> SchedulerState::in_flight_for(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = in_flight_.find(node_id);
    if (it == in_flight_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FinishedTask> SchedulerState::finished_tasks() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return finished_;
}

nlohmann::json SchedulerState::status_json() const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    nlohmann::json in_flight = nlohmann::json::object();
    for (const auto& entry : in_flight_) {
        in_flight[entry.first] = entry.second.name();
    }

    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& entry : nodes_) {
        nodes.push_back(entry.first);
    }

    nlohmann::json status;
    status["total"] = total_tasks_;
    status["waiting"] = waiting_.size();
    status["in_flight"] = in_flight;
    status["finished"] = finished_.size();
    status["registered_nodes"] = nodes;
    status["complete"] = (finished_.size() == total_tasks_);
    return status;
}

std::string SchedulerState::status_report() const {
    return status_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace benchsched
