/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: event_store.cpp

    Description:
        Event ingestion, instance correlation, aggregation and snapshot
        export for the event logger (event_store.h).

*******************************************************************************/

//==============================================================================
// TABLE OF CONTENTS
//==============================================================================
//
// 1. STATISTICS HELPERS
// 2. JSON ENCODING
// 3. INGESTION & CORRELATION
// 4. QUERIES & AGGREGATION
// 5. EXPORT
// 6. SUMMARY REPORT
//
//==============================================================================

#include "event_logger/event_store.h"
#include "common/logger.h"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace benchsched {

//==============================================================================
// SECTION 1: STATISTICS HELPERS
//==============================================================================

void InstanceStats::add(const TaskInstance& instance) {
    total++;
    if (!instance.duration) {
        pending++;
        return;
    }

    double d = *instance.duration;
    if (completed == 0) {
        min_duration = d;
        max_duration = d;
    } else {
        min_duration = std::min(min_duration, d);
        max_duration = std::max(max_duration, d);
    }
    completed++;
    total_duration += d;
}

nlohmann::json InstanceStats::to_json() const {
    nlohmann::json j;
    j["total"] = total;
    j["completed"] = completed;
    j["pending"] = pending;
    if (completed > 0) {
        j["average_duration"] = average_duration();
        j["min_duration"] = min_duration;
        j["max_duration"] = max_duration;
    } else {
        j["average_duration"] = nullptr;
        j["min_duration"] = nullptr;
        j["max_duration"] = nullptr;
    }
    return j;
}

nlohmann::json EventSummary::to_json() const {
    nlohmann::json j;
    j["total_events"] = total_events;
    j["events_by_kind"] = events_by_kind;
    j["orphaned_finishes"] = orphaned_finishes;
    j["instances"] = overall.to_json();

    nlohmann::json nodes = nlohmann::json::object();
    for (const auto& entry : by_node) {
        nodes[entry.first] = entry.second.to_json();
    }
    j["by_node"] = nodes;

    nlohmann::json types = nlohmann::json::object();
    for (const auto& entry : by_type) {
        types[entry.first] = entry.second.to_json();
    }
    j["by_type"] = types;
    return j;
}

//==============================================================================
// SECTION 2: JSON ENCODING
//==============================================================================

nlohmann::json event_to_json(const LifecycleEvent& event) {
    nlohmann::json j;
    j["node"] = event.node;
    j["event"] = event_kind_to_string(event.kind);
    j["time"] = event.time;
    if (event.task_name) {
        j["task_name"] = *event.task_name;
    }
    if (event.task_instance) {
        j["task_instance"] = *event.task_instance;
    }
    return j;
}

nlohmann::json instance_to_json(const TaskInstance& instance) {
    nlohmann::json j;
    j["instance_id"] = instance.instance_id;
    j["task_name"] = instance.task_type;
    j["node"] = instance.node;
    j["assigned_time"] = instance.assigned_time;
    if (instance.finished_time) {
        j["finished_time"] = *instance.finished_time;
    } else {
        j["finished_time"] = nullptr;
    }
    if (instance.duration) {
        j["duration"] = *instance.duration;
    } else {
        j["duration"] = nullptr;
    }

    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : instance.events) {
        events.push_back(event_to_json(event));
    }
    j["events"] = events;
    return j;
}

//==============================================================================
// SECTION 3: INGESTION & CORRELATION
//==============================================================================

EventStore::EventStore() : orphaned_finishes_(0) {
}

std::optional<std::string> EventStore::ingest(LifecycleEvent event) {
    std::lock_guard<std::mutex> lock(store_mutex_);

    std::optional<std::string> attached;

    if (event.kind == EventKind::TASK_ASSIGNED && event.task_name) {
        const std::string& type = *event.task_name;
        uint64_t n = ++type_counters_[type];

        TaskInstance instance;
        instance.instance_id = type + "_" + std::to_string(n);
        instance.task_type = type;
        instance.node = event.node;
        instance.assigned_time = event.time;

        event.task_instance = instance.instance_id;
        instance.events.push_back(event);

        instance_index_[instance.instance_id] = instances_.size();
        instances_.push_back(std::move(instance));
        attached = event.task_instance;

    } else if (event.kind == EventKind::TASK_FINISHED && event.task_name) {
        const std::string& type = *event.task_name;

        for (auto it = instances_.rbegin(); it != instances_.rend(); ++it) {
            if (it->task_type == type && it->node == event.node && !it->is_finished()) {
                event.task_instance = it->instance_id;
                it->finished_time = event.time;
                it->duration = event.time - it->assigned_time;
                it->events.push_back(event);
                attached = it->instance_id;
                break;
            }
        }

        if (!attached) {
            orphaned_finishes_++;
            Logger::warning("Orphaned TASK_FINISHED from " + event.node + " for " + type);
        }
    }

    events_.push_back(std::move(event));
    return attached;
}

std::optional<std::string> EventStore::ingest_text(const std::string& text, double receipt_time) {
    return ingest(parse_event(text, receipt_time));
}

//==============================================================================
// SECTION 4: QUERIES & AGGREGATION
//==============================================================================

size_t EventStore::event_count() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return events_.size();
}

size_t EventStore::instance_count() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return instances_.size();
}

uint64_t EventStore::orphaned_finishes() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return orphaned_finishes_;
}

std::optional<TaskInstance> EventStore::get_instance(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    auto it = instance_index_.find(instance_id);
    if (it == instance_index_.end()) {
        return std::nullopt;
    }
    return instances_[it->second];
}

std::vector<TaskInstance> EventStore::instances() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return instances_;
}

std::vector<LifecycleEvent> EventStore::events() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return events_;
}

InstanceStats EventStore::type_stats(const std::string& task_type) const {
    InstanceStats stats;
    for (const auto& instance : instances()) {
        if (instance.task_type == task_type) {
            stats.add(instance);
        }
    }
    return stats;
}

InstanceStats EventStore::node_stats(const std::string& node) const {
    InstanceStats stats;
    for (const auto& instance : instances()) {
        if (instance.node == node) {
            stats.add(instance);
        }
    }
    return stats;
}

EventSummary EventStore::summarize() const {
    std::vector<LifecycleEvent> events_copy;
    std::vector<TaskInstance> instances_copy;
    EventSummary summary;
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        events_copy = events_;
        instances_copy = instances_;
        summary.orphaned_finishes = orphaned_finishes_;
    }

    summary.total_events = events_copy.size();
    for (const auto& event : events_copy) {
        summary.events_by_kind[event_kind_to_string(event.kind)]++;
    }

    for (const auto& instance : instances_copy) {
        summary.overall.add(instance);
        summary.by_node[instance.node].add(instance);
        summary.by_type[instance.task_type].add(instance);
    }
    return summary;
}

//==============================================================================
// SECTION 5: EXPORT
//==============================================================================

static std::string format_local_time(std::time_t t, const char* format) {
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char out[64];
    std::strftime(out, sizeof(out), format, &tm_buf);
    return std::string(out);
}

nlohmann::json EventStore::snapshot_json() const {
    std::vector<LifecycleEvent> events_copy;
    std::vector<TaskInstance> instances_copy;
    uint64_t orphaned = 0;
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        events_copy = events_;
        instances_copy = instances_;
        orphaned = orphaned_finishes_;
    }

    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : events_copy) {
        events.push_back(event_to_json(event));
    }

    nlohmann::json tasks = nlohmann::json::object();
    for (const auto& instance : instances_copy) {
        tasks[instance.instance_id] = instance_to_json(instance);
    }

    double now = epoch_seconds();

    nlohmann::json snapshot;
    snapshot["events"] = events;
    snapshot["tasks"] = tasks;
    snapshot["orphaned_finishes"] = orphaned;
    snapshot["export_time"] = now;
    snapshot["export_datetime"] = format_local_time(static_cast<std::time_t>(now),
                                                    "%Y-%m-%dT%H:%M:%S");
    return snapshot;
}

bool EventStore::export_to_file(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        Logger::error("Cannot open export file: " + path);
        return false;
    }

    try {
        out << snapshot_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << "\n";
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Failed to serialize snapshot for " + path + ": " + e.what());
        return false;
    }
    out.close();
    if (!out) {
        Logger::error("Failed writing export file: " + path);
        return false;
    }

    Logger::info("Data exported to " + path);
    return true;
}

std::string EventStore::export_to_directory(const std::string& directory) const {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        Logger::error("Cannot create export directory " + directory + ": " + ec.message());
        return "";
    }

    std::string filename = "logger_data_" +
                           format_local_time(std::time(nullptr), "%Y%m%d_%H%M%S") + ".json";
    std::string path = (std::filesystem::path(directory) / filename).string();

    return export_to_file(path) ? path : "";
}

//==============================================================================
// SECTION 6: SUMMARY REPORT
//==============================================================================

std::string EventStore::summary_text() const {
    EventSummary summary = summarize();

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "\n=== Event Logger Summary ===\n"
       << "Total events: " << summary.total_events << "\n"
       << "Total task instances: " << summary.overall.total << "\n"
       << "Orphaned finishes: " << summary.orphaned_finishes << "\n";

    ss << "Event counts:\n";
    for (const auto& entry : summary.events_by_kind) {
        ss << "  " << entry.first << ": " << entry.second << "\n";
    }

    if (summary.overall.completed > 0) {
        ss << "Completed tasks: " << summary.overall.completed << "\n"
           << "Average task duration: " << summary.overall.average_duration() << "s\n"
           << "Min task duration: " << summary.overall.min_duration << "s\n"
           << "Max task duration: " << summary.overall.max_duration << "s\n";
    }

    ss << "Tasks per node:\n";
    for (const auto& entry : summary.by_node) {
        ss << "  " << entry.first << ": " << entry.second.total << " tasks";
        if (entry.second.completed > 0) {
            ss << " (avg duration: " << entry.second.average_duration() << "s)";
        }
        ss << "\n";
    }

    ss << "Tasks per type:\n";
    for (const auto& entry : summary.by_type) {
        ss << "  " << entry.first << ": " << entry.second.total << " instances";
        if (entry.second.completed > 0) {
            ss << " (avg duration: " << entry.second.average_duration() << "s)";
        }
        ss << "\n";
    }

    ss << "============================\n";
    return ss.str();
}

void EventStore::print_summary() const {
    Logger::info(summary_text());
}

} // namespace benchsched
