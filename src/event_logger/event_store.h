/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: event_store.h

    Description:
        In-memory state of the event logger: the raw lifecycle event log and
        the task-instance table reconstructed from it.

    Correlation:
        Senders never name an instance. The store derives one:

        TASK_ASSIGNED (node N, type T)
            -> new instance "T_<k>", k = next value of T's counter (from 1,
               never reused), assigned_time = event time.

        TASK_FINISHED (node N, type T)
            -> scan instances newest first; the first one with type T, node N
               and no finished_time is completed, and
               duration = finished_time - assigned_time.
            -> no candidate: the event stays in the raw log, uncorrelated,
               and is counted as an orphaned finish.

        TASK_REQUESTED
            -> raw log only.

        Matching newest-first is only correct while a node never runs two
        tasks of the same type at once. Overlapping same-type tasks on one
        node would be paired in LIFO order.

    Concurrency:
        One mutex covers the event log, the instance table and the counters.
        Aggregations copy the state under the lock and compute afterwards,
        so a large summary holds the lock only for the copy.

*******************************************************************************/

#ifndef EVENT_STORE_H
#define EVENT_STORE_H

#include "common/lifecycle_event.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace benchsched {

struct TaskInstance {
    std::string instance_id;
    std::string task_type;
    std::string node;
    double assigned_time;
    std::optional<double> finished_time;
    std::optional<double> duration;
    std::vector<LifecycleEvent> events;

    TaskInstance() : assigned_time(0.0) {}

    bool is_finished() const { return finished_time.has_value(); }
};

// Counts and duration figures over a group of instances (one node, one
// type, or everything). Durations cover completed instances only.
struct InstanceStats {
    size_t total;
    size_t completed;
    size_t pending;
    double total_duration;
    double min_duration;
    double max_duration;

    InstanceStats()
        : total(0), completed(0), pending(0),
          total_duration(0.0), min_duration(0.0), max_duration(0.0) {}

    void add(const TaskInstance& instance);

    // 0 when nothing in the group has completed.
    double average_duration() const {
        return completed > 0 ? total_duration / static_cast<double>(completed) : 0.0;
    }

    nlohmann::json to_json() const;
};

struct EventSummary {
    size_t total_events;
    std::map<std::string, size_t> events_by_kind;
    uint64_t orphaned_finishes;
    InstanceStats overall;
    std::map<std::string, InstanceStats> by_node;
    std::map<std::string, InstanceStats> by_type;

    EventSummary() : total_events(0), orphaned_finishes(0) {}

    nlohmann::json to_json() const;
};

nlohmann::json event_to_json(const LifecycleEvent& event);
nlohmann::json instance_to_json(const TaskInstance& instance);

class EventStore {
private:
    mutable std::mutex store_mutex_;

    std::vector<LifecycleEvent> events_;
    std::vector<TaskInstance> instances_;              // insertion order
    std::map<std::string, size_t> instance_index_;     // id -> position
    std::map<std::string, uint64_t> type_counters_;
    uint64_t orphaned_finishes_;

public:
    EventStore();

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    // Appends the event and updates the instance table. Returns the
    // instance id the event was attached to, or nullopt (TASK_REQUESTED,
    // orphaned finish).
    std::optional<std::string> ingest(LifecycleEvent event);

    // parse_event() + ingest(). Throws ProtocolError on a malformed message;
    // nothing is recorded in that case.
    std::optional<std::string> ingest_text(const std::string& text, double receipt_time);

    size_t event_count() const;
    size_t instance_count() const;
    uint64_t orphaned_finishes() const;

    std::optional<TaskInstance> get_instance(const std::string& instance_id) const;
    std::vector<TaskInstance> instances() const;
    std::vector<LifecycleEvent> events() const;

    InstanceStats type_stats(const std::string& task_type) const;
    InstanceStats node_stats(const std::string& node) const;
    EventSummary summarize() const;

    // {"events": [...], "tasks": {id: {...}}, "orphaned_finishes",
    //  "export_time", "export_datetime"}
    nlohmann::json snapshot_json() const;

    // Writes snapshot_json() to path. Returns false (and logs) on I/O failure.
    bool export_to_file(const std::string& path) const;

    // Exports to <directory>/logger_data_<YYYYmmdd_HHMMSS>.json, creating
    // the directory if needed. Returns the file path, or "" on failure.
    std::string export_to_directory(const std::string& directory) const;

    std::string summary_text() const;
    void print_summary() const;
};

} // namespace benchsched

#endif // EVENT_STORE_H
