/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: lifecycle_event.h

    Description:
        The task lifecycle event exchanged between emitters (scheduler, node
        workers) and the event logger, and its free-form text encoding:

            NODE <node> EVENT <kind> TIME <seconds> TASK <task_type>

        Space-separated key/value pairs in any order. Recognized keys are
        NODE, EVENT, TIME and TASK; anything else is skipped one token at a
        time. TIME defaults to the receipt time when absent. TASK carries the
        task type name and is required for TASK_ASSIGNED / TASK_FINISHED, and
        omitted for TASK_REQUESTED.

        Examples:
            NODE W1 EVENT TASK_ASSIGNED TIME 100.0 TASK matmul
            NODE W1 EVENT TASK_REQUESTED TIME 100.1
            NODE W1 EVENT TASK_FINISHED TIME 102.5 TASK matmul

*******************************************************************************/

#ifndef LIFECYCLE_EVENT_H
#define LIFECYCLE_EVENT_H

#include <optional>
#include <string>

namespace benchsched {

enum class EventKind {
    TASK_REQUESTED = 0,
    TASK_ASSIGNED = 1,
    TASK_FINISHED = 2
};

std::string event_kind_to_string(EventKind kind);
bool event_kind_from_string(const std::string& name, EventKind& out);

struct LifecycleEvent {
    std::string node;
    EventKind kind;
    double time;                               // seconds, sender's clock
    std::optional<std::string> task_name;      // task type, e.g. "matmul"

    // Set by the event logger when the event is correlated to an instance;
    // fixed before the event is stored and never changed afterwards.
    std::optional<std::string> task_instance;

    LifecycleEvent() : kind(EventKind::TASK_REQUESTED), time(0.0) {}
    LifecycleEvent(const std::string& n, EventKind k, double t,
                   const std::optional<std::string>& task = std::nullopt)
        : node(n), kind(k), time(t), task_name(task) {}
};

// Wire text for an event (task_instance is never sent).
std::string format_event(const LifecycleEvent& event);

// Parses one message. receipt_time is used when TIME is absent. Throws
// ProtocolError when NODE or EVENT is missing, EVENT is not a known kind,
// TIME is not a number, or TASK is missing on ASSIGNED / FINISHED.
LifecycleEvent parse_event(const std::string& text, double receipt_time);

// Seconds since the Unix epoch, sub-second precision.
double epoch_seconds();

} // namespace benchsched

#endif // LIFECYCLE_EVENT_H
