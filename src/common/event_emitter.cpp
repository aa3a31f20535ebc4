/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: event_emitter.cpp

    Description:
        Fire-and-forget delivery of lifecycle events (event_emitter.h).

*******************************************************************************/

#include "common/event_emitter.h"
#include "common/tcp_connection.h"
#include "common/logger.h"

namespace benchsched {

EventEmitter::EventEmitter(const EmitterConfig& config)
    : config_(config), events_sent_(0), events_dropped_(0) {
}

bool EventEmitter::emit(const LifecycleEvent& event) {
    if (!enabled()) {
        return false;
    }

    std::string text;
    try {
        text = format_event(event);
    } catch (const std::exception& e) {
        Logger::debug("Could not format event: " + std::string(e.what()));
        events_dropped_++;
        return false;
    }

    // No reply is expected; the logger closes once it has read the event.
    bool ok = send_request(config_.host, config_.port, text,
                           config_.timeout_ms, nullptr, 0, true);
    if (ok) {
        events_sent_++;
    } else {
        events_dropped_++;
        Logger::debug("Dropped event for " + config_.host + ":" +
                      std::to_string(config_.port) + ": " + text);
    }
    return ok;
}

bool EventEmitter::emit(const std::string& node, EventKind kind,
                        const std::optional<std::string>& task_name) {
    return emit(LifecycleEvent(node, kind, epoch_seconds(), task_name));
}

} // namespace benchsched
