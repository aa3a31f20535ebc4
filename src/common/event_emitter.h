/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: event_emitter.h

    Description:
        Best-effort sender of lifecycle events to the event logger. Used by
        the scheduler (TASK_ASSIGNED) and node workers (TASK_REQUESTED,
        TASK_FINISHED).

        Each event goes out on its own short-lived connection with a short
        connect/send timeout. Delivery failures are logged at DEBUG and
        reported through the return value only; emit() never throws and
        never retries.

        An emitter constructed with an empty host is disabled: emit() returns
        false immediately without touching the network.

*******************************************************************************/

#ifndef EVENT_EMITTER_H
#define EVENT_EMITTER_H

#include "common/lifecycle_event.h"
#include "common/message.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace benchsched {

struct EmitterConfig {
    std::string host;          // empty = emission disabled
    uint16_t port;
    int timeout_ms;

    EmitterConfig()
        : port(kDefaultEventLoggerPort),
          timeout_ms(1000) {}
};

class EventEmitter {
private:
    EmitterConfig config_;

    std::atomic<uint64_t> events_sent_;
    std::atomic<uint64_t> events_dropped_;

public:
    explicit EventEmitter(const EmitterConfig& config);

    bool enabled() const { return !config_.host.empty(); }

    // Sends one event. Returns true if it was handed to the event logger.
    bool emit(const LifecycleEvent& event);

    // Convenience wrapper stamping the current epoch time.
    bool emit(const std::string& node, EventKind kind,
              const std::optional<std::string>& task_name = std::nullopt);

    uint64_t events_sent() const { return events_sent_; }
    uint64_t events_dropped() const { return events_dropped_; }
};

} // namespace benchsched

#endif // EVENT_EMITTER_H
