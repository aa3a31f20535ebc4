/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: lifecycle_event.cpp

    Description:
        Encoding and parsing of lifecycle event messages (lifecycle_event.h).

*******************************************************************************/

#include "common/lifecycle_event.h"
#include "common/errors.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace benchsched {

std::string event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::TASK_REQUESTED:
            return "TASK_REQUESTED";
        case EventKind::TASK_ASSIGNED:
            return "TASK_ASSIGNED";
        case EventKind::TASK_FINISHED:
            return "TASK_FINISHED";
        default:
            return "UNKNOWN";
    }
}

bool event_kind_from_string(const std::string& name, EventKind& out) {
    if (name == "TASK_REQUESTED") {
        out = EventKind::TASK_REQUESTED;
    } else if (name == "TASK_ASSIGNED") {
        out = EventKind::TASK_ASSIGNED;
    } else if (name == "TASK_FINISHED") {
        out = EventKind::TASK_FINISHED;
    } else {
        return false;
    }
    return true;
}

double epoch_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::string format_event(const LifecycleEvent& event) {
    // %.6f keeps microseconds of an epoch timestamp without exponent notation.
    char time_buf[64];
    std::snprintf(time_buf, sizeof(time_buf), "%.6f", event.time);

    std::string out = "NODE " + event.node +
                      " EVENT " + event_kind_to_string(event.kind) +
                      " TIME " + time_buf;
    if (event.task_name) {
        out += " TASK " + *event.task_name;
    }
    return out;
}

//==============================================================================
// parse_event()
//==============================================================================
//
// Walks the tokens left to right. A recognized key consumes itself and the
// following token; an unrecognized token (or a key at the very end with no
// value) is skipped on its own. Later occurrences of a key overwrite earlier
// ones.
//
//==============================================================================

LifecycleEvent parse_event(const std::string& text, double receipt_time) {
    std::istringstream in(text);
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }

    std::optional<std::string> node;
    std::optional<std::string> kind_name;
    std::optional<double> time;
    std::optional<std::string> task;

    size_t i = 0;
    while (i < tokens.size()) {
        const std::string& key = tokens[i];
        bool has_value = (i + 1 < tokens.size());

        if (key == "NODE" && has_value) {
            node = tokens[i + 1];
            i += 2;
        } else if (key == "EVENT" && has_value) {
            kind_name = tokens[i + 1];
            i += 2;
        } else if (key == "TIME" && has_value) {
            const std::string& value = tokens[i + 1];
            char* end = nullptr;
            double t = std::strtod(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0' || !std::isfinite(t)) {
                throw ProtocolError("invalid TIME value: " + value);
            }
            time = t;
            i += 2;
        } else if (key == "TASK" && has_value) {
            task = tokens[i + 1];
            i += 2;
        } else {
            i += 1;
        }
    }

    if (!node || !kind_name) {
        throw ProtocolError("event missing NODE or EVENT: " + text);
    }

    EventKind kind;
    if (!event_kind_from_string(*kind_name, kind)) {
        throw ProtocolError("unknown EVENT kind: " + *kind_name);
    }

    if ((kind == EventKind::TASK_ASSIGNED || kind == EventKind::TASK_FINISHED) && !task) {
        throw ProtocolError(*kind_name + " event without TASK: " + text);
    }

    return LifecycleEvent(*node, kind, time ? *time : receipt_time, task);
}

} // namespace benchsched
