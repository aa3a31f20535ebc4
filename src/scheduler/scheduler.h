/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: scheduler.h

    Description:
        Network front end of the scheduler. Accepts node connections (one
        request/response exchange each), dispatches them to SchedulerState,
        and emits TASK_ASSIGNED lifecycle events to the event logger.

        Protocol handled (see common/message.h):
            REGISTER|REQUEST|<host>        -> REGISTER|CONFIRM|true|<our host>
            TASK|REQUEST[|<host>]          -> TASK|ASSIGN|<type>|<json> or TASK|ASSIGN|REST
            TASK|FINISH|<secs>[|<host>]    -> (close)
            STATUS|REQUEST                 -> STATUS|REPORT|<json>

        Node Identity:
            The hostname field when present, otherwise the peer IP address.

        Error Handling:
            A malformed or out-of-sequence message is a ProtocolError. It is
            logged and the connection is closed without a reply; the shared
            state is left untouched.

        Event Emission:
            TASK_ASSIGNED is sent after the ASSIGN reply has been written and
            outside the state lock, so a slow or absent event logger can only
            delay the handler thread that already served its node.

*******************************************************************************/

#ifndef SCHEDULER_H
#define SCHEDULER_H

#include "common/event_emitter.h"
#include "common/tcp_server.h"
#include "scheduler/scheduler_state.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace benchsched {

struct SchedulerConfig {
    std::string bind_host;
    uint16_t listen_port;
    int read_timeout_ms;
    std::string hostname;          // sent back in REGISTER|CONFIRM
    EmitterConfig events;
    bool strict_finish;            // unmatched FINISH counts as a protocol error

    SchedulerConfig()
        : listen_port(kDefaultSchedulerPort),
          read_timeout_ms(5000),
          strict_finish(false) {}
};

class Scheduler : public TcpServer {
private:
    SchedulerConfig config_;
    SchedulerState& state_;
    EventEmitter emitter_;

    std::atomic<uint64_t> assignments_sent_;
    std::atomic<uint64_t> rest_sent_;
    std::atomic<uint64_t> protocol_errors_;

public:
    Scheduler(const SchedulerConfig& config, SchedulerState& state);
    ~Scheduler() override;

    SchedulerState& state() { return state_; }

    uint64_t protocol_errors() const { return protocol_errors_; }

    void print_statistics() const;

protected:
    void handle_connection(int client_socket, const std::string& peer_address) override;

private:
    bool reply(int client_socket, const Message& message);
};

} // namespace benchsched

#endif // SCHEDULER_H
