/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: event_logger_server.h

    Description:
        Network front end of the event logger. Each connection carries one
        message, either a lifecycle event or a read-only query:

            NODE <n> EVENT <kind> [TIME <t>] [TASK <type>]   -> (close)
            QUERY SUMMARY                                    -> summary JSON
            QUERY SNAPSHOT                                   -> events + tasks JSON
            QUERY TASK <instance_id>                         -> instance JSON or null

        Malformed events are logged and discarded; the sender gets no reply
        either way.

        With export_interval_sec > 0 a background thread writes a snapshot
        to output_dir on that period. export_snapshot() writes one on demand
        (main calls it after stop()).

*******************************************************************************/

#ifndef EVENT_LOGGER_SERVER_H
#define EVENT_LOGGER_SERVER_H

#include "common/message.h"
#include "common/tcp_server.h"
#include "event_logger/event_store.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace benchsched {

struct EventLoggerConfig {
    std::string bind_host;
    uint16_t listen_port;
    std::string output_dir;
    int export_interval_sec;       // 0 = export only when asked
    int read_timeout_ms;

    EventLoggerConfig()
        : listen_port(kDefaultEventLoggerPort),
          output_dir("logs"),
          export_interval_sec(0),
          read_timeout_ms(2000) {}
};

class EventLoggerServer : public TcpServer {
private:
    EventLoggerConfig config_;
    EventStore& store_;

    std::thread export_thread_;
    std::mutex export_mutex_;
    std::condition_variable export_cv_;
    bool export_stop_;

    std::atomic<uint64_t> events_accepted_;
    std::atomic<uint64_t> events_rejected_;
    std::atomic<uint64_t> queries_served_;

public:
    EventLoggerServer(const EventLoggerConfig& config, EventStore& store);
    ~EventLoggerServer() override;

    bool start() override;
    void stop() override;

    // Writes a snapshot file to output_dir. Returns its path, or "" on failure.
    std::string export_snapshot();

    uint64_t events_accepted() const { return events_accepted_; }
    uint64_t events_rejected() const { return events_rejected_; }
    uint64_t queries_served() const { return queries_served_; }

protected:
    void handle_connection(int client_socket, const std::string& peer_address) override;

private:
    // Throws ProtocolError on an unknown query.
    std::string answer_query(const std::string& query);

    void export_loop();
};

} // namespace benchsched

#endif // EVENT_LOGGER_SERVER_H
