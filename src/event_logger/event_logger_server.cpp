/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: event_logger_server.cpp

    Description:
        Event ingestion, queries and periodic export for the event logger
        (event_logger_server.h).

*******************************************************************************/

#include "event_logger/event_logger_server.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/tcp_connection.h"

#include <chrono>
#include <sstream>
#include <vector>

namespace benchsched {

// Node and task names are raw bytes off the wire; invalid UTF-8 becomes U+FFFD.
static constexpr auto kReplaceInvalid = nlohmann::json::error_handler_t::replace;

//==============================================================================
// SECTION 1: LIFECYCLE
//==============================================================================

EventLoggerServer::EventLoggerServer(const EventLoggerConfig& config, EventStore& store)
    : TcpServer("Event logger", config.bind_host, config.listen_port, config.read_timeout_ms),
      config_(config),
      store_(store),
      export_stop_(false),
      events_accepted_(0),
      events_rejected_(0),
      queries_served_(0) {
}

EventLoggerServer::~EventLoggerServer() {
    stop();
}

bool EventLoggerServer::start() {
    if (!TcpServer::start()) {
        return false;
    }

    if (config_.export_interval_sec > 0) {
        {
            std::lock_guard<std::mutex> lock(export_mutex_);
            export_stop_ = false;
        }
        export_thread_ = std::thread(&EventLoggerServer::export_loop, this);
        Logger::info("Exporting snapshots to " + config_.output_dir + " every " +
                     std::to_string(config_.export_interval_sec) + "s");
    }
    return true;
}

void EventLoggerServer::stop() {
    {
        std::lock_guard<std::mutex> lock(export_mutex_);
        export_stop_ = true;
    }
    export_cv_.notify_all();
    if (export_thread_.joinable()) {
        export_thread_.join();
    }

    TcpServer::stop();
}

std::string EventLoggerServer::export_snapshot() {
    return store_.export_to_directory(config_.output_dir);
}

void EventLoggerServer::export_loop() {
    std::unique_lock<std::mutex> lock(export_mutex_);
    while (!export_stop_) {
        if (export_cv_.wait_for(lock, std::chrono::seconds(config_.export_interval_sec),
                                [this]() { return export_stop_; })) {
            break;
        }
        lock.unlock();
        try {
            export_snapshot();
        } catch (const std::exception& e) {
            Logger::error("Periodic export failed: " + std::string(e.what()));
        }
        lock.lock();
    }
}

//==============================================================================
// SECTION 2: CONNECTION HANDLING
//==============================================================================

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

void EventLoggerServer::handle_connection(int client_socket, const std::string& peer_address) {
    std::string raw;
    if (!receive_all(client_socket, kMaxRequestSize, raw)) {
        Logger::debug("Empty or timed-out message from " + peer_address);
        return;
    }

    double receipt_time = epoch_seconds();
    std::string text = trim(raw);

    try {
        if (text.compare(0, 6, "QUERY ") == 0 || text == "QUERY") {
            std::string response = answer_query(text);
            queries_served_++;
            if (!send_all(client_socket, response)) {
                Logger::warning("Failed to send query reply to " + peer_address);
            }
            return;
        }

        store_.ingest_text(text, receipt_time);
        events_accepted_++;
        Logger::debug("Event from " + peer_address + ": " + text);
    } catch (const ProtocolError& e) {
        events_rejected_++;
        Logger::warning("Rejected message from " + peer_address + ": " + e.what());
    }
}

std::string EventLoggerServer::answer_query(const std::string& query) {
    std::istringstream in(query);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }

    if (words.size() == 2 && words[1] == "SUMMARY") {
        return store_.summarize().to_json().dump(-1, ' ', false, kReplaceInvalid);
    }
    if (words.size() == 2 && words[1] == "SNAPSHOT") {
        return store_.snapshot_json().dump(-1, ' ', false, kReplaceInvalid);
    }
    if (words.size() == 3 && words[1] == "TASK") {
        std::optional<TaskInstance> instance = store_.get_instance(words[2]);
        return instance ? instance_to_json(*instance).dump(-1, ' ', false, kReplaceInvalid)
                        : std::string("null");
    }

    throw ProtocolError("unknown query: " + query);
}

} // namespace benchsched
