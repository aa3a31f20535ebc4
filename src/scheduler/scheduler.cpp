/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: scheduler.cpp

    Description:
        Per-connection message dispatch for the scheduler (scheduler.h).

*******************************************************************************/

//==============================================================================
// TABLE OF CONTENTS
//==============================================================================
//
// 1. CONSTRUCTOR & DESTRUCTOR
// 2. CONNECTION HANDLING
// 3. STATISTICS
//
//==============================================================================

#include "scheduler/scheduler.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/tcp_connection.h"

#include <sstream>

namespace benchsched {

//==============================================================================
// SECTION 1: CONSTRUCTOR & DESTRUCTOR
//==============================================================================

Scheduler::Scheduler(const SchedulerConfig& config, SchedulerState& state)
    : TcpServer("Scheduler", config.bind_host, config.listen_port, config.read_timeout_ms),
      config_(config),
      state_(state),
      emitter_(config.events),
      assignments_sent_(0),
      rest_sent_(0),
      protocol_errors_(0) {
    if (config_.hostname.empty()) {
        config_.hostname = local_hostname();
    }
}

Scheduler::~Scheduler() {
    stop();
}

//==============================================================================
// SECTION 2: CONNECTION HANDLING
//==============================================================================

bool Scheduler::reply(int client_socket, const Message& message) {
    if (!send_all(client_socket, message.serialize())) {
        Logger::warning("Failed to send " + message_type_to_string(message.type) + " reply");
        return false;
    }
    return true;
}

void Scheduler::handle_connection(int client_socket, const std::string& peer_address) {
    std::string text;
    if (!receive_all(client_socket, kMaxRequestSize, text)) {
        Logger::debug("Empty or timed-out request from " + peer_address);
        return;
    }

    try {
        std::unique_ptr<Message> msg = Message::parse(text);

        switch (msg->type) {
            case MessageType::REGISTER_REQUEST: {
                auto* reg = static_cast<RegisterRequestMessage*>(msg.get());
                state_.register_node(reg->hostname.empty() ? peer_address : reg->hostname);
                reply(client_socket, RegisterConfirmMessage(true, config_.hostname));
                break;
            }

            case MessageType::TASK_REQUEST: {
                auto* req = static_cast<TaskRequestMessage*>(msg.get());
                const std::string node = req->hostname.empty() ? peer_address : req->hostname;

                std::optional<TaskSpec> task = state_.request_task(node);
                if (!task) {
                    rest_sent_++;
                    reply(client_socket, TaskAssignMessage::make_rest());
                    break;
                }

                assignments_sent_++;
                // The task stays in flight even if this reply is lost; see
                // the liveness note in scheduler_state.h.
                reply(client_socket, TaskAssignMessage(*task));
                emitter_.emit(node, EventKind::TASK_ASSIGNED, task->name());
                break;
            }

            case MessageType::TASK_FINISH: {
                auto* fin = static_cast<TaskFinishMessage*>(msg.get());
                const std::string node = fin->hostname.empty() ? peer_address : fin->hostname;
                // Closing the connection afterwards is the acknowledgment.
                if (!config_.strict_finish) {
                    state_.finish_task(node, fin->duration);
                    break;
                }
                try {
                    state_.finish_task_strict(node, fin->duration);
                } catch (const UnmatchedFinishError& e) {
                    protocol_errors_++;
                    Logger::warning(std::string("Rejected FINISH: ") + e.what());
                }
                break;
            }

            case MessageType::STATUS_REQUEST:
                reply(client_socket, StatusReportMessage(state_.status_report()));
                break;

            default:
                throw ProtocolError("unexpected " + message_type_to_string(msg->type) +
                                    " message at scheduler");
        }
    } catch (const ProtocolError& e) {
        protocol_errors_++;
        Logger::warning("Protocol error from " + peer_address + ": " + e.what() +
                        "; dropping connection");
    }
}

//==============================================================================
// SECTION 3: STATISTICS
//==============================================================================

void Scheduler::print_statistics() const {
    std::stringstream ss;
    ss << "\n=== Scheduler Statistics ===\n"
       << "Registered Nodes: " << state_.registered_count() << "\n"
       << "Waiting Tasks: " << state_.waiting_count() << "\n"
       << "In-Flight Tasks: " << state_.in_flight_count() << "\n"
       << "Finished Tasks: " << state_.finished_count() << "/" << state_.total_tasks() << "\n"
       << "Assignments Sent: " << assignments_sent_ << "\n"
       << "REST Replies: " << rest_sent_ << "\n"
       << "Protocol Errors: " << protocol_errors_ << "\n"
       << "Events Dropped: " << emitter_.events_dropped() << "\n"
       << "============================\n";

    Logger::info(ss.str());
}

} // namespace benchsched
