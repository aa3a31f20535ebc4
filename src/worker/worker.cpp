/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: worker.cpp

    Description:
        Node worker request/execute/report loop (worker.h).

*******************************************************************************/

//==============================================================================
// TABLE OF CONTENTS
//==============================================================================
//
// 1. CONSTRUCTION
// 2. MAIN LOOP
// 3. SCHEDULER EXCHANGES (register, request, finish)
//
//==============================================================================

#include "worker/worker.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/tcp_connection.h"

#include <sstream>

namespace benchsched {

//==============================================================================
// SECTION 1: CONSTRUCTION
//==============================================================================

Worker::Worker(const WorkerConfig& config)
    : Worker(config, TaskCatalog::with_default_tasks(config.io_file_path)) {
}

Worker::Worker(const WorkerConfig& config, TaskCatalog catalog)
    : config_(config),
      catalog_(std::move(catalog)),
      emitter_(config.events),
      running_(false),
      tasks_completed_(0) {
    if (config_.hostname.empty()) {
        config_.hostname = local_hostname();
    }
}

//==============================================================================
// SECTION 2: MAIN LOOP
//==============================================================================

bool Worker::run() {
    running_ = true;
    try {
        bool ok = run_loop();
        running_ = false;
        return ok;
    } catch (...) {
        running_ = false;
        throw;
    }
}

bool Worker::run_loop() {
    Logger::info("Worker " + config_.hostname + " connecting to scheduler at " +
                 config_.scheduler_host + ":" + std::to_string(config_.scheduler_port));

    if (!register_with_scheduler()) {
        return false;
    }

    while (running_) {
        std::unique_ptr<TaskAssignMessage> assign = request_task();
        if (!assign) {
            Logger::error("Lost contact with scheduler; aborting");
            return false;
        }

        if (assign->rest) {
            Logger::info("Scheduler has no more tasks (REST); " +
                         std::to_string(tasks_completed_) + " tasks completed");
            break;
        }

        const std::string task_name = assign->task.name();
        if (!catalog_.contains(task_name)) {
            throw UnknownTaskError(task_name);
        }

        emitter_.emit(config_.hostname, EventKind::TASK_REQUESTED);

        double duration = catalog_.execute(task_name, assign->task.parameters);

        executed_tasks_.push_back(task_name);
        tasks_completed_++;

        std::ostringstream ss;
        ss << "Completed " << task_name << " in " << duration << "s";
        Logger::info(ss.str());

        if (!report_finish(duration)) {
            Logger::error("Could not report completion of " + task_name + "; aborting");
            return false;
        }

        emitter_.emit(config_.hostname, EventKind::TASK_FINISHED, task_name);
    }

    return true;
}

//==============================================================================
// SECTION 3: SCHEDULER EXCHANGES
//==============================================================================

bool Worker::register_with_scheduler() {
    std::string response;
    if (!send_request(config_.scheduler_host, config_.scheduler_port,
                      RegisterRequestMessage(config_.hostname).serialize(),
                      config_.timeout_ms, &response, kMaxRequestSize)) {
        Logger::error("Failed to reach scheduler for registration");
        return false;
    }

    try {
        std::unique_ptr<Message> msg = Message::parse(response);
        if (msg->type != MessageType::REGISTER_CONFIRM) {
            Logger::error("Unexpected registration reply: " + message_type_to_string(msg->type));
            return false;
        }
        auto* confirm = static_cast<RegisterConfirmMessage*>(msg.get());
        if (!confirm->confirmed) {
            Logger::error("Scheduler refused registration");
            return false;
        }
        Logger::info("Registered with scheduler " + confirm->scheduler_hostname);
        return true;
    } catch (const ProtocolError& e) {
        Logger::error("Invalid registration reply: " + std::string(e.what()));
        return false;
    }
}

std::unique_ptr<TaskAssignMessage> Worker::request_task() {
    std::string response;
    if (!send_request(config_.scheduler_host, config_.scheduler_port,
                      TaskRequestMessage(config_.hostname).serialize(),
                      config_.timeout_ms, &response, kMaxRequestSize)) {
        return nullptr;
    }

    if (response.empty()) {
        // The scheduler drops the connection on a protocol error.
        Logger::error("Scheduler closed the task request without a reply");
        return nullptr;
    }

    std::unique_ptr<Message> msg = Message::parse(response);
    if (msg->type != MessageType::TASK_ASSIGN) {
        throw ProtocolError("expected TASK|ASSIGN, got " + message_type_to_string(msg->type));
    }
    return std::unique_ptr<TaskAssignMessage>(static_cast<TaskAssignMessage*>(msg.release()));
}

bool Worker::report_finish(double duration) {
    // The reply is empty; reading until close means the scheduler has
    // finished processing the FINISH before this returns.
    std::string ack;
    return send_request(config_.scheduler_host, config_.scheduler_port,
                        TaskFinishMessage(duration, config_.hostname).serialize(),
                        config_.timeout_ms, &ack, kMaxRequestSize);
}

} // namespace benchsched
