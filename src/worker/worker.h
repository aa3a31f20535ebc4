/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: worker.h

    Description:
        Node worker: registers with the scheduler, then requests, executes
        and reports tasks one at a time until the scheduler answers REST.

    Loop:

        REGISTER|REQUEST|<host>  --> expect REGISTER|CONFIRM|true
        repeat:
            TASK|REQUEST|<host>  --> TASK|ASSIGN|REST        -> done
                                 --> TASK|ASSIGN|<type>|<json>
            emit TASK_REQUESTED
            catalog.execute(type, params)           (timed)
            TASK|FINISH|<secs>|<host>, wait for the scheduler to close
            emit TASK_FINISHED

        Every exchange uses a fresh connection. Waiting for the close after
        FINISH orders it before the next REQUEST on the scheduler side.

    Failure Handling:
        - Scheduler unreachable / no reply: run() logs and returns false.
          There is no retry loop.
        - Registration refused: run() returns false before any request.
        - UnknownTaskError, ExecutionError: propagate out of run(). The
          scheduler only ever sees the missing FINISH.
        - Event delivery failures are ignored (best effort).

*******************************************************************************/

#ifndef WORKER_H
#define WORKER_H

#include "common/event_emitter.h"
#include "common/message.h"
#include "tasks/task_catalog.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace benchsched {

struct WorkerConfig {
    std::string scheduler_host;
    uint16_t scheduler_port;
    std::string hostname;          // node id; empty = gethostname()
    std::string io_file_path;      // backing file for the fileIO task
    int timeout_ms;                // connect/send/receive, per exchange
    EmitterConfig events;

    WorkerConfig()
        : scheduler_host("localhost"),
          scheduler_port(kDefaultSchedulerPort),
          timeout_ms(5000) {}
};

class Worker {
private:
    WorkerConfig config_;
    TaskCatalog catalog_;
    EventEmitter emitter_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> tasks_completed_;
    std::vector<std::string> executed_tasks_;

public:
    // Worker with the default benchmark bodies (fileIO bound to
    // config.io_file_path).
    explicit Worker(const WorkerConfig& config);

    // Worker with a caller-supplied catalog.
    Worker(const WorkerConfig& config, TaskCatalog catalog);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Runs the register/request/execute/report loop on the calling thread.
    // Returns true when the scheduler said REST (or stop() was called
    // between tasks), false on a network or registration failure.
    bool run();

    // Ends run() before its next request. A running task is not interrupted.
    void stop() { running_ = false; }

    bool is_running() const { return running_; }
    const std::string& hostname() const { return config_.hostname; }
    uint64_t tasks_completed() const { return tasks_completed_; }

    // Task names in execution order. Read only after run() returned.
    const std::vector<std::string>& executed_tasks() const { return executed_tasks_; }

private:
    bool run_loop();
    bool register_with_scheduler();

    // Sends TASK|REQUEST and decodes the reply. Returns nullptr on a
    // network failure; throws ProtocolError on an unparsable reply.
    std::unique_ptr<TaskAssignMessage> request_task();

    bool report_finish(double duration);
};

} // namespace benchsched

#endif // WORKER_H
