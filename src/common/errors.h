/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: errors.h

    Description:
        Exception types thrown by message parsing and task dispatch. Network
        helpers do not throw (they return bool / nullptr and log); everything
        that interprets bytes or runs a task reports failure with one of these.

        Taxonomy:
        - ProtocolError:        malformed or unexpected message. The service
                                that sees it logs it and drops the connection.
        - UnknownTaskError:     task type not in the catalog. A ProtocolError
                                on the worker side (fatal for that worker).
        - UnmatchedFinishError: FINISH with no in-flight assignment. The
                                scheduler only logs this; the type exists for
                                callers that want strict handling.
        - ExecutionError:       a task body failed. Propagates out of the
                                worker's run loop and ends the worker.

        Registration before any request is not an error (implicit
        re-registration), so it has no type here.

*******************************************************************************/

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace benchsched {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what)
        : std::runtime_error(what) {}
};

class UnknownTaskError : public ProtocolError {
public:
    explicit UnknownTaskError(const std::string& task_name)
        : ProtocolError("Unknown task type: " + task_name),
          task_name_(task_name) {}

    const std::string& task_name() const { return task_name_; }

private:
    std::string task_name_;
};

class UnmatchedFinishError : public std::runtime_error {
public:
    explicit UnmatchedFinishError(const std::string& node)
        : std::runtime_error("FINISH from " + node + " with no in-flight task"),
          node_(node) {}

    const std::string& node() const { return node_; }

private:
    std::string node_;
};

class ExecutionError : public std::runtime_error {
public:
    ExecutionError(const std::string& task_name, const std::string& reason)
        : std::runtime_error("Task '" + task_name + "' failed: " + reason),
          task_name_(task_name) {}

    const std::string& task_name() const { return task_name_; }

private:
    std::string task_name_;
};

} // namespace benchsched

#endif // ERRORS_H
