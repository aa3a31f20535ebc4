/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: message.h

    Description:
        Scheduler control-plane protocol: message classes and their text
        encoding. One message per TCP connection in each direction; fields are
        separated by '|'.

        Node -> Scheduler                      Scheduler -> Node
        -----------------------------------    ------------------------------------------
        REGISTER|REQUEST|<hostname>            REGISTER|CONFIRM|true|<scheduler_hostname>
        TASK|REQUEST[|<hostname>]              TASK|ASSIGN|<task_type>|<json_parameters>
                                               TASK|ASSIGN|REST
        TASK|FINISH|<seconds>[|<hostname>]     (no reply; close is the acknowledgment)
        STATUS|REQUEST                         STATUS|REPORT|<json>

        The trailing <hostname> on TASK|REQUEST and TASK|FINISH is optional.
        When present the scheduler tracks the in-flight task under that name;
        when absent it falls back to the peer IP address.

        JSON parameters are a flat object of numbers, e.g. {"size":425}.
        Integral values are written without a fractional part.

    Parsing:
        Message::parse() turns received text into the matching subclass and
        throws ProtocolError for anything it cannot interpret, and
        UnknownTaskError (a ProtocolError) when an ASSIGN names a task type
        outside the vocabulary.

        auto msg = Message::parse("TASK|FINISH|2.5|node-1");
        if (msg->type == MessageType::TASK_FINISH) {
            auto* finish = static_cast<TaskFinishMessage*>(msg.get());
            ... finish->duration ...
        }

*******************************************************************************/

#ifndef MESSAGE_H
#define MESSAGE_H

#include "tasks/task.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace benchsched {

//==============================================================================
// PROTOCOL CONSTANTS
//==============================================================================

constexpr uint16_t kDefaultSchedulerPort = 5000;
constexpr uint16_t kDefaultEventLoggerPort = 5001;

// Upper bound on a single message. Requests are a few dozen bytes; the
// largest payloads are STATUS|REPORT and event logger QUERY replies, which
// are written by the server and read with a larger limit by the client.
constexpr size_t kMaxRequestSize = 4096;

constexpr char kFieldSeparator = '|';

//==============================================================================
// MESSAGE TYPES
//==============================================================================

enum class MessageType : uint8_t {
    REGISTER_REQUEST = 1,
    REGISTER_CONFIRM = 2,
    TASK_REQUEST = 3,
    TASK_ASSIGN = 4,
    TASK_FINISH = 5,
    STATUS_REQUEST = 6,
    STATUS_REPORT = 7
};

std::string message_type_to_string(MessageType type);

//==============================================================================
// BASE CLASS
//==============================================================================

class Message {
public:
    MessageType type;

    explicit Message(MessageType t) : type(t) {}
    virtual ~Message() = default;

    virtual std::string serialize() const = 0;

    // Throws ProtocolError / UnknownTaskError.
    static std::unique_ptr<Message> parse(const std::string& text);
};

//==============================================================================
// REGISTRATION
//==============================================================================

class RegisterRequestMessage : public Message {
public:
    std::string hostname;

    RegisterRequestMessage() : Message(MessageType::REGISTER_REQUEST) {}
    explicit RegisterRequestMessage(const std::string& host)
        : Message(MessageType::REGISTER_REQUEST), hostname(host) {}

    std::string serialize() const override;
};

class RegisterConfirmMessage : public Message {
public:
    bool confirmed;
    std::string scheduler_hostname;

    RegisterConfirmMessage()
        : Message(MessageType::REGISTER_CONFIRM), confirmed(false) {}
    RegisterConfirmMessage(bool ok, const std::string& host)
        : Message(MessageType::REGISTER_CONFIRM), confirmed(ok), scheduler_hostname(host) {}

    std::string serialize() const override;
};

//==============================================================================
// TASK EXCHANGE
//==============================================================================

class TaskRequestMessage : public Message {
public:
    std::string hostname;    // empty: not sent, scheduler uses peer address

    TaskRequestMessage() : Message(MessageType::TASK_REQUEST) {}
    explicit TaskRequestMessage(const std::string& host)
        : Message(MessageType::TASK_REQUEST), hostname(host) {}

    std::string serialize() const override;
};

// TASK|ASSIGN carries either a task or the REST poison pill.
class TaskAssignMessage : public Message {
public:
    bool rest;
    TaskSpec task;           // meaningful only when rest == false

    TaskAssignMessage() : Message(MessageType::TASK_ASSIGN), rest(true) {}
    explicit TaskAssignMessage(const TaskSpec& spec)
        : Message(MessageType::TASK_ASSIGN), rest(false), task(spec) {}

    static TaskAssignMessage make_rest() { return TaskAssignMessage(); }

    std::string serialize() const override;
};

class TaskFinishMessage : public Message {
public:
    double duration;         // seconds, as measured by the node
    std::string hostname;    // empty: not sent

    TaskFinishMessage() : Message(MessageType::TASK_FINISH), duration(0.0) {}
    TaskFinishMessage(double seconds, const std::string& host)
        : Message(MessageType::TASK_FINISH), duration(seconds), hostname(host) {}

    std::string serialize() const override;
};

//==============================================================================
// STATUS QUERY
//==============================================================================

class StatusRequestMessage : public Message {
public:
    StatusRequestMessage() : Message(MessageType::STATUS_REQUEST) {}

    std::string serialize() const override;
};

class StatusReportMessage : public Message {
public:
    std::string status_json;

    StatusReportMessage() : Message(MessageType::STATUS_REPORT) {}
    explicit StatusReportMessage(const std::string& json)
        : Message(MessageType::STATUS_REPORT), status_json(json) {}

    std::string serialize() const override;
};

//==============================================================================
// PARAMETER ENCODING
//==============================================================================

// {"size":425}. Integral values are emitted as JSON integers.
std::string params_to_json(const TaskParams& params);

// Accepts only a flat JSON object whose values are numbers. Throws
// ProtocolError otherwise.
TaskParams params_from_json(const std::string& json_text);

// Splits on kFieldSeparator, keeping empty fields.
std::vector<std::string> split_fields(const std::string& text);

} // namespace benchsched

#endif // MESSAGE_H
