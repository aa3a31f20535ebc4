/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: message.cpp

    Description:
        Text encoding and decoding of the scheduler protocol (see message.h).
        serialize() never fails; parse() throws ProtocolError on anything it
        cannot interpret so the connection handler can log and drop it.

*******************************************************************************/

//==============================================================================
// TABLE OF CONTENTS
//==============================================================================
//
// 1. FIELD HELPERS
// 2. PARAMETER JSON
// 3. SERIALIZATION (one per message class)
// 4. PARSING (Message::parse)
//
//==============================================================================

#include "common/message.h"
#include "common/errors.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace benchsched {

using json = nlohmann::json;

//==============================================================================
// SECTION 1: FIELD HELPERS
//==============================================================================

std::vector<std::string> split_fields(const std::string& text) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(kFieldSeparator, start);
        if (pos == std::string::npos) {
            fields.push_back(text.substr(start));
            break;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

// Re-joins fields[from..] with the separator. JSON payloads are the last field
// and are not supposed to contain '|', but a stray one must not truncate them.
static std::string join_from(const std::vector<std::string>& fields, size_t from) {
    std::string out;
    for (size_t i = from; i < fields.size(); ++i) {
        if (i > from) out += kFieldSeparator;
        out += fields[i];
    }
    return out;
}

// Strips trailing CR/LF/space/NUL. Some senders terminate with a newline.
static std::string trim_message(const std::string& text) {
    size_t end = text.find_last_not_of(std::string(" \t\r\n\0", 5));
    if (end == std::string::npos) return "";
    size_t begin = text.find_first_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

static double parse_duration(const std::string& field) {
    if (field.empty()) {
        throw ProtocolError("empty duration field");
    }
    char* end = nullptr;
    double value = std::strtod(field.c_str(), &end);
    if (end == field.c_str() || *end != '\0') {
        throw ProtocolError("invalid duration value: " + field);
    }
    if (!std::isfinite(value) || value < 0) {
        throw ProtocolError("duration out of range: " + field);
    }
    return value;
}

std::string message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::REGISTER_REQUEST: return "REGISTER_REQUEST";
        case MessageType::REGISTER_CONFIRM: return "REGISTER_CONFIRM";
        case MessageType::TASK_REQUEST:     return "TASK_REQUEST";
        case MessageType::TASK_ASSIGN:      return "TASK_ASSIGN";
        case MessageType::TASK_FINISH:      return "TASK_FINISH";
        case MessageType::STATUS_REQUEST:   return "STATUS_REQUEST";
        case MessageType::STATUS_REPORT:    return "STATUS_REPORT";
        default:                            return "UNKNOWN";
    }
}

//==============================================================================
// SECTION 2: PARAMETER JSON
//==============================================================================

std::string params_to_json(const TaskParams& params) {
    json j = json::object();
    for (const auto& [key, value] : params) {
        // 2^53: largest range where every integer is exactly representable.
        if (std::floor(value) == value && std::fabs(value) < 9007199254740992.0) {
            j[key] = static_cast<int64_t>(value);
        } else {
            j[key] = value;
        }
    }
    return j.dump();
}

TaskParams params_from_json(const std::string& json_text) {
    json j = json::parse(json_text, nullptr, false);
    if (j.is_discarded()) {
        throw ProtocolError("parameters are not valid JSON: " + json_text);
    }
    if (!j.is_object()) {
        throw ProtocolError("parameters must be a JSON object: " + json_text);
    }

    TaskParams params;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            throw ProtocolError("parameter '" + it.key() + "' is not a number");
        }
        params[it.key()] = it.value().get<double>();
    }
    return params;
}

//==============================================================================
// SECTION 3: SERIALIZATION
//==============================================================================

std::string RegisterRequestMessage::serialize() const {
    return "REGISTER|REQUEST|" + hostname;
}

std::string RegisterConfirmMessage::serialize() const {
    return std::string("REGISTER|CONFIRM|") + (confirmed ? "true" : "false") +
           "|" + scheduler_hostname;
}

std::string TaskRequestMessage::serialize() const {
    if (hostname.empty()) return "TASK|REQUEST";
    return "TASK|REQUEST|" + hostname;
}

std::string TaskAssignMessage::serialize() const {
    if (rest) return "TASK|ASSIGN|REST";
    return "TASK|ASSIGN|" + task.name() + "|" + params_to_json(task.parameters);
}

std::string TaskFinishMessage::serialize() const {
    // Full precision; the scheduler only logs it, but FINISH must round-trip.
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", duration);
    std::string out = std::string("TASK|FINISH|") + buf;
    if (!hostname.empty()) out += "|" + hostname;
    return out;
}

std::string StatusRequestMessage::serialize() const {
    return "STATUS|REQUEST";
}

std::string StatusReportMessage::serialize() const {
    return "STATUS|REPORT|" + status_json;
}

//==============================================================================
// SECTION 4: PARSING
//==============================================================================
//
// Message::parse()
// ----------------
// Dispatches on the first two fields. Extra trailing fields on messages that
// do not define them are ignored, matching the lenient behaviour nodes
// already rely on; missing mandatory fields are a ProtocolError.
//
//==============================================================================

std::unique_ptr<Message> Message::parse(const std::string& raw) {
    std::string text = trim_message(raw);
    if (text.empty()) {
        throw ProtocolError("empty message");
    }

    std::vector<std::string> fields = split_fields(text);
    if (fields.size() < 2) {
        throw ProtocolError("too few fields in message: " + text);
    }

    const std::string& group = fields[0];
    const std::string& verb = fields[1];

    if (group == "REGISTER") {
        if (verb == "REQUEST") {
            if (fields.size() < 3 || fields[2].empty()) {
                throw ProtocolError("REGISTER|REQUEST without hostname");
            }
            return std::make_unique<RegisterRequestMessage>(fields[2]);
        }
        if (verb == "CONFIRM") {
            if (fields.size() < 3) {
                throw ProtocolError("REGISTER|CONFIRM without status");
            }
            auto msg = std::make_unique<RegisterConfirmMessage>();
            msg->confirmed = (fields[2] == "true");
            if (fields.size() >= 4) msg->scheduler_hostname = fields[3];
            return msg;
        }
    } else if (group == "TASK") {
        if (verb == "REQUEST") {
            auto msg = std::make_unique<TaskRequestMessage>();
            if (fields.size() >= 3) msg->hostname = fields[2];
            return msg;
        }
        if (verb == "ASSIGN") {
            if (fields.size() < 3 || fields[2].empty()) {
                throw ProtocolError("TASK|ASSIGN without task type");
            }
            if (fields[2] == "REST") {
                return std::make_unique<TaskAssignMessage>();
            }
            TaskType type;
            if (!task_type_from_string(fields[2], type)) {
                throw UnknownTaskError(fields[2]);
            }
            TaskParams params;
            if (fields.size() >= 4) {
                params = params_from_json(join_from(fields, 3));
            }
            return std::make_unique<TaskAssignMessage>(TaskSpec(type, params));
        }
        if (verb == "FINISH") {
            if (fields.size() < 3) {
                throw ProtocolError("TASK|FINISH without duration");
            }
            auto msg = std::make_unique<TaskFinishMessage>();
            msg->duration = parse_duration(fields[2]);
            if (fields.size() >= 4) msg->hostname = fields[3];
            return msg;
        }
    } else if (group == "STATUS") {
        if (verb == "REQUEST") {
            return std::make_unique<StatusRequestMessage>();
        }
        if (verb == "REPORT") {
            return std::make_unique<StatusReportMessage>(join_from(fields, 2));
        }
    }

    throw ProtocolError("unrecognized message: " + text);
}

} // namespace benchsched
