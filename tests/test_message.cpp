/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: test_message.cpp

    Description:
        Unit tests for the two text protocols: scheduler control messages
        (common/message.h) and lifecycle events (common/lifecycle_event.h).

        Test Coverage:
        - Test 1: Scheduler message encodings match the wire format
        - Test 2: ASSIGN carries type and JSON parameters; REST is recognized
        - Test 3: Optional hostname field on REQUEST / FINISH
        - Test 4: Malformed scheduler messages raise ProtocolError
        - Test 5: Unknown ASSIGN task type raises UnknownTaskError
        - Test 6: Event encoding and key/value parsing in any order
        - Test 7: TIME defaults to receipt time, unknown keys are skipped
        - Test 8: Malformed events are rejected

*******************************************************************************/

#include "common/errors.h"
#include "common/lifecycle_event.h"
#include "common/logger.h"
#include "common/message.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace benchsched;

template <typename Fn>
static bool throws_protocol_error(Fn fn) {
    try {
        fn();
    } catch (const ProtocolError&) {
        return true;
    }
    return false;
}

int main() {
    Logger::set_level(LogLevel::WARNING);
    Logger::info("Running message tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Scheduler message encodings... ";
        try {
            assert(RegisterRequestMessage("node-1").serialize() == "REGISTER|REQUEST|node-1");
            assert(RegisterConfirmMessage(true, "sched").serialize() == "REGISTER|CONFIRM|true|sched");
            assert(TaskRequestMessage().serialize() == "TASK|REQUEST");
            assert(TaskAssignMessage::make_rest().serialize() == "TASK|ASSIGN|REST");
            assert(StatusRequestMessage().serialize() == "STATUS|REQUEST");

            TaskAssignMessage assign(TaskSpec(TaskType::MATMUL, {{"size", 425}}));
            assert(assign.serialize() == "TASK|ASSIGN|matmul|{\"size\":425}");

            auto confirm = Message::parse("REGISTER|CONFIRM|true|sched");
            assert(confirm->type == MessageType::REGISTER_CONFIRM);
            auto* c = static_cast<RegisterConfirmMessage*>(confirm.get());
            assert(c->confirmed);
            assert(c->scheduler_hostname == "sched");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: ASSIGN with parameters and REST... ";
        try {
            auto msg = Message::parse("TASK|ASSIGN|primes|{\"max_n\": 2400000}\n");
            assert(msg->type == MessageType::TASK_ASSIGN);
            auto* assign = static_cast<TaskAssignMessage*>(msg.get());
            assert(!assign->rest);
            assert(assign->task.type == TaskType::PRIMES);
            assert(assign->task.parameters.at("max_n") == 2400000.0);

            // File I/O type name keeps its mixed case on the wire.
            auto io = Message::parse("TASK|ASSIGN|fileIO|{\"num_rw\":10}");
            assert(static_cast<TaskAssignMessage*>(io.get())->task.type == TaskType::FILEIO);

            auto rest = Message::parse("TASK|ASSIGN|REST");
            assert(static_cast<TaskAssignMessage*>(rest.get())->rest);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Optional hostname on REQUEST and FINISH... ";
        try {
            auto bare = Message::parse("TASK|REQUEST");
            assert(static_cast<TaskRequestMessage*>(bare.get())->hostname.empty());

            auto named = Message::parse("TASK|REQUEST|W1");
            assert(static_cast<TaskRequestMessage*>(named.get())->hostname == "W1");

            auto finish = Message::parse("TASK|FINISH|2.5");
            auto* f = static_cast<TaskFinishMessage*>(finish.get());
            assert(f->duration == 2.5);
            assert(f->hostname.empty());

            std::string wire = TaskFinishMessage(0.123456789, "W2").serialize();
            auto again = Message::parse(wire);
            auto* g = static_cast<TaskFinishMessage*>(again.get());
            assert(g->duration == 0.123456789);
            assert(g->hostname == "W2");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Malformed scheduler messages... ";
        try {
            assert(throws_protocol_error([]() { Message::parse(""); }));
            assert(throws_protocol_error([]() { Message::parse("HELLO"); }));
            assert(throws_protocol_error([]() { Message::parse("TASK|DANCE"); }));
            assert(throws_protocol_error([]() { Message::parse("REGISTER|REQUEST"); }));
            assert(throws_protocol_error([]() { Message::parse("TASK|FINISH"); }));
            assert(throws_protocol_error([]() { Message::parse("TASK|FINISH|soon"); }));
            assert(throws_protocol_error([]() { Message::parse("TASK|FINISH|-1"); }));
            assert(throws_protocol_error([]() { Message::parse("TASK|ASSIGN|matmul|[1,2]"); }));
            assert(throws_protocol_error([]() { Message::parse("TASK|ASSIGN|matmul|{\"size\":\"big\"}"); }));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Unknown task type in ASSIGN... ";
        try {
            bool thrown = false;
            try {
                Message::parse("TASK|ASSIGN|raytrace|{}");
            } catch (const UnknownTaskError& e) {
                thrown = true;
                assert(e.task_name() == "raytrace");
            }
            assert(thrown);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Event encoding and parsing... ";
        try {
            LifecycleEvent ev("W1", EventKind::TASK_ASSIGNED, 100.0, std::string("matmul"));
            assert(format_event(ev) == "NODE W1 EVENT TASK_ASSIGNED TIME 100.000000 TASK matmul");

            LifecycleEvent parsed = parse_event("TASK primes TIME 7.25 EVENT TASK_FINISHED NODE W3", 0.0);
            assert(parsed.node == "W3");
            assert(parsed.kind == EventKind::TASK_FINISHED);
            assert(parsed.time == 7.25);
            assert(parsed.task_name && *parsed.task_name == "primes");

            LifecycleEvent requested = parse_event("NODE W2 EVENT TASK_REQUESTED TIME 5", 0.0);
            assert(requested.kind == EventKind::TASK_REQUESTED);
            assert(!requested.task_name);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Default TIME and unknown keys... ";
        try {
            LifecycleEvent ev = parse_event("NODE W1 PRIORITY high EVENT TASK_REQUESTED", 42.5);
            assert(ev.node == "W1");
            assert(ev.kind == EventKind::TASK_REQUESTED);
            assert(ev.time == 42.5);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: Malformed events are rejected... ";
        try {
            assert(throws_protocol_error([]() { parse_event("EVENT TASK_ASSIGNED TASK matmul", 0.0); }));
            assert(throws_protocol_error([]() { parse_event("NODE W1 TASK matmul", 0.0); }));
            assert(throws_protocol_error([]() { parse_event("NODE W1 EVENT TASK_EXPLODED", 0.0); }));
            assert(throws_protocol_error([]() { parse_event("NODE W1 EVENT TASK_ASSIGNED", 0.0); }));
            assert(throws_protocol_error([]() { parse_event("NODE W1 EVENT TASK_FINISHED TIME 1", 0.0); }));
            assert(throws_protocol_error([]() { parse_event("NODE W1 EVENT TASK_REQUESTED TIME abc", 0.0); }));
            assert(throws_protocol_error([]() { parse_event("", 0.0); }));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
