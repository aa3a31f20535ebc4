/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: test_event_store.cpp

    Description:
        Unit tests for event correlation and aggregation in the event
        logger's EventStore.

        Test Coverage:
        - Test 1: ASSIGNED then FINISHED yields one completed instance
        - Test 2: FINISHED with no open instance is orphaned
        - Test 3: Instance ids are unique and increase per type
        - Test 4: Newest unfinished instance is matched first
        - Test 5: Malformed text is rejected and not recorded
        - Test 6: Summary, per-node and per-type statistics
        - Test 7: Snapshot export to a directory
        - Test 8: Concurrent ingestion
        - Test 9: Export and summary with names that are not UTF-8

*******************************************************************************/

#include "common/errors.h"
#include "common/logger.h"
#include "event_logger/event_store.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

using namespace benchsched;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

int main() {
    Logger::set_level(LogLevel::ERROR);
    Logger::info("Running event store tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Assignment/finish correlation... ";
        try {
            EventStore store;
            auto id = store.ingest_text("NODE W1 EVENT TASK_ASSIGNED TIME 100.0 TASK matmul", 0.0);
            assert(id && *id == "matmul_1");
            auto done = store.ingest_text("NODE W1 EVENT TASK_FINISHED TIME 102.5 TASK matmul", 0.0);
            assert(done && *done == "matmul_1");

            std::optional<TaskInstance> inst = store.get_instance("matmul_1");
            assert(inst);
            assert(inst->node == "W1");
            assert(inst->task_type == "matmul");
            assert(near(inst->assigned_time, 100.0));
            assert(inst->finished_time && near(*inst->finished_time, 102.5));
            assert(inst->duration && near(*inst->duration, 2.5));
            assert(inst->events.size() == 2);
            assert(inst->events[1].task_instance && *inst->events[1].task_instance == "matmul_1");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Orphaned finish... ";
        try {
            EventStore store;
            auto id = store.ingest_text("NODE W9 EVENT TASK_FINISHED TIME 5 TASK primes", 0.0);
            assert(!id);
            assert(store.orphaned_finishes() == 1);
            assert(store.event_count() == 1);
            assert(store.instance_count() == 0);

            // Different node: still no match.
            store.ingest_text("NODE W1 EVENT TASK_ASSIGNED TIME 1 TASK primes", 0.0);
            assert(!store.ingest_text("NODE W2 EVENT TASK_FINISHED TIME 2 TASK primes", 0.0));
            assert(store.orphaned_finishes() == 2);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Unique increasing instance ids... ";
        try {
            EventStore store;
            std::set<std::string> ids;
            for (int i = 1; i <= 50; ++i) {
                std::string node = "node-" + std::to_string(i % 7);
                auto id = store.ingest(LifecycleEvent(node, EventKind::TASK_ASSIGNED,
                                                      static_cast<double>(i), std::string("array")));
                assert(id && *id == "array_" + std::to_string(i));
                ids.insert(*id);
            }
            assert(ids.size() == 50);

            // Counters are per type.
            auto other = store.ingest(LifecycleEvent("n", EventKind::TASK_ASSIGNED, 0.0,
                                                     std::string("fileIO")));
            assert(other && *other == "fileIO_1");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Newest unfinished instance matched first... ";
        try {
            EventStore store;
            store.ingest_text("NODE W1 EVENT TASK_ASSIGNED TIME 10 TASK matmul", 0.0);
            store.ingest_text("NODE W2 EVENT TASK_ASSIGNED TIME 11 TASK matmul", 0.0);
            store.ingest_text("NODE W1 EVENT TASK_ASSIGNED TIME 12 TASK matmul", 0.0);

            auto first = store.ingest_text("NODE W1 EVENT TASK_FINISHED TIME 15 TASK matmul", 0.0);
            assert(first && *first == "matmul_3");
            auto second = store.ingest_text("NODE W1 EVENT TASK_FINISHED TIME 20 TASK matmul", 0.0);
            assert(second && *second == "matmul_1");

            assert(near(*store.get_instance("matmul_3")->duration, 3.0));
            assert(near(*store.get_instance("matmul_1")->duration, 10.0));
            assert(!store.get_instance("matmul_2")->is_finished());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Malformed text is rejected... ";
        try {
            EventStore store;
            int rejected = 0;
            const char* bad[] = {
                "EVENT TASK_ASSIGNED TASK matmul",
                "NODE W1",
                "NODE W1 EVENT TASK_VANISHED TASK matmul",
                "NODE W1 EVENT TASK_ASSIGNED TIME 3",
            };
            for (const char* text : bad) {
                try {
                    store.ingest_text(text, 0.0);
                } catch (const ProtocolError&) {
                    rejected++;
                }
            }
            assert(rejected == 4);
            assert(store.event_count() == 0);

            store.ingest_text("NODE W1 EVENT TASK_REQUESTED", 77.0);
            assert(store.event_count() == 1);
            assert(near(store.events()[0].time, 77.0));
            assert(store.instance_count() == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Summary and grouped statistics... ";
        try {
            EventStore store;
            store.ingest_text("NODE A EVENT TASK_ASSIGNED TIME 0 TASK matmul", 0.0);
            store.ingest_text("NODE A EVENT TASK_REQUESTED TIME 0.1", 0.0);
            store.ingest_text("NODE A EVENT TASK_FINISHED TIME 2 TASK matmul", 0.0);
            store.ingest_text("NODE B EVENT TASK_ASSIGNED TIME 1 TASK matmul", 0.0);
            store.ingest_text("NODE B EVENT TASK_FINISHED TIME 5 TASK matmul", 0.0);
            store.ingest_text("NODE B EVENT TASK_ASSIGNED TIME 6 TASK primes", 0.0);

            EventSummary summary = store.summarize();
            assert(summary.total_events == 6);
            assert(summary.events_by_kind["TASK_ASSIGNED"] == 3);
            assert(summary.events_by_kind["TASK_FINISHED"] == 2);
            assert(summary.events_by_kind["TASK_REQUESTED"] == 1);
            assert(summary.overall.total == 3);
            assert(summary.overall.completed == 2);
            assert(summary.overall.pending == 1);
            assert(near(summary.overall.average_duration(), 3.0));
            assert(near(summary.overall.min_duration, 2.0));
            assert(near(summary.overall.max_duration, 4.0));
            assert(summary.by_node["B"].total == 2);
            assert(summary.by_node["B"].pending == 1);
            assert(summary.by_type["primes"].completed == 0);

            InstanceStats matmul = store.type_stats("matmul");
            assert(matmul.total == 2 && matmul.completed == 2);
            assert(near(matmul.average_duration(), 3.0));

            InstanceStats node_a = store.node_stats("A");
            assert(node_a.total == 1 && near(node_a.average_duration(), 2.0));
            assert(store.node_stats("nobody").total == 0);

            nlohmann::json j = summary.to_json();
            assert(j["instances"]["completed"] == 2);
            assert(j["by_type"]["primes"]["average_duration"].is_null());

            assert(store.summary_text().find("Completed tasks: 2") != std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Snapshot export... ";
        try {
            const std::string dir = "/tmp/benchsched_test_export";
            std::filesystem::remove_all(dir);

            EventStore store;
            store.ingest_text("NODE W1 EVENT TASK_ASSIGNED TIME 100.0 TASK matmul", 0.0);
            store.ingest_text("NODE W1 EVENT TASK_FINISHED TIME 102.5 TASK matmul", 0.0);
            store.ingest_text("NODE W1 EVENT TASK_FINISHED TIME 103 TASK primes", 0.0);

            std::string path = store.export_to_directory(dir);
            assert(!path.empty());
            assert(std::filesystem::path(path).filename().string().rfind("logger_data_", 0) == 0);

            std::ifstream in(path);
            nlohmann::json snapshot = nlohmann::json::parse(in);
            assert(snapshot["events"].size() == 3);
            assert(snapshot["events"][1]["task_instance"] == "matmul_1");
            assert(!snapshot["events"][2].contains("task_instance"));
            assert(snapshot["tasks"]["matmul_1"]["duration"].get<double>() == 2.5);
            assert(snapshot["orphaned_finishes"] == 1);
            assert(snapshot.contains("export_time"));
            assert(snapshot["export_datetime"].is_string());

            std::filesystem::remove_all(dir);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: Concurrent ingestion... ";
        try {
            EventStore store;
            const int kNodes = 8;
            const int kTasksPerNode = 50;

            std::vector<std::thread> threads;
            for (int n = 0; n < kNodes; ++n) {
                threads.emplace_back([&store, n]() {
                    std::string node = "N" + std::to_string(n);
                    for (int i = 0; i < kTasksPerNode; ++i) {
                        double t = static_cast<double>(i);
                        store.ingest(LifecycleEvent(node, EventKind::TASK_ASSIGNED, t,
                                                    std::string("primes")));
                        store.ingest(LifecycleEvent(node, EventKind::TASK_FINISHED, t + 1.0,
                                                    std::string("primes")));
                    }
                });
            }
            for (auto& th : threads) th.join();

            assert(store.event_count() == static_cast<size_t>(2 * kNodes * kTasksPerNode));
            InstanceStats stats = store.type_stats("primes");
            assert(stats.total == static_cast<size_t>(kNodes * kTasksPerNode));
            assert(stats.completed == stats.total);
            assert(near(stats.average_duration(), 1.0));
            assert(store.orphaned_finishes() == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 9: Non-UTF-8 names in export and summary... ";
        try {
            const std::string dir = "/tmp/benchsched_test_export_bytes";
            std::filesystem::remove_all(dir);

            EventStore store;
            store.ingest_text("NODE w\xff" "1 EVENT TASK_ASSIGNED TIME 1 TASK matmul", 0.0);
            store.ingest_text("NODE w\xff" "1 EVENT TASK_FINISHED TIME 3 TASK matmul", 0.0);
            store.ingest_text("NODE w2 EVENT TASK_FINISHED TIME 4 TASK matmul\xfe", 0.0);
            assert(store.event_count() == 3);

            std::string path = store.export_to_directory(dir);
            assert(!path.empty());

            std::ifstream in(path);
            nlohmann::json snapshot = nlohmann::json::parse(in);
            assert(snapshot["events"].size() == 3);
            assert(snapshot["events"][0]["node"] == "w\xEF\xBF\xBD" "1");
            assert(snapshot["tasks"]["matmul_1"]["duration"].get<double>() == 2.0);

            // The store stays usable: a second export and a summary still work.
            assert(store.export_to_file(dir + "/again.json"));
            std::string summary = store.summarize().to_json().dump(
                -1, ' ', false, nlohmann::json::error_handler_t::replace);
            assert(nlohmann::json::parse(summary)["total_events"] == 3);
            assert(!store.summary_text().empty());

            std::filesystem::remove_all(dir);

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
