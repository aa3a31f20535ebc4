/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: test_task_catalog.cpp

    Description:
        Unit tests for the task catalog and the benchmark bodies. Sizes are
        kept tiny so the whole file runs in well under a second.

        Test Coverage:
        - Test 1: Default catalog contents and parameter schemas
        - Test 2: Benchmark bodies compute the expected results
        - Test 3: fileIO against a scratch file in /tmp
        - Test 4: Error mapping (unknown name, missing parameter, body failure)
        - Test 5: Pluggable task registration
        - Test 6: Default task set and --tasks list parsing
        - Test 7: Out-of-range sizes from an ASSIGN reply are rejected

*******************************************************************************/

#include "common/errors.h"
#include "common/logger.h"
#include "common/message.h"
#include "tasks/benchmark_tasks.h"
#include "tasks/task_catalog.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>

using namespace benchsched;

static const char* kScratchFile = "/tmp/benchsched_test_io_file";

// Counts invocations; used to check that registration replaces bodies.
class CountingTask : public Task {
public:
    int runs;

    CountingTask() : Task("matmul", {"size"}), runs(0) {}

    void run(const TaskParams&) override { runs++; }
};

int main() {
    Logger::set_level(LogLevel::WARNING);
    Logger::info("Running task catalog tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Default catalog and schemas... ";
        try {
            TaskCatalog catalog = TaskCatalog::with_default_tasks("");
            assert(catalog.contains("matmul"));
            assert(catalog.contains("primes"));
            assert(catalog.contains("array"));
            assert(catalog.contains("fileIO"));
            assert(!catalog.contains("fileio"));
            assert(catalog.task_names().size() == 4);

            assert(catalog.parameter_names("matmul") == std::vector<std::string>{"size"});
            assert(catalog.parameter_names("primes") == std::vector<std::string>{"max_n"});
            assert(catalog.parameter_names("array") == std::vector<std::string>{"array_size"});
            assert(catalog.parameter_names("fileIO") == std::vector<std::string>{"num_rw"});

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Benchmark bodies... ";
        try {
            PrimesTask primes;
            primes.run({{"max_n", 100}});
            assert(primes.last_prime_count() == 25);
            primes.run({{"max_n", 1}});
            assert(primes.last_prime_count() == 0);

            ArraySortTask sorter;
            sorter.run({{"array_size", 1000}});
            assert(sorter.last_sorted());

            MatmulTask matmul;
            matmul.run({{"size", 8}});

            TaskCatalog catalog = TaskCatalog::with_default_tasks("");
            double elapsed = catalog.execute("primes", {{"max_n", 10000}});
            assert(elapsed >= 0.0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: fileIO on a scratch file... ";
        try {
            {
                std::ofstream out(kScratchFile, std::ios::binary | std::ios::trunc);
                std::string block(64 * 1024, 'x');
                out << block;
            }

            FileIoTask io(kScratchFile);
            io.run({{"num_rw", 20}});
            assert(io.last_bytes_touched() == 20 * FileIoTask::kChunkSize);

            TaskCatalog catalog = TaskCatalog::with_default_tasks(kScratchFile);
            assert(catalog.execute("fileIO", {{"num_rw", 5}}) >= 0.0);

            std::remove(kScratchFile);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Error mapping... ";
        try {
            TaskCatalog catalog = TaskCatalog::with_default_tasks("/tmp/benchsched_no_such_file");

            bool unknown = false;
            try {
                catalog.execute("raytrace", {});
            } catch (const UnknownTaskError& e) {
                unknown = (e.task_name() == "raytrace");
            }
            assert(unknown);

            bool missing = false;
            try {
                catalog.execute("matmul", {{"sise", 4}});
            } catch (const ExecutionError& e) {
                missing = (e.task_name() == "matmul");
            }
            assert(missing);

            bool body_failed = false;
            try {
                catalog.execute("fileIO", {{"num_rw", 1}});
            } catch (const ExecutionError& e) {
                body_failed = (e.task_name() == "fileIO");
            }
            assert(body_failed);

            bool negative = false;
            try {
                catalog.execute("array", {{"array_size", -5}});
            } catch (const ExecutionError&) {
                negative = true;
            }
            assert(negative);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Pluggable task registration... ";
        try {
            TaskCatalog catalog;
            auto task = std::make_unique<CountingTask>();
            CountingTask* raw = task.get();
            catalog.register_task(std::move(task));

            catalog.execute("matmul", {{"size", 1}});
            catalog.execute("matmul", {{"size", 1}});
            assert(raw->runs == 2);
            assert(!catalog.contains("primes"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Default task set and list parsing... ";
        try {
            std::vector<TaskSpec> defaults = default_task_set();
            assert(defaults.size() == 13);

            std::map<TaskType, int> counts;
            for (const auto& spec : defaults) {
                counts[spec.type]++;
                assert(spec.parameters == default_parameters(spec.type));
            }
            assert(counts[TaskType::ARRAY] == 3);
            assert(counts[TaskType::FILEIO] == 2);
            assert(counts[TaskType::MATMUL] == 3);
            assert(counts[TaskType::PRIMES] == 5);
            assert(default_parameters(TaskType::MATMUL).at("size") == 425);

            std::vector<TaskSpec> custom = parse_task_list(" matmul, primes,,fileIO ");
            assert(custom.size() == 3);
            assert(custom[0].type == TaskType::MATMUL);
            assert(custom[1].type == TaskType::PRIMES);
            assert(custom[2].type == TaskType::FILEIO);

            bool rejected = false;
            try {
                parse_task_list("matmul,quicksort");
            } catch (const UnknownTaskError& e) {
                rejected = (e.task_name() == "quicksort");
            }
            assert(rejected);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Out-of-range sizes are rejected... ";
        try {
            TaskCatalog catalog = TaskCatalog::with_default_tasks(kScratchFile);

            auto msg = Message::parse("TASK|ASSIGN|primes|{\"max_n\": 1e30}");
            assert(msg->type == MessageType::TASK_ASSIGN);
            auto* assign = static_cast<TaskAssignMessage*>(msg.get());
            assert(!assign->rest);

            bool huge_count = false;
            try {
                catalog.execute(assign->task.name(), assign->task.parameters);
            } catch (const ExecutionError& e) {
                huge_count = (e.task_name() == "primes");
            }
            assert(huge_count);

            // 5e9 fits in a long long but 5e9 * 5e9 cells does not fit in size_t.
            bool huge_matrix = false;
            try {
                catalog.execute("matmul", {{"size", 5e9}});
            } catch (const ExecutionError& e) {
                huge_matrix = (e.task_name() == "matmul");
            }
            assert(huge_matrix);

            bool at_limit = false;
            try {
                catalog.execute("array", {{"array_size", 9223372036854775808.0}});
            } catch (const ExecutionError&) {
                at_limit = true;
            }
            assert(at_limit);

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
