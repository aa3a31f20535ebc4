/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: benchmark_tasks.h

    Description:
        The four compute-bound benchmark bodies registered in the default
        catalog. Each one is deliberately naive: the point is a repeatable,
        CPU- or IO-heavy workload whose duration depends on one parameter.

        Task      Parameter    Workload
        ------    ----------   ------------------------------------------
        matmul    size         n x n integer matrix multiply, triple loop
        primes    max_n        sieve of Eratosthenes up to max_n
        array     array_size   std::sort of array_size random integers
        fileIO    num_rw       num_rw random 4 KiB read/reverse/write cycles
                               inside an existing file (IO_FILE_PATH)

        Each body keeps a checksum of its output so the optimizer cannot drop
        the work; the checksum is also handy in tests.

*******************************************************************************/

#ifndef BENCHMARK_TASKS_H
#define BENCHMARK_TASKS_H

#include "tasks/task.h"

#include <cstdint>
#include <string>

namespace benchsched {

class MatmulTask : public Task {
private:
    int64_t last_checksum_;

public:
    MatmulTask() : Task("matmul", {"size"}), last_checksum_(0) {}

    void run(const TaskParams& params) override;

    int64_t last_checksum() const { return last_checksum_; }
};

class PrimesTask : public Task {
private:
    uint64_t last_prime_count_;

public:
    PrimesTask() : Task("primes", {"max_n"}), last_prime_count_(0) {}

    void run(const TaskParams& params) override;

    // Number of primes <= max_n found by the last run.
    uint64_t last_prime_count() const { return last_prime_count_; }
};

class ArraySortTask : public Task {
private:
    bool last_sorted_;

public:
    ArraySortTask() : Task("array", {"array_size"}), last_sorted_(false) {}

    void run(const TaskParams& params) override;

    bool last_sorted() const { return last_sorted_; }
};

class FileIoTask : public Task {
private:
    std::string file_path_;
    uint64_t last_bytes_touched_;

public:
    // Block size for every read/write; matches the page size of the test nodes.
    static constexpr size_t kChunkSize = 4 * 1024;

    explicit FileIoTask(const std::string& file_path)
        : Task("fileIO", {"num_rw"}), file_path_(file_path), last_bytes_touched_(0) {}

    void run(const TaskParams& params) override;

    const std::string& file_path() const { return file_path_; }
    uint64_t last_bytes_touched() const { return last_bytes_touched_; }
};

} // namespace benchsched

#endif // BENCHMARK_TASKS_H
