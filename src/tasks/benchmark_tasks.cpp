/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: benchmark_tasks.cpp

    Description:
        Implementations of the matmul / primes / array / fileIO benchmark
        bodies. Random inputs come from a per-run std::mt19937_64 seeded from
        std::random_device, so two runs of the same task never share data.

*******************************************************************************/

#include "tasks/benchmark_tasks.h"
#include "common/logger.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>
#include <sys/stat.h>

namespace benchsched {

//==============================================================================
// MATMUL
//==============================================================================
//
// Two n x n matrices of values in [-32767, 32767], multiplied with the plain
// i-j-k triple loop. O(n^3); size=425 takes on the order of a second on the
// test nodes.
//
//==============================================================================

void MatmulTask::run(const TaskParams& params) {
    const long long n = param_as_count(params, "size");
    if (n > 0 && static_cast<unsigned long long>(n) >
                     std::numeric_limits<size_t>::max() / static_cast<unsigned long long>(n)) {
        throw std::invalid_argument("matmul size " + std::to_string(n) + " is too large");
    }
    const size_t dim = static_cast<size_t>(n);

    std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(-32767, 32767);

    std::vector<int64_t> a(dim * dim);
    std::vector<int64_t> b(dim * dim);
    for (size_t i = 0; i < dim * dim; ++i) {
        a[i] = dist(rng);
        b[i] = dist(rng);
    }

    std::vector<int64_t> c(dim * dim, 0);
    for (size_t i = 0; i < dim; ++i) {
        for (size_t j = 0; j < dim; ++j) {
            int64_t sum = 0;
            for (size_t k = 0; k < dim; ++k) {
                sum += a[i * dim + k] * b[k * dim + j];
            }
            c[i * dim + j] = sum;
        }
    }

    int64_t checksum = 0;
    for (int64_t v : c) checksum ^= v;
    last_checksum_ = checksum;
}

//==============================================================================
// PRIMES
//==============================================================================

void PrimesTask::run(const TaskParams& params) {
    const long long max_n = param_as_count(params, "max_n");

    if (max_n < 2) {
        last_prime_count_ = 0;
        return;
    }

    const size_t limit = static_cast<size_t>(max_n);
    std::vector<bool> is_prime(limit + 1, true);
    is_prime[0] = false;
    is_prime[1] = false;

    for (size_t p = 2; p * p <= limit; ++p) {
        if (!is_prime[p]) continue;
        for (size_t multiple = p * p; multiple <= limit; multiple += p) {
            is_prime[multiple] = false;
        }
    }

    last_prime_count_ = static_cast<uint64_t>(
        std::count(is_prime.begin(), is_prime.end(), true));
}

//==============================================================================
// ARRAY SORT
//==============================================================================

void ArraySortTask::run(const TaskParams& params) {
    const long long size = param_as_count(params, "array_size");

    std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(0, 1000000000LL);

    std::vector<int64_t> values(static_cast<size_t>(size));
    for (auto& v : values) v = dist(rng);

    std::sort(values.begin(), values.end());
    last_sorted_ = std::is_sorted(values.begin(), values.end());
}

//==============================================================================
// FILE I/O
//==============================================================================
//
// Random-offset read-modify-write inside a file that must already exist (the
// nodes are provisioned with a large scratch file; creating it is not part of
// the benchmark). Each cycle reads one chunk, reverses it and writes it back
// at the same offset, so the file content changes but its size never does.
//
//==============================================================================

void FileIoTask::run(const TaskParams& params) {
    const long long num_rw = param_as_count(params, "num_rw");

    if (file_path_.empty()) {
        throw std::runtime_error("no IO file configured (set --io-file or IO_FILE_PATH)");
    }

    struct stat st;
    if (stat(file_path_.c_str(), &st) != 0) {
        throw std::runtime_error("cannot find " + file_path_);
    }

    const uint64_t file_size = static_cast<uint64_t>(st.st_size);
    if (file_size < kChunkSize) {
        throw std::runtime_error(file_path_ + " is smaller than one " +
                                 std::to_string(kChunkSize) + "-byte chunk");
    }

    std::fstream file(file_path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + file_path_ + " for read/write");
    }

    std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> offset_dist(0, file_size - kChunkSize);
    std::vector<char> chunk(kChunkSize);

    uint64_t touched = 0;
    for (long long i = 0; i < num_rw; ++i) {
        const auto offset = static_cast<std::streamoff>(offset_dist(rng));

        file.seekg(offset);
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!file) {
            throw std::runtime_error("read failed at offset " + std::to_string(offset));
        }

        std::reverse(chunk.begin(), chunk.end());

        file.seekp(offset);
        file.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!file) {
            throw std::runtime_error("write failed at offset " + std::to_string(offset));
        }
        touched += kChunkSize;
    }

    file.flush();
    last_bytes_touched_ = touched;
    Logger::debug("fileIO touched " + std::to_string(touched) + " bytes in " + file_path_);
}

} // namespace benchsched
