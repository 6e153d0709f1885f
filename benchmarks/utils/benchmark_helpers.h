/**
 * @file benchmark_helpers.h
 * @brief Payload generators and scratch files shared by the benchmarks
 */

#ifndef CLIPXFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define CLIPXFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <benchmark/benchmark.h>

#include <clipxfer/core/scoped_directory.h>
#include <clipxfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace clipxfer::benchmark {

/// Uniformly random bytes, reproducible for a given seed
auto random_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte>;

/// Space separated words with occasional newlines, like a copied document
auto text_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte>;

/// Fresh directory under the system temp directory, removed with the value
auto make_workspace() -> result<scoped_directory>;

auto write_file(const std::filesystem::path& path, std::span<const std::byte> data)
    -> result<void>;

/// Throughput over all iterations run so far
inline void report_bytes(::benchmark::State& state, int64_t per_iteration) {
    state.SetBytesProcessed(per_iteration * static_cast<int64_t>(state.iterations()));
}

namespace sizes {
constexpr int64_t KiB = 1024;
constexpr int64_t MiB = 1024 * KiB;

constexpr int64_t small_file = 100 * KiB;
constexpr int64_t medium_file = 10 * MiB;
constexpr int64_t large_file = 64 * MiB;

constexpr int64_t min_chunk = 64 * KiB;
constexpr int64_t default_chunk = 768 * KiB;
constexpr int64_t max_chunk = 4 * MiB;
}  // namespace sizes

}  // namespace clipxfer::benchmark

#endif  // CLIPXFER_BENCHMARKS_BENCHMARK_HELPERS_H
