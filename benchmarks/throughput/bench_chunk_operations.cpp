/**
 * @file bench_chunk_operations.cpp
 * @brief Sender-side splitting and hashing, receiver-side chunk persistence
 */

#include <benchmark/benchmark.h>

#include <clipxfer/core/checksum.h>
#include <clipxfer/core/chunk_splitter.h>
#include <clipxfer/receiver/part_sink.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <filesystem>
#include <span>
#include <vector>

namespace clipxfer::benchmark {

static void BM_ChunkSplitter_Split(::benchmark::State& state) {
    const auto file_size = state.range(0);
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto workspace = make_workspace();
    if (!workspace) {
        state.SkipWithError(workspace.error().message.c_str());
        return;
    }
    const auto source = workspace.value().path() / "split.bin";
    if (!write_file(source, random_bytes(static_cast<std::size_t>(file_size), 42))) {
        state.SkipWithError("cannot create input file");
        return;
    }

    chunk_splitter splitter(chunk_config{chunk_size});
    uint64_t chunks_read = 0;
    for (auto _ : state) {
        auto chunks = splitter.split(source);
        if (!chunks) {
            state.SkipWithError(chunks.error().message.c_str());
            return;
        }
        while (chunks.value().has_next()) {
            auto c = chunks.value().next();
            if (!c) {
                state.SkipWithError(c.error().message.c_str());
                return;
            }
            ::benchmark::DoNotOptimize(c.value());
            ++chunks_read;
        }
    }

    report_bytes(state, file_size);
    state.SetItemsProcessed(static_cast<int64_t>(chunks_read));
}

/// Chunks arrive last to first, then the part is joined
static void BM_ChunkStore_StoreAndFinalize(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto workspace = make_workspace();
    if (!workspace) {
        state.SkipWithError(workspace.error().message.c_str());
        return;
    }
    const auto data = random_bytes(file_size, 42);
    std::vector<std::span<const std::byte>> windows;
    for (std::size_t at = 0; at < file_size; at += chunk_size) {
        windows.emplace_back(data.data() + at, std::min(chunk_size, file_size - at));
    }
    const auto part_dir = workspace.value().path() / "part_001";
    const auto part_file = workspace.value().path() / "part_001.bin";

    for (auto _ : state) {
        auto store = chunk_store::open(part_dir, windows.size());
        if (!store) {
            state.SkipWithError(store.error().message.c_str());
            return;
        }
        for (auto seq = windows.size(); seq > 0; --seq) {
            if (!store.value()->accept(seq, windows[seq - 1])) {
                state.SkipWithError("chunk not stored");
                return;
            }
        }
        auto joined = store.value()->finalize(part_file);
        if (!joined) {
            state.SkipWithError(joined.error().message.c_str());
            return;
        }

        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove(part_file, ec);
        state.ResumeTiming();
    }

    report_bytes(state, static_cast<int64_t>(file_size));
    state.SetItemsProcessed(static_cast<int64_t>(windows.size()) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto data = random_bytes(static_cast<std::size_t>(state.range(0)), 42);

    for (auto _ : state) {
        auto digest = checksum::sha256(data);
        ::benchmark::DoNotOptimize(digest);
    }

    report_bytes(state, state.range(0));
}

static void BM_Checksum_SHA256_File(::benchmark::State& state) {
    auto workspace = make_workspace();
    if (!workspace) {
        state.SkipWithError(workspace.error().message.c_str());
        return;
    }
    const auto source = workspace.value().path() / "hash.bin";
    if (!write_file(source, random_bytes(static_cast<std::size_t>(state.range(0)), 42))) {
        state.SkipWithError("cannot create input file");
        return;
    }

    for (auto _ : state) {
        auto digest = checksum::sha256_file(source);
        if (!digest) {
            state.SkipWithError(digest.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    report_bytes(state, state.range(0));
}

BENCHMARK(BM_ChunkSplitter_Split)
    ->Args({sizes::small_file, sizes::default_chunk})
    ->Args({sizes::medium_file, sizes::default_chunk})
    ->Args({sizes::large_file, sizes::min_chunk})
    ->Args({sizes::large_file, sizes::default_chunk})
    ->Args({sizes::large_file, sizes::max_chunk})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkStore_StoreAndFinalize)
    ->Args({sizes::small_file, sizes::min_chunk})
    ->Args({sizes::medium_file, sizes::default_chunk})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(sizes::KiB)
    ->Arg(64 * sizes::KiB)
    ->Arg(sizes::default_chunk)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256_File)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Arg(sizes::large_file)
    ->Unit(::benchmark::kMillisecond);

}  // namespace clipxfer::benchmark
