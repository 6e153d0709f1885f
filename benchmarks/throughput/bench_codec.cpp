/**
 * @file bench_codec.cpp
 * @brief Benchmarks for the clipboard text encoding of packets
 */

#include <benchmark/benchmark.h>

#include <clipxfer/codec/base64.h>
#include <clipxfer/codec/codec.h>

#include "utils/benchmark_helpers.h"

#include <string>

namespace clipxfer::benchmark {

namespace {

auto make_packet(std::size_t payload_size) -> packet {
    packet p;
    p.base_filename = "benchmark_payload.bin";
    p.content_hash = std::string(64, 'e');
    p.sequence_index = 7;
    p.sequence_count = 12;
    p.payload = random_bytes(payload_size, 42);
    return p;
}

}  // namespace

static void BM_Base64_Encode(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = random_bytes(size, 42);

    for (auto _ : state) {
        auto text = base64::encode(data);
        ::benchmark::DoNotOptimize(text);
    }

    report_bytes(state, state.range(0));
}

static void BM_Base64_Decode(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto text = base64::encode(random_bytes(size, 42));

    for (auto _ : state) {
        auto data = base64::decode(text);
        if (!data) {
            state.SkipWithError("Failed to decode");
            return;
        }
        ::benchmark::DoNotOptimize(data.value());
    }

    report_bytes(state, state.range(0));
}

static void BM_Codec_EncodePacket(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto p = make_packet(size);

    for (auto _ : state) {
        auto text = codec::encode(p);
        ::benchmark::DoNotOptimize(text);
    }

    report_bytes(state, state.range(0));
}

static void BM_Codec_DecodePacket(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto text = codec::encode(make_packet(size));

    for (auto _ : state) {
        auto p = codec::decode(text);
        if (!p) {
            state.SkipWithError("Failed to decode packet");
            return;
        }
        ::benchmark::DoNotOptimize(p.value());
    }

    report_bytes(state, state.range(0));
}

/**
 * @brief Cost of rejecting clipboard text that is not ours
 */
static void BM_Codec_RejectForeignText(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto bytes = text_bytes(size, 7);
    std::string text(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    for (auto _ : state) {
        auto p = codec::decode(text);
        ::benchmark::DoNotOptimize(p);
    }
}

static void BM_Codec_AckRoundTrip(::benchmark::State& state) {
    auto p = make_packet(16);

    for (auto _ : state) {
        auto ack = codec::decode_ack(codec::encode_ack(codec::ack_for(p)));
        ::benchmark::DoNotOptimize(ack);
    }
}

BENCHMARK(BM_Base64_Encode)
    ->Arg(64 * sizes::KiB)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Base64_Decode)
    ->Arg(64 * sizes::KiB)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Codec_EncodePacket)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::default_chunk)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Codec_DecodePacket)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::default_chunk)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Codec_RejectForeignText)
    ->Arg(256)
    ->Arg(64 * sizes::KiB)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Codec_AckRoundTrip);

}  // namespace clipxfer::benchmark
