#include <benchmark/benchmark.h>
#include "peerdrop/network/chunk_codec.hpp"
#include "peerdrop/network/protocol.hpp"
#include "peerdrop/transfer/flow_control.hpp"
#include "peerdrop/transfer/reassembly_buffer.hpp"
#include "peerdrop/transfer/throughput_estimator.hpp"
#include <algorithm>
#include <random>

using namespace peerdrop;

namespace {

const std::string FILE_ID = "6f1c2a9e-4b7d-4e21-9a3f-0c8d5e7b1a24";

std::vector<std::uint8_t> random_payload(std::size_t size) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(dist(rng));
    }
    return data;
}

}

static void BM_ChunkEncode(benchmark::State& state) {
    auto payload = random_payload(static_cast<std::size_t>(state.range(0)));
    
    for (auto _ : state) {
        auto frame = network::encode_chunk(FILE_ID, 7, 100, payload);
        benchmark::DoNotOptimize(frame);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkEncode)->Range(1024, 1024*1024);

static void BM_ChunkDecode(benchmark::State& state) {
    auto frame = network::encode_chunk(FILE_ID, 7, 100, random_payload(static_cast<std::size_t>(state.range(0))));
    
    for (auto _ : state) {
        auto decoded = network::decode_chunk(frame);
        benchmark::DoNotOptimize(decoded);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkDecode)->Range(1024, 1024*1024);

static void BM_AnnouncementSerialization(benchmark::State& state) {
    network::FileBatchAnnouncement batch;
    for (int i = 0; i < state.range(0); ++i) {
        batch.files.emplace_back(FILE_ID, "photo_" + std::to_string(i) + ".jpg", 3 * 1024 * 1024, "image/jpeg");
    }
    
    for (auto _ : state) {
        auto serialized = batch.serialize();
        auto restored = network::FileBatchAnnouncement::deserialize(serialized);
        benchmark::DoNotOptimize(restored);
    }
    
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AnnouncementSerialization)->Range(1, 256);

// Whole file through the receiver, chunks arriving in order
static void BM_Reassembly(benchmark::State& state) {
    constexpr std::size_t chunk_size = transfer::DEFAULT_CHUNK_SIZE;
    auto file_size = static_cast<std::size_t>(state.range(0));
    auto contents = random_payload(file_size);
    auto total = static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);
    
    std::vector<std::vector<std::uint8_t>> frames;
    for (std::uint32_t i = 0; i < total; ++i) {
        auto begin = contents.begin() + static_cast<std::ptrdiff_t>(i * chunk_size);
        auto end = contents.begin() + static_cast<std::ptrdiff_t>(std::min(file_size, (i + 1) * chunk_size));
        frames.push_back(network::encode_chunk(FILE_ID, i, total, std::vector<std::uint8_t>(begin, end)));
    }
    
    for (auto _ : state) {
        transfer::ReassemblyBuffer buffer;
        for (const auto& frame : frames) {
            auto result = buffer.on_frame(network::decode_chunk(frame));
            benchmark::DoNotOptimize(result);
        }
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Reassembly)->Range(64 * 1024, 16 * 1024 * 1024);

static void BM_ThroughputEstimate(benchmark::State& state) {
    std::uint64_t bytes = 0;
    
    for (auto _ : state) {
        bytes += 65536;
        auto sample = transfer::ThroughputEstimator::estimate(bytes, 1ull << 34, 1.5);
        benchmark::DoNotOptimize(sample);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ThroughputEstimate);

BENCHMARK_MAIN();
