#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/network/chunk_codec.hpp"
#include "peerdrop/transfer/throughput_estimator.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace peerdrop::transfer {

// Ids of delivered files kept to drop their late duplicates; oldest go first
constexpr std::size_t MAX_REMEMBERED_DELIVERIES = 1024;

struct CompletedFile {
    std::string file_id;
    std::vector<std::uint8_t> data;
};

// Everything the receiver knows about one file in flight
struct ReassemblyEntry {
    std::uint32_t total_chunks = 0;
    std::map<std::uint32_t, std::vector<std::uint8_t>> fragments;
    TransferState state;
    ThroughputEstimator estimator;
    
    explicit ReassemblyEntry(std::uint32_t chunks, ThroughputEstimator::Clock::time_point started_at);
    
    bool is_complete() const { return fragments.size() == total_chunks; }
};

struct ReassemblyResult {
    core::TransferResult status;
    std::optional<TransferProgress> progress;
    std::optional<CompletedFile> completed;
    bool duplicate = false;
};

class ReassemblyBuffer {
public:
    using Clock = ThroughputEstimator::Clock;
    
    ReassemblyBuffer() = default;
    
    // Stores one decoded frame. Produces a progress sample for every new
    // chunk and the file bytes once all indices are present.
    ReassemblyResult on_frame(network::ChunkFrame frame, Clock::time_point now = Clock::now());
    
    bool has_entry(const std::string& file_id) const;
    std::size_t in_flight() const { return entries_.size(); }
    std::size_t remembered_deliveries() const { return delivered_.size(); }
    std::optional<TransferState> state_of(const std::string& file_id) const;
    std::uint32_t received_chunks(const std::string& file_id) const;
    
    void discard(const std::string& file_id);
    void clear();
    
private:
    std::unordered_map<std::string, ReassemblyEntry> entries_;
    std::unordered_set<std::string> delivered_;
    std::deque<std::string> delivery_order_;
    
    static std::uint64_t estimate_total(std::uint64_t bytes, std::uint32_t total_chunks, std::uint32_t chunk_index);
    static std::vector<std::uint8_t> assemble(ReassemblyEntry& entry);
    void remember_delivery(const std::string& file_id);
};

}
