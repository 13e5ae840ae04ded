#include "peerdrop/transfer/reassembly_buffer.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>

namespace peerdrop::transfer {

ReassemblyEntry::ReassemblyEntry(std::uint32_t chunks, ThroughputEstimator::Clock::time_point started_at)
    : total_chunks(chunks)
    , estimator(started_at) {
    state.started_at = started_at;
}

ReassemblyResult ReassemblyBuffer::on_frame(network::ChunkFrame frame, Clock::time_point now) {
    ReassemblyResult result;
    const auto& header = frame.header;
    
    if (header.file_id.empty()) {
        result.status = core::TransferResult(core::TransferError::INVALID_FRAME, "Chunk frame without file id");
        return result;
    }
    
    if (header.total_chunks == 0 || header.chunk_index >= header.total_chunks) {
        result.status = core::TransferResult(
            core::TransferError::INVALID_FRAME,
            "Chunk index " + std::to_string(header.chunk_index) + " outside of " +
            std::to_string(header.total_chunks) + " chunks");
        return result;
    }
    
    if (delivered_.count(header.file_id) > 0) {
        LOG_DEBUG("Dropping chunk {} of already delivered file {}", header.chunk_index, header.file_id);
        result.duplicate = true;
        return result;
    }
    
    auto it = entries_.find(header.file_id);
    if (it == entries_.end()) {
        it = entries_.emplace(header.file_id, ReassemblyEntry(header.total_chunks, now)).first;
        LOG_DEBUG("Receiving file {} in {} chunks", header.file_id, header.total_chunks);
    } else if (it->second.total_chunks != header.total_chunks) {
        result.status = core::TransferResult(
            core::TransferError::INVALID_FRAME,
            "Chunk count changed from " + std::to_string(it->second.total_chunks) +
            " to " + std::to_string(header.total_chunks));
        return result;
    }
    
    auto& entry = it->second;
    auto fragment = entry.fragments.find(header.chunk_index);
    if (fragment != entry.fragments.end()) {
        // Overwrite in place; the byte count follows the stored fragments
        entry.state.bytes_transferred -= fragment->second.size();
        entry.state.bytes_transferred += frame.payload.size();
        fragment->second = std::move(frame.payload);
        result.duplicate = true;
        return result;
    }
    
    entry.state.bytes_transferred += frame.payload.size();
    entry.fragments.emplace(header.chunk_index, std::move(frame.payload));
    
    TransferProgress progress;
    progress.file_id = header.file_id;
    progress.bytes_transferred = entry.state.bytes_transferred;
    
    if (entry.is_complete()) {
        // Exact from here on
        entry.state.total_bytes = entry.state.bytes_transferred;
        auto sample = entry.estimator.sample(entry.state.bytes_transferred, entry.state.total_bytes, now);
        progress.total_bytes = entry.state.total_bytes;
        progress.speed_bytes_per_sec = sample.speed_bytes_per_sec;
        progress.eta_seconds = 0.0;
        
        CompletedFile completed;
        completed.file_id = header.file_id;
        completed.data = assemble(entry);
        
        LOG_INFO("File {} reassembled ({} bytes in {} chunks)",
                 header.file_id, completed.data.size(), entry.total_chunks);
        
        entries_.erase(it);
        remember_delivery(header.file_id);
        
        result.progress = std::move(progress);
        result.completed = std::move(completed);
        return result;
    }
    
    entry.state.total_bytes = estimate_total(entry.state.bytes_transferred, entry.total_chunks, header.chunk_index);
    auto sample = entry.estimator.sample(entry.state.bytes_transferred, entry.state.total_bytes, now);
    progress.total_bytes = entry.state.total_bytes;
    progress.speed_bytes_per_sec = sample.speed_bytes_per_sec;
    progress.eta_seconds = sample.eta_seconds;
    
    result.progress = std::move(progress);
    return result;
}

bool ReassemblyBuffer::has_entry(const std::string& file_id) const {
    return entries_.find(file_id) != entries_.end();
}

std::optional<TransferState> ReassemblyBuffer::state_of(const std::string& file_id) const {
    auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::uint32_t ReassemblyBuffer::received_chunks(const std::string& file_id) const {
    auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return 0;
    }
    return static_cast<std::uint32_t>(it->second.fragments.size());
}

void ReassemblyBuffer::discard(const std::string& file_id) {
    if (entries_.erase(file_id) > 0) {
        LOG_DEBUG("Discarded partial file {}", file_id);
    }
}

void ReassemblyBuffer::clear() {
    if (!entries_.empty()) {
        LOG_INFO("Discarding {} partially received files", entries_.size());
    }
    entries_.clear();
    delivered_.clear();
    delivery_order_.clear();
}

void ReassemblyBuffer::remember_delivery(const std::string& file_id) {
    if (!delivered_.insert(file_id).second) {
        return;
    }
    delivery_order_.push_back(file_id);
    if (delivery_order_.size() > MAX_REMEMBERED_DELIVERIES) {
        delivered_.erase(delivery_order_.front());
        delivery_order_.pop_front();
    }
}

std::uint64_t ReassemblyBuffer::estimate_total(std::uint64_t bytes, std::uint32_t total_chunks, std::uint32_t chunk_index) {
    // Accurate only while every chunk but the last has the same size
    auto estimate = static_cast<double>(bytes) * static_cast<double>(total_chunks) /
                    static_cast<double>(static_cast<std::uint64_t>(chunk_index) + 1);
    return std::max(bytes, static_cast<std::uint64_t>(estimate));
}

std::vector<std::uint8_t> ReassemblyBuffer::assemble(ReassemblyEntry& entry) {
    std::vector<std::uint8_t> data;
    data.reserve(entry.state.bytes_transferred);
    for (auto& [index, fragment] : entry.fragments) {
        data.insert(data.end(), fragment.begin(), fragment.end());
    }
    return data;
}

}
