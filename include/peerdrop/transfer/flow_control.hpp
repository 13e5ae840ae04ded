#pragma once

#include "peerdrop/core/config.hpp"
#include "peerdrop/core/error.hpp"
#include "peerdrop/network/byte_channel.hpp"
#include "peerdrop/transfer/file_descriptor.hpp"
#include "peerdrop/transfer/file_source.hpp"
#include "peerdrop/transfer/throughput_estimator.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace peerdrop::transfer {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
constexpr std::size_t DEFAULT_HIGH_WATER_MARK = 4 * 1024 * 1024;
constexpr std::chrono::milliseconds DEFAULT_BACKPRESSURE_DELAY{50};
// Chunk indices travel as u32 on the wire
constexpr std::uint64_t MAX_CHUNKS_PER_FILE = 0xFFFFFFFFull;

struct SenderOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::size_t high_water_mark = DEFAULT_HIGH_WATER_MARK;
    std::chrono::milliseconds backpressure_delay = DEFAULT_BACKPRESSURE_DELAY;
    
    static SenderOptions from_config(const core::Config& config);
};

struct OutgoingFile {
    FileDescriptor descriptor;
    std::shared_ptr<FileSource> source;
};

struct SenderHandlers {
    std::function<void(const TransferProgress&)> on_progress;
    std::function<void(const std::string& file_id, const core::TransferResult&)> on_file_finished;
    std::function<void(std::size_t sent, std::size_t failed)> on_batch_finished;
};

// Streams queued files over a ByteChannel one at a time, in queue order.
// Each slice is a separate step on the io_context, so inbound events keep
// flowing while a file is being sent. When the channel's outbound buffer is
// above the high-water mark the sender parks on a timer instead of writing.
class FlowControlledSender : public std::enable_shared_from_this<FlowControlledSender> {
public:
    FlowControlledSender(boost::asio::io_context& io_context,
                         std::shared_ptr<network::ByteChannel> channel,
                         SenderOptions options = {});
    ~FlowControlledSender();
    
    FlowControlledSender(const FlowControlledSender&) = delete;
    FlowControlledSender& operator=(const FlowControlledSender&) = delete;
    
    void set_handlers(SenderHandlers handlers) { handlers_ = std::move(handlers); }
    
    // Sends the batch announcement. Only the first call per sender goes out.
    core::TransferResult announce(const std::vector<FileDescriptor>& files);
    
    // Announces (if not done yet) and queues every file
    core::TransferResult send_batch(std::vector<OutgoingFile> files);
    
    // Queues one file; completion is reported through on_file_finished
    core::TransferResult send_file(OutgoingFile file);
    
    // Stops further chunk emission immediately and drops queued files
    void cancel();
    
    bool is_active() const { return current_.has_value() || !queue_.empty(); }
    bool has_announced() const { return announced_; }
    bool is_cancelled() const { return cancelled_; }
    std::size_t backpressure_waits() const { return backpressure_waits_; }
    const SenderOptions& options() const { return options_; }
    
    // Zero when the file cannot be expressed in u32 chunk indices
    static std::uint32_t chunk_count(std::uint64_t size_bytes, std::size_t chunk_size);
    
private:
    struct OutgoingTransfer {
        OutgoingFile file;
        TransferState state;
        ThroughputEstimator estimator;
        std::uint32_t total_chunks = 0;
        std::uint32_t next_chunk = 0;
    };
    
    void start_next();
    void schedule_pump();
    void pump();
    void wait_for_drain();
    void finish_current(const core::TransferResult& result);
    void fail_all(const core::TransferResult& result);
    void emit_progress(const TransferProgress& progress);
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<network::ByteChannel> channel_;
    SenderOptions options_;
    SenderHandlers handlers_;
    boost::asio::steady_timer drain_timer_;
    
    std::deque<OutgoingFile> queue_;
    std::optional<OutgoingTransfer> current_;
    std::vector<std::uint8_t> slice_;
    
    bool announced_;
    bool cancelled_;
    bool pump_scheduled_;
    std::size_t backpressure_waits_;
    std::size_t files_sent_;
    std::size_t files_failed_;
};

}
