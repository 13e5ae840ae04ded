#include "peerdrop/transfer/flow_control.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/network/chunk_codec.hpp"
#include <algorithm>

namespace peerdrop::transfer {

SenderOptions SenderOptions::from_config(const core::Config& config) {
    SenderOptions options;
    options.chunk_size = static_cast<std::size_t>(
        config.get_uint64("transfer.chunk_size", DEFAULT_CHUNK_SIZE));
    options.high_water_mark = static_cast<std::size_t>(
        config.get_uint64("transfer.high_water_mark", DEFAULT_HIGH_WATER_MARK));
    options.backpressure_delay = std::chrono::milliseconds(
        config.get_int("transfer.backpressure_delay_ms", static_cast<int>(DEFAULT_BACKPRESSURE_DELAY.count())));
    
    if (options.chunk_size == 0) {
        options.chunk_size = DEFAULT_CHUNK_SIZE;
    }
    if (options.backpressure_delay.count() <= 0) {
        options.backpressure_delay = DEFAULT_BACKPRESSURE_DELAY;
    }
    return options;
}

FlowControlledSender::FlowControlledSender(boost::asio::io_context& io_context,
                                           std::shared_ptr<network::ByteChannel> channel,
                                           SenderOptions options)
    : io_context_(io_context)
    , channel_(std::move(channel))
    , options_(options)
    , drain_timer_(io_context)
    , announced_(false)
    , cancelled_(false)
    , pump_scheduled_(false)
    , backpressure_waits_(0)
    , files_sent_(0)
    , files_failed_(0) {
}

FlowControlledSender::~FlowControlledSender() {
    boost::system::error_code ec;
    drain_timer_.cancel(ec);
}

std::uint32_t FlowControlledSender::chunk_count(std::uint64_t size_bytes, std::size_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    auto chunks = size_bytes / chunk_size + (size_bytes % chunk_size != 0 ? 1 : 0);
    if (chunks > MAX_CHUNKS_PER_FILE) {
        return 0;
    }
    // An empty file still travels as one empty chunk so the receiver sees it
    return static_cast<std::uint32_t>(std::max<std::uint64_t>(chunks, 1));
}

core::TransferResult FlowControlledSender::announce(const std::vector<FileDescriptor>& files) {
    if (announced_) {
        return core::TransferResult();
    }
    
    if (!channel_ || !channel_->is_open()) {
        return core::TransferResult(core::TransferError::CHANNEL_UNAVAILABLE, "Channel is not open");
    }
    
    network::FileBatchAnnouncement announcement;
    announcement.files = files;
    
    auto result = channel_->send(network::make_control_message(network::ControlType::BATCH_ANNOUNCE, announcement));
    if (!result.success()) {
        return result;
    }
    
    announced_ = true;
    LOG_INFO("Announced batch of {} files", files.size());
    return core::TransferResult();
}

core::TransferResult FlowControlledSender::send_batch(std::vector<OutgoingFile> files) {
    // Handlers may drop the owner's reference before we return
    auto self = shared_from_this();
    if (cancelled_) {
        return core::TransferResult(core::TransferError::CANCELLED, "Sender has been cancelled");
    }
    
    if (!channel_ || !channel_->is_open()) {
        return core::TransferResult(core::TransferError::CHANNEL_UNAVAILABLE, "Channel is not open");
    }
    
    std::vector<FileDescriptor> descriptors;
    descriptors.reserve(files.size());
    for (const auto& file : files) {
        descriptors.push_back(file.descriptor);
    }
    
    for (const auto& file : files) {
        if (!file.source) {
            return core::TransferResult(core::TransferError::READ_ERROR,
                                        "No source for file " + file.descriptor.file_id);
        }
    }
    
    auto result = announce(descriptors);
    if (!result.success()) {
        return result;
    }
    
    if (files.empty()) {
        if (handlers_.on_batch_finished) {
            handlers_.on_batch_finished(files_sent_, files_failed_);
        }
        return core::TransferResult();
    }
    
    for (auto& file : files) {
        queue_.push_back(std::move(file));
    }
    
    if (!current_) {
        start_next();
    }
    
    return core::TransferResult();
}

core::TransferResult FlowControlledSender::send_file(OutgoingFile file) {
    auto self = shared_from_this();
    if (cancelled_) {
        return core::TransferResult(core::TransferError::CANCELLED, "Sender has been cancelled");
    }
    
    if (!channel_ || !channel_->is_open()) {
        return core::TransferResult(core::TransferError::CHANNEL_UNAVAILABLE, "Channel is not open");
    }
    
    if (!file.source) {
        return core::TransferResult(core::TransferError::READ_ERROR,
                                    "No source for file " + file.descriptor.file_id);
    }
    
    queue_.push_back(std::move(file));
    
    if (!current_) {
        start_next();
    }
    
    return core::TransferResult();
}

void FlowControlledSender::cancel() {
    if (cancelled_) {
        return;
    }
    
    cancelled_ = true;
    boost::system::error_code ec;
    drain_timer_.cancel(ec);
    
    if (current_) {
        LOG_INFO("Cancelled transfer of {} after {} of {} bytes",
                 current_->file.descriptor.file_id,
                 current_->state.bytes_transferred,
                 current_->state.total_bytes);
    }
    
    current_.reset();
    queue_.clear();
    slice_.clear();
}

void FlowControlledSender::start_next() {
    if (cancelled_ || current_ || queue_.empty()) {
        return;
    }
    
    OutgoingTransfer transfer{std::move(queue_.front()), TransferState{}, ThroughputEstimator{}, 0, 0};
    queue_.pop_front();
    
    const auto& descriptor = transfer.file.descriptor;
    if (transfer.file.source->size() != descriptor.size_bytes) {
        LOG_ERROR("Source for {} holds {} bytes but {} were announced",
                  descriptor.file_id, transfer.file.source->size(), descriptor.size_bytes);
        current_ = std::move(transfer);
        finish_current(core::TransferResult(core::TransferError::READ_ERROR, "File size changed since it was announced"));
        return;
    }
    
    transfer.total_chunks = chunk_count(descriptor.size_bytes, options_.chunk_size);
    if (transfer.total_chunks == 0) {
        LOG_ERROR("{} needs more than {} chunks of {} bytes",
                  descriptor.file_id, MAX_CHUNKS_PER_FILE, options_.chunk_size);
        current_ = std::move(transfer);
        finish_current(core::TransferResult(core::TransferError::READ_ERROR, "File too large for the chunk size"));
        return;
    }
    transfer.state.total_bytes = descriptor.size_bytes;
    transfer.state.started_at = ThroughputEstimator::Clock::now();
    transfer.estimator.restart(transfer.state.started_at);
    
    LOG_INFO("Sending {} ({} bytes, {} chunks)", descriptor.name, descriptor.size_bytes, transfer.total_chunks);
    
    current_ = std::move(transfer);
    schedule_pump();
}

void FlowControlledSender::schedule_pump() {
    if (pump_scheduled_) {
        return;
    }
    
    pump_scheduled_ = true;
    std::weak_ptr<FlowControlledSender> weak = weak_from_this();
    boost::asio::post(io_context_, [weak]() {
        if (auto self = weak.lock()) {
            self->pump_scheduled_ = false;
            self->pump();
        }
    });
}

void FlowControlledSender::wait_for_drain() {
    ++backpressure_waits_;
    LOG_DEBUG("Channel buffer at {} bytes, pausing {}ms",
              channel_->buffered_amount(), options_.backpressure_delay.count());
    
    std::weak_ptr<FlowControlledSender> weak = weak_from_this();
    drain_timer_.expires_after(options_.backpressure_delay);
    drain_timer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (auto self = weak.lock()) {
            self->pump();
        }
    });
}

void FlowControlledSender::pump() {
    if (cancelled_ || !current_) {
        return;
    }
    
    if (!channel_->is_open()) {
        fail_all(core::TransferResult(core::TransferError::CHANNEL_UNAVAILABLE, "Channel closed during transfer"));
        return;
    }
    
    if (channel_->buffered_amount() > options_.high_water_mark) {
        wait_for_drain();
        return;
    }
    
    auto& transfer = *current_;
    const auto& descriptor = transfer.file.descriptor;
    auto offset = static_cast<std::uint64_t>(transfer.next_chunk) * options_.chunk_size;
    
    auto read_result = transfer.file.source->read(offset, options_.chunk_size, slice_);
    if (!read_result.success()) {
        LOG_ERROR("Reading {} failed: {}", descriptor.name, read_result.message);
        finish_current(read_result);
        return;
    }
    
    auto frame = network::encode_chunk(descriptor.file_id, transfer.next_chunk, transfer.total_chunks, slice_);
    auto send_result = channel_->send(network::ChannelMessage{network::ChannelMessageKind::BINARY, std::move(frame)});
    if (!send_result.success()) {
        fail_all(send_result);
        return;
    }
    
    transfer.state.bytes_transferred += slice_.size();
    transfer.next_chunk++;
    
    auto sample = transfer.estimator.sample(transfer.state.bytes_transferred, transfer.state.total_bytes);
    emit_progress(TransferProgress{descriptor.file_id,
                                   transfer.state.bytes_transferred,
                                   transfer.state.total_bytes,
                                   sample.speed_bytes_per_sec,
                                   sample.eta_seconds});
    
    // A progress handler may have cancelled us
    if (cancelled_ || !current_) {
        return;
    }
    
    if (current_->next_chunk >= current_->total_chunks) {
        emit_progress(TransferProgress{current_->file.descriptor.file_id,
                                       current_->state.total_bytes,
                                       current_->state.total_bytes,
                                       0.0,
                                       0.0});
        if (cancelled_ || !current_) {
            return;
        }
        finish_current(core::TransferResult());
        return;
    }
    
    schedule_pump();
}

void FlowControlledSender::finish_current(const core::TransferResult& result) {
    if (!current_) {
        return;
    }
    auto self = shared_from_this();
    
    auto file_id = current_->file.descriptor.file_id;
    current_.reset();
    
    if (result.success()) {
        ++files_sent_;
        LOG_INFO("Finished sending {}", file_id);
    } else {
        ++files_failed_;
        LOG_WARN("Transfer of {} aborted: {}", file_id, result.message);
    }
    
    if (handlers_.on_file_finished) {
        handlers_.on_file_finished(file_id, result);
    }
    
    if (cancelled_) {
        return;
    }
    
    if (!queue_.empty()) {
        start_next();
    } else if (handlers_.on_batch_finished) {
        handlers_.on_batch_finished(files_sent_, files_failed_);
    }
}

void FlowControlledSender::fail_all(const core::TransferResult& result) {
    auto self = shared_from_this();
    LOG_ERROR("Channel unusable, aborting {} queued transfers: {}",
              queue_.size() + (current_ ? 1 : 0), result.message);
    
    std::vector<std::string> failed;
    if (current_) {
        failed.push_back(current_->file.descriptor.file_id);
        current_.reset();
    }
    for (const auto& file : queue_) {
        failed.push_back(file.descriptor.file_id);
    }
    queue_.clear();
    
    files_failed_ += failed.size();
    for (const auto& file_id : failed) {
        if (handlers_.on_file_finished) {
            handlers_.on_file_finished(file_id, result);
        }
    }
    
    if (!cancelled_ && handlers_.on_batch_finished) {
        handlers_.on_batch_finished(files_sent_, files_failed_);
    }
}

void FlowControlledSender::emit_progress(const TransferProgress& progress) {
    if (handlers_.on_progress) {
        handlers_.on_progress(progress);
    }
}

}
