#include "peerdrop/network/connection.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <algorithm>

namespace peerdrop::network {

Connection::Connection(boost::asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , state_(ConnectionState::CONNECTED)
    , linger_timer_(io_context)
    , read_header_buffer_{}
    , buffered_bytes_(0)
    , write_in_progress_(false) {
    
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
    
    LOG_DEBUG("New connection with {}", remote_endpoint_);
}

Connection::~Connection() {
    LOG_DEBUG("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    do_read_header();
}

void Connection::close() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }
    
    if (write_queue_.empty()) {
        terminate();
        return;
    }
    
    state_ = ConnectionState::CLOSING;
    LOG_DEBUG("Closing connection to {} once {} queued bytes are written", remote_endpoint_, buffered_bytes_);
    
    message_handler_ = nullptr;
    notify_disconnect();
}

void Connection::terminate() {
    if (state_ == ConnectionState::DISCONNECTED) {
        return;
    }
    
    auto previous = state_;
    state_ = ConnectionState::DISCONNECTED;
    LOG_DEBUG("Closing connection to {}", remote_endpoint_);
    
    boost::system::error_code ec;
    linger_timer_.cancel(ec);
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    
    // Frames stay owned by the queue until the aborted write completes
    if (buffered_bytes_ > 0) {
        LOG_WARN("Dropped {} unsent bytes to {}", buffered_bytes_, remote_endpoint_);
    }
    buffered_bytes_ = 0;
    message_handler_ = nullptr;
    
    if (previous == ConnectionState::CONNECTED) {
        notify_disconnect();
    }
}

void Connection::finish_close() {
    // Everything is written; half-close and give the peer a moment to read it
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec) {
        terminate();
        return;
    }
    
    auto self = shared_from_this();
    linger_timer_.expires_after(CLOSE_LINGER);
    linger_timer_.async_wait([this, self](const boost::system::error_code& error) {
        if (error != boost::asio::error::operation_aborted) {
            terminate();
        }
    });
}

void Connection::notify_disconnect() {
    auto handler = std::move(disconnect_handler_);
    disconnect_handler_ = nullptr;
    if (handler) {
        handler(shared_from_this());
    }
}

bool Connection::send(ChannelMessageKind kind, std::vector<std::uint8_t> payload) {
    if (state_ != ConnectionState::CONNECTED) {
        LOG_WARN("Attempted to send on inactive connection to {}", remote_endpoint_);
        return false;
    }
    
    if (payload.size() > MAX_FRAME_SIZE) {
        LOG_ERROR("Refusing to send {} byte frame to {}", payload.size(), remote_endpoint_);
        return false;
    }
    
    auto size = static_cast<std::uint32_t>(payload.size());
    std::vector<std::uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    frame.push_back(static_cast<std::uint8_t>(kind));
    frame.push_back(static_cast<std::uint8_t>(size >> 24));
    frame.push_back(static_cast<std::uint8_t>(size >> 16));
    frame.push_back(static_cast<std::uint8_t>(size >> 8));
    frame.push_back(static_cast<std::uint8_t>(size));
    frame.insert(frame.end(), payload.begin(), payload.end());
    
    buffered_bytes_ += frame.size();
    write_queue_.push(std::move(frame));
    
    if (!write_in_progress_) {
        do_write();
    }
    return true;
}

void Connection::do_read_header() {
    if (state_ == ConnectionState::DISCONNECTED) {
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            auto kind_byte = read_header_buffer_[0];
            std::uint32_t payload_size = (static_cast<std::uint32_t>(read_header_buffer_[1]) << 24) |
                                         (static_cast<std::uint32_t>(read_header_buffer_[2]) << 16) |
                                         (static_cast<std::uint32_t>(read_header_buffer_[3]) << 8) |
                                         static_cast<std::uint32_t>(read_header_buffer_[4]);
            
            if (kind_byte != static_cast<std::uint8_t>(ChannelMessageKind::CONTROL) &&
                kind_byte != static_cast<std::uint8_t>(ChannelMessageKind::BINARY)) {
                LOG_ERROR("Unknown frame kind {} from {}", static_cast<int>(kind_byte), remote_endpoint_);
                terminate();
                return;
            }
            
            if (payload_size > MAX_FRAME_SIZE) {
                LOG_ERROR("Frame too large ({} bytes) from {}", payload_size, remote_endpoint_);
                terminate();
                return;
            }
            
            do_read_payload(static_cast<ChannelMessageKind>(kind_byte), payload_size);
        });
}

void Connection::do_read_payload(ChannelMessageKind kind, std::uint32_t payload_size) {
    read_payload_buffer_.resize(payload_size);
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self, kind](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            ChannelMessage message{kind, std::move(read_payload_buffer_)};
            read_payload_buffer_.clear();
            
            // The handler may close this connection, which drops message_handler_
            auto handler = message_handler_;
            if (handler) {
                handler(std::move(message));
            }
            
            do_read_header();
        });
}

void Connection::do_write() {
    if (write_in_progress_ || state_ == ConnectionState::DISCONNECTED) {
        return;
    }
    if (write_queue_.empty()) {
        if (state_ == ConnectionState::CLOSING) {
            finish_close();
        }
        return;
    }
    
    write_in_progress_ = true;
    auto& frame = write_queue_.front();
    
    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(frame),
        [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;
            
            if (ec) {
                handle_error(ec);
                return;
            }
            
            if (!write_queue_.empty()) {
                buffered_bytes_ -= std::min(buffered_bytes_, write_queue_.front().size());
                write_queue_.pop();
            }
            
            do_write();
        });
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_INFO("Connection to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Connection operation aborted for {}", remote_endpoint_);
    } else {
        LOG_ERROR("Connection error with {}: {}", remote_endpoint_, error.message());
    }
    
    terminate();
}

}
