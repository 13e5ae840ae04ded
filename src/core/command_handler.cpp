#include "peerdrop/core/command_handler.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/crypto/random.hpp"
#include "peerdrop/network/relay_server.hpp"
#include "peerdrop/network/tcp_relay_client.hpp"
#include "peerdrop/network/tcp_transport.hpp"
#include "peerdrop/transfer/file_sink.hpp"
#include "peerdrop/transfer/transfer_session.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>

namespace peerdrop::core {

namespace {

using transfer::ConnectionStatus;
using transfer::SessionState;
using transfer::TransferProgress;

// Terminal output shared by send and receive. Stops the io_context once
// the session reaches a terminal state.
class ConsoleObserver : public transfer::SessionObserver {
public:
    explicit ConsoleObserver(boost::asio::io_context& io_context)
        : io_context_(io_context)
        , failed_(false) {}
    
    void attach(std::weak_ptr<transfer::TransferSession> session) { session_ = std::move(session); }
    
    void on_state_changed(ConnectionStatus status, SessionState state) override {
        end_progress_line();
        std::cout << "[" << transfer::to_string(status) << "] " << transfer::to_string(state) << "\n";
        
        if (state == SessionState::FAILED) {
            failed_ = true;
        }
        if (state == SessionState::CLOSED || state == SessionState::FAILED) {
            io_context_.stop();
        }
    }
    
    void on_progress(const TransferProgress& progress) override {
        auto now = std::chrono::steady_clock::now();
        if (!progress.is_complete() && now - last_print_ < std::chrono::milliseconds(200)) {
            return;
        }
        last_print_ = now;
        
        std::cout << "\r  " << name_of(progress.file_id) << "  "
                  << std::fixed << std::setprecision(1) << progress.percentage() << "%  "
                  << utils::StringUtils::format_bytes(progress.bytes_transferred) << " / "
                  << utils::StringUtils::format_bytes(progress.total_bytes) << "  "
                  << utils::StringUtils::format_bytes(static_cast<std::uint64_t>(progress.speed_bytes_per_sec)) << "/s";
        if (progress.eta_seconds > 0.0) {
            std::cout << "  eta " << utils::StringUtils::format_duration(
                std::chrono::milliseconds(static_cast<std::int64_t>(progress.eta_seconds * 1000.0)));
        }
        std::cout << "        " << std::flush;
        progress_line_open_ = true;
    }
    
    void on_error(const std::string& file_id, const TransferResult& error) override {
        end_progress_line();
        std::cerr << "Error";
        if (!file_id.empty()) {
            std::cerr << " (" << name_of(file_id) << ")";
        }
        std::cerr << ": " << error.message << "\n";
        last_error_ = error.message;
    }
    
    bool failed() const { return failed_; }
    const std::string& last_error() const { return last_error_; }
    
protected:
    virtual std::string name_of(const std::string& file_id) const {
        auto it = names_.find(file_id);
        return it != names_.end() ? it->second : file_id;
    }
    
    void end_progress_line() {
        if (progress_line_open_) {
            std::cout << "\n";
            progress_line_open_ = false;
        }
    }
    
    // Deferred so the current callback finishes printing first
    void close_session() {
        boost::asio::post(io_context_, [weak = session_]() {
            if (auto session = weak.lock()) {
                session->close();
            }
        });
    }
    
    boost::asio::io_context& io_context_;
    std::weak_ptr<transfer::TransferSession> session_;
    std::map<std::string, std::string> names_;
    std::chrono::steady_clock::time_point last_print_{};
    bool progress_line_open_ = false;
    bool failed_;
    std::string last_error_;
};

class SendObserver : public ConsoleObserver {
public:
    SendObserver(boost::asio::io_context& io_context, const std::vector<transfer::OutgoingFile>& files)
        : ConsoleObserver(io_context)
        , expected_(files.size())
        , sent_(0)
        , batch_failed_(0)
        , batch_done_(false) {
        for (const auto& file : files) {
            names_[file.descriptor.file_id] = file.descriptor.name;
        }
    }
    
    void on_file_sent(const std::string& file_id) override {
        end_progress_line();
        std::cout << "  sent " << name_of(file_id) << "\n";
    }
    
    void on_batch_sent(std::size_t sent, std::size_t failed) override {
        end_progress_line();
        sent_ = sent;
        batch_failed_ = failed;
        batch_done_ = true;
        
        std::cout << "Sent " << sent << " of " << expected_ << " files";
        if (failed > 0) {
            std::cout << ", " << failed << " failed\n";
            close_session();
        } else {
            std::cout << ", waiting for the receiver to finish\n";
        }
    }
    
    bool complete() const { return batch_done_ && batch_failed_ == 0 && sent_ == expected_; }
    
private:
    std::size_t expected_;
    std::size_t sent_;
    std::size_t batch_failed_;
    bool batch_done_;
};

class ReceiveObserver : public ConsoleObserver {
public:
    ReceiveObserver(boost::asio::io_context& io_context, std::filesystem::path output_dir)
        : ConsoleObserver(io_context)
        , sink_(std::move(output_dir))
        , announced_(false)
        , saved_(0)
        , save_failures_(0) {}
    
    void on_files_announced(const std::vector<transfer::FileDescriptor>& files) override {
        end_progress_line();
        announced_ = true;
        
        std::cout << "Incoming " << files.size() << " files:\n";
        for (const auto& file : files) {
            names_[file.file_id] = file.name;
            expected_.insert(file.file_id);
            std::cout << "  " << file.name << " (" << utils::StringUtils::format_bytes(file.size_bytes)
                      << ", " << file.mime_type << ")\n";
        }
        
        if (expected_.empty()) {
            close_session();
        }
    }
    
    void on_file_received(const transfer::FileDescriptor& descriptor, const std::vector<std::uint8_t>& data) override {
        end_progress_line();
        
        std::filesystem::path saved_path;
        auto result = sink_.save(descriptor, data, saved_path);
        if (result.success()) {
            ++saved_;
            std::cout << "  saved " << saved_path.string() << "\n";
        } else {
            ++save_failures_;
            std::cerr << "Could not save " << descriptor.name << ": " << result.message << "\n";
        }
        
        expected_.erase(descriptor.file_id);
        if (announced_ && expected_.empty()) {
            close_session();
        }
    }
    
    bool complete() const { return announced_ && expected_.empty() && save_failures_ == 0; }
    std::size_t saved() const { return saved_; }
    
private:
    transfer::FileSink sink_;
    std::set<std::string> expected_;
    bool announced_;
    std::size_t saved_;
    std::size_t save_failures_;
};

struct RelayAddress {
    std::string host;
    std::uint16_t port;
};

RelayAddress relay_address(const Config& config) {
    auto port = config.get_int("relay.port", 9300);
    return RelayAddress{config.get_string("relay.host", "127.0.0.1"),
                        static_cast<std::uint16_t>(port > 0 && port <= 65535 ? port : 9300)};
}

// Drives one session to completion on the calling thread
void run_session(boost::asio::io_context& io_context,
                 const std::shared_ptr<transfer::TransferSession>& session,
                 const std::shared_ptr<network::TcpRelayClient>& relay,
                 std::string& relay_error) {
    relay->set_error_handler([&relay_error, weak = std::weak_ptr<transfer::TransferSession>(session)](const std::string& reason) {
        auto session = weak.lock();
        if (!session || session->state() == SessionState::OPEN) {
            LOG_WARN("Relay unavailable, continuing on the open channel: {}", reason);
            return;
        }
        relay_error = reason;
        session->close();
    });
    
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&io_context, weak = std::weak_ptr<transfer::TransferSession>(session)](
                           const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        LOG_INFO("Interrupted by signal {}", signal_number);
        auto session = weak.lock();
        if (session && !session->is_terminal()) {
            session->close();
        } else {
            io_context.stop();
        }
    });
    
    relay->connect();
    auto started = session->start();
    if (!started.success()) {
        relay_error = started.message;
        return;
    }
    
    io_context.run();
    
    boost::system::error_code ec;
    signals.cancel(ec);
    session->close();
    relay->close();
    
    // A closed channel still flushes the frames it had queued
    io_context.restart();
    io_context.run_for(network::CLOSE_LINGER + std::chrono::seconds(1));
}

}

CommandResult RelayCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto& config = Config::instance();
    auto port = config.get_int("relay.port", 9300);
    if (port < 0 || port > 65535) {
        return CommandResult::error("Invalid relay port: " + std::to_string(port));
    }
    
    try {
        network::RelayServer server(static_cast<std::uint16_t>(port));
        if (!server.start()) {
            return CommandResult::error("Failed to start relay");
        }
        
        std::cout << "Relay listening on port " << server.get_port() << ", Ctrl+C to stop\n";
        
        boost::asio::io_context signal_context;
        boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code&, int) {});
        signal_context.run();
        
        server.stop();
        return CommandResult::ok("Relay stopped");
    } catch (const std::exception& e) {
        return CommandResult::error("Relay failed: " + std::string(e.what()));
    }
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    if (!crypto::SecureRandom::initialize()) {
        return CommandResult::error("Failed to initialize random number generator");
    }
    
    std::vector<transfer::OutgoingFile> files;
    try {
        for (std::size_t i = 1; i < args.size(); ++i) {
            std::filesystem::path path = args[i];
            if (!utils::FileUtils::is_file(path)) {
                return CommandResult::error("Not a regular file: " + path.string());
            }
            
            auto descriptor = transfer::describe_file(path, crypto::SecureRandom::generate_file_id());
            files.push_back(transfer::OutgoingFile{descriptor, std::make_shared<transfer::FileSystemSource>(path)});
        }
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to read files: " + std::string(e.what()));
    }
    
    auto& config = Config::instance();
    auto relay_at = relay_address(config);
    
    boost::asio::io_context io_context;
    auto session_id = crypto::SecureRandom::generate_session_id();
    auto relay = std::make_shared<network::TcpRelayClient>(io_context, relay_at.host, relay_at.port);
    auto transport = network::TcpPeerTransport::from_config(io_context, config);
    auto observer = std::make_shared<SendObserver>(io_context, files);
    
    std::shared_ptr<transfer::TransferSession> session;
    try {
        session = std::make_shared<transfer::TransferSession>(
            io_context, session_id, transfer::SessionRole::INITIATOR, relay, transport, observer,
            transfer::SenderOptions::from_config(config));
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to create session: " + std::string(e.what()));
    }
    observer->attach(session);
    
    std::uint64_t total_bytes = 0;
    for (const auto& file : files) {
        total_bytes += file.descriptor.size_bytes;
    }
    
    std::cout << "Sharing " << files.size() << " files (" << utils::StringUtils::format_bytes(total_bytes) << ")\n";
    std::cout << "Session id: " << session_id << "\n";
    std::cout << "On the receiving side run: peerdrop receive --relay "
              << relay_at.host << ":" << relay_at.port << " " << session_id << "\n";
    
    auto queued = session->queue_files(std::move(files));
    if (!queued.success()) {
        return CommandResult::error("Failed to queue files: " + queued.message);
    }
    
    std::string relay_error;
    run_session(io_context, session, relay, relay_error);
    
    if (!relay_error.empty()) {
        return CommandResult::error(relay_error);
    }
    if (observer->failed()) {
        return CommandResult::error("Transfer failed: " + observer->last_error());
    }
    if (!observer->complete()) {
        return CommandResult::error("Transfer did not complete");
    }
    return CommandResult::ok("All files sent");
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const auto& session_id = args[1];
    
    auto& config = Config::instance();
    std::filesystem::path output_dir = config.get_string("receive.output_dir", ".");
    if (!utils::FileUtils::create_directories(output_dir)) {
        return CommandResult::error("Cannot create output directory: " + output_dir.string());
    }
    
    if (!crypto::SecureRandom::initialize()) {
        return CommandResult::error("Failed to initialize random number generator");
    }
    
    auto relay_at = relay_address(config);
    
    boost::asio::io_context io_context;
    auto relay = std::make_shared<network::TcpRelayClient>(io_context, relay_at.host, relay_at.port);
    auto transport = network::TcpPeerTransport::from_config(io_context, config);
    auto observer = std::make_shared<ReceiveObserver>(io_context, output_dir);
    
    std::shared_ptr<transfer::TransferSession> session;
    try {
        session = std::make_shared<transfer::TransferSession>(
            io_context, session_id, transfer::SessionRole::RESPONDER, relay, transport, observer,
            transfer::SenderOptions::from_config(config));
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to create session: " + std::string(e.what()));
    }
    observer->attach(session);
    
    std::cout << "Joining session " << session_id << " via " << relay_at.host << ":" << relay_at.port << "\n";
    
    std::string relay_error;
    run_session(io_context, session, relay, relay_error);
    
    if (!relay_error.empty()) {
        return CommandResult::error(relay_error);
    }
    if (observer->failed()) {
        return CommandResult::error("Transfer failed: " + observer->last_error());
    }
    if (!observer->complete()) {
        return CommandResult::error("Session ended before all files arrived");
    }
    return CommandResult::ok("Received " + std::to_string(observer->saved()) + " files");
}

}
