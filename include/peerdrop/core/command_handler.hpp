#pragma once

#include <string>
#include <vector>

namespace peerdrop::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Runs a relay until interrupted
class RelayCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run a signaling relay"; }
    std::string get_usage() const override { return "peerdrop relay [--port N]"; }
};

// Creates a session, prints its id and sends the files once a receiver joins
class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send files to whoever joins the printed session id"; }
    std::string get_usage() const override { return "peerdrop send [--relay host:port] <file>..."; }
};

// Joins a session and saves every announced file
class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Receive files from a session"; }
    std::string get_usage() const override { return "peerdrop receive [--relay host:port] [--output dir] <session-id>"; }
};

}
