#pragma once

#include "peerdrop/core/command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace peerdrop::core {

// Maps the first positional argument to a CommandHandler. Built with the
// relay, send and receive commands.
class CommandRegistry {
public:
    CommandRegistry();
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    // Handler exceptions are reported as failed results
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    
    bool has_command(const std::string& command) const;
    std::vector<std::string> command_names() const;
    void print_help() const;
    
private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
