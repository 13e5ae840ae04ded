#include "peerdrop/core/command_registry.hpp"
#include "peerdrop/core/logger.hpp"
#include <iomanip>
#include <iostream>

namespace peerdrop::core {

CommandRegistry::CommandRegistry() {
    register_command("relay", std::make_unique<RelayCommandHandler>());
    register_command("send", std::make_unique<SendCommandHandler>());
    register_command("receive", std::make_unique<ReceiveCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        std::string known;
        for (const auto& name : command_names()) {
            known += (known.empty() ? "" : ", ") + name;
        }
        return CommandResult::error("Unknown command: " + command + " (expected one of: " + known + ")");
    }
    
    LOG_DEBUG("Running command '{}' with {} arguments", command, args.size() > 0 ? args.size() - 1 : 0);
    try {
        return it->second->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command '{}' aborted: {}", command, e.what());
        return CommandResult::error(command + " failed: " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n";
    }
    
    std::cout << "\nUsage:\n";
    for (const auto& entry : handlers_) {
        std::cout << "  " << entry.second->get_usage() << "\n";
    }
    std::cout << "\n";
}

}
