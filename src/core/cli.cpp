#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/utils.hpp"
#include <iomanip>
#include <iostream>

namespace peerdrop::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "peerdrop.conf");
    add_option("", "verbose", "Enable debug logging");
    add_option("p", "port", "Relay port to listen on (relay)", true);
    add_option("r", "relay", "Relay address as host:port (send, receive)", true);
    add_option("o", "output", "Directory for received files (receive)", true);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    options_.push_back(Option{short_name, long_name, description, has_value, default_value});
}

const CommandLineParser::Option* CommandLineParser::find(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name || (!option.short_name.empty() && option.short_name == name)) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), argv + i + 1, argv + argc);
            return true;
        }
        
        bool ok = true;
        if (arg.size() > 2 && arg.starts_with("--")) {
            ok = parse_long(arg, i, argc, argv);
        } else if (arg.size() > 1 && arg[0] == '-') {
            ok = parse_short(arg, i, argc, argv);
        } else {
            positional_args_.push_back(arg);
        }
        
        if (!ok) {
            return false;
        }
    }
    
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
    
    const auto* option = find(name);
    if (!option || option->long_name != name) {
        error_ = "Unknown option: --" + name;
        return false;
    }
    
    if (!option->has_value) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " takes no value";
            return false;
        }
        values_[option->long_name] = "true";
        return true;
    }
    
    if (eq_pos != std::string::npos) {
        values_[option->long_name] = arg.substr(eq_pos + 1);
    } else if (index + 1 < argc) {
        values_[option->long_name] = argv[++index];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse_short(const std::string& arg, int& index, int argc, char* argv[]) {
    for (std::size_t j = 1; j < arg.size(); ++j) {
        std::string flag(1, arg[j]);
        
        const auto* option = find(flag);
        if (!option || option->short_name != flag) {
            error_ = "Unknown option: -" + flag;
            return false;
        }
        
        if (!option->has_value) {
            values_[option->long_name] = "true";
            continue;
        }
        
        // The rest of the cluster is the value, or else the next argument
        if (j + 1 < arg.size()) {
            values_[option->long_name] = arg.substr(j + 1);
        } else if (index + 1 < argc) {
            values_[option->long_name] = argv[++index];
        } else {
            error_ = "Option -" + flag + " requires a value";
            return false;
        }
        return true;
    }
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const auto* option = find(name);
    return option && values_.count(option->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const auto* option = find(name);
    if (!option) {
        return default_value;
    }
    
    auto it = values_.find(option->long_name);
    if (it != values_.end()) {
        return it->second;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    if (value.empty()) {
        return default_value;
    }
    
    try {
        std::size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        return consumed == value.size() ? result : default_value;
    } catch (const std::exception&) {
        return default_value;
    }
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) {
        return default_value;
    }
    
    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes";
}

bool CommandLineParser::apply_to_config(Config& config) {
    if (has_option("port")) {
        auto port = get_int_option("port", -1);
        if (port <= 0 || port > 65535) {
            error_ = "--port expects a number between 1 and 65535";
            return false;
        }
        config.set("relay.port", std::to_string(port));
    }
    
    if (has_option("relay")) {
        auto relay = utils::StringUtils::parse_host_port(get_option("relay"));
        if (!relay) {
            error_ = "--relay expects host:port";
            return false;
        }
        config.set("relay.host", relay->first);
        config.set("relay.port", std::to_string(relay->second));
    }
    
    if (has_option("output")) {
        config.set("receive.output_dir", get_option("output"));
    }
    
    return true;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& option : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name;
        if (option.has_value) {
            flags += " <value>";
        }
        
        std::cout << "  " << std::left << std::setw(24) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " 1.0.0\n";
}

}
