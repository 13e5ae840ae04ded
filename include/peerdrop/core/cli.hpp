#pragma once

#include "peerdrop/core/config.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop::core {

// getopt-style parsing: "--name value", "--name=value", "-n value", "-nvalue",
// clustered short flags ("-hv") and "--" to end option processing.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");
    
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    // Copies --port, --relay and --output into their config keys. False,
    // with get_error() set, when a value does not parse.
    bool apply_to_config(Config& config);
    
    void print_help() const;
    void print_version() const;
    
private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };
    
    bool parse_long(const std::string& arg, int& index, int argc, char* argv[]);
    bool parse_short(const std::string& arg, int& index, int argc, char* argv[]);
    const Option* find(const std::string& name) const;
    
    std::string program_name_;
    std::vector<Option> options_;
    std::unordered_map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
