#include <iostream>
#include <string>
#include <vector>
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/core/command_registry.hpp"

using namespace peerdrop::core;

int main(int argc, char* argv[]) {
    CommandLineParser parser("peerdrop");
    CommandRegistry command_registry;
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 1;
    }
    
    auto& config = Config::instance();
    config.set_defaults();
    
    // Only an explicitly named file has to exist
    auto config_file = parser.get_option("config");
    if (utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Warning: could not read " << config_file << "\n";
        }
    } else if (parser.has_option("config")) {
        std::cerr << "Error: config file " << config_file << " not found\n";
        return 1;
    }
    
    if (!parser.apply_to_config(config)) {
        std::cerr << "Error: " << parser.get_error() << "\n";
        return 1;
    }
    
    auto log_level = parser.get_bool_option("verbose")
        ? LogLevel::Debug
        : Logger::parse_level(config.get_string("log.level"), LogLevel::Info);
    Logger::initialize(config.get_string("log.file", "peerdrop.log"), log_level);
    
    const auto& command = args[0];
    LOG_INFO("PeerDrop {} starting", command);
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    Logger::shutdown();
    return result.exit_code;
}
