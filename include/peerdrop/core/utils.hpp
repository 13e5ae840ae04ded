#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace peerdrop::core::utils {

class StringUtils {
public:
    // Empty fields are kept, so "a,,b" yields three parts and "" yields one
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    
    // "1.50 MB", "512.00 B"
    static std::string format_bytes(std::uint64_t bytes);
    
    // "250ms", "42s", "2m 5s", "2h 15m"
    static std::string format_duration(std::chrono::milliseconds duration);
    
    // "host:port" or "[v6]:port" -> {host, port}. nullopt when the host or
    // port is missing or the port is not in 1..65535.
    static std::optional<std::pair<std::string, std::uint16_t>> parse_host_port(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    
    // Lower-cased, including the dot; empty when there is none
    static std::string get_file_extension(const std::filesystem::path& path);
};

}
