#include "peerdrop/core/utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace peerdrop::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    
    for (;;) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            return parts;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string StringUtils::trim(const std::string& str) {
    static constexpr const char* whitespace = " \t\r\n\f\v";
    
    auto first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result(str.size(), '\0');
    std::transform(str.begin(), str.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    
    auto size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", size, units[unit]);
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    using namespace std::chrono;
    
    if (duration < seconds(1)) {
        return fmt::format("{}ms", duration.count());
    }
    
    auto h = duration_cast<hours>(duration);
    auto m = duration_cast<minutes>(duration - h);
    auto s = duration_cast<seconds>(duration - h - m);
    
    if (h.count() > 0) {
        return fmt::format("{}h {}m", h.count(), m.count());
    }
    if (m.count() > 0) {
        return fmt::format("{}m {}s", m.count(), s.count());
    }
    return fmt::format("{}s", s.count());
}

std::optional<std::pair<std::string, std::uint16_t>> StringUtils::parse_host_port(const std::string& str) {
    auto colon = str.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    
    auto host = str.substr(0, colon);
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    
    const char* begin = str.data() + colon + 1;
    const char* end = str.data() + str.size();
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(begin, end, port);
    if (begin == end || ec != std::errc() || ptr != end || port == 0 || port > 65535) {
        return std::nullopt;
    }
    
    return std::make_pair(host, static_cast<std::uint16_t>(port));
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::string FileUtils::get_file_extension(const std::filesystem::path& path) {
    return StringUtils::to_lower(path.extension().string());
}

}
