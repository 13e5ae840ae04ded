#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <fstream>
#include <utility>

namespace peerdrop::core {

namespace {

const std::pair<const char*, const char*> DEFAULTS[] = {
    {"relay.host", "127.0.0.1"},
    {"relay.port", "9300"},
    {"transfer.chunk_size", "65536"},
    {"transfer.high_water_mark", "4194304"},
    {"transfer.backpressure_delay_ms", "50"},
    {"transport.listen_address", "0.0.0.0"},
    {"transport.advertise_address", "127.0.0.1"},
    {"receive.output_dir", "."},
    {"log.level", "info"},
    {"log.file", "peerdrop.log"},
};

std::string section_of(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? std::string() : key.substr(0, dot);
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        auto key = eq_pos == std::string::npos ? std::string() : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value", filename, line_number);
            continue;
        }
        
        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }
    
    LOG_DEBUG("Loaded configuration from {}", filename);
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# PeerDrop configuration\n";
    
    std::string section = "\x01";
    for (const auto& [key, value] : values_) {
        auto current = section_of(key);
        if (current != section) {
            file << "\n";
            section = current;
        }
        file << key << "=" << value << "\n";
    }
    
    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    
    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    // istream happily wraps "-1" into a huge unsigned value
    if (!value || value->empty() || (*value)[0] == '-') {
        return default_value;
    }
    return get_as<std::uint64_t>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULTS) {
        values_[key] = value;
    }
}

}
