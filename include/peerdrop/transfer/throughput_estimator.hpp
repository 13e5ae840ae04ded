#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace peerdrop::transfer {

// Reported instead of an ETA when nothing has moved yet
constexpr double ETA_UNKNOWN = -1.0;

struct ThroughputSample {
    double speed_bytes_per_sec = 0.0;
    double eta_seconds = ETA_UNKNOWN;
};

struct TransferProgress {
    std::string file_id;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    double speed_bytes_per_sec = 0.0;
    double eta_seconds = ETA_UNKNOWN;
    
    bool is_complete() const { return total_bytes > 0 ? bytes_transferred >= total_bytes : false; }
    double percentage() const;
};

struct TransferState {
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::steady_clock::time_point started_at;
};

class ThroughputEstimator {
public:
    using Clock = std::chrono::steady_clock;
    
    explicit ThroughputEstimator(Clock::time_point started_at = Clock::now());
    
    // speed = bytes / elapsed (0 when elapsed <= 0)
    // eta = (total - bytes) / speed, ETA_UNKNOWN when speed is 0
    static ThroughputSample estimate(std::uint64_t bytes_transferred,
                                     std::uint64_t total_bytes,
                                     double elapsed_seconds);
    
    ThroughputSample sample(std::uint64_t bytes_transferred,
                            std::uint64_t total_bytes,
                            Clock::time_point now = Clock::now()) const;
    
    double elapsed_seconds(Clock::time_point now = Clock::now()) const;
    Clock::time_point started_at() const { return started_at_; }
    void restart(Clock::time_point started_at = Clock::now()) { started_at_ = started_at; }
    
private:
    Clock::time_point started_at_;
};

}
