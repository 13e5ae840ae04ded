#include "peerdrop/transfer/throughput_estimator.hpp"
#include <algorithm>
#include <cmath>

namespace peerdrop::transfer {

double TransferProgress::percentage() const {
    if (total_bytes == 0) return 0.0;
    
    auto ratio = static_cast<double>(bytes_transferred) / static_cast<double>(total_bytes);
    return std::min(ratio, 1.0) * 100.0;
}

ThroughputEstimator::ThroughputEstimator(Clock::time_point started_at)
    : started_at_(started_at) {
}

ThroughputSample ThroughputEstimator::estimate(std::uint64_t bytes_transferred,
                                               std::uint64_t total_bytes,
                                               double elapsed_seconds) {
    ThroughputSample sample;
    
    if (!(elapsed_seconds > 0.0) || !std::isfinite(elapsed_seconds)) {
        return sample;
    }
    
    sample.speed_bytes_per_sec = static_cast<double>(bytes_transferred) / elapsed_seconds;
    
    if (sample.speed_bytes_per_sec <= 0.0) {
        sample.speed_bytes_per_sec = 0.0;
        return sample;
    }
    
    // An estimated total can lag behind what has already arrived
    std::uint64_t remaining = total_bytes > bytes_transferred ? total_bytes - bytes_transferred : 0;
    sample.eta_seconds = static_cast<double>(remaining) / sample.speed_bytes_per_sec;
    
    return sample;
}

ThroughputSample ThroughputEstimator::sample(std::uint64_t bytes_transferred,
                                             std::uint64_t total_bytes,
                                             Clock::time_point now) const {
    return estimate(bytes_transferred, total_bytes, elapsed_seconds(now));
}

double ThroughputEstimator::elapsed_seconds(Clock::time_point now) const {
    return std::chrono::duration<double>(now - started_at_).count();
}

}
