#include <gtest/gtest.h>
#include "peerdrop/transfer/throughput_estimator.hpp"
#include <cmath>
#include <limits>

using namespace peerdrop::transfer;

class ThroughputEstimatorTest : public ::testing::Test {
protected:
    using Clock = ThroughputEstimator::Clock;
    
    Clock::time_point start_ = Clock::now();
};

TEST_F(ThroughputEstimatorTest, SpeedAndEta) {
    auto sample = ThroughputEstimator::estimate(1000, 3000, 2.0);
    
    EXPECT_DOUBLE_EQ(sample.speed_bytes_per_sec, 500.0);
    EXPECT_DOUBLE_EQ(sample.eta_seconds, 4.0);
}

TEST_F(ThroughputEstimatorTest, ZeroElapsedGivesSentinel) {
    auto sample = ThroughputEstimator::estimate(1000, 3000, 0.0);
    
    EXPECT_EQ(sample.speed_bytes_per_sec, 0.0);
    EXPECT_EQ(sample.eta_seconds, ETA_UNKNOWN);
    EXPECT_FALSE(std::isnan(sample.eta_seconds));
}

TEST_F(ThroughputEstimatorTest, NegativeOrNonFiniteElapsed) {
    for (double elapsed : {-1.0, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()}) {
        auto sample = ThroughputEstimator::estimate(1000, 3000, elapsed);
        EXPECT_GE(sample.speed_bytes_per_sec, 0.0);
        EXPECT_FALSE(std::isnan(sample.speed_bytes_per_sec));
        EXPECT_EQ(sample.eta_seconds, ETA_UNKNOWN);
    }
}

TEST_F(ThroughputEstimatorTest, NothingTransferredYet) {
    auto sample = ThroughputEstimator::estimate(0, 3000, 5.0);
    
    EXPECT_EQ(sample.speed_bytes_per_sec, 0.0);
    EXPECT_EQ(sample.eta_seconds, ETA_UNKNOWN);
}

TEST_F(ThroughputEstimatorTest, CompleteTransferHasZeroEta) {
    auto sample = ThroughputEstimator::estimate(200000, 200000, 1.5);
    
    EXPECT_GT(sample.speed_bytes_per_sec, 0.0);
    EXPECT_DOUBLE_EQ(sample.eta_seconds, 0.0);
}

TEST_F(ThroughputEstimatorTest, TotalBehindTransferredClampsEta) {
    auto sample = ThroughputEstimator::estimate(5000, 4000, 1.0);
    EXPECT_DOUBLE_EQ(sample.eta_seconds, 0.0);
}

TEST_F(ThroughputEstimatorTest, SampleUsesStartTime) {
    ThroughputEstimator estimator(start_);
    
    auto sample = estimator.sample(4096, 8192, start_ + std::chrono::seconds(2));
    EXPECT_DOUBLE_EQ(sample.speed_bytes_per_sec, 2048.0);
    EXPECT_DOUBLE_EQ(sample.eta_seconds, 2.0);
    
    auto same_instant = estimator.sample(4096, 8192, start_);
    EXPECT_EQ(same_instant.eta_seconds, ETA_UNKNOWN);
}

TEST_F(ThroughputEstimatorTest, Restart) {
    ThroughputEstimator estimator(start_);
    estimator.restart(start_ + std::chrono::seconds(10));
    
    EXPECT_DOUBLE_EQ(estimator.elapsed_seconds(start_ + std::chrono::seconds(12)), 2.0);
}

TEST_F(ThroughputEstimatorTest, ProgressPercentage) {
    TransferProgress progress{"f", 50, 200, 0.0, ETA_UNKNOWN};
    EXPECT_DOUBLE_EQ(progress.percentage(), 25.0);
    EXPECT_FALSE(progress.is_complete());
    
    progress.bytes_transferred = 200;
    EXPECT_TRUE(progress.is_complete());
    
    TransferProgress unknown_total{"f", 10, 0, 0.0, ETA_UNKNOWN};
    EXPECT_DOUBLE_EQ(unknown_total.percentage(), 0.0);
}
