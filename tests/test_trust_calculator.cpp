/**
 * @file test_trust_calculator.cpp
 * @brief Unit tests for TrustCalculator
 *
 * Tests trust scoring including:
 * - Default metrics
 * - Individual component weights
 * - Report penalty and clamping
 * - Monotonicity across parameter sweeps
 * - Decay
 */

#include <gtest/gtest.h>
#include "toolmesh/trust_calculator.hpp"

using namespace toolmesh;

class TrustCalculatorTest : public ::testing::Test {
protected:
    TrustMetrics metrics_;
};

// ============================================================================
// Score components
// ============================================================================

TEST_F(TrustCalculatorTest, DefaultMetrics) {
    // 20 + 15 + 25 + 7.5 + 0 + 7.5
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 75);
}

TEST_F(TrustCalculatorTest, PerfectServer) {
    metrics_.quality_score = 100.0;
    metrics_.total_requests = 99999;
    metrics_.verified_owner = true;
    metrics_.audited_code = true;

    EXPECT_EQ(TrustCalculator::calculate(metrics_), 100);
}

TEST_F(TrustCalculatorTest, ResponseTimePenalty) {
    metrics_.avg_response_time_ms = 4000.0;   // response score 60
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 69);

    metrics_.avg_response_time_ms = 20000.0;  // floors at 0
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 60);
}

TEST_F(TrustCalculatorTest, VolumeIsLogarithmic) {
    metrics_.total_requests = 9;      // log10(10) * 20 = 20 -> +2
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 77);

    metrics_.total_requests = 999;    // 60 -> +6
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 81);
}

TEST_F(TrustCalculatorTest, VerificationBonus) {
    metrics_.verified_owner = true;
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 79);

    metrics_.audited_code = true;
    metrics_.quality_score = 60.0;
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 84);
}

TEST_F(TrustCalculatorTest, ReportPenalty) {
    metrics_.report_count = 1;
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 65);

    metrics_.report_count = 3;
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 45);
}

TEST_F(TrustCalculatorTest, ReportPenaltyCappedAtFifty) {
    metrics_.report_count = 5;
    int at_cap = TrustCalculator::calculate(metrics_);

    metrics_.report_count = 100;
    EXPECT_EQ(TrustCalculator::calculate(metrics_), at_cap);
    EXPECT_EQ(at_cap, 25);
}

TEST_F(TrustCalculatorTest, ClampedAtZero) {
    metrics_.uptime = 0.0;
    metrics_.success_rate = 0.0;
    metrics_.quality_score = 0.0;
    metrics_.avg_response_time_ms = 50000.0;
    metrics_.report_count = 10;

    EXPECT_EQ(TrustCalculator::calculate(metrics_), 0);
}

TEST_F(TrustCalculatorTest, AfterSuccessfulCalls) {
    metrics_.total_requests = 10;
    metrics_.avg_response_time_ms = 50.0;
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 77);

    metrics_.total_requests = 11;
    metrics_.total_errors = 1;
    metrics_.success_rate = 10.0 / 11.0 * 100.0;
    EXPECT_EQ(TrustCalculator::calculate(metrics_), 75);
}

TEST_F(TrustCalculatorTest, Deterministic) {
    metrics_.uptime = 87.3;
    metrics_.avg_response_time_ms = 321.0;
    metrics_.total_requests = 4242;

    int first = TrustCalculator::calculate(metrics_);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(TrustCalculator::calculate(metrics_), first);
    }
    EXPECT_GE(first, 0);
    EXPECT_LE(first, 100);
}

// ============================================================================
// Monotonicity
// ============================================================================

TEST_F(TrustCalculatorTest, NonDecreasingInUptime) {
    metrics_.report_count = 2;
    int previous = -1;
    for (int uptime = 0; uptime <= 100; ++uptime) {
        metrics_.uptime = uptime;
        int score = TrustCalculator::calculate(metrics_);
        EXPECT_GE(score, previous) << "uptime " << uptime;
        previous = score;
    }
}

TEST_F(TrustCalculatorTest, NonDecreasingInSuccessRate) {
    metrics_.uptime = 60.0;
    int previous = -1;
    for (int rate = 0; rate <= 100; ++rate) {
        metrics_.success_rate = rate;
        int score = TrustCalculator::calculate(metrics_);
        EXPECT_GE(score, previous) << "success rate " << rate;
        previous = score;
    }
}

TEST_F(TrustCalculatorTest, NonDecreasingInQuality) {
    metrics_.avg_response_time_ms = 2500.0;
    int previous = -1;
    for (int quality = 0; quality <= 100; ++quality) {
        metrics_.quality_score = quality;
        int score = TrustCalculator::calculate(metrics_);
        EXPECT_GE(score, previous) << "quality " << quality;
        previous = score;
    }
}

TEST_F(TrustCalculatorTest, NonDecreasingInRequestVolume) {
    metrics_.quality_score = 20.0;
    int previous = -1;
    for (uint64_t requests = 0; requests <= 100000; requests += (requests < 1000 ? 1 : 997)) {
        metrics_.total_requests = requests;
        int score = TrustCalculator::calculate(metrics_);
        EXPECT_GE(score, previous) << "requests " << requests;
        previous = score;
    }
}

TEST_F(TrustCalculatorTest, NonIncreasingInResponseTime) {
    int previous = 101;
    for (int ms = 0; ms <= 12000; ms += 50) {
        metrics_.avg_response_time_ms = ms;
        int score = TrustCalculator::calculate(metrics_);
        EXPECT_LE(score, previous) << "response time " << ms;
        previous = score;
    }
}

TEST_F(TrustCalculatorTest, NonIncreasingInReports) {
    for (bool verified : {false, true}) {
        metrics_.verified_owner = verified;
        int previous = 101;
        for (uint32_t reports = 0; reports <= 10; ++reports) {
            metrics_.report_count = reports;
            int score = TrustCalculator::calculate(metrics_);
            EXPECT_LE(score, previous) << "reports " << reports;
            previous = score;
        }
    }
}

// ============================================================================
// Decay
// ============================================================================

TEST_F(TrustCalculatorTest, DecayNoTime) {
    EXPECT_EQ(TrustCalculator::apply_decay(80, 0.0, 0.99), 80);
}

TEST_F(TrustCalculatorTest, DecayOverDays) {
    EXPECT_EQ(TrustCalculator::apply_decay(100, 1.0, 0.99), 99);
    EXPECT_EQ(TrustCalculator::apply_decay(100, 30.0, 0.99), 74);   // 73.97
    EXPECT_EQ(TrustCalculator::apply_decay(100, 100.0, 0.99), 37);  // 36.6
}

TEST_F(TrustCalculatorTest, DecayZeroDaysKeepsScore) {
    for (double rate : {0.1, 0.5, 0.9, 0.99, 1.0}) {
        EXPECT_EQ(TrustCalculator::apply_decay(100, 0.0, rate), 100) << "rate " << rate;
        EXPECT_EQ(TrustCalculator::apply_decay(37, 0.0, rate), 37) << "rate " << rate;
    }
}

TEST_F(TrustCalculatorTest, DecayNonIncreasingInDays) {
    for (double rate : {0.5, 0.9, 0.99}) {
        int previous = 100;
        for (int days = 0; days <= 365; ++days) {
            int score = TrustCalculator::apply_decay(100, days, rate);
            EXPECT_LE(score, previous) << "rate " << rate << " day " << days;
            EXPECT_GE(score, 0);
            previous = score;
        }
    }
}

TEST_F(TrustCalculatorTest, DecayRateOneIsIdentity) {
    EXPECT_EQ(TrustCalculator::apply_decay(42, 365.0, 1.0), 42);
}
