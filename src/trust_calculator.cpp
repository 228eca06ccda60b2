/**
 * @file trust_calculator.cpp
 * @brief Implementation of trust scoring
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/trust_calculator.hpp"
#include <algorithm>
#include <cmath>

namespace toolmesh {

int TrustCalculator::calculate(const TrustMetrics& metrics) {
    double score = 0.0;

    score += metrics.uptime * UPTIME_WEIGHT;

    // 100 at 0ms, 0 at 10s and beyond
    double response_score = std::max(0.0, 100.0 - metrics.avg_response_time_ms / 100.0);
    score += response_score * RESPONSE_TIME_WEIGHT;

    score += metrics.success_rate * SUCCESS_RATE_WEIGHT;
    score += metrics.quality_score * QUALITY_WEIGHT;

    // 20 points per order of magnitude, saturating at 100k requests
    double volume_score = std::min(
        100.0, std::log10(static_cast<double>(metrics.total_requests) + 1.0) * 20.0);
    score += volume_score * VOLUME_WEIGHT;

    double verification_score = 50.0;
    if (metrics.verified_owner) verification_score += 25.0;
    if (metrics.audited_code) verification_score += 25.0;
    score += verification_score * VERIFICATION_WEIGHT;

    score -= std::min(MAX_REPORT_PENALTY, metrics.report_count * REPORT_PENALTY);

    score = std::clamp(score, 0.0, 100.0);
    return static_cast<int>(std::lround(score));
}

int TrustCalculator::apply_decay(int score, double days_since_activity, double decay_rate) {
    return static_cast<int>(std::lround(score * std::pow(decay_rate, days_since_activity)));
}

} // namespace toolmesh
