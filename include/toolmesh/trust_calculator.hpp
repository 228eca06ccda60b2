/**
 * @file trust_calculator.hpp
 * @brief Trust scoring from observed server behavior
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Score components (weights sum to 1.0):
 * - Uptime (0.20)
 * - Response time (0.15)
 * - Success rate (0.25)
 * - Quality (0.15)
 * - Request volume (0.10, logarithmic)
 * - Verification (0.15, owner and code audit)
 *
 * Abuse reports subtract up to 50 points from the weighted sum.
 */

#pragma once

#include "toolmesh/federation_types.hpp"

namespace toolmesh {

/**
 * @brief Stateless trust scoring functions
 */
class TrustCalculator {
public:
    static constexpr double UPTIME_WEIGHT = 0.20;
    static constexpr double RESPONSE_TIME_WEIGHT = 0.15;
    static constexpr double SUCCESS_RATE_WEIGHT = 0.25;
    static constexpr double QUALITY_WEIGHT = 0.15;
    static constexpr double VOLUME_WEIGHT = 0.10;
    static constexpr double VERIFICATION_WEIGHT = 0.15;

    static constexpr double REPORT_PENALTY = 10.0;
    static constexpr double MAX_REPORT_PENALTY = 50.0;

    /**
     * @brief Compute trust score
     * @param metrics Observed behavior
     * @return Score rounded to the nearest integer in [0, 100]
     */
    static int calculate(const TrustMetrics& metrics);

    /**
     * @brief Decay a score for inactivity
     * @param score Current score
     * @param days_since_activity Days without activity
     * @param decay_rate Multiplier per day (e.g. 0.99)
     * @return round(score * decay_rate ^ days)
     */
    static int apply_decay(int score, double days_since_activity, double decay_rate);
};

} // namespace toolmesh
