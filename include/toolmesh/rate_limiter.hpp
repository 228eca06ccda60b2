/**
 * @file rate_limiter.hpp
 * @brief Per-sender token bucket for inbound gossip and discovery messages
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Sustained rate and burst capacity from FederationConfig
 * - Refill driven by the injected Clock
 * - Thread-safe
 */

#pragma once

#include "toolmesh/utilities.hpp"
#include <string>
#include <chrono>
#include <mutex>
#include <map>

namespace toolmesh {

/**
 * @brief Token bucket for a single sender
 */
struct TokenBucket {
    double tokens;
    double capacity;
    double refill_rate;         ///< Tokens per second
    uint64_t last_refill_ms;    ///< Clock time of the last refill

    TokenBucket(double rate, double burst, uint64_t now_ms)
        : tokens(burst)
        , capacity(burst)
        , refill_rate(rate)
        , last_refill_ms(now_ms)
    {}
};

/**
 * @brief RateLimiter - Token bucket rate limiting per sender
 *
 * Each sender ID gets an independent bucket that starts full. Every admitted
 * message consumes one token; tokens refill continuously up to the burst
 * capacity.
 */
class RateLimiter {
public:
    /**
     * @brief Construct rate limiter
     * @param rate_per_second Sustained messages per second per sender
     * @param burst_capacity Maximum tokens per sender
     * @param clock Time source (defaults to wall clock)
     */
    RateLimiter(double rate_per_second, double burst_capacity, Clock clock = nullptr);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Admit a message from sender, consuming one token
     * @return false if the sender is over its limit
     */
    bool allow(const std::string& sender_id);

    /**
     * @brief Tokens currently available to sender (capacity if untracked)
     */
    double available_tokens(const std::string& sender_id);

    /**
     * @brief Number of senders with a bucket
     */
    size_t tracked_senders() const;

    /**
     * @brief Drop buckets untouched for longer than threshold
     * @return Number of buckets removed
     */
    size_t cleanup_inactive(std::chrono::milliseconds inactive_threshold = std::chrono::minutes(5));

    void clear();

private:
    void refill_tokens(TokenBucket& bucket, uint64_t now_ms);

    double rate_per_second_;
    double burst_capacity_;
    Clock clock_;

    std::map<std::string, TokenBucket> sender_buckets_;
    mutable std::mutex mutex_;
};

} // namespace toolmesh
