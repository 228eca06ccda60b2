/**
 * @file rate_limiter.cpp
 * @brief Implementation of per-sender token bucket rate limiting
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/rate_limiter.hpp"
#include <algorithm>

namespace toolmesh {

RateLimiter::RateLimiter(double rate_per_second, double burst_capacity, Clock clock)
    : rate_per_second_(rate_per_second)
    , burst_capacity_(burst_capacity)
    , clock_(clock ? std::move(clock) : Clock(utilities::current_time_ms))
{
}

// ============================================================================
// Rate Limiting
// ============================================================================

bool RateLimiter::allow(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_();

    auto it = sender_buckets_.find(sender_id);
    if (it == sender_buckets_.end()) {
        it = sender_buckets_.emplace(
            sender_id, TokenBucket(rate_per_second_, burst_capacity_, now)).first;
    }

    TokenBucket& bucket = it->second;
    refill_tokens(bucket, now);

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }

    return false;
}

double RateLimiter::available_tokens(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sender_buckets_.find(sender_id);
    if (it == sender_buckets_.end()) {
        return burst_capacity_;
    }

    refill_tokens(it->second, clock_());
    return it->second.tokens;
}

void RateLimiter::refill_tokens(TokenBucket& bucket, uint64_t now_ms) {
    if (now_ms <= bucket.last_refill_ms) {
        return;
    }

    double seconds_elapsed = (now_ms - bucket.last_refill_ms) / 1000.0;
    bucket.tokens = std::min(bucket.tokens + seconds_elapsed * bucket.refill_rate, bucket.capacity);
    bucket.last_refill_ms = now_ms;
}

// ============================================================================
// Management Functions
// ============================================================================

size_t RateLimiter::tracked_senders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sender_buckets_.size();
}

size_t RateLimiter::cleanup_inactive(std::chrono::milliseconds inactive_threshold) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_();
    uint64_t threshold = static_cast<uint64_t>(inactive_threshold.count());
    size_t removed = 0;

    for (auto it = sender_buckets_.begin(); it != sender_buckets_.end(); ) {
        if (now > it->second.last_refill_ms && now - it->second.last_refill_ms > threshold) {
            it = sender_buckets_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

void RateLimiter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sender_buckets_.clear();
}

} // namespace toolmesh
