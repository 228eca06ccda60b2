/**
 * @file health_monitor.cpp
 * @brief Implementation of server health supervision
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/health_monitor.hpp"

namespace toolmesh {

HealthMonitor::HealthMonitor(const FederationConfig& config, ServerRegistry& registry,
                             HttpTransport& transport, Clock clock)
    : config_(config)
    , registry_(registry)
    , transport_(transport)
    , clock_(clock ? std::move(clock) : Clock(utilities::current_time_ms))
{
}

HealthRoundSummary HealthMonitor::health_check_round() {
    HealthRoundSummary summary;

    const uint64_t stale_after = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(protocol::STALE_SERVER_THRESHOLD).count());

    // Snapshot; probes run without the registry lock
    for (const auto& server : registry_.get_all_servers()) {
        uint64_t now = clock_();
        if (now <= server.last_seen_at || now - server.last_seen_at <= stale_after) {
            continue;
        }

        summary.checked++;

        bool alive = probe_health(transport_, server.endpoint,
                                  std::chrono::milliseconds(config_.connection_timeout_ms));

        if (alive) {
            if (registry_.mark_alive(server.id)) {
                summary.alive++;
            }
            continue;
        }

        summary.failed++;
        UnreachableOutcome outcome = registry_.mark_unreachable(
            server.id, protocol::EVICTION_TRUST_THRESHOLD);

        if (outcome == UnreachableOutcome::EVICTED) {
            summary.evicted++;
            utilities::log_warn("Health: evicted unreachable server " + server.id +
                                " (" + server.endpoint + ")");
        } else if (outcome == UnreachableOutcome::DEGRADED) {
            utilities::log_debug("Health: server " + server.id + " failed health check");
        }
    }

    if (summary.checked > 0) {
        utilities::log_info("Health: checked " + std::to_string(summary.checked) + " servers, " +
                            std::to_string(summary.alive) + " alive, " +
                            std::to_string(summary.failed) + " failed, " +
                            std::to_string(summary.evicted) + " evicted");
    }

    return summary;
}

} // namespace toolmesh
