/**
 * @file health_monitor.hpp
 * @brief Periodic reachability checks of stale servers
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Servers not seen for STALE_SERVER_THRESHOLD are probed with
 * GET {endpoint}/health. A live server gains uptime, a dead one loses it
 * and is evicted once its trust drops below EVICTION_TRUST_THRESHOLD.
 */

#pragma once

#include "toolmesh/federation_config.hpp"
#include "toolmesh/server_registry.hpp"
#include "toolmesh/http_transport.hpp"
#include "toolmesh/utilities.hpp"
#include <cstddef>

namespace toolmesh {

/**
 * @brief Counts of one health round
 */
struct HealthRoundSummary {
    size_t checked = 0;
    size_t alive = 0;
    size_t failed = 0;
    size_t evicted = 0;
};

/**
 * @brief HealthMonitor - Health supervision of registered servers
 */
class HealthMonitor {
public:
    HealthMonitor(const FederationConfig& config, ServerRegistry& registry,
                  HttpTransport& transport, Clock clock = nullptr);

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Probe every stale server once
     * @return Round summary
     */
    HealthRoundSummary health_check_round();

private:
    FederationConfig config_;
    ServerRegistry& registry_;
    HttpTransport& transport_;
    Clock clock_;
};

} // namespace toolmesh
