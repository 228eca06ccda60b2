/**
 * @file tool_router.hpp
 * @brief Routes tool invocations to federated servers
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Features:
 * - Trust gating against minTrustScore
 * - Result cache keyed by server, tool and canonical params
 * - Hard deadline of requestTimeoutMs per call
 * - Automatic fallback across all servers offering a tool
 *
 * Failures are returned in ToolCallResponse, never thrown.
 */

#pragma once

#include "toolmesh/federation_types.hpp"
#include "toolmesh/federation_config.hpp"
#include "toolmesh/server_registry.hpp"
#include "toolmesh/http_transport.hpp"
#include "toolmesh/utilities.hpp"
#include <string>
#include <map>
#include <mutex>
#include <optional>

namespace toolmesh {

/**
 * @brief Options for call_tool_auto()
 */
struct AutoCallOptions {
    std::optional<int> min_trust;
    std::optional<std::string> user_id;
    std::optional<std::string> api_key;
};

/**
 * @brief ToolRouter - Remote tool invocation
 */
class ToolRouter {
public:
    /**
     * @brief Construct router
     * @param config Federation configuration (copied)
     * @param registry Registry providing servers and trust bookkeeping
     * @param transport Outbound transport
     * @param clock Time source (defaults to wall clock)
     */
    ToolRouter(const FederationConfig& config, ServerRegistry& registry,
               HttpTransport& transport, Clock clock = nullptr);

    ~ToolRouter() = default;

    ToolRouter(const ToolRouter&) = delete;
    ToolRouter& operator=(const ToolRouter&) = delete;

    /**
     * @brief Invoke a tool on one server
     *
     * POST {endpoint}/tools/{tool} with the params as body. Success and
     * failure are recorded against the server's trust metrics; cache hits
     * are not.
     */
    ToolCallResponse call_tool(const ToolCallRequest& request);

    /**
     * @brief Invoke a tool on the most trusted server offering it
     *
     * Servers are tried in descending trust order until one succeeds.
     */
    ToolCallResponse call_tool_auto(const std::string& tool_name, const std::string& params_json,
                                    const AutoCallOptions& options = {});

    /**
     * @brief Set the value sent in X-Federation-Caller
     */
    void set_caller_id(const std::string& caller_id);

    size_t cache_size() const;
    void clear_cache();

private:
    struct CachedResult {
        std::string result_json;
        uint64_t stored_at = 0;
    };

    std::optional<std::string> lookup_cache(const std::string& key, uint64_t now);
    void store_cache(const std::string& key, const std::string& result_json, uint64_t now);

    FederationConfig config_;
    ServerRegistry& registry_;
    HttpTransport& transport_;
    Clock clock_;

    std::string caller_id_;
    mutable std::mutex caller_mutex_;

    std::map<std::string, CachedResult> result_cache_;
    mutable std::mutex cache_mutex_;
};

} // namespace toolmesh
