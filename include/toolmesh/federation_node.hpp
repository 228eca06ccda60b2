/**
 * @file federation_node.hpp
 * @brief High-level federation node combining all components
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * FederationNode owns:
 * - Configuration and outbound transport
 * - ServerRegistry, ToolRouter, PeerDiscovery and HealthMonitor
 * - Gossip and health timers on a single-threaded io_context
 *
 * Its public methods are the operations a gateway exposes to callers
 * and to other nodes.
 */

#pragma once

#include "toolmesh/federation_config.hpp"
#include "toolmesh/federation_types.hpp"
#include "toolmesh/http_transport.hpp"
#include "toolmesh/server_registry.hpp"
#include "toolmesh/tool_router.hpp"
#include "toolmesh/peer_discovery.hpp"
#include "toolmesh/health_monitor.hpp"
#include "toolmesh/utilities.hpp"
#include <asio.hpp>
#include <string>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <optional>

namespace toolmesh {

/**
 * @brief FederationNode - Composition root of a federation member
 *
 * Usage:
 * @code
 *   FederationNode node(load_config("federation.json"));
 *   node.start(my_server);
 *   auto result = node.call_tool_auto("get_balance", R"({"address":"..."})");
 *   node.stop();
 * @endcode
 */
class FederationNode {
public:
    /**
     * @brief Construct node
     * @param config Federation configuration
     * @param transport Outbound transport (AsioHttpTransport if null)
     * @param clock Time source (defaults to wall clock)
     * @throws ValidationError if config is invalid
     */
    explicit FederationNode(
        const FederationConfig& config,
        std::shared_ptr<HttpTransport> transport = nullptr,
        Clock clock = nullptr
    );

    /**
     * @brief Destructor - stops the node if running
     */
    ~FederationNode();

    // Disable copy and move
    FederationNode(const FederationNode&) = delete;
    FederationNode& operator=(const FederationNode&) = delete;
    FederationNode(FederationNode&&) = delete;
    FederationNode& operator=(FederationNode&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the node
     *
     * 1. Bootstrap from configured peers (blocking)
     * 2. Start gossip timer if discovery is enabled
     * 3. Start health timer
     * 4. Announce this_server if announcing is enabled
     *
     * @param this_server This node's own server descriptor, if it serves tools
     * @return true if started, false if already running or startup failed
     */
    bool start(const std::optional<FederatedServer>& this_server = std::nullopt);

    /**
     * @brief Cancel timers and join the worker thread
     *
     * An in-flight gossip or health round completes first.
     */
    void stop();

    bool is_running() const;

    // ========================================================================
    // Gateway operations
    // ========================================================================

    RegistrationResult register_server(FederatedServer server);
    std::optional<FederatedServer> get_server(const std::string& server_id) const;
    std::vector<FederatedServer> list_servers(const ListOptions& options = {});
    std::vector<ToolMatch> search_tools(const std::string& query, const SearchOptions& options = {});

    ToolCallResponse call_tool(const ToolCallRequest& request);
    ToolCallResponse call_tool_auto(const std::string& tool_name, const std::string& params_json,
                                    const AutoCallOptions& options = {});

    bool report_server(const std::string& server_id, const std::string& reason,
                       const std::optional<std::string>& reporter = std::nullopt);
    bool verify_owner(const std::string& server_id, const std::string& signature);
    std::optional<TrustMetrics> get_trust_metrics(const std::string& server_id) const;

    /**
     * @brief Network statistics including peer count
     */
    NetworkStats get_stats() const;

    /**
     * @brief This node's own descriptor (GET /federation/info)
     */
    std::optional<FederatedServer> info() const;

    /// POST /federation/gossip
    std::optional<GossipReply> handle_gossip(const GossipExchange& exchange);

    /// POST /federation/message
    DiscoveryAck handle_message(const DiscoveryMessage& message);

    // ========================================================================
    // Components
    // ========================================================================

    const FederationConfig& config() const { return config_; }
    ServerRegistry& registry() { return *registry_; }
    ToolRouter& router() { return *router_; }
    PeerDiscovery& discovery() { return *discovery_; }
    HealthMonitor& health_monitor() { return *health_monitor_; }

private:
    void schedule_gossip();
    void schedule_health();

    FederationConfig config_;
    Clock clock_;
    std::shared_ptr<HttpTransport> transport_;

    std::unique_ptr<ServerRegistry> registry_;
    std::unique_ptr<ToolRouter> router_;
    std::unique_ptr<PeerDiscovery> discovery_;
    std::unique_ptr<HealthMonitor> health_monitor_;

    std::optional<FederatedServer> this_server_;
    mutable std::mutex this_server_mutex_;

    std::atomic<bool> running_;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    asio::steady_timer gossip_timer_;
    asio::steady_timer health_timer_;
    std::thread worker_thread_;
};

} // namespace toolmesh
