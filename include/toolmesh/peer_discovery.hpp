/**
 * @file peer_discovery.hpp
 * @brief Bootstrap, gossip and announce for the federation peer network
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides HTTP-based peer discovery:
 * - Bootstrap from seed endpoints (GET /federation/info)
 * - Periodic gossip with up to three random peers (POST /federation/gossip)
 * - Announce newly registered servers (POST /federation/message)
 * - Rate-limited handling of inbound gossip and discovery messages
 *
 * Inbound messages are not authenticated; the signature field is ignored.
 */

#pragma once

#include "toolmesh/federation_types.hpp"
#include "toolmesh/federation_config.hpp"
#include "toolmesh/server_registry.hpp"
#include "toolmesh/http_transport.hpp"
#include "toolmesh/rate_limiter.hpp"
#include "toolmesh/utilities.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <random>
#include <optional>

namespace toolmesh {

/**
 * @brief PeerDiscovery - Decentralized server discovery
 *
 * The peer table is separate from the server registry: peers are gossip
 * partners, servers are tool providers. A node usually appears in both.
 */
class PeerDiscovery {
public:
    /**
     * @brief Construct PeerDiscovery
     * @param config Federation configuration (copied)
     * @param registry Registry that discovered servers are registered into
     * @param transport Outbound transport
     * @param clock Time source (defaults to wall clock)
     */
    PeerDiscovery(const FederationConfig& config, ServerRegistry& registry,
                  HttpTransport& transport, Clock clock = nullptr);

    ~PeerDiscovery() = default;

    // Disable copy and move
    PeerDiscovery(const PeerDiscovery&) = delete;
    PeerDiscovery& operator=(const PeerDiscovery&) = delete;
    PeerDiscovery(PeerDiscovery&&) = delete;
    PeerDiscovery& operator=(PeerDiscovery&&) = delete;

    // ========================================================================
    // Outbound discovery
    // ========================================================================

    /**
     * @brief Contact every configured bootstrap peer
     *
     * Each seed's server is registered if unknown and the seed is added to
     * the peer table. A failing seed is logged and skipped.
     *
     * @return Number of seeds added as peers
     */
    size_t bootstrap();

    /**
     * @brief Exchange server lists with up to GOSSIP_FANOUT random peers
     *
     * Does nothing when no peers are known.
     *
     * @return Number of successful exchanges
     */
    size_t gossip_round();

    /**
     * @brief Send our server list to a peer and discover unknown servers it returns
     * @return true if the peer answered with a valid list
     */
    bool exchange_server_list(const PeerInfo& peer);

    /**
     * @brief Fetch a server descriptor and register it if its ID is unknown
     * @return true if the server is now known
     */
    bool discover_server(const std::string& endpoint);

    /**
     * @brief GET {endpoint}/federation/info
     * @return Descriptor or std::nullopt on any failure
     */
    std::optional<FederatedServer> fetch_server_info(const std::string& endpoint);

    /**
     * @brief Broadcast an announce message for server to every peer
     * @return Number of peers that accepted it (0 if announcing is disabled)
     */
    size_t announce_server(const FederatedServer& server);

    /**
     * @brief POST a discovery message to every known peer
     * @return Number of peers that answered 2xx
     */
    size_t broadcast_message(const DiscoveryMessage& message);

    // ========================================================================
    // Inbound handling
    // ========================================================================

    /**
     * @brief Handle POST /federation/message
     *
     * announce registers the payload, ping is answered with pong, other
     * types are acknowledged without effect.
     */
    DiscoveryAck handle_message(const DiscoveryMessage& message);

    /**
     * @brief Handle POST /federation/gossip
     * @return Our server summaries, or std::nullopt if the sender is rate limited
     */
    std::optional<GossipReply> handle_gossip(const GossipExchange& exchange);

    // ========================================================================
    // Peer table
    // ========================================================================

    /**
     * @brief Add or refresh a peer
     * @return false if the table is full or the peer is this node
     */
    bool add_peer(const PeerInfo& peer);

    std::optional<PeerInfo> get_peer(const std::string& server_id) const;
    std::vector<PeerInfo> get_peers() const;
    size_t peer_count() const;
    bool remove_peer(const std::string& server_id);

    void set_local_server_id(const std::string& server_id);
    std::string local_server_id() const;

    // ========================================================================
    // Statistics
    // ========================================================================

    uint64_t get_messages_sent() const;
    uint64_t get_messages_received() const;

private:
    void touch_peer(const std::string& server_id);

    std::chrono::milliseconds connection_timeout() const {
        return std::chrono::milliseconds(config_.connection_timeout_ms);
    }

    FederationConfig config_;
    ServerRegistry& registry_;
    HttpTransport& transport_;
    Clock clock_;

    RateLimiter rate_limiter_;

    std::map<std::string, PeerInfo> peers_;
    std::string local_server_id_;
    std::mt19937 rng_;
    mutable std::mutex peers_mutex_;

    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> messages_received_{0};
};

} // namespace toolmesh
