/**
 * @file peer_discovery.cpp
 * @brief Implementation of bootstrap, gossip and announce
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/peer_discovery.hpp"
#include "toolmesh/errors.hpp"
#include <algorithm>

namespace toolmesh {

// ============================================================================
// Constructor
// ============================================================================

PeerDiscovery::PeerDiscovery(const FederationConfig& config, ServerRegistry& registry,
                             HttpTransport& transport, Clock clock)
    : config_(config)
    , registry_(registry)
    , transport_(transport)
    , clock_(clock ? std::move(clock) : Clock(utilities::current_time_ms))
    , rate_limiter_(config.inbound_rate_per_second, config.inbound_burst, clock_)
    , rng_(std::random_device{}())
{
}

// ============================================================================
// Outbound discovery
// ============================================================================

size_t PeerDiscovery::bootstrap() {
    size_t added = 0;

    for (const auto& seed : config_.bootstrap_peers) {
        try {
            if (!discover_server(seed)) {
                utilities::log_warn("Discovery: bootstrap peer " + seed + " could not be registered");
            }

            auto info = fetch_server_info(seed);
            if (!info) {
                utilities::log_warn("Discovery: bootstrap peer " + seed + " is unavailable");
                continue;
            }

            PeerInfo peer;
            peer.server_id = info->id.empty() ? seed : info->id;
            peer.endpoint = seed;
            peer.last_contact = clock_();
            peer.trust_score = info->trust_score;

            if (add_peer(peer)) {
                added++;
            }

        } catch (const std::exception& e) {
            utilities::log_error("Discovery: bootstrap from " + seed + " failed: " + e.what());
        }
    }

    utilities::log_info("Discovery: bootstrap complete, " + std::to_string(added) + " of " +
                        std::to_string(config_.bootstrap_peers.size()) + " peers reachable");
    return added;
}

size_t PeerDiscovery::gossip_round() {
    std::vector<PeerInfo> selected;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        for (const auto& entry : peers_) {
            selected.push_back(entry.second);
        }
        std::shuffle(selected.begin(), selected.end(), rng_);
    }

    if (selected.empty()) {
        utilities::log_debug("Discovery: no peers to gossip with");
        return 0;
    }

    if (selected.size() > protocol::GOSSIP_FANOUT) {
        selected.resize(protocol::GOSSIP_FANOUT);
    }

    size_t exchanged = 0;
    for (const auto& peer : selected) {
        if (exchange_server_list(peer)) {
            exchanged++;
        }
    }

    rate_limiter_.cleanup_inactive();

    utilities::log_debug("Discovery: gossip round exchanged with " + std::to_string(exchanged) +
                         " of " + std::to_string(selected.size()) + " peers");
    return exchanged;
}

bool PeerDiscovery::exchange_server_list(const PeerInfo& peer) {
    GossipExchange exchange;
    exchange.sender_id = local_server_id();
    for (const auto& server : registry_.get_all_servers()) {
        exchange.servers.push_back(ServerSummary::from_server(server));
    }

    HttpRequest request;
    request.method = "POST";
    request.url = join_url(peer.endpoint, protocol::GOSSIP_PATH);
    request.headers["Content-Type"] = "application/json";
    request.headers[protocol::NETWORK_HEADER] = config_.network_id;
    request.body = exchange.to_json();

    messages_sent_++;
    HttpResponse response = transport_.send(request, connection_timeout());
    if (!response.ok()) {
        utilities::log_debug("Discovery: gossip with " + peer.endpoint + " failed: " +
                             response.describe_failure());
        return false;
    }

    if (response.body.size() > protocol::MAX_JSON_SIZE) {
        utilities::log_warn("Discovery: oversized gossip reply from " + peer.endpoint);
        return false;
    }

    auto reply = GossipReply::from_json(response.body);
    if (!reply) {
        utilities::log_warn("Discovery: malformed gossip reply from " + peer.endpoint);
        return false;
    }

    size_t discovered = 0;
    for (const auto& summary : reply->servers) {
        if (summary.id.empty() || summary.endpoint.empty() || registry_.contains(summary.id)) {
            continue;
        }
        if (discover_server(summary.endpoint)) {
            discovered++;
        }
    }

    touch_peer(peer.server_id);

    if (discovered > 0) {
        utilities::log_info("Discovery: learned " + std::to_string(discovered) +
                            " servers from " + peer.endpoint);
    }
    return true;
}

std::optional<FederatedServer> PeerDiscovery::fetch_server_info(const std::string& endpoint) {
    HttpRequest request;
    request.method = "GET";
    request.url = join_url(endpoint, protocol::INFO_PATH);
    request.headers[protocol::NETWORK_HEADER] = config_.network_id;

    messages_sent_++;
    HttpResponse response = transport_.send(request, connection_timeout());
    if (!response.ok()) {
        utilities::log_debug("Discovery: info request to " + endpoint + " failed: " +
                             response.describe_failure());
        return std::nullopt;
    }

    if (response.body.size() > protocol::MAX_JSON_SIZE) {
        utilities::log_warn("Discovery: oversized server info from " + endpoint);
        return std::nullopt;
    }

    auto server = FederatedServer::from_json(response.body);
    if (!server) {
        utilities::log_warn("Discovery: malformed server info from " + endpoint);
        return std::nullopt;
    }

    if (server->endpoint.empty()) {
        server->endpoint = endpoint;
    }
    return server;
}

bool PeerDiscovery::discover_server(const std::string& endpoint) {
    auto info = fetch_server_info(endpoint);
    if (!info) {
        return false;
    }

    if (!info->id.empty() && registry_.contains(info->id)) {
        return true;
    }

    try {
        auto result = registry_.register_server(*info);
        utilities::log_info("Discovery: discovered server " + result.server_id + " at " + endpoint);
        return true;

    } catch (const FederationError& e) {
        utilities::log_warn("Discovery: could not register server at " + endpoint + ": " + e.what());
        return false;
    }
}

size_t PeerDiscovery::announce_server(const FederatedServer& server) {
    if (!config_.announce_enabled) {
        return 0;
    }

    DiscoveryMessage message;
    message.type = DiscoveryMessageType::ANNOUNCE;
    message.sender_id = server.id;
    message.timestamp = clock_();
    message.payload_json = server.to_json();

    size_t delivered = broadcast_message(message);
    utilities::log_info("Discovery: announced " + server.id + " to " +
                        std::to_string(delivered) + " peers");
    return delivered;
}

size_t PeerDiscovery::broadcast_message(const DiscoveryMessage& message) {
    std::string body = message.to_json();
    size_t delivered = 0;

    for (const auto& peer : get_peers()) {
        HttpRequest request;
        request.method = "POST";
        request.url = join_url(peer.endpoint, protocol::MESSAGE_PATH);
        request.headers["Content-Type"] = "application/json";
        request.headers[protocol::NETWORK_HEADER] = config_.network_id;
        request.body = body;

        messages_sent_++;
        HttpResponse response = transport_.send(request, connection_timeout());
        if (response.ok()) {
            delivered++;
        } else {
            utilities::log_debug("Discovery: message to " + peer.endpoint + " failed: " +
                                 response.describe_failure());
        }
    }

    return delivered;
}

// ============================================================================
// Inbound handling
// ============================================================================

DiscoveryAck PeerDiscovery::handle_message(const DiscoveryMessage& message) {
    DiscoveryAck ack;

    std::string sender = message.sender_id.empty() ? "anonymous" : message.sender_id;
    if (!rate_limiter_.allow(sender)) {
        utilities::log_warn("Discovery: rate limit exceeded for " + sender);
        ack.error = "Rate limit exceeded";
        return ack;
    }

    messages_received_++;
    ack.received = true;

    switch (message.type) {
        case DiscoveryMessageType::ANNOUNCE: {
            auto server = FederatedServer::from_json(message.payload_json);
            if (!server) {
                ack.error = "Invalid announce payload";
                return ack;
            }

            try {
                registry_.register_server(*server);
                ack.accepted = true;
            } catch (const FederationError& e) {
                utilities::log_warn("Discovery: announce from " + sender + " rejected: " + e.what());
                ack.error = e.what();
            }
            break;
        }

        case DiscoveryMessageType::PING: {
            DiscoveryMessage pong;
            pong.type = DiscoveryMessageType::PONG;
            pong.sender_id = local_server_id();
            pong.timestamp = clock_();
            ack.reply = pong;
            ack.accepted = true;
            break;
        }

        default:
            utilities::log_debug("Discovery: ignoring " +
                                 MessageHelpers::message_type_to_string(message.type) +
                                 " from " + sender);
            break;
    }

    return ack;
}

std::optional<GossipReply> PeerDiscovery::handle_gossip(const GossipExchange& exchange) {
    std::string sender = exchange.sender_id.empty() ? "anonymous" : exchange.sender_id;
    if (!rate_limiter_.allow(sender)) {
        utilities::log_warn("Discovery: gossip rate limit exceeded for " + sender);
        return std::nullopt;
    }

    messages_received_++;

    GossipReply reply;
    for (const auto& server : registry_.list_servers()) {
        reply.servers.push_back(ServerSummary::from_server(server));
    }
    return reply;
}

// ============================================================================
// Peer table
// ============================================================================

bool PeerDiscovery::add_peer(const PeerInfo& peer) {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    if (peer.server_id.empty() || peer.server_id == local_server_id_) {
        return false;
    }

    auto it = peers_.find(peer.server_id);
    if (it != peers_.end()) {
        it->second = peer;
        return true;
    }

    if (peers_.size() >= config_.max_peers) {
        utilities::log_debug("Discovery: peer table full, dropping " + peer.server_id);
        return false;
    }

    peers_.emplace(peer.server_id, peer);
    return true;
}

std::optional<PeerInfo> PeerDiscovery::get_peer(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    auto it = peers_.find(server_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerInfo> PeerDiscovery::get_peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    std::vector<PeerInfo> peers;
    peers.reserve(peers_.size());
    for (const auto& entry : peers_) {
        peers.push_back(entry.second);
    }
    return peers;
}

size_t PeerDiscovery::peer_count() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_.size();
}

bool PeerDiscovery::remove_peer(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_.erase(server_id) > 0;
}

void PeerDiscovery::touch_peer(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    auto it = peers_.find(server_id);
    if (it != peers_.end()) {
        it->second.last_contact = clock_();
    }
}

void PeerDiscovery::set_local_server_id(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    local_server_id_ = server_id;
}

std::string PeerDiscovery::local_server_id() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return local_server_id_;
}

uint64_t PeerDiscovery::get_messages_sent() const {
    return messages_sent_.load();
}

uint64_t PeerDiscovery::get_messages_received() const {
    return messages_received_.load();
}

} // namespace toolmesh
