/**
 * @file federation_types.hpp
 * @brief Federation data model and JSON wire serialization
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * All records exchanged with peers and gateway callers:
 * - Server descriptors and their tools
 * - Trust metrics and peer records
 * - Discovery and gossip messages
 * - Tool call requests and responses
 *
 * Arbitrary JSON values (tool input schemas, call parameters, results,
 * message payloads) are carried as serialized JSON text.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace toolmesh {

/**
 * @brief Per-call pricing declared by a tool, in micro units
 */
struct ToolPricing {
    uint64_t base_cost_micro = 0;
    std::optional<uint64_t> per_call_cost;
};

/**
 * @brief Rate limit a tool advertises to callers
 */
struct ToolRateLimit {
    uint32_t requests_per_minute = 0;
    uint32_t requests_per_day = 0;
};

/**
 * @brief A named, schema-described capability exposed by a server
 */
struct FederatedTool {
    std::string name;
    std::string description;
    std::string input_schema_json = "{}";   ///< JSON schema of the parameters
    std::string category;
    std::optional<ToolPricing> pricing;
    std::optional<ToolRateLimit> rate_limit;
};

/**
 * @brief Protocol features a server supports
 */
struct ServerCapabilities {
    bool streaming = false;
    bool batching = false;
    bool webhooks = false;
    bool custom_auth = false;
    uint32_t max_concurrent_requests = 1;
    std::vector<std::string> supported_auth_methods;
};

/**
 * @brief Descriptive and commercial metadata of a server
 */
struct ServerMetadata {
    std::string version;
    std::optional<std::string> region;
    std::vector<std::string> tags;
    std::optional<std::string> website;
    std::optional<std::string> documentation;
    std::optional<std::string> support_contact;
    double revenue_share_percent = 70.0;    ///< 0-100, developer share
    int min_trust_required = 0;             ///< Minimum trust to use this server
};

/**
 * @brief Identity and capability record of a federated server
 */
struct FederatedServer {
    std::string id;
    std::string name;
    std::string description;
    std::string endpoint;                   ///< Base URL
    std::string protocol_version;           ///< "mcpVersion" on the wire
    std::string owner;                      ///< Owner identity (wallet address)
    std::vector<FederatedTool> tools;
    ServerCapabilities capabilities;
    int trust_score = 0;                    ///< 0-100, derived from TrustMetrics
    uint64_t registered_at = 0;             ///< Epoch milliseconds
    uint64_t last_seen_at = 0;              ///< Epoch milliseconds
    ServerMetadata metadata;

    /**
     * @brief Find a tool by exact name
     * @return Pointer into tools, or nullptr
     */
    const FederatedTool* find_tool(const std::string& tool_name) const;

    std::string to_json() const;
    static std::optional<FederatedServer> from_json(const std::string& json);
};

/**
 * @brief Observed behavior of a server, input to TrustCalculator
 */
struct TrustMetrics {
    double uptime = 100.0;                  ///< 0-100 percentage
    double avg_response_time_ms = 0.0;
    double success_rate = 100.0;            ///< 0-100 percentage
    uint64_t total_requests = 0;
    uint64_t total_errors = 0;
    double quality_score = 50.0;            ///< 0-100
    uint32_t report_count = 0;              ///< Abuse reports
    bool verified_owner = false;
    bool audited_code = false;

    std::string to_json() const;
    static std::optional<TrustMetrics> from_json(const std::string& json);
};

/**
 * @brief Gossip partner known through bootstrap or gossip
 */
struct PeerInfo {
    std::string server_id;
    std::string endpoint;
    uint64_t last_contact = 0;              ///< Epoch milliseconds
    int trust_score = 0;
};

/**
 * @brief Reduced server record exchanged during gossip
 */
struct ServerSummary {
    std::string id;
    std::string name;
    std::string endpoint;
    int trust_score = 0;
    uint64_t last_seen_at = 0;

    static ServerSummary from_server(const FederatedServer& server);
};

/**
 * @brief Body of POST /federation/gossip
 */
struct GossipExchange {
    std::string type = "exchange";
    std::string sender_id;
    std::vector<ServerSummary> servers;

    std::string to_json() const;
    static std::optional<GossipExchange> from_json(const std::string& json);
};

/**
 * @brief Reply to POST /federation/gossip
 */
struct GossipReply {
    std::vector<ServerSummary> servers;

    std::string to_json() const;
    static std::optional<GossipReply> from_json(const std::string& json);
};

/**
 * @brief Discovery message types
 */
enum class DiscoveryMessageType {
    ANNOUNCE,   ///< Sender publishes a server descriptor
    QUERY,      ///< Sender asks for servers
    RESPONSE,   ///< Answer to a query
    PING,       ///< Connectivity check
    PONG        ///< Ping reply
};

/**
 * @brief Body of POST /federation/message
 *
 * The signature field is carried but never verified.
 */
struct DiscoveryMessage {
    DiscoveryMessageType type = DiscoveryMessageType::PING;
    std::string sender_id;
    uint64_t timestamp = 0;                 ///< Epoch milliseconds
    std::string payload_json = "null";
    std::optional<std::string> signature;

    std::string to_json() const;
    static std::optional<DiscoveryMessage> from_json(const std::string& json);
};

/**
 * @brief Outcome of handling an inbound discovery message
 */
struct DiscoveryAck {
    bool received = false;                  ///< Message was admitted
    bool accepted = false;                  ///< Message had the intended effect
    std::string error;
    std::optional<DiscoveryMessage> reply;  ///< e.g. pong for ping

    std::string to_json() const;
};

/**
 * @brief Tool invocation routed to one server
 */
struct ToolCallRequest {
    std::string server_id;
    std::string tool;
    std::string params_json = "{}";
    std::optional<std::string> user_id;
    std::optional<std::string> api_key;
};

/**
 * @brief Result of a tool invocation
 */
struct ToolCallResponse {
    bool success = false;
    std::optional<std::string> result_json;
    std::optional<std::string> error;
    std::string server_id;
    std::string tool;
    uint64_t duration_ms = 0;
    bool from_cache = false;
    std::optional<uint64_t> cost;           ///< Micro units, never charged here

    std::string to_json() const;
};

/**
 * @brief Registration outcome
 */
struct RegistrationResult {
    bool success = false;
    std::string server_id;
};

/**
 * @brief Network-wide statistics
 */
struct NetworkStats {
    size_t total_servers = 0;
    size_t total_tools = 0;
    size_t total_peers = 0;
    int average_trust = 0;
    std::string network_id;

    std::string to_json() const;
};

/**
 * @brief Helper functions for message handling
 */
class MessageHelpers {
public:
    static std::string message_type_to_string(DiscoveryMessageType type);
    static std::optional<DiscoveryMessageType> string_to_message_type(const std::string& str);

    /**
     * @brief Re-serialize a JSON document in canonical compact form
     * @param json JSON text (empty is treated as an empty object)
     * @return Canonical text or std::nullopt if unparsable
     */
    static std::optional<std::string> canonical_json(const std::string& json);
};

} // namespace toolmesh
