/**
 * @file federation_config.hpp
 * @brief Federation configuration and protocol constants
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include <optional>

namespace toolmesh {
namespace protocol {

// ============================================================================
// Limits
// ============================================================================

/// Maximum HTTP response accepted from a peer (10MB)
constexpr size_t MAX_RESPONSE_SIZE = 10 * 1024 * 1024;

/// Maximum JSON document accepted from a peer or config file (1MB)
constexpr size_t MAX_JSON_SIZE = 1024 * 1024;

/// Maximum server identifier length
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

// ============================================================================
// Trust and health
// ============================================================================

/// Servers not seen for longer than this are probed by the health loop
constexpr auto STALE_SERVER_THRESHOLD = std::chrono::minutes(5);

/// A server whose trust drops below this after a failed probe is evicted
constexpr int EVICTION_TRUST_THRESHOLD = 5;

/// Number of peers contacted per gossip round
constexpr size_t GOSSIP_FANOUT = 3;

/// Length of the random suffix in generated server IDs
constexpr size_t SERVER_ID_SUFFIX_LENGTH = 6;

// ============================================================================
// HTTP surface
// ============================================================================

constexpr const char* HEALTH_PATH = "/health";
constexpr const char* INFO_PATH = "/federation/info";
constexpr const char* GOSSIP_PATH = "/federation/gossip";
constexpr const char* MESSAGE_PATH = "/federation/message";
constexpr const char* TOOLS_PATH = "/tools/";

constexpr const char* NETWORK_HEADER = "X-Federation-Network";
constexpr const char* CALLER_HEADER = "X-Federation-Caller";

/**
 * @brief Validate identifier (alphanumeric plus _ - . :, not all dots)
 *
 * Valid identifiers are safe as a URL path segment and as a header value.
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

} // namespace protocol

/**
 * @brief Runtime configuration of a federation node
 *
 * Defaults match the public mainnet deployment.
 */
struct FederationConfig {
    // Network
    std::string network_id = "opensvm-mcp-mainnet";   ///< Unique network identifier
    std::vector<std::string> bootstrap_peers;         ///< Initial peer endpoints
    size_t max_peers = 100;                           ///< Peer table bound
    uint64_t gossip_interval_ms = 60000;              ///< 1 minute
    uint64_t health_check_interval_ms = 30000;        ///< 30 seconds

    // Discovery
    bool discovery_enabled = true;
    bool announce_enabled = false;
    std::optional<std::string> announce_endpoint;     ///< This node's endpoint for others

    // Trust
    int min_trust_score = 20;
    double trust_decay_rate = 0.99;                   ///< 1% decay per day
    int new_server_trust = 30;

    // Timeouts
    uint64_t request_timeout_ms = 30000;
    uint64_t connection_timeout_ms = 10000;

    // Caching
    uint64_t cache_server_list_ms = 300000;           ///< 5 minutes
    uint64_t cache_tool_results_ms = 60000;           ///< 1 minute

    // Inbound protection
    double inbound_rate_per_second = 10.0;
    double inbound_burst = 20.0;

    // Logging
    std::string log_file;
    std::string log_level = "info";

    /**
     * @brief Check ranges of all fields
     * @throws ValidationError describing the first invalid field
     */
    void validate() const;

    /**
     * @brief Serialize to JSON (camelCase keys)
     */
    std::string to_json() const;

    /**
     * @brief Parse JSON; absent keys keep their defaults
     * @param json JSON object text
     * @return Parsed config
     * @throws ValidationError on malformed JSON or wrongly typed fields
     */
    static FederationConfig from_json(const std::string& json);
};

/**
 * @brief Load configuration from a JSON file
 * @param path Path to JSON file
 * @return Parsed config
 * @throws ValidationError if the file cannot be read or parsed
 */
FederationConfig load_config(const std::string& path);

/**
 * @brief Apply TOOLMESH_* environment variable overrides
 *
 * Recognised: TOOLMESH_NETWORK_ID, TOOLMESH_BOOTSTRAP_PEERS (comma separated),
 * TOOLMESH_ANNOUNCE_ENDPOINT, TOOLMESH_LOG_LEVEL.
 */
void apply_env_overrides(FederationConfig& config);

} // namespace toolmesh
