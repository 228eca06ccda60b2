/**
 * @file federation_config.cpp
 * @brief Implementation of federation configuration loading and validation
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/federation_config.hpp"
#include "toolmesh/errors.hpp"
#include "toolmesh/utilities.hpp"
#include <nlohmann/json.hpp>
#include <cctype>

using json = nlohmann::json;

namespace toolmesh {

// ============================================================================
// Identifier validation
// ============================================================================

namespace protocol {

bool validate_identifier(const std::string& identifier, size_t max_length) {
    // Check length
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Validate characters: alphanumeric plus _ - . :
    bool only_dots = true;
    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.' && c != ':') {
            return false;
        }
        if (c != '.') {
            only_dots = false;
        }
    }

    // "." and ".." would be resolved away as path segments
    return !only_dots;
}

} // namespace protocol

// ============================================================================
// Validation
// ============================================================================

void FederationConfig::validate() const {
    if (network_id.empty()) {
        throw ValidationError("networkId must not be empty");
    }
    if (max_peers == 0) {
        throw ValidationError("maxPeers must be positive");
    }
    if (gossip_interval_ms == 0 || health_check_interval_ms == 0) {
        throw ValidationError("gossip and health check intervals must be positive");
    }
    if (request_timeout_ms == 0 || connection_timeout_ms == 0) {
        throw ValidationError("timeouts must be positive");
    }
    if (min_trust_score < 0 || min_trust_score > 100) {
        throw ValidationError("minTrustScore must be within [0, 100]");
    }
    if (new_server_trust < 0 || new_server_trust > 100) {
        throw ValidationError("newServerTrust must be within [0, 100]");
    }
    if (!(trust_decay_rate > 0.0 && trust_decay_rate <= 1.0)) {
        throw ValidationError("trustDecayRate must be within (0, 1]");
    }
    if (inbound_rate_per_second <= 0.0 || inbound_burst < 1.0) {
        throw ValidationError("inbound rate limit must be positive with burst >= 1");
    }
    if (!utilities::parse_log_level(log_level)) {
        throw ValidationError("unknown logLevel: " + log_level);
    }
}

// ============================================================================
// Serialization
// ============================================================================

std::string FederationConfig::to_json() const {
    json j;
    j["networkId"] = network_id;
    j["bootstrapPeers"] = bootstrap_peers;
    j["maxPeers"] = max_peers;
    j["gossipIntervalMs"] = gossip_interval_ms;
    j["healthCheckIntervalMs"] = health_check_interval_ms;
    j["discoveryEnabled"] = discovery_enabled;
    j["announceEnabled"] = announce_enabled;
    if (announce_endpoint) {
        j["announceEndpoint"] = *announce_endpoint;
    }
    j["minTrustScore"] = min_trust_score;
    j["trustDecayRate"] = trust_decay_rate;
    j["newServerTrust"] = new_server_trust;
    j["requestTimeoutMs"] = request_timeout_ms;
    j["connectionTimeoutMs"] = connection_timeout_ms;
    j["cacheServerListMs"] = cache_server_list_ms;
    j["cacheToolResultsMs"] = cache_tool_results_ms;
    j["inboundRatePerSecond"] = inbound_rate_per_second;
    j["inboundBurst"] = inbound_burst;
    j["logFile"] = log_file;
    j["logLevel"] = log_level;

    return j.dump(2);
}

FederationConfig FederationConfig::from_json(const std::string& json_str) {
    if (json_str.size() > protocol::MAX_JSON_SIZE) {
        throw ValidationError("configuration document too large");
    }

    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            throw ValidationError("configuration must be a JSON object");
        }

        FederationConfig config;
        config.network_id = j.value("networkId", config.network_id);
        config.bootstrap_peers = j.value("bootstrapPeers", config.bootstrap_peers);
        config.max_peers = j.value("maxPeers", config.max_peers);
        config.gossip_interval_ms = j.value("gossipIntervalMs", config.gossip_interval_ms);
        config.health_check_interval_ms = j.value("healthCheckIntervalMs", config.health_check_interval_ms);
        config.discovery_enabled = j.value("discoveryEnabled", config.discovery_enabled);
        config.announce_enabled = j.value("announceEnabled", config.announce_enabled);
        if (j.contains("announceEndpoint") && j["announceEndpoint"].is_string()) {
            config.announce_endpoint = j["announceEndpoint"].get<std::string>();
        }
        config.min_trust_score = j.value("minTrustScore", config.min_trust_score);
        config.trust_decay_rate = j.value("trustDecayRate", config.trust_decay_rate);
        config.new_server_trust = j.value("newServerTrust", config.new_server_trust);
        config.request_timeout_ms = j.value("requestTimeoutMs", config.request_timeout_ms);
        config.connection_timeout_ms = j.value("connectionTimeoutMs", config.connection_timeout_ms);
        config.cache_server_list_ms = j.value("cacheServerListMs", config.cache_server_list_ms);
        config.cache_tool_results_ms = j.value("cacheToolResultsMs", config.cache_tool_results_ms);
        config.inbound_rate_per_second = j.value("inboundRatePerSecond", config.inbound_rate_per_second);
        config.inbound_burst = j.value("inboundBurst", config.inbound_burst);
        config.log_file = j.value("logFile", config.log_file);
        config.log_level = j.value("logLevel", config.log_level);

        return config;

    } catch (const json::exception& e) {
        throw ValidationError("invalid configuration: " + std::string(e.what()));
    }
}

FederationConfig load_config(const std::string& path) {
    auto content = utilities::read_file(path);
    if (!content) {
        throw ValidationError("cannot read configuration file: " + path);
    }

    return FederationConfig::from_json(*content);
}

// ============================================================================
// Environment overrides
// ============================================================================

void apply_env_overrides(FederationConfig& config) {
    std::string network_id = utilities::get_env("TOOLMESH_NETWORK_ID");
    if (!network_id.empty()) {
        config.network_id = network_id;
    }

    std::string peers = utilities::get_env("TOOLMESH_BOOTSTRAP_PEERS");
    if (!peers.empty()) {
        config.bootstrap_peers = utilities::split_list(peers, ',');
    }

    std::string announce = utilities::get_env("TOOLMESH_ANNOUNCE_ENDPOINT");
    if (!announce.empty()) {
        config.announce_endpoint = announce;
    }

    std::string level = utilities::get_env("TOOLMESH_LOG_LEVEL");
    if (!level.empty()) {
        config.log_level = level;
    }
}

} // namespace toolmesh
