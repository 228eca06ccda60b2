/**
 * @file federation_types.cpp
 * @brief Implementation of federation data model serialization
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/federation_types.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

using json = nlohmann::json;

namespace toolmesh {

namespace {

// ============================================================================
// JSON field helpers
// ============================================================================

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// Counters and timestamps arrive as numbers; prices may arrive as decimal strings
uint64_t read_u64(const json& j, const char* key, uint64_t default_value = 0) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return default_value;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer()) {
        int64_t value = it->get<int64_t>();
        return value < 0 ? 0 : static_cast<uint64_t>(value);
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        return value < 0.0 ? 0 : static_cast<uint64_t>(value);
    }
    if (it->is_string()) {
        std::string text = it->get<std::string>();
        if (!text.empty() && text.back() == 'n') {
            text.pop_back();
        }
        try {
            return std::stoull(text);
        } catch (const std::exception&) {
            return default_value;
        }
    }
    return default_value;
}

int read_score(const json& j, const char* key, int default_value = 0) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return default_value;
    }
    return static_cast<int>(std::lround(it->get<double>()));
}

json parse_embedded(const std::string& text, json fallback) {
    if (text.empty()) {
        return fallback;
    }
    try {
        return json::parse(text);
    } catch (const json::exception&) {
        return fallback;
    }
}

// ============================================================================
// Tool
// ============================================================================

json tool_to_json(const FederatedTool& tool) {
    json j;
    j["name"] = tool.name;
    j["description"] = tool.description;
    j["inputSchema"] = parse_embedded(tool.input_schema_json, json::object());
    j["category"] = tool.category;

    if (tool.pricing) {
        json pricing;
        pricing["baseCostMicro"] = tool.pricing->base_cost_micro;
        if (tool.pricing->per_call_cost) {
            pricing["perCallCost"] = *tool.pricing->per_call_cost;
        }
        j["pricing"] = pricing;
    }

    if (tool.rate_limit) {
        j["rateLimit"] = {
            {"requestsPerMinute", tool.rate_limit->requests_per_minute},
            {"requestsPerDay", tool.rate_limit->requests_per_day}
        };
    }

    return j;
}

FederatedTool tool_from_json(const json& j) {
    FederatedTool tool;
    tool.name = j.value("name", "");
    tool.description = j.value("description", "");
    tool.category = j.value("category", "");

    auto schema = j.find("inputSchema");
    tool.input_schema_json = (schema != j.end() && !schema->is_null()) ? schema->dump() : "{}";

    auto pricing = j.find("pricing");
    if (pricing != j.end() && pricing->is_object()) {
        ToolPricing p;
        p.base_cost_micro = read_u64(*pricing, "baseCostMicro");
        if (pricing->contains("perCallCost")) {
            p.per_call_cost = read_u64(*pricing, "perCallCost");
        }
        tool.pricing = p;
    }

    auto rate_limit = j.find("rateLimit");
    if (rate_limit != j.end() && rate_limit->is_object()) {
        ToolRateLimit r;
        r.requests_per_minute = static_cast<uint32_t>(read_u64(*rate_limit, "requestsPerMinute"));
        r.requests_per_day = static_cast<uint32_t>(read_u64(*rate_limit, "requestsPerDay"));
        tool.rate_limit = r;
    }

    return tool;
}

// ============================================================================
// Server
// ============================================================================

json server_to_json(const FederatedServer& server) {
    json j;
    j["id"] = server.id;
    j["name"] = server.name;
    j["description"] = server.description;
    j["endpoint"] = server.endpoint;
    j["mcpVersion"] = server.protocol_version;
    j["owner"] = server.owner;

    json tools = json::array();
    for (const auto& tool : server.tools) {
        tools.push_back(tool_to_json(tool));
    }
    j["tools"] = tools;

    const auto& caps = server.capabilities;
    j["capabilities"] = {
        {"streaming", caps.streaming},
        {"batching", caps.batching},
        {"webhooks", caps.webhooks},
        {"customAuth", caps.custom_auth},
        {"maxConcurrentRequests", caps.max_concurrent_requests},
        {"supportedAuthMethods", caps.supported_auth_methods}
    };

    j["trustScore"] = server.trust_score;
    j["registeredAt"] = server.registered_at;
    j["lastSeenAt"] = server.last_seen_at;

    const auto& meta = server.metadata;
    json metadata;
    metadata["version"] = meta.version;
    metadata["tags"] = meta.tags;
    metadata["revenueSharePercent"] = meta.revenue_share_percent;
    metadata["minTrustRequired"] = meta.min_trust_required;
    if (meta.region) metadata["region"] = *meta.region;
    if (meta.website) metadata["website"] = *meta.website;
    if (meta.documentation) metadata["documentation"] = *meta.documentation;
    if (meta.support_contact) metadata["supportContact"] = *meta.support_contact;
    j["metadata"] = metadata;

    return j;
}

FederatedServer server_from_json(const json& j) {
    FederatedServer server;
    server.id = j.value("id", "");
    server.name = j.value("name", "");
    server.description = j.value("description", "");
    server.endpoint = j.value("endpoint", "");
    server.protocol_version = j.value("mcpVersion", "");
    server.owner = j.value("owner", "");

    auto tools = j.find("tools");
    if (tools != j.end() && tools->is_array()) {
        for (const auto& tool : *tools) {
            if (tool.is_object()) {
                server.tools.push_back(tool_from_json(tool));
            }
        }
    }

    auto caps = j.find("capabilities");
    if (caps != j.end() && caps->is_object()) {
        server.capabilities.streaming = caps->value("streaming", false);
        server.capabilities.batching = caps->value("batching", false);
        server.capabilities.webhooks = caps->value("webhooks", false);
        server.capabilities.custom_auth = caps->value("customAuth", false);
        server.capabilities.max_concurrent_requests =
            static_cast<uint32_t>(read_u64(*caps, "maxConcurrentRequests", 1));
        server.capabilities.supported_auth_methods =
            caps->value("supportedAuthMethods", std::vector<std::string>{});
    }

    server.trust_score = read_score(j, "trustScore");
    server.registered_at = read_u64(j, "registeredAt");
    server.last_seen_at = read_u64(j, "lastSeenAt");

    auto meta = j.find("metadata");
    if (meta != j.end() && meta->is_object()) {
        server.metadata.version = meta->value("version", "");
        server.metadata.tags = meta->value("tags", std::vector<std::string>{});
        server.metadata.revenue_share_percent = meta->value("revenueSharePercent", 70.0);
        server.metadata.min_trust_required = read_score(*meta, "minTrustRequired");
        server.metadata.region = optional_string(*meta, "region");
        server.metadata.website = optional_string(*meta, "website");
        server.metadata.documentation = optional_string(*meta, "documentation");
        server.metadata.support_contact = optional_string(*meta, "supportContact");
    }

    return server;
}

json summary_to_json(const ServerSummary& summary) {
    return {
        {"id", summary.id},
        {"name", summary.name},
        {"endpoint", summary.endpoint},
        {"trustScore", summary.trust_score},
        {"lastSeenAt", summary.last_seen_at}
    };
}

std::vector<ServerSummary> summaries_from_json(const json& j) {
    std::vector<ServerSummary> servers;

    auto list = j.find("servers");
    if (list == j.end() || !list->is_array()) {
        return servers;
    }

    for (const auto& entry : *list) {
        if (!entry.is_object()) {
            continue;
        }
        ServerSummary summary;
        summary.id = entry.value("id", "");
        summary.name = entry.value("name", "");
        summary.endpoint = entry.value("endpoint", "");
        summary.trust_score = read_score(entry, "trustScore");
        summary.last_seen_at = read_u64(entry, "lastSeenAt");
        servers.push_back(std::move(summary));
    }

    return servers;
}

json message_to_json(const DiscoveryMessage& message) {
    json j;
    j["type"] = MessageHelpers::message_type_to_string(message.type);
    j["senderId"] = message.sender_id;
    j["timestamp"] = message.timestamp;
    j["payload"] = parse_embedded(message.payload_json, nullptr);
    if (message.signature) {
        j["signature"] = *message.signature;
    }
    return j;
}

} // namespace

// ============================================================================
// FederatedServer
// ============================================================================

const FederatedTool* FederatedServer::find_tool(const std::string& tool_name) const {
    for (const auto& tool : tools) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

std::string FederatedServer::to_json() const {
    try {
        return server_to_json(*this).dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<FederatedServer> FederatedServer::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }
        return server_from_json(j);

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// TrustMetrics
// ============================================================================

std::string TrustMetrics::to_json() const {
    json j;
    j["uptime"] = uptime;
    j["avgResponseTimeMs"] = avg_response_time_ms;
    j["successRate"] = success_rate;
    j["totalRequests"] = total_requests;
    j["totalErrors"] = total_errors;
    j["qualityScore"] = quality_score;
    j["reportCount"] = report_count;
    j["verifiedOwner"] = verified_owner;
    j["auditedCode"] = audited_code;
    return j.dump();
}

std::optional<TrustMetrics> TrustMetrics::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        TrustMetrics metrics;
        metrics.uptime = j.value("uptime", metrics.uptime);
        metrics.avg_response_time_ms = j.value("avgResponseTimeMs", metrics.avg_response_time_ms);
        metrics.success_rate = j.value("successRate", metrics.success_rate);
        metrics.total_requests = read_u64(j, "totalRequests");
        metrics.total_errors = read_u64(j, "totalErrors");
        metrics.quality_score = j.value("qualityScore", metrics.quality_score);
        metrics.report_count = static_cast<uint32_t>(read_u64(j, "reportCount"));
        metrics.verified_owner = j.value("verifiedOwner", false);
        metrics.audited_code = j.value("auditedCode", false);
        return metrics;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Gossip
// ============================================================================

ServerSummary ServerSummary::from_server(const FederatedServer& server) {
    ServerSummary summary;
    summary.id = server.id;
    summary.name = server.name;
    summary.endpoint = server.endpoint;
    summary.trust_score = server.trust_score;
    summary.last_seen_at = server.last_seen_at;
    return summary;
}

std::string GossipExchange::to_json() const {
    try {
        json servers_json = json::array();
        for (const auto& summary : servers) {
            servers_json.push_back(summary_to_json(summary));
        }

        json j;
        j["type"] = type;
        j["senderId"] = sender_id;
        j["servers"] = servers_json;
        return j.dump();

    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<GossipExchange> GossipExchange::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        GossipExchange exchange;
        exchange.type = j.value("type", "exchange");
        auto sender = j.find("senderId");
        if (sender != j.end() && sender->is_string()) {
            exchange.sender_id = sender->get<std::string>();
        }
        exchange.servers = summaries_from_json(j);
        return exchange;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string GossipReply::to_json() const {
    try {
        json servers_json = json::array();
        for (const auto& summary : servers) {
            servers_json.push_back(summary_to_json(summary));
        }
        return json{{"servers", servers_json}}.dump();

    } catch (const std::exception&) {
        return "{\"servers\":[]}";
    }
}

std::optional<GossipReply> GossipReply::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        GossipReply reply;
        reply.servers = summaries_from_json(j);
        return reply;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// DiscoveryMessage
// ============================================================================

std::string MessageHelpers::message_type_to_string(DiscoveryMessageType type) {
    switch (type) {
        case DiscoveryMessageType::ANNOUNCE: return "announce";
        case DiscoveryMessageType::QUERY: return "query";
        case DiscoveryMessageType::RESPONSE: return "response";
        case DiscoveryMessageType::PING: return "ping";
        case DiscoveryMessageType::PONG: return "pong";
        default: return "unknown";
    }
}

std::optional<DiscoveryMessageType> MessageHelpers::string_to_message_type(const std::string& str) {
    if (str == "announce") return DiscoveryMessageType::ANNOUNCE;
    if (str == "query") return DiscoveryMessageType::QUERY;
    if (str == "response") return DiscoveryMessageType::RESPONSE;
    if (str == "ping") return DiscoveryMessageType::PING;
    if (str == "pong") return DiscoveryMessageType::PONG;
    return std::nullopt;
}

std::optional<std::string> MessageHelpers::canonical_json(const std::string& json_str) {
    if (json_str.empty()) {
        return std::string("{}");
    }
    try {
        return json::parse(json_str).dump();
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string DiscoveryMessage::to_json() const {
    try {
        return message_to_json(*this).dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<DiscoveryMessage> DiscoveryMessage::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        auto type = MessageHelpers::string_to_message_type(j.value("type", ""));
        if (!type) {
            return std::nullopt;
        }

        DiscoveryMessage message;
        message.type = *type;
        message.sender_id = j.value("senderId", "");
        message.timestamp = read_u64(j, "timestamp");
        auto payload = j.find("payload");
        message.payload_json = payload != j.end() ? payload->dump() : "null";
        message.signature = optional_string(j, "signature");
        return message;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string DiscoveryAck::to_json() const {
    try {
        json j;
        j["received"] = received;
        j["accepted"] = accepted;
        if (!error.empty()) {
            j["error"] = error;
        }
        if (reply) {
            j["reply"] = message_to_json(*reply);
        }
        return j.dump();

    } catch (const std::exception&) {
        return "{}";
    }
}

// ============================================================================
// Tool call / stats
// ============================================================================

std::string ToolCallResponse::to_json() const {
    try {
        json j;
        j["success"] = success;
        if (result_json) {
            j["result"] = parse_embedded(*result_json, json(*result_json));
        }
        if (error) {
            j["error"] = *error;
        }
        j["serverId"] = server_id;
        j["tool"] = tool;
        j["durationMs"] = duration_ms;
        j["fromCache"] = from_cache;
        if (cost) {
            j["cost"] = *cost;
        }
        return j.dump();

    } catch (const std::exception&) {
        return "{}";
    }
}

std::string NetworkStats::to_json() const {
    json j;
    j["totalServers"] = total_servers;
    j["totalTools"] = total_tools;
    j["totalPeers"] = total_peers;
    j["averageTrust"] = average_trust;
    j["networkId"] = network_id;
    return j.dump();
}

} // namespace toolmesh
