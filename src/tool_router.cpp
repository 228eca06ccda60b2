/**
 * @file tool_router.cpp
 * @brief Implementation of tool call routing
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/tool_router.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace toolmesh {

namespace {

ToolCallResponse failure(const std::string& server_id, const std::string& tool,
                         const std::string& error, uint64_t duration_ms = 0) {
    ToolCallResponse response;
    response.success = false;
    response.error = error;
    response.server_id = server_id;
    response.tool = tool;
    response.duration_ms = duration_ms;
    return response;
}

} // namespace

// ============================================================================
// Constructor
// ============================================================================

ToolRouter::ToolRouter(const FederationConfig& config, ServerRegistry& registry,
                       HttpTransport& transport, Clock clock)
    : config_(config)
    , registry_(registry)
    , transport_(transport)
    , clock_(clock ? std::move(clock) : Clock(utilities::current_time_ms))
{
}

void ToolRouter::set_caller_id(const std::string& caller_id) {
    std::lock_guard<std::mutex> lock(caller_mutex_);
    caller_id_ = caller_id;
}

// ============================================================================
// Tool calls
// ============================================================================

ToolCallResponse ToolRouter::call_tool(const ToolCallRequest& request) {
    auto server = registry_.get_server(request.server_id);
    if (!server) {
        return failure(request.server_id, request.tool, "Server not found: " + request.server_id);
    }

    if (server->trust_score < config_.min_trust_score) {
        return failure(request.server_id, request.tool,
                       "Server trust score too low: " + std::to_string(server->trust_score));
    }

    if (!protocol::validate_identifier(request.tool)) {
        return failure(request.server_id, request.tool, "Invalid tool name");
    }

    std::string authorization;
    if (request.api_key && !request.api_key->empty()) {
        authorization = "Bearer " + *request.api_key;
        if (!is_valid_header("Authorization", authorization)) {
            return failure(request.server_id, request.tool, "Invalid API key");
        }
    }

    auto canonical_params = MessageHelpers::canonical_json(request.params_json);
    if (!canonical_params) {
        return failure(request.server_id, request.tool, "Invalid params: not valid JSON");
    }

    std::string cache_key = request.server_id + ":" + request.tool + ":" + *canonical_params;

    uint64_t start = clock_();
    if (auto cached = lookup_cache(cache_key, start)) {
        ToolCallResponse response;
        response.success = true;
        response.result_json = *cached;
        response.server_id = request.server_id;
        response.tool = request.tool;
        response.from_cache = true;
        return response;
    }

    HttpRequest http_request;
    http_request.method = "POST";
    http_request.url = join_url(server->endpoint, protocol::TOOLS_PATH + request.tool);
    http_request.body = *canonical_params;
    http_request.headers["Content-Type"] = "application/json";
    if (!authorization.empty()) {
        http_request.headers["Authorization"] = authorization;
    }
    http_request.headers[protocol::NETWORK_HEADER] = config_.network_id;
    {
        std::lock_guard<std::mutex> lock(caller_mutex_);
        http_request.headers[protocol::CALLER_HEADER] = caller_id_.empty() ? "unknown" : caller_id_;
    }

    HttpResponse http_response = transport_.send(
        http_request, std::chrono::milliseconds(config_.request_timeout_ms));

    uint64_t end = clock_();
    uint64_t duration = end >= start ? end - start : 0;

    std::string error;
    std::string result_json;

    if (!http_response.ok()) {
        error = http_response.describe_failure();
    } else {
        try {
            result_json = json::parse(http_response.body).dump();
        } catch (const json::exception&) {
            error = "Invalid JSON in response from " + server->endpoint;
        }
    }

    if (!error.empty()) {
        registry_.record_error(request.server_id);
        utilities::log_warn("Router: call to " + request.tool + " on " + request.server_id +
                            " failed: " + error);
        return failure(request.server_id, request.tool, error, duration);
    }

    registry_.record_success(request.server_id, duration);
    store_cache(cache_key, result_json, end);

    ToolCallResponse response;
    response.success = true;
    response.result_json = result_json;
    response.server_id = request.server_id;
    response.tool = request.tool;
    response.duration_ms = duration;
    response.from_cache = false;

    const FederatedTool* tool = server->find_tool(request.tool);
    if (tool && tool->pricing) {
        response.cost = tool->pricing->base_cost_micro;
    }

    utilities::log_debug("Router: " + request.tool + " on " + request.server_id +
                         " succeeded in " + std::to_string(duration) + " ms");
    return response;
}

ToolCallResponse ToolRouter::call_tool_auto(const std::string& tool_name, const std::string& params_json,
                                            const AutoCallOptions& options) {
    ListOptions list_options;
    list_options.min_trust = options.min_trust;
    list_options.has_tools = {tool_name};

    auto servers = registry_.list_servers(list_options);
    if (servers.empty()) {
        return failure("", tool_name, "No servers found with tool: " + tool_name);
    }

    for (const auto& server : servers) {
        ToolCallRequest request;
        request.server_id = server.id;
        request.tool = tool_name;
        request.params_json = params_json;
        request.user_id = options.user_id;
        request.api_key = options.api_key;

        ToolCallResponse response = call_tool(request);
        if (response.success) {
            return response;
        }

        utilities::log_debug("Router: falling back from " + server.id + " for " + tool_name);
    }

    return failure("", tool_name,
                   "All " + std::to_string(servers.size()) + " servers failed for tool: " + tool_name);
}

// ============================================================================
// Result cache
// ============================================================================

std::optional<std::string> ToolRouter::lookup_cache(const std::string& key, uint64_t now) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto it = result_cache_.find(key);
    if (it == result_cache_.end()) {
        return std::nullopt;
    }

    if (now < it->second.stored_at || now - it->second.stored_at >= config_.cache_tool_results_ms) {
        return std::nullopt;
    }

    return it->second.result_json;
}

void ToolRouter::store_cache(const std::string& key, const std::string& result_json, uint64_t now) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    for (auto it = result_cache_.begin(); it != result_cache_.end(); ) {
        if (now >= it->second.stored_at &&
            now - it->second.stored_at >= config_.cache_tool_results_ms) {
            it = result_cache_.erase(it);
        } else {
            ++it;
        }
    }

    result_cache_[key] = CachedResult{result_json, now};
}

size_t ToolRouter::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return result_cache_.size();
}

void ToolRouter::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    result_cache_.clear();
}

} // namespace toolmesh
