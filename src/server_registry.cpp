/**
 * @file server_registry.cpp
 * @brief Implementation of the federated server registry
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/server_registry.hpp"
#include "toolmesh/trust_calculator.hpp"
#include "toolmesh/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace toolmesh {

// ============================================================================
// Constructor
// ============================================================================

ServerRegistry::ServerRegistry(const FederationConfig& config, HttpTransport& transport, Clock clock)
    : config_(config)
    , transport_(transport)
    , clock_(clock ? std::move(clock) : Clock(utilities::current_time_ms))
{
}

// ============================================================================
// Registration
// ============================================================================

RegistrationResult ServerRegistry::register_server(FederatedServer server) {
    if (server.endpoint.empty() || server.owner.empty() || server.tools.empty()) {
        throw ValidationError("Missing required fields: endpoint, owner, tools");
    }

    if (server.id.empty()) {
        server.id = generate_server_id();
    } else if (!protocol::validate_identifier(server.id)) {
        throw ValidationError("Invalid server ID: " + server.id);
    }

    uint64_t now = clock_();
    server.registered_at = now;
    server.last_seen_at = now;
    server.trust_score = config_.new_server_trust;

    if (!probe_health(transport_, server.endpoint,
                      std::chrono::milliseconds(config_.connection_timeout_ms))) {
        throw UnreachableError(server.endpoint, "health check failed");
    }

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        trust_metrics_[server.id] = TrustMetrics{};
        servers_[server.id] = server;
    }

    utilities::log_info("Registry: registered server " + server.id + " (" + server.name +
                        ") at " + server.endpoint + " with " +
                        std::to_string(server.tools.size()) + " tools");

    if (config_.announce_enabled) {
        AnnounceCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = announce_callback_;
        }
        if (callback) {
            callback(server);
        }
    }

    RegistrationResult result;
    result.success = true;
    result.server_id = server.id;
    return result;
}

std::string ServerRegistry::generate_server_id() const {
    return "srv_" + std::to_string(clock_()) + "_" +
           utilities::generate_random_string(protocol::SERVER_ID_SUFFIX_LENGTH);
}

std::optional<FederatedServer> ServerRegistry::get_server(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ServerRegistry::contains(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return servers_.count(server_id) > 0;
}

// ============================================================================
// Listing and search
// ============================================================================

std::vector<FederatedServer> ServerRegistry::list_servers(const ListOptions& options) {
    std::vector<FederatedServer> servers;

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);

        uint64_t now = clock_();
        bool fresh = list_cache_ && now >= list_cache_->built_at &&
                     now - list_cache_->built_at < config_.cache_server_list_ms;

        if (!fresh) {
            ServerListCache cache;
            cache.built_at = now;
            for (const auto& [id, server] : servers_) {
                if (server.trust_score >= config_.min_trust_score) {
                    cache.servers.push_back(server);
                }
            }
            list_cache_ = std::move(cache);
        }

        servers = list_cache_->servers;
    }

    if (options.min_trust) {
        int min_trust = *options.min_trust;
        servers.erase(std::remove_if(servers.begin(), servers.end(),
            [min_trust](const FederatedServer& s) { return s.trust_score < min_trust; }),
            servers.end());
    }

    if (!options.category.empty()) {
        servers.erase(std::remove_if(servers.begin(), servers.end(),
            [&options](const FederatedServer& s) {
                return std::none_of(s.tools.begin(), s.tools.end(),
                    [&options](const FederatedTool& t) { return t.category == options.category; });
            }),
            servers.end());
    }

    if (!options.has_tools.empty()) {
        servers.erase(std::remove_if(servers.begin(), servers.end(),
            [&options](const FederatedServer& s) {
                for (const auto& name : options.has_tools) {
                    if (!s.find_tool(name)) {
                        return true;
                    }
                }
                return false;
            }),
            servers.end());
    }

    std::stable_sort(servers.begin(), servers.end(),
        [](const FederatedServer& a, const FederatedServer& b) {
            return a.trust_score > b.trust_score;
        });

    if (options.limit > 0 && servers.size() > options.limit) {
        servers.resize(options.limit);
    }

    return servers;
}

std::vector<ToolMatch> ServerRegistry::search_tools(const std::string& query, const SearchOptions& options) {
    ListOptions list_options;
    list_options.min_trust = options.min_trust;

    std::vector<ToolMatch> matches;

    for (const auto& server : list_servers(list_options)) {
        for (const auto& tool : server.tools) {
            if (!options.category.empty() && tool.category != options.category) {
                continue;
            }

            double score = 0.0;
            if (utilities::contains_ignore_case(tool.name, query)) score += 50.0;
            if (utilities::contains_ignore_case(tool.description, query)) score += 30.0;
            if (utilities::contains_ignore_case(tool.category, query)) score += 20.0;

            score += server.trust_score * 0.3;
            if (score == 0.0) {
                continue;
            }

            matches.push_back(ToolMatch{server, tool, score});
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
        [](const ToolMatch& a, const ToolMatch& b) { return a.score > b.score; });

    if (options.limit > 0 && matches.size() > options.limit) {
        matches.resize(options.limit);
    }

    return matches;
}

std::vector<FederatedServer> ServerRegistry::get_all_servers() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::vector<FederatedServer> servers;
    servers.reserve(servers_.size());
    for (const auto& [id, server] : servers_) {
        servers.push_back(server);
    }
    return servers;
}

std::vector<std::string> ServerRegistry::server_ids() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::vector<std::string> ids;
    ids.reserve(servers_.size());
    for (const auto& entry : servers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

size_t ServerRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return servers_.size();
}

NetworkStats ServerRegistry::stats() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    NetworkStats stats;
    stats.network_id = config_.network_id;
    stats.total_servers = servers_.size();

    long long trust_sum = 0;
    for (const auto& [id, server] : servers_) {
        stats.total_tools += server.tools.size();
        trust_sum += server.trust_score;
    }

    if (!servers_.empty()) {
        stats.average_trust = static_cast<int>(
            std::lround(static_cast<double>(trust_sum) / servers_.size()));
    }

    return stats;
}

// ============================================================================
// Trust bookkeeping
// ============================================================================

void ServerRegistry::recompute_trust_locked(const std::string& server_id) {
    auto server = servers_.find(server_id);
    auto metrics = trust_metrics_.find(server_id);
    if (server != servers_.end() && metrics != trust_metrics_.end()) {
        server->second.trust_score = TrustCalculator::calculate(metrics->second);
    }
}

std::optional<TrustMetrics> ServerRegistry::get_trust_metrics(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = trust_metrics_.find(server_id);
    if (it == trust_metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ServerRegistry::record_success(const std::string& server_id, uint64_t response_time_ms) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto metrics_it = trust_metrics_.find(server_id);
    auto server_it = servers_.find(server_id);
    if (metrics_it == trust_metrics_.end() || server_it == servers_.end()) {
        return false;
    }

    TrustMetrics& metrics = metrics_it->second;
    metrics.total_requests++;

    double n = static_cast<double>(metrics.total_requests);
    metrics.avg_response_time_ms =
        (metrics.avg_response_time_ms * (n - 1.0) + static_cast<double>(response_time_ms)) / n;
    metrics.success_rate =
        static_cast<double>(metrics.total_requests - metrics.total_errors) / n * 100.0;

    server_it->second.trust_score = TrustCalculator::calculate(metrics);
    server_it->second.last_seen_at = clock_();
    return true;
}

bool ServerRegistry::record_error(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto metrics_it = trust_metrics_.find(server_id);
    if (metrics_it == trust_metrics_.end()) {
        return false;
    }

    TrustMetrics& metrics = metrics_it->second;
    metrics.total_requests++;
    metrics.total_errors++;
    metrics.success_rate = static_cast<double>(metrics.total_requests - metrics.total_errors) /
                           static_cast<double>(metrics.total_requests) * 100.0;

    recompute_trust_locked(server_id);
    return true;
}

bool ServerRegistry::report_server(const std::string& server_id, const std::string& reason,
                                   const std::optional<std::string>& reporter) {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);

        auto it = trust_metrics_.find(server_id);
        if (it == trust_metrics_.end()) {
            return false;
        }

        it->second.report_count++;
        recompute_trust_locked(server_id);
    }

    utilities::log_warn("Registry: server " + server_id + " reported by " +
                        reporter.value_or("anonymous") + ": " + reason);
    return true;
}

bool ServerRegistry::verify_owner(const std::string& server_id, const std::string& signature) {
    (void)signature;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = trust_metrics_.find(server_id);
    if (it != trust_metrics_.end()) {
        it->second.verified_owner = true;
        recompute_trust_locked(server_id);
        utilities::log_info("Registry: owner of " + server_id + " verified");
    }

    return true;
}

bool ServerRegistry::mark_alive(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto server_it = servers_.find(server_id);
    auto metrics_it = trust_metrics_.find(server_id);
    if (server_it == servers_.end() || metrics_it == trust_metrics_.end()) {
        return false;
    }

    server_it->second.last_seen_at = clock_();
    metrics_it->second.uptime = std::min(100.0, metrics_it->second.uptime + 1.0);
    server_it->second.trust_score = TrustCalculator::calculate(metrics_it->second);
    return true;
}

UnreachableOutcome ServerRegistry::mark_unreachable(const std::string& server_id, int eviction_threshold) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto server_it = servers_.find(server_id);
    auto metrics_it = trust_metrics_.find(server_id);
    if (server_it == servers_.end() || metrics_it == trust_metrics_.end()) {
        return UnreachableOutcome::NOT_FOUND;
    }

    metrics_it->second.uptime = std::max(0.0, metrics_it->second.uptime - 5.0);
    server_it->second.trust_score = TrustCalculator::calculate(metrics_it->second);

    if (server_it->second.trust_score < eviction_threshold) {
        servers_.erase(server_it);
        trust_metrics_.erase(metrics_it);
        return UnreachableOutcome::EVICTED;
    }

    return UnreachableOutcome::DEGRADED;
}

bool ServerRegistry::remove_server(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    size_t removed = servers_.erase(server_id);
    trust_metrics_.erase(server_id);
    return removed > 0;
}

// ============================================================================
// Snapshot
// ============================================================================

std::string ServerRegistry::export_snapshot() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    json entries = json::array();
    for (const auto& [id, server] : servers_) {
        json entry;
        entry["server"] = json::parse(server.to_json());
        auto metrics = trust_metrics_.find(id);
        entry["metrics"] = json::parse(
            metrics != trust_metrics_.end() ? metrics->second.to_json() : TrustMetrics{}.to_json());
        entries.push_back(entry);
    }

    json snapshot;
    snapshot["networkId"] = config_.network_id;
    snapshot["exportedAt"] = clock_();
    snapshot["servers"] = entries;
    return snapshot.dump();
}

size_t ServerRegistry::import_snapshot(const std::string& snapshot) {
    std::vector<std::pair<FederatedServer, TrustMetrics>> restored;

    try {
        json j = json::parse(snapshot);
        if (!j.is_object() || !j.contains("servers") || !j["servers"].is_array()) {
            throw ValidationError("snapshot must contain a servers array");
        }

        for (const auto& entry : j["servers"]) {
            if (!entry.is_object() || !entry.contains("server")) {
                continue;
            }

            auto server = FederatedServer::from_json(entry["server"].dump());
            if (!server || !protocol::validate_identifier(server->id)) {
                continue;
            }

            TrustMetrics metrics;
            if (entry.contains("metrics")) {
                metrics = TrustMetrics::from_json(entry["metrics"].dump()).value_or(TrustMetrics{});
            }

            restored.emplace_back(std::move(*server), metrics);
        }

    } catch (const json::exception& e) {
        throw ValidationError("invalid snapshot: " + std::string(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (auto& [server, metrics] : restored) {
            server.trust_score = TrustCalculator::calculate(metrics);
            trust_metrics_[server.id] = metrics;
            servers_[server.id] = std::move(server);
        }
    }

    utilities::log_info("Registry: imported " + std::to_string(restored.size()) + " servers from snapshot");
    return restored.size();
}

void ServerRegistry::set_announce_callback(AnnounceCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    announce_callback_ = std::move(callback);
}

} // namespace toolmesh
