/**
 * @file server_registry.hpp
 * @brief In-memory registry of federated servers and their trust metrics
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Features:
 * - Registration gated by a reachability probe
 * - TTL-cached server listing, filtering and tool search
 * - Atomic trust bookkeeping (success, error, report, owner verification)
 * - Health adjustments and eviction
 * - JSON snapshot export/import for external persistence
 *
 * A single mutex guards servers, metrics and the list cache. Network I/O
 * is never performed while it is held.
 */

#pragma once

#include "toolmesh/federation_types.hpp"
#include "toolmesh/federation_config.hpp"
#include "toolmesh/http_transport.hpp"
#include "toolmesh/utilities.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <functional>

namespace toolmesh {

/**
 * @brief Per-call filters for list_servers()
 */
struct ListOptions {
    std::optional<int> min_trust;           ///< Applied on top of the configured minimum
    std::string category;                   ///< At least one tool with this exact category
    std::vector<std::string> has_tools;     ///< Every named tool must be present
    size_t limit = 0;                       ///< 0 = unlimited
};

/**
 * @brief Filters for search_tools()
 */
struct SearchOptions {
    std::string category;                   ///< Exact tool category
    std::optional<int> min_trust;
    size_t limit = 0;
};

/**
 * @brief Scored tool search hit
 */
struct ToolMatch {
    FederatedServer server;
    FederatedTool tool;
    double score = 0.0;
};

/**
 * @brief Result of a failed health probe adjustment
 */
enum class UnreachableOutcome {
    NOT_FOUND,      ///< Server was already gone
    DEGRADED,       ///< Uptime lowered, server kept
    EVICTED         ///< Trust fell below threshold, server and metrics removed
};

/// Receives newly registered servers when announcing is enabled
using AnnounceCallback = std::function<void(const FederatedServer&)>;

/**
 * @brief ServerRegistry - Store of known servers
 *
 * Every FederatedServer has exactly one TrustMetrics entry and its
 * trust_score is always TrustCalculator::calculate() of those metrics,
 * except right after registration where it is newServerTrust.
 */
class ServerRegistry {
public:
    /**
     * @brief Construct registry
     * @param config Federation configuration (copied)
     * @param transport Transport used for registration probes
     * @param clock Time source (defaults to wall clock)
     */
    ServerRegistry(const FederationConfig& config, HttpTransport& transport, Clock clock = nullptr);

    ~ServerRegistry() = default;

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;
    ServerRegistry(ServerRegistry&&) = delete;
    ServerRegistry& operator=(ServerRegistry&&) = delete;

    // ========================================================================
    // Registration and lookup
    // ========================================================================

    /**
     * @brief Validate, probe and store a server
     *
     * Assigns an ID when absent, stamps registration time and resets trust
     * to newServerTrust. Re-registering an existing ID replaces the server
     * and its metrics.
     *
     * @param server Descriptor
     * @return {success: true, server_id}
     * @throws ValidationError if endpoint, owner or tools are missing
     * @throws UnreachableError if GET {endpoint}/health fails
     */
    RegistrationResult register_server(FederatedServer server);

    std::optional<FederatedServer> get_server(const std::string& server_id) const;

    bool contains(const std::string& server_id) const;

    /**
     * @brief List servers above the configured trust minimum
     *
     * The base list is cached for cacheServerListMs; per-call filters,
     * sorting (trust descending, stable) and the limit are applied on top.
     */
    std::vector<FederatedServer> list_servers(const ListOptions& options = {});

    /**
     * @brief Score tools matching query (case-insensitive)
     *
     * score = 50 (name) + 30 (description) + 20 (category) + 0.3 * trust.
     * Every tool on a listed server is returned; only zero totals are dropped.
     */
    std::vector<ToolMatch> search_tools(const std::string& query, const SearchOptions& options = {});

    std::vector<FederatedServer> get_all_servers() const;
    std::vector<std::string> server_ids() const;
    size_t size() const;

    /**
     * @brief Server, tool and average trust counts (peers left at 0)
     */
    NetworkStats stats() const;

    // ========================================================================
    // Trust bookkeeping
    // ========================================================================

    std::optional<TrustMetrics> get_trust_metrics(const std::string& server_id) const;

    /**
     * @brief Record a successful call
     * @return false if the server is unknown
     */
    bool record_success(const std::string& server_id, uint64_t response_time_ms);

    /**
     * @brief Record a failed call (last_seen_at is not touched)
     * @return false if the server is unknown
     */
    bool record_error(const std::string& server_id);

    /**
     * @brief Record an abuse report
     * @return false if the server is unknown
     */
    bool report_server(const std::string& server_id, const std::string& reason,
                       const std::optional<std::string>& reporter = std::nullopt);

    /**
     * @brief Mark owner as verified
     *
     * The signature is not checked. Returns true for unknown IDs as well.
     */
    bool verify_owner(const std::string& server_id, const std::string& signature);

    /**
     * @brief Successful health probe: refresh last_seen_at, uptime + 1
     * @return false if the server is unknown
     */
    bool mark_alive(const std::string& server_id);

    /**
     * @brief Failed health probe: uptime - 5, evict if trust < threshold
     */
    UnreachableOutcome mark_unreachable(const std::string& server_id, int eviction_threshold);

    /**
     * @brief Remove server and metrics together
     * @return true if removed
     */
    bool remove_server(const std::string& server_id);

    // ========================================================================
    // Snapshot
    // ========================================================================

    /**
     * @brief Serialize all servers with their metrics
     */
    std::string export_snapshot() const;

    /**
     * @brief Restore servers and metrics without probing
     * @param snapshot Output of export_snapshot()
     * @return Number of servers imported
     * @throws ValidationError if the document is malformed
     */
    size_t import_snapshot(const std::string& snapshot);

    void set_announce_callback(AnnounceCallback callback);

private:
    struct ServerListCache {
        std::vector<FederatedServer> servers;
        uint64_t built_at = 0;
    };

    std::string generate_server_id() const;

    /// Recompute trust_score from metrics (lock must be held)
    void recompute_trust_locked(const std::string& server_id);

    FederationConfig config_;
    HttpTransport& transport_;
    Clock clock_;

    std::map<std::string, FederatedServer> servers_;
    std::map<std::string, TrustMetrics> trust_metrics_;
    std::optional<ServerListCache> list_cache_;
    mutable std::mutex registry_mutex_;

    AnnounceCallback announce_callback_;
    std::mutex callback_mutex_;
};

} // namespace toolmesh
