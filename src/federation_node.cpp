/**
 * @file federation_node.cpp
 * @brief Implementation of the federation node
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/federation_node.hpp"

using namespace toolmesh::utilities;

namespace toolmesh {

// ============================================================================
// Constructor and Destructor
// ============================================================================

FederationNode::FederationNode(
    const FederationConfig& config,
    std::shared_ptr<HttpTransport> transport,
    Clock clock
)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock(current_time_ms))
    , transport_(transport ? std::move(transport) : std::make_shared<AsioHttpTransport>())
    , running_(false)
    , gossip_timer_(io_context_)
    , health_timer_(io_context_)
{
    config_.validate();

    registry_ = std::make_unique<ServerRegistry>(config_, *transport_, clock_);
    router_ = std::make_unique<ToolRouter>(config_, *registry_, *transport_, clock_);
    discovery_ = std::make_unique<PeerDiscovery>(config_, *registry_, *transport_, clock_);
    health_monitor_ = std::make_unique<HealthMonitor>(config_, *registry_, *transport_, clock_);

    registry_->set_announce_callback([this](const FederatedServer& server) {
        discovery_->announce_server(server);
    });

    log_info("FederationNode: Initialized for network '" + config_.network_id + "'");
}

FederationNode::~FederationNode() {
    if (running_) {
        log_warn("FederationNode: Destructor called while still running, forcing stop");
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool FederationNode::start(const std::optional<FederatedServer>& this_server) {
    if (running_) {
        log_warn("FederationNode: Already running");
        return false;
    }

    log_info("FederationNode: Starting network " + config_.network_id);

    try {
        std::string local_id;
        {
            std::lock_guard<std::mutex> lock(this_server_mutex_);
            this_server_ = this_server;
            if (this_server_ && this_server_->endpoint.empty() && config_.announce_endpoint) {
                this_server_->endpoint = *config_.announce_endpoint;
            }
            if (this_server_) {
                local_id = this_server_->id;
            }
        }

        router_->set_caller_id(local_id);
        discovery_->set_local_server_id(local_id);

        if (!config_.bootstrap_peers.empty()) {
            discovery_->bootstrap();
        }

        io_context_.restart();
        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            io_context_.get_executor()
        );

        // One worker so rounds of the same kind never overlap
        worker_thread_ = std::thread([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("FederationNode: Worker thread exception: " + std::string(e.what()));
            }
        });

        running_ = true;

        if (config_.discovery_enabled) {
            asio::post(io_context_, [this]() { schedule_gossip(); });
        }
        asio::post(io_context_, [this]() { schedule_health(); });

        if (config_.announce_enabled) {
            auto self = info();
            if (self) {
                discovery_->announce_server(*self);
            }
        }

        log_info("FederationNode: Network started with " + std::to_string(registry_->size()) +
                 " known servers");
        return true;

    } catch (const std::exception& e) {
        log_error("FederationNode: Exception during start: " + std::string(e.what()));
        return false;
    }
}

void FederationNode::stop() {
    if (!running_) {
        log_warn("FederationNode: Not running");
        return;
    }

    log_info("FederationNode: Stopping...");
    running_ = false;

    // Timers are only touched from the worker thread
    asio::post(io_context_, [this]() {
        gossip_timer_.cancel();
        health_timer_.cancel();
    });
    work_guard_.reset();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    log_info("FederationNode: Network stopped");
}

bool FederationNode::is_running() const {
    return running_;
}

void FederationNode::schedule_gossip() {
    if (!running_) {
        return;
    }

    gossip_timer_.expires_after(std::chrono::milliseconds(config_.gossip_interval_ms));
    gossip_timer_.async_wait([this](const asio::error_code& error) {
        if (error == asio::error::operation_aborted || !running_) {
            return;
        }

        try {
            discovery_->gossip_round();
        } catch (const std::exception& e) {
            log_error("FederationNode: Gossip round failed: " + std::string(e.what()));
        }

        schedule_gossip();
    });
}

void FederationNode::schedule_health() {
    if (!running_) {
        return;
    }

    health_timer_.expires_after(std::chrono::milliseconds(config_.health_check_interval_ms));
    health_timer_.async_wait([this](const asio::error_code& error) {
        if (error == asio::error::operation_aborted || !running_) {
            return;
        }

        try {
            health_monitor_->health_check_round();
        } catch (const std::exception& e) {
            log_error("FederationNode: Health round failed: " + std::string(e.what()));
        }

        schedule_health();
    });
}

// ============================================================================
// Gateway operations
// ============================================================================

RegistrationResult FederationNode::register_server(FederatedServer server) {
    return registry_->register_server(std::move(server));
}

std::optional<FederatedServer> FederationNode::get_server(const std::string& server_id) const {
    return registry_->get_server(server_id);
}

std::vector<FederatedServer> FederationNode::list_servers(const ListOptions& options) {
    return registry_->list_servers(options);
}

std::vector<ToolMatch> FederationNode::search_tools(const std::string& query, const SearchOptions& options) {
    return registry_->search_tools(query, options);
}

ToolCallResponse FederationNode::call_tool(const ToolCallRequest& request) {
    return router_->call_tool(request);
}

ToolCallResponse FederationNode::call_tool_auto(const std::string& tool_name, const std::string& params_json,
                                                const AutoCallOptions& options) {
    return router_->call_tool_auto(tool_name, params_json, options);
}

bool FederationNode::report_server(const std::string& server_id, const std::string& reason,
                                   const std::optional<std::string>& reporter) {
    return registry_->report_server(server_id, reason, reporter);
}

bool FederationNode::verify_owner(const std::string& server_id, const std::string& signature) {
    return registry_->verify_owner(server_id, signature);
}

std::optional<TrustMetrics> FederationNode::get_trust_metrics(const std::string& server_id) const {
    return registry_->get_trust_metrics(server_id);
}

NetworkStats FederationNode::get_stats() const {
    NetworkStats stats = registry_->stats();
    stats.total_peers = discovery_->peer_count();
    return stats;
}

std::optional<FederatedServer> FederationNode::info() const {
    std::lock_guard<std::mutex> lock(this_server_mutex_);
    return this_server_;
}

std::optional<GossipReply> FederationNode::handle_gossip(const GossipExchange& exchange) {
    return discovery_->handle_gossip(exchange);
}

DiscoveryAck FederationNode::handle_message(const DiscoveryMessage& message) {
    return discovery_->handle_message(message);
}

} // namespace toolmesh
