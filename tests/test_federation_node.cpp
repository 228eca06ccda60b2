/**
 * @file test_federation_node.cpp
 * @brief Integration tests for FederationNode
 *
 * Tests node behavior including:
 * - Construction and lifecycle
 * - Bootstrap and self announcement on start
 * - Trust evolution across registration and tool calls
 * - Background gossip timer
 */

#include <gtest/gtest.h>
#include "toolmesh/federation_node.hpp"
#include "toolmesh/errors.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <thread>

using namespace toolmesh;
using namespace toolmesh::testing_support;
using json = nlohmann::json;

class FederationNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = make_test_config();
        transport_ = std::make_shared<FakeTransport>(&clock_);
    }

    std::unique_ptr<FederationNode> make_node() {
        return std::make_unique<FederationNode>(config_, transport_, clock_.as_clock());
    }

    FederatedServer serve_node(const std::string& id) {
        std::string endpoint = "http://" + id + ".example";
        FederatedServer server = make_server(id, endpoint);
        transport_->serve_health(endpoint);
        transport_->respond("GET", endpoint + "/federation/info", 200, server.to_json());
        return server;
    }

    ManualClock clock_;
    FederationConfig config_;
    std::shared_ptr<FakeTransport> transport_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(FederationNodeTest, InvalidConfigRejected) {
    config_.network_id = "";
    EXPECT_THROW(make_node(), ValidationError);
}

TEST_F(FederationNodeTest, StartAndStop) {
    auto node = make_node();
    EXPECT_FALSE(node->is_running());

    EXPECT_TRUE(node->start());
    EXPECT_TRUE(node->is_running());
    EXPECT_FALSE(node->start());

    node->stop();
    EXPECT_FALSE(node->is_running());
}

TEST_F(FederationNodeTest, RestartAfterStop) {
    auto node = make_node();
    ASSERT_TRUE(node->start());
    node->stop();

    EXPECT_TRUE(node->start());
    EXPECT_TRUE(node->is_running());
    node->stop();
}

TEST_F(FederationNodeTest, DestructorStopsRunningNode) {
    auto node = make_node();
    ASSERT_TRUE(node->start());
    EXPECT_NO_THROW(node.reset());
}

TEST_F(FederationNodeTest, StartBootstrapsFromSeeds) {
    serve_node("srv_seed");
    config_.bootstrap_peers = {"http://srv_seed.example"};

    auto node = make_node();
    ASSERT_TRUE(node->start());

    EXPECT_TRUE(node->get_server("srv_seed").has_value());

    NetworkStats stats = node->get_stats();
    EXPECT_EQ(stats.total_servers, 1u);
    EXPECT_EQ(stats.total_peers, 1u);
    EXPECT_EQ(stats.network_id, "toolmesh-test");

    node->stop();
}

TEST_F(FederationNodeTest, StartFillsEndpointFromConfig) {
    config_.announce_endpoint = "https://me.example";
    auto node = make_node();

    EXPECT_FALSE(node->info().has_value());

    ASSERT_TRUE(node->start(make_server("srv_me", "")));
    auto self = node->info();
    ASSERT_TRUE(self.has_value());
    EXPECT_EQ(self->id, "srv_me");
    EXPECT_EQ(self->endpoint, "https://me.example");
    EXPECT_EQ(node->discovery().local_server_id(), "srv_me");

    node->stop();
}

TEST_F(FederationNodeTest, StartAnnouncesSelfToPeers) {
    serve_node("srv_seed");
    transport_->respond("POST", "http://srv_seed.example/federation/message", 200, R"({"received":true})");
    config_.bootstrap_peers = {"http://srv_seed.example"};
    config_.announce_enabled = true;

    auto node = make_node();
    ASSERT_TRUE(node->start(make_server("srv_me", "http://me.example")));
    node->stop();

    EXPECT_EQ(transport_->count("POST", "http://srv_seed.example/federation/message"), 1u);
}

TEST_F(FederationNodeTest, RegistrationAnnouncedWhenEnabled) {
    config_.announce_enabled = true;
    auto node = make_node();
    node->discovery().add_peer(PeerInfo{"srv_peer", "http://srv_peer.example", clock_.now(), 50});
    transport_->respond("POST", "http://srv_peer.example/federation/message", 200, "{}");

    transport_->serve_health("http://srv_new.example");
    node->register_server(make_server("srv_new", "http://srv_new.example"));

    ASSERT_EQ(transport_->count("POST", "http://srv_peer.example/federation/message"), 1u);
    auto message = DiscoveryMessage::from_json(transport_->requests().back().body);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->type, DiscoveryMessageType::ANNOUNCE);
    EXPECT_EQ(json::parse(message->payload_json)["id"], "srv_new");
}

TEST_F(FederationNodeTest, RegistrationNotAnnouncedByDefault) {
    auto node = make_node();
    node->discovery().add_peer(PeerInfo{"srv_peer", "http://srv_peer.example", clock_.now(), 50});

    transport_->serve_health("http://srv_new.example");
    node->register_server(make_server("srv_new", "http://srv_new.example"));

    EXPECT_EQ(transport_->count("POST", "http://srv_peer.example/federation/message"), 0u);
}

// ============================================================================
// Trust evolution
// ============================================================================

TEST_F(FederationNodeTest, TrustEvolvesThroughCalls) {
    auto node = make_node();
    transport_->serve_health("http://srv_a.example");
    node->register_server(make_server("srv_a", "http://srv_a.example"));
    EXPECT_EQ(node->get_server("srv_a")->trust_score, 30);

    transport_->respond("POST", "http://srv_a.example/tools/echo", 200, R"({"ok":true})");
    transport_->set_latency(50);

    for (int i = 0; i < 10; ++i) {
        ToolCallRequest request{"srv_a", "echo", "{\"i\":" + std::to_string(i) + "}"};
        ASSERT_TRUE(node->call_tool(request).success);
    }

    auto metrics = node->get_trust_metrics("srv_a");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->total_requests, 10u);
    EXPECT_DOUBLE_EQ(metrics->success_rate, 100.0);
    EXPECT_DOUBLE_EQ(metrics->avg_response_time_ms, 50.0);
    EXPECT_EQ(node->get_server("srv_a")->trust_score, 77);

    transport_->respond("POST", "http://srv_a.example/tools/echo", 500, R"({"error":"boom"})");
    ToolCallResponse failed = node->call_tool(ToolCallRequest{"srv_a", "echo", R"({"i":99})"});
    EXPECT_FALSE(failed.success);

    metrics = node->get_trust_metrics("srv_a");
    EXPECT_EQ(metrics->total_requests, 11u);
    EXPECT_EQ(metrics->total_errors, 1u);
    EXPECT_NEAR(metrics->success_rate, 1000.0 / 11.0, 1e-9);
    EXPECT_EQ(node->get_server("srv_a")->trust_score, 75);
}

TEST_F(FederationNodeTest, ReportAndVerifyPassThrough) {
    auto node = make_node();
    transport_->serve_health("http://srv_a.example");
    node->register_server(make_server("srv_a", "http://srv_a.example"));

    EXPECT_TRUE(node->report_server("srv_a", "spam", std::string("srv_b")));
    EXPECT_EQ(node->get_server("srv_a")->trust_score, 65);

    EXPECT_TRUE(node->verify_owner("srv_a", "sig"));
    EXPECT_TRUE(node->get_trust_metrics("srv_a")->verified_owner);
}

TEST_F(FederationNodeTest, CallToolAutoAndSearch) {
    auto node = make_node();
    transport_->serve_health("http://srv_a.example");
    node->register_server(make_server("srv_a", "http://srv_a.example", {make_tool("get_balance", "finance")}));
    transport_->respond("POST", "http://srv_a.example/tools/get_balance", 200, R"({"balance":5})");

    auto matches = node->search_tools("balance");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].server.id, "srv_a");

    ToolCallResponse response = node->call_tool_auto("get_balance", "{}");
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.server_id, "srv_a");
    EXPECT_EQ(json::parse(*response.result_json)["balance"], 5);
}

// ============================================================================
// Inbound endpoints
// ============================================================================

TEST_F(FederationNodeTest, HandleGossipListsKnownServers) {
    auto node = make_node();
    transport_->serve_health("http://srv_a.example");
    node->register_server(make_server("srv_a", "http://srv_a.example"));

    GossipExchange exchange;
    exchange.sender_id = "srv_peer";
    auto reply = node->handle_gossip(exchange);
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->servers.size(), 1u);
    EXPECT_EQ(reply->servers[0].id, "srv_a");
}

TEST_F(FederationNodeTest, HandleMessagePing) {
    auto node = make_node();

    DiscoveryMessage ping;
    ping.type = DiscoveryMessageType::PING;
    ping.sender_id = "srv_peer";

    DiscoveryAck ack = node->handle_message(ping);
    EXPECT_TRUE(ack.accepted);
    ASSERT_TRUE(ack.reply.has_value());
    EXPECT_EQ(ack.reply->type, DiscoveryMessageType::PONG);
}

// ============================================================================
// Background rounds
// ============================================================================

TEST_F(FederationNodeTest, GossipTimerRunsRounds) {
    config_.gossip_interval_ms = 20;
    auto node = make_node();
    node->discovery().add_peer(PeerInfo{"srv_peer", "http://srv_peer.example", clock_.now(), 50});
    transport_->respond("POST", "http://srv_peer.example/federation/gossip", 200, R"({"servers":[]})");

    ASSERT_TRUE(node->start());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (transport_->count("POST", "http://srv_peer.example/federation/gossip") < 2 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    node->stop();
    EXPECT_GE(transport_->count("POST", "http://srv_peer.example/federation/gossip"), 2u);
}

TEST_F(FederationNodeTest, GossipTimerDisabledWithDiscovery) {
    config_.gossip_interval_ms = 20;
    config_.discovery_enabled = false;
    auto node = make_node();
    node->discovery().add_peer(PeerInfo{"srv_peer", "http://srv_peer.example", clock_.now(), 50});

    ASSERT_TRUE(node->start());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    node->stop();

    EXPECT_EQ(transport_->count("POST", "http://srv_peer.example/federation/gossip"), 0u);
}
