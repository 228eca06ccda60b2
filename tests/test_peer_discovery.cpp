/**
 * @file test_peer_discovery.cpp
 * @brief Unit tests for PeerDiscovery
 *
 * Tests discovery behavior including:
 * - Bootstrap from seed peers
 * - Gossip fanout and server discovery
 * - Announce broadcast
 * - Inbound message and gossip handling with rate limiting
 * - Peer table bounds
 */

#include <gtest/gtest.h>
#include "toolmesh/peer_discovery.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>
#include <set>

using namespace toolmesh;
using namespace toolmesh::testing_support;
using json = nlohmann::json;

class PeerDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = make_test_config();
        rebuild();
    }

    void TearDown() override {
        discovery_.reset();
        registry_.reset();
    }

    void rebuild() {
        discovery_.reset();
        registry_.reset();
        registry_ = std::make_unique<ServerRegistry>(config_, transport_, clock_.as_clock());
        discovery_ = std::make_unique<PeerDiscovery>(config_, *registry_, transport_, clock_.as_clock());
    }

    /// Serve /health and /federation/info for a server at http://<id>.example
    FederatedServer serve_node(const std::string& id) {
        std::string endpoint = "http://" + id + ".example";
        FederatedServer server = make_server(id, endpoint);
        transport_.serve_health(endpoint);
        transport_.respond("GET", endpoint + "/federation/info", 200, server.to_json());
        return server;
    }

    void serve_gossip(const std::string& endpoint, const std::string& reply = R"({"servers":[]})") {
        transport_.respond("POST", endpoint + "/federation/gossip", 200, reply);
    }

    PeerInfo peer(const std::string& id) {
        return PeerInfo{id, "http://" + id + ".example", clock_.now(), 50};
    }

    ManualClock clock_;
    FakeTransport transport_{&clock_};
    FederationConfig config_;
    std::unique_ptr<ServerRegistry> registry_;
    std::unique_ptr<PeerDiscovery> discovery_;
};

// ============================================================================
// Bootstrap
// ============================================================================

TEST_F(PeerDiscoveryTest, BootstrapRegistersSeedsAndAddsPeers) {
    serve_node("srv_seed1");
    config_.bootstrap_peers = {"http://srv_seed1.example", "http://srv_down.example"};
    rebuild();

    EXPECT_EQ(discovery_->bootstrap(), 1u);

    EXPECT_TRUE(registry_->contains("srv_seed1"));
    EXPECT_EQ(discovery_->peer_count(), 1u);

    auto seed = discovery_->get_peer("srv_seed1");
    ASSERT_TRUE(seed.has_value());
    EXPECT_EQ(seed->endpoint, "http://srv_seed1.example");
    EXPECT_EQ(seed->last_contact, clock_.now());

    EXPECT_EQ(transport_.count("GET", "http://srv_seed1.example/federation/info"), 2u);
    EXPECT_EQ(transport_.count("GET", "http://srv_down.example/federation/info"), 2u);
}

TEST_F(PeerDiscoveryTest, BootstrapDoesNotReregisterKnownServer) {
    FederatedServer seed = serve_node("srv_seed1");
    registry_->register_server(seed);
    uint64_t registered_at = registry_->get_server("srv_seed1")->registered_at;

    config_.bootstrap_peers = {"http://srv_seed1.example"};
    // Rebuild would drop the registry, so build discovery against the same one
    PeerDiscovery discovery(config_, *registry_, transport_, clock_.as_clock());

    clock_.advance(1000);
    EXPECT_EQ(discovery.bootstrap(), 1u);
    EXPECT_EQ(registry_->get_server("srv_seed1")->registered_at, registered_at);
}

TEST_F(PeerDiscoveryTest, DiscoverServerUsesQueriedEndpointWhenMissing) {
    FederatedServer server = make_server("srv_bare", "");
    transport_.respond("GET", "http://bare.example/federation/info", 200, server.to_json());
    transport_.serve_health("http://bare.example");

    EXPECT_TRUE(discovery_->discover_server("http://bare.example"));
    EXPECT_EQ(registry_->get_server("srv_bare")->endpoint, "http://bare.example");
}

TEST_F(PeerDiscoveryTest, DiscoverServerWithHostStyleId) {
    FederatedServer server = make_server("node.example.com:8080", "http://node.example.com:8080");
    transport_.respond("GET", "http://node.example.com:8080/federation/info", 200, server.to_json());
    transport_.serve_health("http://node.example.com:8080");

    EXPECT_TRUE(discovery_->discover_server("http://node.example.com:8080"));
    EXPECT_TRUE(registry_->contains("node.example.com:8080"));
}

TEST_F(PeerDiscoveryTest, FetchServerInfoRejectsGarbage) {
    transport_.respond("GET", "http://junk.example/federation/info", 200, "not json");
    EXPECT_FALSE(discovery_->fetch_server_info("http://junk.example").has_value());
    EXPECT_FALSE(discovery_->discover_server("http://junk.example"));
}

// ============================================================================
// Gossip
// ============================================================================

TEST_F(PeerDiscoveryTest, GossipWithoutPeersMakesNoRequests) {
    EXPECT_EQ(discovery_->gossip_round(), 0u);
    EXPECT_TRUE(transport_.requests().empty());
}

TEST_F(PeerDiscoveryTest, GossipContactsAtMostThreePeers) {
    for (int i = 0; i < 5; ++i) {
        std::string id = "srv_p" + std::to_string(i);
        discovery_->add_peer(peer(id));
        serve_gossip("http://" + id + ".example");
    }

    EXPECT_EQ(discovery_->gossip_round(), 3u);

    std::set<std::string> contacted;
    for (const auto& request : transport_.requests()) {
        EXPECT_EQ(request.method, "POST");
        contacted.insert(request.url);
    }
    EXPECT_EQ(transport_.requests().size(), 3u);
    EXPECT_EQ(contacted.size(), 3u);
}

TEST_F(PeerDiscoveryTest, GossipDiscoversUnknownServers) {
    FederatedServer known = serve_node("srv_known");
    registry_->register_server(known);
    serve_node("srv_new");

    discovery_->add_peer(peer("srv_peer"));
    serve_gossip("http://srv_peer.example", R"({"servers":[
        {"id":"srv_known","name":"K","endpoint":"http://srv_known.example","trustScore":30,"lastSeenAt":1},
        {"id":"srv_new","name":"N","endpoint":"http://srv_new.example","trustScore":30,"lastSeenAt":1}
    ]})");

    clock_.advance(5000);
    EXPECT_EQ(discovery_->gossip_round(), 1u);

    EXPECT_TRUE(registry_->contains("srv_new"));
    EXPECT_EQ(transport_.count("GET", "http://srv_known.example/federation/info"), 0u);
    EXPECT_EQ(discovery_->get_peer("srv_peer")->last_contact, clock_.now());
}

TEST_F(PeerDiscoveryTest, GossipRequestCarriesOurServers) {
    registry_->register_server(serve_node("srv_a"));
    discovery_->set_local_server_id("srv_me");
    discovery_->add_peer(peer("srv_peer"));
    serve_gossip("http://srv_peer.example");

    discovery_->gossip_round();

    const HttpRequest& sent = transport_.requests().back();
    EXPECT_EQ(sent.url, "http://srv_peer.example/federation/gossip");
    EXPECT_EQ(sent.headers.at("X-Federation-Network"), "toolmesh-test");

    json body = json::parse(sent.body);
    EXPECT_EQ(body["type"], "exchange");
    EXPECT_EQ(body["senderId"], "srv_me");
    ASSERT_EQ(body["servers"].size(), 1u);
    EXPECT_EQ(body["servers"][0]["id"], "srv_a");
    EXPECT_EQ(body["servers"][0]["endpoint"], "http://srv_a.example");
}

TEST_F(PeerDiscoveryTest, GossipRequestIncludesLowTrustAndFreshServers) {
    registry_->register_server(serve_node("srv_low"));
    for (int i = 0; i < 10; ++i) {
        registry_->record_error("srv_low");
    }
    for (int i = 0; i < 5; ++i) {
        registry_->report_server("srv_low", "spam");
    }
    ASSERT_LT(registry_->get_server("srv_low")->trust_score, config_.min_trust_score);
    EXPECT_TRUE(registry_->list_servers().empty());

    // Registered while the listing above is still cached
    registry_->register_server(serve_node("srv_new"));

    discovery_->add_peer(peer("srv_peer"));
    serve_gossip("http://srv_peer.example");
    discovery_->gossip_round();

    json body = json::parse(transport_.requests().back().body);
    ASSERT_EQ(body["servers"].size(), 2u);
    EXPECT_EQ(body["servers"][0]["id"], "srv_low");
    EXPECT_EQ(body["servers"][1]["id"], "srv_new");
}

TEST_F(PeerDiscoveryTest, GossipFailuresAreSwallowed) {
    discovery_->add_peer(peer("srv_dead"));
    discovery_->add_peer(peer("srv_bad"));
    serve_gossip("http://srv_bad.example", "not json");

    uint64_t before = discovery_->get_peer("srv_dead")->last_contact;
    clock_.advance(1000);

    EXPECT_NO_THROW(EXPECT_EQ(discovery_->gossip_round(), 0u));
    EXPECT_EQ(discovery_->get_peer("srv_dead")->last_contact, before);
}

// ============================================================================
// Announce
// ============================================================================

TEST_F(PeerDiscoveryTest, AnnounceDisabledSendsNothing) {
    discovery_->add_peer(peer("srv_peer"));
    EXPECT_EQ(discovery_->announce_server(make_server("srv_me", "http://me.example")), 0u);
    EXPECT_TRUE(transport_.requests().empty());
}

TEST_F(PeerDiscoveryTest, AnnounceBroadcastsToAllPeers) {
    config_.announce_enabled = true;
    rebuild();
    discovery_->set_local_server_id("srv_me");

    discovery_->add_peer(peer("srv_up"));
    discovery_->add_peer(peer("srv_down"));
    transport_.respond("POST", "http://srv_up.example/federation/message", 200, R"({"received":true})");

    EXPECT_EQ(discovery_->announce_server(make_server("srv_me", "http://me.example")), 1u);
    EXPECT_EQ(transport_.count("POST", "http://srv_down.example/federation/message"), 1u);

    auto message = DiscoveryMessage::from_json(transport_.requests().front().body);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->type, DiscoveryMessageType::ANNOUNCE);
    EXPECT_EQ(message->sender_id, "srv_me");
    EXPECT_EQ(message->timestamp, clock_.now());
    EXPECT_EQ(json::parse(message->payload_json)["id"], "srv_me");
}

TEST_F(PeerDiscoveryTest, AnnounceRelayedServerUsesItsOwnId) {
    config_.announce_enabled = true;
    rebuild();
    discovery_->set_local_server_id("srv_me");

    discovery_->add_peer(peer("srv_up"));
    transport_.respond("POST", "http://srv_up.example/federation/message", 200, R"({"received":true})");

    EXPECT_EQ(discovery_->announce_server(make_server("srv_other", "http://other.example")), 1u);

    auto message = DiscoveryMessage::from_json(transport_.requests().back().body);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->sender_id, "srv_other");
    EXPECT_EQ(json::parse(message->payload_json)["id"], "srv_other");
}

// ============================================================================
// Inbound messages
// ============================================================================

TEST_F(PeerDiscoveryTest, HandleAnnounceRegistersServer) {
    FederatedServer server = serve_node("srv_remote");

    DiscoveryMessage message;
    message.type = DiscoveryMessageType::ANNOUNCE;
    message.sender_id = "srv_remote";
    message.payload_json = server.to_json();

    DiscoveryAck ack = discovery_->handle_message(message);
    EXPECT_TRUE(ack.received);
    EXPECT_TRUE(ack.accepted);
    EXPECT_TRUE(registry_->contains("srv_remote"));
    EXPECT_EQ(discovery_->get_messages_received(), 1u);
}

TEST_F(PeerDiscoveryTest, HandleAnnounceUnreachableNotAccepted) {
    DiscoveryMessage message;
    message.type = DiscoveryMessageType::ANNOUNCE;
    message.sender_id = "srv_liar";
    message.payload_json = make_server("srv_liar", "http://nowhere.example").to_json();

    DiscoveryAck ack = discovery_->handle_message(message);
    EXPECT_TRUE(ack.received);
    EXPECT_FALSE(ack.accepted);
    EXPECT_NE(ack.error.find("not reachable"), std::string::npos);
    EXPECT_FALSE(registry_->contains("srv_liar"));
}

TEST_F(PeerDiscoveryTest, HandleAnnounceInvalidPayload) {
    DiscoveryMessage message;
    message.type = DiscoveryMessageType::ANNOUNCE;
    message.sender_id = "srv_x";
    message.payload_json = "null";

    DiscoveryAck ack = discovery_->handle_message(message);
    EXPECT_FALSE(ack.accepted);
    EXPECT_FALSE(ack.error.empty());
}

TEST_F(PeerDiscoveryTest, HandlePingRepliesPong) {
    discovery_->set_local_server_id("srv_me");

    DiscoveryMessage ping;
    ping.type = DiscoveryMessageType::PING;
    ping.sender_id = "srv_other";

    DiscoveryAck ack = discovery_->handle_message(ping);
    EXPECT_TRUE(ack.accepted);
    ASSERT_TRUE(ack.reply.has_value());
    EXPECT_EQ(ack.reply->type, DiscoveryMessageType::PONG);
    EXPECT_EQ(ack.reply->sender_id, "srv_me");
    EXPECT_EQ(ack.reply->timestamp, clock_.now());
}

TEST_F(PeerDiscoveryTest, HandleOtherTypesAcknowledged) {
    DiscoveryMessage query;
    query.type = DiscoveryMessageType::QUERY;
    query.sender_id = "srv_other";

    DiscoveryAck ack = discovery_->handle_message(query);
    EXPECT_TRUE(ack.received);
    EXPECT_FALSE(ack.accepted);
    EXPECT_TRUE(ack.error.empty());
    EXPECT_FALSE(ack.reply.has_value());
}

TEST_F(PeerDiscoveryTest, HandleMessageRateLimited) {
    config_.inbound_rate_per_second = 1.0;
    config_.inbound_burst = 2.0;
    rebuild();

    DiscoveryMessage ping;
    ping.type = DiscoveryMessageType::PING;
    ping.sender_id = "srv_noisy";

    EXPECT_TRUE(discovery_->handle_message(ping).received);
    EXPECT_TRUE(discovery_->handle_message(ping).received);

    DiscoveryAck rejected = discovery_->handle_message(ping);
    EXPECT_FALSE(rejected.received);
    EXPECT_EQ(rejected.error, "Rate limit exceeded");

    ping.sender_id = "srv_quiet";
    EXPECT_TRUE(discovery_->handle_message(ping).received);

    clock_.advance(1000);
    ping.sender_id = "srv_noisy";
    EXPECT_TRUE(discovery_->handle_message(ping).received);
}

TEST_F(PeerDiscoveryTest, HandleGossipReturnsSummaries) {
    registry_->register_server(serve_node("srv_a"));

    GossipExchange exchange;
    exchange.sender_id = "srv_peer";
    exchange.servers.push_back(ServerSummary{"srv_other", "O", "http://other.example", 40, 1});

    auto reply = discovery_->handle_gossip(exchange);
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->servers.size(), 1u);
    EXPECT_EQ(reply->servers[0].id, "srv_a");
    EXPECT_EQ(reply->servers[0].trust_score, 30);

    // Incoming lists are not merged
    EXPECT_FALSE(registry_->contains("srv_other"));
}

TEST_F(PeerDiscoveryTest, HandleGossipRateLimited) {
    config_.inbound_burst = 1.0;
    rebuild();

    GossipExchange exchange;
    exchange.sender_id = "srv_peer";

    EXPECT_TRUE(discovery_->handle_gossip(exchange).has_value());
    EXPECT_FALSE(discovery_->handle_gossip(exchange).has_value());
}

// ============================================================================
// Peer table
// ============================================================================

TEST_F(PeerDiscoveryTest, PeerTableBounded) {
    config_.max_peers = 2;
    rebuild();

    EXPECT_TRUE(discovery_->add_peer(peer("srv_1")));
    EXPECT_TRUE(discovery_->add_peer(peer("srv_2")));
    EXPECT_FALSE(discovery_->add_peer(peer("srv_3")));
    EXPECT_EQ(discovery_->peer_count(), 2u);

    // Refreshing an existing peer is allowed when full
    PeerInfo refreshed = peer("srv_1");
    refreshed.trust_score = 90;
    EXPECT_TRUE(discovery_->add_peer(refreshed));
    EXPECT_EQ(discovery_->get_peer("srv_1")->trust_score, 90);
}

TEST_F(PeerDiscoveryTest, AddPeerRejectsSelfAndEmpty) {
    discovery_->set_local_server_id("srv_me");
    EXPECT_FALSE(discovery_->add_peer(peer("srv_me")));
    EXPECT_FALSE(discovery_->add_peer(PeerInfo{}));
    EXPECT_EQ(discovery_->peer_count(), 0u);
}

TEST_F(PeerDiscoveryTest, RemovePeer) {
    discovery_->add_peer(peer("srv_1"));
    EXPECT_TRUE(discovery_->remove_peer("srv_1"));
    EXPECT_FALSE(discovery_->remove_peer("srv_1"));
    EXPECT_FALSE(discovery_->get_peer("srv_1").has_value());
    EXPECT_TRUE(discovery_->get_peers().empty());
}

TEST_F(PeerDiscoveryTest, MessageCounters) {
    discovery_->add_peer(peer("srv_1"));
    serve_gossip("http://srv_1.example");
    discovery_->gossip_round();

    EXPECT_EQ(discovery_->get_messages_sent(), 1u);
    EXPECT_EQ(discovery_->get_messages_received(), 0u);
}
