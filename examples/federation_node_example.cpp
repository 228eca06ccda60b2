/**
 * @file federation_node_example.cpp
 * @brief Example CLI application using FederationNode
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates basic FederationNode usage:
 * - Load configuration from JSON and TOOLMESH_* variables
 * - Bootstrap, gossip and health supervision
 * - Search tools and call them with automatic fallback
 */

#include "toolmesh/federation_node.hpp"
#include "toolmesh/errors.hpp"
#include "toolmesh/utilities.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <csignal>
#include <atomic>

using namespace toolmesh;
using namespace toolmesh::utilities;

static std::atomic<bool> g_shutdown(false);

void signal_handler(int signal) {
    (void)signal;
    g_shutdown = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config.json]\n\n";
    std::cout << "Environment:\n";
    std::cout << "  TOOLMESH_NETWORK_ID          Network identifier\n";
    std::cout << "  TOOLMESH_BOOTSTRAP_PEERS     Comma separated peer endpoints\n";
    std::cout << "  TOOLMESH_ANNOUNCE_ENDPOINT   This node's public endpoint\n";
    std::cout << "  TOOLMESH_LOG_LEVEL           debug|info|warn|error|critical\n\n";
}

void print_help() {
    std::cout << "\nCommands:\n";
    std::cout << "  help                  Show this help\n";
    std::cout << "  stats                 Network statistics\n";
    std::cout << "  servers               Known servers by trust\n";
    std::cout << "  peers                 Gossip peers\n";
    std::cout << "  search <query>        Search tools\n";
    std::cout << "  call <tool> [json]    Call a tool on the best server\n";
    std::cout << "  gossip                Run a gossip round now\n";
    std::cout << "  health                Run a health round now\n";
    std::cout << "  quit                  Stop and exit\n\n";
}

void list_servers(FederationNode& node) {
    auto servers = node.list_servers();
    if (servers.empty()) {
        std::cout << "No servers known\n";
        return;
    }

    for (const auto& server : servers) {
        std::cout << "  " << server.id << "  trust=" << server.trust_score
                  << "  tools=" << server.tools.size()
                  << "  " << server.endpoint << "\n";
    }
}

void list_peers(FederationNode& node) {
    auto peers = node.discovery().get_peers();
    if (peers.empty()) {
        std::cout << "No peers known\n";
        return;
    }

    for (const auto& peer : peers) {
        std::cout << "  " << peer.server_id << "  " << peer.endpoint
                  << "  last contact " << format_timestamp(peer.last_contact) << "\n";
    }
}

bool handle_command(FederationNode& node, const std::string& command_line) {
    std::istringstream iss(command_line);
    std::string cmd;
    iss >> cmd;

    if (cmd.empty()) {
        return true;
    }

    if (cmd == "help" || cmd == "?") {
        print_help();
    }
    else if (cmd == "stats") {
        std::cout << node.get_stats().to_json() << "\n";
    }
    else if (cmd == "servers") {
        list_servers(node);
    }
    else if (cmd == "peers") {
        list_peers(node);
    }
    else if (cmd == "search") {
        std::string query;
        std::getline(iss, query);
        query = trim_string(query);

        auto matches = node.search_tools(query, SearchOptions{"", std::nullopt, 10});
        for (const auto& match : matches) {
            std::cout << "  " << match.tool.name << " @ " << match.server.id
                      << "  score=" << match.score << "\n";
        }
        if (matches.empty()) {
            std::cout << "No matching tools\n";
        }
    }
    else if (cmd == "call") {
        std::string tool;
        std::string params;
        iss >> tool;
        std::getline(iss, params);
        params = trim_string(params);

        if (tool.empty()) {
            std::cout << "Usage: call <tool> [json]\n";
        } else {
            auto response = node.call_tool_auto(tool, params.empty() ? "{}" : params);
            std::cout << response.to_json() << "\n";
        }
    }
    else if (cmd == "gossip") {
        size_t exchanged = node.discovery().gossip_round();
        std::cout << "Exchanged with " << exchanged << " peers\n";
    }
    else if (cmd == "health") {
        auto summary = node.health_monitor().health_check_round();
        std::cout << "Checked " << summary.checked << ", alive " << summary.alive
                  << ", failed " << summary.failed << ", evicted " << summary.evicted << "\n";
    }
    else if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    else {
        std::cout << "Unknown command: " << cmd << " (type 'help')\n";
    }

    return true;
}

int main(int argc, char* argv[]) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_usage(argv[0]);
        return 0;
    }

    FederationConfig config;
    try {
        if (argc > 1) {
            config = load_config(argv[1]);
        }
        apply_env_overrides(config);
        config.validate();
    } catch (const ValidationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    initialize_logging(config.log_file, parse_log_level(config.log_level).value_or(LogLevel::INFO));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        FederationNode node(config);

        if (!node.start()) {
            log_error("Failed to start federation node");
            return 1;
        }

        print_help();

        std::string line;
        while (!g_shutdown) {
            std::cout << "toolmesh> " << std::flush;
            if (!std::getline(std::cin, line)) {
                break;
            }
            if (!handle_command(node, line)) {
                break;
            }
        }

        node.stop();

    } catch (const std::exception& e) {
        log_critical(std::string("Fatal error: ") + e.what());
        return 1;
    }

    return 0;
}
