/**
 * @file errors.hpp
 * @brief Exception types thrown by ToolMesh
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Only registration and configuration throw. Tool calls, gossip, discovery
 * and health probes report failures as values.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace toolmesh {

/**
 * @brief Base class for all ToolMesh exceptions
 */
class FederationError : public std::runtime_error {
public:
    explicit FederationError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief Server descriptor or configuration is missing required fields
 */
class ValidationError : public FederationError {
public:
    explicit ValidationError(const std::string& message)
        : FederationError(message)
    {}
};

/**
 * @brief Server failed its reachability probe at registration time
 */
class UnreachableError : public FederationError {
public:
    UnreachableError(const std::string& endpoint, const std::string& reason)
        : FederationError("Server is not reachable: " + endpoint +
                          (reason.empty() ? "" : " (" + reason + ")"))
        , endpoint_(endpoint)
    {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

} // namespace toolmesh
