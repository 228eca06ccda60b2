/**
 * @file http_transport.hpp
 * @brief Outbound HTTP/1.1 client used for all peer communication
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Features:
 * - Abstract HttpTransport seam (tests substitute an in-memory fake)
 * - Asio implementation for http:// and https:// (OpenSSL)
 * - Hard per-request deadline
 * - Connection: close, chunked transfer decoding
 *
 * Transport failures are returned as values, never thrown. Requests whose
 * URL or headers cannot be framed safely fail before any connection is made.
 */

#pragma once

#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <optional>
#include <cstdint>

namespace asio {
namespace ssl {
class context;
}
}

namespace toolmesh {

/**
 * @brief Outbound HTTP request
 */
struct HttpRequest {
    std::string method = "GET";
    std::string url;                                ///< Absolute http(s) URL
    std::map<std::string, std::string> headers;
    std::string body;
};

/**
 * @brief HTTP response or transport failure
 */
struct HttpResponse {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers;     ///< Lowercase header names
    std::string body;
    std::string error;                              ///< Non-empty on transport failure

    /// Transport succeeded and status is 2xx
    bool ok() const {
        return error.empty() && status >= 200 && status < 300;
    }

    /**
     * @brief Human readable failure reason
     * @return Transport error, or "HTTP <status> <reason>"
     */
    std::string describe_failure() const;
};

/**
 * @brief Components of an http(s) URL
 */
struct ParsedUrl {
    std::string scheme;     ///< "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target;     ///< Path and query, at least "/"
};

/**
 * @brief Parse an absolute http:// or https:// URL
 * @return ParsedUrl or std::nullopt for other schemes, malformed input, or
 *         URLs containing whitespace or control characters
 */
std::optional<ParsedUrl> parse_url(const std::string& url);

/**
 * @brief Check a header field can be written without breaking framing
 * @return false if the name is not an HTTP token or the value holds CR, LF or NUL
 */
bool is_valid_header(const std::string& name, const std::string& value);

/**
 * @brief Append a path to a base endpoint, dropping trailing slashes of the base
 */
std::string join_url(const std::string& base, const std::string& path);

/**
 * @brief Parse a complete raw HTTP/1.1 response (status line, headers, body)
 * @return Response or std::nullopt if the status line or framing is malformed
 */
std::optional<HttpResponse> parse_http_response(const std::string& raw);

/**
 * @brief Decode a chunked transfer-encoded body
 * @return Decoded body or std::nullopt on malformed chunk framing
 */
std::optional<std::string> decode_chunked_body(const std::string& body);

/**
 * @brief HttpTransport - Blocking request/response with deadline
 *
 * Implementations must be safe to call from multiple threads.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one request
     * @param request Request to send
     * @param timeout Deadline covering resolve, connect, TLS, write and read
     * @return Response; error is set if no complete response arrived in time
     */
    virtual HttpResponse send(const HttpRequest& request, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Probe GET {endpoint}/health
 * @return true if the endpoint answered 2xx within timeout
 */
bool probe_health(HttpTransport& transport, const std::string& endpoint,
                  std::chrono::milliseconds timeout);

/**
 * @brief AsioHttpTransport - HttpTransport over standalone asio
 *
 * Each request runs on its own io_context so the deadline is enforced by
 * io_context::run_for() regardless of what the caller's threads are doing.
 * HTTPS verifies the peer certificate and host name against the system
 * trust store.
 */
class AsioHttpTransport : public HttpTransport {
public:
    AsioHttpTransport();
    ~AsioHttpTransport() override;

    AsioHttpTransport(const AsioHttpTransport&) = delete;
    AsioHttpTransport& operator=(const AsioHttpTransport&) = delete;

    HttpResponse send(const HttpRequest& request, std::chrono::milliseconds timeout) override;

private:
    std::unique_ptr<asio::ssl::context> ssl_context_;
};

} // namespace toolmesh
