/**
 * @file http_transport.cpp
 * @brief Implementation of the asio HTTP/1.1 client
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "toolmesh/http_transport.hpp"
#include "toolmesh/federation_config.hpp"
#include "toolmesh/utilities.hpp"
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <cstring>
#include <sstream>
#include <type_traits>

namespace toolmesh {

namespace {

bool is_token(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (unsigned char c : text) {
        if (c <= 0x20 || c >= 0x7f || std::strchr("()<>@,;:\\\"/[]?={}", c) != nullptr) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// URL and response parsing
// ============================================================================

std::string HttpResponse::describe_failure() const {
    if (!error.empty()) {
        return error;
    }
    std::string description = "HTTP " + std::to_string(status);
    if (!reason.empty()) {
        description += " " + reason;
    }
    return description;
}

std::optional<ParsedUrl> parse_url(const std::string& url) {
    ParsedUrl parsed;

    // Whitespace and control characters would end up raw in the request line
    for (unsigned char c : url) {
        if (c <= 0x20 || c == 0x7f) {
            return std::nullopt;
        }
    }

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    parsed.scheme = utilities::to_lowercase(url.substr(0, scheme_end));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return std::nullopt;
    }

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start, authority_end - authority_start);
    if (authority.empty()) {
        return std::nullopt;
    }

    // Strip userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (authority.front() == '[') {
        size_t bracket = authority.find(']');
        if (bracket == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(1, bracket - 1);
        if (bracket + 1 < authority.size()) {
            if (authority[bracket + 1] != ':') {
                return std::nullopt;
            }
            port_text = authority.substr(bracket + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parsed.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            parsed.host = authority;
        }
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }

    if (port_text.empty()) {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    } else {
        for (char c : port_text) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
        }
        unsigned long port = 0;
        try {
            port = std::stoul(port_text);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        parsed.port = static_cast<uint16_t>(port);
    }

    if (authority_end == std::string::npos) {
        parsed.target = "/";
    } else {
        parsed.target = url.substr(authority_end);
        size_t fragment = parsed.target.find('#');
        if (fragment != std::string::npos) {
            parsed.target.erase(fragment);
        }
        if (parsed.target.empty() || parsed.target.front() != '/') {
            parsed.target = "/" + parsed.target;
        }
    }

    return parsed;
}

bool is_valid_header(const std::string& name, const std::string& value) {
    if (!is_token(name)) {
        return false;
    }
    for (unsigned char c : value) {
        if (c == '\r' || c == '\n' || c == '\0') {
            return false;
        }
    }
    return true;
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string joined = base;
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        joined += '/';
    }
    return joined + path;
}

std::optional<std::string> decode_chunked_body(const std::string& body) {
    std::string decoded;
    size_t pos = 0;

    while (true) {
        size_t line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) {
            return std::nullopt;
        }

        // Chunk extensions follow ';'
        std::string size_line = body.substr(pos, line_end - pos);
        size_t semicolon = size_line.find(';');
        if (semicolon != std::string::npos) {
            size_line.erase(semicolon);
        }
        size_line = utilities::trim_string(size_line);
        if (size_line.empty()) {
            return std::nullopt;
        }

        size_t chunk_size = 0;
        try {
            size_t consumed = 0;
            chunk_size = std::stoul(size_line, &consumed, 16);
            if (consumed != size_line.size()) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }

        pos = line_end + 2;
        if (chunk_size == 0) {
            // Trailers are ignored
            return decoded;
        }

        if (pos + chunk_size + 2 > body.size()) {
            return std::nullopt;
        }
        decoded.append(body, pos, chunk_size);
        pos += chunk_size;

        if (body.compare(pos, 2, "\r\n") != 0) {
            return std::nullopt;
        }
        pos += 2;
    }
}

std::optional<HttpResponse> parse_http_response(const std::string& raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream head(raw.substr(0, header_end));
    std::string status_line;
    std::getline(head, status_line);
    if (!status_line.empty() && status_line.back() == '\r') {
        status_line.pop_back();
    }

    if (!utilities::starts_with(status_line, "HTTP/")) {
        return std::nullopt;
    }

    HttpResponse response;

    size_t first_space = status_line.find(' ');
    if (first_space == std::string::npos) {
        return std::nullopt;
    }
    size_t second_space = status_line.find(' ', first_space + 1);
    std::string code = status_line.substr(
        first_space + 1,
        second_space == std::string::npos ? std::string::npos : second_space - first_space - 1);
    if (code.size() != 3) {
        return std::nullopt;
    }
    try {
        response.status = std::stoi(code);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (second_space != std::string::npos) {
        response.reason = status_line.substr(second_space + 1);
    }

    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = utilities::to_lowercase(utilities::trim_string(line.substr(0, colon)));
        response.headers[name] = utilities::trim_string(line.substr(colon + 1));
    }

    std::string body = raw.substr(header_end + 4);

    auto transfer_encoding = response.headers.find("transfer-encoding");
    if (transfer_encoding != response.headers.end() &&
        utilities::contains_ignore_case(transfer_encoding->second, "chunked")) {
        auto decoded = decode_chunked_body(body);
        if (!decoded) {
            return std::nullopt;
        }
        response.body = std::move(*decoded);
        return response;
    }

    auto content_length = response.headers.find("content-length");
    if (content_length != response.headers.end()) {
        size_t length = 0;
        try {
            length = std::stoul(content_length->second);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (body.size() < length) {
            return std::nullopt;
        }
        body.resize(length);
    }

    response.body = std::move(body);
    return response;
}

bool probe_health(HttpTransport& transport, const std::string& endpoint,
                  std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.method = "GET";
    request.url = join_url(endpoint, protocol::HEALTH_PATH);

    HttpResponse response = transport.send(request, timeout);
    if (!response.ok()) {
        utilities::log_debug("Transport: health probe of " + endpoint + " failed: " +
                             response.describe_failure());
        return false;
    }
    return true;
}

// ============================================================================
// Asio exchange
// ============================================================================

namespace {

/**
 * @brief Serialize the request head and body
 * @param error Set to the reason when the request cannot be framed safely
 * @return Wire bytes or std::nullopt
 */
std::optional<std::string> build_request(const HttpRequest& request, const ParsedUrl& url, std::string& error) {
    if (!is_token(request.method)) {
        error = "Invalid method: " + request.method;
        return std::nullopt;
    }
    for (const auto& [name, value] : request.headers) {
        if (!is_valid_header(name, value)) {
            error = "Invalid header: " + (is_token(name) ? name : std::string("(malformed name)"));
            return std::nullopt;
        }
    }

    std::ostringstream out;
    out << request.method << " " << url.target << " HTTP/1.1\r\n";

    bool default_port = (url.scheme == "http" && url.port == 80) ||
                        (url.scheme == "https" && url.port == 443);
    std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
    out << "Host: " << host;
    if (!default_port) {
        out << ":" << url.port;
    }
    out << "\r\n";

    out << "User-Agent: toolmesh/1.0\r\n";
    out << "Accept: application/json\r\n";
    out << "Connection: close\r\n";

    for (const auto& [name, value] : request.headers) {
        out << name << ": " << value << "\r\n";
    }

    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        out << "Content-Length: " << request.body.size() << "\r\n";
    }

    out << "\r\n" << request.body;
    return out.str();
}

/**
 * @brief One request/response exchange on a TCP or TLS stream
 *
 * resolve -> connect -> [handshake] -> write -> read until close
 */
template <typename Stream>
class HttpExchange : public std::enable_shared_from_this<HttpExchange<Stream>> {
public:
    static constexpr bool kTls = !std::is_same<Stream, asio::ip::tcp::socket>::value;

    template <typename... StreamArgs>
    HttpExchange(asio::io_context& io_context, ParsedUrl url, std::string payload,
                 StreamArgs&&... stream_args)
        : resolver_(io_context)
        , stream_(std::forward<StreamArgs>(stream_args)...)
        , url_(std::move(url))
        , payload_(std::move(payload))
    {}

    void start() {
        auto self = this->shared_from_this();
        resolver_.async_resolve(
            url_.host, std::to_string(url_.port),
            [self](const asio::error_code& error, asio::ip::tcp::resolver::results_type results) {
                if (error) {
                    self->fail("DNS resolution failed for " + self->url_.host + ": " + error.message());
                    return;
                }
                self->connect(results);
            }
        );
    }

    void abort() {
        asio::error_code ignored;
        resolver_.cancel();
        socket().close(ignored);
    }

    bool finished() const { return finished_; }
    const std::string& error() const { return error_; }
    const std::string& raw() const { return raw_; }

private:
    asio::ip::tcp::socket& socket() {
        if constexpr (kTls) {
            return stream_.next_layer();
        } else {
            return stream_;
        }
    }

    void connect(const asio::ip::tcp::resolver::results_type& results) {
        auto self = this->shared_from_this();
        asio::async_connect(
            socket(), results,
            [self](const asio::error_code& error, const asio::ip::tcp::endpoint&) {
                if (error) {
                    self->fail("Connection to " + self->url_.host + " failed: " + error.message());
                    return;
                }
                if constexpr (kTls) {
                    self->handshake();
                } else {
                    self->write();
                }
            }
        );
    }

    void handshake() {
        if constexpr (kTls) {
            // SNI
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
                fail("Failed to set TLS server name for " + url_.host);
                return;
            }
            stream_.set_verify_callback(asio::ssl::host_name_verification(url_.host));

            auto self = this->shared_from_this();
            stream_.async_handshake(
                asio::ssl::stream_base::client,
                [self](const asio::error_code& error) {
                    if (error) {
                        self->fail("TLS handshake with " + self->url_.host + " failed: " + error.message());
                        return;
                    }
                    self->write();
                }
            );
        }
    }

    void write() {
        auto self = this->shared_from_this();
        asio::async_write(
            stream_, asio::buffer(payload_),
            [self](const asio::error_code& error, std::size_t) {
                if (error) {
                    self->fail("Failed to send request: " + error.message());
                    return;
                }
                self->read();
            }
        );
    }

    void read() {
        auto self = this->shared_from_this();
        asio::async_read(
            stream_, asio::dynamic_buffer(raw_, protocol::MAX_RESPONSE_SIZE),
            [self](const asio::error_code& error, std::size_t) {
                bool closed = error == asio::error::eof;
                if constexpr (kTls) {
                    // Peers commonly skip close_notify
                    closed = closed || error == asio::ssl::error::stream_truncated;
                }

                if (!error) {
                    self->fail("Response exceeds maximum size");
                } else if (!closed) {
                    self->fail("Failed to read response: " + error.message());
                } else {
                    self->finished_ = true;
                }
            }
        );
    }

    void fail(const std::string& message) {
        error_ = message;
        finished_ = true;
    }

    asio::ip::tcp::resolver resolver_;
    Stream stream_;
    ParsedUrl url_;
    std::string payload_;
    std::string raw_;
    std::string error_;
    bool finished_ = false;
};

template <typename Exchange>
HttpResponse run_exchange(asio::io_context& io_context, const std::shared_ptr<Exchange>& exchange,
                          std::chrono::milliseconds timeout) {
    HttpResponse response;

    exchange->start();
    io_context.run_for(timeout);

    if (!exchange->finished()) {
        exchange->abort();
        response.error = "Request timed out after " + std::to_string(timeout.count()) + " ms";
        return response;
    }

    if (!exchange->error().empty()) {
        response.error = exchange->error();
        return response;
    }

    auto parsed = parse_http_response(exchange->raw());
    if (!parsed) {
        response.error = "Malformed HTTP response";
        return response;
    }

    return *parsed;
}

} // namespace

// ============================================================================
// AsioHttpTransport
// ============================================================================

AsioHttpTransport::AsioHttpTransport()
    : ssl_context_(std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client))
{
    asio::error_code error;
    ssl_context_->set_default_verify_paths(error);
    if (error) {
        utilities::log_warn("Transport: failed to load system CA certificates: " + error.message());
    }
    ssl_context_->set_verify_mode(asio::ssl::verify_peer);
}

AsioHttpTransport::~AsioHttpTransport() = default;

HttpResponse AsioHttpTransport::send(const HttpRequest& request, std::chrono::milliseconds timeout) {
    auto url = parse_url(request.url);
    if (!url) {
        HttpResponse response;
        response.error = "Invalid URL: " + request.url;
        return response;
    }

    std::string error;
    auto payload = build_request(request, *url, error);
    if (!payload) {
        HttpResponse response;
        response.error = error;
        return response;
    }

    try {
        asio::io_context io_context;

        if (url->scheme == "https") {
            using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;
            auto exchange = std::make_shared<HttpExchange<TlsStream>>(
                io_context, *url, std::move(*payload), io_context, *ssl_context_);
            return run_exchange(io_context, exchange, timeout);
        }

        auto exchange = std::make_shared<HttpExchange<asio::ip::tcp::socket>>(
            io_context, *url, std::move(*payload), io_context);
        return run_exchange(io_context, exchange, timeout);

    } catch (const std::exception& e) {
        HttpResponse response;
        response.error = std::string("HTTP request failed: ") + e.what();
        return response;
    }
}

} // namespace toolmesh
