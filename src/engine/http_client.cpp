/**
 * @file http_client.cpp
 * @brief HttpClient implementation over cpp-httplib.
 */

#include "engine/http_client.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <memory>
#include <sys/socket.h>
#include <sys/un.h>

namespace codebox {

namespace {

/// Slack for timer granularity when deciding a failed read ran into the timeout.
constexpr Duration kTimerSlack{10};

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::unique_ptr<httplib::Client> make_client(const HttpEndpoint& endpoint,
                                             uint32_t connect_timeout_ms, Duration timeout) {
    std::unique_ptr<httplib::Client> client;
    if (endpoint.kind == HttpEndpoint::Kind::Unix) {
        client = std::make_unique<httplib::Client>(endpoint.socket_path, 80);
        client->set_address_family(AF_UNIX);
    } else {
        client = std::make_unique<httplib::Client>(endpoint.host, endpoint.port);
    }
    client->set_connection_timeout(std::chrono::milliseconds(connect_timeout_ms));
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    client->set_keep_alive(false);
    return client;
}

Error transport_error(const HttpRequest& request, httplib::Error err, Duration elapsed,
                      Duration timeout) {
    std::string message = request.method + " " + request.target + ": " + httplib::to_string(err);
    if (err != httplib::Error::Connection && elapsed + kTimerSlack >= timeout) {
        return Error{ErrorCode::DeadlineExceeded, std::move(message)};
    }
    return Error{ErrorCode::EngineUnavailable, std::move(message)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// HttpEndpoint
// ─────────────────────────────────────────────

Result<HttpEndpoint> HttpEndpoint::parse(std::string_view uri) {
    HttpEndpoint ep;

    if (uri.rfind("unix://", 0) == 0) {
        ep.kind = Kind::Unix;
        ep.socket_path = std::string(uri.substr(7));
        if (ep.socket_path.empty() || ep.socket_path.front() != '/') {
            return Error{ErrorCode::InvalidRequest,
                         "Unix endpoint needs an absolute socket path: " + std::string(uri)};
        }
        if (ep.socket_path.size() >= sizeof(sockaddr_un::sun_path)) {
            return Error{ErrorCode::InvalidRequest, "Unix socket path too long"};
        }
        return ep;
    }

    std::string_view rest;
    if (uri.rfind("tcp://", 0) == 0) {
        rest = uri.substr(6);
    } else if (uri.rfind("http://", 0) == 0) {
        rest = uri.substr(7);
    } else {
        return Error{ErrorCode::InvalidRequest, "Unsupported endpoint scheme: " + std::string(uri)};
    }
    if (!rest.empty() && rest.back() == '/') rest.remove_suffix(1);

    auto colon = rest.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Error{ErrorCode::InvalidRequest, "TCP endpoint needs host:port: " + std::string(uri)};
    }
    ep.kind = Kind::Tcp;
    ep.host = std::string(rest.substr(0, colon));
    auto port_str = rest.substr(colon + 1);
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), ep.port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || ep.port == 0) {
        return Error{ErrorCode::InvalidRequest, "Invalid port in endpoint: " + std::string(uri)};
    }
    return ep;
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto key = to_lower(name);
    for (const auto& [k, v] : headers) {
        if (k == key) return v;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// HttpClient
// ─────────────────────────────────────────────

HttpClient::HttpClient(HttpEndpoint endpoint, uint32_t connect_timeout_ms)
    : endpoint_(std::move(endpoint))
    , connect_timeout_ms_(connect_timeout_ms) {}

Result<HttpResponse> HttpClient::send(const HttpRequest& request, Duration timeout,
                                      const BodySink& sink) const {
    const auto& method = request.method;
    if (method != "GET" && method != "POST" && method != "DELETE") {
        return Error{ErrorCode::Internal, "Unsupported HTTP method: " + method};
    }
    if (sink && method != "GET") {
        return Error{ErrorCode::Internal, "Streaming bodies are only read from GET"};
    }

    auto client = make_client(endpoint_, connect_timeout_ms_, timeout);

    httplib::Headers headers{{"User-Agent", "codebox"}};
    if (endpoint_.kind == HttpEndpoint::Kind::Unix) {
        headers.emplace("Host", "localhost");
    }
    for (const auto& [name, value] : request.headers) {
        headers.emplace(name, value);
    }

    HttpResponse response;
    bool sink_stopped = false;
    const auto started = std::chrono::steady_clock::now();

    auto result = [&]() -> httplib::Result {
        if (method == "GET") {
            if (!sink) return client->Get(request.target, headers);
            return client->Get(request.target, headers,
                [&](const httplib::Response& head) {
                    response.status = head.status;
                    return true;
                },
                [&](const char* data, size_t length) {
                    // Error bodies are kept for the caller's diagnostics.
                    if (response.status / 100 != 2) {
                        response.body.append(data, length);
                        return true;
                    }
                    if (!sink(std::string_view(data, length))) {
                        sink_stopped = true;
                        return false;
                    }
                    return true;
                });
        }
        if (method == "POST") {
            if (request.body.empty()) return client->Post(request.target, headers);
            return client->Post(request.target, headers, request.body,
                                request.content_type.empty() ? "application/octet-stream"
                                                             : request.content_type);
        }
        return client->Delete(request.target, headers);
    }();

    if (!result) {
        if (result.error() == httplib::Error::Canceled && sink_stopped) {
            return response;
        }
        const auto elapsed = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - started);
        return transport_error(request, result.error(), elapsed, timeout);
    }

    response.status = result->status;
    for (const auto& [name, value] : result->headers) {
        response.headers.emplace_back(to_lower(name), value);
    }
    if (!sink) response.body = std::move(result->body);
    return response;
}

Result<UpgradedConnection> HttpClient::upgrade(const HttpRequest& request,
                                               Duration timeout) const {
    return open_upgraded(endpoint_, request, connect_timeout_ms_,
                         std::chrono::steady_clock::now() + timeout);
}

}  // namespace codebox
