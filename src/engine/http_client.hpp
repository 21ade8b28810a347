/**
 * @file http_client.hpp
 * @brief HTTP/1.1 client for the container engine, over TCP or Unix sockets.
 *
 * Request/response calls go through cpp-httplib, one connection per call.
 * The stdin attach needs the raw connection after the upgrade handshake, so
 * upgrade() hands back an UpgradedConnection (see attach_stream.hpp).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/attach_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codebox {

struct HttpEndpoint {
    enum class Kind : uint8_t { Unix, Tcp };

    Kind kind{Kind::Unix};
    std::string socket_path;   ///< Unix
    std::string host;          ///< Tcp
    uint16_t port{0};          ///< Tcp

    /// Parse "unix:///var/run/docker.sock", "tcp://host:2375" or "http://host:2375".
    static Result<HttpEndpoint> parse(std::string_view uri);
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string target;                 ///< Origin-form, e.g. "/v1.43/_ping"
    HttpHeaders headers;
    std::string body;
    std::string content_type;
};

struct HttpResponse {
    int status{0};
    HttpHeaders headers;                ///< Names lowercased
    std::string body;                   ///< Empty when a sink consumed it

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

/// Receives body bytes in order; return false to stop reading early.
using BodySink = std::function<bool(std::string_view)>;

class HttpClient {
public:
    explicit HttpClient(HttpEndpoint endpoint, uint32_t connect_timeout_ms = 5000);

    /**
     * @brief Perform one request.
     *
     * @p timeout bounds every read and write on the connection. Running into
     * it yields ErrorCode::DeadlineExceeded; failing to connect or a broken
     * exchange yields ErrorCode::EngineUnavailable. A sink receives the body
     * of 2xx responses (GET only); other bodies are buffered for the error.
     */
    Result<HttpResponse> send(const HttpRequest& request, Duration timeout,
                              const BodySink& sink = {}) const;

    /**
     * @brief Send an upgrade request and hand back the raw connection.
     */
    Result<UpgradedConnection> upgrade(const HttpRequest& request, Duration timeout) const;

    [[nodiscard]] const HttpEndpoint& endpoint() const noexcept { return endpoint_; }

private:
    HttpEndpoint endpoint_;
    uint32_t connect_timeout_ms_;
};

}  // namespace codebox
