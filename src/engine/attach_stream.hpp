/**
 * @file attach_stream.hpp
 * @brief Raw socket side of the stdin attach.
 *
 * After the engine answers the attach request with "101 UPGRADED" the
 * connection stops being HTTP, so it is driven directly: non-blocking
 * socket, poll() against an absolute deadline.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace codebox {

struct HttpEndpoint;
struct HttpRequest;

/**
 * @brief Owned socket descriptor with deadline-bounded I/O.
 */
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) noexcept : fd_(fd) {}
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    Result<void> send_all(std::string_view data, SteadyTime deadline);
    /// Returns 0 on orderly shutdown by the peer.
    Result<size_t> recv_some(char* buf, size_t len, SteadyTime deadline);
    void shutdown_write() noexcept;
    void close() noexcept;

private:
    int fd_ = -1;
};

/**
 * @brief A connection taken over after "101 Switching Protocols".
 */
class UpgradedConnection {
public:
    explicit UpgradedConnection(Socket socket) noexcept : socket_(std::move(socket)) {}

    Result<void> write(std::string_view data, SteadyTime deadline);
    /// Half-close, then read until the peer closes or @p deadline passes.
    void finish(SteadyTime deadline) noexcept;

private:
    Socket socket_;
};

/**
 * @brief Connect, send @p request with "Connection: Upgrade" and read the
 * response head.
 *
 * 101 and 200 are accepted; any other status is EngineRejected. Connecting
 * is additionally capped by @p connect_timeout_ms.
 */
Result<UpgradedConnection> open_upgraded(const HttpEndpoint& endpoint,
                                         const HttpRequest& request,
                                         uint32_t connect_timeout_ms,
                                         SteadyTime deadline);

}  // namespace codebox
