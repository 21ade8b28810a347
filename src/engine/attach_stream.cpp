/**
 * @file attach_stream.cpp
 * @brief Socket, UpgradedConnection and the attach handshake.
 */

#include "engine/attach_stream.hpp"

#include "engine/http_client.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace codebox {

namespace {

constexpr size_t kMaxResponseHead = 64 * 1024;

std::string errno_message(std::string_view what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

/// Milliseconds left until @p deadline, or a negative value once it has passed.
int remaining_ms(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) return -1;
    return static_cast<int>(std::min<int64_t>(left, 60'000));
}

Result<Socket> finish_connect(Socket sock, const sockaddr* addr, socklen_t len,
                              SteadyTime deadline) {
    int ret = ::connect(sock.fd(), addr, len);
    if (ret < 0 && errno != EINPROGRESS && errno != EAGAIN) {
        return Error{ErrorCode::EngineUnavailable, errno_message("connect", errno)};
    }
    if (ret < 0) {
        for (;;) {
            int wait_ms = remaining_ms(deadline);
            if (wait_ms < 0) {
                return Error{ErrorCode::EngineUnavailable, "Connect timed out"};
            }
            pollfd pfd{};
            pfd.fd = sock.fd();
            pfd.events = POLLOUT;
            int ready = ::poll(&pfd, 1, wait_ms);
            if (ready < 0 && errno == EINTR) continue;
            if (ready < 0) {
                return Error{ErrorCode::EngineUnavailable, errno_message("poll", errno)};
            }
            if (ready > 0) break;
        }
        int err = 0;
        socklen_t err_len = sizeof(err);
        ::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &err, &err_len);
        if (err != 0) {
            return Error{ErrorCode::EngineUnavailable, errno_message("connect", err)};
        }
    }
    return sock;
}

Result<Socket> connect_endpoint(const HttpEndpoint& endpoint, SteadyTime deadline) {
    if (endpoint.kind == HttpEndpoint::Kind::Unix) {
        Socket sock(::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
        if (!sock.is_open()) {
            return Error{ErrorCode::EngineUnavailable, errno_message("socket", errno)};
        }
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::memcpy(addr.sun_path, endpoint.socket_path.c_str(), endpoint.socket_path.size() + 1);
        return finish_connect(std::move(sock), reinterpret_cast<const sockaddr*>(&addr),
                              sizeof(addr), deadline);
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    auto port = std::to_string(endpoint.port);
    if (int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &found); rc != 0) {
        return Error{ErrorCode::EngineUnavailable,
                     "Cannot resolve " + endpoint.host + ": " + ::gai_strerror(rc)};
    }

    Error last{ErrorCode::EngineUnavailable, "No usable address for " + endpoint.host};
    for (auto* ai = found; ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                             ai->ai_protocol));
        if (!sock.is_open()) {
            last = Error{ErrorCode::EngineUnavailable, errno_message("socket", errno)};
            continue;
        }
        auto connected = finish_connect(std::move(sock), ai->ai_addr, ai->ai_addrlen, deadline);
        if (connected) {
            ::freeaddrinfo(found);
            int flag = 1;
            ::setsockopt(connected->fd(), IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
            return connected;
        }
        last = connected.error();
    }
    ::freeaddrinfo(found);
    return last;
}

std::string upgrade_head(const HttpEndpoint& endpoint, const HttpRequest& request) {
    std::string out = request.method + " " + request.target + " HTTP/1.1\r\nHost: ";
    if (endpoint.kind == HttpEndpoint::Kind::Unix) {
        out += "localhost";
    } else {
        out += endpoint.host + ":" + std::to_string(endpoint.port);
    }
    out += "\r\nUser-Agent: codebox\r\n";
    for (const auto& [name, value] : request.headers) {
        out += name + ": " + value + "\r\n";
    }
    if (!request.content_type.empty()) {
        out += "Content-Type: " + request.content_type + "\r\n";
    }
    out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    out += "Connection: Upgrade\r\nUpgrade: tcp\r\n\r\n";
    out += request.body;
    return out;
}

/// Status code of "HTTP/1.x NNN ...", or nullopt.
std::optional<int> status_of(std::string_view head) {
    if (head.rfind("HTTP/1.", 0) != 0 || head.size() < 12 || head[8] != ' ') {
        return std::nullopt;
    }
    int code = 0;
    for (size_t i = 9; i < 12; ++i) {
        if (head[i] < '0' || head[i] > '9') return std::nullopt;
        code = code * 10 + (head[i] - '0');
    }
    return code;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Socket
// ─────────────────────────────────────────────

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<void> Socket::send_all(std::string_view data, SteadyTime deadline) {
    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms < 0) return Error{ErrorCode::DeadlineExceeded, "Send timed out"};

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return Error{ErrorCode::EngineUnavailable, errno_message("poll", errno)};
        }
        if (ready == 0) continue;  // deadline re-checked above

        auto sent = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{ErrorCode::EngineUnavailable, errno_message("send", errno)};
        }
        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return {};
}

Result<size_t> Socket::recv_some(char* buf, size_t len, SteadyTime deadline) {
    for (;;) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms < 0) return Error{ErrorCode::DeadlineExceeded, "Receive timed out"};

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return Error{ErrorCode::EngineUnavailable, errno_message("poll", errno)};
        }
        if (ready == 0) continue;

        auto received = ::recv(fd_, buf, len, 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{ErrorCode::EngineUnavailable, errno_message("recv", errno)};
        }
        return static_cast<size_t>(received);
    }
}

void Socket::shutdown_write() noexcept {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_WR);
}

void Socket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// UpgradedConnection
// ─────────────────────────────────────────────

Result<void> UpgradedConnection::write(std::string_view data, SteadyTime deadline) {
    return socket_.send_all(data, deadline);
}

void UpgradedConnection::finish(SteadyTime deadline) noexcept {
    socket_.shutdown_write();
    char drain[4096];
    for (;;) {
        auto n = socket_.recv_some(drain, sizeof(drain), deadline);
        if (!n || *n == 0) break;
    }
    socket_.close();
}

// ─────────────────────────────────────────────
// Handshake
// ─────────────────────────────────────────────

Result<UpgradedConnection> open_upgraded(const HttpEndpoint& endpoint,
                                         const HttpRequest& request,
                                         uint32_t connect_timeout_ms,
                                         SteadyTime deadline) {
    const auto connect_deadline = std::min(
        deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(connect_timeout_ms));
    auto sock = connect_endpoint(endpoint, connect_deadline);
    if (!sock) return sock.error();

    if (auto sent = sock->send_all(upgrade_head(endpoint, request), deadline); !sent) {
        return sent.error();
    }

    // Read the head only; bytes after it belong to the hijacked stream.
    std::string head;
    char buf[1024];
    while (head.find("\r\n\r\n") == std::string::npos) {
        if (head.size() > kMaxResponseHead) {
            return Error{ErrorCode::EngineUnavailable, "Upgrade response head too large"};
        }
        auto n = sock->recv_some(buf, sizeof(buf), deadline);
        if (!n) return n.error();
        if (*n == 0) {
            return Error{ErrorCode::EngineUnavailable, "Connection closed during upgrade"};
        }
        head.append(buf, *n);
    }

    auto status = status_of(head);
    if (!status) {
        return Error{ErrorCode::EngineUnavailable, "Malformed status line in upgrade response"};
    }
    // Engines answer 101 when they honour the Upgrade header, 200 otherwise.
    if (*status != 101 && *status != 200) {
        return Error{ErrorCode::EngineRejected,
                     "Upgrade refused with status " + std::to_string(*status)};
    }
    return UpgradedConnection{std::move(*sock)};
}

}  // namespace codebox
