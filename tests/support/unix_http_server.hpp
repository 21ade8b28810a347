/**
 * @file unix_http_server.hpp
 * @brief One-connection HTTP responder on a Unix socket, for client tests.
 */

#pragma once

#include "engine/http_client.hpp"

#include <cstring>
#include <filesystem>
#include <functional>
#include <poll.h>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

namespace codebox::testing {

inline void write_raw(int fd, std::string_view data) {
    while (!data.empty()) {
        auto n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n <= 0) return;
        data.remove_prefix(static_cast<size_t>(n));
    }
}

/// Read the request head plus a Content-Length body, if any.
inline std::string read_request(int fd) {
    std::string request;
    char buf[4096];
    size_t expected = std::string::npos;
    for (;;) {
        auto head_end = request.find("\r\n\r\n");
        if (head_end != std::string::npos && expected == std::string::npos) {
            expected = head_end + 4;
            auto cl = request.find("Content-Length: ");
            if (cl != std::string::npos && cl < head_end) {
                expected += std::stoul(request.substr(cl + 16));
            }
        }
        if (expected != std::string::npos && request.size() >= expected) return request;
        auto n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return request;
        request.append(buf, static_cast<size_t>(n));
    }
}

/**
 * @brief Accepts one connection on a Unix socket and runs a handler on it.
 */
class OneShotServer {
public:
    using Handler = std::function<void(int client, const std::string& request)>;

    OneShotServer() {
        path_ = (std::filesystem::temp_directory_path()
                 / ("codebox_http_" + std::to_string(::getpid()) + "_"
                    + std::to_string(counter_++) + ".sock")).string();
        ::unlink(path_.c_str());

        listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 4);
    }

    ~OneShotServer() {
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
        ::unlink(path_.c_str());
    }

    void serve(Handler handler) {
        thread_ = std::thread([this, handler = std::move(handler)] {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 5000) <= 0) return;
            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) return;
            request_ = read_request(client);
            handler(client, request_);
            ::close(client);
        });
    }

    /// Valid after the handler has run (i.e. after the client call returned).
    std::string request() {
        if (thread_.joinable()) thread_.join();
        return request_;
    }

    [[nodiscard]] std::string uri() const { return "unix://" + path_; }

    [[nodiscard]] HttpClient client(uint32_t connect_timeout_ms = 1000) const {
        return HttpClient(HttpEndpoint::parse(uri()).value(), connect_timeout_ms);
    }

private:
    static inline int counter_ = 0;

    std::string path_;
    int listen_fd_ = -1;
    std::thread thread_;
    std::string request_;
};

}  // namespace codebox::testing
