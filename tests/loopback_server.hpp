// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace manifold::test {

struct RecordedRequest {
    std::string method;
    std::string path;
    std::string range; // Range header value, empty when absent
};

struct ServerBehaviour {
    bool honour_range{true};        // false: answer every GET with 200 and the whole body
    int fixed_status{0};            // Non-zero: answer everything with this status and no body
    std::size_t max_range_bytes{0}; // Non-zero: serve at most this many bytes per range
};

// HTTP/1.1 server on 127.0.0.1 serving one body for every path.
// One connection at a time, "Connection: close" on every reply.
class LoopbackServer {
public:
    explicit LoopbackServer(std::string body) : body_(std::move(body)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0
            || ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind() or listen() failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listen_fd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::string base() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    [[nodiscard]] std::string url(std::string_view path) const {
        return base() + std::string(path);
    }

    void behaviour(const ServerBehaviour& b) {
        std::lock_guard lock(mutex_);
        behaviour_ = b;
    }

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t count(std::string_view method) const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(),
            [method](const RecordedRequest& r) { return r.method == method; }));
    }

private:
    void serve() {
        while (!stop_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (fd < 0) {
                continue;
            }
            handle(fd);
            ::close(fd);
        }
    }

    static RecordedRequest parse(std::string_view text) {
        RecordedRequest req;
        auto line_end = text.find("\r\n");
        auto request_line = text.substr(0, line_end);
        auto sp1 = request_line.find(' ');
        auto sp2 = request_line.find(' ', sp1 + 1);
        req.method = std::string(request_line.substr(0, sp1));
        req.path = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));

        std::size_t pos = line_end + 2;
        while (pos < text.size()) {
            auto end = text.find("\r\n", pos);
            if (end == std::string_view::npos || end == pos) break;
            auto line = text.substr(pos, end - pos);
            pos = end + 2;

            auto colon = line.find(':');
            if (colon == std::string_view::npos) continue;
            std::string name;
            for (char c : line.substr(0, colon)) {
                name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            auto value = line.substr(colon + 1);
            while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
            if (name == "range") {
                req.range = std::string(value);
            }
        }
        return req;
    }

    // "bytes=<first>-[<last>]"
    static std::pair<std::uint64_t, std::optional<std::uint64_t>> parse_range(const std::string& value) {
        auto spec = value.substr(value.find('=') + 1);
        auto dash = spec.find('-');
        std::uint64_t first = std::strtoull(spec.substr(0, dash).c_str(), nullptr, 10);
        auto tail = spec.substr(dash + 1);
        if (tail.empty()) {
            return {first, std::nullopt};
        }
        return {first, std::strtoull(tail.c_str(), nullptr, 10)};
    }

    static bool send_all(int fd, std::string_view data) {
        while (!data.empty()) {
            ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return true;
    }

    void handle(int fd) {
        timeval tv{5, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        std::string request;
        char buf[4096];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                return;
            }
            request.append(buf, static_cast<std::size_t>(n));
        }

        RecordedRequest req = parse(request);
        ServerBehaviour b;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(req);
            b = behaviour_;
        }

        const std::uint64_t size = body_.size();
        std::string head;
        std::string_view payload;

        if (b.fixed_status != 0) {
            head = "HTTP/1.1 " + std::to_string(b.fixed_status) + " Status\r\nContent-Length: 0\r\n";
        } else if (!req.range.empty() && b.honour_range) {
            auto [first, last] = parse_range(req.range);
            if (first >= size) {
                head = "HTTP/1.1 416 Range Not Satisfiable\r\nContent-Range: bytes */"
                     + std::to_string(size) + "\r\nContent-Length: 0\r\n";
            } else {
                std::uint64_t end = std::min(last.value_or(size - 1), size - 1);
                if (b.max_range_bytes > 0) {
                    end = std::min<std::uint64_t>(end, first + b.max_range_bytes - 1);
                }
                payload = std::string_view(body_).substr(first, end - first + 1);
                head = "HTTP/1.1 206 Partial Content\r\nContent-Range: bytes " + std::to_string(first) + "-"
                     + std::to_string(end) + "/" + std::to_string(size) + "\r\nContent-Length: "
                     + std::to_string(payload.size()) + "\r\n";
            }
        } else {
            payload = body_;
            head = "HTTP/1.1 200 OK\r\nAccept-Ranges: bytes\r\nContent-Length: " + std::to_string(size) + "\r\n";
        }
        head += "Connection: close\r\n\r\n";

        if (send_all(fd, head) && req.method != "HEAD") {
            send_all(fd, payload);
        }
    }

    std::string body_;
    int listen_fd_{-1};
    std::uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    ServerBehaviour behaviour_;
    std::vector<RecordedRequest> requests_;
};

// Deterministic, non-repeating-looking payload
inline std::string pattern_body(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>((i * 7 + i / 251) % 256);
    }
    return body;
}

} // namespace manifold::test
