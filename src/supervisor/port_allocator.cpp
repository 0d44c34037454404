/*
 * port_allocator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Port allocator implementation

**************************************************/

#include "port_allocator.hpp"

#include "exceptions.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace wayfarer::supervisor {

namespace {

constexpr int INVALID_SOCK = -1;

/// Owns a socket descriptor for the duration of a check
class SocketHandle {
public:
    explicit SocketHandle(int fd = INVALID_SOCK) : fd_(fd) {}
    ~SocketHandle() { reset(); }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    SocketHandle(SocketHandle&& other) noexcept : fd_(other.fd_) {
        other.fd_ = INVALID_SOCK;
    }
    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = INVALID_SOCK;
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool {
        return fd_ != INVALID_SOCK;
    }

    void reset() {
        if (fd_ != INVALID_SOCK) {
            ::close(fd_);
            fd_ = INVALID_SOCK;
        }
    }

private:
    int fd_;
};

/// Bind a TCP socket on all interfaces; port 0 lets the OS choose
auto bindSocket(int port) -> SocketHandle {
    SocketHandle sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        spdlog::warn("Failed to create probe socket: {}", strerror(errno));
        return sock;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr),
               sizeof(addr)) != 0) {
        sock.reset();
    }
    return sock;
}

auto boundPort(const SocketHandle& sock) -> int {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&addr), &len) !=
        0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

}  // namespace

PortAllocator::PortAllocator(std::optional<PortRange> range)
    : range_(range) {}

auto PortAllocator::allocate(std::optional<int> preferred) -> int {
    return allocateMany(1, preferred).front();
}

auto PortAllocator::allocateMany(int count, std::optional<int> preferred)
    -> std::vector<int> {
    std::vector<int> ports;
    if (count <= 0) {
        return ports;
    }

    // Held open until every port is chosen so the OS hands out distinct ones
    std::vector<SocketHandle> held;

    if (preferred) {
        if (!isValidPort(*preferred)) {
            throw PortUnavailable(*preferred, "port out of range");
        }
        auto sock = bindSocket(*preferred);
        if (!sock.valid()) {
            throw PortUnavailable(*preferred);
        }
        ports.push_back(*preferred);
        held.push_back(std::move(sock));
    }

    if (range_) {
        for (int port = range_->first;
             port <= range_->last && static_cast<int>(ports.size()) < count;
             ++port) {
            if (std::find(ports.begin(), ports.end(), port) != ports.end()) {
                continue;
            }
            auto sock = bindSocket(port);
            if (sock.valid()) {
                ports.push_back(port);
                held.push_back(std::move(sock));
            }
        }
        if (static_cast<int>(ports.size()) < count) {
            throw PortUnavailable(
                0, fmt::format("no free ports between {} and {}",
                               range_->first, range_->last));
        }
    } else {
        while (static_cast<int>(ports.size()) < count) {
            auto sock = bindSocket(0);
            int port = sock.valid() ? boundPort(sock) : 0;
            if (port == 0) {
                throw PortUnavailable(
                    0, fmt::format("ephemeral bind failed: {}",
                                   strerror(errno)));
            }
            ports.push_back(port);
            held.push_back(std::move(sock));
        }
    }

    spdlog::debug("Allocated port(s): {}", fmt::join(ports, ", "));
    return ports;
}

auto PortAllocator::isPortFree(int port) -> bool {
    if (!isValidPort(port)) {
        return false;
    }
    return bindSocket(port).valid();
}

auto PortAllocator::probe(const std::string& host, int port,
                          std::chrono::milliseconds timeout) -> bool {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string portStr = std::to_string(port);
    if (::getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result) != 0) {
        return false;
    }

    bool connected = false;
    for (addrinfo* rp = result; rp != nullptr && !connected; rp = rp->ai_next) {
        SocketHandle sock(
            ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC,
                     rp->ai_protocol));
        if (!sock.valid()) {
            continue;
        }

        int flags = ::fcntl(sock.get(), F_GETFL, 0);
        ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

        int ret = ::connect(sock.get(), rp->ai_addr, rp->ai_addrlen);
        if (ret == 0) {
            connected = true;
            break;
        }
        if (errno != EINPROGRESS) {
            continue;
        }

        pollfd pfd{sock.get(), POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0) {
            int error = 0;
            socklen_t len = sizeof(error);
            if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len) ==
                    0 &&
                error == 0) {
                connected = true;
            }
        }
    }

    ::freeaddrinfo(result);
    return connected;
}

}  // namespace wayfarer::supervisor
