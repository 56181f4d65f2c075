/**
 * @file tcp_connect.cpp
 * @brief Bounded non-blocking TCP connect used by TcpConnectCheck probes.
 */
#include "drguard/health/region_probe.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace drguard::health {

namespace {

/// Closes the descriptor on scope exit.
struct FdGuard {
    int fd{-1};
    ~FdGuard() { if (fd >= 0) ::close(fd); }
};

/// Frees getaddrinfo results on scope exit.
struct AddrInfoGuard {
    addrinfo* ai{nullptr};
    ~AddrInfoGuard() { if (ai) ::freeaddrinfo(ai); }
};

} // namespace

Result<std::uint32_t> tcp_connect_latency(const std::string& host, std::uint16_t port,
                                          std::uint32_t timeout_ms) {
    using clock = std::chrono::steady_clock;
    if (host.empty() || port == 0) {
        return make_error(ErrorCode::InvalidArgument, "tcp check needs host and port");
    }

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    AddrInfoGuard res;
    const std::string service = std::to_string(port);
    if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res.ai); rc != 0) {
        return make_error(ErrorCode::BackendFailure, std::string("resolve failed: ") + ::gai_strerror(rc));
    }

    const auto t0 = clock::now();
    FdGuard sock{::socket(res.ai->ai_family, res.ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          res.ai->ai_protocol)};
    if (sock.fd < 0) {
        return make_error(ErrorCode::BackendFailure, std::string("socket: ") + std::strerror(errno));
    }

    if (::connect(sock.fd, res.ai->ai_addr, res.ai->ai_addrlen) != 0 && errno != EINPROGRESS) {
        return make_error(ErrorCode::BackendFailure, std::string("connect: ") + std::strerror(errno));
    }

    pollfd pfd{};
    pfd.fd     = sock.fd;
    pfd.events = POLLOUT;
    const int prc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (prc == 0) {
        return make_error(ErrorCode::Timeout, "connect timed out");
    }
    if (prc < 0) {
        return make_error(ErrorCode::BackendFailure, std::string("poll: ") + std::strerror(errno));
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
        return make_error(ErrorCode::BackendFailure,
                          std::string("connect: ") + std::strerror(so_error ? so_error : errno));
    }

    const auto dt = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0).count();
    return static_cast<std::uint32_t>(dt);
}

} // namespace drguard::health
