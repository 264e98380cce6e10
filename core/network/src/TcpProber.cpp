#include "TcpProber.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "Result.h"
#include "SocketGuard.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <future>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <utility>

namespace LanScout {

PosixTcpProber::PosixTcpProber()
    : resolver_(&PosixTcpProber::systemResolve) {}

PosixTcpProber::PosixTcpProber(HostResolver resolver)
    : resolver_(std::move(resolver)) {}

std::optional<std::uint32_t> PosixTcpProber::systemResolve(const std::string& host) {
    struct addrinfo hints{};
    struct addrinfo* result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return std::nullopt;
    }
    const std::uint32_t address =
        ntohl(reinterpret_cast<const sockaddr_in*>(result->ai_addr)->sin_addr.s_addr);
    freeaddrinfo(result);
    return address;
}

std::optional<std::uint32_t> PosixTcpProber::resolveBefore(
        const std::string& host, std::chrono::steady_clock::time_point deadline) const {
    in_addr numeric{};
    if (inet_pton(AF_INET, host.c_str(), &numeric) == 1) {
        return ntohl(numeric.s_addr);
    }
    if (!resolver_) {
        return std::nullopt;
    }

    // getaddrinfo() has no timeout; a lookup that outlives the deadline
    // finishes on its own thread and its answer is dropped
    auto answer = std::make_shared<std::promise<std::optional<std::uint32_t>>>();
    std::future<std::optional<std::uint32_t>> pending = answer->get_future();
    try {
        std::thread([answer, resolver = resolver_, host]() {
            try {
                answer->set_value(resolver(host));
            } catch (const std::exception& e) {
                LOG_DEBUG_COMP_IF("Lookup of " + host + " failed: " + e.what(), "TcpProber");
                answer->set_value(std::nullopt);
            }
        }).detach();
    } catch (const std::system_error& e) {
        LOG_WARN_COMP(std::string("Cannot start host lookup: ") + e.what(), "TcpProber");
        return std::nullopt;
    }

    if (pending.wait_until(deadline) != std::future_status::ready) {
        LOG_DEBUG_COMP_IF("Lookup of " + host + " timed out", "TcpProber");
        return std::nullopt;
    }
    return pending.get();
}

std::optional<int> PosixTcpProber::probe(const std::string& host, int port,
                                         std::chrono::milliseconds timeout) {
    const auto startedAt = std::chrono::steady_clock::now();
    const auto deadline = startedAt + timeout;

    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }

    const auto resolved = resolveBefore(host, deadline);
    if (!resolved) {
        LOG_DEBUG_COMP_IF("Cannot resolve " + host, "TcpProber");
        return std::nullopt;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        LOG_DEBUG_COMP_IF(host + ":" + std::to_string(port) + " timed out", "TcpProber");
        return std::nullopt;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(*resolved);

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock) {
        LOG_WARN_COMP("Failed to create probe socket: " + errnoMessage(errno), "TcpProber");
        return std::nullopt;
    }

    int flags = fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::nullopt;
    }

    int rc = ::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        LOG_DEBUG_COMP_IF(host + ":" + std::to_string(port) + " connect failed: " + errnoMessage(errno), "TcpProber");
        return std::nullopt;
    }

    if (rc != 0) {
        // Wait for writability, restarting on EINTR with the remaining time
        for (;;) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                LOG_DEBUG_COMP_IF(host + ":" + std::to_string(port) + " timed out", "TcpProber");
                return std::nullopt;
            }

            struct pollfd pfd{};
            pfd.fd = sock.get();
            pfd.events = POLLOUT;
            int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready < 0 && errno == EINTR) {
                continue;
            }
            if (ready <= 0) {
                LOG_DEBUG_COMP_IF(host + ":" + std::to_string(port) + " timed out", "TcpProber");
                return std::nullopt;
            }
            break;
        }

        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            LOG_DEBUG_COMP_IF(host + ":" + std::to_string(port) + " unreachable: " + errnoMessage(error), "TcpProber");
            return std::nullopt;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt).count();
    return std::max<int>(config::MIN_REPORTED_LATENCY_MS, static_cast<int>(elapsed));
}

} // namespace LanScout
