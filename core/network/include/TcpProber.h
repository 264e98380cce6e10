#pragma once

/**
 * @file TcpProber.h
 * @brief Timed TCP reachability check for a single host:port
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace LanScout {

/**
 * @brief Reachability probe seam
 *
 * Implementations must be safe to call from many threads at once and keep
 * no shared mutable state between calls.
 */
class TcpProber {
public:
    virtual ~TcpProber() = default;

    /**
     * @return connect latency in milliseconds (>= 1) once the connection is
     *         fully established, or std::nullopt on refusal, unreachability
     *         or timeout.
     */
    virtual std::optional<int> probe(const std::string& host, int port,
                                     std::chrono::milliseconds timeout) = 0;
};

/// Maps a host name to an IPv4 address in host byte order
using HostResolver = std::function<std::optional<std::uint32_t>(const std::string& host)>;

/**
 * @brief Non-blocking connect() + poll() prober
 *
 * Dotted-quad hosts are used as is. Other names go through the resolver on a
 * helper thread, and the lookup counts against the probe timeout.
 */
class PosixTcpProber : public TcpProber {
public:
    PosixTcpProber();
    explicit PosixTcpProber(HostResolver resolver);

    std::optional<int> probe(const std::string& host, int port,
                             std::chrono::milliseconds timeout) override;

    /// Blocking getaddrinfo() lookup restricted to AF_INET
    static std::optional<std::uint32_t> systemResolve(const std::string& host);

private:
    std::optional<std::uint32_t> resolveBefore(const std::string& host,
                                               std::chrono::steady_clock::time_point deadline) const;

    HostResolver resolver_;
};

} // namespace LanScout
