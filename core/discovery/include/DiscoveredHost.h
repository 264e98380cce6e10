#pragma once

/**
 * @file DiscoveredHost.h
 * @brief One candidate SSH endpoint and the form prefill derived from it
 */

#include "Constants.h"

#include <chrono>
#include <optional>
#include <set>
#include <string>

namespace LanScout {

/**
 * @brief Where an observation came from
 */
enum class DiscoverySource {
    ServiceDiscovery,
    ActiveProbe
};

/// User-facing label ("Service Discovery", "Port Scan")
const char* discoverySourceLabel(DiscoverySource source);

/// Stable machine name ("service_discovery", "active_probe")
const char* discoverySourceName(DiscoverySource source);

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief A host reachable over SSH, identified by host:port
 */
struct DiscoveredHost {
    std::string displayName;
    std::string host;
    int port{config::SSH_PORT};
    std::set<DiscoverySource> sources;
    Timestamp lastSeenAt{};
    std::optional<int> latencyMs;

    // When the kept displayName and latencyMs were observed
    Timestamp nameSeenAt{};
    Timestamp latencySeenAt{};

    DiscoveredHost() = default;

    /// An empty displayName falls back to the host
    DiscoveredHost(std::string displayName,
                   std::string host,
                   int port,
                   std::set<DiscoverySource> sources,
                   Timestamp lastSeenAt = std::chrono::system_clock::now(),
                   std::optional<int> latencyMs = std::nullopt);

    /// "{host}:{port}"; the deduplication key
    std::string identityKey() const;

    /// True when displayName carries no more information than host
    bool hasGenericName() const;

    bool hasSource(DiscoverySource source) const;

    /**
     * @brief Fold another observation of the same key into this record.
     *
     * Sources are unioned, lastSeenAt keeps the maximum, latency and a
     * non-generic display name follow the newer observation of each. Ties go
     * to the smaller name or latency, so the outcome does not depend on the
     * order observations are merged in.
     */
    void merge(const DiscoveredHost& other);
};

bool operator==(const DiscoveredHost& lhs, const DiscoveredHost& rhs);
inline bool operator!=(const DiscoveredHost& lhs, const DiscoveredHost& rhs) { return !(lhs == rhs); }

/**
 * @brief Values handed to the server creation form
 *
 * Discovery never supplies credentials; username stays empty.
 */
struct ServerFormPrefill {
    std::string name;
    std::string host;
    int port{config::SSH_PORT};
    std::optional<std::string> username;

    ServerFormPrefill() = default;
    ServerFormPrefill(std::string name, std::string host, int port = config::SSH_PORT,
                      std::optional<std::string> username = std::nullopt);
    explicit ServerFormPrefill(const DiscoveredHost& discovered);

    bool operator==(const ServerFormPrefill& other) const {
        return name == other.name && host == other.host && port == other.port &&
               username == other.username;
    }
};

} // namespace LanScout
