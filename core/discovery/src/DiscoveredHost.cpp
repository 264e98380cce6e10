#include "DiscoveredHost.h"

#include <algorithm>
#include <utility>

namespace LanScout {

const char* discoverySourceLabel(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::ServiceDiscovery: return "Service Discovery";
        case DiscoverySource::ActiveProbe: return "Port Scan";
    }
    return "Unknown";
}

const char* discoverySourceName(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::ServiceDiscovery: return "service_discovery";
        case DiscoverySource::ActiveProbe: return "active_probe";
    }
    return "unknown";
}

DiscoveredHost::DiscoveredHost(std::string displayName,
                               std::string host,
                               int port,
                               std::set<DiscoverySource> sources,
                               Timestamp lastSeenAt,
                               std::optional<int> latencyMs)
    : displayName(displayName.empty() ? host : std::move(displayName)),
      host(std::move(host)),
      port(port),
      sources(std::move(sources)),
      lastSeenAt(lastSeenAt),
      latencyMs(latencyMs),
      nameSeenAt(lastSeenAt),
      latencySeenAt(lastSeenAt) {}

std::string DiscoveredHost::identityKey() const {
    return host + ":" + std::to_string(port);
}

bool DiscoveredHost::hasGenericName() const {
    return displayName.empty() || displayName == host;
}

bool DiscoveredHost::hasSource(DiscoverySource source) const {
    return sources.count(source) > 0;
}

void DiscoveredHost::merge(const DiscoveredHost& other) {
    if (!other.hasGenericName()) {
        if (hasGenericName() || other.nameSeenAt > nameSeenAt ||
            (other.nameSeenAt == nameSeenAt && other.displayName < displayName)) {
            displayName = other.displayName;
            nameSeenAt = other.nameSeenAt;
        }
    } else if (hasGenericName()) {
        nameSeenAt = std::max(nameSeenAt, other.nameSeenAt);
    }

    if (other.latencyMs) {
        if (!latencyMs || other.latencySeenAt > latencySeenAt ||
            (other.latencySeenAt == latencySeenAt && *other.latencyMs < *latencyMs)) {
            latencyMs = other.latencyMs;
            latencySeenAt = other.latencySeenAt;
        }
    } else if (!latencyMs) {
        latencySeenAt = std::max(latencySeenAt, other.latencySeenAt);
    }

    sources.insert(other.sources.begin(), other.sources.end());
    lastSeenAt = std::max(lastSeenAt, other.lastSeenAt);
}

bool operator==(const DiscoveredHost& lhs, const DiscoveredHost& rhs) {
    return lhs.displayName == rhs.displayName &&
           lhs.host == rhs.host &&
           lhs.port == rhs.port &&
           lhs.sources == rhs.sources &&
           lhs.lastSeenAt == rhs.lastSeenAt &&
           lhs.latencyMs == rhs.latencyMs &&
           lhs.nameSeenAt == rhs.nameSeenAt &&
           lhs.latencySeenAt == rhs.latencySeenAt;
}

ServerFormPrefill::ServerFormPrefill(std::string name, std::string host, int port,
                                     std::optional<std::string> username)
    : name(std::move(name)), host(std::move(host)), port(port), username(std::move(username)) {}

ServerFormPrefill::ServerFormPrefill(const DiscoveredHost& discovered)
    : name(discovered.displayName),
      host(discovered.host),
      port(discovered.port) {}

} // namespace LanScout
