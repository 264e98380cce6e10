#pragma once

#include "Constants.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace LanScout {

class Config;

/**
 * @brief Tunables for one discovery session
 *
 * Defaults come from Constants.h and are the shipped behaviour.
 */
struct DiscoveryOptions {
    std::chrono::milliseconds scanDuration{config::SCAN_DURATION_MS};
    std::chrono::milliseconds probeTimeout{config::PROBE_TIMEOUT_MS};
    std::chrono::milliseconds resolveTimeout{config::RESOLVE_TIMEOUT_MS};
    int probeConcurrency{config::PROBE_CONCURRENCY};
    int probePort{config::SSH_PORT};
    int resolverThreads{config::RESOLVER_THREADS};
    std::vector<std::string> serviceTypes{config::SSH_SERVICE_TYPE, config::SFTP_SERVICE_TYPE};
    std::string serviceDomain{config::LOCAL_DOMAIN};
    std::vector<std::string> preferredInterfacePrefixes{"en", "wl", "eth"};
    std::size_t maxHosts{config::MAX_HOSTS};
    bool enableServiceDiscovery{true};
    bool enableActiveProbe{true};

    /**
     * @brief Overlay keys present in `cfg` on top of the defaults.
     *
     * Out-of-range numbers are ignored with a warning. The session length,
     * probe timeout and probe concurrency are clamped to their defaults.
     */
    static DiscoveryOptions fromConfig(const Config& cfg);
};

} // namespace LanScout
