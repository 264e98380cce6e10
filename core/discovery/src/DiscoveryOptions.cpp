#include "DiscoveryOptions.h"
#include "Config.h"
#include "Logger.h"

namespace LanScout {

namespace {

void applyMillis(const Config& cfg, const char* key, int minValue,
                 std::chrono::milliseconds& target) {
    if (!cfg.hasKey(key)) return;
    int value = cfg.getInt(key, -1);
    if (value < minValue) {
        Logger::instance().warn(std::string("Ignoring invalid ") + key + "=" + cfg.get(key), "Config");
        return;
    }
    target = std::chrono::milliseconds(value);
}

// Shipped bounds can be lowered for development and tests, never raised
void applyCeiling(const Config& cfg, const char* key, int ceiling, int& target) {
    if (target > ceiling) {
        Logger::instance().warn(std::string(key) + "=" + cfg.get(key) + " exceeds " +
                                std::to_string(ceiling) + ", clamped", "Config");
        target = ceiling;
    }
}

void applyCeiling(const Config& cfg, const char* key, int ceiling, std::chrono::milliseconds& target) {
    int value = static_cast<int>(target.count());
    applyCeiling(cfg, key, ceiling, value);
    target = std::chrono::milliseconds(value);
}

void applyInt(const Config& cfg, const char* key, int minValue, int maxValue, int& target) {
    if (!cfg.hasKey(key)) return;
    int value = cfg.getInt(key, minValue - 1);
    if (value < minValue || value > maxValue) {
        Logger::instance().warn(std::string("Ignoring invalid ") + key + "=" + cfg.get(key), "Config");
        return;
    }
    target = value;
}

} // namespace

DiscoveryOptions DiscoveryOptions::fromConfig(const Config& cfg) {
    DiscoveryOptions options;

    applyMillis(cfg, "scan_duration_ms", 1, options.scanDuration);
    applyMillis(cfg, "probe_timeout_ms", 1, options.probeTimeout);
    applyMillis(cfg, "resolve_timeout_ms", 1, options.resolveTimeout);
    applyInt(cfg, "probe_concurrency", 1, 1024, options.probeConcurrency);
    applyInt(cfg, "probe_port", 1, 65535, options.probePort);
    applyInt(cfg, "resolver_threads", 1, 64, options.resolverThreads);

    applyCeiling(cfg, "scan_duration_ms", config::SCAN_DURATION_MS, options.scanDuration);
    applyCeiling(cfg, "probe_timeout_ms", config::PROBE_TIMEOUT_MS, options.probeTimeout);
    applyCeiling(cfg, "probe_concurrency", config::PROBE_CONCURRENCY, options.probeConcurrency);

    int maxHosts = static_cast<int>(options.maxHosts);
    applyInt(cfg, "max_hosts", 1, 100000, maxHosts);
    options.maxHosts = static_cast<std::size_t>(maxHosts);

    options.serviceTypes = cfg.getList("service_types", options.serviceTypes);
    options.serviceDomain = cfg.get("service_domain", options.serviceDomain);
    options.preferredInterfacePrefixes =
        cfg.getList("preferred_interfaces", options.preferredInterfacePrefixes);
    options.enableServiceDiscovery = cfg.getBool("enable_service_discovery", options.enableServiceDiscovery);
    options.enableActiveProbe = cfg.getBool("enable_active_probe", options.enableActiveProbe);

    return options;
}

} // namespace LanScout
