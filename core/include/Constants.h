#pragma once

/**
 * @file Constants.h
 * @brief Compile-time defaults for LanScout discovery
 *
 * DiscoveryOptions starts from these values; Config keys may override them
 * for development and tests.
 */

#include <cstddef>
#include <cstdint>

namespace LanScout::config {

// =============================================================================
// Session
// =============================================================================

/// Hard upper bound on one scan session (milliseconds)
constexpr int SCAN_DURATION_MS = 6000;

/// Maximum records kept by the host aggregator
constexpr std::size_t MAX_HOSTS = 200;

// =============================================================================
// Active probing
// =============================================================================

/// Per-probe TCP connect timeout (milliseconds)
constexpr int PROBE_TIMEOUT_MS = 350;

/// Concurrent probes per wave
constexpr int PROBE_CONCURRENCY = 24;

/// Port probed on every candidate address
constexpr std::uint16_t SSH_PORT = 22;

/// Smallest latency ever reported for a successful probe (milliseconds)
constexpr int MIN_REPORTED_LATENCY_MS = 1;

/// Prefix lengths shorter than this are clamped to the local /24
constexpr int MIN_SCANNED_PREFIX = 24;

// =============================================================================
// Service discovery
// =============================================================================

/// Per-advertisement resolution timeout (milliseconds)
constexpr int RESOLVE_TIMEOUT_MS = 2000;

/// Resolutions running in parallel
constexpr int RESOLVER_THREADS = 4;

constexpr const char* SSH_SERVICE_TYPE = "_ssh._tcp.";
constexpr const char* SFTP_SERVICE_TYPE = "_sftp-ssh._tcp.";
constexpr const char* LOCAL_DOMAIN = "local.";

// =============================================================================
// mDNS transport
// =============================================================================

constexpr std::uint16_t MDNS_PORT = 5353;
constexpr const char* MDNS_GROUP_IPV4 = "224.0.0.251";

/// Initial PTR query burst count
constexpr int MDNS_QUERY_BURSTS = 2;

/// PTR re-query interval while browsing (milliseconds)
constexpr int MDNS_REQUERY_INTERVAL_MS = 1000;

/// Resolver re-query interval for SRV/A (milliseconds)
constexpr int MDNS_RESOLVE_REQUERY_MS = 400;

/// Receive poll slice; bounds how long stop() waits for the browse thread
constexpr int MDNS_POLL_SLICE_MS = 100;

constexpr std::size_t MDNS_MAX_PACKET = 9000;

} // namespace LanScout::config
