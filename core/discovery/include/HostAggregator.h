#pragma once

/**
 * @file HostAggregator.h
 * @brief Deduplicated, capped and ordered view of discovered hosts
 */

#include "DiscoveredHost.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LanScout {

/**
 * @brief Display order: service-discovery hosts first, then display name
 *        and host (both case-insensitive), then port.
 */
bool hostDisplayOrder(const DiscoveredHost& lhs, const DiscoveredHost& rhs);

/**
 * @brief Folds HostFound observations into one record per host:port.
 *
 * The result depends only on the set of observations, not on the order in
 * which they were upserted. Not thread-safe; the owner serialises access.
 */
class HostAggregator {
public:
    explicit HostAggregator(std::size_t maxHosts = config::MAX_HOSTS);

    /**
     * @return true if the visible set changed. Hosts with an empty address
     *         are ignored; new keys are rejected once maxHosts are held.
     */
    bool upsert(const DiscoveredHost& host);

    /// Snapshot in display order
    std::vector<DiscoveredHost> hosts() const;

    std::optional<DiscoveredHost> find(const std::string& identityKey) const;

    std::size_t size() const { return byKey_.size(); }
    bool empty() const { return byKey_.empty(); }
    std::size_t maxHosts() const { return maxHosts_; }
    void clear() { byKey_.clear(); }

private:
    std::unordered_map<std::string, DiscoveredHost> byKey_;
    std::size_t maxHosts_;
};

} // namespace LanScout
