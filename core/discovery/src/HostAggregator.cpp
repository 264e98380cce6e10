#include "HostAggregator.h"

#include <algorithm>
#include <cctype>

namespace LanScout {

namespace {

int compareIgnoreCase(const std::string& lhs, const std::string& rhs) {
    const std::size_t n = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int a = std::tolower(static_cast<unsigned char>(lhs[i]));
        const int b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b) {
            return a < b ? -1 : 1;
        }
    }
    if (lhs.size() == rhs.size()) {
        return 0;
    }
    return lhs.size() < rhs.size() ? -1 : 1;
}

} // namespace

bool hostDisplayOrder(const DiscoveredHost& lhs, const DiscoveredHost& rhs) {
    const bool lhsService = lhs.hasSource(DiscoverySource::ServiceDiscovery);
    const bool rhsService = rhs.hasSource(DiscoverySource::ServiceDiscovery);
    if (lhsService != rhsService) {
        return lhsService;
    }

    if (int c = compareIgnoreCase(lhs.displayName, rhs.displayName)) {
        return c < 0;
    }
    if (int c = compareIgnoreCase(lhs.host, rhs.host)) {
        return c < 0;
    }
    if (lhs.host != rhs.host) {
        return lhs.host < rhs.host;
    }
    return lhs.port < rhs.port;
}

HostAggregator::HostAggregator(std::size_t maxHosts)
    : maxHosts_(maxHosts) {}

bool HostAggregator::upsert(const DiscoveredHost& host) {
    if (host.host.empty()) {
        return false;
    }

    const std::string key = host.identityKey();
    auto it = byKey_.find(key);
    if (it == byKey_.end()) {
        if (byKey_.size() >= maxHosts_) {
            return false;
        }
        byKey_.emplace(key, host);
        return true;
    }

    DiscoveredHost merged = it->second;
    merged.merge(host);
    if (merged == it->second) {
        return false;
    }
    it->second = std::move(merged);
    return true;
}

std::vector<DiscoveredHost> HostAggregator::hosts() const {
    std::vector<DiscoveredHost> out;
    out.reserve(byKey_.size());
    for (const auto& entry : byKey_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), hostDisplayOrder);
    return out;
}

std::optional<DiscoveredHost> HostAggregator::find(const std::string& identityKey) const {
    auto it = byKey_.find(identityKey);
    if (it == byKey_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace LanScout
