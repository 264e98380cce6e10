#include "SubnetEnumerator.h"
#include "Constants.h"
#include "Logger.h"

#include <arpa/inet.h>
#include <bitset>
#include <netinet/in.h>

namespace LanScout {

namespace {

constexpr std::uint32_t SLASH24_MASK = 0xFFFFFF00u;

bool hasPrefix(const std::string& name, const std::string& prefix) {
    return !prefix.empty() && name.compare(0, prefix.size(), prefix) == 0;
}

void fillHosts(CandidateAddressSet& set) {
    // Need at least one address strictly between network and broadcast
    if (set.broadcast <= set.network || set.broadcast - set.network < 2) {
        return;
    }
    const std::uint32_t first = set.network + 1;
    const std::uint32_t last = set.broadcast - 1;
    set.hosts.reserve(last - first + 1);
    for (std::uint32_t ip = first; ip <= last; ++ip) {
        if (ip != set.localAddress) {
            set.hosts.push_back(ip);
        }
    }
}

} // namespace

std::vector<std::string> CandidateAddressSet::hostStrings() const {
    std::vector<std::string> out;
    out.reserve(hosts.size());
    for (auto ip : hosts) {
        out.push_back(formatIPv4(ip));
    }
    return out;
}

std::string formatIPv4(std::uint32_t hostOrderAddress) {
    in_addr addr{};
    addr.s_addr = htonl(hostOrderAddress);
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
        return "";
    }
    return buf;
}

std::optional<std::uint32_t> parseIPv4(const std::string& text) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

int prefixLengthFromNetmask(std::uint32_t netmask) {
    return static_cast<int>(std::bitset<32>(netmask).count());
}

bool isQualifyingInterface(const NetworkInterface& iface) {
    return iface.isUp && !iface.isLoopback && iface.address != 0 && iface.netmask != 0;
}

std::optional<NetworkInterface> selectInterface(const std::vector<NetworkInterface>& interfaces,
                                                const std::vector<std::string>& preferredPrefixes) {
    std::optional<NetworkInterface> selected;
    for (const auto& iface : interfaces) {
        if (!isQualifyingInterface(iface)) {
            continue;
        }
        for (const auto& prefix : preferredPrefixes) {
            if (hasPrefix(iface.name, prefix)) {
                return iface;
            }
        }
        selected = iface;
    }
    return selected;
}

CandidateAddressSet computeCandidates(std::uint32_t address, std::uint32_t netmask) {
    CandidateAddressSet set;
    set.localAddress = address;
    set.prefixLength = prefixLengthFromNetmask(netmask);

    if (set.prefixLength < config::MIN_SCANNED_PREFIX) {
        set.clamped = true;
        set.network = address & SLASH24_MASK;
        set.broadcast = set.network | ~SLASH24_MASK;
    } else {
        set.network = address & netmask;
        set.broadcast = set.network | ~netmask;
    }

    fillHosts(set);
    return set;
}

CandidateAddressSet enumerateCandidates(InterfaceSnapshotProvider& provider,
                                        const std::vector<std::string>& preferredPrefixes) {
    auto& logger = Logger::instance();

    auto snapshot = provider.snapshot();
    if (!snapshot) {
        logger.warn("Interface snapshot unavailable: " + snapshot.error().toString(), "SubnetEnumerator");
        return {};
    }

    auto iface = selectInterface(snapshot.value(), preferredPrefixes);
    if (!iface) {
        logger.info("No qualifying IPv4 interface; skipping active probe", "SubnetEnumerator");
        return {};
    }

    CandidateAddressSet set = computeCandidates(iface->address, iface->netmask);
    set.interfaceName = iface->name;

    logger.info("Selected " + iface->name + " " + formatIPv4(iface->address) + "/" +
                std::to_string(set.prefixLength) + ", " + std::to_string(set.size()) + " candidate(s)" +
                (set.clamped ? " (clamped to local /24)" : ""),
                "SubnetEnumerator");
    return set;
}

} // namespace LanScout
