#pragma once

/**
 * @file SubnetEnumerator.h
 * @brief Picks the active interface and lists the addresses worth probing
 */

#include "NetworkInterfaces.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LanScout {

/**
 * @brief Addresses selected for active probing in one session
 *
 * Empty `hosts` is a valid outcome (no usable interface, degenerate range).
 */
struct CandidateAddressSet {
    std::string interfaceName;
    std::uint32_t localAddress{0};
    std::uint32_t network{0};
    std::uint32_t broadcast{0};
    int prefixLength{0};
    bool clamped{false};          ///< true when a wide subnet was cut down to the local /24
    std::vector<std::uint32_t> hosts;

    bool empty() const { return hosts.empty(); }
    std::size_t size() const { return hosts.size(); }
    std::vector<std::string> hostStrings() const;
};

std::string formatIPv4(std::uint32_t hostOrderAddress);
std::optional<std::uint32_t> parseIPv4(const std::string& text);

int prefixLengthFromNetmask(std::uint32_t netmask);

/**
 * @brief Up, non-loopback, with a non-zero address and mask
 */
bool isQualifyingInterface(const NetworkInterface& iface);

/**
 * @brief Choose the interface to scan.
 *
 * The first qualifying interface whose name starts with one of
 * `preferredPrefixes` wins; otherwise the last qualifying one.
 */
std::optional<NetworkInterface> selectInterface(const std::vector<NetworkInterface>& interfaces,
                                                const std::vector<std::string>& preferredPrefixes);

/**
 * @brief Host range for `address`/`netmask`, excluding network, broadcast
 *        and `address` itself. Prefixes shorter than /24 are clamped to the
 *        /24 containing `address`.
 */
CandidateAddressSet computeCandidates(std::uint32_t address, std::uint32_t netmask);

/**
 * @brief Snapshot, select and compute in one call; fails closed to an empty set.
 */
CandidateAddressSet enumerateCandidates(InterfaceSnapshotProvider& provider,
                                        const std::vector<std::string>& preferredPrefixes);

} // namespace LanScout
