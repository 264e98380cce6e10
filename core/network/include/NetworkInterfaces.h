#pragma once

/**
 * @file NetworkInterfaces.h
 * @brief Read-only IPv4 interface snapshot and its providers
 */

#include "Result.h"

#include <cstdint>
#include <string>
#include <vector>

namespace LanScout {

/**
 * @brief One IPv4 address bound to an interface
 *
 * Addresses and masks are in host byte order.
 */
struct NetworkInterface {
    std::string name;
    std::uint32_t address{0};
    std::uint32_t netmask{0};
    bool isUp{false};
    bool isLoopback{false};
};

/**
 * @brief Source of the current interface table
 */
class InterfaceSnapshotProvider {
public:
    virtual ~InterfaceSnapshotProvider() = default;
    virtual Result<std::vector<NetworkInterface>> snapshot() = 0;
};

/**
 * @brief Reads the live table with getifaddrs()
 */
class SystemInterfaceProvider : public InterfaceSnapshotProvider {
public:
    Result<std::vector<NetworkInterface>> snapshot() override;
};

/**
 * @brief Returns a fixed table (tests and manual overrides)
 */
class StaticInterfaceProvider : public InterfaceSnapshotProvider {
public:
    explicit StaticInterfaceProvider(std::vector<NetworkInterface> interfaces)
        : interfaces_(std::move(interfaces)) {}

    Result<std::vector<NetworkInterface>> snapshot() override { return interfaces_; }

private:
    std::vector<NetworkInterface> interfaces_;
};

} // namespace LanScout
