#include "NetworkInterfaces.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace LanScout {

Result<std::vector<NetworkInterface>> SystemInterfaceProvider::snapshot() {
    struct ifaddrs* head = nullptr;
    if (getifaddrs(&head) != 0) {
        int err = errno;
        return Error("getifaddrs failed: " + errnoMessage(err), err, "NetworkInterfaces");
    }

    std::vector<NetworkInterface> result;
    for (auto* it = head; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = it->ifa_name ? it->ifa_name : "";
        iface.address = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
        if (it->ifa_netmask) {
            iface.netmask = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
        }
        iface.isUp = (it->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
        result.push_back(std::move(iface));
    }

    freeifaddrs(head);
    return result;
}

} // namespace LanScout
