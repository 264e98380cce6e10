#pragma once

/**
 * @file MdnsCache.h
 * @brief Joins PTR, SRV, TXT and address records collected across packets
 */

#include "DnsMessage.h"
#include "ServiceBrowser.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace LanScout::Mdns {

/**
 * @brief Record store for one browse session
 *
 * Keys are canonical names, so lookups ignore ASCII case and trailing dots.
 * Not thread-safe.
 */
class MdnsCache {
public:
    /// Service types to accept PTR records for, e.g. {"_ssh._tcp."} in "local."
    void setServices(const std::vector<std::string>& types, const std::string& domain);

    /**
     * @brief Merge every record of `message`.
     * @return advertisements seen for the first time, in record order
     */
    std::vector<ServiceAdvertisement> ingest(const DnsMessage& message);

    /**
     * @return SRV target and port once an SRV record is known for the
     *         instance, with any IPv4 addresses known for the target
     */
    std::optional<ResolvedService> lookup(const ServiceAdvertisement& advertisement) const;

    std::vector<std::string> txtFor(const ServiceAdvertisement& advertisement) const;

    std::size_t instanceCount() const { return instances_.size(); }
    void clear();

private:
    struct Srv {
        std::uint16_t port{0};
        std::string target;
    };

    struct Service {
        std::string type;
        std::string domain;
    };

    static std::string instanceKey(const ServiceAdvertisement& advertisement);

    std::unordered_map<std::string, Service> services_;       // "_ssh._tcp.local" -> configured spelling
    std::unordered_set<std::string> instances_;               // instance keys announced by PTR
    std::unordered_map<std::string, Srv> srv_;
    std::unordered_map<std::string, std::vector<std::string>> txt_;
    std::unordered_map<std::string, std::vector<std::string>> addresses_;
};

} // namespace LanScout::Mdns
