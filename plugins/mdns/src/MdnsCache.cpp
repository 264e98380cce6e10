#include "MdnsCache.h"

#include <algorithm>

namespace LanScout::Mdns {

void MdnsCache::setServices(const std::vector<std::string>& types, const std::string& domain) {
    services_.clear();
    for (const auto& type : types) {
        const std::string key = canonicalName(joinInstanceName("x", type, domain));
        // Drop the "x." placeholder instance label
        services_[key.substr(2)] = Service{type, domain};
    }
}

std::vector<ServiceAdvertisement> MdnsCache::ingest(const DnsMessage& message) {
    std::vector<ServiceAdvertisement> fresh;

    for (const DnsRecord* record : message.allRecords()) {
        if (record->rrClass != CLASS_IN) {
            continue;
        }
        const std::string key = canonicalName(record->name);

        switch (record->type) {
            case TYPE_PTR: {
                // ttl 0 is a goodbye; nothing to withdraw from a one-shot scan
                if (record->ttl == 0) {
                    break;
                }
                auto service = services_.find(key);
                if (service == services_.end()) {
                    break;
                }
                auto parts = splitInstanceName(record->target);
                if (!parts) {
                    break;
                }
                ServiceAdvertisement advertisement{parts->label, service->second.type, service->second.domain};
                if (instances_.insert(instanceKey(advertisement)).second) {
                    fresh.push_back(std::move(advertisement));
                }
                break;
            }
            case TYPE_SRV:
                srv_[key] = Srv{record->port, record->target};
                break;
            case TYPE_TXT:
                txt_[key] = record->txt;
                break;
            case TYPE_A: {
                auto& list = addresses_[key];
                if (std::find(list.begin(), list.end(), record->address) == list.end()) {
                    list.push_back(record->address);
                }
                break;
            }
            default:
                break;
        }
    }

    return fresh;
}

std::optional<ResolvedService> MdnsCache::lookup(const ServiceAdvertisement& advertisement) const {
    auto srv = srv_.find(instanceKey(advertisement));
    if (srv == srv_.end()) {
        return std::nullopt;
    }

    ResolvedService resolved;
    resolved.hostName = srv->second.target;
    resolved.port = srv->second.port;
    auto addrs = addresses_.find(canonicalName(srv->second.target));
    if (addrs != addresses_.end()) {
        resolved.addresses = addrs->second;
    }
    return resolved;
}

std::vector<std::string> MdnsCache::txtFor(const ServiceAdvertisement& advertisement) const {
    auto it = txt_.find(instanceKey(advertisement));
    return it == txt_.end() ? std::vector<std::string>{} : it->second;
}

void MdnsCache::clear() {
    instances_.clear();
    srv_.clear();
    txt_.clear();
    addresses_.clear();
}

std::string MdnsCache::instanceKey(const ServiceAdvertisement& advertisement) {
    return canonicalName(joinInstanceName(advertisement.name, advertisement.type, advertisement.domain));
}

} // namespace LanScout::Mdns
