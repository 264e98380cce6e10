#pragma once

/**
 * @file MdnsServiceBrowser.h
 * @brief DNS-SD browser over IPv4 multicast DNS
 */

#include "Constants.h"
#include "MdnsCache.h"
#include "ServiceBrowser.h"
#include "SocketGuard.h"

#include <netinet/in.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace LanScout::Mdns {

struct MdnsBrowserOptions {
    std::uint16_t port{config::MDNS_PORT};
    std::string group{config::MDNS_GROUP_IPV4};
    int queryBursts{config::MDNS_QUERY_BURSTS};
    std::chrono::milliseconds requeryInterval{config::MDNS_REQUERY_INTERVAL_MS};
    std::chrono::milliseconds resolveRequery{config::MDNS_RESOLVE_REQUERY_MS};
    std::chrono::milliseconds pollSlice{config::MDNS_POLL_SLICE_MS};
};

/**
 * @brief Browses `_service._tcp` PTR records and resolves SRV/TXT/A.
 *
 * Binds UDP 5353 shared with any system responder. When the port cannot be
 * bound it falls back to an ephemeral port and asks for unicast responses.
 * One instance serves one browse; create a new one per session.
 */
class MdnsServiceBrowser : public ServiceBrowser {
public:
    explicit MdnsServiceBrowser(MdnsBrowserOptions options = MdnsBrowserOptions{});
    ~MdnsServiceBrowser() override;

    MdnsServiceBrowser(const MdnsServiceBrowser&) = delete;
    MdnsServiceBrowser& operator=(const MdnsServiceBrowser&) = delete;

    /**
     * @return an Error with errno in `code` when the socket cannot be set
     *         up (EACCES/EPERM for a policy denial)
     */
    VoidResult start(const std::vector<std::string>& serviceTypes,
                     const std::string& domain,
                     BrowseListener& listener) override;

    std::optional<ResolvedService> resolve(const ServiceAdvertisement& advertisement,
                                           std::chrono::milliseconds timeout) override;

    void stop() override;

    bool isRunning() const { return running_; }
    bool usingUnicastFallback() const { return unicastFallback_; }

private:
    VoidResult openSocket();
    void browseLoop();
    void receiveOne(std::vector<std::uint8_t>& buffer);
    void sendServiceQueries();

    /// Multicast `packet` on every joined interface; returns the last errno or 0
    int sendPacket(const std::vector<std::uint8_t>& packet);
    void reportSendError(int err);

    MdnsBrowserOptions options_;
    std::vector<std::string> serviceNames_;
    BrowseListener* listener_{nullptr};

    SocketGuard socket_;
    std::vector<in_addr> interfaces_;
    std::atomic<bool> unicastFallback_{false};
    std::atomic<bool> running_{false};
    std::thread browseThread_;
    std::mutex lifecycleMutex_;
    std::mutex sendMutex_;

    mutable std::mutex cacheMutex_;
    std::condition_variable cacheCv_;
    MdnsCache cache_;
};

} // namespace LanScout::Mdns
