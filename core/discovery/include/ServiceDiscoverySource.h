#pragma once

/**
 * @file ServiceDiscoverySource.h
 * @brief Turns DNS-SD advertisements into HostFound events
 */

#include "DiscoveryEvent.h"
#include "DiscoveryOptions.h"
#include "ServiceBrowser.h"
#include "ThreadPool.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace LanScout {

/**
 * @brief Fallback host label for an advertisement that did not resolve.
 *
 * Trims, folds Latin-1 accented letters to ASCII, lowercases and joins
 * whitespace runs with '-'. Returns `name` unchanged if nothing is left.
 */
std::string sanitizeHostLabel(const std::string& name);

/// Strip surrounding whitespace and trailing dots from a resolved host name
std::string normalizeResolvedHost(const std::string& hostName);

/**
 * @brief Service discovery half of a scan session
 *
 * Emits SourceStatus(ServiceDiscovery, Started) on start() but never the
 * matching Finished; browsing has no natural end and the owning session
 * decides when it is over.
 */
class ServiceDiscoverySource : public BrowseListener {
public:
    using EventSink = std::function<void(DiscoveryEvent)>;

    ServiceDiscoverySource(std::unique_ptr<ServiceBrowser> browser, DiscoveryOptions options);
    ~ServiceDiscoverySource() override;

    ServiceDiscoverySource(const ServiceDiscoverySource&) = delete;
    ServiceDiscoverySource& operator=(const ServiceDiscoverySource&) = delete;

    /**
     * @brief Start browsing. A browser failure is reported (permission denial
     *        as an event, anything else in the log) and returned; the source
     *        itself stays open until stop().
     * @throws std::system_error if the resolver pool cannot be created
     */
    VoidResult start(EventSink sink);

    /// Idempotent; joins resolver workers and drops queued resolutions
    void stop();

    /// Distinct advertisements seen so far
    std::size_t advertisementCount() const;

    void onServiceFound(const ServiceAdvertisement& advertisement) override;
    void onBrowseError(const BrowseError& error) override;

private:
    void resolveAndEmit(const ServiceAdvertisement& advertisement);
    void reportPermissionDenied();
    void emit(DiscoveryEvent event);

    std::unique_ptr<ServiceBrowser> browser_;
    DiscoveryOptions options_;
    EventSink sink_;
    std::unique_ptr<ThreadPool> resolvers_;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> seen_;
    bool started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> permissionReported_{false};
};

} // namespace LanScout
