#pragma once

/**
 * @file DiscoveryManager.h
 * @brief Stateful front end that consumes scan streams for a UI or CLI
 */

#include "DiscoveryController.h"
#include "EventBus.h"
#include "HostAggregator.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace LanScout {

/**
 * @brief Aggregated scan state, rebuilt from the event stream
 */
class DiscoveryManager {
public:
    enum class ScanState {
        Idle,
        Scanning,
        Completed,
        UnsupportedNetwork,
        Failed
    };

    enum class PermissionState {
        Unknown,
        Granted,
        Denied
    };

    /// Payload of STATE_CHANGED
    struct Status {
        ScanState scanState{ScanState::Idle};
        PermissionState permission{PermissionState::Unknown};
        bool serviceDiscoveryActive{false};
        bool activeProbeActive{false};
        std::size_t hostCount{0};
        std::string error;
        std::string statusText;
    };

    // EventBus topics. HOSTS_CHANGED carries std::vector<DiscoveredHost>,
    // STATE_CHANGED a Status, EVENT every raw DiscoveryEvent.
    static constexpr const char* HOSTS_CHANGED = "discovery.hosts_changed";
    static constexpr const char* STATE_CHANGED = "discovery.state_changed";
    static constexpr const char* EVENT = "discovery.event";

    explicit DiscoveryManager(std::unique_ptr<DiscoveryController> controller,
                              std::shared_ptr<EventBus> bus = nullptr);
    ~DiscoveryManager();

    DiscoveryManager(const DiscoveryManager&) = delete;
    DiscoveryManager& operator=(const DiscoveryManager&) = delete;

    /**
     * @brief Stop any running scan, clear results and start a new one.
     *
     * Without a usable interface the scan still runs with an empty probe
     * phase; it ends in UnsupportedNetwork when it finds no host.
     */
    void startScan();
    void rescan() { startScan(); }
    void stopScan(bool clearResults = false);

    /**
     * @brief Block until the current scan's stream has ended.
     * @return false on timeout
     */
    bool waitForCompletion(std::chrono::milliseconds timeout);

    ScanState scanState() const;
    PermissionState permissionState() const;
    bool isScanning() const { return scanState() == ScanState::Scanning; }
    bool isSourceActive(DiscoverySource source) const;
    std::string error() const;
    std::string statusText() const;
    Status status() const;

    std::vector<DiscoveredHost> hosts() const;
    std::optional<ServerFormPrefill> prefill(const std::string& identityKey) const;

    EventBus& bus() { return *bus_; }

private:
    void stopLocked(bool clearResults);
    void pumpEvents(std::shared_ptr<DiscoveryStream> stream);
    void handleEvent(const DiscoveryEvent& event);
    bool hasUsableInterface() const;
    ScanState completedStateLocked() const;

    Status statusLocked() const;
    std::string statusTextLocked() const;
    void publishState();
    void publishHosts();

    std::unique_ptr<DiscoveryController> controller_;
    std::shared_ptr<EventBus> bus_;

    // Serialises start/stop; never taken by the pump thread
    std::mutex controlMutex_;
    std::thread pump_;
    std::atomic<bool> stopRequested_{false};

    mutable std::mutex stateMutex_;
    std::condition_variable completionCv_;
    bool pumpDone_{true};
    HostAggregator aggregator_;
    ScanState scanState_{ScanState::Idle};
    PermissionState permission_{PermissionState::Unknown};
    std::string error_;
    bool serviceActive_{false};
    bool probeActive_{false};
    // Set when the scan started without a qualifying interface
    bool noUsableInterface_{false};
};

const char* scanStateName(DiscoveryManager::ScanState state);
const char* permissionStateName(DiscoveryManager::PermissionState state);

} // namespace LanScout
