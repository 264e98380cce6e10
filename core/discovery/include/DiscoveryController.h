#pragma once

/**
 * @file DiscoveryController.h
 * @brief Public entry point: at most one scan session at a time
 */

#include "DiscoverySession.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace LanScout {

/**
 * @brief Starts, replaces and stops discovery sessions.
 *
 * Starting a scan always tears the previous session down completely before
 * the new one emits anything, so a stream only ever carries events of the
 * session that created it.
 */
class DiscoveryController {
public:
    /// Creates a fresh browser per session; may return nullptr
    using BrowserFactory = std::function<std::unique_ptr<ServiceBrowser>()>;

    enum class State {
        Idle,
        Scanning,
        Finished
    };

    DiscoveryController(std::shared_ptr<InterfaceSnapshotProvider> interfaces,
                        std::shared_ptr<TcpProber> prober,
                        BrowserFactory browserFactory,
                        DiscoveryOptions options = DiscoveryOptions{});
    ~DiscoveryController();

    DiscoveryController(const DiscoveryController&) = delete;
    DiscoveryController& operator=(const DiscoveryController&) = delete;

    /**
     * @brief Begin a new session and return its event stream.
     *
     * Never throws. If the session cannot be started the returned stream
     * holds ScanningStarted, Failed(reason) and ScanningFinished.
     */
    std::shared_ptr<DiscoveryStream> startScan();

    /// Stop the active session, if any, and close its stream
    void stopScan();

    std::shared_ptr<DiscoveryStream> rescan();

    State state() const;

    const DiscoveryOptions& options() const { return options_; }
    std::shared_ptr<InterfaceSnapshotProvider> interfaceProvider() const { return interfaces_; }

    /// Sessions created so far, including failed ones
    std::uint64_t sessionCount() const;

private:
    void stopLocked();

    std::shared_ptr<InterfaceSnapshotProvider> interfaces_;
    std::shared_ptr<TcpProber> prober_;
    BrowserFactory browserFactory_;
    DiscoveryOptions options_;

    mutable std::mutex mutex_;
    std::unique_ptr<DiscoverySession> session_;
    State idleState_{State::Idle};
    std::uint64_t nextSessionId_{1};
};

const char* controllerStateName(DiscoveryController::State state);

} // namespace LanScout
