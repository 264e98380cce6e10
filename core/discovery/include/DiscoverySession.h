#pragma once

/**
 * @file DiscoverySession.h
 * @brief One time-bounded scan: both sources, the timer and their event stream
 */

#include "DiscoveryEvent.h"
#include "DiscoveryOptions.h"
#include "EventChannel.h"
#include "NetworkInterfaces.h"
#include "ServiceBrowser.h"
#include "ServiceDiscoverySource.h"
#include "TcpProber.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace LanScout {

using DiscoveryStream = EventChannel<DiscoveryEvent>;

/**
 * @brief Owns every thread, socket and handle of a single scan.
 *
 * A session is started once and stopped once. Destroying it stops it, so
 * nothing it started can outlive it or write into another session's stream.
 */
class DiscoverySession {
public:
    enum class State {
        Created,
        Running,
        Draining,
        Terminated
    };

    DiscoverySession(std::uint64_t id,
                     std::shared_ptr<InterfaceSnapshotProvider> interfaces,
                     std::shared_ptr<TcpProber> prober,
                     std::unique_ptr<ServiceBrowser> browser,
                     DiscoveryOptions options);
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    /**
     * @brief Emit ScanningStarted, start both sources and arm the timer.
     * @throws std::system_error if a worker thread cannot be created; the
     *         caller must still stop() the session.
     */
    void start();

    /**
     * @brief Cancel everything and close the stream. Idempotent.
     *
     * Returns only after every thread the session started has been joined.
     */
    void stop();

    std::shared_ptr<DiscoveryStream> events() const { return channel_; }
    State state() const { return state_.load(); }
    std::uint64_t id() const { return id_; }

    /// True once the stream is closed (timeout or stop)
    bool isFinished() const { return channel_->isClosed(); }

private:
    void emit(DiscoveryEvent event);
    void runActiveProbe();
    void runTimer();
    void finishOnTimeout();
    void stopWorkers();

    const std::uint64_t id_;
    std::shared_ptr<InterfaceSnapshotProvider> interfaces_;
    std::shared_ptr<TcpProber> prober_;
    std::unique_ptr<ServiceBrowser> browser_;
    DiscoveryOptions options_;

    std::shared_ptr<DiscoveryStream> channel_;
    std::unique_ptr<ServiceDiscoverySource> serviceSource_;
    std::thread probeThread_;
    std::thread timerThread_;

    std::atomic<State> state_{State::Created};
    std::atomic<bool> cancelled_{false};

    // Serialises source-finished bookkeeping with the timeout batch
    std::mutex emitMutex_;
    bool serviceStarted_{false};
    bool serviceFinished_{false};
    bool probeStarted_{false};
    bool probeFinished_{false};

    std::mutex timerMutex_;
    std::condition_variable timerCv_;
    bool stopRequested_{false};

    std::mutex lifecycleMutex_;
    std::mutex workersMutex_;
    bool workersStopped_{false};
    bool stopped_{false};
};

} // namespace LanScout
