#pragma once

/**
 * @file ProbeScheduler.h
 * @brief Runs the reachability prober over a candidate set in bounded waves
 */

#include "DiscoveryEvent.h"
#include "DiscoveryOptions.h"
#include "SubnetEnumerator.h"
#include "TcpProber.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>

namespace LanScout {

/**
 * @brief Wave scheduler for active probes
 *
 * At most `probeConcurrency` probes are in flight at any time. Each wave is
 * started as soon as the previous one has fully completed. Successful probes
 * are reported through the sink from the worker that ran them.
 */
class ProbeScheduler {
public:
    using EventSink = std::function<void(DiscoveryEvent)>;

    struct RunStats {
        std::size_t candidates{0};
        std::size_t attempted{0};
        std::size_t found{0};
        std::size_t waves{0};
        bool cancelled{false};
    };

    ProbeScheduler(std::shared_ptr<TcpProber> prober, DiscoveryOptions options);

    /**
     * @brief Probe every candidate; blocks until done or cancelled.
     *
     * Emits HostFound per success and, unless cancelled, exactly one
     * SourceStatus(ActiveProbe, Finished) at the end (also for an empty set).
     * Cancellation is checked before every wave and before every probe.
     *
     * @throws std::system_error if the worker pool cannot be created
     */
    RunStats run(const CandidateAddressSet& candidates,
                 const EventSink& sink,
                 const std::atomic<bool>& cancelled);

private:
    std::shared_ptr<TcpProber> prober_;
    DiscoveryOptions options_;
};

} // namespace LanScout
