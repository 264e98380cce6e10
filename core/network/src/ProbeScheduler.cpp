#include "ProbeScheduler.h"
#include "LoggerMacros.h"
#include "ThreadPool.h"

#include <algorithm>
#include <exception>
#include <future>
#include <vector>

namespace LanScout {

ProbeScheduler::ProbeScheduler(std::shared_ptr<TcpProber> prober, DiscoveryOptions options)
    : prober_(std::move(prober)), options_(std::move(options)) {}

ProbeScheduler::RunStats ProbeScheduler::run(const CandidateAddressSet& candidates,
                                             const EventSink& sink,
                                             const std::atomic<bool>& cancelled) {
    auto& logger = Logger::instance();
    RunStats stats;
    stats.candidates = candidates.size();

    if (candidates.empty()) {
        if (!cancelled) {
            sink(DiscoveryEvent::sourceStatus(DiscoverySource::ActiveProbe, SourceState::Finished));
        }
        return stats;
    }

    SCOPED_TIMER_COMP("Active probe of " + std::to_string(candidates.size()) + " candidates", "ProbeScheduler");

    const std::size_t concurrency = static_cast<std::size_t>(std::max(1, options_.probeConcurrency));
    const auto timeout = options_.probeTimeout;
    const int port = options_.probePort;

    ThreadPool pool(std::min(concurrency, candidates.size()), "ProbeScheduler");
    std::atomic<std::size_t> attempted{0};
    std::atomic<std::size_t> found{0};

    std::size_t start = 0;
    while (start < candidates.size()) {
        if (cancelled) {
            stats.cancelled = true;
            break;
        }

        const std::size_t end = std::min(start + concurrency, candidates.size());
        std::vector<std::future<void>> wave;
        wave.reserve(end - start);

        for (std::size_t i = start; i < end; ++i) {
            const std::string host = formatIPv4(candidates.hosts[i]);
            wave.push_back(pool.enqueue([this, host, port, timeout, &sink, &cancelled, &attempted, &found]() {
                if (cancelled) {
                    return;
                }
                attempted.fetch_add(1);
                auto latency = prober_->probe(host, port, timeout);
                if (!latency || cancelled) {
                    return;
                }
                found.fetch_add(1);
                LOG_DEBUG_COMP_IF(host + ":" + std::to_string(port) + " open (" +
                                  std::to_string(*latency) + "ms)", "ProbeScheduler");
                sink(DiscoveryEvent::hostFound(DiscoveredHost(
                    host, host, port, {DiscoverySource::ActiveProbe},
                    std::chrono::system_clock::now(), latency)));
            }));
        }

        for (auto& f : wave) {
            if (!f.valid()) {
                continue;
            }
            try {
                f.get();
            } catch (const std::exception& e) {
                logger.warn(std::string("Probe task failed: ") + e.what(), "ProbeScheduler");
            }
        }

        ++stats.waves;
        start = end;
    }

    pool.shutdown(false);

    stats.attempted = attempted.load();
    stats.found = found.load();
    stats.cancelled = stats.cancelled || cancelled.load();

    if (stats.cancelled) {
        logger.debug("Active probe cancelled after " + std::to_string(stats.waves) + " wave(s)", "ProbeScheduler");
        return stats;
    }

    logger.info("Active probe finished: " + std::to_string(stats.found) + " open of " +
                std::to_string(stats.attempted) + " probed", "ProbeScheduler");
    sink(DiscoveryEvent::sourceStatus(DiscoverySource::ActiveProbe, SourceState::Finished));
    return stats;
}

} // namespace LanScout
