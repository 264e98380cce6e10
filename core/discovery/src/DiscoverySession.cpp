#include "DiscoverySession.h"
#include "LoggerMacros.h"
#include "ProbeScheduler.h"
#include "SubnetEnumerator.h"

#include <system_error>
#include <vector>

namespace LanScout {

DiscoverySession::DiscoverySession(std::uint64_t id,
                                   std::shared_ptr<InterfaceSnapshotProvider> interfaces,
                                   std::shared_ptr<TcpProber> prober,
                                   std::unique_ptr<ServiceBrowser> browser,
                                   DiscoveryOptions options)
    : id_(id),
      interfaces_(std::move(interfaces)),
      prober_(std::move(prober)),
      browser_(std::move(browser)),
      options_(std::move(options)),
      channel_(std::make_shared<DiscoveryStream>()) {}

DiscoverySession::~DiscoverySession() {
    stop();
}

void DiscoverySession::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_ || state_ != State::Created) {
        return;
    }
    state_ = State::Running;

    Logger::instance().info("Session " + std::to_string(id_) + " started (" +
                            std::to_string(options_.scanDuration.count()) + "ms)", "DiscoverySession");
    emit(DiscoveryEvent::scanningStarted());

    if (options_.enableServiceDiscovery) {
        serviceSource_ = std::make_unique<ServiceDiscoverySource>(std::move(browser_), options_);
        auto browsing = serviceSource_->start([this](DiscoveryEvent event) { emit(std::move(event)); });
        if (!browsing) {
            LOG_DEBUG_COMP_IF("Session " + std::to_string(id_) + " continues without browsing: " +
                              browsing.error().message, "DiscoverySession");
        }
    }

    if (options_.enableActiveProbe) {
        emit(DiscoveryEvent::sourceStatus(DiscoverySource::ActiveProbe, SourceState::Started));
        probeThread_ = std::thread(&DiscoverySession::runActiveProbe, this);
    }

    timerThread_ = std::thread(&DiscoverySession::runTimer, this);
}

void DiscoverySession::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    {
        std::lock_guard<std::mutex> timerLock(timerMutex_);
        stopRequested_ = true;
    }
    timerCv_.notify_all();

    cancelled_ = true;
    channel_->close();
    if (state_ != State::Terminated) {
        state_ = State::Draining;
    }

    if (timerThread_.joinable()) {
        timerThread_.join();
    }
    stopWorkers();

    state_ = State::Terminated;
    LOG_DEBUG_COMP_IF("Session " + std::to_string(id_) + " stopped", "DiscoverySession");
}

void DiscoverySession::emit(DiscoveryEvent event) {
    std::lock_guard<std::mutex> lock(emitMutex_);

    if (event.type == DiscoveryEvent::Type::SourceStatus) {
        const bool service = event.source == DiscoverySource::ServiceDiscovery;
        bool& started = service ? serviceStarted_ : probeStarted_;
        bool& finished = service ? serviceFinished_ : probeFinished_;
        if (event.state == SourceState::Started) {
            started = true;
        } else {
            if (finished) {
                return;
            }
            finished = true;
        }
    }

    channel_->push(std::move(event));
}

void DiscoverySession::runActiveProbe() {
    auto& logger = Logger::instance();

    CandidateAddressSet candidates;
    if (interfaces_) {
        candidates = enumerateCandidates(*interfaces_, options_.preferredInterfacePrefixes);
    } else {
        logger.warn("No interface provider, skipping active probe", "DiscoverySession");
    }

    if (cancelled_) {
        return;
    }

    ProbeScheduler scheduler(prober_, options_);
    try {
        scheduler.run(candidates, [this](DiscoveryEvent event) { emit(std::move(event)); }, cancelled_);
    } catch (const std::system_error& e) {
        logger.error(std::string("Active probe could not start: ") + e.what(), "DiscoverySession");
        emit(DiscoveryEvent::failed(std::string("Active probe could not start: ") + e.what()));
        emit(DiscoveryEvent::sourceStatus(DiscoverySource::ActiveProbe, SourceState::Finished));
    }
}

void DiscoverySession::runTimer() {
    {
        std::unique_lock<std::mutex> lock(timerMutex_);
        if (timerCv_.wait_for(lock, options_.scanDuration, [this]() { return stopRequested_; })) {
            return;
        }
    }
    finishOnTimeout();
}

void DiscoverySession::finishOnTimeout() {
    {
        std::lock_guard<std::mutex> lock(emitMutex_);
        std::vector<DiscoveryEvent> batch;
        if (serviceStarted_ && !serviceFinished_) {
            serviceFinished_ = true;
            batch.push_back(DiscoveryEvent::sourceStatus(DiscoverySource::ServiceDiscovery, SourceState::Finished));
        }
        if (probeStarted_ && !probeFinished_) {
            probeFinished_ = true;
            batch.push_back(DiscoveryEvent::sourceStatus(DiscoverySource::ActiveProbe, SourceState::Finished));
        }
        batch.push_back(DiscoveryEvent::scanningFinished());
        if (!channel_->pushAndClose(std::move(batch))) {
            return;
        }
    }

    Logger::instance().info("Session " + std::to_string(id_) + " reached its time limit", "DiscoverySession");
    state_ = State::Draining;
    cancelled_ = true;
    stopWorkers();
    state_ = State::Terminated;
}

void DiscoverySession::stopWorkers() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    if (workersStopped_) {
        return;
    }
    workersStopped_ = true;
    cancelled_ = true;

    if (serviceSource_) {
        serviceSource_->stop();
    }
    if (probeThread_.joinable()) {
        probeThread_.join();
    }
}

} // namespace LanScout
