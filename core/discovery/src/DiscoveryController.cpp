#include "DiscoveryController.h"
#include "Logger.h"

#include <exception>
#include <system_error>
#include <vector>

namespace LanScout {

namespace {

std::shared_ptr<DiscoveryStream> failedStream(const std::string& reason) {
    auto stream = std::make_shared<DiscoveryStream>();
    std::vector<DiscoveryEvent> events;
    events.push_back(DiscoveryEvent::scanningStarted());
    events.push_back(DiscoveryEvent::failed(reason));
    events.push_back(DiscoveryEvent::scanningFinished());
    stream->pushAndClose(std::move(events));
    return stream;
}

} // namespace

DiscoveryController::DiscoveryController(std::shared_ptr<InterfaceSnapshotProvider> interfaces,
                                         std::shared_ptr<TcpProber> prober,
                                         BrowserFactory browserFactory,
                                         DiscoveryOptions options)
    : interfaces_(std::move(interfaces)),
      prober_(std::move(prober)),
      browserFactory_(std::move(browserFactory)),
      options_(std::move(options)) {}

DiscoveryController::~DiscoveryController() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopLocked();
}

std::shared_ptr<DiscoveryStream> DiscoveryController::startScan() {
    auto& logger = Logger::instance();
    std::lock_guard<std::mutex> lock(mutex_);

    stopLocked();

    const std::uint64_t id = nextSessionId_++;
    std::unique_ptr<DiscoverySession> session;
    try {
        std::unique_ptr<ServiceBrowser> browser;
        if (options_.enableServiceDiscovery && browserFactory_) {
            browser = browserFactory_();
        }
        session = std::make_unique<DiscoverySession>(id, interfaces_, prober_, std::move(browser), options_);
        session->start();
    } catch (const std::system_error& e) {
        logger.error("Session " + std::to_string(id) + " could not start: " + e.what(), "DiscoveryController");
        if (session) {
            session->stop();
        }
        idleState_ = State::Finished;
        return failedStream(std::string("Unable to start discovery: ") + e.what());
    } catch (const std::exception& e) {
        logger.error("Session " + std::to_string(id) + " failed: " + e.what(), "DiscoveryController");
        if (session) {
            session->stop();
        }
        idleState_ = State::Finished;
        return failedStream(e.what());
    }

    auto stream = session->events();
    session_ = std::move(session);
    return stream;
}

void DiscoveryController::stopScan() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopLocked();
    idleState_ = State::Idle;
}

std::shared_ptr<DiscoveryStream> DiscoveryController::rescan() {
    stopScan();
    return startScan();
}

DiscoveryController::State DiscoveryController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return idleState_;
    }
    return session_->isFinished() ? State::Finished : State::Scanning;
}

std::uint64_t DiscoveryController::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSessionId_ - 1;
}

void DiscoveryController::stopLocked() {
    if (!session_) {
        return;
    }
    session_->stop();
    session_.reset();
}

const char* controllerStateName(DiscoveryController::State state) {
    switch (state) {
        case DiscoveryController::State::Idle: return "idle";
        case DiscoveryController::State::Scanning: return "scanning";
        case DiscoveryController::State::Finished: return "finished";
    }
    return "unknown";
}

} // namespace LanScout
