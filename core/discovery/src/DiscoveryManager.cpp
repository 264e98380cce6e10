#include "DiscoveryManager.h"
#include "LoggerMacros.h"
#include "SubnetEnumerator.h"

#include <stdexcept>
#include <system_error>

namespace LanScout {

DiscoveryManager::DiscoveryManager(std::unique_ptr<DiscoveryController> controller,
                                   std::shared_ptr<EventBus> bus)
    : controller_(std::move(controller)),
      bus_(bus ? std::move(bus) : std::make_shared<EventBus>()),
      aggregator_(controller_ ? controller_->options().maxHosts : config::MAX_HOSTS) {
    if (!controller_) {
        throw std::invalid_argument("DiscoveryManager requires a controller");
    }
}

DiscoveryManager::~DiscoveryManager() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    stopLocked(false);
}

void DiscoveryManager::startScan() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    stopLocked(false);

    const bool usable = hasUsableInterface();
    if (!usable) {
        Logger::instance().warn("No usable network interface, subnet probe has no candidates", "DiscoveryManager");
    }

    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        aggregator_.clear();
        error_.clear();
        scanState_ = ScanState::Scanning;
        permission_ = PermissionState::Unknown;
        noUsableInterface_ = !usable;
        serviceActive_ = false;
        probeActive_ = false;
        pumpDone_ = false;
    }
    stopRequested_ = false;
    publishHosts();
    publishState();

    auto stream = controller_->startScan();
    try {
        pump_ = std::thread(&DiscoveryManager::pumpEvents, this, stream);
    } catch (const std::system_error& e) {
        Logger::instance().error(std::string("Cannot start event pump: ") + e.what(), "DiscoveryManager");
        controller_->stopScan();
        {
            std::lock_guard<std::mutex> stateLock(stateMutex_);
            error_ = std::string("Unable to start discovery: ") + e.what();
            scanState_ = ScanState::Failed;
            pumpDone_ = true;
        }
        completionCv_.notify_all();
        publishState();
    }
}

void DiscoveryManager::stopScan(bool clearResults) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    stopLocked(clearResults);
}

void DiscoveryManager::stopLocked(bool clearResults) {
    stopRequested_ = true;
    controller_->stopScan();
    if (pump_.joinable()) {
        pump_.join();
    }

    bool hostsCleared = false;
    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        serviceActive_ = false;
        probeActive_ = false;
        if (scanState_ == ScanState::Scanning) {
            scanState_ = ScanState::Idle;
        }
        if (clearResults) {
            hostsCleared = !aggregator_.empty();
            aggregator_.clear();
            error_.clear();
            scanState_ = ScanState::Idle;
            permission_ = PermissionState::Unknown;
        }
        pumpDone_ = true;
    }
    completionCv_.notify_all();

    if (hostsCleared) {
        publishHosts();
    }
    publishState();
}

bool DiscoveryManager::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stateMutex_);
    return completionCv_.wait_for(lock, timeout, [this]() { return pumpDone_; });
}

bool DiscoveryManager::hasUsableInterface() const {
    auto provider = controller_->interfaceProvider();
    if (!provider) {
        return false;
    }
    auto snapshot = provider->snapshot();
    if (!snapshot) {
        Logger::instance().warn("Interface snapshot failed: " + snapshot.error().toString(), "DiscoveryManager");
        return false;
    }
    return selectInterface(snapshot.value(), controller_->options().preferredInterfacePrefixes).has_value();
}

DiscoveryManager::ScanState DiscoveryManager::completedStateLocked() const {
    // Nothing found and nothing to probe: the network is the likely cause
    if (noUsableInterface_ && aggregator_.empty()) {
        return ScanState::UnsupportedNetwork;
    }
    return ScanState::Completed;
}

void DiscoveryManager::pumpEvents(std::shared_ptr<DiscoveryStream> stream) {
    while (!stopRequested_) {
        auto event = stream->next();
        if (!event) {
            break;
        }
        if (stopRequested_) {
            break;
        }
        handleEvent(*event);
    }

    if (stopRequested_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        serviceActive_ = false;
        probeActive_ = false;
        if (scanState_ == ScanState::Scanning) {
            scanState_ = completedStateLocked();
        }
        pumpDone_ = true;
    }
    completionCv_.notify_all();
    publishState();
}

void DiscoveryManager::handleEvent(const DiscoveryEvent& event) {
    bus_->publish(EVENT, event);

    bool hostsChanged = false;
    bool stateChanged = true;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        switch (event.type) {
            case DiscoveryEvent::Type::ScanningStarted:
                scanState_ = ScanState::Scanning;
                break;
            case DiscoveryEvent::Type::SourceStatus: {
                const bool active = event.state == SourceState::Started;
                if (event.source == DiscoverySource::ServiceDiscovery) {
                    serviceActive_ = active;
                } else {
                    probeActive_ = active;
                }
                break;
            }
            case DiscoveryEvent::Type::HostFound:
                stateChanged = permission_ != PermissionState::Granted;
                permission_ = PermissionState::Granted;
                hostsChanged = event.host && aggregator_.upsert(*event.host);
                stateChanged = stateChanged || hostsChanged;
                break;
            case DiscoveryEvent::Type::PermissionDenied:
                permission_ = PermissionState::Denied;
                break;
            case DiscoveryEvent::Type::Failed:
                error_ = event.message;
                scanState_ = ScanState::Failed;
                break;
            case DiscoveryEvent::Type::ScanningFinished:
                serviceActive_ = false;
                probeActive_ = false;
                if (scanState_ != ScanState::Failed) {
                    scanState_ = completedStateLocked();
                }
                break;
        }
    }

    if (hostsChanged) {
        publishHosts();
    }
    if (stateChanged) {
        publishState();
    }
}

DiscoveryManager::ScanState DiscoveryManager::scanState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return scanState_;
}

DiscoveryManager::PermissionState DiscoveryManager::permissionState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return permission_;
}

bool DiscoveryManager::isSourceActive(DiscoverySource source) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return source == DiscoverySource::ServiceDiscovery ? serviceActive_ : probeActive_;
}

std::string DiscoveryManager::error() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return error_;
}

std::string DiscoveryManager::statusText() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return statusTextLocked();
}

DiscoveryManager::Status DiscoveryManager::status() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return statusLocked();
}

std::vector<DiscoveredHost> DiscoveryManager::hosts() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return aggregator_.hosts();
}

std::optional<ServerFormPrefill> DiscoveryManager::prefill(const std::string& identityKey) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto host = aggregator_.find(identityKey);
    if (!host) {
        return std::nullopt;
    }
    return ServerFormPrefill(*host);
}

DiscoveryManager::Status DiscoveryManager::statusLocked() const {
    Status status;
    status.scanState = scanState_;
    status.permission = permission_;
    status.serviceDiscoveryActive = serviceActive_;
    status.activeProbeActive = probeActive_;
    status.hostCount = aggregator_.size();
    status.error = error_;
    status.statusText = statusTextLocked();
    return status;
}

std::string DiscoveryManager::statusTextLocked() const {
    switch (scanState_) {
        case ScanState::Idle:
            return "Ready to scan your local network.";
        case ScanState::UnsupportedNetwork:
            return "Connect to Wi-Fi or ethernet to discover local SSH hosts.";
        case ScanState::Scanning:
            if (serviceActive_ && probeActive_) {
                return "Scanning with service discovery and SSH port probe...";
            }
            if (serviceActive_) {
                return "Scanning service advertisements...";
            }
            if (probeActive_) {
                return "Scanning local subnet for SSH port " +
                       std::to_string(controller_->options().probePort) + "...";
            }
            return "Scanning...";
        case ScanState::Completed:
            if (aggregator_.empty()) {
                return "No SSH hosts found.";
            }
            return std::to_string(aggregator_.size()) + " SSH host(s) found.";
        case ScanState::Failed:
            return error_;
    }
    return "";
}

void DiscoveryManager::publishState() {
    Status snapshot = status();
    LOG_DEBUG_COMP_IF(std::string("State ") + scanStateName(snapshot.scanState) + ": " + snapshot.statusText,
                      "DiscoveryManager");
    bus_->publish(STATE_CHANGED, snapshot);
}

void DiscoveryManager::publishHosts() {
    bus_->publish(HOSTS_CHANGED, hosts());
}

const char* scanStateName(DiscoveryManager::ScanState state) {
    switch (state) {
        case DiscoveryManager::ScanState::Idle: return "idle";
        case DiscoveryManager::ScanState::Scanning: return "scanning";
        case DiscoveryManager::ScanState::Completed: return "completed";
        case DiscoveryManager::ScanState::UnsupportedNetwork: return "unsupported_network";
        case DiscoveryManager::ScanState::Failed: return "failed";
    }
    return "unknown";
}

const char* permissionStateName(DiscoveryManager::PermissionState state) {
    switch (state) {
        case DiscoveryManager::PermissionState::Unknown: return "unknown";
        case DiscoveryManager::PermissionState::Granted: return "granted";
        case DiscoveryManager::PermissionState::Denied: return "denied";
    }
    return "unknown";
}

} // namespace LanScout
