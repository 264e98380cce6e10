#include "DiscoveryEvent.h"

#include <sstream>
#include <utility>

namespace LanScout {

DiscoveryEvent DiscoveryEvent::scanningStarted() {
    DiscoveryEvent event;
    event.type = Type::ScanningStarted;
    return event;
}

DiscoveryEvent DiscoveryEvent::sourceStatus(DiscoverySource source, SourceState state) {
    DiscoveryEvent event;
    event.type = Type::SourceStatus;
    event.source = source;
    event.state = state;
    return event;
}

DiscoveryEvent DiscoveryEvent::hostFound(DiscoveredHost host) {
    DiscoveryEvent event;
    event.type = Type::HostFound;
    event.host = std::move(host);
    return event;
}

DiscoveryEvent DiscoveryEvent::permissionDenied() {
    DiscoveryEvent event;
    event.type = Type::PermissionDenied;
    return event;
}

DiscoveryEvent DiscoveryEvent::failed(std::string message) {
    DiscoveryEvent event;
    event.type = Type::Failed;
    event.message = std::move(message);
    return event;
}

DiscoveryEvent DiscoveryEvent::scanningFinished() {
    DiscoveryEvent event;
    event.type = Type::ScanningFinished;
    return event;
}

const char* eventTypeName(DiscoveryEvent::Type type) {
    switch (type) {
        case DiscoveryEvent::Type::ScanningStarted: return "scanning_started";
        case DiscoveryEvent::Type::SourceStatus: return "source_status";
        case DiscoveryEvent::Type::HostFound: return "host_found";
        case DiscoveryEvent::Type::PermissionDenied: return "permission_denied";
        case DiscoveryEvent::Type::Failed: return "failed";
        case DiscoveryEvent::Type::ScanningFinished: return "scanning_finished";
    }
    return "unknown";
}

std::string DiscoveryEvent::toString() const {
    std::ostringstream ss;
    ss << eventTypeName(type);
    switch (type) {
        case Type::SourceStatus:
            ss << " " << discoverySourceName(source)
               << (state == SourceState::Started ? " started" : " finished");
            break;
        case Type::HostFound:
            if (host) {
                ss << " " << host->displayName << " (" << host->identityKey() << ")";
                if (host->latencyMs) {
                    ss << " " << *host->latencyMs << "ms";
                }
            }
            break;
        case Type::Failed:
            ss << ": " << message;
            break;
        default:
            break;
    }
    return ss.str();
}

} // namespace LanScout
