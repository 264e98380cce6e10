#pragma once

/**
 * @file DiscoveryEvent.h
 * @brief Lifecycle events emitted by a scan session
 */

#include "DiscoveredHost.h"

#include <optional>
#include <string>

namespace LanScout {

enum class SourceState {
    Started,
    Finished
};

/**
 * @brief One entry in a session's event stream
 *
 * Only the fields relevant to `type` are set; use the factory functions.
 */
struct DiscoveryEvent {
    enum class Type {
        ScanningStarted,
        SourceStatus,
        HostFound,
        PermissionDenied,
        Failed,
        ScanningFinished
    };

    Type type{Type::ScanningStarted};
    DiscoverySource source{DiscoverySource::ServiceDiscovery};
    SourceState state{SourceState::Started};
    std::optional<DiscoveredHost> host;
    std::string message;

    static DiscoveryEvent scanningStarted();
    static DiscoveryEvent sourceStatus(DiscoverySource source, SourceState state);
    static DiscoveryEvent hostFound(DiscoveredHost host);
    static DiscoveryEvent permissionDenied();
    static DiscoveryEvent failed(std::string message);
    static DiscoveryEvent scanningFinished();

    bool isSourceStatus(DiscoverySource s, SourceState st) const {
        return type == Type::SourceStatus && source == s && state == st;
    }

    std::string toString() const;
};

const char* eventTypeName(DiscoveryEvent::Type type);

} // namespace LanScout
