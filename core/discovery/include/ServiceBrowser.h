#pragma once

/**
 * @file ServiceBrowser.h
 * @brief Platform seam for DNS-SD browsing and resolution
 */

#include "Result.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace LanScout {

/**
 * @brief One advertised service instance, as seen by the browser
 */
struct ServiceAdvertisement {
    std::string name;     ///< instance label, e.g. "Living Room Pi"
    std::string type;     ///< "_ssh._tcp."
    std::string domain;   ///< "local."

    /// "name|type|domain"; identifies an advertisement for deduplication
    std::string key() const { return name + "|" + type + "|" + domain; }
};

struct ResolvedService {
    std::string hostName;   ///< SRV target or address, may carry a trailing dot
    int port{0};            ///< 0 when unknown
    std::vector<std::string> addresses;
};

struct BrowseError {
    enum class Kind {
        PermissionDenied,
        Failed
    };

    Kind kind{Kind::Failed};
    int code{0};
    std::string message;
};

/**
 * @brief Callbacks from a running browser; may arrive on any thread.
 */
class BrowseListener {
public:
    virtual ~BrowseListener() = default;
    virtual void onServiceFound(const ServiceAdvertisement& advertisement) = 0;
    virtual void onBrowseError(const BrowseError& error) = 0;
};

/**
 * @brief Service browser interface
 *
 * A browser is used by one discovery source for one session. `resolve()` is
 * called from resolver workers concurrently with browsing and must honour
 * `timeout`. After `stop()` returns no further listener callbacks are made
 * and any `resolve()` still waiting returns std::nullopt promptly.
 */
class ServiceBrowser {
public:
    virtual ~ServiceBrowser() = default;

    virtual VoidResult start(const std::vector<std::string>& serviceTypes,
                             const std::string& domain,
                             BrowseListener& listener) = 0;

    virtual std::optional<ResolvedService> resolve(const ServiceAdvertisement& advertisement,
                                                   std::chrono::milliseconds timeout) = 0;

    virtual void stop() = 0;
};

} // namespace LanScout
