#include "ServiceDiscoverySource.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <cctype>
#include <cerrno>

namespace LanScout {

namespace {

// ASCII replacements for U+00C0..U+00FF; nullptr keeps the original bytes
const char* const kLatin1Fold[64] = {
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
    "D", "N", "O", "O", "O", "O", "O", nullptr, "O", "U", "U", "U", "U", "Y", "TH", "ss",
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", nullptr, "o", "u", "u", "u", "u", "y", "th", "y",
};

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trimmed(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isSpace(text[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string foldLatin1(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if ((lead == 0xC3 || lead == 0xC2) && i + 1 < text.size()) {
            const auto trail = static_cast<unsigned char>(text[i + 1]);
            if ((trail & 0xC0) == 0x80) {
                // C3 xx encodes U+00C0..U+00FF
                if (lead == 0xC3 && kLatin1Fold[trail - 0x80] != nullptr) {
                    out += kLatin1Fold[trail - 0x80];
                } else {
                    out += text[i];
                    out += text[i + 1];
                }
                ++i;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace

std::string sanitizeHostLabel(const std::string& name) {
    const std::string folded = foldLatin1(trimmed(name));

    std::string out;
    out.reserve(folded.size());
    bool pendingDash = false;
    for (char c : folded) {
        if (isSpace(c)) {
            pendingDash = true;
            continue;
        }
        if (pendingDash) {
            out += '-';
            pendingDash = false;
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return out.empty() ? name : out;
}

std::string normalizeResolvedHost(const std::string& hostName) {
    std::string host = trimmed(hostName);
    while (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    return host;
}

ServiceDiscoverySource::ServiceDiscoverySource(std::unique_ptr<ServiceBrowser> browser,
                                               DiscoveryOptions options)
    : browser_(std::move(browser)), options_(std::move(options)) {}

ServiceDiscoverySource::~ServiceDiscoverySource() {
    stop();
}

VoidResult ServiceDiscoverySource::start(EventSink sink) {
    auto& logger = Logger::instance();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return Error("Service discovery already started", 0, "ServiceDiscovery");
        }
        started_ = true;
        sink_ = std::move(sink);
        const auto workers = static_cast<std::size_t>(std::max(1, options_.resolverThreads));
        resolvers_ = std::make_unique<ThreadPool>(workers, "Resolver");
    }

    emit(DiscoveryEvent::sourceStatus(DiscoverySource::ServiceDiscovery, SourceState::Started));

    if (!browser_) {
        return Error("No service browser available", 0, "ServiceDiscovery");
    }

    auto result = browser_->start(options_.serviceTypes, options_.serviceDomain, *this);
    if (!result) {
        const Error& err = result.error();
        if (err.code == EACCES || err.code == EPERM) {
            reportPermissionDenied();
        } else {
            logger.warn("Browse failed to start: " + err.toString(), "ServiceDiscovery");
        }
        return result;
    }

    logger.info("Browsing " + std::to_string(options_.serviceTypes.size()) +
                " service type(s) in " + options_.serviceDomain, "ServiceDiscovery");
    return Ok();
}

void ServiceDiscoverySource::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    // The browser may be blocked delivering a callback that takes mutex_
    if (browser_) {
        browser_->stop();
    }

    if (resolvers_) {
        resolvers_->shutdown(false);
    }

    LOG_DEBUG_COMP_IF("Stopped after " + std::to_string(advertisementCount()) + " advertisement(s)",
                      "ServiceDiscovery");
}

std::size_t ServiceDiscoverySource::advertisementCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

void ServiceDiscoverySource::onServiceFound(const ServiceAdvertisement& advertisement) {
    if (stopped_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!seen_.insert(advertisement.key()).second) {
        return;
    }

    LOG_DEBUG_COMP_IF("Found '" + advertisement.name + "' (" + advertisement.type + ")", "ServiceDiscovery");

    auto pending = resolvers_->enqueue([this, advertisement]() {
        resolveAndEmit(advertisement);
    });
    if (!pending.valid()) {
        LOG_DEBUG_COMP_IF("Resolver closed, dropping '" + advertisement.name + "'", "ServiceDiscovery");
    }
}

void ServiceDiscoverySource::onBrowseError(const BrowseError& error) {
    if (error.kind == BrowseError::Kind::PermissionDenied) {
        reportPermissionDenied();
        return;
    }
    Logger::instance().warn("Browse error: " + error.message +
                            " (code: " + std::to_string(error.code) + ")", "ServiceDiscovery");
}

void ServiceDiscoverySource::resolveAndEmit(const ServiceAdvertisement& advertisement) {
    if (stopped_) {
        return;
    }

    std::string host;
    int port = config::SSH_PORT;

    auto resolved = browser_->resolve(advertisement, options_.resolveTimeout);
    if (stopped_) {
        return;
    }

    if (resolved) {
        host = normalizeResolvedHost(resolved->hostName);
        if (host.empty() && !resolved->addresses.empty()) {
            host = resolved->addresses.front();
        }
        if (resolved->port > 0) {
            port = resolved->port;
        }
    } else {
        LOG_DEBUG_COMP_IF("Resolve timed out for '" + advertisement.name + "'", "ServiceDiscovery");
    }

    if (host.empty()) {
        host = sanitizeHostLabel(advertisement.name) + ".local";
    }

    emit(DiscoveryEvent::hostFound(DiscoveredHost(
        advertisement.name, host, port, {DiscoverySource::ServiceDiscovery})));
}

void ServiceDiscoverySource::reportPermissionDenied() {
    if (permissionReported_.exchange(true)) {
        return;
    }
    Logger::instance().warn("Local network browsing was denied", "ServiceDiscovery");
    emit(DiscoveryEvent::permissionDenied());
}

void ServiceDiscoverySource::emit(DiscoveryEvent event) {
    if (sink_) {
        sink_(std::move(event));
    }
}

} // namespace LanScout
