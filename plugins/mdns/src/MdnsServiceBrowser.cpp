#include "MdnsServiceBrowser.h"
#include "LoggerMacros.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace LanScout::Mdns {

namespace {

std::string errnoText(const std::string& what, int err) {
    return what + ": " + errnoMessage(err);
}

bool isPermissionError(int err) {
    return err == EACCES || err == EPERM;
}

// Up, non-loopback, multicast-capable IPv4 interfaces
std::vector<in_addr> multicastInterfaces() {
    std::vector<in_addr> out;
    struct ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        LOG_WARN_COMP(errnoText("getifaddrs", errno), "MdnsBrowser");
        return out;
    }
    for (auto* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        const unsigned int flags = it->ifa_flags;
        if (!(flags & IFF_UP) || (flags & IFF_LOOPBACK) || !(flags & IFF_MULTICAST)) {
            continue;
        }
        out.push_back(reinterpret_cast<sockaddr_in*>(it->ifa_addr)->sin_addr);
    }
    ::freeifaddrs(list);
    return out;
}

void setReuse(int fd) {
    int yes = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        LOG_DEBUG_COMP_IF(errnoText("SO_REUSEADDR", errno), "MdnsBrowser");
    }
#ifdef SO_REUSEPORT
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes)) < 0) {
        LOG_DEBUG_COMP_IF(errnoText("SO_REUSEPORT", errno), "MdnsBrowser");
    }
#endif
}

} // namespace

MdnsServiceBrowser::MdnsServiceBrowser(MdnsBrowserOptions options)
    : options_(std::move(options)) {}

MdnsServiceBrowser::~MdnsServiceBrowser() {
    stop();
}

VoidResult MdnsServiceBrowser::start(const std::vector<std::string>& serviceTypes,
                                     const std::string& domain,
                                     BrowseListener& listener) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    auto& logger = Logger::instance();

    if (running_) {
        return Error("Browser already running", 0, "MdnsBrowser");
    }
    if (serviceTypes.empty()) {
        return Error("No service types to browse", EINVAL, "MdnsBrowser");
    }

    listener_ = &listener;
    serviceNames_.clear();
    for (const auto& type : serviceTypes) {
        std::string name = type;
        if (name.empty() || name.back() != '.') {
            name += '.';
        }
        serviceNames_.push_back(name + domain);
    }
    {
        std::lock_guard<std::mutex> cacheLock(cacheMutex_);
        cache_.clear();
        cache_.setServices(serviceTypes, domain);
    }

    auto opened = openSocket();
    if (!opened) {
        return opened;
    }

    running_ = true;
    try {
        browseThread_ = std::thread(&MdnsServiceBrowser::browseLoop, this);
    } catch (const std::system_error& e) {
        running_ = false;
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        socket_.reset();
        return Error(std::string("Cannot start browse thread: ") + e.what(), e.code().value(), "MdnsBrowser");
    }

    logger.info("Browsing on " + std::to_string(interfaces_.size()) + " interface(s)" +
                (unicastFallback_ ? " with unicast responses" : ""), "MdnsBrowser");
    return Ok();
}

void MdnsServiceBrowser::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> cacheLock(cacheMutex_);
    }
    cacheCv_.notify_all();

    if (browseThread_.joinable()) {
        browseThread_.join();
    }

    {
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        socket_.reset();
    }
    LOG_DEBUG_COMP_IF("Browser stopped", "MdnsBrowser");
}

VoidResult MdnsServiceBrowser::openSocket() {
    auto& logger = Logger::instance();

    SocketGuard sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!sock) {
        const int err = errno;
        return Error(errnoText("socket", err), err, "MdnsBrowser");
    }
    setReuse(sock.get());

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);

    unicastFallback_ = false;
    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        if (isPermissionError(err)) {
            return Error(errnoText("bind", err), err, "MdnsBrowser");
        }
        logger.warn(errnoText("Port " + std::to_string(options_.port) + " unavailable", err) +
                    ", asking for unicast responses", "MdnsBrowser");

        sock.reset(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
        if (!sock) {
            const int socketErr = errno;
            return Error(errnoText("socket", socketErr), socketErr, "MdnsBrowser");
        }
        addr.sin_port = htons(0);
        if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            const int bindErr = errno;
            return Error(errnoText("bind", bindErr), bindErr, "MdnsBrowser");
        }
        unicastFallback_ = true;
    }

    in_addr group{};
    if (::inet_pton(AF_INET, options_.group.c_str(), &group) != 1) {
        return Error("Invalid multicast group " + options_.group, EINVAL, "MdnsBrowser");
    }

    interfaces_ = multicastInterfaces();
    if (!unicastFallback_) {
        int joined = 0;
        for (const auto& iface : interfaces_) {
            ip_mreq membership{};
            membership.imr_multiaddr = group;
            membership.imr_interface = iface;
            if (::setsockopt(sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) == 0) {
                ++joined;
            } else {
                LOG_DEBUG_COMP_IF(errnoText("IP_ADD_MEMBERSHIP", errno), "MdnsBrowser");
            }
        }
        if (joined == 0) {
            ip_mreq membership{};
            membership.imr_multiaddr = group;
            membership.imr_interface.s_addr = htonl(INADDR_ANY);
            if (::setsockopt(sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) < 0) {
                logger.warn(errnoText("Cannot join " + options_.group, errno), "MdnsBrowser");
            }
        }
    }

    unsigned char ttl = 255;
    if (::setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        LOG_DEBUG_COMP_IF(errnoText("IP_MULTICAST_TTL", errno), "MdnsBrowser");
    }
    unsigned char loop = 1;
    if (::setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
        LOG_DEBUG_COMP_IF(errnoText("IP_MULTICAST_LOOP", errno), "MdnsBrowser");
    }

    const int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        const int err = errno;
        return Error(errnoText("fcntl", err), err, "MdnsBrowser");
    }

    std::lock_guard<std::mutex> sendLock(sendMutex_);
    socket_ = std::move(sock);
    return Ok();
}

void MdnsServiceBrowser::browseLoop() {
    using Clock = std::chrono::steady_clock;

    std::vector<std::uint8_t> buffer(config::MDNS_MAX_PACKET);
    int burstsLeft = std::max(1, options_.queryBursts);
    auto nextQuery = Clock::now();

    while (running_) {
        auto now = Clock::now();
        if (now >= nextQuery) {
            sendServiceQueries();
            --burstsLeft;
            nextQuery = now + (burstsLeft > 0 ? options_.pollSlice : options_.requeryInterval);
        }

        auto untilQuery = std::chrono::duration_cast<std::chrono::milliseconds>(nextQuery - now);
        const auto wait = std::max<std::chrono::milliseconds::rep>(
            1, std::min(options_.pollSlice, untilQuery).count());

        pollfd pfd{};
        pfd.fd = socket_.get();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(wait));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            listener_->onBrowseError(BrowseError{BrowseError::Kind::Failed, err, errnoText("poll", err)});
            break;
        }
        if (rc > 0 && (pfd.revents & POLLIN)) {
            receiveOne(buffer);
        }
    }
}

void MdnsServiceBrowser::receiveOne(std::vector<std::uint8_t>& buffer) {
    while (running_) {
        sockaddr_in source{};
        socklen_t sourceLength = sizeof(source);
        const ssize_t n = ::recvfrom(socket_.get(), buffer.data(), buffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&source), &sourceLength);
        if (n < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_DEBUG_COMP_IF(errnoText("recvfrom", errno), "MdnsBrowser");
            }
            return;
        }

        auto parsed = DnsMessage::parse(buffer.data(), static_cast<std::size_t>(n));
        if (!parsed) {
            char from[INET_ADDRSTRLEN] = {0};
            ::inet_ntop(AF_INET, &source.sin_addr, from, sizeof(from));
            LOG_DEBUG_COMP_IF("Dropped packet from " + std::string(from) + ": " + parsed.error().message,
                              "MdnsBrowser");
            continue;
        }
        if (!parsed.value().isResponse()) {
            continue;
        }

        std::vector<ServiceAdvertisement> fresh;
        {
            std::lock_guard<std::mutex> lock(cacheMutex_);
            fresh = cache_.ingest(parsed.value());
        }
        cacheCv_.notify_all();

        for (const auto& advertisement : fresh) {
            if (!running_) {
                return;
            }
            listener_->onServiceFound(advertisement);
        }
    }
}

void MdnsServiceBrowser::sendServiceQueries() {
    std::vector<DnsQuestion> questions;
    for (const auto& name : serviceNames_) {
        questions.push_back(DnsQuestion{name, TYPE_PTR, unicastFallback_.load()});
    }

    auto packet = encodeQuery(questions);
    if (!packet) {
        LOG_WARN_COMP(packet.error().toString(), "MdnsBrowser");
        return;
    }

    const int err = sendPacket(packet.value());
    if (err != 0) {
        reportSendError(err);
    }
}

int MdnsServiceBrowser::sendPacket(const std::vector<std::uint8_t>& packet) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!socket_) {
        return EBADF;
    }

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(options_.port);
    if (::inet_pton(AF_INET, options_.group.c_str(), &dest.sin_addr) != 1) {
        return EINVAL;
    }

    auto sendOnce = [&]() -> int {
        const ssize_t sent = ::sendto(socket_.get(), packet.data(), packet.size(), 0,
                                      reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
        return sent < 0 ? errno : 0;
    };

    if (interfaces_.empty()) {
        return sendOnce();
    }

    int lastError = 0;
    bool anySent = false;
    for (const auto& iface : interfaces_) {
        if (::setsockopt(socket_.get(), IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) < 0) {
            lastError = errno;
            continue;
        }
        const int err = sendOnce();
        if (err == 0) {
            anySent = true;
        } else {
            lastError = err;
        }
    }
    return anySent ? 0 : lastError;
}

void MdnsServiceBrowser::reportSendError(int err) {
    if (isPermissionError(err)) {
        listener_->onBrowseError(BrowseError{BrowseError::Kind::PermissionDenied, err, errnoText("sendto", err)});
        return;
    }
    LOG_DEBUG_COMP_IF(errnoText("Query not sent", err), "MdnsBrowser");
}

std::optional<ResolvedService> MdnsServiceBrowser::resolve(const ServiceAdvertisement& advertisement,
                                                           std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    if (!running_) {
        return std::nullopt;
    }

    const std::string instance = joinInstanceName(advertisement.name, advertisement.type, advertisement.domain);
    const auto deadline = Clock::now() + timeout;
    auto nextQuery = Clock::now();

    std::unique_lock<std::mutex> lock(cacheMutex_);
    while (running_) {
        auto found = cache_.lookup(advertisement);
        if (found && !found->addresses.empty()) {
            return found;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            // An SRV target without an address still names the host
            return found;
        }

        if (now >= nextQuery) {
            const bool unicast = unicastFallback_;
            lock.unlock();

            std::vector<DnsQuestion> questions;
            if (!found) {
                questions.push_back(DnsQuestion{instance, TYPE_SRV, unicast});
                questions.push_back(DnsQuestion{instance, TYPE_TXT, unicast});
            } else {
                questions.push_back(DnsQuestion{found->hostName, TYPE_A, unicast});
            }
            auto packet = encodeQuery(questions);
            if (!packet) {
                LOG_DEBUG_COMP_IF(packet.error().message, "MdnsBrowser");
            } else if (int err = sendPacket(packet.value())) {
                LOG_DEBUG_COMP_IF(errnoText("Resolve query for '" + advertisement.name + "' not sent", err),
                                  "MdnsBrowser");
            }

            lock.lock();
            nextQuery = now + options_.resolveRequery;
            continue;
        }

        cacheCv_.wait_until(lock, std::min(deadline, nextQuery));
    }
    return std::nullopt;
}

} // namespace LanScout::Mdns
