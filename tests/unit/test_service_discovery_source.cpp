#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "Logger.h"
#include "MockDiscovery.h"
#include "ServiceDiscoverySource.h"

using namespace LanScout;

class ServiceDiscoverySourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        state_ = std::make_shared<FakeBrowserState>();
        options_.resolveTimeout = std::chrono::milliseconds(200);
    }

    void TearDown() override {
        Logger::instance().setConsoleOutput(true);
    }

    std::unique_ptr<ServiceDiscoverySource> makeSource() {
        return std::make_unique<ServiceDiscoverySource>(std::make_unique<FakeServiceBrowser>(state_), options_);
    }

    ServiceDiscoverySource::EventSink collector() {
        return [this](DiscoveryEvent event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        };
    }

    std::vector<DiscoveryEvent> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<DiscoveredHost> waitForHosts(std::size_t count,
                                             std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            std::vector<DiscoveredHost> hosts;
            for (const auto& e : events()) {
                if (e.type == DiscoveryEvent::Type::HostFound && e.host) {
                    hosts.push_back(*e.host);
                }
            }
            if (hosts.size() >= count) {
                return hosts;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return {};
    }

    static ServiceAdvertisement ad(const std::string& name) {
        return ServiceAdvertisement{name, "_ssh._tcp.", "local."};
    }

    std::shared_ptr<FakeBrowserState> state_;
    DiscoveryOptions options_;
    std::mutex mutex_;
    std::vector<DiscoveryEvent> events_;
};

TEST(HostLabelTest, SanitizesAdvertisedNames) {
    EXPECT_EQ(sanitizeHostLabel("Raspberry Pi"), "raspberry-pi");
    EXPECT_EQ(sanitizeHostLabel("  Office   Server \t"), "office-server");
    EXPECT_EQ(sanitizeHostLabel("Café Ñandú"), "cafe-nandu");
    EXPECT_EQ(sanitizeHostLabel("Straße"), "strasse");
    EXPECT_EQ(sanitizeHostLabel("NAS-01"), "nas-01");
    EXPECT_EQ(sanitizeHostLabel("   "), "   ");
}

TEST(HostLabelTest, NormalizesResolvedHostNames) {
    EXPECT_EQ(normalizeResolvedHost("raspberrypi.local."), "raspberrypi.local");
    EXPECT_EQ(normalizeResolvedHost("  nas.local.. "), "nas.local");
    EXPECT_EQ(normalizeResolvedHost("."), "");
}

TEST_F(ServiceDiscoverySourceTest, StartAnnouncesSourceAndBrowsesConfiguredTypes) {
    auto source = makeSource();
    ASSERT_TRUE(source->start(collector()).isOk());
    ASSERT_TRUE(state_->waitStarted(std::chrono::seconds(1)));

    auto captured = events();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_TRUE(captured[0].isSourceStatus(DiscoverySource::ServiceDiscovery, SourceState::Started));
    EXPECT_EQ(state_->startCount, 1);

    source->stop();
    EXPECT_EQ(state_->stopCount, 1);
    EXPECT_EQ(countSourceEvents(events(), DiscoverySource::ServiceDiscovery, SourceState::Finished), 0u);
}

TEST_F(ServiceDiscoverySourceTest, ResolvedAdvertisementUsesResolvedHost) {
    state_->resolutions[ad("Raspberry Pi").key()] = ResolvedService{"raspberrypi.local.", 22, {"192.168.1.50"}};

    auto source = makeSource();
    ASSERT_TRUE(source->start(collector()).isOk());
    ASSERT_TRUE(state_->announce(ad("Raspberry Pi")));

    auto hosts = waitForHosts(1);
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].displayName, "Raspberry Pi");
    EXPECT_EQ(hosts[0].host, "raspberrypi.local");
    EXPECT_EQ(hosts[0].port, 22);
    EXPECT_TRUE(hosts[0].hasSource(DiscoverySource::ServiceDiscovery));
    EXPECT_FALSE(hosts[0].latencyMs.has_value());
    EXPECT_EQ(state_->lastResolveTimeout, std::chrono::milliseconds(200));
}

TEST_F(ServiceDiscoverySourceTest, UnresolvedAdvertisementFallsBackToSanitizedLabel) {
    auto source = makeSource();
    ASSERT_TRUE(source->start(collector()).isOk());
    ASSERT_TRUE(state_->announce(ad("Raspberry Pi")));

    auto hosts = waitForHosts(1);
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].displayName, "Raspberry Pi");
    EXPECT_EQ(hosts[0].host, "raspberry-pi.local");
    EXPECT_EQ(hosts[0].port, 22);
}

TEST_F(ServiceDiscoverySourceTest, ResolvedPortAndAddressFallback) {
    state_->resolutions[ad("Build Box").key()] = ResolvedService{"", 2222, {"10.0.0.8"}};
    state_->resolutions[ad("Old Box").key()] = ResolvedService{"oldbox.local", 0, {}};

    auto source = makeSource();
    ASSERT_TRUE(source->start(collector()).isOk());
    state_->announce(ad("Build Box"));
    state_->announce(ad("Old Box"));

    auto hosts = waitForHosts(2);
    ASSERT_EQ(hosts.size(), 2u);
    for (const auto& host : hosts) {
        if (host.displayName == "Build Box") {
            EXPECT_EQ(host.identityKey(), "10.0.0.8:2222");
        } else {
            EXPECT_EQ(host.identityKey(), "oldbox.local:22");
        }
    }
}

TEST_F(ServiceDiscoverySourceTest, DuplicateAdvertisementsResolveOnce) {
    auto source = makeSource();
    ASSERT_TRUE(source->start(collector()).isOk());
    state_->announce(ad("nas"));
    state_->announce(ad("nas"));
    state_->announce(ServiceAdvertisement{"nas", "_sftp-ssh._tcp.", "local."});

    auto hosts = waitForHosts(2);
    EXPECT_EQ(hosts.size(), 2u);
    EXPECT_EQ(source->advertisementCount(), 2u);

    std::lock_guard<std::mutex> lock(state_->mutex);
    EXPECT_EQ(state_->resolveRequests.size(), 2u);
}

TEST_F(ServiceDiscoverySourceTest, PermissionDeniedIsReportedOnce) {
    auto source = makeSource();
    ASSERT_TRUE(source->start(collector()).isOk());

    BrowseError denied{BrowseError::Kind::PermissionDenied, EACCES, "denied"};
    state_->raise(denied);
    state_->raise(denied);
    state_->raise(BrowseError{BrowseError::Kind::Failed, EIO, "socket gone"});

    EXPECT_EQ(countEvents(events(), DiscoveryEvent::Type::PermissionDenied), 1u);
}

TEST_F(ServiceDiscoverySourceTest, StartFailureWithEaccesReportsPermission) {
    state_->startError = Error("bind failed", EACCES, "MdnsServiceBrowser");

    auto source = makeSource();
    auto result = source->start(collector());
    EXPECT_FALSE(result.isOk());

    auto captured = events();
    EXPECT_EQ(countSourceEvents(captured, DiscoverySource::ServiceDiscovery, SourceState::Started), 1u);
    EXPECT_EQ(countEvents(captured, DiscoveryEvent::Type::PermissionDenied), 1u);
    EXPECT_EQ(countEvents(captured, DiscoveryEvent::Type::Failed), 0u);
}

TEST_F(ServiceDiscoverySourceTest, OtherStartFailureIsOnlyLogged) {
    state_->startError = Error("no multicast route", ENETUNREACH, "MdnsServiceBrowser");

    auto source = makeSource();
    EXPECT_FALSE(source->start(collector()).isOk());
    EXPECT_EQ(countEvents(events(), DiscoveryEvent::Type::PermissionDenied), 0u);
    EXPECT_EQ(countEvents(events(), DiscoveryEvent::Type::Failed), 0u);
}

TEST_F(ServiceDiscoverySourceTest, StopCancelsPendingResolutionsWithoutEmitting) {
    state_->resolveDelay = std::chrono::seconds(5);
    options_.resolveTimeout = std::chrono::seconds(5);

    auto source = makeSource();
    ASSERT_TRUE(source->start(collector()).isOk());
    state_->announce(ad("slow"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    const auto started = std::chrono::steady_clock::now();
    source->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));

    EXPECT_EQ(countEvents(events(), DiscoveryEvent::Type::HostFound), 0u);
    EXPECT_FALSE(state_->announce(ad("late")));

    source->stop();
    EXPECT_EQ(state_->stopCount, 1);
}
