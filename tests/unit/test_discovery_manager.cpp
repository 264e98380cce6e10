#include <gtest/gtest.h>

#include <algorithm>
#include <any>
#include <cerrno>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "DiscoveryManager.h"
#include "Logger.h"
#include "MockDiscovery.h"

using namespace LanScout;

class DiscoveryManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        interfaces_ = std::make_shared<FakeInterfaceProvider>(std::vector<NetworkInterface>{
            makeInterface("en0", "192.168.1.42", "255.255.255.0"),
        });
        prober_ = std::make_shared<ScriptedProber>();
        browserState_ = std::make_shared<FakeBrowserState>();
        options_.scanDuration = std::chrono::milliseconds(250);
        options_.probeTimeout = std::chrono::milliseconds(20);
        options_.resolveTimeout = std::chrono::milliseconds(50);
    }

    void TearDown() override {
        Logger::instance().setConsoleOutput(true);
    }

    std::unique_ptr<DiscoveryManager> makeManager() {
        auto state = browserState_;
        auto controller = std::make_unique<DiscoveryController>(
            interfaces_, prober_,
            [state]() { return std::make_unique<FakeServiceBrowser>(state); },
            options_);
        return std::make_unique<DiscoveryManager>(std::move(controller));
    }

    std::shared_ptr<FakeInterfaceProvider> interfaces_;
    std::shared_ptr<ScriptedProber> prober_;
    std::shared_ptr<FakeBrowserState> browserState_;
    DiscoveryOptions options_;
};

TEST_F(DiscoveryManagerTest, RequiresController) {
    EXPECT_THROW(DiscoveryManager(nullptr), std::invalid_argument);
}

TEST_F(DiscoveryManagerTest, StartsIdle) {
    auto manager = makeManager();
    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Idle);
    EXPECT_EQ(manager->permissionState(), DiscoveryManager::PermissionState::Unknown);
    EXPECT_EQ(manager->statusText(), "Ready to scan your local network.");
    EXPECT_TRUE(manager->hosts().empty());
}

TEST_F(DiscoveryManagerTest, CompletedScanCollectsHosts) {
    prober_->succeed("192.168.1.10", 4);
    prober_->succeed("192.168.1.11", 6);

    auto manager = makeManager();
    manager->startScan();
    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Scanning);
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));

    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Completed);
    EXPECT_EQ(manager->permissionState(), DiscoveryManager::PermissionState::Granted);
    EXPECT_FALSE(manager->isScanning());
    EXPECT_FALSE(manager->isSourceActive(DiscoverySource::ActiveProbe));
    EXPECT_FALSE(manager->isSourceActive(DiscoverySource::ServiceDiscovery));
    EXPECT_EQ(manager->hosts().size(), 2u);
    EXPECT_EQ(manager->statusText(), "2 SSH host(s) found.");

    auto prefill = manager->prefill("192.168.1.10:22");
    ASSERT_TRUE(prefill.has_value());
    EXPECT_EQ(prefill->host, "192.168.1.10");
    EXPECT_EQ(prefill->port, 22);
    EXPECT_FALSE(prefill->username.has_value());
    EXPECT_FALSE(manager->prefill("192.168.1.99:22").has_value());
}

TEST_F(DiscoveryManagerTest, EmptyScanReportsNoHosts) {
    auto manager = makeManager();
    manager->startScan();
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));

    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Completed);
    EXPECT_EQ(manager->permissionState(), DiscoveryManager::PermissionState::Unknown);
    EXPECT_EQ(manager->statusText(), "No SSH hosts found.");
}

TEST_F(DiscoveryManagerTest, NoUsableInterfaceStillScansThenReportsUnsupportedNetwork) {
    interfaces_->setInterfaces({makeInterface("lo", "127.0.0.1", "255.0.0.0", true, true)});
    auto manager = makeManager();
    manager->startScan();
    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Scanning);
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));

    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::UnsupportedNetwork);
    EXPECT_EQ(manager->statusText(), "Connect to Wi-Fi or ethernet to discover local SSH hosts.");
    EXPECT_EQ(browserState_->startCount, 1);
    EXPECT_EQ(prober_->calls(), 0);
}

TEST_F(DiscoveryManagerTest, NoUsableInterfaceKeepsServiceDiscoveryResults) {
    interfaces_->setInterfaces({});
    auto manager = makeManager();
    manager->startScan();
    ASSERT_TRUE(browserState_->waitStarted(std::chrono::seconds(1)));
    ASSERT_TRUE(browserState_->announce(ServiceAdvertisement{"nas", "_ssh._tcp.", "local."}));
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));

    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Completed);
    ASSERT_EQ(manager->hosts().size(), 1u);
    EXPECT_EQ(manager->hosts()[0].host, "nas.local");
    EXPECT_EQ(prober_->calls(), 0);
}

TEST_F(DiscoveryManagerTest, SnapshotFailureIsUnsupportedNetwork) {
    interfaces_->failWith(Error("getifaddrs failed", EMFILE, "NetworkInterfaces"));
    auto manager = makeManager();
    manager->startScan();
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));
    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::UnsupportedNetwork);
    EXPECT_EQ(prober_->calls(), 0);
}

TEST_F(DiscoveryManagerTest, PermissionDeniedIsTracked) {
    browserState_->startError = Error("bind 5353 denied", EACCES, "MdnsServiceBrowser");
    auto manager = makeManager();
    manager->startScan();
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));

    EXPECT_EQ(manager->permissionState(), DiscoveryManager::PermissionState::Denied);
    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Completed);
}

TEST_F(DiscoveryManagerTest, FailedStreamSetsErrorAndStatusText) {
    auto controller = std::make_unique<DiscoveryController>(
        interfaces_, prober_,
        []() -> std::unique_ptr<ServiceBrowser> { throw std::runtime_error("no resources"); },
        options_);
    DiscoveryManager manager(std::move(controller));

    manager.startScan();
    ASSERT_TRUE(manager.waitForCompletion(std::chrono::seconds(5)));

    EXPECT_EQ(manager.scanState(), DiscoveryManager::ScanState::Failed);
    EXPECT_EQ(manager.error(), "no resources");
    EXPECT_EQ(manager.statusText(), "no resources");
}

TEST_F(DiscoveryManagerTest, StopKeepsHostsUnlessCleared) {
    prober_->succeed("192.168.1.10", 4);
    options_.scanDuration = std::chrono::seconds(30);
    auto manager = makeManager();

    manager->startScan();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (manager->hosts().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(manager->hosts().size(), 1u);

    manager->stopScan(false);
    EXPECT_EQ(manager->scanState(), DiscoveryManager::ScanState::Idle);
    EXPECT_EQ(manager->hosts().size(), 1u);
    EXPECT_FALSE(manager->isSourceActive(DiscoverySource::ServiceDiscovery));

    manager->stopScan(true);
    EXPECT_TRUE(manager->hosts().empty());
    EXPECT_EQ(manager->permissionState(), DiscoveryManager::PermissionState::Unknown);
    EXPECT_EQ(manager->statusText(), "Ready to scan your local network.");
}

TEST_F(DiscoveryManagerTest, RescanStartsFromEmptyResults) {
    prober_->succeed("192.168.1.10", 4);
    auto manager = makeManager();
    manager->startScan();
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));
    ASSERT_EQ(manager->hosts().size(), 1u);

    interfaces_->setInterfaces({makeInterface("en0", "10.0.0.5", "255.255.255.0")});
    manager->rescan();
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));

    EXPECT_TRUE(manager->hosts().empty());
    EXPECT_EQ(manager->statusText(), "No SSH hosts found.");
}

TEST_F(DiscoveryManagerTest, StatusTextFollowsActiveSources) {
    options_.scanDuration = std::chrono::seconds(30);
    prober_ = std::make_shared<ScriptedProber>(std::chrono::milliseconds(50));
    options_.probeConcurrency = 1;
    auto manager = makeManager();

    manager->startScan();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!(manager->isSourceActive(DiscoverySource::ServiceDiscovery) &&
             manager->isSourceActive(DiscoverySource::ActiveProbe)) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(manager->statusText(), "Scanning with service discovery and SSH port probe...");
    manager->stopScan();
}

TEST_F(DiscoveryManagerTest, PublishesOnTheEventBus) {
    prober_->succeed("192.168.1.10", 4);

    // Declared before the manager so they outlive its pump thread
    std::mutex mutex;
    std::vector<DiscoveryManager::ScanState> states;
    std::size_t lastHostCount = 0;
    std::size_t rawEvents = 0;

    auto manager = makeManager();

    manager->bus().subscribe(DiscoveryManager::STATE_CHANGED, [&](const std::any& data) {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(std::any_cast<DiscoveryManager::Status>(data).scanState);
    });
    manager->bus().subscribe(DiscoveryManager::HOSTS_CHANGED, [&](const std::any& data) {
        std::lock_guard<std::mutex> lock(mutex);
        lastHostCount = std::any_cast<std::vector<DiscoveredHost>>(data).size();
    });
    manager->bus().subscribe(DiscoveryManager::EVENT, [&](const std::any& data) {
        std::lock_guard<std::mutex> lock(mutex);
        if (std::any_cast<DiscoveryEvent>(&data)) {
            ++rawEvents;
        }
    });

    manager->startScan();
    ASSERT_TRUE(manager->waitForCompletion(std::chrono::seconds(5)));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(states.empty());
    EXPECT_NE(std::find(states.begin(), states.end(), DiscoveryManager::ScanState::Scanning), states.end());
    EXPECT_EQ(states.back(), DiscoveryManager::ScanState::Completed);
    EXPECT_EQ(lastHostCount, 1u);
    EXPECT_GE(rawEvents, 6u);
}

TEST(DiscoveryManagerNames, StableStateNames) {
    EXPECT_STREQ(scanStateName(DiscoveryManager::ScanState::UnsupportedNetwork), "unsupported_network");
    EXPECT_STREQ(permissionStateName(DiscoveryManager::PermissionState::Denied), "denied");
}
