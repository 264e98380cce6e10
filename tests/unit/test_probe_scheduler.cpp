#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

#include "Logger.h"
#include "MockDiscovery.h"
#include "ProbeScheduler.h"

using namespace LanScout;

class ProbeSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        options_.probeTimeout = std::chrono::milliseconds(50);
    }

    void TearDown() override {
        Logger::instance().setConsoleOutput(true);
    }

    ProbeScheduler::EventSink collector() {
        return [this](DiscoveryEvent event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        };
    }

    std::vector<DiscoveryEvent> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    static CandidateAddressSet slash24(const char* local) {
        return computeCandidates(parseIPv4(local).value_or(0), parseIPv4("255.255.255.0").value_or(0));
    }

    DiscoveryOptions options_;
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<DiscoveryEvent> events_;
};

TEST_F(ProbeSchedulerTest, ReportsOpenHostsAndFinishesOnce) {
    auto prober = std::make_shared<ScriptedProber>();
    prober->succeed("192.168.1.10", 4);
    prober->succeed("192.168.1.20", 12);

    ProbeScheduler scheduler(prober, options_);
    auto stats = scheduler.run(slash24("192.168.1.42"), collector(), cancelled_);

    EXPECT_EQ(stats.candidates, 253u);
    EXPECT_EQ(stats.attempted, 253u);
    EXPECT_EQ(stats.found, 2u);
    EXPECT_EQ(stats.waves, 11u);   // ceil(253 / 24)
    EXPECT_FALSE(stats.cancelled);
    EXPECT_EQ(prober->calls(), 253);
    EXPECT_EQ(prober->lastPort(), 22);

    auto captured = events();
    ASSERT_EQ(countEvents(captured, DiscoveryEvent::Type::HostFound), 2u);
    EXPECT_EQ(countSourceEvents(captured, DiscoverySource::ActiveProbe, SourceState::Finished), 1u);
    EXPECT_TRUE(captured.back().isSourceStatus(DiscoverySource::ActiveProbe, SourceState::Finished));

    for (const auto& event : captured) {
        if (event.type != DiscoveryEvent::Type::HostFound) {
            continue;
        }
        ASSERT_TRUE(event.host.has_value());
        EXPECT_EQ(event.host->displayName, event.host->host);
        EXPECT_EQ(event.host->port, 22);
        EXPECT_TRUE(event.host->hasSource(DiscoverySource::ActiveProbe));
        EXPECT_FALSE(event.host->hasSource(DiscoverySource::ServiceDiscovery));
        ASSERT_TRUE(event.host->latencyMs.has_value());
        EXPECT_EQ(*event.host->latencyMs, event.host->host == "192.168.1.10" ? 4 : 12);
    }
}

TEST_F(ProbeSchedulerTest, NeverExceedsConcurrencyLimit) {
    options_.probeConcurrency = 5;
    auto prober = std::make_shared<ScriptedProber>(std::chrono::milliseconds(5));

    ProbeScheduler scheduler(prober, options_);
    auto stats = scheduler.run(slash24("10.0.0.1"), collector(), cancelled_);

    EXPECT_EQ(stats.attempted, 253u);
    EXPECT_LE(prober->maxInFlight(), 5);
    EXPECT_GE(prober->maxInFlight(), 1);
}

TEST_F(ProbeSchedulerTest, UsesConfiguredPort) {
    options_.probePort = 2222;
    auto prober = std::make_shared<ScriptedProber>();
    prober->succeed("192.168.1.7", 1);

    ProbeScheduler scheduler(prober, options_);
    scheduler.run(slash24("192.168.1.42"), collector(), cancelled_);

    EXPECT_EQ(prober->lastPort(), 2222);
    auto captured = events();
    ASSERT_EQ(countEvents(captured, DiscoveryEvent::Type::HostFound), 1u);
    EXPECT_EQ(captured.front().host->identityKey(), "192.168.1.7:2222");
}

TEST_F(ProbeSchedulerTest, EmptyCandidateSetFinishesImmediately) {
    auto prober = std::make_shared<ScriptedProber>();
    ProbeScheduler scheduler(prober, options_);

    auto stats = scheduler.run(CandidateAddressSet{}, collector(), cancelled_);

    EXPECT_EQ(stats.attempted, 0u);
    EXPECT_EQ(prober->calls(), 0);
    auto captured = events();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_TRUE(captured[0].isSourceStatus(DiscoverySource::ActiveProbe, SourceState::Finished));
}

TEST_F(ProbeSchedulerTest, CancelledRunEmitsNothing) {
    cancelled_ = true;
    auto prober = std::make_shared<ScriptedProber>();
    prober->succeedAll(3);

    ProbeScheduler scheduler(prober, options_);
    auto stats = scheduler.run(slash24("192.168.1.42"), collector(), cancelled_);

    EXPECT_TRUE(stats.cancelled);
    EXPECT_EQ(prober->calls(), 0);
    EXPECT_TRUE(events().empty());

    auto emptyStats = scheduler.run(CandidateAddressSet{}, collector(), cancelled_);
    EXPECT_EQ(emptyStats.attempted, 0u);
    EXPECT_TRUE(events().empty());
}

TEST_F(ProbeSchedulerTest, CancellationMidRunStopsFurtherWaves) {
    options_.probeConcurrency = 4;
    auto prober = std::make_shared<ScriptedProber>(std::chrono::milliseconds(10));
    prober->succeedAll(2);

    ProbeScheduler scheduler(prober, options_);
    std::atomic<int> found{0};
    auto stats = scheduler.run(slash24("192.168.1.42"), [this, &found](DiscoveryEvent event) {
        if (event.type == DiscoveryEvent::Type::HostFound && ++found == 4) {
            cancelled_ = true;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }, cancelled_);

    EXPECT_TRUE(stats.cancelled);
    EXPECT_LT(stats.attempted, 253u);
    EXPECT_LE(stats.waves, 2u);
    EXPECT_EQ(countSourceEvents(events(), DiscoverySource::ActiveProbe, SourceState::Finished), 0u);
}
