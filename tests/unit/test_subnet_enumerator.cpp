#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "Logger.h"
#include "MockDiscovery.h"
#include "SubnetEnumerator.h"

using namespace LanScout;

class SubnetEnumeratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
    }

    void TearDown() override {
        Logger::instance().setConsoleOutput(true);
    }

    static std::uint32_t ip(const char* text) {
        return parseIPv4(text).value_or(0);
    }

    const std::vector<std::string> prefixes_{"en", "wl", "eth"};
};

TEST_F(SubnetEnumeratorTest, Slash24ExcludesNetworkBroadcastAndSelf) {
    auto set = computeCandidates(ip("192.168.1.42"), ip("255.255.255.0"));

    EXPECT_EQ(set.prefixLength, 24);
    EXPECT_FALSE(set.clamped);
    EXPECT_EQ(formatIPv4(set.network), "192.168.1.0");
    EXPECT_EQ(formatIPv4(set.broadcast), "192.168.1.255");
    ASSERT_EQ(set.size(), 253u);

    auto hosts = set.hostStrings();
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");
    EXPECT_EQ(std::count(hosts.begin(), hosts.end(), "192.168.1.42"), 0);
    EXPECT_EQ(std::count(hosts.begin(), hosts.end(), "192.168.1.0"), 0);
    EXPECT_EQ(std::count(hosts.begin(), hosts.end(), "192.168.1.255"), 0);
}

TEST_F(SubnetEnumeratorTest, WideSubnetIsClampedToLocalSlash24) {
    auto set = computeCandidates(ip("10.20.30.40"), ip("255.255.0.0"));

    EXPECT_EQ(set.prefixLength, 16);
    EXPECT_TRUE(set.clamped);
    EXPECT_EQ(formatIPv4(set.network), "10.20.30.0");
    EXPECT_EQ(formatIPv4(set.broadcast), "10.20.30.255");
    EXPECT_EQ(set.size(), 253u);
}

TEST_F(SubnetEnumeratorTest, NarrowSubnetsKeepTheirRange) {
    auto slash30 = computeCandidates(ip("192.168.5.1"), ip("255.255.255.252"));
    ASSERT_EQ(slash30.size(), 1u);
    EXPECT_EQ(slash30.hostStrings()[0], "192.168.5.2");

    auto slash28 = computeCandidates(ip("172.16.0.20"), ip("255.255.255.240"));
    EXPECT_EQ(slash28.size(), 13u);
}

TEST_F(SubnetEnumeratorTest, DegenerateRangesAreEmpty) {
    EXPECT_TRUE(computeCandidates(ip("192.168.5.1"), ip("255.255.255.254")).empty());
    EXPECT_TRUE(computeCandidates(ip("192.168.5.1"), ip("255.255.255.255")).empty());
}

TEST_F(SubnetEnumeratorTest, IPv4Helpers) {
    EXPECT_EQ(prefixLengthFromNetmask(ip("255.255.255.0")), 24);
    EXPECT_EQ(prefixLengthFromNetmask(ip("255.255.240.0")), 20);
    EXPECT_EQ(prefixLengthFromNetmask(0), 0);
    EXPECT_FALSE(parseIPv4("192.168.1").has_value());
    EXPECT_FALSE(parseIPv4("not-an-address").has_value());
    EXPECT_EQ(formatIPv4(0xC0A8012Au), "192.168.1.42");
}

TEST_F(SubnetEnumeratorTest, PrefersNamedInterfaceOtherwiseLastQualifying) {
    std::vector<NetworkInterface> interfaces{
        makeInterface("lo", "127.0.0.1", "255.0.0.0", true, true),
        makeInterface("docker0", "172.17.0.1", "255.255.0.0"),
        makeInterface("wlan0", "192.168.1.42", "255.255.255.0"),
        makeInterface("virbr0", "192.168.122.1", "255.255.255.0"),
    };

    auto selected = selectInterface(interfaces, prefixes_);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->name, "wlan0");

    auto fallback = selectInterface(interfaces, {"en"});
    ASSERT_TRUE(fallback.has_value());
    EXPECT_EQ(fallback->name, "virbr0");
}

TEST_F(SubnetEnumeratorTest, SkipsDownLoopbackAndUnaddressedInterfaces) {
    std::vector<NetworkInterface> interfaces{
        makeInterface("lo", "127.0.0.1", "255.0.0.0", true, true),
        makeInterface("eth0", "192.168.1.10", "255.255.255.0", false),
        makeInterface("en0", "0.0.0.0", "255.255.255.0"),
    };
    EXPECT_FALSE(selectInterface(interfaces, prefixes_).has_value());
}

TEST_F(SubnetEnumeratorTest, EnumerateUsesSelectedInterface) {
    FakeInterfaceProvider provider({
        makeInterface("lo", "127.0.0.1", "255.0.0.0", true, true),
        makeInterface("en0", "192.168.1.42", "255.255.255.0"),
    });

    auto set = enumerateCandidates(provider, prefixes_);
    EXPECT_EQ(set.interfaceName, "en0");
    EXPECT_EQ(set.size(), 253u);
    EXPECT_EQ(provider.calls(), 1);
}

TEST_F(SubnetEnumeratorTest, EnumerateFailsClosed) {
    FakeInterfaceProvider failing;
    failing.failWith(Error("getifaddrs failed", 12, "NetworkInterfaces"));
    EXPECT_TRUE(enumerateCandidates(failing, prefixes_).empty());

    FakeInterfaceProvider loopbackOnly({makeInterface("lo", "127.0.0.1", "255.0.0.0", true, true)});
    EXPECT_TRUE(enumerateCandidates(loopbackOnly, prefixes_).empty());
}

TEST_F(SubnetEnumeratorTest, SystemSnapshotReportsAddressesInHostOrder) {
    SystemInterfaceProvider provider;
    auto snapshot = provider.snapshot();
    ASSERT_TRUE(snapshot.isOk());

    for (const auto& iface : snapshot.value()) {
        if (iface.isLoopback && iface.address != 0) {
            EXPECT_EQ(iface.address >> 24, 127u);
        }
    }
}
