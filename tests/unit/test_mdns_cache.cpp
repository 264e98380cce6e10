#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "MdnsCache.h"

using namespace LanScout;
using namespace LanScout::Mdns;

namespace {

DnsRecord ptr(const std::string& service, const std::string& instance, std::uint32_t ttl = 4500) {
    DnsRecord record;
    record.name = service;
    record.type = TYPE_PTR;
    record.ttl = ttl;
    record.target = instance;
    return record;
}

DnsRecord srv(const std::string& instance, std::uint16_t port, const std::string& target) {
    DnsRecord record;
    record.name = instance;
    record.type = TYPE_SRV;
    record.ttl = 120;
    record.port = port;
    record.target = target;
    return record;
}

DnsRecord a(const std::string& host, const std::string& address) {
    DnsRecord record;
    record.name = host;
    record.type = TYPE_A;
    record.ttl = 120;
    record.address = address;
    return record;
}

DnsRecord txt(const std::string& instance, std::vector<std::string> strings) {
    DnsRecord record;
    record.name = instance;
    record.type = TYPE_TXT;
    record.ttl = 4500;
    record.txt = std::move(strings);
    return record;
}

} // namespace

class MdnsCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_.setServices({"_ssh._tcp.", "_sftp-ssh._tcp."}, "local.");
    }

    MdnsCache cache_;
};

TEST_F(MdnsCacheTest, PtrAnnouncesEachInstanceOnce) {
    DnsMessage msg;
    msg.flags = FLAG_RESPONSE;
    msg.answers.push_back(ptr("_ssh._tcp.local", "Office Pi._ssh._tcp.local"));

    auto fresh = cache_.ingest(msg);
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0].name, "Office Pi");
    EXPECT_EQ(fresh[0].type, "_ssh._tcp.");
    EXPECT_EQ(fresh[0].domain, "local.");

    EXPECT_TRUE(cache_.ingest(msg).empty());
    EXPECT_EQ(cache_.instanceCount(), 1u);
}

TEST_F(MdnsCacheTest, MatchesServiceNamesCaseInsensitively) {
    DnsMessage msg;
    msg.answers.push_back(ptr("_SSH._TCP.Local.", "Office Pi._SSH._TCP.Local."));
    msg.answers.push_back(ptr("_sftp-ssh._tcp.local", "Office Pi._sftp-ssh._tcp.local"));

    auto fresh = cache_.ingest(msg);
    ASSERT_EQ(fresh.size(), 2u);
    EXPECT_EQ(fresh[0].type, "_ssh._tcp.");
    EXPECT_EQ(fresh[1].type, "_sftp-ssh._tcp.");
}

TEST_F(MdnsCacheTest, IgnoresOtherServicesAndGoodbyes) {
    DnsMessage msg;
    msg.answers.push_back(ptr("_http._tcp.local", "Printer._http._tcp.local"));
    msg.answers.push_back(ptr("_ssh._tcp.local", "Leaving._ssh._tcp.local", 0));
    msg.answers.push_back(ptr("_ssh._tcp.local", "not-an-instance.local"));

    EXPECT_TRUE(cache_.ingest(msg).empty());
    EXPECT_EQ(cache_.instanceCount(), 0u);
}

TEST_F(MdnsCacheTest, LookupJoinsRecordsFromSeparatePackets) {
    ServiceAdvertisement ad{"Office Pi", "_ssh._tcp.", "local."};
    EXPECT_FALSE(cache_.lookup(ad).has_value());

    DnsMessage first;
    first.answers.push_back(ptr("_ssh._tcp.local", "Office Pi._ssh._tcp.local"));
    first.additionals.push_back(srv("office pi._ssh._tcp.local.", 22, "raspberrypi.local."));
    first.additionals.push_back(txt("Office Pi._ssh._tcp.local", {"model=pi4"}));
    cache_.ingest(first);

    auto partial = cache_.lookup(ad);
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(partial->hostName, "raspberrypi.local.");
    EXPECT_EQ(partial->port, 22);
    EXPECT_TRUE(partial->addresses.empty());

    DnsMessage second;
    second.answers.push_back(a("RaspberryPi.local", "192.168.1.50"));
    second.answers.push_back(a("raspberrypi.local", "192.168.1.50"));
    second.answers.push_back(a("raspberrypi.local", "10.0.0.50"));
    cache_.ingest(second);

    auto full = cache_.lookup(ad);
    ASSERT_TRUE(full.has_value());
    ASSERT_EQ(full->addresses.size(), 2u);
    EXPECT_EQ(full->addresses[0], "192.168.1.50");
    EXPECT_EQ(full->addresses[1], "10.0.0.50");

    auto strings = cache_.txtFor(ad);
    ASSERT_EQ(strings.size(), 1u);
    EXPECT_EQ(strings[0], "model=pi4");
}

TEST_F(MdnsCacheTest, InstanceLabelsWithDotsRoundTrip) {
    DnsMessage msg;
    msg.answers.push_back(ptr("_ssh._tcp.local", "build\\.box._ssh._tcp.local"));
    msg.answers.push_back(srv("build\\.box._ssh._tcp.local", 2222, "buildbox.local"));

    auto fresh = cache_.ingest(msg);
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0].name, "build.box");

    auto resolved = cache_.lookup(fresh[0]);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->port, 2222);
}

TEST_F(MdnsCacheTest, ClearForgetsInstances) {
    DnsMessage msg;
    msg.answers.push_back(ptr("_ssh._tcp.local", "nas._ssh._tcp.local"));
    cache_.ingest(msg);
    cache_.clear();

    EXPECT_EQ(cache_.instanceCount(), 0u);
    EXPECT_EQ(cache_.ingest(msg).size(), 1u);
}
