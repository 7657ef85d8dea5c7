#include <gtest/gtest.h>
#include "DiscoveryService.h"
#include "PeerTable.h"

using namespace NetLink;
using namespace std::chrono_literals;

TEST(DiscoveryFilterTest, PrefixMatching) {
    DiscoveryFilter open;
    EXPECT_FALSE(open.enabled());
    EXPECT_TRUE(open.accepts("10.0.0.1"));

    DiscoveryFilter lan("192.168.1.");
    EXPECT_TRUE(lan.enabled());
    EXPECT_TRUE(lan.accepts("192.168.1.20"));
    EXPECT_FALSE(lan.accepts("192.168.10.20"));
    EXPECT_FALSE(lan.accepts("10.0.0.5"));
    EXPECT_FALSE(lan.accepts("192.168"));
}

TEST(PeerTableTest, UpsertKeyedByAddress) {
    PeerTable table;
    auto now = std::chrono::steady_clock::now();

    EXPECT_EQ(table.upsert("10.0.0.2", "alpha", 5000, now), PeerTable::Update::Inserted);
    EXPECT_EQ(table.upsert("10.0.0.2", "alpha", 5000, now + 1s), PeerTable::Update::Refreshed);
    EXPECT_EQ(table.upsert("10.0.0.2", "alpha", 6000, now + 2s), PeerTable::Update::Changed);
    EXPECT_EQ(table.upsert("10.0.0.3", "beta", 5000, now), PeerTable::Update::Inserted);

    EXPECT_EQ(table.size(), 2u);
    auto alpha = table.findByName("alpha");
    ASSERT_TRUE(alpha.has_value());
    EXPECT_EQ(alpha->port, 6000);
    EXPECT_EQ(alpha->firstSeen, now);
    EXPECT_EQ(alpha->lastSeen, now + 2s);
    EXPECT_FALSE(table.findByAddress("10.0.0.9").has_value());
}

TEST(PeerTableTest, SweepRemovesOnlyExpired) {
    PeerTable table;
    auto start = std::chrono::steady_clock::now();
    table.upsert("10.0.0.2", "old", 5000, start);
    table.upsert("10.0.0.3", "fresh", 5000, start + 3s);

    EXPECT_TRUE(table.sweep(start + 4s, 4000ms).empty());

    auto removed = table.sweep(start + 4s + 1ms, 4000ms);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].machineName, "old");
    EXPECT_EQ(table.size(), 1u);
}

class DiscoveryTtlTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::CRITICAL);
        now_ = std::chrono::steady_clock::now();
    }

    std::string beaconFrom(const std::string& name, int port, const std::string& instance = "remote-1") {
        Beacon beacon;
        beacon.machineName = name;
        beacon.port = port;
        beacon.instanceId = instance;
        return BeaconCodec::encode(beacon);
    }

    DiscoveryConfig config(const std::string& filter = "") {
        DiscoveryConfig cfg;
        cfg.machineName = "local";
        cfg.peerTtlMs = 4000;
        cfg.ipFilter = filter;
        return cfg;
    }

    std::chrono::steady_clock::time_point now_;
};

TEST_F(DiscoveryTtlTest, PeerExpiresAfterTtlUnderSimulatedTime) {
    DiscoveryService service(config(), [this] { return now_; });
    int changes = 0;
    service.setPeersChangedCallback([&](const std::vector<Peer>&) { ++changes; });

    EXPECT_EQ(service.handleDatagram(beaconFrom("alpha", 5000), "10.0.0.2"), BeaconOutcome::NewPeer);
    EXPECT_EQ(service.getPeers().size(), 1u);

    now_ += 3s;
    EXPECT_EQ(service.sweepExpired(), 0u);
    EXPECT_EQ(service.getPeers().size(), 1u);

    now_ += 1001ms;
    EXPECT_EQ(service.sweepExpired(), 1u);
    EXPECT_TRUE(service.getPeers().empty());
    EXPECT_EQ(changes, 2);
}

TEST_F(DiscoveryTtlTest, RefreshKeepsPeerAlive) {
    DiscoveryService service(config(), [this] { return now_; });
    service.handleDatagram(beaconFrom("alpha", 5000), "10.0.0.2");

    for (int i = 0; i < 5; ++i) {
        now_ += 2s;
        EXPECT_EQ(service.handleDatagram(beaconFrom("alpha", 5000), "10.0.0.2"), BeaconOutcome::Refreshed);
        EXPECT_EQ(service.sweepExpired(), 0u);
    }
    ASSERT_TRUE(service.findPeer("alpha").has_value());
}

TEST_F(DiscoveryTtlTest, FilteredBeaconNeverReachesTable) {
    DiscoveryService service(config("192.168.1."), [this] { return now_; });

    EXPECT_EQ(service.handleDatagram(beaconFrom("outsider", 5000), "10.0.0.5"), BeaconOutcome::Filtered);
    EXPECT_EQ(service.handleDatagram(beaconFrom("insider", 5000), "192.168.1.20"), BeaconOutcome::NewPeer);

    auto peers = service.getPeers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].machineName, "insider");
    EXPECT_EQ(peers[0].ipAddress, "192.168.1.20");
}

TEST_F(DiscoveryTtlTest, OwnAndInvalidBeaconsAreIgnored) {
    DiscoveryService service(config(), [this] { return now_; });

    EXPECT_EQ(service.handleDatagram(beaconFrom("local", 5000, service.instanceId()), "10.0.0.1"),
              BeaconOutcome::Self);
    EXPECT_EQ(service.handleDatagram("not json at all", "10.0.0.2"), BeaconOutcome::Malformed);
    EXPECT_EQ(service.handleDatagram("{\"service\":\"other\",\"name\":\"x\",\"port\":1}", "10.0.0.3"),
              BeaconOutcome::Foreign);

    BeaconOutcome nested = BeaconOutcome::NewPeer;
    EXPECT_NO_THROW(nested = service.handleDatagram(std::string(1024, '['), "10.0.0.9"));
    EXPECT_EQ(nested, BeaconOutcome::Malformed);
    EXPECT_TRUE(service.getPeers().empty());
}
