/**
 * @file discovery_integration_test.cpp
 * @brief Beacon exchange between two discovery services over loopback
 *
 * Multicast and broadcast are switched off so the tests do not depend on the
 * network the machine sits on; beacons travel through unicast targets.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "DiscoveryService.h"
#include "Logger.h"

using namespace NetLink;

namespace {

template<typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

DiscoveryConfig loopbackConfig(const std::string& name) {
    DiscoveryConfig config;
    config.machineName = name;
    config.discoveryPort = 0;
    config.announceOnLan = false;
    config.beaconIntervalMs = 100;
    config.peerTtlMs = 600;
    return config;
}

} // namespace

class DiscoveryIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::WARN);

        DiscoveryConfig config = loopbackConfig("observer");
        config.advertise = false;
        observer_ = std::make_unique<DiscoveryService>(config);
        ASSERT_TRUE(observer_->start().ok());
        ASSERT_GT(observer_->listenPort(), 0);
    }

    void TearDown() override {
        observer_.reset();
    }

    std::unique_ptr<DiscoveryService> makeAnnouncer(const std::string& name, int receivePort) {
        DiscoveryConfig config = loopbackConfig(name);
        config.receivePort = receivePort;
        config.unicastTargets = {"127.0.0.1:" + std::to_string(observer_->listenPort())};
        return std::make_unique<DiscoveryService>(config);
    }

    std::unique_ptr<DiscoveryService> observer_;
};

TEST_F(DiscoveryIntegrationTest, AnnouncedPeerIsDiscovered) {
    std::atomic<int> changes{0};
    observer_->setPeersChangedCallback([&](const std::vector<Peer>&) { ++changes; });

    auto announcer = makeAnnouncer("alpha", 6123);
    ASSERT_TRUE(announcer->start().ok());

    ASSERT_TRUE(waitUntil([&] { return observer_->findPeer("alpha").has_value(); }));
    auto peer = observer_->findPeer("alpha");
    EXPECT_EQ(peer->ipAddress, "127.0.0.1");
    EXPECT_EQ(peer->port, 6123);
    EXPECT_GE(changes.load(), 1);

    // Repeated beacons refresh the entry instead of duplicating it
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(observer_->getPeers().size(), 1u);

    // The announcer never lists itself
    EXPECT_TRUE(announcer->getPeers().empty());
}

TEST_F(DiscoveryIntegrationTest, SilentPeerExpires) {
    std::atomic<size_t> lastCount{0};
    observer_->setPeersChangedCallback([&](const std::vector<Peer>& peers) { lastCount = peers.size(); });

    auto announcer = makeAnnouncer("beta", 6200);
    ASSERT_TRUE(announcer->start().ok());
    ASSERT_TRUE(waitUntil([&] { return observer_->findPeer("beta").has_value(); }));
    EXPECT_EQ(lastCount.load(), 1u);

    announcer->stop();
    ASSERT_TRUE(waitUntil([&] { return observer_->getPeers().empty(); }));
    EXPECT_EQ(lastCount.load(), 0u);
}

TEST_F(DiscoveryIntegrationTest, RestartedAnnouncerReappearsWithNewPort) {
    auto announcer = makeAnnouncer("gamma", 6300);
    ASSERT_TRUE(announcer->start().ok());
    ASSERT_TRUE(waitUntil([&] { return observer_->findPeer("gamma").has_value(); }));
    announcer.reset();

    auto replacement = makeAnnouncer("gamma", 6301);
    ASSERT_TRUE(replacement->start().ok());
    ASSERT_TRUE(waitUntil([&] {
        auto peer = observer_->findPeer("gamma");
        return peer && peer->port == 6301;
    }));
    EXPECT_EQ(observer_->getPeers().size(), 1u);
}

TEST_F(DiscoveryIntegrationTest, FilterIgnoresOtherSubnets) {
    DiscoveryConfig config = loopbackConfig("filtered-observer");
    config.advertise = false;
    config.ipFilter = "10.";
    DiscoveryService filtered(config);
    ASSERT_TRUE(filtered.start().ok());

    DiscoveryConfig announcerConfig = loopbackConfig("delta");
    announcerConfig.unicastTargets = {"127.0.0.1:" + std::to_string(filtered.listenPort()),
                                      "127.0.0.1:" + std::to_string(observer_->listenPort())};
    DiscoveryService announcer(announcerConfig);
    ASSERT_TRUE(announcer.start().ok());

    ASSERT_TRUE(waitUntil([&] { return observer_->findPeer("delta").has_value(); }));
    EXPECT_TRUE(filtered.getPeers().empty());
}

TEST_F(DiscoveryIntegrationTest, ServiceCanBeRestarted) {
    observer_->stop();
    EXPECT_FALSE(observer_->isRunning());
    ASSERT_TRUE(observer_->start().ok());
    EXPECT_TRUE(observer_->isRunning());

    auto announcer = makeAnnouncer("epsilon", 6400);
    ASSERT_TRUE(announcer->start().ok());
    EXPECT_TRUE(waitUntil([&] { return observer_->findPeer("epsilon").has_value(); }));
}

TEST_F(DiscoveryIntegrationTest, ManualBeaconFromListeningOnlyService) {
    DiscoveryConfig config = loopbackConfig("zeta");
    config.advertise = false;
    config.unicastTargets = {"127.0.0.1:" + std::to_string(observer_->listenPort())};
    DiscoveryService quiet(config);

    EXPECT_EQ(quiet.sendBeaconOnce(), 0);
    ASSERT_TRUE(quiet.start().ok());
    EXPECT_EQ(quiet.sendBeaconOnce(), 1);
    EXPECT_TRUE(waitUntil([&] { return observer_->findPeer("zeta").has_value(); }));

    quiet.stop();
    EXPECT_EQ(quiet.sendBeaconOnce(), 0);
}

TEST_F(DiscoveryIntegrationTest, ManualBeaconsRacingStopAreSafe) {
    for (int round = 0; round < 20; ++round) {
        DiscoveryConfig config = loopbackConfig("eta");
        config.advertise = false;
        config.unicastTargets = {"127.0.0.1:" + std::to_string(observer_->listenPort())};
        DiscoveryService quiet(config);
        ASSERT_TRUE(quiet.start().ok());

        std::atomic<bool> done{false};
        std::thread sender([&] {
            while (!done) {
                int sent = quiet.sendBeaconOnce();
                EXPECT_GE(sent, 0);
                EXPECT_LE(sent, 1);
            }
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        quiet.stop();
        EXPECT_EQ(quiet.sendBeaconOnce(), 0);
        done = true;
        sender.join();
    }
}
