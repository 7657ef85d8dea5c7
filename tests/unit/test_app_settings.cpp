#include <gtest/gtest.h>
#include "AppSettings.h"

using namespace NetLink;
using namespace std::chrono_literals;

TEST(AppSettingsTest, DefaultsWhenConfigIsEmpty) {
    Config config;
    auto settings = AppSettings::fromConfig(config);
    ASSERT_TRUE(settings.ok()) << settings.error().message;

    EXPECT_EQ(settings->server.port, nlk::config::DEFAULT_TCP_PORT);
    EXPECT_EQ(settings->client.protocol, ProtocolVariant::Resumable);
    EXPECT_EQ(settings->client.retry.maxAttempts, 3);
    EXPECT_EQ(settings->client.retry.baseDelay, 2000ms);
    EXPECT_TRUE(settings->client.resumePartial);
    EXPECT_EQ(settings->discovery.discoveryPort, 5007);
    EXPECT_EQ(settings->discovery.multicastGroup, "239.255.77.77");
    EXPECT_EQ(settings->discovery.beaconIntervalMs, 1000);
    EXPECT_EQ(settings->discovery.peerTtlMs, 4000);
    EXPECT_TRUE(settings->discovery.ipFilter.empty());
    EXPECT_EQ(settings->logLevel, LogLevel::INFO);
}

TEST(AppSettingsTest, ValuesFlowIntoComponents) {
    Config config;
    config.setInt("listen_port", 6000);
    config.set("output_root", "/srv/incoming");
    config.setInt("max_attempts", 5);
    config.setInt("base_delay_ms", 500);
    config.set("protocol", "multi");
    config.set("discovery_ip_filter", "192.168.");
    config.set("unicast_targets", "10.0.0.5, 10.0.0.6:6007");
    config.set("broadcast_only", "yes");
    config.set("log_level", "debug");

    auto settings = AppSettings::fromConfig(config);
    ASSERT_TRUE(settings.ok()) << settings.error().message;

    EXPECT_EQ(settings->server.port, 6000);
    EXPECT_EQ(settings->discovery.receivePort, 6000);
    EXPECT_EQ(settings->server.outputRoot, "/srv/incoming");
    EXPECT_EQ(settings->client.retry.maxAttempts, 5);
    EXPECT_EQ(settings->client.retry.baseDelay, 500ms);
    EXPECT_EQ(settings->client.protocol, ProtocolVariant::Multi);
    EXPECT_EQ(settings->discovery.ipFilter, "192.168.");
    EXPECT_EQ(settings->discovery.unicastTargets, (std::vector<std::string>{"10.0.0.5", "10.0.0.6:6007"}));
    EXPECT_TRUE(settings->discovery.broadcastOnly);
    EXPECT_EQ(settings->logLevel, LogLevel::DEBUG);
}

TEST(AppSettingsTest, InvalidValuesNameTheKey) {
    struct Case { const char* key; const char* value; };
    for (const Case& bad : {Case{"listen_port", "70000"}, Case{"max_attempts", "0"},
                            Case{"protocol", "carrier-pigeon"}, Case{"broadcast_only", "maybe"},
                            Case{"chunk_size", "12abc"}, Case{"log_level", "loud"}}) {
        Config config;
        config.set(bad.key, bad.value);
        auto settings = AppSettings::fromConfig(config);
        ASSERT_FALSE(settings.ok()) << bad.key;
        EXPECT_EQ(settings.error().code, nlk::ErrorCode::InvalidConfig);
        EXPECT_NE(settings.error().message.find(bad.key), std::string::npos);
    }
}

TEST(AppSettingsTest, TtlMustOutliveBeaconInterval) {
    Config config;
    config.setInt("beacon_interval_ms", 1000);
    config.setInt("peer_ttl_ms", 800);
    auto settings = AppSettings::fromConfig(config);
    ASSERT_FALSE(settings.ok());
    EXPECT_EQ(settings.error().code, nlk::ErrorCode::InvalidConfig);
}
