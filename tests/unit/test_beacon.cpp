#include <gtest/gtest.h>
#include "Beacon.h"
#include "Constants.h"

using namespace NetLink;

TEST(BeaconTest, EncodeDecode) {
    Beacon beacon;
    beacon.machineName = "workstation";
    beacon.port = 5000;
    beacon.instanceId = "abc123";

    std::string payload = BeaconCodec::encode(beacon);
    EXPECT_NE(payload.find("\"service\":\"netlink\""), std::string::npos);
    EXPECT_EQ(payload.find('\n'), std::string::npos);
    EXPECT_LE(payload.size(), nlk::config::MAX_BEACON_SIZE);

    auto decoded = BeaconCodec::decode(payload);
    ASSERT_TRUE(decoded.ok()) << decoded.error().message;
    EXPECT_EQ(decoded->machineName, "workstation");
    EXPECT_EQ(decoded->port, 5000);
    EXPECT_EQ(decoded->instanceId, "abc123");
    EXPECT_EQ(decoded->version, 1);
}

TEST(BeaconTest, InstanceIsOptional) {
    auto decoded = BeaconCodec::decode(R"({"service":"netlink","version":1,"name":"pc","port":5000})");
    ASSERT_TRUE(decoded.ok()) << decoded.error().message;
    EXPECT_TRUE(decoded->instanceId.empty());
}

TEST(BeaconTest, ForeignServiceIsRecognized) {
    auto decoded = BeaconCodec::decode(R"({"service":"airdrop","version":1,"name":"pc","port":5000})");
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::ForeignBeacon);
    EXPECT_EQ(decoded.error().category(), nlk::ErrorCategory::Discovery);
}

TEST(BeaconTest, MalformedPayloads) {
    const char* payloads[] = {
        "",
        "garbage",
        "[1,2,3]",
        R"({"service":"netlink"})",
        R"({"service":"netlink","version":1,"name":"pc","port":"5000"})",
        R"({"service":"netlink","version":1,"name":"","port":5000})",
        R"({"service":"netlink","version":1,"name":"pc","port":70000})",
        R"({"service":"netlink","version":0,"name":"pc","port":5000})",
        R"({"service":"netlink","version":1,"name":"pc","port":5000,"instance":7})",
    };
    for (const char* payload : payloads) {
        auto decoded = BeaconCodec::decode(payload);
        ASSERT_FALSE(decoded.ok()) << payload;
        EXPECT_EQ(decoded.error().code, nlk::ErrorCode::MalformedBeacon) << payload;
    }

    std::string oversized(nlk::config::MAX_BEACON_SIZE + 1, ' ');
    EXPECT_FALSE(BeaconCodec::decode(oversized).ok());
}

TEST(BeaconTest, DeeplyNestedPayloadIsRejected) {
    std::string nested = R"({"service":"netlink","version":1,"name":"pc","port":5000,"x":)";
    nested += std::string(40, '[') + std::string(40, ']') + "}";
    const std::string payloads[] = {
        std::string(nlk::config::MAX_BEACON_SIZE, '['),
        nested,
    };
    for (const auto& payload : payloads) {
        EXPECT_NO_THROW({
            auto decoded = BeaconCodec::decode(payload);
            ASSERT_FALSE(decoded.ok());
            EXPECT_EQ(decoded.error().code, nlk::ErrorCode::MalformedBeacon);
        });
    }
}
