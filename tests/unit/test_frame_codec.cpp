#include <gtest/gtest.h>
#include "Constants.h"
#include "FrameCodec.h"

using namespace NetLink;

namespace {

HandshakeRequest makeRequest(ProtocolVariant variant) {
    HandshakeRequest request;
    request.variant = variant;

    ManifestEntry first;
    first.path = "a.txt";
    first.size = 10;
    first.offset = 10;
    first.digest.fill(0xAB);
    request.entries.push_back(first);

    if (variant != ProtocolVariant::LegacySingle) {
        ManifestEntry second;
        second.path = "sub/b.txt";
        second.size = 300;
        second.offset = 300;
        request.entries.push_back(second);
    }
    return request;
}

std::vector<uint8_t> withMagic(uint32_t magic) {
    ByteWriter writer;
    writer.putU32(magic);
    return writer.take();
}

} // namespace

TEST(FrameCodecTest, ByteWriterIsBigEndian) {
    ByteWriter writer;
    writer.putU32(0xFFFF0003);
    writer.putU64(0x0102030405060708ULL);
    writer.putString("ab");

    std::vector<uint8_t> expected = {
        0xFF, 0xFF, 0x00, 0x03,
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
        0x00, 0x00, 0x00, 0x02, 'a', 'b'
    };
    EXPECT_EQ(writer.bytes(), expected);
}

TEST(FrameCodecTest, LegacyFrameHasNoCount) {
    auto request = makeRequest(ProtocolVariant::LegacySingle);
    auto bytes = FrameCodec::encodeRequest(request);

    // magic + path length + "a.txt" + size
    EXPECT_EQ(bytes.size(), 4u + 4u + 5u + 8u);

    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(bytes));
    ASSERT_TRUE(decoded.ok()) << decoded.error().message;
    EXPECT_EQ(decoded->variant, ProtocolVariant::LegacySingle);
    ASSERT_EQ(decoded->entries.size(), 1u);
    EXPECT_EQ(decoded->entries[0].path, "a.txt");
    EXPECT_EQ(decoded->entries[0].size, 10u);
}

TEST(FrameCodecTest, ResumableFrameCarriesOffsetsAndDigests) {
    auto request = makeRequest(ProtocolVariant::Resumable);
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(FrameCodec::encodeRequest(request)));
    ASSERT_TRUE(decoded.ok()) << decoded.error().message;

    ASSERT_EQ(decoded->entries.size(), 2u);
    EXPECT_EQ(decoded->entries[1].path, "sub/b.txt");
    EXPECT_EQ(decoded->entries[1].offset, 300u);
    EXPECT_EQ(decoded->entries[0].digest, request.entries[0].digest);
    EXPECT_EQ(decoded->totalBytes(), 310u);
}

TEST(FrameCodecTest, MultiFrameDropsResumeFields) {
    auto request = makeRequest(ProtocolVariant::Multi);
    auto multi = FrameCodec::encodeRequest(request);
    request.variant = ProtocolVariant::Resumable;
    auto resumable = FrameCodec::encodeRequest(request);

    EXPECT_EQ(resumable.size() - multi.size(), 2 * (8 + nlk::config::DIGEST_SIZE));
}

TEST(FrameCodecTest, UnknownMagicIsFatal) {
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(withMagic(0xDEADBEEF)));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::BadMagic);
    EXPECT_FALSE(decoded.error().retryable());
}

TEST(FrameCodecTest, CountLimitsAreEnforced) {
    ByteWriter zero;
    zero.putU32(nlk::config::MAGIC_MULTI);
    zero.putU32(0);
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(zero.take()));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::MalformedFrame);

    ByteWriter huge;
    huge.putU32(nlk::config::MAGIC_MULTI);
    huge.putU32(nlk::config::MAX_FILE_COUNT + 1);
    decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(huge.take()));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::MalformedFrame);
}

TEST(FrameCodecTest, OversizedPathIsRejected) {
    ByteWriter writer;
    writer.putU32(nlk::config::MAGIC_LEGACY_SINGLE);
    writer.putU32(nlk::config::MAX_PATH_LENGTH + 1);
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(writer.take()));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::MalformedFrame);
}

TEST(FrameCodecTest, TruncatedFrameLooksLikeClosedConnection) {
    auto bytes = FrameCodec::encodeRequest(makeRequest(ProtocolVariant::Multi));
    bytes.resize(bytes.size() - 3);
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(bytes));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::ConnectionClosed);
}

TEST(FrameCodecTest, RequestedOffsetBeyondSizeIsRejected) {
    auto request = makeRequest(ProtocolVariant::Resumable);
    request.entries[0].offset = request.entries[0].size + 1;
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(FrameCodec::encodeRequest(request)));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::InvalidOffset);
}

TEST(FrameCodecTest, DuplicatePathsAreRejected) {
    auto request = makeRequest(ProtocolVariant::Multi);
    request.entries[1].path = request.entries[0].path;
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(FrameCodec::encodeRequest(request)));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::MalformedFrame);
}

TEST(FrameCodecTest, UnsafePaths) {
    EXPECT_TRUE(FrameCodec::validateRelativePath("a.txt").ok());
    EXPECT_TRUE(FrameCodec::validateRelativePath("dir/sub/file.bin").ok());
    EXPECT_TRUE(FrameCodec::validateRelativePath("..hidden/x").ok());

    for (const std::string path : {"", "/etc/passwd", "../x", "a/../../b", "a//b", "a/./b",
                                   "dir/", "C:/win", "a\\b"}) {
        auto result = FrameCodec::validateRelativePath(path);
        ASSERT_FALSE(result.ok()) << path;
        EXPECT_EQ(result.error().code, nlk::ErrorCode::UnsafePath) << path;
    }

    auto request = makeRequest(ProtocolVariant::Multi);
    request.entries[1].path = "../escape.txt";
    auto decoded = FrameCodec::decodeRequest(FrameCodec::bufferReader(FrameCodec::encodeRequest(request)));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::UnsafePath);
}

TEST(FrameCodecTest, ReplyValidation) {
    auto request = makeRequest(ProtocolVariant::Resumable);
    request.entries[0].offset = 0;

    HandshakeReply reply;
    reply.offsets = {0, 120};
    auto decoded = FrameCodec::decodeReply(FrameCodec::bufferReader(FrameCodec::encodeReply(reply)));
    ASSERT_TRUE(decoded.ok()) << decoded.error().message;
    EXPECT_EQ(decoded->offsets, reply.offsets);
    EXPECT_TRUE(FrameCodec::validateReply(request, *decoded).ok());

    // Acknowledged beyond requested
    reply.offsets = {5, 120};
    auto invalid = FrameCodec::validateReply(request, reply);
    ASSERT_FALSE(invalid.ok());
    EXPECT_EQ(invalid.error().code, nlk::ErrorCode::InvalidOffset);

    reply.offsets = {0};
    invalid = FrameCodec::validateReply(request, reply);
    ASSERT_FALSE(invalid.ok());
    EXPECT_EQ(invalid.error().code, nlk::ErrorCode::MalformedFrame);
}

TEST(FrameCodecTest, RejectedReplyCarriesReason) {
    HandshakeReply reply;
    reply.accepted = false;
    reply.reason = "disk full";
    auto decoded = FrameCodec::decodeReply(FrameCodec::bufferReader(FrameCodec::encodeReply(reply)));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, nlk::ErrorCode::TransferRejected);
    EXPECT_NE(decoded.error().message.find("disk full"), std::string::npos);
}

TEST(FrameCodecTest, StatusBytes) {
    auto ok = FrameCodec::encodeStatus(true);
    auto er = FrameCodec::encodeStatus(false);
    EXPECT_TRUE(FrameCodec::decodeStatus(FrameCodec::bufferReader({ok.begin(), ok.end()})).ok());

    auto rejected = FrameCodec::decodeStatus(FrameCodec::bufferReader({er.begin(), er.end()}));
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.error().code, nlk::ErrorCode::TransferRejected);

    auto garbage = FrameCodec::decodeStatus(FrameCodec::bufferReader({'x', 'y'}));
    ASSERT_FALSE(garbage.ok());
    EXPECT_EQ(garbage.error().code, nlk::ErrorCode::MalformedFrame);
}
