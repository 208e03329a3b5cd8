#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "ArdourOsc/Exceptions.h"
#include "ArdourOsc/OscCodec.h"
#include "TestSupport.h"

using namespace ArdourOsc;
using ArdourOscTest::PacketBuilder;

TEST(OscCodec, EncodesFramingExactly) {
    std::vector<std::byte> packet = OscCodec::encode("/tempo", {Value(120.0f)});

    std::vector<std::byte> expected = PacketBuilder().str("/tempo").str(",f").float32(120.0f).bytes();
    EXPECT_EQ(packet, expected);
    EXPECT_EQ(packet.size() % 4, 0u);
}

TEST(OscCodec, EncodesStripGainInBigEndian) {
    std::vector<std::byte> packet =
        OscCodec::encode("/strip/gain", {Value(int32_t(3)), Value(-6.0f)});

    std::vector<std::byte> expected =
        PacketBuilder().str("/strip/gain").str(",if").int32(3).float32(-6.0f).bytes();
    EXPECT_EQ(packet, expected);
}

TEST(OscCodec, EncodesMessageWithoutArguments) {
    std::vector<std::byte> packet = OscCodec::encode("/transport_play", {});
    EXPECT_EQ(packet, PacketBuilder().str("/transport_play").str(",").bytes());
}

TEST(OscCodec, RoundTripsEveryArgumentType) {
    const unsigned char raw[] = {0xde, 0xad, 0xbe, 0xef, 0x01};
    std::vector<Value> args = {Value(int32_t(-42)),
                               Value(int64_t(48000LL * 3600 * 5)),
                               Value(0.25f),
                               Value(3.5),
                               Value("Vocals"),
                               Value(Blob(raw, sizeof(raw))),
                               Value(true),
                               Value(false),
                               Value::nil()};

    Message decoded = OscCodec::decode(OscCodec::encode("/strip/plugin/parameter", args));

    EXPECT_EQ(decoded.getPath(), "/strip/plugin/parameter");
    EXPECT_EQ(decoded.getTypeTags(), "ihfdsbTFN");
    EXPECT_EQ(decoded.getArguments(), args);
}

TEST(OscCodec, RoundTripsEmptyStringAndEmptyBlob) {
    std::vector<Value> args = {Value(""), Value(Blob())};
    Message decoded = OscCodec::decode(OscCodec::encode("/session_name", args));
    EXPECT_EQ(decoded.getArguments(), args);
}

TEST(OscCodec, DecodesHandBuiltPacket) {
    auto packet = PacketBuilder().str("/strip/name").str(",is").int32(1).str("Vocals").bytes();

    Message message = OscCodec::decode(packet);
    EXPECT_EQ(message.getPath(), "/strip/name");
    ASSERT_EQ(message.getArgumentCount(), 2u);
    EXPECT_EQ(message.getArgument(0).asInt32(), 1);
    EXPECT_EQ(message.getArgument(1).asString(), "Vocals");
}

TEST(OscCodec, DecodesInfinitumAsNil) {
    auto packet = PacketBuilder().str("/x").str(",I").bytes();
    Message message = OscCodec::decode(packet);
    ASSERT_EQ(message.getArgumentCount(), 1u);
    EXPECT_TRUE(message.getArgument(0).isNil());
}

TEST(OscCodec, RejectsInvalidAddressesOnEncode) {
    EXPECT_THROW(OscCodec::encode("", {}), ValidationError);
    EXPECT_THROW(OscCodec::encode("transport_play", {}), ValidationError);
    EXPECT_THROW(OscCodec::encode("/with space", {}), ValidationError);
    EXPECT_THROW(OscCodec::encode("/bad#char", {}), ValidationError);
}

TEST(OscCodec, RejectsOversizedPacketOnEncode) {
    std::string huge(OscCodec::MAX_PACKET_SIZE, 'x');
    EXPECT_THROW(OscCodec::encode("/session_name", {Value(huge)}), ValidationError);
}

TEST(OscCodec, RejectsEmptyAndShortPackets) {
    EXPECT_THROW(OscCodec::decode(nullptr, 0), ProtocolError);

    const char three[] = {'/', 'a', 0};
    EXPECT_THROW(OscCodec::decode(three, 3), ProtocolError);
}

TEST(OscCodec, RejectsUnalignedLength) {
    auto packet = PacketBuilder().str("/tempo").str(",f").float32(120.0f).bytes();
    packet.push_back(std::byte{0});
    EXPECT_THROW(OscCodec::decode(packet), ProtocolError);
}

TEST(OscCodec, RejectsMissingLeadingSlash) {
    auto packet = PacketBuilder().str("tempo").str(",f").float32(1.0f).bytes();
    EXPECT_THROW(OscCodec::decode(packet), ProtocolError);
}

TEST(OscCodec, RejectsUnterminatedAddress) {
    const char packet[] = {'/', 'a', 'b', 'c'};
    EXPECT_THROW(OscCodec::decode(packet, sizeof(packet)), ProtocolError);
}

TEST(OscCodec, RejectsTruncatedArguments) {
    auto packet = PacketBuilder().str("/strip/gain").str(",if").int32(3).bytes();
    try {
        OscCodec::decode(packet);
        FAIL() << "truncated packet decoded";
    } catch (const ProtocolError &e) {
        EXPECT_EQ(e.code(), ErrorCode::ProtocolError);
        EXPECT_NE(std::string(e.what()).find("/strip/gain"), std::string::npos);
    }
}

TEST(OscCodec, RejectsNonZeroPadding) {
    auto packet = PacketBuilder().raw({'/', 'a', 0, 'X'}).str(",i").int32(1).bytes();
    EXPECT_THROW(OscCodec::decode(packet), ProtocolError);
}

TEST(OscCodec, RejectsUnknownTypeTag) {
    auto packet = PacketBuilder().str("/x").str(",z").int32(1).bytes();
    EXPECT_THROW(OscCodec::decode(packet), ProtocolError);
}

TEST(OscCodec, RejectsBundles) {
    auto bundle = PacketBuilder().str("#bundle").int32(0).int32(1).bytes();
    EXPECT_TRUE(OscCodec::isBundle(bundle.data(), bundle.size()));
    EXPECT_THROW(OscCodec::decode(bundle), ProtocolError);

    auto message = OscCodec::encode("/tempo", {Value(120.0f)});
    EXPECT_FALSE(OscCodec::isBundle(message.data(), message.size()));
}

TEST(OscCodec, TryDecodeReportsReason) {
    std::string error;
    const char junk[] = {'x', 'y', 'z', 'w'};
    EXPECT_FALSE(OscCodec::tryDecode(junk, sizeof(junk), &error).has_value());
    EXPECT_FALSE(error.empty());

    auto packet = OscCodec::encode("/tempo", {Value(96.0f)});
    auto message = OscCodec::tryDecode(packet.data(), packet.size(), &error);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->getArgument(0).asFloat(), 96.0f);
}

TEST(OscCodec, RandomGarbageNeverEscapesAsAnythingButProtocolError) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byteDist(0, 255);
    std::uniform_int_distribution<int> lengthDist(0, 96);

    auto valid = OscCodec::encode("/strip/name", {Value(int32_t(1)), Value("Vocals")});

    for (int round = 0; round < 2000; ++round) {
        std::vector<std::byte> packet;
        if (round % 2 == 0) {
            int length = lengthDist(rng);
            for (int i = 0; i < length; ++i) packet.push_back(static_cast<std::byte>(byteDist(rng)));
        } else {
            // Corrupt or truncate a valid packet, keeping the leading '/'
            packet = valid;
            packet.resize(1 + static_cast<size_t>(lengthDist(rng)) % valid.size());
            size_t flips = 1 + static_cast<size_t>(byteDist(rng)) % 4;
            for (size_t i = 0; i < flips && packet.size() > 1; ++i) {
                size_t at = 1 + static_cast<size_t>(byteDist(rng)) % (packet.size() - 1);
                packet[at] = static_cast<std::byte>(byteDist(rng));
            }
        }

        try {
            OscCodec::decode(packet.data(), packet.size());
        } catch (const ProtocolError &) {
        }
        EXPECT_NO_THROW(OscCodec::tryDecode(packet.data(), packet.size()));
    }

    // The codec still works after the garbage.
    EXPECT_EQ(OscCodec::decode(valid).getArgument(1).asString(), "Vocals");
}

TEST(Message, AddressValidation) {
    EXPECT_TRUE(Message::isValidAddress("/strip/gain"));
    EXPECT_TRUE(Message::isValidAddress("/"));
    EXPECT_FALSE(Message::isValidAddress(""));
    EXPECT_FALSE(Message::isValidAddress("strip"));
    EXPECT_FALSE(Message::isValidAddress("/a\tb"));
    EXPECT_FALSE(Message::isValidAddress("/a#b"));
}

TEST(Value, NumericConversions) {
    EXPECT_EQ(Value(int32_t(7)).toInteger(), 7);
    EXPECT_EQ(Value(2.0f).toInteger(), 2);
    EXPECT_FALSE(Value(2.5f).toInteger().has_value());
    EXPECT_EQ(Value(true).toDouble(), 1.0);
    EXPECT_FALSE(Value("1").toDouble().has_value());
    EXPECT_THROW(Value("x").asInt32(), ValidationError);
    EXPECT_TRUE(Value(true).asBool());
    EXPECT_THROW(Value(int32_t(1)).asBool(), ValidationError);
}
