#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "ArdourOsc/OscBridge.h"
#include "ArdourOsc/OscCodec.h"
#include "TestSupport.h"

using namespace ArdourOsc;
using ArdourOscTest::UdpPeer;
using ArdourOscTest::waitFor;

namespace {
    BridgeConfig loopbackConfig(int commandPort, int feedbackPort = 0) {
        BridgeConfig config;
        config.host = "127.0.0.1";
        config.commandPort = commandPort;
        config.feedbackPort = feedbackPort;
        config.listenAddress = "127.0.0.1";
        config.receiveTimeoutMs = 50;
        return config;
    }

    Message receiveMessage(const UdpPeer &peer) {
        std::vector<std::byte> packet = peer.receive(std::chrono::milliseconds(2000));
        if (packet.empty()) return Message();
        return OscCodec::decode(packet);
    }
}  // namespace

// Play command goes out, speed feedback comes back and updates the cache.
TEST(OscBridge, CommandAndFeedbackRoundTrip) {
    UdpPeer ardour;
    ASSERT_TRUE(ardour.valid());

    OscBridge bridge(loopbackConfig(ardour.port()));
    ASSERT_TRUE(bridge.connect().ok());
    EXPECT_EQ(bridge.state(), BridgeState::Connected);
    ASSERT_GT(bridge.feedbackPort(), 0);

    ASSERT_TRUE(bridge.send("/transport_play").ok());
    EXPECT_EQ(receiveMessage(ardour).getPath(), "/transport_play");

    ASSERT_TRUE(ardour.sendTo(bridge.feedbackPort(),
                              OscCodec::encode("/transport_speed", {Value(1.0f)})));
    ASSERT_TRUE(waitFor([&] { return bridge.getTransportState().playing; }));
    EXPECT_DOUBLE_EQ(bridge.getTransportState().speed, 1.0);

    bridge.disconnect();
    EXPECT_EQ(bridge.state(), BridgeState::Disconnected);
}

TEST(OscBridge, StripFeedbackBuildsTrackRecords) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));
    ASSERT_TRUE(bridge.connect().ok());

    int port = bridge.feedbackPort();
    ardour.sendTo(port, OscCodec::encode("/strip/name", {Value(int32_t(1)), Value("Vocals")}));
    ardour.sendTo(port, OscCodec::encode("/strip/gain", {Value(int32_t(1)), Value(-6.0f)}));
    ardour.sendTo(port, OscCodec::encode("/strip/mute", {Value(int32_t(1)), Value(int32_t(1))}));
    ardour.sendTo(port, OscCodec::encode("/strip/name", {Value(int32_t(2)), Value("Bass")}));

    ASSERT_TRUE(waitFor([&] {
        auto track = bridge.getTrackState(1);
        return bridge.getAllTracks().size() == 2 && track && track->muted.has_value();
    }));

    TrackState vocals = *bridge.getTrackState(1);
    EXPECT_EQ(vocals.name, "Vocals");
    EXPECT_EQ(vocals.gainDb, -6.0f);
    EXPECT_EQ(vocals.muted, true);
    EXPECT_FALSE(vocals.soloed.has_value());
    EXPECT_EQ(bridge.getTrackState(2)->name, "Bass");
}

TEST(OscBridge, InjectedFeedbackUpdatesState) {
    OscBridge bridge(loopbackConfig(3819));

    EXPECT_EQ(bridge.injectFeedback("/strip/gain", {Value(int32_t(4)), Value(-12.0f)}),
              HandlerRegistry::Result::Handled);
    EXPECT_EQ(bridge.injectFeedback("/tempo", {Value(98.5f)}), HandlerRegistry::Result::Handled);
    EXPECT_EQ(bridge.injectFeedback("/marker", {Value("intro"), Value(int64_t(0))}),
              HandlerRegistry::Result::Handled);
    EXPECT_EQ(bridge.injectFeedback("/unknown/thing"), HandlerRegistry::Result::Unhandled);

    EXPECT_EQ(bridge.getTrackState(4)->gainDb, -12.0f);
    EXPECT_DOUBLE_EQ(bridge.getTransportState().tempo, 98.5);
    ASSERT_EQ(bridge.getMarkers().size(), 1u);
    EXPECT_EQ(bridge.getMarkers()[0].name, "intro");
    EXPECT_EQ(bridge.listenerStats().unhandled, 1u);
}

TEST(OscBridge, ReconnectStartsWithEmptyCache) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));
    ASSERT_TRUE(bridge.connect().ok());

    bridge.injectFeedback("/strip/name", {Value(int32_t(1)), Value("Vocals")});
    bridge.injectFeedback("/transport_play");
    ASSERT_TRUE(bridge.getTrackState(1).has_value());

    bridge.disconnect();
    EXPECT_FALSE(bridge.getTrackState(1).has_value());
    EXPECT_FALSE(bridge.getTransportState().playing);

    ASSERT_TRUE(bridge.connect().ok());
    EXPECT_TRUE(bridge.getAllTracks().empty());
    EXPECT_EQ(bridge.getTransportState(), TransportState());
}

TEST(OscBridge, BindConflictLeavesBridgeDisconnected) {
    UdpPeer ardour;
    UdpPeer occupier;
    ASSERT_TRUE(occupier.valid());

    OscBridge bridge(loopbackConfig(ardour.port(), occupier.port()));
    Status status = bridge.connect();
    EXPECT_EQ(status.code(), ErrorCode::ConnectionError);
    EXPECT_EQ(bridge.state(), BridgeState::Disconnected);
    EXPECT_EQ(bridge.feedbackPort(), 0);
    EXPECT_EQ(bridge.send("/transport_play").code(), ErrorCode::NotConnected);
}

TEST(OscBridge, AnnounceRegistersFeedbackPortThenRefreshes) {
    UdpPeer ardour;
    BridgeConfig config = loopbackConfig(ardour.port());
    config.announceSurface = true;
    config.feedbackMask = 8191;

    OscBridge bridge(config);
    ASSERT_TRUE(bridge.connect().ok());

    Message port = receiveMessage(ardour);
    EXPECT_EQ(port.getPath(), "/set_surface/port");
    ASSERT_EQ(port.getArgumentCount(), 1u);
    EXPECT_EQ(port.getArgument(0).asInt32(), bridge.feedbackPort());

    Message mask = receiveMessage(ardour);
    EXPECT_EQ(mask.getPath(), "/set_surface/feedback");
    EXPECT_EQ(mask.getArgument(0).asInt32(), 8191);

    EXPECT_EQ(receiveMessage(ardour).getPath(), "/refresh");
}

TEST(OscBridge, AnnounceWithoutMaskSkipsFeedbackCommand) {
    UdpPeer ardour;
    BridgeConfig config = loopbackConfig(ardour.port());
    config.announceSurface = true;

    OscBridge bridge(config);
    ASSERT_TRUE(bridge.connect().ok());

    EXPECT_EQ(receiveMessage(ardour).getPath(), "/set_surface/port");
    EXPECT_EQ(receiveMessage(ardour).getPath(), "/refresh");
}

TEST(OscBridge, SecondConnectIsRejected) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));
    ASSERT_TRUE(bridge.connect().ok());

    int port = bridge.feedbackPort();
    EXPECT_EQ(bridge.connect().code(), ErrorCode::AlreadyConnected);
    EXPECT_TRUE(bridge.isConnected());
    EXPECT_EQ(bridge.feedbackPort(), port);
}

TEST(OscBridge, InvalidConfigurationIsRefused) {
    BridgeConfig config = loopbackConfig(3819);
    config.receiveTimeoutMs = 0;

    OscBridge bridge(config);
    EXPECT_EQ(bridge.connect().code(), ErrorCode::ConfigurationError);
    EXPECT_EQ(bridge.state(), BridgeState::Disconnected);
}

TEST(OscBridge, SendBeforeConnectIsNotConnected) {
    OscBridge bridge(loopbackConfig(3819));
    EXPECT_EQ(bridge.send("/transport_play").code(), ErrorCode::NotConnected);

    // Queries work in every state
    EXPECT_EQ(bridge.getTransportState(), TransportState());
    EXPECT_TRUE(bridge.getAllTracks().empty());
    EXPECT_FALSE(bridge.getSessionState().name.has_value());
}

TEST(OscBridge, DisconnectWhenDisconnectedIsANoOp) {
    OscBridge bridge(loopbackConfig(3819));
    bridge.disconnect();
    bridge.disconnect();
    EXPECT_EQ(bridge.state(), BridgeState::Disconnected);
}

TEST(OscBridge, DisconnectReturnsPromptly) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));
    ASSERT_TRUE(bridge.connect().ok());

    auto begin = std::chrono::steady_clock::now();
    bridge.disconnect();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1000));
}

TEST(OscBridge, ExtensionHandlersSurviveReconnect) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));

    std::atomic<int> seen{0};
    bridge.registerFeedbackHandler("/select/*", [&seen](const std::string &, const std::vector<Value> &) {
        ++seen;
    });

    ASSERT_TRUE(bridge.connect().ok());
    bridge.disconnect();
    ASSERT_TRUE(bridge.connect().ok());

    ardour.sendTo(bridge.feedbackPort(),
                  OscCodec::encode("/select/name", {Value("Vocals")}));
    EXPECT_TRUE(waitFor([&] { return seen.load() == 1; }));
    EXPECT_EQ(bridge.listenerStats().unhandled, 0u);
}

TEST(OscBridge, ThrowingExtensionIsContained) {
    OscBridge bridge(loopbackConfig(3819));
    bridge.registerFeedbackHandler("/tempo", [](const std::string &, const std::vector<Value> &) {
        throw std::runtime_error("extension failed");
    });

    EXPECT_EQ(bridge.injectFeedback("/tempo", {Value(140.0f)}), HandlerRegistry::Result::Rejected);
    // The built-in handler ran first
    EXPECT_DOUBLE_EQ(bridge.getTransportState().tempo, 140.0);
}

TEST(OscBridge, MalformedFeedbackIsCountedNotFatal) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));
    ASSERT_TRUE(bridge.connect().ok());

    const char junk[] = {'n', 'o', 'p', 'e'};
    ardour.sendTo(bridge.feedbackPort(), junk, sizeof(junk));
    ardour.sendTo(bridge.feedbackPort(), OscCodec::encode("/dirty", {Value(int32_t(1))}));

    ASSERT_TRUE(waitFor([&] { return bridge.getSessionState().dirty; }));
    EXPECT_EQ(bridge.listenerStats().protocolErrors, 1u);
    EXPECT_TRUE(bridge.isConnected());
}

TEST(OscBridge, NonStandardExceptionFromExtensionKeepsListenerRunning) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));
    bridge.registerFeedbackHandler("/tempo", [](const std::string &, const std::vector<Value> &) {
        throw 42;
    });
    ASSERT_TRUE(bridge.connect().ok());

    ardour.sendTo(bridge.feedbackPort(), OscCodec::encode("/tempo", {Value(140.0f)}));
    ASSERT_TRUE(waitFor([&] { return bridge.listenerStats().handlerErrors == 1; }));

    ardour.sendTo(bridge.feedbackPort(), OscCodec::encode("/dirty", {Value(int32_t(1))}));
    EXPECT_TRUE(waitFor([&] { return bridge.getSessionState().dirty; }));
    EXPECT_TRUE(bridge.isConnected());
}

// A handler running on the listener while disconnect() joins it may still
// call back into the bridge.
TEST(OscBridge, HandlerMayQueryBridgeWhileDisconnecting) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));

    std::atomic<bool> entered{false};
    std::atomic<bool> queried{false};
    bridge.registerFeedbackHandler("/ping", [&](const std::string &, const std::vector<Value> &) {
        entered = true;
        waitFor([&] { return bridge.state() == BridgeState::Stopping; });
        bridge.listenerStats();
        bridge.feedbackPort();
        queried = true;
    });
    ASSERT_TRUE(bridge.connect().ok());

    ardour.sendTo(bridge.feedbackPort(), OscCodec::encode("/ping", {}));
    ASSERT_TRUE(waitFor([&] { return entered.load(); }));

    bridge.disconnect();
    EXPECT_TRUE(queried.load());
    EXPECT_EQ(bridge.state(), BridgeState::Disconnected);
}

TEST(OscBridge, StatsStartOverOnConnect) {
    UdpPeer ardour;
    OscBridge bridge(loopbackConfig(ardour.port()));
    ASSERT_TRUE(bridge.connect().ok());

    const char junk[] = {'n', 'o', 'p', 'e'};
    ardour.sendTo(bridge.feedbackPort(), junk, sizeof(junk));
    ASSERT_TRUE(waitFor([&] { return bridge.listenerStats().protocolErrors == 1; }));
    bridge.injectFeedback("/not/a/feedback/address");
    EXPECT_EQ(bridge.listenerStats().unhandled, 1u);

    bridge.disconnect();
    EXPECT_EQ(bridge.listenerStats().protocolErrors, 0u);

    ASSERT_TRUE(bridge.connect().ok());
    ListenerStats stats = bridge.listenerStats();
    EXPECT_EQ(stats.received, 0u);
    EXPECT_EQ(stats.protocolErrors, 0u);
    EXPECT_EQ(stats.unhandled, 0u);
}
