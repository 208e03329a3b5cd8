#include <gtest/gtest.h>

#include "ArdourOsc/StateSerializer.h"
#include "ArdourOsc/StateStore.h"

using namespace ArdourOsc;

TEST(StateSerializer, UnknownTrackFieldsAreNull) {
    TrackState track;
    track.id = 7;
    track.gainDb = -3.5f;

    nlohmann::json json = StateSerializer::toJson(track);
    EXPECT_EQ(json["id"], 7);
    EXPECT_EQ(json["kind"], "audio");
    EXPECT_EQ(json["gain_db"], -3.5);
    EXPECT_TRUE(json["name"].is_null());
    EXPECT_TRUE(json["muted"].is_null());
    EXPECT_TRUE(json["pan"].is_null());
    EXPECT_TRUE(json["monitor_mode"].is_null());
    EXPECT_TRUE(json["meter"].is_null());
    EXPECT_TRUE(json["sends"].empty());
}

TEST(StateSerializer, TrackDetails) {
    StateStore store;
    TrackUpdate update;
    update.name = "Vocals";
    update.muted = true;
    update.kind = TrackKind::Bus;
    store.updateTrack(2, update);
    store.setTrackMonitor(2, MonitorMode::Disk, true);
    store.setAutomationMode(2, "gain", AutomationMode::Write);
    store.updateSend(2, 0, -10.0f, true);
    store.setPluginParameter(2, 1, 3, 0.5f);

    nlohmann::json json = StateSerializer::toJson(*store.getTrack(2));
    EXPECT_EQ(json["name"], "Vocals");
    EXPECT_EQ(json["muted"], true);
    EXPECT_EQ(json["kind"], "bus");
    EXPECT_EQ(json["monitor_mode"], "disk");
    EXPECT_EQ(json["automation"]["gain"], "write");
    EXPECT_EQ(json["sends"]["0"]["gain_db"], -10.0);
    EXPECT_EQ(json["sends"]["0"]["enabled"], true);
    EXPECT_TRUE(json["plugins"]["1"]["active"].is_null());
    EXPECT_EQ(json["plugins"]["1"]["parameters"]["3"], 0.5);
}

TEST(StateSerializer, SessionSnapshot) {
    StateStore store;
    SessionUpdate session;
    session.name = "Song";
    session.sampleRate = 48000;
    store.updateSession(session);

    TransportUpdate transport;
    transport.playing = true;
    transport.tempo = 128.0;
    transport.loopRange = std::make_pair(int64_t(0), int64_t(96000));
    store.updateTransport(transport);

    store.upsertMarker("intro", 0);
    store.upsertMarker("verse", 48000);
    store.updateTrack(1, TrackUpdate());

    nlohmann::json json = StateSerializer::toJson(store.getSession());
    EXPECT_EQ(json["name"], "Song");
    EXPECT_EQ(json["sample_rate"], 48000);
    EXPECT_TRUE(json["path"].is_null());
    EXPECT_TRUE(json["master_meter"].is_null());
    EXPECT_EQ(json["dirty"], false);

    EXPECT_EQ(json["transport"]["playing"], true);
    EXPECT_EQ(json["transport"]["tempo"], 128.0);
    EXPECT_EQ(json["transport"]["time_signature"], nlohmann::json({4, 4}));
    EXPECT_EQ(json["transport"]["loop_range"], nlohmann::json({0, 96000}));

    ASSERT_EQ(json["markers"].size(), 2u);
    EXPECT_EQ(json["markers"][1]["name"], "verse");
    EXPECT_EQ(json["markers"][1]["position"], 48000);

    ASSERT_TRUE(json["tracks"].contains("1"));
    EXPECT_EQ(json["tracks"]["1"]["id"], 1);
}

TEST(StateSerializer, MeterLevels) {
    MeterLevels meter;
    meter.peakLeft = 0.5f;
    meter.peakRight = 0.25f;

    nlohmann::json json = StateSerializer::toJson(meter);
    EXPECT_EQ(json["peak_left"], 0.5);
    EXPECT_EQ(json["peak_right"], 0.25);
    EXPECT_EQ(json["rms_left"], 0.0);
}
