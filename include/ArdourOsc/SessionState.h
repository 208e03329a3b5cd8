#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ArdourOsc
{
    enum class TrackKind
    {
        Audio,
        Midi,
        Bus
    };

    enum class MonitorMode
    {
        Input,
        Disk,
        Auto
    };

    /**
     * @brief Automation state of one strip parameter, numbered as on the wire
     */
    enum class AutomationMode
    {
        Manual = 0,
        Play = 1,
        Write = 2,
        Touch = 3,
        Latch = 4
    };

    const char *trackKindName(TrackKind kind);
    const char *monitorModeName(MonitorMode mode);
    const char *automationModeName(AutomationMode mode);

    /**
     * @brief Map a wire value to an automation mode
     * @return nullopt for values outside 0..4
     */
    std::optional<AutomationMode> automationModeFromInt(int64_t value);

    /// Peak and RMS levels in dB for a stereo meter
    struct MeterLevels
    {
        float peakLeft = 0.0f;
        float peakRight = 0.0f;
        float rmsLeft = 0.0f;
        float rmsRight = 0.0f;

        bool operator==(const MeterLevels &other) const
        {
            return peakLeft == other.peakLeft && peakRight == other.peakRight &&
                   rmsLeft == other.rmsLeft && rmsRight == other.rmsRight;
        }
    };

    struct SendState
    {
        std::optional<float> gainDb;
        std::optional<bool> enabled;

        bool operator==(const SendState &other) const
        {
            return gainDb == other.gainDb && enabled == other.enabled;
        }
    };

    struct PluginState
    {
        std::optional<bool> active;
        std::map<int, float> parameters;

        bool operator==(const PluginState &other) const
        {
            return active == other.active && parameters == other.parameters;
        }
    };

    struct TransportState
    {
        bool playing = false;
        bool recording = false;
        int64_t frame = 0;
        double speed = 0.0;
        double tempo = 120.0;
        std::pair<int, int> timeSignature{4, 4};
        bool loopEnabled = false;
        std::optional<std::pair<int64_t, int64_t>> loopRange;

        bool operator==(const TransportState &other) const
        {
            return playing == other.playing && recording == other.recording &&
                   frame == other.frame && speed == other.speed && tempo == other.tempo &&
                   timeSignature == other.timeSignature && loopEnabled == other.loopEnabled &&
                   loopRange == other.loopRange;
        }
        bool operator!=(const TransportState &other) const { return !(*this == other); }
    };

    /**
     * @brief Cached state of one mixer strip
     *
     * Optional fields stay empty until feedback reports them, so "unknown"
     * is distinct from a known zero or false.
     */
    struct TrackState
    {
        int id = 0;
        TrackKind kind = TrackKind::Audio;
        std::optional<std::string> name;
        std::optional<bool> muted;
        std::optional<bool> soloed;
        std::optional<bool> recEnabled;
        std::optional<bool> selected;
        std::optional<float> gainDb;
        std::optional<float> pan;
        std::optional<MonitorMode> monitorMode;
        std::optional<MeterLevels> meter;
        std::map<std::string, AutomationMode> automation;
        std::map<int, SendState> sends;
        std::map<int, PluginState> plugins;

        bool operator==(const TrackState &other) const
        {
            return id == other.id && kind == other.kind && name == other.name &&
                   muted == other.muted && soloed == other.soloed &&
                   recEnabled == other.recEnabled && selected == other.selected &&
                   gainDb == other.gainDb && pan == other.pan &&
                   monitorMode == other.monitorMode && meter == other.meter &&
                   automation == other.automation && sends == other.sends &&
                   plugins == other.plugins;
        }
    };

    struct Marker
    {
        std::string name;
        int64_t position = 0;

        bool operator==(const Marker &other) const
        {
            return name == other.name && position == other.position;
        }
    };

    struct SessionState
    {
        std::optional<std::string> name;
        std::optional<std::string> path;
        std::optional<int> sampleRate;
        std::optional<int> trackCount;
        bool dirty = false;
        std::optional<MeterLevels> masterMeter;
        std::map<int, TrackState> tracks;
        std::vector<Marker> markers;
        TransportState transport;
    };

    /**
     * @brief Partial transport update; only engaged fields are applied
     */
    struct TransportUpdate
    {
        std::optional<bool> playing;
        std::optional<bool> recording;
        std::optional<int64_t> frame;
        std::optional<double> speed;
        std::optional<double> tempo;
        std::optional<std::pair<int, int>> timeSignature;
        std::optional<bool> loopEnabled;
        std::optional<std::pair<int64_t, int64_t>> loopRange;
    };

    /**
     * @brief Partial strip update; only engaged fields are applied
     */
    struct TrackUpdate
    {
        std::optional<TrackKind> kind;
        std::optional<std::string> name;
        std::optional<bool> muted;
        std::optional<bool> soloed;
        std::optional<bool> recEnabled;
        std::optional<bool> selected;
        std::optional<float> gainDb;
        std::optional<float> pan;
        std::optional<MonitorMode> monitorMode;
        std::optional<MeterLevels> meter;
    };

    struct SessionUpdate
    {
        std::optional<std::string> name;
        std::optional<std::string> path;
        std::optional<int> sampleRate;
        std::optional<int> trackCount;
        std::optional<bool> dirty;
        std::optional<MeterLevels> masterMeter;
    };

} // namespace ArdourOsc
