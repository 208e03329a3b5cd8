#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ArdourOsc/SessionState.h"

namespace ArdourOsc
{
    /**
     * @brief Thread safe cache of the remote session's state
     *
     * Every call takes the store's single lock for its whole duration, so a
     * multi-field update is never observed half applied. Readers receive
     * copies; no reference into the cache ever leaves this class.
     */
    class StateStore
    {
    public:
        StateStore() = default;

        StateStore(const StateStore &) = delete;
        StateStore &operator=(const StateStore &) = delete;

        void updateTransport(const TransportUpdate &update);

        /**
         * @brief Apply a partial update to a strip, creating it if absent
         *
         * @param trackId Strip identifier
         * @param update Fields to change
         */
        void updateTrack(int trackId, const TrackUpdate &update);

        void updateSession(const SessionUpdate &update);

        /**
         * @brief Create a strip with the given kind if it does not exist yet
         *
         * An existing strip keeps its kind.
         *
         * @return true if the strip was created
         */
        bool ensureTrack(int trackId, TrackKind kind);

        /**
         * @brief Apply a monitor_input / monitor_disk report
         *
         * Enabling a source selects it. Disabling the active source falls
         * back to Auto; disabling the other source changes nothing.
         */
        void setTrackMonitor(int trackId, MonitorMode source, bool enabled);

        void setAutomationMode(int trackId, const std::string &parameter, AutomationMode mode);

        void updateSend(int trackId, int sendId, std::optional<float> gainDb,
                        std::optional<bool> enabled);

        void setPluginActive(int trackId, int pluginId, bool active);

        void setPluginParameter(int trackId, int pluginId, int parameterId, float value);

        /**
         * @brief Insert a marker or move an existing one with the same name
         */
        void upsertMarker(const std::string &name, int64_t position);

        /**
         * @return true if a marker with that name existed
         */
        bool removeMarker(const std::string &name);

        TransportState getTransport() const;

        std::optional<TrackState> getTrack(int trackId) const;

        std::map<int, TrackState> getAllTracks() const;

        std::vector<Marker> getMarkers() const;

        /**
         * @brief Snapshot of the whole session, transport and tracks included
         */
        SessionState getSession() const;

        /**
         * @brief Reset every record to its default
         */
        void clear();

    private:
        // Caller holds m_mutex
        TrackState &trackLocked(int trackId);

        mutable std::mutex m_mutex;
        SessionState m_session;
    };

} // namespace ArdourOsc
