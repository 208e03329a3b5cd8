#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ArdourOsc/BridgeConfig.h"
#include "ArdourOsc/CommandSender.h"
#include "ArdourOsc/FeedbackListener.h"
#include "ArdourOsc/HandlerRegistry.h"
#include "ArdourOsc/StateStore.h"
#include "ArdourOsc/Status.h"

namespace ArdourOsc
{
    enum class BridgeState
    {
        Disconnected,
        Connecting,
        Connected,
        Stopping
    };

    const char *bridgeStateName(BridgeState state);

    /**
     * @brief OSC bridge to one Ardour session
     *
     * Owns the state cache, the command sender and the feedback listener.
     * Commands go out through send(); feedback arriving on the listener
     * updates the cache, which callers read with the get* queries. Queries
     * never touch the network and work in every state; while disconnected
     * they return the cleared cache.
     */
    class OscBridge
    {
    public:
        explicit OscBridge(BridgeConfig config = BridgeConfig());

        /**
         * @brief Disconnects if still connected
         */
        ~OscBridge();

        OscBridge(const OscBridge &) = delete;
        OscBridge &operator=(const OscBridge &) = delete;

        /**
         * @brief Open the command socket and start the feedback listener
         *
         * The cache is cleared first. When announceSurface is set, the bridge
         * then registers its feedback port with Ardour and asks for a refresh.
         *
         * @return ConnectionError if a socket cannot be opened or bound (the
         *         bridge stays Disconnected), AlreadyConnected if not
         *         Disconnected, ConfigurationError for an invalid config
         */
        Status connect();

        /**
         * @brief Stop the listener, close the sockets and clear the cache
         *
         * Returns within about one receive timeout. Does nothing unless
         * Connected. The listener is joined without the lifecycle lock held, so
         * feedback handlers may call feedbackPort() or listenerStats().
         */
        void disconnect();

        /**
         * @brief Send one command
         *
         * @return NotConnected unless Connected, otherwise the sender's result
         */
        Status send(const std::string &address, const std::vector<Value> &args = {});

        TransportState getTransportState() const;
        std::optional<TrackState> getTrackState(int trackId) const;
        std::map<int, TrackState> getAllTracks() const;
        SessionState getSessionState() const;
        std::vector<Marker> getMarkers() const;

        /**
         * @brief Add a feedback handler that runs after the built-in one
         *
         * @param address Exact address, or a prefix ending in '*'
         * @param handler Called on the listener thread
         */
        void registerFeedbackHandler(const std::string &address, FeedbackHandler handler);

        /**
         * @brief Dispatch a message as if it had arrived from Ardour
         *
         * @return The registry's verdict; Rejected if a handler threw
         */
        HandlerRegistry::Result injectFeedback(const std::string &address, const std::vector<Value> &args = {});

        BridgeState state() const { return m_state.load(); }
        bool isConnected() const { return state() == BridgeState::Connected; }

        /**
         * @brief Port the listener is bound to, 0 when disconnected
         */
        int feedbackPort() const;

        const BridgeConfig &config() const { return m_config; }

        /**
         * @brief Counters since the last connect()
         *
         * The listener counters read zero while disconnected.
         *
         * unhandled also counts messages passed to injectFeedback().
         */
        ListenerStats listenerStats() const;

    private:
        Status announceSurface(CommandSender &sender, int port);

        const BridgeConfig m_config;
        StateStore m_store;
        HandlerRegistry m_registry;

        // Serializes connect() and disconnect()
        mutable std::mutex m_lifecycleMutex;
        std::atomic<BridgeState> m_state;
        std::unique_ptr<FeedbackListener> m_listener;

        mutable std::mutex m_senderMutex;
        std::shared_ptr<CommandSender> m_sender;
    };

} // namespace ArdourOsc
