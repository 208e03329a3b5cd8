#include "ArdourOsc/OscBridge.h"

#include <chrono>

#include "ArdourOsc/Logging.h"

namespace ArdourOsc
{
	const char *bridgeStateName(BridgeState state)
	{
		switch (state)
		{
		case BridgeState::Disconnected:
			return "disconnected";
		case BridgeState::Connecting:
			return "connecting";
		case BridgeState::Connected:
			return "connected";
		case BridgeState::Stopping:
			return "stopping";
		}
		return "unknown";
	}

	OscBridge::OscBridge(BridgeConfig config)
		: m_config(std::move(config)), m_registry(m_store), m_state(BridgeState::Disconnected)
	{
	}

	OscBridge::~OscBridge()
	{
		disconnect();
	}

	Status OscBridge::connect()
	{
		std::lock_guard<std::mutex> lock(m_lifecycleMutex);
		if (m_state != BridgeState::Disconnected)
			return Status::failure(ErrorCode::AlreadyConnected, std::string("bridge is ") + bridgeStateName(m_state));

		Status valid = m_config.validate();
		if (!valid)
		{
			log_error("Refusing to connect: %s", valid.message().c_str());
			return valid;
		}

		m_state = BridgeState::Connecting;
		m_store.clear();
		m_registry.resetStats();

		auto sender = std::make_shared<CommandSender>(m_config.host, m_config.commandPort);
		Status opened = sender->open();
		if (!opened)
		{
			m_state = BridgeState::Disconnected;
			return opened;
		}

		auto listener = std::make_unique<FeedbackListener>(m_config.listenAddress, m_config.feedbackPort,
														   std::chrono::milliseconds(m_config.receiveTimeoutMs),
														   static_cast<size_t>(m_config.maxDatagramSize));
		Status started = listener->start([this](const Message &message)
										 { m_registry.dispatch(message); });
		if (!started)
		{
			sender->close();
			m_state = BridgeState::Disconnected;
			log_error("Connect failed: %s", started.toString().c_str());
			return started;
		}

		int port = listener->port();
		m_listener = std::move(listener);
		{
			std::lock_guard<std::mutex> senderLock(m_senderMutex);
			m_sender = sender;
		}
		m_state = BridgeState::Connected;
		log_info("Connected to Ardour at %s:%d, feedback on port %d", m_config.host.c_str(), m_config.commandPort, port);

		if (m_config.announceSurface)
		{
			Status announced = announceSurface(*sender, port);
			if (!announced)
				log_warning("Surface registration failed: %s", announced.toString().c_str());
		}

		return Status::success();
	}

	void OscBridge::disconnect()
	{
		std::unique_ptr<FeedbackListener> listener;
		std::shared_ptr<CommandSender> sender;
		{
			std::lock_guard<std::mutex> lock(m_lifecycleMutex);
			if (m_state != BridgeState::Connected)
				return;

			m_state = BridgeState::Stopping;
			listener = std::move(m_listener);
			std::lock_guard<std::mutex> senderLock(m_senderMutex);
			sender.swap(m_sender);
		}

		// The worker may be inside a handler that calls back into the bridge,
		// so it is joined without m_lifecycleMutex held.
		if (listener)
			listener->stop();
		if (sender)
			sender->close();

		std::lock_guard<std::mutex> lock(m_lifecycleMutex);
		m_store.clear();
		log_info("State cache cleared");

		m_state = BridgeState::Disconnected;
		log_info("Disconnected from Ardour at %s:%d", m_config.host.c_str(), m_config.commandPort);
	}

	Status OscBridge::send(const std::string &address, const std::vector<Value> &args)
	{
		std::shared_ptr<CommandSender> sender;
		{
			std::lock_guard<std::mutex> senderLock(m_senderMutex);
			sender = m_sender;
		}

		if (!sender || m_state != BridgeState::Connected)
			return Status::failure(ErrorCode::NotConnected, "bridge is not connected");

		return sender->send(address, args);
	}

	TransportState OscBridge::getTransportState() const
	{
		return m_store.getTransport();
	}

	std::optional<TrackState> OscBridge::getTrackState(int trackId) const
	{
		return m_store.getTrack(trackId);
	}

	std::map<int, TrackState> OscBridge::getAllTracks() const
	{
		return m_store.getAllTracks();
	}

	SessionState OscBridge::getSessionState() const
	{
		return m_store.getSession();
	}

	std::vector<Marker> OscBridge::getMarkers() const
	{
		return m_store.getMarkers();
	}

	void OscBridge::registerFeedbackHandler(const std::string &address, FeedbackHandler handler)
	{
		m_registry.registerHandler(address, std::move(handler));
	}

	HandlerRegistry::Result OscBridge::injectFeedback(const std::string &address, const std::vector<Value> &args)
	{
		try
		{
			return m_registry.dispatch(address, args);
		}
		catch (const std::exception &e)
		{
			log_error("Feedback handler for %s failed: %s", address.c_str(), e.what());
			return HandlerRegistry::Result::Rejected;
		}
	}

	int OscBridge::feedbackPort() const
	{
		std::lock_guard<std::mutex> lock(m_lifecycleMutex);
		if (m_state != BridgeState::Connected || !m_listener)
			return 0;
		return m_listener->port();
	}

	ListenerStats OscBridge::listenerStats() const
	{
		ListenerStats stats;
		{
			std::lock_guard<std::mutex> lock(m_lifecycleMutex);
			if (m_listener)
				stats = m_listener->stats();
		}
		stats.unhandled = m_registry.stats().unhandled;
		return stats;
	}

	Status OscBridge::announceSurface(CommandSender &sender, int port)
	{
		Status status = sender.send("/set_surface/port", {Value(static_cast<int32_t>(port))});
		if (!status)
			return status;

		if (m_config.feedbackMask != 0)
		{
			status = sender.send("/set_surface/feedback", {Value(static_cast<int32_t>(m_config.feedbackMask))});
			if (!status)
				return status;
		}

		status = sender.send("/refresh");
		if (status)
			log_info("Registered as control surface, feedback port %d", port);
		return status;
	}

} // namespace ArdourOsc
