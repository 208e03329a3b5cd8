#include "ArdourOsc/StateStore.h"

#include <algorithm>

namespace ArdourOsc
{
	const char *trackKindName(TrackKind kind)
	{
		switch (kind)
		{
		case TrackKind::Audio:
			return "audio";
		case TrackKind::Midi:
			return "midi";
		case TrackKind::Bus:
			return "bus";
		}
		return "unknown";
	}

	const char *monitorModeName(MonitorMode mode)
	{
		switch (mode)
		{
		case MonitorMode::Input:
			return "input";
		case MonitorMode::Disk:
			return "disk";
		case MonitorMode::Auto:
			return "auto";
		}
		return "unknown";
	}

	const char *automationModeName(AutomationMode mode)
	{
		switch (mode)
		{
		case AutomationMode::Manual:
			return "manual";
		case AutomationMode::Play:
			return "play";
		case AutomationMode::Write:
			return "write";
		case AutomationMode::Touch:
			return "touch";
		case AutomationMode::Latch:
			return "latch";
		}
		return "unknown";
	}

	std::optional<AutomationMode> automationModeFromInt(int64_t value)
	{
		if (value < 0 || value > static_cast<int64_t>(AutomationMode::Latch))
			return std::nullopt;
		return static_cast<AutomationMode>(value);
	}

	void StateStore::updateTransport(const TransportUpdate &update)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		TransportState &transport = m_session.transport;

		if (update.playing)
			transport.playing = *update.playing;
		if (update.recording)
			transport.recording = *update.recording;
		if (update.frame)
			transport.frame = *update.frame;
		if (update.speed)
			transport.speed = *update.speed;
		if (update.tempo)
			transport.tempo = *update.tempo;
		if (update.timeSignature)
			transport.timeSignature = *update.timeSignature;
		if (update.loopEnabled)
			transport.loopEnabled = *update.loopEnabled;
		if (update.loopRange)
			transport.loopRange = *update.loopRange;
	}

	void StateStore::updateTrack(int trackId, const TrackUpdate &update)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		TrackState &track = trackLocked(trackId);

		if (update.kind)
			track.kind = *update.kind;
		if (update.name)
			track.name = *update.name;
		if (update.muted)
			track.muted = *update.muted;
		if (update.soloed)
			track.soloed = *update.soloed;
		if (update.recEnabled)
			track.recEnabled = *update.recEnabled;
		if (update.selected)
			track.selected = *update.selected;
		if (update.gainDb)
			track.gainDb = *update.gainDb;
		if (update.pan)
			track.pan = std::max(-1.0f, std::min(1.0f, *update.pan));
		if (update.monitorMode)
			track.monitorMode = *update.monitorMode;
		if (update.meter)
			track.meter = *update.meter;
	}

	void StateStore::updateSession(const SessionUpdate &update)
	{
		std::lock_guard<std::mutex> lock(m_mutex);

		if (update.name)
			m_session.name = *update.name;
		if (update.path)
			m_session.path = *update.path;
		if (update.sampleRate)
			m_session.sampleRate = *update.sampleRate;
		if (update.trackCount)
			m_session.trackCount = *update.trackCount;
		if (update.dirty)
			m_session.dirty = *update.dirty;
		if (update.masterMeter)
			m_session.masterMeter = *update.masterMeter;
	}

	bool StateStore::ensureTrack(int trackId, TrackKind kind)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_session.tracks.count(trackId) != 0)
			return false;

		TrackState &track = trackLocked(trackId);
		track.kind = kind;
		return true;
	}

	void StateStore::setTrackMonitor(int trackId, MonitorMode source, bool enabled)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		TrackState &track = trackLocked(trackId);

		if (enabled)
			track.monitorMode = source;
		else if (track.monitorMode && *track.monitorMode == source)
			track.monitorMode = MonitorMode::Auto;
	}

	void StateStore::setAutomationMode(int trackId, const std::string &parameter, AutomationMode mode)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		trackLocked(trackId).automation[parameter] = mode;
	}

	void StateStore::updateSend(int trackId, int sendId, std::optional<float> gainDb,
								std::optional<bool> enabled)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		SendState &send = trackLocked(trackId).sends[sendId];
		if (gainDb)
			send.gainDb = *gainDb;
		if (enabled)
			send.enabled = *enabled;
	}

	void StateStore::setPluginActive(int trackId, int pluginId, bool active)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		trackLocked(trackId).plugins[pluginId].active = active;
	}

	void StateStore::setPluginParameter(int trackId, int pluginId, int parameterId, float value)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		trackLocked(trackId).plugins[pluginId].parameters[parameterId] = value;
	}

	void StateStore::upsertMarker(const std::string &name, int64_t position)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		auto it = std::find_if(m_session.markers.begin(), m_session.markers.end(),
							   [&name](const Marker &marker)
							   { return marker.name == name; });
		if (it != m_session.markers.end())
		{
			it->position = position;
			return;
		}
		m_session.markers.push_back(Marker{name, position});
	}

	bool StateStore::removeMarker(const std::string &name)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		auto it = std::find_if(m_session.markers.begin(), m_session.markers.end(),
							   [&name](const Marker &marker)
							   { return marker.name == name; });
		if (it == m_session.markers.end())
			return false;

		m_session.markers.erase(it);
		return true;
	}

	TransportState StateStore::getTransport() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_session.transport;
	}

	std::optional<TrackState> StateStore::getTrack(int trackId) const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		auto it = m_session.tracks.find(trackId);
		if (it == m_session.tracks.end())
			return std::nullopt;
		return it->second;
	}

	std::map<int, TrackState> StateStore::getAllTracks() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_session.tracks;
	}

	std::vector<Marker> StateStore::getMarkers() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_session.markers;
	}

	SessionState StateStore::getSession() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_session;
	}

	void StateStore::clear()
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_session = SessionState();
	}

	TrackState &StateStore::trackLocked(int trackId)
	{
		auto it = m_session.tracks.find(trackId);
		if (it == m_session.tracks.end())
		{
			TrackState track;
			track.id = trackId;
			it = m_session.tracks.emplace(trackId, std::move(track)).first;
		}
		return it->second;
	}

} // namespace ArdourOsc
