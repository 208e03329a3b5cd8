#include "ArdourOsc/StateSerializer.h"

namespace ArdourOsc
{
	namespace
	{
		template <typename T>
		nlohmann::json optionalToJson(const std::optional<T> &value)
		{
			if (!value)
				return nullptr;
			return nlohmann::json(*value);
		}
	}

	nlohmann::json StateSerializer::toJson(const MeterLevels &meter)
	{
		return {{"peak_left", meter.peakLeft},
				{"peak_right", meter.peakRight},
				{"rms_left", meter.rmsLeft},
				{"rms_right", meter.rmsRight}};
	}

	nlohmann::json StateSerializer::toJson(const TransportState &transport)
	{
		nlohmann::json json;
		json["playing"] = transport.playing;
		json["recording"] = transport.recording;
		json["frame"] = transport.frame;
		json["speed"] = transport.speed;
		json["tempo"] = transport.tempo;
		json["time_signature"] = {transport.timeSignature.first, transport.timeSignature.second};
		json["loop_enabled"] = transport.loopEnabled;
		if (transport.loopRange)
			json["loop_range"] = {transport.loopRange->first, transport.loopRange->second};
		else
			json["loop_range"] = nullptr;
		return json;
	}

	nlohmann::json StateSerializer::toJson(const TrackState &track)
	{
		nlohmann::json json;
		json["id"] = track.id;
		json["kind"] = trackKindName(track.kind);
		json["name"] = optionalToJson(track.name);
		json["muted"] = optionalToJson(track.muted);
		json["soloed"] = optionalToJson(track.soloed);
		json["rec_enabled"] = optionalToJson(track.recEnabled);
		json["selected"] = optionalToJson(track.selected);
		json["gain_db"] = optionalToJson(track.gainDb);
		json["pan"] = optionalToJson(track.pan);
		json["monitor_mode"] = track.monitorMode ? nlohmann::json(monitorModeName(*track.monitorMode)) : nlohmann::json(nullptr);
		json["meter"] = track.meter ? toJson(*track.meter) : nlohmann::json(nullptr);

		nlohmann::json automation = nlohmann::json::object();
		for (const auto &entry : track.automation)
			automation[entry.first] = automationModeName(entry.second);
		json["automation"] = automation;

		nlohmann::json sends = nlohmann::json::object();
		for (const auto &entry : track.sends)
		{
			sends[std::to_string(entry.first)] = {{"gain_db", optionalToJson(entry.second.gainDb)},
												  {"enabled", optionalToJson(entry.second.enabled)}};
		}
		json["sends"] = sends;

		nlohmann::json plugins = nlohmann::json::object();
		for (const auto &entry : track.plugins)
		{
			nlohmann::json parameters = nlohmann::json::object();
			for (const auto &parameter : entry.second.parameters)
				parameters[std::to_string(parameter.first)] = parameter.second;

			plugins[std::to_string(entry.first)] = {{"active", optionalToJson(entry.second.active)},
													{"parameters", parameters}};
		}
		json["plugins"] = plugins;
		return json;
	}

	nlohmann::json StateSerializer::tracksToJson(const std::map<int, TrackState> &tracks)
	{
		nlohmann::json json = nlohmann::json::object();
		for (const auto &entry : tracks)
			json[std::to_string(entry.first)] = toJson(entry.second);
		return json;
	}

	nlohmann::json StateSerializer::toJson(const SessionState &session)
	{
		nlohmann::json json;
		json["name"] = optionalToJson(session.name);
		json["path"] = optionalToJson(session.path);
		json["sample_rate"] = optionalToJson(session.sampleRate);
		json["track_count"] = optionalToJson(session.trackCount);
		json["dirty"] = session.dirty;
		json["master_meter"] = session.masterMeter ? toJson(*session.masterMeter) : nlohmann::json(nullptr);
		json["transport"] = toJson(session.transport);
		json["tracks"] = tracksToJson(session.tracks);

		nlohmann::json markers = nlohmann::json::array();
		for (const auto &marker : session.markers)
			markers.push_back(nlohmann::json{{"name", marker.name}, {"position", marker.position}});
		json["markers"] = markers;
		return json;
	}

} // namespace ArdourOsc
