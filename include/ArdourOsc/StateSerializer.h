#pragma once

#include <map>
#include <nlohmann/json.hpp>

#include "ArdourOsc/SessionState.h"

namespace ArdourOsc
{
    /**
     * @brief JSON rendering of state snapshots
     *
     * Fields that feedback has not reported yet render as null.
     */
    class StateSerializer
    {
    public:
        static nlohmann::json toJson(const SessionState &session);
        static nlohmann::json toJson(const TransportState &transport);
        static nlohmann::json toJson(const TrackState &track);
        static nlohmann::json toJson(const MeterLevels &meter);
        static nlohmann::json tracksToJson(const std::map<int, TrackState> &tracks);
    };

} // namespace ArdourOsc
