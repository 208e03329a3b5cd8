#pragma once

#include <string>

#include "ArdourOsc/Status.h"

namespace ArdourOsc
{
    /**
     * @brief Settings for one bridge instance
     */
    struct BridgeConfig
    {
        std::string host = "127.0.0.1";       // Ardour host
        int commandPort = 3819;               // Ardour's OSC port
        int feedbackPort = 3820;              // Local feedback port, 0 = ephemeral
        std::string listenAddress = "0.0.0.0";
        int receiveTimeoutMs = 1000;          // Listener wake-up period
        int maxDatagramSize = 65536;          // 64..65536
        bool announceSurface = false;         // Send /set_surface/* after connecting
        int feedbackMask = 0;                 // 0 = leave Ardour's feedback setting alone
        std::string logLevel = "info";
        std::string logFile;                  // Empty = stderr only

        /**
         * @brief Check the values a bridge cannot run with
         *
         * @return ConfigurationError describing the first bad value
         */
        Status validate() const;
    };

} // namespace ArdourOsc
