#include "ArdourOsc/BridgeConfig.h"

#include "ArdourOsc/Logging.h"
#include "ArdourOsc/OscCodec.h"

namespace ArdourOsc
{
	Status BridgeConfig::validate() const
	{
		if (host.empty())
			return Status::failure(ErrorCode::ConfigurationError, "host must not be empty");
		if (commandPort <= 0 || commandPort > 65535)
			return Status::failure(ErrorCode::ConfigurationError,
								   "command port " + std::to_string(commandPort) + " is outside 1..65535");
		if (feedbackPort < 0 || feedbackPort > 65535)
			return Status::failure(ErrorCode::ConfigurationError,
								   "feedback port " + std::to_string(feedbackPort) + " is outside 0..65535");
		if (listenAddress.empty())
			return Status::failure(ErrorCode::ConfigurationError, "listen address must not be empty");
		if (receiveTimeoutMs <= 0)
			return Status::failure(ErrorCode::ConfigurationError, "receive timeout must be positive");
		if (maxDatagramSize < 64 || static_cast<size_t>(maxDatagramSize) > OscCodec::MAX_PACKET_SIZE)
			return Status::failure(ErrorCode::ConfigurationError,
								   "max datagram size " + std::to_string(maxDatagramSize) + " is outside 64.." +
									   std::to_string(OscCodec::MAX_PACKET_SIZE));
		if (feedbackMask < 0)
			return Status::failure(ErrorCode::ConfigurationError, "feedback mask must not be negative");

		log_level_t level;
		if (log_level_from_string(logLevel.c_str(), &level) != 0)
			return Status::failure(ErrorCode::ConfigurationError, "unknown log level '" + logLevel + "'");

		return Status::success();
	}

} // namespace ArdourOsc
