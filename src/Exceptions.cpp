#include "ArdourOsc/Exceptions.h"
#include "ArdourOsc/Status.h"

namespace ArdourOsc {
    const char *errorCodeName(ErrorCode code) {
        switch (code) {
            case ErrorCode::None:
                return "None";
            case ErrorCode::ConnectionError:
                return "ConnectionError";
            case ErrorCode::ProtocolError:
                return "ProtocolError";
            case ErrorCode::ValidationError:
                return "ValidationError";
            case ErrorCode::SendError:
                return "SendError";
            case ErrorCode::NotConnected:
                return "NotConnected";
            case ErrorCode::AlreadyConnected:
                return "AlreadyConnected";
            case ErrorCode::ConfigurationError:
                return "ConfigurationError";
        }
        return "Unknown";
    }

    std::string Status::toString() const {
        if (ok()) {
            return "ok";
        }
        return std::string(errorCodeName(code_)) + ": " + message_;
    }

}  // namespace ArdourOsc
