/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This file defines the error codes and exceptions used throughout the bridge.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ArdourOsc {
    /**
     * @brief Error codes shared by exceptions and Status results
     */
    enum class ErrorCode {
        None = 0,
        ConnectionError,     ///< Socket bind/connect failure while connecting
        ProtocolError,       ///< Malformed packet during decode
        ValidationError,     ///< Address or argument rejected before encode
        SendError,           ///< Local socket write failure
        NotConnected,        ///< Operation needs a connected bridge
        AlreadyConnected,    ///< connect() on a connected bridge
        ConfigurationError   ///< Invalid configuration value
    };

    /**
     * @brief Stable name of an error code (e.g. "ProtocolError")
     */
    const char *errorCodeName(ErrorCode code);

    /**
     * @brief Base exception class for all bridge errors
     */
    class BridgeException : public std::runtime_error {
       public:
        /**
         * @brief Construct a new bridge exception
         * @param message Error message
         * @param code Error code
         */
        BridgeException(const std::string &message, ErrorCode code = ErrorCode::None)
            : std::runtime_error(message), code_(code) {}

        /**
         * @brief Get the error code
         * @return ErrorCode
         */
        ErrorCode code() const { return code_; }

       private:
        ErrorCode code_;
    };

    /**
     * @brief Malformed, truncated or unsupported packet
     *
     * Carries the liblo deserialiser result when the failure came from liblo
     * (one of the LO_E* codes), or 0 when the packet was rejected before that.
     */
    class ProtocolError : public BridgeException {
       public:
        explicit ProtocolError(const std::string &message, int loError = 0)
            : BridgeException(message, ErrorCode::ProtocolError), loError_(loError) {}

        int loError() const { return loError_; }

       private:
        int loError_;
    };

    /**
     * @brief Caller supplied address or arguments that cannot be encoded
     */
    class ValidationError : public BridgeException {
       public:
        explicit ValidationError(const std::string &message)
            : BridgeException(message, ErrorCode::ValidationError) {}
    };

}  // namespace ArdourOsc
