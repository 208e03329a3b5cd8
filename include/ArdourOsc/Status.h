/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This header declares the Status result returned by non-throwing operations.
 */

#pragma once

#include <string>

#include "ArdourOsc/Exceptions.h"

namespace ArdourOsc {
    /**
     * @brief Outcome of an operation that reports failure by value
     *
     * A default constructed Status is a success. Failures carry an ErrorCode
     * and a human readable message.
     */
    class Status {
       public:
        Status() : code_(ErrorCode::None) {}

        Status(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

        static Status success() { return Status(); }

        static Status failure(ErrorCode code, std::string message) {
            return Status(code, std::move(message));
        }

        /**
         * @brief Build a failure from a caught bridge exception
         */
        static Status fromException(const BridgeException &e) { return Status(e.code(), e.what()); }

        bool ok() const { return code_ == ErrorCode::None; }

        ErrorCode code() const { return code_; }

        const std::string &message() const { return message_; }

        /**
         * @brief "ok" or "<ErrorName>: <message>"
         */
        std::string toString() const;

        explicit operator bool() const { return ok(); }

       private:
        ErrorCode code_;
        std::string message_;
    };

}  // namespace ArdourOsc
