/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This header declares the Message class, which represents an OSC message,
 *  including its path and arguments.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ArdourOsc/Value.h"

namespace ArdourOsc {
    /**
     * @brief The Message class represents an OSC message.
     *
     * A message is a plain value: it does not validate its path. The codec
     * validates addresses on encode.
     */
    class Message {
       public:
        Message() = default;

        /**
         * @brief Construct a new OSC Message object
         * @param path The OSC address path
         */
        explicit Message(std::string path) : path_(std::move(path)) {}

        /**
         * @brief Construct a message with its arguments
         * @param path The OSC address path
         * @param args The typed arguments
         */
        Message(std::string path, std::vector<Value> args)
            : path_(std::move(path)), arguments_(std::move(args)) {}

        /**
         * @brief Get the OSC address path
         * @return The path as a string
         */
        const std::string &getPath() const { return path_; }

        /**
         * @brief Get the arguments in this message
         * @return A const reference to the argument vector
         */
        const std::vector<Value> &getArguments() const { return arguments_; }

        size_t getArgumentCount() const { return arguments_.size(); }

        /**
         * @brief Get one argument
         * @param index Zero based argument index
         * @throws std::out_of_range if index is past the end
         */
        const Value &getArgument(size_t index) const { return arguments_.at(index); }

        /**
         * @brief Type tag string without the leading comma (e.g. "if")
         */
        std::string getTypeTags() const { return typeTagsOf(arguments_); }

        /**
         * @brief Check OSC address syntax
         *
         * A valid address is non-empty, starts with '/', and contains no
         * whitespace, no '#' and no control characters.
         */
        static bool isValidAddress(const std::string &address);

        /**
         * @brief Printable form for logs, e.g. "/strip/gain ,if 3 -6"
         */
        std::string toString() const;

        bool operator==(const Message &other) const {
            return path_ == other.path_ && arguments_ == other.arguments_;
        }
        bool operator!=(const Message &other) const { return !(*this == other); }

       private:
        std::string path_;
        std::vector<Value> arguments_;
    };

}  // namespace ArdourOsc
