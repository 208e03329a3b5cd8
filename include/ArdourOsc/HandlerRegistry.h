/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This header declares the feedback dispatch table that turns incoming
 *  messages into state store updates.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ArdourOsc/Message.h"
#include "ArdourOsc/StateStore.h"

namespace ArdourOsc {
    /**
     * @brief Callback for feedback messages, receives the address as it
     *        arrived and the decoded arguments
     */
    using FeedbackHandler =
        std::function<void(const std::string &address, const std::vector<Value> &args)>;

    /**
     * @brief Dispatches feedback messages to state updates
     *
     * Built-in handlers come from a fixed table. Entries are either global
     * (exact address) or per strip, where the first argument is the strip id.
     * Per strip addresses are also accepted with the id in the path, e.g.
     * "/strip/3/gain -6.0" is handled as "/strip/gain 3 -6.0".
     *
     * Extension handlers registered at runtime run after the built-in one for
     * the same message. Addresses nothing handles are ignored.
     */
    class HandlerRegistry {
       public:
        enum class Result {
            Handled,    ///< A built-in or extension handler accepted the message
            Unhandled,  ///< No handler for the address
            Rejected    ///< A built-in handler exists but the arguments were unusable
        };

        struct Stats {
            uint64_t handled = 0;
            uint64_t unhandled = 0;
            uint64_t rejected = 0;
        };

        explicit HandlerRegistry(StateStore &store);

        HandlerRegistry(const HandlerRegistry &) = delete;
        HandlerRegistry &operator=(const HandlerRegistry &) = delete;

        /**
         * @brief Apply one feedback message
         *
         * Exceptions thrown by extension handlers propagate to the caller.
         */
        Result dispatch(const Message &message);

        Result dispatch(const std::string &address, const std::vector<Value> &args) {
            return dispatch(Message(address, args));
        }

        /**
         * @brief Add an extension handler
         *
         * @param pattern Exact address, or a prefix ending in '*'
         * @param handler Called on the listener thread
         */
        void registerHandler(const std::string &pattern, FeedbackHandler handler);

        size_t extensionHandlerCount() const;

        Stats stats() const;

        void resetStats();

        /**
         * @brief True if a built-in handler covers the address (either form)
         */
        static bool hasBuiltin(const std::string &address);

        static std::vector<std::string> builtinAddresses();

        /**
         * @brief Split the id out of a "/strip/<id>/<field>" address
         *
         * @param address Incoming address
         * @param canonical Receives "/strip/<field>" when an id was found
         * @param id Receives the strip id
         * @return true if the address carried a numeric id segment
         */
        static bool splitPathId(const std::string &address, std::string &canonical, int &id);

       private:
        struct Extension {
            std::string pattern;
            bool prefix;
            FeedbackHandler handler;
        };

        Result applyBuiltin(const std::string &address, const std::vector<Value> &args);
        bool runExtensions(const std::string &address, const std::vector<Value> &args);

        StateStore &m_store;

        mutable std::mutex m_extensionMutex;
        std::vector<Extension> m_extensions;

        std::atomic<uint64_t> m_handled{0};
        std::atomic<uint64_t> m_unhandled{0};
        std::atomic<uint64_t> m_rejected{0};
    };

}  // namespace ArdourOsc
