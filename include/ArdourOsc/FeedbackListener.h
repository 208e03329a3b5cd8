/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This header declares the background worker that receives feedback
 *  datagrams on the local UDP port.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ArdourOsc/Message.h"
#include "ArdourOsc/Status.h"

namespace ArdourOsc {
    /**
     * @brief Counters for one listener lifetime
     *
     * OscBridge resets every counter on connect().
     */
    struct ListenerStats {
        uint64_t received = 0;        ///< Datagrams read from the socket
        uint64_t decoded = 0;         ///< Datagrams that decoded to a message
        uint64_t protocolErrors = 0;  ///< Datagrams dropped as malformed
        uint64_t handlerErrors = 0;   ///< Messages whose callback threw
        uint64_t unhandled = 0;       ///< Messages no handler wanted, injected ones included (filled by OscBridge)
    };

    /**
     * @brief Receives and decodes OSC datagrams on a worker thread
     *
     * The worker polls the socket with a bounded timeout so stop() returns
     * within one timeout period. Malformed packets and exceptions of any type
     * thrown by the callback are logged and counted; they never end the loop.
     */
    class FeedbackListener {
       public:
        using MessageCallback = std::function<void(const Message &)>;

        /**
         * @param listenAddress IPv4 address to bind ("0.0.0.0" for all)
         * @param port UDP port, 0 for an ephemeral port
         * @param receiveTimeout Longest wait before the stop flag is checked
         * @param maxDatagramSize Receive buffer size; larger datagrams are dropped
         */
        FeedbackListener(std::string listenAddress, int port,
                         std::chrono::milliseconds receiveTimeout = std::chrono::milliseconds(1000),
                         size_t maxDatagramSize = 65536);

        ~FeedbackListener();

        FeedbackListener(const FeedbackListener &) = delete;
        FeedbackListener &operator=(const FeedbackListener &) = delete;

        /**
         * @brief Bind the socket and start the worker
         * @param callback Called on the worker for every decoded message
         * @return ConnectionError if the socket cannot be created or bound or
         *         the receive buffer cannot be allocated, AlreadyConnected if
         *         the worker is running
         */
        Status start(MessageCallback callback);

        /**
         * @brief Stop the worker, join it and close the socket
         */
        void stop();

        bool isRunning() const { return running_.load(); }

        /**
         * @brief Port the socket is bound to, 0 before start()
         */
        int port() const { return boundPort_.load(); }

        ListenerStats stats() const;

       private:
        void run();
        void handleDatagram(const void *data, size_t size, const std::string &origin);
        void closeSocket();

        std::string listenAddress_;
        int requestedPort_;
        std::chrono::milliseconds receiveTimeout_;
        size_t maxDatagramSize_;

        std::mutex lifecycleMutex_;
        int socket_;
        std::thread thread_;
        std::atomic<bool> running_;
        std::atomic<int> boundPort_;
        MessageCallback callback_;
        std::vector<std::byte> buffer_;

        std::atomic<uint64_t> received_{0};
        std::atomic<uint64_t> decoded_{0};
        std::atomic<uint64_t> protocolErrors_{0};
        std::atomic<uint64_t> handlerErrors_{0};
    };

}  // namespace ArdourOsc
