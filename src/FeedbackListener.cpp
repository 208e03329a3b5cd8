#include "ArdourOsc/FeedbackListener.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <new>
#include <vector>

#include "ArdourOsc/Exceptions.h"
#include "ArdourOsc/Logging.h"
#include "ArdourOsc/OscCodec.h"

namespace ArdourOsc {
    namespace {
        std::string endpointOf(const sockaddr_in &addr) {
            char host[INET_ADDRSTRLEN] = {0};
            if (!inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host))) {
                return "unknown";
            }
            return std::string(host) + ":" + std::to_string(ntohs(addr.sin_port));
        }
    }  // namespace

    FeedbackListener::FeedbackListener(std::string listenAddress, int port,
                                       std::chrono::milliseconds receiveTimeout,
                                       size_t maxDatagramSize)
        : listenAddress_(std::move(listenAddress)),
          requestedPort_(port),
          receiveTimeout_(receiveTimeout),
          maxDatagramSize_(maxDatagramSize),
          socket_(-1),
          running_(false),
          boundPort_(0) {}

    FeedbackListener::~FeedbackListener() { stop(); }

    Status FeedbackListener::start(MessageCallback callback) {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (running_) {
            return Status::failure(ErrorCode::AlreadyConnected, "feedback listener already running");
        }
        // A worker that ended on a socket error is still joinable.
        if (thread_.joinable()) {
            thread_.join();
        }
        closeSocket();
        if (requestedPort_ < 0 || requestedPort_ > 65535) {
            return Status::failure(ErrorCode::ConnectionError,
                                   "invalid feedback port " + std::to_string(requestedPort_));
        }

        if (maxDatagramSize_ == 0 || maxDatagramSize_ > OscCodec::MAX_PACKET_SIZE) {
            return Status::failure(ErrorCode::ConnectionError,
                                   "invalid receive buffer size " +
                                       std::to_string(maxDatagramSize_));
        }
        try {
            buffer_.assign(maxDatagramSize_, std::byte{0});
        } catch (const std::bad_alloc &) {
            return Status::failure(ErrorCode::ConnectionError,
                                   "cannot allocate receive buffer of " +
                                       std::to_string(maxDatagramSize_) + " bytes");
        }

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(requestedPort_));
        if (inet_pton(AF_INET, listenAddress_.c_str(), &addr.sin_addr) != 1) {
            return Status::failure(ErrorCode::ConnectionError,
                                   "invalid listen address '" + listenAddress_ + "'");
        }

        socket_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (socket_ < 0) {
            return Status::failure(ErrorCode::ConnectionError,
                                   std::string("failed to create feedback socket: ") +
                                       std::strerror(errno));
        }

        if (::bind(socket_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            closeSocket();
            std::string message = "failed to bind feedback socket to " + listenAddress_ + ":" +
                                  std::to_string(requestedPort_) + ": " + std::strerror(err);
            log_error("%s", message.c_str());
            return Status::failure(ErrorCode::ConnectionError, message);
        }

        sockaddr_in bound;
        socklen_t boundLength = sizeof(bound);
        if (::getsockname(socket_, reinterpret_cast<sockaddr *>(&bound), &boundLength) < 0) {
            int err = errno;
            closeSocket();
            return Status::failure(ErrorCode::ConnectionError,
                                   std::string("failed to query feedback socket: ") +
                                       std::strerror(err));
        }
        boundPort_ = ntohs(bound.sin_port);

        callback_ = std::move(callback);
        received_ = 0;
        decoded_ = 0;
        protocolErrors_ = 0;
        handlerErrors_ = 0;

        running_ = true;
        thread_ = std::thread(&FeedbackListener::run, this);

        log_info("Listening for feedback on %s:%d", listenAddress_.c_str(), boundPort_.load());
        return Status::success();
    }

    void FeedbackListener::stop() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        running_ = false;

        // The worker sees the flag after at most one receive timeout.
        if (thread_.joinable()) {
            thread_.join();
        }
        closeSocket();
    }

    ListenerStats FeedbackListener::stats() const {
        ListenerStats s;
        s.received = received_.load();
        s.decoded = decoded_.load();
        s.protocolErrors = protocolErrors_.load();
        s.handlerErrors = handlerErrors_.load();
        return s;
    }

    void FeedbackListener::run() {
        std::vector<std::byte> &buffer = buffer_;

        while (running_) {
            pollfd pfd;
            pfd.fd = socket_;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ready = ::poll(&pfd, 1, static_cast<int>(receiveTimeout_.count()));
            if (ready < 0) {
                if (errno == EINTR) continue;
                log_error("Feedback socket wait failed: %s", std::strerror(errno));
                break;
            }
            if (ready == 0) continue;

            sockaddr_in from;
            socklen_t fromLength = sizeof(from);
            std::memset(&from, 0, sizeof(from));

            // MSG_TRUNC reports the full datagram length even when it did not fit.
            ssize_t received = ::recvfrom(socket_, buffer.data(), buffer.size(), MSG_TRUNC,
                                          reinterpret_cast<sockaddr *>(&from), &fromLength);
            if (received < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                log_warning("Feedback receive failed: %s", std::strerror(errno));
                continue;
            }

            std::string origin = endpointOf(from);
            if (static_cast<size_t>(received) > buffer.size()) {
                ++received_;
                ++protocolErrors_;
                log_warning("Dropped oversized packet of %zd bytes from %s", received,
                            origin.c_str());
                continue;
            }

            handleDatagram(buffer.data(), static_cast<size_t>(received), origin);
        }

        running_ = false;
    }

    void FeedbackListener::handleDatagram(const void *data, size_t size,
                                          const std::string &origin) {
        ++received_;
        try {
            Message message = OscCodec::decode(data, size);
            ++decoded_;
            if (callback_) {
                callback_(message);
            }
        } catch (const ProtocolError &e) {
            ++protocolErrors_;
            log_warning("Dropped malformed packet of %zu bytes from %s: %s", size, origin.c_str(),
                        e.what());
        } catch (const std::exception &e) {
            ++handlerErrors_;
            log_error("Feedback handler failed for packet from %s: %s", origin.c_str(), e.what());
        } catch (...) {
            ++handlerErrors_;
            log_error("Feedback handler for packet from %s threw a non-standard exception",
                      origin.c_str());
        }
    }

    void FeedbackListener::closeSocket() {
        if (socket_ >= 0) {
            ::close(socket_);
            socket_ = -1;
        }
    }

}  // namespace ArdourOsc
