// Helpers shared by the socket based tests: a loopback UDP peer standing in
// for Ardour, and polling for state reached on the listener thread.
#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstddef>
#include <cstring>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace ArdourOscTest {
    /**
     * @brief UDP socket bound to an ephemeral loopback port
     */
    class UdpPeer {
       public:
        UdpPeer() : socket_(::socket(AF_INET, SOCK_DGRAM, 0)), port_(0) {
            if (socket_ < 0) return;

            sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_port = 0;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            if (::bind(socket_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
                ::close(socket_);
                socket_ = -1;
                return;
            }

            socklen_t length = sizeof(addr);
            if (::getsockname(socket_, reinterpret_cast<sockaddr *>(&addr), &length) == 0) {
                port_ = ntohs(addr.sin_port);
            }
        }

        ~UdpPeer() {
            if (socket_ >= 0) ::close(socket_);
        }

        UdpPeer(const UdpPeer &) = delete;
        UdpPeer &operator=(const UdpPeer &) = delete;

        bool valid() const { return socket_ >= 0 && port_ > 0; }
        int port() const { return port_; }

        bool sendTo(int port, const void *data, size_t size) const {
            sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_port = htons(static_cast<uint16_t>(port));
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            ssize_t sent = ::sendto(socket_, data, size, 0, reinterpret_cast<sockaddr *>(&addr),
                                    sizeof(addr));
            return sent == static_cast<ssize_t>(size);
        }

        bool sendTo(int port, const std::vector<std::byte> &packet) const {
            return sendTo(port, packet.data(), packet.size());
        }

        /**
         * @brief Receive one datagram, empty on timeout
         */
        std::vector<std::byte> receive(std::chrono::milliseconds timeout) const {
            pollfd pfd{};
            pfd.fd = socket_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
                return {};
            }

            std::vector<std::byte> buffer(65536);
            ssize_t received = ::recv(socket_, buffer.data(), buffer.size(), 0);
            if (received <= 0) return {};
            buffer.resize(static_cast<size_t>(received));
            return buffer;
        }

       private:
        int socket_;
        int port_;
    };

    /**
     * @brief Poll until the predicate holds or the timeout expires
     */
    inline bool waitFor(const std::function<bool()> &predicate,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    /**
     * @brief Build raw packet bytes, for malformed input the encoder refuses
     */
    class PacketBuilder {
       public:
        PacketBuilder &str(const std::string &text) {
            for (char c : text) bytes_.push_back(static_cast<std::byte>(c));
            bytes_.push_back(std::byte{0});
            while (bytes_.size() % 4 != 0) bytes_.push_back(std::byte{0});
            return *this;
        }

        PacketBuilder &raw(std::initializer_list<int> values) {
            for (int v : values) bytes_.push_back(static_cast<std::byte>(v));
            return *this;
        }

        PacketBuilder &int32(int32_t value) {
            uint32_t v = static_cast<uint32_t>(value);
            return raw({static_cast<int>((v >> 24) & 0xff), static_cast<int>((v >> 16) & 0xff),
                        static_cast<int>((v >> 8) & 0xff), static_cast<int>(v & 0xff)});
        }

        PacketBuilder &float32(float value) {
            int32_t bits;
            std::memcpy(&bits, &value, sizeof(bits));
            return int32(bits);
        }

        const std::vector<std::byte> &bytes() const { return bytes_; }

       private:
        std::vector<std::byte> bytes_;
    };

}  // namespace ArdourOscTest
