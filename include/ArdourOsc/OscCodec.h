/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This header declares the wire codec: OSC 1.0 message framing on top of liblo.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ArdourOsc/Message.h"
#include "ArdourOsc/Value.h"

namespace ArdourOsc {
    /**
     * @brief Encodes and decodes single OSC messages
     *
     * Packets are a 4-byte aligned, null padded address string, a comma
     * prefixed type tag string, and the arguments in big-endian order.
     * Bundles are not supported and decode as a ProtocolError.
     */
    class OscCodec {
       public:
        /// Largest datagram the codec accepts or produces
        static constexpr size_t MAX_PACKET_SIZE = 65536;

        /**
         * @brief Encode an address and arguments into packet bytes
         * @throws ValidationError on an invalid address or an oversized packet
         */
        static std::vector<std::byte> encode(const std::string &address,
                                             const std::vector<Value> &args);

        static std::vector<std::byte> encode(const Message &message) {
            return encode(message.getPath(), message.getArguments());
        }

        /**
         * @brief Decode one packet
         * @throws ProtocolError if the packet is truncated, misaligned, badly
         *         padded, carries an unknown type tag, or is a bundle
         */
        static Message decode(const void *data, size_t size);

        static Message decode(const std::vector<std::byte> &packet) {
            return decode(packet.data(), packet.size());
        }

        /**
         * @brief Non-throwing decode
         * @param error Receives the failure reason when decoding fails (optional)
         * @return The message, or nullopt if the packet was rejected
         */
        static std::optional<Message> tryDecode(const void *data, size_t size,
                                                std::string *error = nullptr);

        /**
         * @brief True if the packet starts with the "#bundle" marker
         */
        static bool isBundle(const void *data, size_t size);

        /**
         * @brief Text for a liblo deserialiser result code
         */
        static std::string describeLoError(int code);
    };

}  // namespace ArdourOsc
