#include "ArdourOsc/OscCodec.h"

#include <climits>
#include <cstring>

#include "ArdourOsc/Exceptions.h"
#include "LoMessage.h"

namespace ArdourOsc {
    LoMessagePtr buildLoMessage(const std::vector<Value> &args) {
        LoMessagePtr msg(lo_message_new());
        if (!msg) {
            throw ValidationError("liblo could not allocate an OSC message");
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const Value &arg = args[i];
            int result = 0;

            switch (arg.typeTag()) {
                case Value::INT32_TAG:
                    result = lo_message_add_int32(msg.get(), arg.asInt32());
                    break;
                case Value::INT64_TAG:
                    result = lo_message_add_int64(msg.get(), arg.asInt64());
                    break;
                case Value::FLOAT_TAG:
                    result = lo_message_add_float(msg.get(), arg.asFloat());
                    break;
                case Value::DOUBLE_TAG:
                    result = lo_message_add_double(msg.get(), arg.asDouble());
                    break;
                case Value::STRING_TAG:
                    result = lo_message_add_string(msg.get(), arg.asString().c_str());
                    break;
                case Value::BLOB_TAG: {
                    const Blob &blob = arg.asBlob();
                    if (blob.size() > static_cast<size_t>(INT32_MAX)) {
                        throw ValidationError("blob argument " + std::to_string(i) + " is too large");
                    }
                    static const char empty = 0;
                    const void *bytes = blob.size() > 0 ? static_cast<const void *>(blob.bytes())
                                                        : static_cast<const void *>(&empty);
                    lo_blob loBlob = lo_blob_new(static_cast<int32_t>(blob.size()), bytes);
                    if (!loBlob) {
                        throw ValidationError("liblo could not allocate blob argument " +
                                              std::to_string(i));
                    }
                    result = lo_message_add_blob(msg.get(), loBlob);
                    lo_blob_free(loBlob);
                    break;
                }
                case Value::TRUE_TAG:
                    result = lo_message_add_true(msg.get());
                    break;
                case Value::FALSE_TAG:
                    result = lo_message_add_false(msg.get());
                    break;
                case Value::NIL_TAG:
                    result = lo_message_add_nil(msg.get());
                    break;
                default:
                    throw ValidationError(std::string("unsupported argument type '") + arg.typeTag() +
                                          "'");
            }

            if (result < 0) {
                throw ValidationError("liblo rejected argument " + std::to_string(i) + " (" +
                                      arg.toString() + ")");
            }
        }

        return msg;
    }

    LoMessagePtr encodeLoMessage(const std::string &address, const std::vector<Value> &args,
                                 size_t *encodedLength) {
        if (!Message::isValidAddress(address)) {
            throw ValidationError("invalid OSC address '" + address + "'");
        }

        LoMessagePtr msg = buildLoMessage(args);

        size_t length = lo_message_length(msg.get(), address.c_str());
        if (length == 0) {
            throw ValidationError("liblo could not size message for " + address);
        }
        if (length > OscCodec::MAX_PACKET_SIZE) {
            throw ValidationError("encoded message for " + address + " is " +
                                  std::to_string(length) + " bytes, limit is " +
                                  std::to_string(OscCodec::MAX_PACKET_SIZE));
        }

        if (encodedLength) {
            *encodedLength = length;
        }
        return msg;
    }

    std::vector<std::byte> OscCodec::encode(const std::string &address,
                                            const std::vector<Value> &args) {
        size_t length = 0;
        LoMessagePtr msg = encodeLoMessage(address, args, &length);

        std::vector<std::byte> packet(length);
        size_t written = length;
        if (!lo_message_serialise(msg.get(), address.c_str(), packet.data(), &written)) {
            throw ValidationError("liblo failed to serialise message for " + address);
        }
        packet.resize(written);
        return packet;
    }

    Message OscCodec::decode(const void *data, size_t size) {
        if (!data || size == 0) {
            throw ProtocolError("empty packet");
        }
        if (size > MAX_PACKET_SIZE) {
            throw ProtocolError("packet of " + std::to_string(size) + " bytes exceeds the " +
                                std::to_string(MAX_PACKET_SIZE) + " byte limit");
        }
        if (size % 4 != 0) {
            throw ProtocolError("packet length " + std::to_string(size) +
                                " is not a multiple of 4");
        }
        if (isBundle(data, size)) {
            throw ProtocolError("OSC bundles are not supported");
        }

        const char *bytes = static_cast<const char *>(data);
        if (bytes[0] != '/') {
            throw ProtocolError("address does not start with '/'");
        }

        const void *terminator = std::memchr(bytes, '\0', size);
        if (!terminator) {
            throw ProtocolError("address string is not null terminated");
        }
        std::string path(bytes, static_cast<const char *>(terminator) - bytes);

        // liblo copies the packet; it validates padding, tag count and sizes.
        int result = 0;
        LoMessagePtr msg(lo_message_deserialise(const_cast<void *>(data), size, &result));
        if (!msg) {
            throw ProtocolError("malformed OSC message for " + path + ": " +
                                    describeLoError(result),
                                result);
        }

        const int argc = lo_message_get_argc(msg.get());
        const char *types = lo_message_get_types(msg.get());
        lo_arg **argv = lo_message_get_argv(msg.get());
        if (argc > 0 && (!types || !argv)) {
            throw ProtocolError("liblo returned no arguments for " + path);
        }

        std::vector<Value> args;
        args.reserve(static_cast<size_t>(argc));

        for (int i = 0; i < argc; ++i) {
            switch (types[i]) {
                case Value::INT32_TAG:
                    args.emplace_back(static_cast<int32_t>(argv[i]->i));
                    break;
                case Value::INT64_TAG:
                    args.emplace_back(static_cast<int64_t>(argv[i]->h));
                    break;
                case Value::FLOAT_TAG:
                    args.emplace_back(static_cast<float>(argv[i]->f));
                    break;
                case Value::DOUBLE_TAG:
                    args.emplace_back(static_cast<double>(argv[i]->d));
                    break;
                case Value::STRING_TAG:
                    args.emplace_back(std::string(&argv[i]->s));
                    break;
                case Value::SYMBOL_TAG:
                    args.emplace_back(std::string(&argv[i]->S));
                    break;
                case Value::CHAR_TAG:
                    args.emplace_back(static_cast<int32_t>(static_cast<unsigned char>(argv[i]->c)));
                    break;
                case Value::BLOB_TAG: {
                    lo_blob blob = reinterpret_cast<lo_blob>(argv[i]);
                    args.emplace_back(Blob(lo_blob_dataptr(blob), lo_blob_datasize(blob)));
                    break;
                }
                case Value::TRUE_TAG:
                    args.emplace_back(true);
                    break;
                case Value::FALSE_TAG:
                    args.emplace_back(false);
                    break;
                case Value::NIL_TAG:
                case Value::INFINITUM_TAG:
                    args.push_back(Value::nil());
                    break;
                default:
                    throw ProtocolError(std::string("unsupported OSC type tag '") + types[i] +
                                        "' in " + path);
            }
        }

        return Message(std::move(path), std::move(args));
    }

    std::optional<Message> OscCodec::tryDecode(const void *data, size_t size, std::string *error) {
        try {
            return decode(data, size);
        } catch (const ProtocolError &e) {
            if (error) {
                *error = e.what();
            }
            return std::nullopt;
        }
    }

    bool OscCodec::isBundle(const void *data, size_t size) {
        static const char marker[8] = {'#', 'b', 'u', 'n', 'd', 'l', 'e', '\0'};
        return data && size >= sizeof(marker) && std::memcmp(data, marker, sizeof(marker)) == 0;
    }

    std::string OscCodec::describeLoError(int code) {
        switch (code) {
            case LO_ESIZE:
                return "packet size does not match its contents";
            case LO_EINVALIDPATH:
                return "invalid address string";
            case LO_ENOTYPE:
                return "missing type tag string";
            case LO_EINVALIDTYPE:
                return "invalid type tag string";
            case LO_EBADTYPE:
                return "unknown type tag";
            case LO_EINVALIDARG:
                return "argument data is invalid";
            case LO_ETERM:
                return "string is not null terminated";
            case LO_EPAD:
                return "string padding is not null";
            case LO_EALLOC:
                return "out of memory";
        }
        return "liblo error " + std::to_string(code);
    }

}  // namespace ArdourOsc
