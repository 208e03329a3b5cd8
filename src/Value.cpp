/*
 * Implementation of the Value and Blob classes: type checks, checked
 * accessors and the numeric conversions used by the feedback handlers.
 */

#include "ArdourOsc/Value.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <sstream>

#include "ArdourOsc/Exceptions.h"

namespace ArdourOsc {
    namespace {
        const char *tagName(char tag) {
            switch (tag) {
                case Value::INT32_TAG:
                    return "int32";
                case Value::INT64_TAG:
                    return "int64";
                case Value::FLOAT_TAG:
                    return "float";
                case Value::DOUBLE_TAG:
                    return "double";
                case Value::STRING_TAG:
                    return "string";
                case Value::BLOB_TAG:
                    return "blob";
                case Value::TRUE_TAG:
                case Value::FALSE_TAG:
                    return "bool";
                case Value::NIL_TAG:
                    return "nil";
            }
            return "unknown";
        }

        [[noreturn]] void throwMismatch(const char *wanted, char actual) {
            throw ValidationError(std::string("OSC value type mismatch: expected ") + wanted +
                                  ", got " + tagName(actual));
        }
    }  // namespace

    Blob::Blob(const void *data, size_t size) : data_(size) {
        if (size > 0 && data) {
            std::memcpy(data_.data(), data, size);
        }
    }

    Value::Int32 Value::asInt32() const {
        if (!isInt32()) throwMismatch("int32", typeTag());
        return std::get<Int32>(value_);
    }

    Value::Int64 Value::asInt64() const {
        if (!isInt64()) throwMismatch("int64", typeTag());
        return std::get<Int64>(value_);
    }

    Value::Float Value::asFloat() const {
        if (!isFloat()) throwMismatch("float", typeTag());
        return std::get<Float>(value_);
    }

    Value::Double Value::asDouble() const {
        if (!isDouble()) throwMismatch("double", typeTag());
        return std::get<Double>(value_);
    }

    const Value::String &Value::asString() const {
        if (!isString()) throwMismatch("string", typeTag());
        return std::get<String>(value_);
    }

    const Blob &Value::asBlob() const {
        if (!isBlob()) throwMismatch("blob", typeTag());
        return std::get<Blob>(value_);
    }

    Value::Bool Value::asBool() const {
        if (!isBool()) throwMismatch("bool", typeTag());
        return std::get<Bool>(value_);
    }

    std::optional<double> Value::toDouble() const {
        if (isInt32()) return static_cast<double>(std::get<Int32>(value_));
        if (isInt64()) return static_cast<double>(std::get<Int64>(value_));
        if (isFloat()) return static_cast<double>(std::get<Float>(value_));
        if (isDouble()) return std::get<Double>(value_);
        if (isBool()) return std::get<Bool>(value_) ? 1.0 : 0.0;
        return std::nullopt;
    }

    std::optional<int64_t> Value::toInteger() const {
        if (isInt32()) return std::get<Int32>(value_);
        if (isInt64()) return std::get<Int64>(value_);
        if (isBool()) return std::get<Bool>(value_) ? 1 : 0;

        if (isFloat() || isDouble()) {
            double d = *toDouble();
            if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
            if (d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
                d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<int64_t>(d);
        }
        return std::nullopt;
    }

    char Value::typeTag() const {
        if (isInt32()) return INT32_TAG;
        if (isInt64()) return INT64_TAG;
        if (isFloat()) return FLOAT_TAG;
        if (isDouble()) return DOUBLE_TAG;
        if (isString()) return STRING_TAG;
        if (isBlob()) return BLOB_TAG;
        if (isBool()) return std::get<Bool>(value_) ? TRUE_TAG : FALSE_TAG;
        return NIL_TAG;
    }

    std::string Value::toString() const {
        std::ostringstream out;
        out << typeTag() << ':';
        if (isInt32()) {
            out << std::get<Int32>(value_);
        } else if (isInt64()) {
            out << std::get<Int64>(value_);
        } else if (isFloat()) {
            out << std::get<Float>(value_);
        } else if (isDouble()) {
            out << std::get<Double>(value_);
        } else if (isString()) {
            out << '"' << std::get<String>(value_) << '"';
        } else if (isBlob()) {
            out << std::get<Blob>(value_).size() << " bytes";
        } else if (isBool()) {
            out << (std::get<Bool>(value_) ? "true" : "false");
        } else {
            out << "nil";
        }
        return out.str();
    }

    std::string typeTagsOf(const std::vector<Value> &args) {
        std::string tags;
        tags.reserve(args.size());
        for (const auto &arg : args) {
            tags += arg.typeTag();
        }
        return tags;
    }

}  // namespace ArdourOsc
