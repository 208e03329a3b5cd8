/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This header defines the typed OSC argument values carried by messages.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ArdourOsc {
    /**
     * @brief Class representing an OSC Blob
     *
     * OSC Blobs are binary data with a specified size.
     */
    class Blob {
       public:
        /**
         * @brief Default constructor (empty blob)
         */
        Blob() = default;

        /**
         * @brief Construct from data
         * @param data Binary data
         */
        explicit Blob(std::vector<std::byte> data) : data_(std::move(data)) {}

        /**
         * @brief Construct from raw data
         * @param data Pointer to data
         * @param size Size of data in bytes
         */
        Blob(const void *data, size_t size);

        const std::vector<std::byte> &data() const { return data_; }

        size_t size() const { return data_.size(); }

        const std::byte *bytes() const { return data_.data(); }

        bool operator==(const Blob &other) const { return data_ == other.data_; }
        bool operator!=(const Blob &other) const { return !(*this == other); }

       private:
        std::vector<std::byte> data_;
    };

    /**
     * @brief Class representing an OSC value
     *
     * OSC values can be of various types, represented here as a variant.
     * Symbols ('S') decode to strings and chars ('c') decode to Int32.
     */
    class Value {
       public:
        // Type tag constants
        static constexpr char INT32_TAG = 'i';
        static constexpr char INT64_TAG = 'h';
        static constexpr char FLOAT_TAG = 'f';
        static constexpr char DOUBLE_TAG = 'd';
        static constexpr char STRING_TAG = 's';
        static constexpr char SYMBOL_TAG = 'S';
        static constexpr char BLOB_TAG = 'b';
        static constexpr char TRUE_TAG = 'T';
        static constexpr char FALSE_TAG = 'F';
        static constexpr char NIL_TAG = 'N';
        static constexpr char INFINITUM_TAG = 'I';
        static constexpr char CHAR_TAG = 'c';

        // Type definitions
        using Int32 = int32_t;
        using Int64 = int64_t;
        using Float = float;
        using Double = double;
        using String = std::string;
        using Bool = bool;
        using Nil = std::monostate;

        // Variant definition for all supported OSC types
        using Variant = std::variant<Nil,     // N, I
                                     Bool,    // T, F
                                     Int32,   // i, c
                                     Int64,   // h
                                     Float,   // f
                                     Double,  // d
                                     String,  // s, S
                                     Blob     // b
                                     >;

        // Default constructor (creates Nil value)
        Value() : value_(Nil{}) {}

        // Constructors for specific types
        explicit Value(Int32 value) : value_(value) {}
        explicit Value(Int64 value) : value_(value) {}
        explicit Value(Float value) : value_(value) {}
        explicit Value(Double value) : value_(value) {}
        explicit Value(const char *value) : value_(String(value)) {}
        explicit Value(String value) : value_(std::move(value)) {}
        explicit Value(Blob value) : value_(std::move(value)) {}
        explicit Value(Bool value) : value_(value) {}

        static Value nil() { return Value(); }

        // Type checking
        bool isInt32() const { return std::holds_alternative<Int32>(value_); }
        bool isInt64() const { return std::holds_alternative<Int64>(value_); }
        bool isFloat() const { return std::holds_alternative<Float>(value_); }
        bool isDouble() const { return std::holds_alternative<Double>(value_); }
        bool isString() const { return std::holds_alternative<String>(value_); }
        bool isBlob() const { return std::holds_alternative<Blob>(value_); }
        bool isBool() const { return std::holds_alternative<Bool>(value_); }
        bool isNil() const { return std::holds_alternative<Nil>(value_); }

        // Value accessors (throw ValidationError on type mismatch)
        Int32 asInt32() const;
        Int64 asInt64() const;
        Float asFloat() const;
        Double asDouble() const;
        const String &asString() const;
        const Blob &asBlob() const;
        Bool asBool() const;

        /**
         * @brief Numeric value widened to double, nullopt for non-numeric values
         */
        std::optional<double> toDouble() const;

        /**
         * @brief Numeric value as an integer
         *
         * Floating point values are accepted only when they hold an integral
         * number; nullopt otherwise.
         */
        std::optional<int64_t> toInteger() const;

        // Get the type tag for this value
        char typeTag() const;

        // Get the raw variant
        const Variant &variant() const { return value_; }

        /**
         * @brief Short printable form for logs (e.g. "f:-6.0", "s:\"Vocals\"")
         */
        std::string toString() const;

        bool operator==(const Value &other) const { return value_ == other.value_; }
        bool operator!=(const Value &other) const { return !(*this == other); }

       private:
        Variant value_;
    };

    /**
     * @brief Type tag string for an argument list, without the leading comma
     */
    std::string typeTagsOf(const std::vector<Value> &args);

}  // namespace ArdourOsc
