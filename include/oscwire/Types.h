/*
 *  OSCWire - Open Sound Control wire codec.
 *  This header file defines the value types carried in OSC messages.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "oscwire/Exceptions.h"
#include "oscwire/Options.h"

namespace oscwire {

    /**
     * @brief Class representing an OSC Time Tag
     *
     * OSC Time Tags are 64-bit fixed-point numbers representing
     * time in NTP format (seconds since Jan 1, 1900).
     */
    class TimeTag {
       public:
        /**
         * @brief Default constructor (creates an immediate time tag)
         */
        TimeTag();

        /**
         * @brief Construct from NTP format (64-bit)
         * @param ntp NTP timestamp
         */
        explicit TimeTag(uint64_t ntp);

        /**
         * @brief Construct from seconds and fraction
         * @param seconds Seconds since Jan 1, 1900
         * @param fraction Fractional seconds (0-0xFFFFFFFF)
         */
        TimeTag(uint32_t seconds, uint32_t fraction);

        /**
         * @brief Construct from std::chrono::system_clock::time_point
         * @param tp Time point
         */
        explicit TimeTag(std::chrono::system_clock::time_point tp);

        /**
         * @brief Get current time as TimeTag
         */
        static TimeTag now();

        /**
         * @brief Get immediate execution time tag (seconds 0, fraction 1)
         */
        static TimeTag immediate();

        /**
         * @brief Convert to NTP format
         * @return 64-bit NTP timestamp
         */
        uint64_t toNTP() const;

        /**
         * @brief Convert to std::chrono::system_clock::time_point
         */
        std::chrono::system_clock::time_point toTimePoint() const;

        uint32_t seconds() const;
        uint32_t fraction() const;

        /**
         * @brief Check if this is an immediate time tag
         */
        bool isImmediate() const;

        // Comparison operators
        bool operator==(const TimeTag &other) const;
        bool operator!=(const TimeTag &other) const;
        bool operator<(const TimeTag &other) const;
        bool operator>(const TimeTag &other) const;
        bool operator<=(const TimeTag &other) const;
        bool operator>=(const TimeTag &other) const;

       private:
        uint32_t seconds_;   ///< Seconds since Jan 1, 1900
        uint32_t fraction_;  ///< Fractional seconds (0-0xFFFFFFFF)
    };

    /**
     * @brief Class representing an OSC Blob
     *
     * OSC Blobs are binary data with a specified size.
     */
    class Blob {
       public:
        Blob() = default;

        /**
         * @brief Construct from data
         * @param data Binary data
         */
        explicit Blob(std::vector<std::byte> data);

        /**
         * @brief Construct from raw data
         * @param data Pointer to data
         * @param size Size of data in bytes
         */
        Blob(const void *data, size_t size);

        const std::vector<std::byte> &data() const;
        size_t size() const;
        const std::byte *bytes() const;

        bool operator==(const Blob &other) const { return data_ == other.data_; }
        bool operator!=(const Blob &other) const { return !(*this == other); }

       private:
        std::vector<std::byte> data_;
    };

    /**
     * @brief Structure for MIDI message (OSC type 'm')
     */
    struct MIDIMessage {
        uint8_t port;
        uint8_t status;
        uint8_t data1;
        uint8_t data2;

        MIDIMessage() : port(0), status(0), data1(0), data2(0) {}
        MIDIMessage(uint8_t p, uint8_t s, uint8_t d1, uint8_t d2)
            : port(p), status(s), data1(d1), data2(d2) {}

        bool operator==(const MIDIMessage &other) const {
            return port == other.port && status == other.status && data1 == other.data1 &&
                   data2 == other.data2;
        }
        bool operator!=(const MIDIMessage &other) const { return !(*this == other); }
    };

    /**
     * @brief Structure for RGBA color (OSC type 'r')
     */
    struct RGBAColor {
        uint8_t r, g, b, a;

        RGBAColor() : r(0), g(0), b(0), a(0) {}
        RGBAColor(uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha)
            : r(red), g(green), b(blue), a(alpha) {}

        bool operator==(const RGBAColor &other) const {
            return r == other.r && g == other.g && b == other.b && a == other.a;
        }
        bool operator!=(const RGBAColor &other) const { return !(*this == other); }
    };

    /**
     * @brief OSC symbol (type 'S'): string payload, distinct from 's'
     */
    struct Symbol {
        std::string value;

        Symbol() = default;
        explicit Symbol(std::string v) : value(std::move(v)) {}

        bool operator==(const Symbol &other) const { return value == other.value; }
        bool operator!=(const Symbol &other) const { return !(*this == other); }
    };

    /// OSC nil (type 'N')
    struct Nil {
        bool operator==(const Nil &) const { return true; }
        bool operator!=(const Nil &) const { return false; }
    };

    /// OSC infinitum (type 'I')
    struct Infinitum {
        bool operator==(const Infinitum &) const { return true; }
        bool operator!=(const Infinitum &) const { return false; }
    };

    /**
     * @brief Class representing an OSC value
     *
     * OSC values can be of various types, represented here as a variant. An
     * Array holds a run of values written between '[' and ']' in the type-tag
     * string; arrays never contain arrays.
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
        static constexpr char TIMETAG_TAG = 't';
        static constexpr char CHAR_TAG = 'c';
        static constexpr char RGBA_TAG = 'r';
        static constexpr char MIDI_TAG = 'm';
        static constexpr char ARRAY_BEGIN_TAG = '[';
        static constexpr char ARRAY_END_TAG = ']';

        // Type definitions
        using Int32 = int32_t;
        using Int64 = int64_t;
        using Float = float;
        using Double = double;
        using String = std::string;
        using Bool = bool;
        using Char = char;
        using Array = std::vector<Value>;

        // One alternative per wire type
        using Variant = std::variant<Int32,        // i
                                     Float,        // f
                                     String,       // s
                                     Blob,         // b
                                     Int64,        // h
                                     TimeTag,      // t
                                     Double,       // d
                                     Symbol,       // S
                                     Char,         // c
                                     RGBAColor,    // r
                                     MIDIMessage,  // m
                                     Bool,         // T, F
                                     Nil,          // N
                                     Infinitum,    // I
                                     Array         // [ ... ]
                                     >;

        // Default constructor (creates Nil value)
        Value() : value_(Nil{}) {}

        explicit Value(Variant value) : value_(std::move(value)) {}

        // Constructors for specific types
        explicit Value(Int32 value);
        explicit Value(Int64 value);
        explicit Value(Float value);
        explicit Value(Double value);
        explicit Value(const char *value);
        explicit Value(String value);
        explicit Value(Symbol value);
        explicit Value(Blob value);
        explicit Value(TimeTag value);
        explicit Value(Char value);
        explicit Value(RGBAColor value);
        explicit Value(MIDIMessage value);
        explicit Value(Bool value);
        explicit Value(Nil value);
        explicit Value(Infinitum value);
        explicit Value(Array values);

        // Static methods for special values
        static Value nil();
        static Value infinitum();
        static Value trueBool();
        static Value falseBool();
        static Value symbol(std::string value);

        // Type checking
        bool isInt32() const;
        bool isInt64() const;
        bool isFloat() const;
        bool isDouble() const;
        bool isString() const;
        bool isSymbol() const;
        bool isBlob() const;
        bool isTimeTag() const;
        bool isChar() const;
        bool isRGBA() const;
        bool isMIDI() const;
        bool isBool() const;
        bool isTrue() const;
        bool isFalse() const;
        bool isNil() const;
        bool isInfinitum() const;
        bool isArray() const;

        // Value accessors (with type checking)
        Int32 asInt32() const;
        Int64 asInt64() const;
        Float asFloat() const;
        Double asDouble() const;
        const String &asString() const;
        const String &asSymbol() const;
        const Blob &asBlob() const;
        TimeTag asTimeTag() const;
        Char asChar() const;
        RGBAColor asRGBA() const;
        MIDIMessage asMIDI() const;
        Bool asBool() const;
        const Array &asArray() const;

        /**
         * @brief Get the type tag for this value
         *
         * Arrays report ARRAY_BEGIN_TAG; use appendTypeTags() for the full run.
         */
        char typeTag() const;

        /**
         * @brief Append this value's type tags, including '[' ... ']' for arrays
         */
        void appendTypeTags(std::string &tags) const;

        // Get the raw variant
        const Variant &variant() const;

        /**
         * @brief Check that this value can be encoded
         * @param options Limits shared with the decoder (maxBlobSize)
         * @param insideArray True when the value is an element of an Array
         * @throws InvalidArgumentException for nested arrays, strings with
         *         embedded nulls and blobs too large for a 32-bit length
         * @throws MessageSizeException for blobs over options.maxBlobSize
         */
        void validate(const CodecOptions &options = CodecOptions(),
                      bool insideArray = false) const;

        /**
         * @brief Append the wire encoding of this value (array elements inline)
         *
         * Call validate() first; serialize() assumes a valid value.
         */
        void serialize(std::vector<std::byte> &buffer) const;

        /**
         * @brief Decode one value of the given type at pos
         *
         * @param data Start of the enclosing message
         * @param size Size of the enclosing message
         * @param pos Read cursor, advanced by the consumed width (not re-aligned)
         * @param typeTag Type tag character
         * @param options Decoder limits
         * @throws OSCException on unknown tags and truncated or malformed data
         */
        static Value deserialize(const std::byte *data, size_t size, size_t &pos, char typeTag,
                                 const CodecOptions &options = CodecOptions());

        bool operator==(const Value &other) const;
        bool operator!=(const Value &other) const;

       private:
        Variant value_;
    };

}  // namespace oscwire
