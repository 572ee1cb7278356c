/*
 * This file contains the implementation of the Value class: typed access to
 * OSC arguments and the per-type-tag wire encoding.
 */

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include "StringCodec.h"
#include "oscwire/Endian.h"
#include "oscwire/Exceptions.h"
#include "oscwire/Types.h"

namespace oscwire {

    using ErrorCode = OSCException::ErrorCode;

    // Blob implementation
    Blob::Blob(std::vector<std::byte> data) : data_(std::move(data)) {}

    Blob::Blob(const void *data, size_t size)
        : data_(static_cast<const std::byte *>(data), static_cast<const std::byte *>(data) + size) {}

    const std::vector<std::byte> &Blob::data() const { return data_; }

    size_t Blob::size() const { return data_.size(); }

    const std::byte *Blob::bytes() const { return data_.data(); }

    namespace {

        struct TypeTagVisitor {
            char operator()(Value::Int32) const { return Value::INT32_TAG; }
            char operator()(Value::Float) const { return Value::FLOAT_TAG; }
            char operator()(const Value::String &) const { return Value::STRING_TAG; }
            char operator()(const Blob &) const { return Value::BLOB_TAG; }
            char operator()(Value::Int64) const { return Value::INT64_TAG; }
            char operator()(const TimeTag &) const { return Value::TIMETAG_TAG; }
            char operator()(Value::Double) const { return Value::DOUBLE_TAG; }
            char operator()(const Symbol &) const { return Value::SYMBOL_TAG; }
            char operator()(Value::Char) const { return Value::CHAR_TAG; }
            char operator()(const RGBAColor &) const { return Value::RGBA_TAG; }
            char operator()(const MIDIMessage &) const { return Value::MIDI_TAG; }
            char operator()(Value::Bool value) const {
                return value ? Value::TRUE_TAG : Value::FALSE_TAG;
            }
            char operator()(const Nil &) const { return Value::NIL_TAG; }
            char operator()(const Infinitum &) const { return Value::INFINITUM_TAG; }
            char operator()(const Value::Array &) const { return Value::ARRAY_BEGIN_TAG; }
        };

        struct EncodeVisitor {
            std::vector<std::byte> &buffer;

            void operator()(Value::Int32 value) const { endian::writeInt32(buffer, value); }
            void operator()(Value::Float value) const { endian::writeFloat32(buffer, value); }
            void operator()(const Value::String &value) const {
                detail::writePaddedString(buffer, value);
            }
            void operator()(const Blob &blob) const {
                endian::writeInt32(buffer, static_cast<int32_t>(blob.size()));
                buffer.insert(buffer.end(), blob.bytes(), blob.bytes() + blob.size());
                // Prefix is 4 bytes, so padding the payload pads the whole field
                buffer.resize(buffer.size() + endian::padSize(blob.size()) - blob.size(),
                              std::byte{0});
            }
            void operator()(Value::Int64 value) const { endian::writeInt64(buffer, value); }
            void operator()(const TimeTag &tag) const { endian::writeUInt64(buffer, tag.toNTP()); }
            void operator()(Value::Double value) const { endian::writeFloat64(buffer, value); }
            void operator()(const Symbol &symbol) const {
                detail::writePaddedString(buffer, symbol.value);
            }
            void operator()(Value::Char value) const {
                buffer.insert(buffer.end(), 3, std::byte{0});
                buffer.push_back(static_cast<std::byte>(value));
            }
            void operator()(const RGBAColor &color) const {
                buffer.push_back(std::byte{color.r});
                buffer.push_back(std::byte{color.g});
                buffer.push_back(std::byte{color.b});
                buffer.push_back(std::byte{color.a});
            }
            void operator()(const MIDIMessage &midi) const {
                buffer.push_back(std::byte{midi.port});
                buffer.push_back(std::byte{midi.status});
                buffer.push_back(std::byte{midi.data1});
                buffer.push_back(std::byte{midi.data2});
            }
            // T, F, N and I live in the type-tag string only
            void operator()(Value::Bool) const {}
            void operator()(const Nil &) const {}
            void operator()(const Infinitum &) const {}
            void operator()(const Value::Array &values) const {
                for (const auto &value : values) {
                    value.serialize(buffer);
                }
            }
        };

        void requireBytes(size_t size, size_t pos, size_t width, const char *what) {
            if (pos > size || size - pos < width) {
                throw MalformedPacketException(std::string("Not enough data for ") + what,
                                               ErrorCode::TruncatedArgument);
            }
        }

    }  // namespace

    // Constructors for specific types
    Value::Value(Int32 value) : value_(std::in_place_type<Int32>, value) {}

    Value::Value(Int64 value) : value_(std::in_place_type<Int64>, value) {}

    Value::Value(Float value) : value_(std::in_place_type<Float>, value) {}

    Value::Value(Double value) : value_(std::in_place_type<Double>, value) {}

    Value::Value(const char *value) : value_(std::in_place_type<String>, value) {}

    Value::Value(String value) : value_(std::in_place_type<String>, std::move(value)) {}

    Value::Value(Symbol value) : value_(std::in_place_type<Symbol>, std::move(value)) {}

    Value::Value(Blob value) : value_(std::in_place_type<Blob>, std::move(value)) {}

    Value::Value(TimeTag value) : value_(std::in_place_type<TimeTag>, value) {}

    Value::Value(Char value) : value_(std::in_place_type<Char>, value) {}

    Value::Value(RGBAColor value) : value_(std::in_place_type<RGBAColor>, value) {}

    Value::Value(MIDIMessage value) : value_(std::in_place_type<MIDIMessage>, value) {}

    Value::Value(Bool value) : value_(std::in_place_type<Bool>, value) {}

    Value::Value(Nil value) : value_(std::in_place_type<Nil>, value) {}

    Value::Value(Infinitum value) : value_(std::in_place_type<Infinitum>, value) {}

    Value::Value(Array values) : value_(std::in_place_type<Array>, std::move(values)) {}

    // Static methods for special values
    Value Value::nil() { return Value(Nil{}); }

    Value Value::infinitum() { return Value(Infinitum{}); }

    Value Value::trueBool() { return Value(true); }

    Value Value::falseBool() { return Value(false); }

    Value Value::symbol(std::string value) { return Value(Symbol(std::move(value))); }

    // Type checking methods
    bool Value::isInt32() const { return std::holds_alternative<Int32>(value_); }
    bool Value::isInt64() const { return std::holds_alternative<Int64>(value_); }
    bool Value::isFloat() const { return std::holds_alternative<Float>(value_); }
    bool Value::isDouble() const { return std::holds_alternative<Double>(value_); }
    bool Value::isString() const { return std::holds_alternative<String>(value_); }
    bool Value::isSymbol() const { return std::holds_alternative<Symbol>(value_); }
    bool Value::isBlob() const { return std::holds_alternative<Blob>(value_); }
    bool Value::isTimeTag() const { return std::holds_alternative<TimeTag>(value_); }
    bool Value::isChar() const { return std::holds_alternative<Char>(value_); }
    bool Value::isRGBA() const { return std::holds_alternative<RGBAColor>(value_); }
    bool Value::isMIDI() const { return std::holds_alternative<MIDIMessage>(value_); }
    bool Value::isBool() const { return std::holds_alternative<Bool>(value_); }
    bool Value::isTrue() const { return isBool() && std::get<Bool>(value_); }
    bool Value::isFalse() const { return isBool() && !std::get<Bool>(value_); }
    bool Value::isNil() const { return std::holds_alternative<Nil>(value_); }
    bool Value::isInfinitum() const { return std::holds_alternative<Infinitum>(value_); }
    bool Value::isArray() const { return std::holds_alternative<Array>(value_); }

    // Value accessors
    Value::Int32 Value::asInt32() const {
        if (!isInt32()) throw TypeMismatchException("Value is not an Int32");
        return std::get<Int32>(value_);
    }

    Value::Int64 Value::asInt64() const {
        if (!isInt64()) throw TypeMismatchException("Value is not an Int64");
        return std::get<Int64>(value_);
    }

    Value::Float Value::asFloat() const {
        if (!isFloat()) throw TypeMismatchException("Value is not a Float");
        return std::get<Float>(value_);
    }

    Value::Double Value::asDouble() const {
        if (!isDouble()) throw TypeMismatchException("Value is not a Double");
        return std::get<Double>(value_);
    }

    const Value::String &Value::asString() const {
        if (!isString()) throw TypeMismatchException("Value is not a String");
        return std::get<String>(value_);
    }

    const Value::String &Value::asSymbol() const {
        if (!isSymbol()) throw TypeMismatchException("Value is not a Symbol");
        return std::get<Symbol>(value_).value;
    }

    const Blob &Value::asBlob() const {
        if (!isBlob()) throw TypeMismatchException("Value is not a Blob");
        return std::get<Blob>(value_);
    }

    TimeTag Value::asTimeTag() const {
        if (!isTimeTag()) throw TypeMismatchException("Value is not a TimeTag");
        return std::get<TimeTag>(value_);
    }

    Value::Char Value::asChar() const {
        if (!isChar()) throw TypeMismatchException("Value is not a Char");
        return std::get<Char>(value_);
    }

    RGBAColor Value::asRGBA() const {
        if (!isRGBA()) throw TypeMismatchException("Value is not an RGBA color");
        return std::get<RGBAColor>(value_);
    }

    MIDIMessage Value::asMIDI() const {
        if (!isMIDI()) throw TypeMismatchException("Value is not a MIDI message");
        return std::get<MIDIMessage>(value_);
    }

    Value::Bool Value::asBool() const {
        if (!isBool()) throw TypeMismatchException("Value is not a Bool");
        return std::get<Bool>(value_);
    }

    const Value::Array &Value::asArray() const {
        if (!isArray()) throw TypeMismatchException("Value is not an Array");
        return std::get<Array>(value_);
    }

    char Value::typeTag() const { return std::visit(TypeTagVisitor{}, value_); }

    void Value::appendTypeTags(std::string &tags) const {
        if (!isArray()) {
            tags += typeTag();
            return;
        }
        tags += ARRAY_BEGIN_TAG;
        for (const auto &element : asArray()) {
            element.appendTypeTags(tags);
        }
        tags += ARRAY_END_TAG;
    }

    const Value::Variant &Value::variant() const { return value_; }

    void Value::validate(const CodecOptions &options, bool insideArray) const {
        if (isArray()) {
            if (insideArray) {
                throw InvalidArgumentException("Arrays cannot contain arrays",
                                               ErrorCode::NestedArraysUnsupported);
            }
            for (const auto &element : asArray()) {
                element.validate(options, true);
            }
            return;
        }

        const String *text = nullptr;
        if (isString()) {
            text = &asString();
        } else if (isSymbol()) {
            text = &asSymbol();
        }
        if (text && text->find('\0') != String::npos) {
            throw InvalidArgumentException("String arguments cannot contain null bytes");
        }

        if (isBlob()) {
            const size_t blobSize = asBlob().size();
            if (blobSize > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
                throw InvalidArgumentException("Blob is too large for a 32-bit length prefix");
            }
            // Same limit as the decoder, so whatever is written can be read back
            if (blobSize > options.maxBlobSize) {
                throw MessageSizeException("Blob of " + std::to_string(blobSize) +
                                           " bytes exceeds the limit of " +
                                           std::to_string(options.maxBlobSize));
            }
        }
    }

    void Value::serialize(std::vector<std::byte> &buffer) const {
        std::visit(EncodeVisitor{buffer}, value_);
    }

    Value Value::deserialize(const std::byte *data, size_t size, size_t &pos, char typeTag,
                             const CodecOptions &options) {
        switch (typeTag) {
            case INT32_TAG: {
                requireBytes(size, pos, 4, "Int32");
                Value value(endian::readInt32(data + pos));
                pos += 4;
                return value;
            }
            case FLOAT_TAG: {
                requireBytes(size, pos, 4, "Float");
                Value value(endian::readFloat32(data + pos));
                pos += 4;
                return value;
            }
            case STRING_TAG:
                return Value(
                    detail::stripNulls(detail::readPaddedString(data, size, pos, "string")));
            case SYMBOL_TAG:
                return Value::symbol(
                    detail::stripNulls(detail::readPaddedString(data, size, pos, "symbol")));
            case BLOB_TAG: {
                requireBytes(size, pos, 4, "blob size");
                int32_t blobSize = endian::readInt32(data + pos);
                if (blobSize < 0) {
                    throw MalformedPacketException("Negative blob size");
                }
                if (static_cast<size_t>(blobSize) > options.maxBlobSize) {
                    throw MessageSizeException("Blob of " + std::to_string(blobSize) +
                                               " bytes exceeds the limit of " +
                                               std::to_string(options.maxBlobSize));
                }
                pos += 4;
                requireBytes(size, pos, static_cast<size_t>(blobSize), "blob");
                Value value(Blob(data + pos, static_cast<size_t>(blobSize)));
                pos += static_cast<size_t>(blobSize);
                return value;
            }
            case INT64_TAG: {
                requireBytes(size, pos, 8, "Int64");
                Value value(endian::readInt64(data + pos));
                pos += 8;
                return value;
            }
            case TIMETAG_TAG: {
                requireBytes(size, pos, 8, "timetag");
                Value value(TimeTag(endian::readUInt64(data + pos)));
                pos += 8;
                return value;
            }
            case DOUBLE_TAG: {
                requireBytes(size, pos, 8, "Double");
                Value value(endian::readFloat64(data + pos));
                pos += 8;
                return value;
            }
            case CHAR_TAG: {
                requireBytes(size, pos, 4, "char");
                Value value(static_cast<Char>(std::to_integer<uint8_t>(data[pos + 3])));
                pos += 4;
                return value;
            }
            case RGBA_TAG: {
                requireBytes(size, pos, 4, "RGBA");
                Value value(RGBAColor(std::to_integer<uint8_t>(data[pos]),
                                      std::to_integer<uint8_t>(data[pos + 1]),
                                      std::to_integer<uint8_t>(data[pos + 2]),
                                      std::to_integer<uint8_t>(data[pos + 3])));
                pos += 4;
                return value;
            }
            case MIDI_TAG: {
                requireBytes(size, pos, 4, "MIDI");
                Value value(MIDIMessage(std::to_integer<uint8_t>(data[pos]),
                                        std::to_integer<uint8_t>(data[pos + 1]),
                                        std::to_integer<uint8_t>(data[pos + 2]),
                                        std::to_integer<uint8_t>(data[pos + 3])));
                pos += 4;
                return value;
            }
            case TRUE_TAG:
                return Value::trueBool();
            case FALSE_TAG:
                return Value::falseBool();
            case NIL_TAG:
                return Value::nil();
            case INFINITUM_TAG:
                return Value::infinitum();
            default:
                throw MalformedPacketException(
                    "OSC type tag '" + std::string(1, typeTag) + "' is unknown",
                    ErrorCode::UnknownTypeTag);
        }
    }

    bool Value::operator==(const Value &other) const { return value_ == other.value_; }

    bool Value::operator!=(const Value &other) const { return !(*this == other); }

}  // namespace oscwire
