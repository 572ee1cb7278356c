#include "oscwire/Message.h"

#include <algorithm>
#include <optional>
#include <string>

#include "StringCodec.h"
#include "oscwire/Endian.h"
#include "oscwire/Exceptions.h"

namespace oscwire {

    using ErrorCode = OSCException::ErrorCode;

    namespace {
        // OSC addresses must start with '/'; ',' and NUL would break decoding
        void validatePath(const std::string &path) {
            if (path.empty() || path[0] != '/') {
                throw AddressException("Invalid OSC address '" + path +
                                       "' (must start with '/')");
            }
            if (path.find(',') != std::string::npos || path.find('\0') != std::string::npos) {
                throw AddressException("OSC address cannot contain ',' or null bytes");
            }
        }
    }  // namespace

    // Constructor for Message class with address path validation
    Message::Message(const std::string &path) : path_(path) { validatePath(path_); }

    Message::Message(const std::string &path, std::vector<Value> arguments)
        : path_(path), arguments_(std::move(arguments)) {
        validatePath(path_);
    }

    const std::string &Message::getPath() const { return path_; }

    const std::vector<Value> &Message::getArguments() const { return arguments_; }

    size_t Message::getArgumentCount() const { return arguments_.size(); }

    const Value &Message::getArgument(size_t index) const {
        if (index >= arguments_.size()) {
            throw InvalidArgumentException("Argument index " + std::to_string(index) +
                                           " out of range (message has " +
                                           std::to_string(arguments_.size()) + " arguments)");
        }
        return arguments_[index];
    }

    std::string Message::getTypeTags() const {
        std::string tags = ",";
        for (const auto &arg : arguments_) {
            arg.appendTypeTags(tags);
        }
        return tags;
    }

    // Add an Int32 argument (type tag 'i')
    Message &Message::addInt32(int32_t value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add an Int64 argument (type tag 'h')
    Message &Message::addInt64(int64_t value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a Float argument (type tag 'f')
    Message &Message::addFloat(float value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a Double argument (type tag 'd')
    Message &Message::addDouble(double value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a String argument (type tag 's')
    Message &Message::addString(const std::string &value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a Symbol argument (type tag 'S')
    Message &Message::addSymbol(const std::string &value) {
        arguments_.push_back(Value::symbol(value));
        return *this;
    }

    // Add a Blob argument from raw data (type tag 'b')
    Message &Message::addBlob(const void *data, size_t size) {
        arguments_.emplace_back(Blob(data, size));
        return *this;
    }

    // Add a TimeTag argument (type tag 't')
    Message &Message::addTimeTag(const TimeTag &timeTag) {
        arguments_.emplace_back(timeTag);
        return *this;
    }

    // Add a Character argument (type tag 'c')
    Message &Message::addChar(char value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a RGBA Color argument (type tag 'r')
    Message &Message::addColor(uint32_t value) {
        arguments_.emplace_back(RGBAColor(static_cast<uint8_t>((value >> 24) & 0xFF),
                                          static_cast<uint8_t>((value >> 16) & 0xFF),
                                          static_cast<uint8_t>((value >> 8) & 0xFF),
                                          static_cast<uint8_t>(value & 0xFF)));
        return *this;
    }

    // Add a MIDI message argument (type tag 'm')
    Message &Message::addMidi(uint8_t port, uint8_t status, uint8_t data1, uint8_t data2) {
        arguments_.emplace_back(MIDIMessage(port, status, data1, data2));
        return *this;
    }

    Message &Message::addTrue() {
        arguments_.push_back(Value::trueBool());
        return *this;
    }

    Message &Message::addFalse() {
        arguments_.push_back(Value::falseBool());
        return *this;
    }

    Message &Message::addBool(bool value) { return value ? addTrue() : addFalse(); }

    Message &Message::addNil() {
        arguments_.push_back(Value::nil());
        return *this;
    }

    Message &Message::addInfinitum() {
        arguments_.push_back(Value::infinitum());
        return *this;
    }

    // Add an Array of arguments (type tags '[ ... ]')
    Message &Message::addArray(std::vector<Value> array) {
        for (const auto &element : array) {
            if (element.isArray()) {
                throw InvalidArgumentException("Arrays cannot contain arrays",
                                               ErrorCode::NestedArraysUnsupported);
            }
        }
        arguments_.emplace_back(std::move(array));
        return *this;
    }

    Message &Message::addValue(const Value &value) {
        arguments_.push_back(value);
        return *this;
    }

    // Serialize the message to OSC format
    std::vector<std::byte> Message::serialize(const CodecOptions &options) const {
        // Reject invalid arguments before any byte is written
        for (const auto &arg : arguments_) {
            arg.validate(options);
        }
        const std::string typeTags = getTypeTags();

        std::vector<std::byte> result;
        result.reserve(endian::padSize(path_.size()) + endian::stringPadSize(typeTags.size()) +
                       arguments_.size() * 8);

        // 1. Address, padded to a 4-byte boundary; the comma marks its end
        const std::byte *pathBytes = reinterpret_cast<const std::byte *>(path_.data());
        result.insert(result.end(), pathBytes, pathBytes + path_.size());
        endian::padBuffer(result);

        // 2. Type tag string (starts with ',', null-terminated, padded)
        detail::writePaddedString(result, typeTags);

        // 3. Argument data, array elements inline
        for (const auto &arg : arguments_) {
            arg.serialize(result);
        }

        if (options.maxPacketSize != 0 && result.size() > options.maxPacketSize) {
            throw MessageSizeException("Message of " + std::to_string(result.size()) +
                                       " bytes exceeds the limit of " +
                                       std::to_string(options.maxPacketSize));
        }

        return result;
    }

    // Deserialize a message from binary data
    Message Message::deserialize(const std::byte *data, size_t size, const CodecOptions &options) {
        // 1. Address: everything before the first ',' with nulls removed
        const std::byte *comma = std::find(data, data + size, std::byte{','});
        if (comma == data + size) {
            throw MalformedPacketException("No ',' found before the end of the message",
                                           ErrorCode::MissingTypeTagComma);
        }

        const size_t commaPos = static_cast<size_t>(comma - data);
        if (commaPos % 4 != 0) {
            throw MalformedPacketException(
                "Misaligned OSC message: address is not padded to a 4-byte boundary",
                ErrorCode::MisalignedAddress);
        }

        std::string path =
            detail::stripNulls(std::string(reinterpret_cast<const char *>(data), commaPos));

        // 2. Type tag string; the stride scan leaves pos 4-byte aligned
        size_t pos = commaPos;
        std::string typeTags = detail::readPaddedString(data, size, pos, "type-tag string");
        typeTags.resize(typeTags.find('\0'));

        // 3. Arguments, with at most one open array at a time
        std::vector<Value> arguments;
        std::optional<Value::Array> openArray;

        for (size_t i = 1; i < typeTags.size(); ++i) {
            const char tag = typeTags[i];

            if (tag == Value::ARRAY_BEGIN_TAG) {
                if (openArray) {
                    throw MalformedPacketException("Nested arrays are not supported",
                                                   ErrorCode::NestedArraysUnsupported);
                }
                openArray.emplace();
                continue;
            }

            if (tag == Value::ARRAY_END_TAG) {
                if (!openArray) {
                    throw MalformedPacketException("']' without a matching '['",
                                                   ErrorCode::UnbalancedArray);
                }
                arguments.emplace_back(std::move(*openArray));
                openArray.reset();
                continue;
            }

            Value value = Value::deserialize(data, size, pos, tag, options);
            if (openArray) {
                openArray->push_back(std::move(value));
            } else {
                arguments.push_back(std::move(value));
            }
            pos = endian::padSize(pos);
        }

        if (openArray) {
            throw MalformedPacketException("'[' without a matching ']'",
                                           ErrorCode::UnbalancedArray);
        }

        return Message(path, std::move(arguments));
    }

    bool Message::operator==(const Message &other) const {
        return path_ == other.path_ && arguments_ == other.arguments_;
    }

    bool Message::operator!=(const Message &other) const { return !(*this == other); }

}  // namespace oscwire
