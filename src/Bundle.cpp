#include "oscwire/Bundle.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include "oscwire/Endian.h"
#include "oscwire/Exceptions.h"

namespace oscwire {

    using ErrorCode = OSCException::ErrorCode;

    namespace {
        // Largest element a signed 32-bit size prefix can frame
        constexpr size_t MAX_ELEMENT_SIZE =
            static_cast<size_t>(std::numeric_limits<int32_t>::max());

        // Rethrow with the element index, keeping the exception type callers catch by
        void rethrowInElement(const OSCException &e, size_t index) {
            const std::string message =
                "Error in bundled message " + std::to_string(index) + ": " + e.what();
            switch (e.code()) {
                case ErrorCode::AddressError:
                    throw AddressException(message);
                case ErrorCode::MessageTooLarge:
                    throw MessageSizeException(message);
                case ErrorCode::TypeMismatch:
                    throw TypeMismatchException(message);
                case ErrorCode::InvalidArgument:
                    throw InvalidArgumentException(message);
                default:
                    throw MalformedPacketException(message, e.code());
            }
        }
    }  // namespace

    // Constructor with time tag
    Bundle::Bundle(const TimeTag &timeTag) : timeTag_(timeTag) {}

    Bundle::Bundle(const TimeTag &timeTag, std::vector<Message> messages)
        : timeTag_(timeTag), messages_(std::move(messages)) {}

    // Add a message to the bundle
    Bundle &Bundle::addMessage(const Message &message) {
        messages_.push_back(message);
        return *this;
    }

    TimeTag Bundle::getTimeTag() const { return timeTag_; }

    const std::vector<Message> &Bundle::messages() const { return messages_; }

    size_t Bundle::size() const { return messages_.size(); }

    bool Bundle::isEmpty() const { return messages_.empty(); }

    // Serialize the bundle to OSC binary format
    std::vector<std::byte> Bundle::serialize(const CodecOptions &options) const {
        // The packet limit applies to the whole bundle, checked below
        CodecOptions elementOptions = options;
        elementOptions.maxPacketSize = 0;

        size_t elementLimit = MAX_ELEMENT_SIZE;
        if (options.maxPacketSize != 0) {
            elementLimit = std::min(elementLimit, options.maxPacketSize);
        }

        // Encode every element first so a failure leaves nothing behind
        std::vector<std::vector<std::byte>> elements;
        elements.reserve(messages_.size());
        for (const auto &message : messages_) {
            elements.push_back(message.serialize(elementOptions));
            if (elements.back().size() > elementLimit) {
                throw MessageSizeException("Bundle element of " +
                                           std::to_string(elements.back().size()) +
                                           " bytes exceeds the limit of " +
                                           std::to_string(elementLimit));
            }
        }

        std::vector<std::byte> result;
        result.reserve(512);

        // 1. "#bundle\0"
        const std::byte *header = reinterpret_cast<const std::byte *>(BUNDLE_HEADER);
        result.insert(result.end(), header, header + BUNDLE_HEADER_SIZE);

        // 2. Time tag (8 bytes, big-endian)
        endian::writeUInt64(result, timeTag_.toNTP());

        // 3. Bundle elements, each prefixed with its size
        for (const auto &element : elements) {
            endian::writeInt32(result, static_cast<int32_t>(element.size()));
            result.insert(result.end(), element.begin(), element.end());
            endian::padBuffer(result);
        }

        if (options.maxPacketSize != 0 && result.size() > options.maxPacketSize) {
            throw MessageSizeException("Bundle of " + std::to_string(result.size()) +
                                       " bytes exceeds the limit of " +
                                       std::to_string(options.maxPacketSize));
        }

        return result;
    }

    // Deserialize a bundle from binary data
    Bundle Bundle::deserialize(const std::byte *data, size_t size, const CodecOptions &options) {
        // 1. "#bundle\0" identifier
        if (size < BUNDLE_HEADER_SIZE ||
            std::memcmp(data, BUNDLE_HEADER, BUNDLE_HEADER_SIZE) != 0) {
            throw MalformedPacketException("Not an OSC bundle (missing #bundle identifier)",
                                           ErrorCode::NotABundle);
        }
        size_t pos = BUNDLE_HEADER_SIZE;

        // 2. Time tag
        if (size - pos < 8) {
            throw MalformedPacketException("Bundle data truncated: missing time tag",
                                           ErrorCode::TruncatedBundle);
        }
        Bundle bundle(TimeTag(endian::readUInt64(data + pos)));
        pos += 8;

        // 3. Size-prefixed elements until the buffer is exhausted
        while (pos < size) {
            if (size - pos < 4) {
                throw MalformedPacketException("Bundle data truncated: missing element size",
                                               ErrorCode::TruncatedBundle);
            }
            const int32_t elementSize = endian::readInt32(data + pos);
            pos += 4;

            if (elementSize < 0) {
                throw MalformedPacketException("Invalid bundle element size " +
                                               std::to_string(elementSize));
            }
            if (static_cast<size_t>(elementSize) > size - pos) {
                throw MalformedPacketException(
                    "Bundle element claims " + std::to_string(elementSize) + " bytes but only " +
                        std::to_string(size - pos) + " remain",
                    ErrorCode::TruncatedBundle);
            }

            try {
                bundle.messages_.push_back(
                    Message::deserialize(data + pos, static_cast<size_t>(elementSize), options));
            } catch (const OSCException &e) {
                rethrowInElement(e, bundle.messages_.size());
            }

            pos = endian::padSize(pos + static_cast<size_t>(elementSize));
        }

        return bundle;
    }

    // Execute a function for each message in the bundle
    void Bundle::forEach(const std::function<void(const Message &)> &callback) const {
        for (const auto &message : messages_) {
            callback(message);
        }
    }

    bool Bundle::operator==(const Bundle &other) const {
        return timeTag_ == other.timeTag_ && messages_ == other.messages_;
    }

    bool Bundle::operator!=(const Bundle &other) const { return !(*this == other); }

}  // namespace oscwire
