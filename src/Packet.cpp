#include "oscwire/Packet.h"

#include "oscwire/Exceptions.h"
#include "oscwire/Logging.h"

namespace oscwire {

    Packet::Packet(Message message) : value_(std::move(message)) {}

    Packet::Packet(Bundle bundle) : value_(std::move(bundle)) {}

    bool Packet::isMessage() const { return std::holds_alternative<Message>(value_); }

    bool Packet::isBundle() const { return std::holds_alternative<Bundle>(value_); }

    const Message &Packet::asMessage() const {
        if (!isMessage()) throw TypeMismatchException("Packet is not a Message");
        return std::get<Message>(value_);
    }

    const Bundle &Packet::asBundle() const {
        if (!isBundle()) throw TypeMismatchException("Packet is not a Bundle");
        return std::get<Bundle>(value_);
    }

    const Packet::Variant &Packet::variant() const { return value_; }

    std::vector<std::byte> Packet::serialize(const CodecOptions &options) const {
        if (isBundle()) {
            return std::get<Bundle>(value_).serialize(options);
        }
        return std::get<Message>(value_).serialize(options);
    }

    Packet Packet::deserialize(const std::byte *data, size_t size, const CodecOptions &options) {
        try {
            if (size == 0) {
                throw MalformedPacketException("Empty OSC packet");
            }
            if (options.maxPacketSize != 0 && size > options.maxPacketSize) {
                throw MessageSizeException("Packet of " + std::to_string(size) +
                                           " bytes exceeds the limit of " +
                                           std::to_string(options.maxPacketSize));
            }

            if (data[0] == std::byte{'#'}) {
                return Packet(Bundle::deserialize(data, size, options));
            }
            return Packet(Message::deserialize(data, size, options));
        } catch (const OSCException &e) {
            OSCWIRE_LOG_DEBUG("Rejected %zu-byte packet (%s): %s", size,
                              OSCException::getErrorDescription(e.code()).c_str(), e.what());
            throw;
        }
    }

    Packet Packet::deserialize(const std::vector<std::byte> &buffer, const CodecOptions &options) {
        return deserialize(buffer.data(), buffer.size(), options);
    }

    bool Packet::operator==(const Packet &other) const { return value_ == other.value_; }

    bool Packet::operator!=(const Packet &other) const { return !(*this == other); }

}  // namespace oscwire
