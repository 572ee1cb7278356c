/*
 *  OSCWire - Open Sound Control wire codec.
 *  A decoded OSC packet: either a Message or a Bundle.
 */

#pragma once

#include <cstddef>
#include <variant>
#include <vector>

#include "oscwire/Bundle.h"
#include "oscwire/Message.h"
#include "oscwire/Options.h"

namespace oscwire {

    /**
     * @brief Tagged result of decoding one OSC packet
     *
     * deserialize() is the entry point for raw packets: it looks at the first
     * byte and hands the buffer to the bundle or message decoder.
     */
    class Packet {
       public:
        using Variant = std::variant<Message, Bundle>;

        Packet(Message message);
        Packet(Bundle bundle);

        bool isMessage() const;
        bool isBundle() const;

        /**
         * @brief Get the message
         * @throws TypeMismatchException if the packet is a bundle
         */
        const Message &asMessage() const;

        /**
         * @brief Get the bundle
         * @throws TypeMismatchException if the packet is a message
         */
        const Bundle &asBundle() const;

        const Variant &variant() const;

        std::vector<std::byte> serialize(const CodecOptions &options = CodecOptions()) const;

        /**
         * @brief Decode a raw OSC packet
         *
         * A buffer starting with '#' is decoded as a bundle, anything else as a
         * message.
         *
         * @param data Pointer to the packet bytes
         * @param size Size of the packet in bytes
         * @param options Decoder limits
         * @throws OSCException (MalformedPacket) for an empty buffer, or any
         *         error raised by the message and bundle decoders
         */
        static Packet deserialize(const std::byte *data, size_t size,
                                  const CodecOptions &options = CodecOptions());

        static Packet deserialize(const std::vector<std::byte> &buffer,
                                  const CodecOptions &options = CodecOptions());

        bool operator==(const Packet &other) const;
        bool operator!=(const Packet &other) const;

       private:
        Variant value_;
    };

}  // namespace oscwire
