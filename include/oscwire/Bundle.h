/*
 *  OSCWire - Open Sound Control wire codec.
 *  This header file declares the Bundle class: a time tag plus an ordered
 *  list of messages.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "oscwire/Message.h"
#include "oscwire/Options.h"
#include "oscwire/Types.h"

namespace oscwire {

    /**
     * @brief The Bundle class represents an OSC bundle, a collection of OSC messages
     * that should be executed atomically and potentially at a specific time.
     *
     * Bundle elements are always messages; bundles nested in bundles are not
     * supported by this codec.
     */
    class Bundle {
       public:
        /// The 8-byte bundle header, "#bundle" plus its null terminator
        static constexpr char BUNDLE_HEADER[] = "#bundle";
        static constexpr size_t BUNDLE_HEADER_SIZE = 8;

        /**
         * @brief Construct a new Bundle object with the specified time tag
         * @param timeTag The time at which this bundle should be executed (default: immediate)
         */
        explicit Bundle(const TimeTag &timeTag = TimeTag::immediate());

        Bundle(const TimeTag &timeTag, std::vector<Message> messages);

        /**
         * @brief Add a message to this bundle
         * @param message The OSC message to add
         * @return Reference to this bundle for method chaining
         */
        Bundle &addMessage(const Message &message);

        TimeTag getTimeTag() const;

        /**
         * @brief Get the messages in this bundle, in wire order
         */
        const std::vector<Message> &messages() const;

        size_t size() const;
        bool isEmpty() const;

        /**
         * @brief Serialize the bundle to the OSC binary format
         * @param options Limits shared with the decoder
         * @return Vector of bytes representing the serialized bundle
         * @throws OSCException if any message cannot be encoded
         * @throws MessageSizeException if an element does not fit its 32-bit
         *         size prefix or the bundle exceeds options.maxPacketSize
         */
        std::vector<std::byte> serialize(const CodecOptions &options = CodecOptions()) const;

        /**
         * @brief Deserialize a bundle from OSC binary format
         * @param data Pointer to the binary data
         * @param size Size of the binary data in bytes
         * @param options Decoder limits
         * @return The deserialized Bundle object
         * @throws OSCException if the data is invalid
         */
        static Bundle deserialize(const std::byte *data, size_t size,
                                  const CodecOptions &options = CodecOptions());

        /**
         * @brief Execute a function for each message in the bundle
         * @param callback The function to call for each message
         */
        void forEach(const std::function<void(const Message &)> &callback) const;

        bool operator==(const Bundle &other) const;
        bool operator!=(const Bundle &other) const;

       private:
        TimeTag timeTag_;
        std::vector<Message> messages_;
    };

}  // namespace oscwire
