/*
 *  OSCWire - Open Sound Control wire codec.
 *  This header file declares the Message class, which represents an OSC message,
 *  including its address and arguments.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "oscwire/Options.h"
#include "oscwire/Types.h"

namespace oscwire {
    /**
     * @brief The Message class represents an OSC message.
     *
     * Arrays appear in the argument list as a single Value holding the array
     * elements.
     */
    class Message {
       public:
        /**
         * @brief Construct a new OSC Message object
         * @param path The OSC address (must start with '/')
         * @throws AddressException if the address is invalid
         */
        explicit Message(const std::string &path);

        /**
         * @brief Construct a message with its full argument list
         * @param path The OSC address (must start with '/')
         * @param arguments Arguments in wire order
         */
        Message(const std::string &path, std::vector<Value> arguments);

        /**
         * @brief Get the OSC address
         */
        const std::string &getPath() const;

        /**
         * @brief Get the arguments in this message
         */
        const std::vector<Value> &getArguments() const;

        size_t getArgumentCount() const;

        /**
         * @brief Get one argument
         * @throws InvalidArgumentException if index is out of range
         */
        const Value &getArgument(size_t index) const;

        /**
         * @brief Build the type-tag string, e.g. ",is[ff]"
         */
        std::string getTypeTags() const;

        /**
         * @brief Add an Int32 argument (type tag 'i')
         * @return Reference to this message for method chaining
         */
        Message &addInt32(int32_t value);

        /**
         * @brief Add an Int64 argument (type tag 'h')
         * @return Reference to this message for method chaining
         */
        Message &addInt64(int64_t value);

        /**
         * @brief Add a Float argument (type tag 'f')
         * @return Reference to this message for method chaining
         */
        Message &addFloat(float value);

        /**
         * @brief Add a Double argument (type tag 'd')
         * @return Reference to this message for method chaining
         */
        Message &addDouble(double value);

        /**
         * @brief Add a String argument (type tag 's')
         * @return Reference to this message for method chaining
         */
        Message &addString(const std::string &value);

        /**
         * @brief Add a Symbol argument (type tag 'S')
         * @return Reference to this message for method chaining
         */
        Message &addSymbol(const std::string &value);

        /**
         * @brief Add a Blob argument (type tag 'b')
         * @param data Pointer to the binary data
         * @param size Size of the binary data in bytes
         * @return Reference to this message for method chaining
         *
         * serialize() rejects blobs over CodecOptions::maxBlobSize (32 MiB by
         * default), the same limit the decoder applies.
         */
        Message &addBlob(const void *data, size_t size);

        /**
         * @brief Add a TimeTag argument (type tag 't')
         * @return Reference to this message for method chaining
         */
        Message &addTimeTag(const TimeTag &timeTag);

        /**
         * @brief Add a Character argument (type tag 'c')
         * @return Reference to this message for method chaining
         */
        Message &addChar(char value);

        /**
         * @brief Add a RGBA Color argument (type tag 'r')
         * @param value The color packed as 0xRRGGBBAA
         * @return Reference to this message for method chaining
         */
        Message &addColor(uint32_t value);

        /**
         * @brief Add a MIDI message argument (type tag 'm')
         * @return Reference to this message for method chaining
         */
        Message &addMidi(uint8_t port, uint8_t status, uint8_t data1, uint8_t data2);

        Message &addTrue();
        Message &addFalse();

        /**
         * @brief Add a boolean argument (type tag 'T' or 'F')
         * @return Reference to this message for method chaining
         */
        Message &addBool(bool value);

        Message &addNil();
        Message &addInfinitum();

        /**
         * @brief Add an Array of arguments (type tags '[ ... ]')
         * @param array The array elements; they must not be arrays themselves
         * @return Reference to this message for method chaining
         */
        Message &addArray(std::vector<Value> array);

        /**
         * @brief Add a generic Value argument
         * @return Reference to this message for method chaining
         */
        Message &addValue(const Value &value);

        /**
         * @brief Serialize the message to the OSC binary format
         * @param options Limits shared with the decoder (maxBlobSize, maxPacketSize)
         * @return Vector of bytes representing the serialized message
         * @throws OSCException if an argument cannot be encoded or a limit is
         *         exceeded; nothing is returned in that case
         */
        std::vector<std::byte> serialize(const CodecOptions &options = CodecOptions()) const;

        /**
         * @brief Deserialize a message from OSC binary format
         * @param data Pointer to the binary data
         * @param size Size of the binary data in bytes
         * @param options Decoder limits
         * @return The deserialized Message object
         * @throws OSCException if the data is invalid
         */
        static Message deserialize(const std::byte *data, size_t size,
                                   const CodecOptions &options = CodecOptions());

        bool operator==(const Message &other) const;
        bool operator!=(const Message &other) const;

       private:
        std::string path_;
        std::vector<Value> arguments_;
    };

}  // namespace oscwire
