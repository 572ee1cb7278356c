/*
 *  OSCWire - Open Sound Control wire codec.
 *  Big-endian primitive encoding and 4-byte alignment helpers shared by the
 *  argument, message and bundle codecs.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace oscwire {
    namespace endian {

        /// Round up to the next multiple of 4 (ceil(size / 4) * 4)
        inline size_t padSize(size_t size) { return (size + 3) & ~static_cast<size_t>(3); }

        /**
         * @brief Padded size of a null-terminated OSC string
         *
         * Always leaves room for at least one null byte, so a string whose
         * length is already a multiple of 4 gets four zero bytes.
         */
        inline size_t stringPadSize(size_t length) { return (length / 4 + 1) * 4; }

        /// Append zero bytes until the buffer size is a multiple of 4
        void padBuffer(std::vector<std::byte> &buffer);

        // Writers append most-significant byte first
        void writeUInt32(std::vector<std::byte> &buffer, uint32_t value);
        void writeUInt64(std::vector<std::byte> &buffer, uint64_t value);
        void writeInt32(std::vector<std::byte> &buffer, int32_t value);
        void writeInt64(std::vector<std::byte> &buffer, int64_t value);
        void writeFloat32(std::vector<std::byte> &buffer, float value);
        void writeFloat64(std::vector<std::byte> &buffer, double value);

        // Readers expect at least 4 (or 8) readable bytes at data
        uint32_t readUInt32(const std::byte *data);
        uint64_t readUInt64(const std::byte *data);
        int32_t readInt32(const std::byte *data);
        int64_t readInt64(const std::byte *data);
        float readFloat32(const std::byte *data);
        double readFloat64(const std::byte *data);

    }  // namespace endian
}  // namespace oscwire
