#include "oscwire/Endian.h"

#include <cstring>

namespace oscwire {
    namespace endian {

        void padBuffer(std::vector<std::byte> &buffer) {
            buffer.resize(padSize(buffer.size()), std::byte{0});
        }

        void writeUInt32(std::vector<std::byte> &buffer, uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                buffer.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
            }
        }

        void writeUInt64(std::vector<std::byte> &buffer, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                buffer.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
            }
        }

        void writeInt32(std::vector<std::byte> &buffer, int32_t value) {
            writeUInt32(buffer, static_cast<uint32_t>(value));
        }

        void writeInt64(std::vector<std::byte> &buffer, int64_t value) {
            writeUInt64(buffer, static_cast<uint64_t>(value));
        }

        void writeFloat32(std::vector<std::byte> &buffer, float value) {
            static_assert(sizeof(float) == sizeof(uint32_t), "float must be 32 bits");
            uint32_t bits;
            std::memcpy(&bits, &value, sizeof(bits));
            writeUInt32(buffer, bits);
        }

        void writeFloat64(std::vector<std::byte> &buffer, double value) {
            static_assert(sizeof(double) == sizeof(uint64_t), "double must be 64 bits");
            uint64_t bits;
            std::memcpy(&bits, &value, sizeof(bits));
            writeUInt64(buffer, bits);
        }

        uint32_t readUInt32(const std::byte *data) {
            uint32_t value = 0;
            for (size_t i = 0; i < 4; ++i) {
                value = (value << 8) | std::to_integer<uint32_t>(data[i]);
            }
            return value;
        }

        uint64_t readUInt64(const std::byte *data) {
            uint64_t value = 0;
            for (size_t i = 0; i < 8; ++i) {
                value = (value << 8) | std::to_integer<uint64_t>(data[i]);
            }
            return value;
        }

        int32_t readInt32(const std::byte *data) { return static_cast<int32_t>(readUInt32(data)); }

        int64_t readInt64(const std::byte *data) { return static_cast<int64_t>(readUInt64(data)); }

        float readFloat32(const std::byte *data) {
            uint32_t bits = readUInt32(data);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }

        double readFloat64(const std::byte *data) {
            uint64_t bits = readUInt64(data);
            double value;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }

    }  // namespace endian
}  // namespace oscwire
