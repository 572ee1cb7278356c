#include "StringCodec.h"

#include <algorithm>

#include "oscwire/Endian.h"
#include "oscwire/Exceptions.h"

namespace oscwire {
    namespace detail {

        std::string readPaddedString(const std::byte *data, size_t size, size_t &pos,
                                     const char *what) {
            for (size_t end = pos + 4; end <= size; end += 4) {
                if (data[end - 1] == std::byte{0}) {
                    std::string raw(reinterpret_cast<const char *>(data + pos), end - pos);
                    pos = end;
                    return raw;
                }
            }
            throw MalformedPacketException(std::string("No null terminator after ") + what,
                                           OSCException::ErrorCode::MissingNullTerminator);
        }

        std::string stripNulls(std::string raw) {
            raw.erase(std::remove(raw.begin(), raw.end(), '\0'), raw.end());
            return raw;
        }

        void writePaddedString(std::vector<std::byte> &buffer, const std::string &value) {
            const std::byte *bytes = reinterpret_cast<const std::byte *>(value.data());
            buffer.insert(buffer.end(), bytes, bytes + value.size());
            buffer.resize(buffer.size() + endian::stringPadSize(value.size()) - value.size(),
                          std::byte{0});
        }

    }  // namespace detail
}  // namespace oscwire
