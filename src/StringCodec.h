/*
 *  OSCWire - Open Sound Control wire codec.
 *  Internal helpers for null-terminated, 4-byte padded OSC strings.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace oscwire {
    namespace detail {

        /**
         * @brief Read a padded OSC string starting at pos
         *
         * Scans forward in 4-byte strides until a stride ends in a null byte.
         * Returns every byte of the consumed strides (nulls included) and
         * advances pos past them.
         *
         * @throws MalformedPacketException (MissingNullTerminator) if the
         *         buffer ends first
         */
        std::string readPaddedString(const std::byte *data, size_t size, size_t &pos,
                                     const char *what);

        /// Remove every null byte from a raw padded string
        std::string stripNulls(std::string raw);

        /// Append value followed by 1-4 null bytes so the total is a multiple of 4
        void writePaddedString(std::vector<std::byte> &buffer, const std::string &value);

    }  // namespace detail
}  // namespace oscwire
