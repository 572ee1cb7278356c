/*
 *  OSCWire - Open Sound Control wire codec.
 *  Decoder limits and logging settings.
 */

#pragma once

#include <cstddef>
#include <string>

#include "oscwire/Logging.h"

namespace oscwire {

    // 32 MiB upper bound for a single blob argument
    constexpr size_t DEFAULT_MAX_BLOB_SIZE = 33554432;

    /**
     * @brief Options consulted by the decoders
     *
     * A default-constructed instance is what the decode entry points use when
     * no options are passed. Load values from JSON with ConfigurationParser.
     */
    struct CodecOptions {
        size_t maxPacketSize = 0;                     ///< 0 disables the packet size limit
        size_t maxBlobSize = DEFAULT_MAX_BLOB_SIZE;   ///< Largest accepted blob payload
        LogLevel logLevel = LOG_WARNING;              ///< Applied by ConfigurationParser::applyLogging
        std::string logFile;                          ///< Empty logs to stderr only
    };

}  // namespace oscwire
