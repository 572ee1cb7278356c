/*
 *  OSCWire - Open Sound Control wire codec.
 *
 *  Encodes and decodes OSC 1.0 messages and bundles. Transport is left to
 *  the caller.
 */

#pragma once

/**
 * @file OSCWire.h
 * @brief Main include file for the OSCWire library
 *
 * Example usage:
 *
 * ```cpp
 * oscwire::Message message("/mixer/channel/1/gain");
 * message.addFloat(0.75f).addString("dB");
 * std::vector<std::byte> bytes = message.serialize();
 *
 * oscwire::Packet packet = oscwire::Packet::deserialize(bytes);
 * if (packet.isMessage()) {
 *     float gain = packet.asMessage().getArgument(0).asFloat();
 * }
 * ```
 */

#include <string>

#include "oscwire/Bundle.h"
#include "oscwire/ConfigurationParser.h"
#include "oscwire/Endian.h"
#include "oscwire/Exceptions.h"
#include "oscwire/Logging.h"
#include "oscwire/Message.h"
#include "oscwire/Options.h"
#include "oscwire/Packet.h"
#include "oscwire/Types.h"

// Version information
#define OSCWIRE_VERSION_MAJOR 1
#define OSCWIRE_VERSION_MINOR 0
#define OSCWIRE_VERSION_PATCH 0
#define OSCWIRE_VERSION_STRING "1.0.0"

/**
 * @namespace oscwire
 * @brief Namespace containing all OSCWire components
 */
namespace oscwire {

    /**
     * @brief Get the library version as a string
     * @return Version string in format "major.minor.patch"
     */
    inline std::string getVersionString() { return OSCWIRE_VERSION_STRING; }

    /**
     * @brief Get the library version as components
     */
    inline void getVersion(int &major, int &minor, int &patch) {
        major = OSCWIRE_VERSION_MAJOR;
        minor = OSCWIRE_VERSION_MINOR;
        patch = OSCWIRE_VERSION_PATCH;
    }

}  // namespace oscwire
