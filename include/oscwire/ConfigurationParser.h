#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "oscwire/Options.h"

/**
 * @file ConfigurationParser.h
 * @brief Parser for codec options from JSON
 *
 * Recognised keys:
 * - "maxPacketSize": non-negative integer, 0 disables the limit
 * - "maxBlobSize": non-negative integer
 * - "logLevel": "error", "warning", "info" or "debug"
 * - "logFile": path of a file to append log lines to
 *
 * This class does not maintain state itself and all methods are static.
 */

namespace oscwire {

    class ConfigurationParser {
       public:
        /**
         * @brief Parse options from a JSON file
         *
         * @param filePath Path to the JSON file
         * @param options Options to fill; untouched if parsing fails
         * @return bool True if parsing was successful
         */
        static bool parseJsonFile(const std::string &filePath, CodecOptions &options);

        /**
         * @brief Parse options from a JSON string
         *
         * @param jsonContent JSON content as string
         * @param options Options to fill; untouched if parsing fails
         * @return bool True if parsing was successful
         */
        static bool parseJsonString(const std::string &jsonContent, CodecOptions &options);

        /**
         * @brief Apply the log level and log file to the logging module
         *
         * @return bool False if the log file could not be opened
         */
        static bool applyLogging(const CodecOptions &options);

        /**
         * @brief Parse a level name ("error", "warning", "info", "debug")
         *
         * @return bool False if the name is not recognised
         */
        static bool parseLogLevel(const std::string &name, LogLevel &level);

       private:
        /**
         * @brief Core JSON parsing logic used by all JSON-related methods
         */
        static bool parseJson(const nlohmann::json &json, CodecOptions &options);
    };

}  // namespace oscwire
