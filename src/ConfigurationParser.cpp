#include "oscwire/ConfigurationParser.h"

#include <fstream>
#include <string>

#include "oscwire/Exceptions.h"
#include "oscwire/Logging.h"

namespace oscwire {

    namespace {
        bool readSize(const nlohmann::json &json, const char *key, size_t &value) {
            const auto &field = json.at(key);
            if (!field.is_number_unsigned()) {
                OSCWIRE_LOG_ERROR("Configuration key '%s' must be a non-negative integer", key);
                return false;
            }
            value = field.get<size_t>();
            return true;
        }
    }  // namespace

    bool ConfigurationParser::parseJsonFile(const std::string &filePath, CodecOptions &options) {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            OSCWIRE_LOG_ERROR("Cannot open configuration file '%s'", filePath.c_str());
            return false;
        }

        nlohmann::json json;
        try {
            file >> json;
        } catch (const nlohmann::json::parse_error &e) {
            OSCWIRE_LOG_ERROR("%s in '%s': %s",
                              OSCException::getErrorDescription(
                                  OSCException::ErrorCode::ConfigurationError)
                                  .c_str(),
                              filePath.c_str(), e.what());
            return false;
        }

        return parseJson(json, options);
    }

    bool ConfigurationParser::parseJsonString(const std::string &jsonContent,
                                              CodecOptions &options) {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(jsonContent);
        } catch (const nlohmann::json::parse_error &e) {
            OSCWIRE_LOG_ERROR("%s: %s",
                              OSCException::getErrorDescription(
                                  OSCException::ErrorCode::ConfigurationError)
                                  .c_str(),
                              e.what());
            return false;
        }

        return parseJson(json, options);
    }

    bool ConfigurationParser::parseJson(const nlohmann::json &json, CodecOptions &options) {
        if (!json.is_object()) {
            OSCWIRE_LOG_ERROR("Configuration must be a JSON object");
            return false;
        }

        // Fill a copy so a bad key leaves the caller's options untouched
        CodecOptions parsed = options;

        for (auto it = json.begin(); it != json.end(); ++it) {
            const std::string &key = it.key();

            if (key == "maxPacketSize") {
                if (!readSize(json, "maxPacketSize", parsed.maxPacketSize)) return false;
            } else if (key == "maxBlobSize") {
                if (!readSize(json, "maxBlobSize", parsed.maxBlobSize)) return false;
            } else if (key == "logLevel") {
                if (!it.value().is_string() ||
                    !parseLogLevel(it.value().get<std::string>(), parsed.logLevel)) {
                    OSCWIRE_LOG_ERROR(
                        "Configuration key 'logLevel' must be one of error, warning, info, debug");
                    return false;
                }
            } else if (key == "logFile") {
                if (!it.value().is_string()) {
                    OSCWIRE_LOG_ERROR("Configuration key 'logFile' must be a string");
                    return false;
                }
                parsed.logFile = it.value().get<std::string>();
            } else {
                OSCWIRE_LOG_WARNING("Ignoring unknown configuration key '%s'", key.c_str());
            }
        }

        options = parsed;
        return true;
    }

    bool ConfigurationParser::applyLogging(const CodecOptions &options) {
        log_set_level(options.logLevel);
        if (log_set_file(options.logFile.c_str()) != 0) {
            OSCWIRE_LOG_ERROR("Cannot open log file '%s'", options.logFile.c_str());
            return false;
        }
        return true;
    }

    bool ConfigurationParser::parseLogLevel(const std::string &name, LogLevel &level) {
        for (LogLevel candidate : {LOG_ERROR, LOG_WARNING, LOG_INFO, LOG_DEBUG}) {
            if (name == log_level_name(candidate)) {
                level = candidate;
                return true;
            }
        }
        return false;
    }

}  // namespace oscwire
