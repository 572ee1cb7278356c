/*
 *  OSCWire - Open Sound Control wire codec.
 *  Leveled logging used by the codec and the configuration parser.
 */

#pragma once

#include <cstdarg>
#include <cstddef>
#include <string>
#include <vector>

namespace oscwire {

    // Log levels
    enum LogLevel {
        LOG_ERROR = 0,    // Critical errors (always logged)
        LOG_WARNING = 1,  // Warnings (logged by default)
        LOG_INFO = 2,     // Informational messages
        LOG_DEBUG = 3     // Debug messages, including rejected packets
    };

    using LogCallback = void (*)(LogLevel level, const char *message);

    /**
     * @brief Initialize the logging system
     *
     * @param filename Path to log file (nullptr for stderr only)
     * @param level Maximum level to log
     * @param callback Function to call for every logged line (may be nullptr)
     * @return 0 on success, non-zero if the log file could not be opened
     */
    int log_init(const char *filename, LogLevel level, LogCallback callback);

    /**
     * @brief Close the log file, drop the callback and clear the history
     */
    void log_cleanup();

    /**
     * @brief Set the log level
     *
     * @param level Maximum level to log
     */
    void log_set_level(LogLevel level);

    /**
     * @brief Get the current log level
     */
    LogLevel log_get_level();

    /**
     * @brief Set a custom log file
     *
     * @param filename Path to log file (nullptr or empty to close the current file)
     * @return 0 on success, non-zero on failure
     */
    int log_set_file(const char *filename);

    /**
     * @brief Log a message
     *
     * @param level The log level
     * @param fmt Printf-style format string
     * @param ... Format arguments
     */
    void log_message(LogLevel level, const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    /**
     * @brief Log a message with a va_list
     */
    void log_message_v(LogLevel level, const char *fmt, va_list args);

    /**
     * @brief Get the last logged lines, oldest first
     *
     * @param messages Vector to fill
     * @param maxMessages Maximum number of lines to retrieve
     * @return Number of lines retrieved
     */
    size_t log_get_recent(std::vector<std::string> &messages, size_t maxMessages);

    /**
     * @brief Clear the log history buffer
     */
    void log_clear_history();

    /**
     * @brief Name of a level as used in log lines and configuration ("error", ...)
     */
    const char *log_level_name(LogLevel level);

}  // namespace oscwire

// Convenience macros
#define OSCWIRE_LOG_ERROR(fmt, ...) ::oscwire::log_message(::oscwire::LOG_ERROR, fmt, ##__VA_ARGS__)
#define OSCWIRE_LOG_WARNING(fmt, ...) \
    ::oscwire::log_message(::oscwire::LOG_WARNING, fmt, ##__VA_ARGS__)
#define OSCWIRE_LOG_INFO(fmt, ...) ::oscwire::log_message(::oscwire::LOG_INFO, fmt, ##__VA_ARGS__)
#define OSCWIRE_LOG_DEBUG(fmt, ...) ::oscwire::log_message(::oscwire::LOG_DEBUG, fmt, ##__VA_ARGS__)
