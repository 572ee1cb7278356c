#include "oscwire/Logging.h"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>

namespace oscwire {

    namespace {
        constexpr size_t LOG_HISTORY_SIZE = 100;
        constexpr size_t LOG_LINE_INITIAL = 256;

        struct LogState {
            std::mutex mutex;
            LogLevel level = LOG_WARNING;
            LogCallback callback = nullptr;
            std::ofstream file;
            std::deque<std::string> history;
        };

        LogState &state() {
            static LogState instance;
            return instance;
        }

        std::string formatText(const char *fmt, va_list args) {
            std::string text(LOG_LINE_INITIAL, '\0');
            va_list retry;
            va_copy(retry, args);
            int needed = std::vsnprintf(&text[0], text.size() + 1, fmt, args);
            if (needed < 0) {
                va_end(retry);
                return fmt;
            }
            if (static_cast<size_t>(needed) > text.size()) {
                text.resize(static_cast<size_t>(needed));
                std::vsnprintf(&text[0], text.size() + 1, fmt, retry);
            }
            va_end(retry);
            text.resize(static_cast<size_t>(needed));
            return text;
        }

        // Caller holds the mutex
        int openFile(LogState &s, const char *filename) {
            if (s.file.is_open()) {
                s.file.close();
            }
            if (filename == nullptr || filename[0] == '\0') {
                return 0;
            }
            s.file.open(filename, std::ios::out | std::ios::app);
            return s.file.is_open() ? 0 : -1;
        }
    }  // namespace

    int log_init(const char *filename, LogLevel level, LogCallback callback) {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.level = level;
        s.callback = callback;
        return openFile(s, filename);
    }

    void log_cleanup() {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open()) {
            s.file.close();
        }
        s.callback = nullptr;
        s.history.clear();
    }

    void log_set_level(LogLevel level) {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.level = level;
    }

    LogLevel log_get_level() {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        return s.level;
    }

    int log_set_file(const char *filename) {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        return openFile(s, filename);
    }

    const char *log_level_name(LogLevel level) {
        switch (level) {
            case LOG_ERROR:
                return "error";
            case LOG_WARNING:
                return "warning";
            case LOG_INFO:
                return "info";
            case LOG_DEBUG:
                return "debug";
        }
        return "unknown";
    }

    void log_message(LogLevel level, const char *fmt, ...) {
        va_list args;
        va_start(args, fmt);
        log_message_v(level, fmt, args);
        va_end(args);
    }

    void log_message_v(LogLevel level, const char *fmt, va_list args) {
        LogState &s = state();
        LogCallback callback = nullptr;
        std::string text;
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            if (level > s.level) {
                return;
            }

            text = formatText(fmt, args);
            std::string line = std::string("[oscwire] ") + log_level_name(level) + ": " + text;

            if (level <= LOG_WARNING) {
                std::cerr << line << std::endl;
            }
            if (s.file.is_open()) {
                s.file << line << std::endl;
            }

            s.history.push_back(std::move(line));
            if (s.history.size() > LOG_HISTORY_SIZE) {
                s.history.pop_front();
            }
            callback = s.callback;
        }

        // Outside the lock: the callback may call back into the logger
        if (callback) {
            callback(level, text.c_str());
        }
    }

    size_t log_get_recent(std::vector<std::string> &messages, size_t maxMessages) {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        messages.clear();
        size_t count = std::min(maxMessages, s.history.size());
        messages.insert(messages.end(), s.history.end() - static_cast<std::ptrdiff_t>(count),
                        s.history.end());
        return count;
    }

    void log_clear_history() {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.history.clear();
    }

}  // namespace oscwire
