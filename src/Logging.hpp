#pragma once

/** @file Logging.hpp
 *
 * @brief fmt-formatted logging to syslog.
 */

#include <fmt/format.h>
#include <utility>

extern "C" {
    #include <syslog.h>
}

class Log {
    template <class... T>
    static inline void sendLog(int level, fmt::format_string<T...> fmt, T&&... args) {
        auto msg = fmt::format(fmt, std::forward<T>(args)...);
        ::syslog(level, "%s", msg.c_str());
    }

  public:
    /**
     * Open the syslog connection for this process.
     *
     * @param ident Program name prepended to every message.
     * @param echo Whether messages should also be written to stderr.
     */
    static inline void open(const char *ident, bool echo) {
        ::openlog(ident, LOG_PID | (echo ? LOG_PERROR : 0), LOG_USER);
    }

    template <class... T> static inline void error(fmt::format_string<T...> fmt, T&&... args) {
        sendLog(LOG_ERR, fmt, std::forward<T>(args)...);
    }

    template <class... T> static inline void warn(fmt::format_string<T...> fmt, T&&... args) {
        sendLog(LOG_WARNING, fmt, std::forward<T>(args)...);
    }

    template <class... T> static inline void info(fmt::format_string<T...> fmt, T&&... args) {
        sendLog(LOG_INFO, fmt, std::forward<T>(args)...);
    }

    template <class... T> static inline void debug(fmt::format_string<T...> fmt, T&&... args) {
        sendLog(LOG_DEBUG, fmt, std::forward<T>(args)...);
    }

    template <class... T> static inline void notice(fmt::format_string<T...> fmt, T&&... args) {
        sendLog(LOG_NOTICE, fmt, std::forward<T>(args)...);
    }

    template <class... T> static inline void crit(fmt::format_string<T...> fmt, T&&... args) {
        sendLog(LOG_CRIT, fmt, std::forward<T>(args)...);
    }
};
