#pragma once

#include <string>
#include <mutex>
#include <tuple>
#include <utility>
#include <fmt/format.h>

extern "C" {
    #include <libnotify/notify.h>
}

namespace Notifications {
    extern std::mutex last_notification_mtx;
    extern std::tuple<std::string, std::string> last_notification;

    /**
     * Connect to the notification daemon.
     *
     * Until this succeeds notifications are only written to syslog.
     *
     * @return False if libnotify could not be initialized.
     */
    bool init(const std::string &app_name);

    void uninit();
}

void libnotify_notify(const std::string &title, const std::string &msg,
                      NotifyUrgency urgency);

template <class... T>
inline void notify(const std::string &title,
                   fmt::format_string<T...> fmt,
                   T&&... args) {
    libnotify_notify(title, fmt::format(fmt, std::forward<T>(args)...), NOTIFY_URGENCY_NORMAL);
}

template <class... T>
inline void notifyCritical(const std::string &title,
                           fmt::format_string<T...> fmt,
                           T&&... args) {
    libnotify_notify(title, fmt::format(fmt, std::forward<T>(args)...), NOTIFY_URGENCY_CRITICAL);
}
