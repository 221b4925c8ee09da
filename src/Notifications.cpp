#include "Notifications.hpp"
#include "Logging.hpp"

using namespace std;

extern "C" {
    #include <libnotify/notify.h>
}

using namespace Notifications;

std::mutex Notifications::last_notification_mtx;
std::tuple<std::string, std::string> Notifications::last_notification;

bool Notifications::init(const string &app_name) {
    if (notify_is_initted())
        return true;
    if (!notify_init(app_name.c_str())) {
        Log::warn("Unable to initialize libnotify, notifications go to syslog only");
        return false;
    }
    return true;
}

void Notifications::uninit() {
    if (notify_is_initted())
        notify_uninit();
}

void libnotify_notify(const string &title, const string &msg, NotifyUrgency urgency) {
    Log::info("{}: {}", title, msg);

    // Only the desktop popup is deduplicated.
    lock_guard<mutex> lock(last_notification_mtx);
    tuple<string, string> notif(title, msg);
    if (notif == last_notification)
        return;
    last_notification = notif;

    if (!notify_is_initted())
        return;

    NotifyNotification *n = notify_notification_new(title.c_str(), msg.c_str(), "input-keyboard");
    if (n == nullptr) {
        Log::warn("D-Bus notifications cannot be shown.");
        return;
    }
    notify_notification_set_timeout(n, 12000);
    notify_notification_set_urgency(n, urgency);
    if (!notify_notification_show(n, nullptr))
        Log::warn("D-Bus notifications cannot be shown.");
    g_object_unref(G_OBJECT(n));
}
