#include <iostream>
#include <string>
#include <cstdlib>
#include <cerrno>

#include <g15keys_config.h>

extern "C" {
    #include <pwd.h>
    #include <unistd.h>
    #include <sys/types.h>
    #include <sys/stat.h>
    #include <X11/Xlib.h>
}

#include "Control.hpp"
#include "EventLoop.hpp"
#include "Logging.hpp"
#include "Notifications.hpp"
#include "ProtocolClient.hpp"
#include "XInjector.hpp"
#include "utils.hpp"

using namespace std;

static string homeDir() {
    const char *home = getenv("HOME");
    if (home != nullptr && *home != '\0')
        return home;
    struct passwd *pw = getpwuid(getuid());
    if (pw == nullptr || pw->pw_dir == nullptr)
        throw SystemError("Unable to find home directory: ", errno);
    return pw->pw_dir;
}

int main() {
    Log::open("g15keysd", true);
    Log::info("g15keysd v" G15KEYSD_VERSION " starting");

    umask(0022);

    ControlChannel control;
    // Must exist before any other thread, see SignalWatcher.
    SignalWatcher signals(control);

    if (!XInitThreads())
        Log::warn("XInitThreads() failed, macro recording may be unreliable");
    Notifications::init("g15keys");

    int status = 0;
    try {
        string config_path = pathJoin(homeDir(), ".g15keys", "config");

        ProtocolClient client(ScreenType::G15R);
        XInjector injector;
        XRecordCapture capture;
        EventLoop loop(config_path, client, injector, capture, control);

        loop.load();
        loop.run();
    } catch (const ConfigError &e) {
        Log::crit("Invalid configuration: {}", e.what());
        cerr << "g15keysd: " << e.what() << endl;
        status = 4;
    } catch (const HandshakeError &e) {
        Log::crit("{}", e.what());
        cerr << "g15keysd: " << e.what() << endl;
        status = 3;
    } catch (const SystemError &e) {
        Log::crit("g15keysd: {}", e.what());
        cerr << "g15keysd: " << e.what() << endl;
        e.printBacktrace();
        status = 1;
    } catch (const exception &e) {
        Log::crit("g15keysd: {}", e.what());
        cerr << "g15keysd: " << e.what() << endl;
        status = 1;
    }

    Notifications::uninit();
    return status;
}
