extern "C" {
    #include <pthread.h>
    #include <unistd.h>
    #include <errno.h>
}

#include "Control.hpp"
#include "Logging.hpp"

using namespace std;

ControlChannel::ControlChannel()
    : queue(64),
      shutdown_requested(false),
      wake(O_CLOEXEC | O_NONBLOCK)
{}

void ControlChannel::wakeUp() noexcept {
    char b = 1;
    // A full pipe is already readable, EAGAIN is fine.
    ssize_t n = ::write(wake.get(1), &b, 1);
    (void) n;
}

void ControlChannel::post(ControlMessage msg) {
    if (msg == ControlMessage::Shutdown) {
        shutdown_requested = true;
        wakeUp();
        return;
    }
    if (queue.trySend(msg))
        wakeUp();
    else
        Log::warn("Control queue is full, message dropped");
}

vector<ControlMessage> ControlChannel::drain() {
    char buf[64];
    while (::read(wake.get(0), buf, sizeof(buf)) > 0)
        continue;
    auto msgs = queue.drain();
    if (shutdown_requested.exchange(false))
        msgs.push_back(ControlMessage::Shutdown);
    return msgs;
}

SignalWatcher::SignalWatcher(ControlChannel &control)
    : control(control),
      running(true)
{
    signal(SIGPIPE, SIG_IGN);

    sigemptyset(&set);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGUSR1})
        sigaddset(&set, sig);

    if (int err = pthread_sigmask(SIG_BLOCK, &set, &old_mask))
        throw SystemError("Unable to block signals: ", err);

    worker = thread([this]() { watch(); });
}

SignalWatcher::~SignalWatcher() {
    running = false;
    pthread_kill(worker.native_handle(), SIGUSR1);
    worker.join();
    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
}

void SignalWatcher::watch() {
    while (running) {
        int sig;
        if (sigwait(&set, &sig) != 0 || !running)
            continue;

        try {
            if (sig == SIGUSR1) {
                Log::info("Reload requested");
                control.post(ControlMessage::Reload);
            } else {
                Log::info("Graceful shutdown on signal {}", sig);
                control.post(ControlMessage::Shutdown);
            }
        } catch (const exception &e) {
            Log::error("Unable to handle signal {}: {}", sig, e.what());
        }
    }
}
