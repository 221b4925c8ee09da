/** @file Control.hpp
 *
 * @brief Shutdown and reload requests for the event loop.
 */

#pragma once

#include <vector>
#include <thread>
#include <atomic>

extern "C" {
    #include <signal.h>
}

#include "Channel.hpp"
#include "Process.hpp"

enum class ControlMessage {
    Shutdown,
    Reload,
};

/**
 * Queue of control messages with a descriptor that is readable while
 * messages are pending, so blocking waits can include it in poll().
 */
class ControlChannel {
private:
    Channel<ControlMessage> queue;
    std::atomic<bool> shutdown_requested;
    Pipe wake;

    void wakeUp() noexcept;

public:
    ControlChannel();

    /**
     * Queue a message, may be called from any thread.
     *
     * A shutdown request is never dropped, other messages are dropped
     * while the queue is full.
     *
     * @throws std::system_error, std::bad_alloc If the queue is unusable.
     */
    void post(ControlMessage msg);

    /**
     * Take all pending messages, in posting order. A pending shutdown
     * always comes last.
     */
    std::vector<ControlMessage> drain();

    inline int fd() const noexcept { return wake.get(0); }
};

/**
 * Turns process signals into control messages.
 *
 * SIGINT, SIGTERM, SIGHUP and SIGQUIT request a shutdown, SIGUSR1 a reload.
 * SIGPIPE is ignored. The signals are blocked in the constructing thread and
 * received by a dedicated thread with sigwait(), so the watcher must be
 * created before any other thread is started.
 */
class SignalWatcher {
private:
    ControlChannel &control;
    sigset_t set;
    sigset_t old_mask;
    std::atomic<bool> running;
    std::thread worker;

    void watch();

public:
    /** @throws SystemError If the signal mask could not be changed. */
    explicit SignalWatcher(ControlChannel &control);

    /** Stops the watcher thread and restores the previous signal mask. */
    ~SignalWatcher();
};
