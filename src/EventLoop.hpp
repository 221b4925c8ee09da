/** @file EventLoop.hpp
 *
 * @brief g15keys event loop.
 */

#pragma once

#include <string>
#include <cstdint>

#include "ActionDispatcher.hpp"
#include "ClientState.hpp"
#include "Control.hpp"
#include "MacroRecorder.hpp"
#include "Process.hpp"
#include "ProtocolClient.hpp"

/** Event loop.
 *
 * Receive key states from g15daemon and run the bound commands on the
 * resulting key events.
 */
class EventLoop {
private:
    std::string config_path;
    ClientState state;
    ProtocolClient &client;
    ControlChannel &control;
    MacroRecorder recorder;
    ActionDispatcher dispatcher;
    bool running = true;
    bool reload_pending = false;

    /** Handle queued control messages. */
    void handleControl();

    /** Reconnect until it works or a shutdown is requested. */
    void recover();

    /** Stop the recording and bind it to `key`. */
    void finishRecording(const std::string &key);

public:
    /**
     * @param config_path The configuration file.
     * @param client Connection to the daemon, the loop sets its wake fd.
     * @param injector Input injection for emit commands.
     * @param capture Key capture for macro recording.
     * @param control Source of shutdown and reload requests.
     * @param spawn Program starter for shell commands.
     */
    EventLoop(const std::string &config_path,
              ProtocolClient &client,
              IInjector &injector,
              IEventCapture &capture,
              ControlChannel &control,
              SpawnFn spawn = spawnDetached);

    /**
     * Load the configuration for the first time.
     *
     * @throws ConfigError If it is missing or invalid.
     */
    void load();

    /**
     * Load the configuration again, keeping the active profile if it still
     * exists. Failures are logged and the current configuration is kept.
     *
     * While a macro is being recorded the reload is deferred until the
     * recording is finished.
     */
    void reload();

    /**
     * Run the mainloop until a shutdown is requested.
     *
     * @throws HandshakeError If the daemon is not g15daemon.
     */
    void run();

    /** Process a new key-state snapshot. */
    void handleKeyState(uint32_t keys);

    /** Process one key event. */
    void handleKeyEvent(const std::string &key, bool pressed);

    inline const ClientState &getState() const noexcept { return state; }

    inline bool isRecording() const noexcept { return recorder.isCapturing(); }
};
