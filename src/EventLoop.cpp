#include "EventLoop.hpp"
#include "KeyState.hpp"
#include "Logging.hpp"
#include "Notifications.hpp"
#include "SystemError.hpp"

using namespace std;

EventLoop::EventLoop(const string &config_path,
                     ProtocolClient &client,
                     IInjector &injector,
                     IEventCapture &capture,
                     ControlChannel &control,
                     SpawnFn spawn)
    : config_path(config_path),
      client(client),
      control(control),
      recorder(capture),
      dispatcher(state, client, injector, recorder, move(spawn))
{
    client.setWakeFd(control.fd());
}

void EventLoop::load() {
    Log::info("Loading configuration from {}", config_path);
    state = ClientState::fromConfig(Config::load(config_path));
    Log::info("Loaded {} profile(s), active profile is {}", state.config.size(), state.profile);
}

void EventLoop::reload() {
    if (recorder.isCapturing()) {
        Log::info("Recording in progress, configuration reload deferred");
        reload_pending = true;
        return;
    }
    reload_pending = false;

    Log::info("Reloading configuration from {}", config_path);
    try {
        auto next = ClientState::fromConfig(Config::load(config_path), state.profile);
        next.keys = state.keys;
        state = move(next);
        Log::info("Loaded {} profile(s), active profile is {}", state.config.size(), state.profile);
    } catch (const ConfigError &e) {
        Log::warn("Unable to reload {}, keeping the current configuration: {}",
                  config_path, e.what());
        notifyCritical("g15keys", "Configuration was not reloaded: {}", e.what());
    }
}

void EventLoop::handleControl() {
    for (auto msg : control.drain()) {
        switch (msg) {
            case ControlMessage::Shutdown:
                if (recorder.isCapturing() && recorder.stop())
                    Log::notice("Unfinished recording discarded");
                client.disconnect();
                running = false;
                break;

            case ControlMessage::Reload:
                reload();
                break;
        }
    }
}

void EventLoop::recover() {
    notify("g15keys", "Lost connection to g15daemon, reconnecting ...");

    while (running) {
        if (client.reconnect()) {
            notify("g15keys", "Reconnected to g15daemon");
            return;
        }
        handleControl();
    }
}

void EventLoop::finishRecording(const string &key) {
    auto macro = recorder.stop();

    if (macro) {
        Profile *profile = state.activeProfile();
        if (profile == nullptr) {
            Log::error("Active profile '{}' does not exist, macro dropped", state.profile);
        } else {
            Log::info("Finished recording, saving macro for {} in {}: {}", key, state.profile, *macro);
            (*profile)[key] = SingleBinding{*macro};
            try {
                state.config.save(config_path);
                notify("g15keys", "Macro saved to {} in profile {}", key, state.profile);
            } catch (const SystemError &e) {
                Log::error("Unable to save macro to {}: {}", config_path, e.what());
                notifyCritical("g15keys", "Unable to save macro: {}", e.what());
            }
        }
    }

    if (reload_pending)
        reload();
}

void EventLoop::handleKeyEvent(const string &key, bool pressed) {
    if (recorder.isCapturing()) {
        recorder.collect();
        if (!pressed)
            finishRecording(key);
        return;
    }

    dispatcher.handleKey(key, pressed);
}

void EventLoop::handleKeyState(uint32_t keys) {
    auto events = decodeKeyEvents(state.keys, keys);
    state.keys = keys;

    for (const auto &ev : events) {
        try {
            handleKeyEvent(ev.name, ev.pressed);
        } catch (const HandshakeError &) {
            throw;
        } catch (const exception &e) {
            Log::error("Error while handling {} {}: {}", ev.name,
                       ev.pressed ? "press" : "release", e.what());
        }
    }
}

void EventLoop::run() {
    Log::info("Connecting to g15daemon ...");
    while (running && !client.reconnect())
        handleControl();

    Log::info("Starting main loop");

    unsigned seen_session = 0;
    while (running) {
        uint32_t keys;
        switch (client.waitForKeyState(&keys)) {
            case Link::Interrupted:
                handleControl();
                continue;

            case Link::Disconnected:
                if (client.isDisconnecting())
                    running = false;
                else
                    recover();
                continue;

            case Link::Ok:
                break;
        }

        // A new session reports every held key again.
        unsigned session = client.getSession();
        if (session != seen_session) {
            seen_session = session;
            state.keys = 0;
        }

        try {
            handleKeyState(keys);
        } catch (const HandshakeError &) {
            throw;
        } catch (const exception &e) {
            Log::error("Error while handling key state {:#010x}: {}", keys, e.what());
        }

        // The daemon sends a second frame per cycle, its payload is not used.
        // Skip it unless a command reconnected in the meantime.
        uint32_t trailing;
        if (running && client.getSession() == session &&
            client.waitForKeyState(&trailing, false) == Link::Disconnected &&
            !client.isDisconnecting())
            recover();
    }

    Log::info("g15keys exiting ...");
}
