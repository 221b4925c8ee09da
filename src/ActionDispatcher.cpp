#include <thread>
#include <chrono>

#include "ActionDispatcher.hpp"
#include "Logging.hpp"
#include "utils.hpp"

using namespace std;

ActionDispatcher::ActionDispatcher(ClientState &state,
                                   ProtocolClient &client,
                                   IInjector &injector,
                                   MacroRecorder &recorder,
                                   SpawnFn spawn)
    : state(state),
      client(client),
      injector(injector),
      recorder(recorder),
      spawn(move(spawn))
{}

void ActionDispatcher::handleKey(const string &key, bool pressed) {
    Log::debug("{} button {}", key, pressed ? "pressed" : "released");

    Profile *profile = state.activeProfile();
    if (profile == nullptr) {
        Log::warn("Active profile '{}' does not exist", state.profile);
        return;
    }

    auto it = profile->find(key);
    if (it == profile->end())
        return;

    executeAll(bindingCommands(it->second, pressed));
}

void ActionDispatcher::executeAll(const vector<string> &commands) {
    for (const auto &cmd : commands) {
        try {
            execute(cmd);
        } catch (const HandshakeError &) {
            throw;
        } catch (const exception &e) {
            Log::error("Command '{}' failed: {}", cmd, e.what());
        }
    }
}

void ActionDispatcher::execute(const string &command) {
    Log::debug("Executing the following command: {}", command);
    Command cmd = parseCommand(command);
    visit([this](const auto &c) { run(c); }, cmd);
}

void ActionDispatcher::run(const ProfileSwitch &cmd) {
    if (!state.config.contains(cmd.profile)) {
        Log::warn("Profile not found: {}", cmd.profile);
        return;
    }
    Log::info("Switching profile to {}", cmd.profile);
    state.profile = cmd.profile;
}

void ActionDispatcher::run(const SetLeds &cmd) {
    for (unsigned mask : cmd.masks) {
        if (client.setLeds(mask) == Link::Ok || client.isDisconnecting())
            continue;

        Log::warn("Lost connection while setting LEDs, reconnecting");
        // The mask is remembered and restored on reconnect.
        if (!client.reconnect()) {
            Log::notice("Reconnect interrupted, remaining LEDs are not set");
            return;
        }
    }
}

void ActionDispatcher::run(const Emit &cmd) {
    for (const auto &token : cmd.tokens) {
        switch (token.kind) {
            case InputToken::Sleep:
                injector.sync();
                this_thread::sleep_for(chrono::milliseconds(token.value));
                break;

            case InputToken::Key:
                injector.inject(InputKind::Key, token.press, token.value);
                break;

            case InputToken::Mouse:
                injector.inject(InputKind::Mouse, token.press, token.value);
                break;
        }
    }
    injector.sync();
}

void ActionDispatcher::run(const Record &) {
    if (!recorder.start())
        Log::debug("Already recording, ignoring record command");
}

void ActionDispatcher::run(const Shell &cmd) {
    Log::debug("Running: {}", StringJoiner(" ").joinAll(cmd.argv));
    spawn(cmd.argv);
}
