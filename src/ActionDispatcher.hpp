/** @file ActionDispatcher.hpp
 *
 * @brief Runs the commands bound to keys.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>

#include "ClientState.hpp"
#include "Command.hpp"
#include "IInjector.hpp"
#include "MacroRecorder.hpp"
#include "ProtocolClient.hpp"

/** Starts a program, see spawnDetached(). */
using SpawnFn = std::function<void(const std::vector<std::string> &argv)>;

/**
 * Resolves key events against the active profile and executes the bound
 * commands.
 *
 * Errors in a single command are logged and the command is abandoned, the
 * remaining commands of the binding still run. A HandshakeError from a
 * reconnect is fatal and propagates.
 */
class ActionDispatcher {
private:
    ClientState &state;
    ProtocolClient &client;
    IInjector &injector;
    MacroRecorder &recorder;
    SpawnFn spawn;

    void run(const ProfileSwitch &cmd);
    void run(const SetLeds &cmd);
    void run(const Emit &cmd);
    void run(const Record &cmd);
    void run(const Shell &cmd);

public:
    ActionDispatcher(ClientState &state,
                     ProtocolClient &client,
                     IInjector &injector,
                     MacroRecorder &recorder,
                     SpawnFn spawn);

    /**
     * Handle a key event.
     *
     * @param key Key name, e.g "G1".
     * @param pressed True for a press, false for a release.
     */
    void handleKey(const std::string &key, bool pressed);

    /**
     * Execute a list of commands, logging and skipping the ones that fail.
     */
    void executeAll(const std::vector<std::string> &commands);

    /**
     * Execute one command.
     *
     * @throws CommandError If the command is malformed.
     * @throws InjectError, CaptureError, SubprocessError, SystemError If the
     *         command could not be carried out.
     */
    void execute(const std::string &command);
};
