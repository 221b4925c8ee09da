/** @file ClientState.hpp
 *
 * @brief Everything the client knows about the user's setup at one time.
 */

#pragma once

#include <string>
#include <cstdint>
#include <utility>

#include "Config.hpp"

struct ClientState {
    Config config;
    /** Name of the active profile, always a profile of `config`. */
    std::string profile;
    /** Last key-state snapshot received from the daemon. */
    uint32_t keys = 0;

    /**
     * Build the state for a freshly loaded Config.
     *
     * @param config The configuration, must hold at least one profile.
     * @param previous Profile to keep active if `config` still has it,
     *                 otherwise the first profile becomes active.
     */
    static inline ClientState fromConfig(Config config, const std::string &previous = "") {
        ClientState state;
        state.profile = config.contains(previous) ? previous : config.firstProfile();
        state.config = std::move(config);
        return state;
    }

    inline Profile *activeProfile() { return config.find(profile); }
};
