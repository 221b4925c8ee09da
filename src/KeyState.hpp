/** @file KeyState.hpp
 *
 * @brief Decoding of g15daemon key-state bitmasks into named key events.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

/** Bit of the backlight button, never reported as a key event. */
static constexpr uint32_t G15_KEY_LIGHT = 1u << 27;

/** A single press or release of a named key. */
struct KeyEvent {
    std::string name;
    bool pressed;

    inline bool operator==(const KeyEvent &other) const {
        return name == other.name && pressed == other.pressed;
    }
};

/**
 * Compute the key events between two key-state snapshots.
 *
 * One event is produced per bit that differs. The G keys come first, then
 * the M keys and finally the L keys, each group in physical key order.
 * G19 to G22 live on bits 28 to 31, the fourth M key is called "MR".
 *
 * @param prev The previous snapshot.
 * @param next The new snapshot.
 */
std::vector<KeyEvent> decodeKeyEvents(uint32_t prev, uint32_t next);

/**
 * Bitmask of a named key.
 *
 * @return The mask, or 0 if no key has that name.
 */
uint32_t keyMask(const std::string &name) noexcept;
