#include "KeyState.hpp"

using namespace std;

namespace {
    struct KeyBit {
        const char *name;
        unsigned bit;
    };

    // Ordered as the events must be reported.
    const KeyBit key_bits[] = {
        {"G1",   0}, {"G2",   1}, {"G3",   2}, {"G4",   3}, {"G5",   4}, {"G6",   5},
        {"G7",   6}, {"G8",   7}, {"G9",   8}, {"G10",  9}, {"G11", 10}, {"G12", 11},
        {"G13", 12}, {"G14", 13}, {"G15", 14}, {"G16", 15}, {"G17", 16}, {"G18", 17},
        {"G19", 28}, {"G20", 29}, {"G21", 30}, {"G22", 31},

        {"M1", 18}, {"M2", 19}, {"M3", 20}, {"MR", 21},

        {"L1", 22}, {"L2", 23}, {"L3", 24}, {"L4", 25}, {"L5", 26},
    };
}

vector<KeyEvent> decodeKeyEvents(uint32_t prev, uint32_t next) {
    vector<KeyEvent> events;
    uint32_t changed = prev ^ next;

    if (changed == 0)
        return events;

    for (const auto &kb : key_bits) {
        uint32_t mask = 1u << kb.bit;
        if (changed & mask)
            events.push_back({kb.name, (next & mask) != 0});
    }

    return events;
}

uint32_t keyMask(const string &name) noexcept {
    for (const auto &kb : key_bits)
        if (name == kb.name)
            return 1u << kb.bit;
    return 0;
}
