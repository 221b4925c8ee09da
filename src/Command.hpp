/** @file Command.hpp
 *
 * @brief The small command language used in key bindings.
 *
 * Grammar, tested in this order:
 *   switch-profile <name>
 *   set-leds <led>[,<led>...]
 *   emit <token>[,<token>...]    token: {k|m}{+|-}<code> or s<milliseconds>
 *   record
 *   <anything else>              run as a program, split like a shell would
 */

#pragma once

#include <string>
#include <vector>
#include <variant>
#include <stdexcept>

class CommandError : public std::runtime_error {
public:
    explicit CommandError(const std::string &expl) : std::runtime_error(expl) {}
};

struct ProfileSwitch {
    std::string profile;
};

struct SetLeds {
    /** One M-key LED mask per listed LED, sent in order. */
    std::vector<unsigned> masks;
};

/** Synthetic input event, or a pause between events. */
struct InputToken {
    enum Kind { Key, Mouse, Sleep };

    Kind kind;
    /** Press or release, unused for Sleep. */
    bool press;
    /** Key code, button number, or milliseconds for Sleep. */
    int value;

    inline bool operator==(const InputToken &o) const {
        return kind == o.kind && press == o.press && value == o.value;
    }
};

struct Emit {
    std::vector<InputToken> tokens;
};

struct Record {};

struct Shell {
    std::vector<std::string> argv;
};

using Command = std::variant<ProfileSwitch, SetLeds, Emit, Record, Shell>;

/**
 * Parse a command line.
 *
 * @throws CommandError If the command is malformed.
 */
Command parseCommand(const std::string &line);

/**
 * Parse one emit token, e.g "k+38", "m-1" or "s250".
 *
 * @throws CommandError If the token is malformed.
 */
InputToken parseInputToken(const std::string &token);

/** Format a token the way parseInputToken() reads it. */
std::string formatInputToken(const InputToken &token);

/**
 * Parse an LED name, "M1" to "M4" or "MR".
 *
 * @return The M-key LED mask for the LED.
 * @throws CommandError If the name is not an LED.
 */
unsigned parseLed(const std::string &name);

/**
 * Split a command line into words, honoring single quotes, double quotes
 * and backslash escapes like a POSIX shell.
 *
 * @throws CommandError On an unterminated quote or a trailing backslash.
 */
std::vector<std::string> splitShellWords(const std::string &line);
