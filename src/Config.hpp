/** @file Config.hpp
 *
 * @brief Profiles and key bindings, loaded from and saved to JSON.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <utility>
#include <stdexcept>

#include <nlohmann/json.hpp>

/** One command, fired when the key is released. */
struct SingleBinding {
    std::string command;

    inline bool operator==(const SingleBinding &o) const { return command == o.command; }
};

/** Commands run in order when the key is released. */
struct SequenceBinding {
    std::vector<std::string> commands;

    inline bool operator==(const SequenceBinding &o) const { return commands == o.commands; }
};

/** Separate commands for the press and the release of a key. */
struct PhaseBinding {
    std::optional<std::string> pressed;
    std::optional<std::string> released;

    inline bool operator==(const PhaseBinding &o) const {
        return pressed == o.pressed && released == o.released;
    }
};

using Binding = std::variant<SingleBinding, SequenceBinding, PhaseBinding>;

/** Key name to binding. */
using Profile = std::map<std::string, Binding>;

/**
 * The commands a binding fires for one phase of a key.
 *
 * @param binding The binding.
 * @param pressed True for the press, false for the release.
 * @return Commands to execute in order, empty if nothing should happen.
 */
std::vector<std::string> bindingCommands(const Binding &binding, bool pressed);

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &expl) : std::runtime_error(expl) {}
};

/**
 * Ordered collection of named profiles.
 *
 * A loaded Config always holds at least one profile.
 */
class Config {
private:
    std::vector<std::pair<std::string, Profile>> profiles;

public:
    /**
     * Build a Config from its JSON form.
     *
     * @throws ConfigError If the document does not have the expected shape
     *                     or holds no profile.
     */
    static Config fromJson(const nlohmann::ordered_json &doc);

    /**
     * Parse a Config from JSON text.
     *
     * @throws ConfigError See fromJson(), also thrown on syntax errors.
     */
    static Config parse(const std::string &text);

    /**
     * Load a Config from a file.
     *
     * @throws ConfigError If the file cannot be read or parsed.
     */
    static Config load(const std::string &path);

    /**
     * Write the Config to a file, replacing it atomically.
     *
     * @throws SystemError If the file cannot be written.
     */
    void save(const std::string &path) const;

    nlohmann::ordered_json toJson() const;

    /** Profile by name, nullptr if it does not exist. */
    Profile *find(const std::string &name);
    const Profile *find(const std::string &name) const;

    inline bool contains(const std::string &name) const { return find(name) != nullptr; }

    /** Name of the first profile, see the class invariant. */
    const std::string &firstProfile() const;

    /** Add a profile, or replace the profile of the same name. */
    void setProfile(const std::string &name, Profile profile);

    inline size_t size() const noexcept { return profiles.size(); }

    inline bool empty() const noexcept { return profiles.empty(); }

    inline auto begin() const { return profiles.begin(); }
    inline auto end() const { return profiles.end(); }
};
