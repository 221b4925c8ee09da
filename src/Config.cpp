extern "C" {
    #include <stdio.h>
    #include <errno.h>
}

#include <fstream>
#include <sstream>

#include "Config.hpp"
#include "KeyState.hpp"
#include "Logging.hpp"
#include "SystemError.hpp"
#include "utils.hpp"

using namespace std;
using json = nlohmann::ordered_json;

vector<string> bindingCommands(const Binding &binding, bool pressed) {
    if (auto *single = get_if<SingleBinding>(&binding)) {
        if (!pressed)
            return {single->command};
    } else if (auto *seq = get_if<SequenceBinding>(&binding)) {
        if (!pressed)
            return seq->commands;
    } else if (auto *phase = get_if<PhaseBinding>(&binding)) {
        const auto &cmd = pressed ? phase->pressed : phase->released;
        if (cmd)
            return {*cmd};
    }
    return {};
}

static Binding bindingFromJson(const string &profile, const string &key, const json &val) {
    if (val.is_string())
        return SingleBinding{val.get<string>()};

    if (val.is_array()) {
        SequenceBinding seq;
        for (const auto &cmd : val) {
            if (!cmd.is_string())
                throw ConfigError(fmt::format("{}/{}: command lists may only hold strings",
                                              profile, key));
            seq.commands.push_back(cmd.get<string>());
        }
        return seq;
    }

    if (val.is_object()) {
        PhaseBinding phase;
        for (const auto &item : val.items()) {
            if (item.key() != "pressed" && item.key() != "released") {
                Log::warn("{}/{}: ignoring unknown field '{}'", profile, key, item.key());
                continue;
            }
            if (!item.value().is_string())
                throw ConfigError(fmt::format("{}/{}: '{}' must be a string",
                                              profile, key, item.key()));
            if (item.key() == "pressed")
                phase.pressed = item.value().get<string>();
            else
                phase.released = item.value().get<string>();
        }
        return phase;
    }

    throw ConfigError(fmt::format("{}/{}: expected a string, a list of strings or an "
                                  "object with \"pressed\"/\"released\"", profile, key));
}

static json bindingToJson(const Binding &binding) {
    if (auto *single = get_if<SingleBinding>(&binding))
        return single->command;

    if (auto *seq = get_if<SequenceBinding>(&binding))
        return seq->commands;

    const auto &phase = get<PhaseBinding>(binding);
    json obj = json::object();
    if (phase.pressed)
        obj["pressed"] = *phase.pressed;
    if (phase.released)
        obj["released"] = *phase.released;
    return obj;
}

Config Config::fromJson(const json &doc) {
    if (!doc.is_object())
        throw ConfigError("The configuration must be an object of profiles");

    Config cfg;
    for (const auto &prof_item : doc.items()) {
        const string &name = prof_item.key();
        if (!prof_item.value().is_object())
            throw ConfigError(fmt::format("Profile '{}' must be an object of key bindings", name));

        Profile profile;
        for (const auto &key_item : prof_item.value().items()) {
            if (keyMask(key_item.key()) == 0)
                Log::notice("Profile '{}' binds unknown key '{}'", name, key_item.key());
            profile[key_item.key()] = bindingFromJson(name, key_item.key(), key_item.value());
        }
        cfg.setProfile(name, move(profile));
    }

    if (cfg.empty())
        throw ConfigError("No profile found");

    return cfg;
}

Config Config::parse(const string &text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error &e) {
        throw ConfigError(string("Invalid JSON: ") + e.what());
    }
    return fromJson(doc);
}

Config Config::load(const string &path) {
    ifstream in(path);
    if (!in)
        throw ConfigError("Unable to open " + path + ": " + SystemError::getErrorString());

    sstream ss;
    ss << in.rdbuf();
    string text = ss.str();
    if (stringTrim(text).empty())
        throw ConfigError(path + " is empty");

    try {
        return parse(text);
    } catch (const ConfigError &e) {
        throw ConfigError(path + ": " + e.what());
    }
}

void Config::save(const string &path) const {
    string tmp = path + ".tmp";
    {
        ofstream out(tmp, ios::trunc);
        if (!out)
            throw SystemError("Unable to open " + tmp + ": ", errno);
        out << toJson().dump(4) << endl;
        if (!out)
            throw SystemError("Unable to write " + tmp + ": ", errno);
    }

    if (::rename(tmp.c_str(), path.c_str()) == -1)
        throw SystemError("Unable to replace " + path + ": ", errno);
}

json Config::toJson() const {
    json doc = json::object();
    for (const auto &[name, profile] : profiles) {
        json jprof = json::object();
        for (const auto &[key, binding] : profile)
            jprof[key] = bindingToJson(binding);
        doc[name] = jprof;
    }
    return doc;
}

Profile *Config::find(const string &name) {
    for (auto &[pname, profile] : profiles)
        if (pname == name)
            return &profile;
    return nullptr;
}

const Profile *Config::find(const string &name) const {
    for (const auto &[pname, profile] : profiles)
        if (pname == name)
            return &profile;
    return nullptr;
}

const string &Config::firstProfile() const {
    if (profiles.empty())
        throw ConfigError("No profile found");
    return profiles.front().first;
}

void Config::setProfile(const string &name, Profile profile) {
    if (Profile *existing = find(name)) {
        *existing = move(profile);
        return;
    }
    profiles.emplace_back(name, move(profile));
}
