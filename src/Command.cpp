#include <cctype>
#include <fmt/format.h>

#include "Command.hpp"
#include "utils.hpp"

using namespace std;

static int parseNumber(const string &digits, const string &token) {
    if (digits.empty() || digits.size() > 9)
        throw CommandError("Malformed token: '" + token + "'");
    for (char c : digits)
        if (!isdigit(static_cast<unsigned char>(c)))
            throw CommandError("Malformed token: '" + token + "'");
    return stoi(digits);
}

InputToken parseInputToken(const string &token) {
    if (token.size() >= 2 && token[0] == 's')
        return {InputToken::Sleep, false, parseNumber(token.substr(1), token)};

    if (token.size() < 3 || (token[0] != 'k' && token[0] != 'm') ||
        (token[1] != '+' && token[1] != '-'))
        throw CommandError("Malformed token: '" + token + "'");

    return {token[0] == 'k' ? InputToken::Key : InputToken::Mouse,
            token[1] == '+',
            parseNumber(token.substr(2), token)};
}

string formatInputToken(const InputToken &token) {
    switch (token.kind) {
        case InputToken::Sleep:
            return fmt::format("s{}", token.value);
        case InputToken::Key:
            return fmt::format("k{}{}", token.press ? '+' : '-', token.value);
        case InputToken::Mouse:
            return fmt::format("m{}{}", token.press ? '+' : '-', token.value);
    }
    return "";
}

unsigned parseLed(const string &name) {
    if (name == "MR")
        return 1 << 3;
    // Only the digit matters to the daemon, "L2" lights the same LED as "M2".
    if (name.size() == 2 && isalpha(static_cast<unsigned char>(name[0])) &&
        name[1] >= '1' && name[1] <= '4')
        return 1 << (name[1] - '1');
    throw CommandError("Unknown LED: '" + name + "'");
}

vector<string> splitShellWords(const string &line) {
    vector<string> words;
    string word;
    bool in_word = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        if (isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(word);
                word.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        switch (c) {
            case '\\':
                if (++i == line.size())
                    throw CommandError("Trailing backslash in: " + line);
                word += line[i];
                break;

            case '\'': {
                size_t end = line.find('\'', i + 1);
                if (end == string::npos)
                    throw CommandError("Unterminated quote in: " + line);
                word += line.substr(i + 1, end - i - 1);
                i = end;
                break;
            }

            case '"':
                for (i++;; i++) {
                    if (i >= line.size())
                        throw CommandError("Unterminated quote in: " + line);
                    if (line[i] == '"')
                        break;
                    // Inside double quotes a backslash only escapes these.
                    if (line[i] == '\\' && i + 1 < line.size() &&
                        string("\"\\$`").find(line[i + 1]) != string::npos)
                        i++;
                    word += line[i];
                }
                break;

            default:
                word += c;
        }
    }

    if (in_word)
        words.push_back(word);

    return words;
}

Command parseCommand(const string &raw) {
    string line = stringTrim(raw);

    if (stringStartsWith(line, "switch-profile ")) {
        string name = stringTrim(line.substr(15));
        if (name.empty())
            throw CommandError("switch-profile needs a profile name");
        return ProfileSwitch{name};
    }

    if (stringStartsWith(line, "set-leds ")) {
        SetLeds cmd;
        for (const auto &led : stringSplit(line.substr(9), ','))
            cmd.masks.push_back(parseLed(led));
        return cmd;
    }

    if (stringStartsWith(line, "emit ")) {
        Emit cmd;
        for (const auto &token : stringSplit(line.substr(5), ','))
            cmd.tokens.push_back(parseInputToken(token));
        return cmd;
    }

    if (line == "record")
        return Record{};

    auto argv = splitShellWords(line);
    if (argv.empty())
        throw CommandError("Empty command");
    return Shell{argv};
}
