#pragma once

/** @file utils.hpp
 *
 * @brief Miscellaneous utilities used throughout g15keys.
 */

#include <memory>
#include <sstream>
#include <string>
#include <vector>

/**
 * Create a unique_ptr<T> value, with a custom deleter.
 *
 *   auto ptr = mkuniq(p, free);
 */
template <class T, class F>
inline std::unique_ptr<T, F> mkuniq(T *p, F fn) {
    return std::unique_ptr<T, decltype(fn)>(p, fn);
}

/**
 * stringstream is too much typing, use sstream (like the header)
 * instead.
 */
using sstream = std::stringstream;

class StringJoiner {
private:
    std::string sep;

public:
    inline StringJoiner(std::string sep) : sep(sep) {}

    template <class... Ts>
    inline std::string join(Ts... parts) {
        std::stringstream sstream;
        return _join(&sstream, parts...);
    }

    /** Join the elements of a container with the separator. */
    template <class C>
    inline std::string joinAll(const C &parts) {
        std::stringstream sstream;
        bool first = true;
        for (const auto &part : parts) {
            if (!first)
                sstream << sep;
            sstream << part;
            first = false;
        }
        return sstream.str();
    }

private:
    template <class T>
    inline std::string _join(std::stringstream *stream, T arg) {
        (*stream) << arg;
        return stream->str();
    }

    template <class T, class... Ts>
    inline std::string _join(std::stringstream *stream, T arg, Ts... rest) {
        (*stream) << arg << sep;
        return _join(stream, rest...);
    }
};

template <class... Ts>
static inline std::string pathJoin(Ts... parts) {
    StringJoiner joiner("/");
    return joiner.join(parts...);
}

/**
 * Check if string `a` starts with string `b`.
 * NOTE: This is a strict starts with, so it will return false if a == b.
 */
static inline bool stringStartsWith(const std::string& a, const std::string& b) {
    return a.size() > b.size() && a.compare(0, b.size(), b) == 0;
}

/** Strip leading and trailing blanks. */
static inline std::string stringTrim(const std::string &s) {
    const char *ws = " \t\r\n";
    size_t beg = s.find_first_not_of(ws);
    if (beg == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(beg, end - beg + 1);
}

/**
 * Split a string on a separator character, every part is trimmed.
 *
 * An empty input gives an empty vector, "a,,b" gives {"a", "", "b"}.
 */
static inline std::vector<std::string> stringSplit(const std::string &s, char sep) {
    std::vector<std::string> parts;
    if (stringTrim(s).empty())
        return parts;
    size_t beg = 0;
    for (;;) {
        size_t end = s.find(sep, beg);
        parts.push_back(stringTrim(s.substr(beg, end - beg)));
        if (end == std::string::npos)
            break;
        beg = end + 1;
    }
    return parts;
}
