#pragma once

/** @file Process.hpp
 *
 * @brief Pipes and detached child processes.
 */

#include <string>
#include <vector>
#include <sstream>
#include <exception>

extern "C" {
    #include <unistd.h>
    #include <fcntl.h>
}

#include "SystemError.hpp"

class Pipe {
  public:
    int io[2];

    /**
     * @param flags Flags for pipe2(), e.g O_CLOEXEC | O_NONBLOCK.
     */
    inline explicit Pipe(int flags = O_CLOEXEC) {
        if (pipe2(io, flags) == -1) {
            throw SystemError("Unable to open pipe: ", errno);
        }
    }

    inline ~Pipe() {
        close(0);
        close(1);
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

    inline int get(int idx) const noexcept {
        return io[idx];
    }

    inline void close(int idx) noexcept {
        if (io[idx] != -1) {
            ::close(io[idx]);
            io[idx] = -1;
        }
    }
};

class SubprocessError : public std::exception {
  private:
    std::string expl;

  public:
    inline SubprocessError(const std::string &exe, const std::string &reason) {
        std::stringstream sstream;
        sstream << "Unable to run " << exe << ": " << reason;
        expl = sstream.str();
    }
    virtual const char *what() const noexcept override { return expl.c_str(); }
};

/**
 * Start a program that lives on its own.
 *
 * The program runs in a new process group, with stdin, stdout and stderr
 * connected to /dev/null and a default signal mask. It is not a child of
 * the calling process, so it never has to be waited for.
 *
 * Returns once the program has been exec()'d.
 *
 * @param argv Program name, looked up in $PATH, followed by its arguments.
 * @throws SubprocessError If the program could not be executed.
 * @throws SystemError If fork() or pipe() failed.
 */
void spawnDetached(const std::vector<std::string> &argv);
