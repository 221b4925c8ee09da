#pragma once

#include <string>
#include <exception>
#include <mutex>

extern "C" {
    #include <string.h>
    #include <errno.h>
    #include <execinfo.h>
    #include <stdio.h>
}

static std::mutex strerror_mtx;
static constexpr size_t STACK_MAX_ELEMS = 64;

/**
 * Error from a failed system call, carries the backtrace of the throw site.
 */
class SystemError : public std::exception {
private:
    std::string expl;
    void *stack[STACK_MAX_ELEMS];
    size_t stack_sz = 0;

public:
    explicit SystemError(const std::string &expl) : expl(expl) {
        stack_sz = backtrace(stack, STACK_MAX_ELEMS);
    }

    /**
     * @param expl Explanation, the strerror() text of `errnum` is appended.
     * @param errnum The errno value.
     */
    inline SystemError(const std::string &expl, int errnum)
        : expl(expl + getErrorString(errnum))
    {
        stack_sz = backtrace(stack, STACK_MAX_ELEMS);
    }

    inline void printBacktrace() const {
        if (stack_sz > 1)
            backtrace_symbols_fd(stack + 1, stack_sz - 1, fileno(stderr));
    }

    static inline std::string getErrorString(int errnum) {
        // strerror() is not thread-safe.
        std::lock_guard<std::mutex> lock(strerror_mtx);
        return std::string(strerror(errnum));
    }

    static inline std::string getErrorString() {
        return getErrorString(errno);
    }

    virtual const char *what() const noexcept override {
        return expl.c_str();
    }
};
