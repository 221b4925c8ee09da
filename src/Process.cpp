extern "C" {
    #include <sys/types.h>
    #include <sys/wait.h>
    #include <signal.h>
    #include <errno.h>
}

#include "Process.hpp"

using namespace std;

/** Report errno to the parent through the error pipe and exit. */
[[noreturn]] static void childFail(int fd, int status) {
    int err = errno;
    // Nothing more can be done if this fails, the parent then sees success.
    ssize_t n = ::write(fd, &err, sizeof(err));
    (void) n;
    _exit(status);
}

void spawnDetached(const vector<string> &argv) {
    if (argv.empty())
        throw SubprocessError("(nothing)", "empty argument list");

    // Everything the children need is prepared before fork(), only
    // async-signal-safe calls are made between fork() and exec().
    vector<char *> cargv;
    for (const auto &arg : argv)
        cargv.push_back(const_cast<char *>(arg.c_str()));
    cargv.push_back(nullptr);

    // Close-on-exec, so the read end sees EOF once exec() succeeds.
    Pipe err;

    pid_t pid = fork();
    switch (pid) {
        case -1:
            throw SystemError("Unable to fork(): ", errno);

        case 0: {
            err.close(0);
            pid_t grandchild = fork();
            if (grandchild == -1)
                childFail(err.get(1), 1);
            if (grandchild > 0)
                _exit(0);

            setpgid(0, 0);

            sigset_t none;
            sigemptyset(&none);
            sigprocmask(SIG_SETMASK, &none, nullptr);
            signal(SIGPIPE, SIG_DFL);

            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull != -1) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO)
                    ::close(devnull);
            }

            execvp(cargv[0], cargv.data());
            childFail(err.get(1), 127);
        }

        default:
            break;
    }

    err.close(1);

    int status;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR)
        continue;

    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(err.get(0), &child_errno, sizeof(child_errno))) == -1 && errno == EINTR)
        continue;

    if (n == sizeof(child_errno))
        throw SubprocessError(argv[0], SystemError::getErrorString(child_errno));
}
