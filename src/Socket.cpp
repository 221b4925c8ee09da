extern "C" {
    #include <unistd.h>
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <netdb.h>
    #include <poll.h>
    #include <errno.h>
}

#include <string>
#include <memory>

#include "Socket.hpp"
#include "SystemError.hpp"

using namespace std;

RecvStatus recvAll(int fd, char *dst, size_t sz, int wake_fd) {
    size_t got = 0;

    while (got < sz) {
        if (got == 0 && wake_fd != -1) {
            struct pollfd pfds[2];
            pfds[0].fd = fd;
            pfds[0].events = POLLIN;
            pfds[1].fd = wake_fd;
            pfds[1].events = POLLIN;

            if (poll(pfds, 2, -1) == -1) {
                if (errno == EINTR)
                    continue;
                throw SocketError("Error in poll(): " + SystemError::getErrorString());
            }
            if (pfds[1].revents & POLLIN)
                return RecvStatus::Interrupted;
            if (!pfds[0].revents)
                continue;
        }

        ssize_t n = ::read(fd, dst + got, sz - got);
        if (n == 0)
            return RecvStatus::Closed;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw SocketError("Unable to receive packet: " + SystemError::getErrorString());
        }
        got += n;
    }

    return RecvStatus::Ok;
}

TCPSocket::~TCPSocket() noexcept {
    close();
}

void TCPSocket::connectTo(const string &host, uint16_t port) {
    close();

    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *res_raw = nullptr;
    string service = to_string(port);
    int ret = getaddrinfo(host.c_str(), service.c_str(), &hints, &res_raw);
    if (ret != 0)
        throw SocketError("Unable to resolve " + host + ": " + gai_strerror(ret));
    auto res = unique_ptr<struct addrinfo, decltype(&freeaddrinfo)>(res_raw, &freeaddrinfo);

    int last_errno = 0;
    for (struct addrinfo *ai = res.get(); ai != nullptr; ai = ai->ai_next) {
        int sock = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (sock == -1) {
            last_errno = errno;
            continue;
        }
        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd = sock;
            return;
        }
        last_errno = errno;
        ::close(sock);
    }

    throw SocketError("Unable to connect to " + host + ":" + service + ": " +
                      SystemError::getErrorString(last_errno));
}

bool TCPSocket::sendAll(const void *buf, size_t sz) noexcept {
    if (fd == -1)
        return false;

    const char *p = static_cast<const char *>(buf);
    while (sz > 0) {
        ssize_t n = ::send(fd, p, sz, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += n;
        sz -= n;
    }
    return true;
}

RecvStatus TCPSocket::recv(char *dst, size_t sz, int wake_fd) {
    if (fd == -1)
        return RecvStatus::Closed;
    return recvAll(fd, dst, sz, wake_fd);
}

void TCPSocket::shutdown() noexcept {
    if (fd != -1)
        ::shutdown(fd, SHUT_RDWR);
}

void TCPSocket::close() noexcept {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}
