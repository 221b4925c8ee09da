/* =====================================================================================
 * TCP socket helper library.
 *
 * Copyright (C) 2018 Jonas Møller (no) <jonas.moeller2@protonmail.com>
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 * =====================================================================================
 */

/** @file Socket.hpp
 *
 * @brief TCP socket helper library.
 */

#pragma once

#include <string>
#include <exception>
#include <cstdint>

class SocketError : public std::exception {
private:
    std::string expl;
public:
    explicit SocketError(const std::string& expl) noexcept : expl(expl) {}

    virtual const char *what() const noexcept override {
        return expl.c_str();
    }
};

/** Outcome of an all-or-nothing receive. */
enum class RecvStatus {
    /** The whole buffer was filled. */
    Ok,
    /** The peer closed the connection (read() returned 0). */
    Closed,
    /** The wake descriptor became readable before any byte arrived. */
    Interrupted,
};

/**
 * Receive an exact amount of bytes on a file descriptor,
 * all or nothing.
 *
 * If `wake_fd` is not -1 it is polled together with `fd` until the first
 * byte of the buffer has arrived. Once a partial buffer has been received
 * the wake descriptor is ignored so that framing is never broken.
 *
 * @param fd The file descriptor to receive on.
 * @param dst The buffer to insert received data into.
 * @param sz The amount of bytes to be read.
 * @param wake_fd Descriptor that interrupts the wait, or -1.
 * @throws SocketError If read() or poll() fails.
 */
RecvStatus recvAll(int fd, char *dst, size_t sz, int wake_fd = -1);

/**
 * Connected TCP stream socket.
 *
 * The descriptor is owned by the object and closed on destruction.
 */
class TCPSocket {
private:
    int fd = -1;

public:
    TCPSocket() noexcept = default;
    ~TCPSocket() noexcept;

    TCPSocket(const TCPSocket &) = delete;
    TCPSocket &operator=(const TCPSocket &) = delete;

    /**
     * Establish a connection, closing any previous one.
     *
     * Every address `host` resolves to is tried in order.
     *
     * @throws SocketError If no address accepted the connection.
     */
    void connectTo(const std::string &host, uint16_t port);

    /**
     * Send a whole buffer.
     *
     * @return False if the buffer could not be sent, the caller decides
     *         whether that means the peer is gone.
     */
    bool sendAll(const void *buf, size_t sz) noexcept;

    /** See recvAll(). */
    RecvStatus recv(char *dst, size_t sz, int wake_fd = -1);

    /** Shut down both directions, unblocks readers on other threads. */
    void shutdown() noexcept;

    /** Closes the connection. */
    void close() noexcept;

    inline bool isOpen() const noexcept { return fd != -1; }

    inline int getFd() const noexcept { return fd; }
};
