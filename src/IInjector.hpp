/* =====================================================================================
 * Input injection abstract class.
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

/** @file IInjector.hpp
 *
 * Synthetic input interfaces: injecting events, and capturing the events
 * the user types so they can be replayed later.
 */

#pragma once

#include <string>
#include <functional>
#include <stdexcept>

enum class InputKind {
    Key,
    Mouse,
};

class InjectError : public std::runtime_error {
public:
    explicit InjectError(const std::string &expl) : std::runtime_error(expl) {}
};

class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string &expl) : std::runtime_error(expl) {}
};

class IInjector {
public:
    virtual ~IInjector() {}

    /**
     * Inject an input event.
     *
     * @param kind Key or mouse button event.
     * @param press True for a press, false for a release.
     * @param code Key code or button number.
     * @throws InjectError If the event could not be injected.
     */
    virtual void inject(InputKind kind, bool press, int code) = 0;

    /**
     * Wait until all injected events have been processed.
     *
     * @throws InjectError If the display connection is unusable.
     */
    virtual void sync() = 0;
};

/**
 * Called for every captured key event, from the capture thread.
 *
 * @param code Key code.
 * @param press True for a press, false for a release.
 */
using CaptureFn = std::function<void(int code, bool press)>;

class IEventCapture {
public:
    virtual ~IEventCapture() {}

    /**
     * Start delivering key events to `fn` from a separate thread.
     *
     * @throws CaptureError If capturing could not be started.
     */
    virtual void start(CaptureFn fn) = 0;

    /**
     * Stop capturing. When this returns `fn` is not running and will not be
     * called again. Calling stop() when not capturing does nothing.
     */
    virtual void stop() noexcept = 0;
};
