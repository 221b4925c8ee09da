/** @file MacroRecorder.hpp
 *
 * @brief Records typed keys into an emit command.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

#include "IInjector.hpp"
#include "Command.hpp"
#include "Channel.hpp"

/**
 * Two-state recorder, Idle and Capturing.
 *
 * The capture thread only pushes tokens into a bounded channel, the thread
 * owning the recorder is the only one that reads them into the recording
 * and the only one that starts or stops the capture.
 */
class MacroRecorder {
private:
    IEventCapture &capture;
    Channel<InputToken> pending;
    std::vector<InputToken> tokens;
    bool capturing = false;

public:
    /**
     * @param capture Source of key events.
     * @param max_pending Captured events that may wait for collect() before
     *                    new ones are dropped.
     */
    explicit MacroRecorder(IEventCapture &capture, size_t max_pending = 4096);

    ~MacroRecorder();

    MacroRecorder(const MacroRecorder &) = delete;
    MacroRecorder &operator=(const MacroRecorder &) = delete;

    /**
     * Go from Idle to Capturing.
     *
     * @return False if a recording was already in progress.
     * @throws CaptureError If the capture could not be started, the recorder
     *                      stays Idle.
     */
    bool start();

    /**
     * Go from Capturing to Idle.
     *
     * @return The recording as an emit command, or nothing if no key was
     *         captured.
     */
    std::optional<std::string> stop();

    /** Move captured events into the recording. */
    void collect();

    inline bool isCapturing() const noexcept { return capturing; }

    /** Events collected so far. */
    inline const std::vector<InputToken> &getTokens() const noexcept { return tokens; }
};
