/** @file XInjector.hpp
 *
 * @brief X11 input injection and capture.
 */

#pragma once

#include <string>
#include <thread>

extern "C" {
    #include <X11/Xlib.h>
    #include <X11/extensions/record.h>
}

#include "IInjector.hpp"

/**
 * Injects key and button events through the XTest extension.
 *
 * The display is opened on first use, so the client can run without an X
 * server as long as no emit command is used.
 */
class XInjector : public IInjector {
private:
    std::string display_name;
    Display *display = nullptr;

    Display *getDisplay();

public:
    /** @param display_name X display, empty for $DISPLAY. */
    explicit XInjector(const std::string &display_name = "");

    ~XInjector();

    virtual void inject(InputKind kind, bool press, int code) override;

    virtual void sync() override;
};

/**
 * Captures key events with the RECORD extension.
 *
 * RECORD needs two connections, one blocks in XRecordEnableContext() on the
 * capture thread and the other one controls the context.
 */
class XRecordCapture : public IEventCapture {
private:
    std::string display_name;
    Display *ctrl = nullptr;
    Display *data = nullptr;
    XRecordContext context = 0;
    std::thread worker;
    CaptureFn callback;

    static void intercept(XPointer self, XRecordInterceptData *data);

    void release() noexcept;

public:
    /** @param display_name X display, empty for $DISPLAY. */
    explicit XRecordCapture(const std::string &display_name = "");

    ~XRecordCapture();

    virtual void start(CaptureFn fn) override;

    virtual void stop() noexcept override;
};
