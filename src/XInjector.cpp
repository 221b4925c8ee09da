extern "C" {
    #include <X11/Xlib.h>
    #include <X11/extensions/XTest.h>
    #include <X11/extensions/record.h>
}

#include "XInjector.hpp"
#include "Logging.hpp"
#include "utils.hpp"

using namespace std;

static Display *openDisplay(const string &name) {
    return XOpenDisplay(name.empty() ? nullptr : name.c_str());
}

static string displayName(const string &name) {
    return XDisplayName(name.empty() ? nullptr : name.c_str());
}

XInjector::XInjector(const string &display_name)
    : display_name(display_name)
{}

XInjector::~XInjector() {
    if (display)
        XCloseDisplay(display);
}

Display *XInjector::getDisplay() {
    if (display)
        return display;

    if ((display = openDisplay(display_name)) == nullptr)
        throw InjectError("Unable to open X display " + displayName(display_name));

    int ev_base, err_base, major, minor;
    if (!XTestQueryExtension(display, &ev_base, &err_base, &major, &minor)) {
        XCloseDisplay(display);
        display = nullptr;
        throw InjectError("The XTest extension is not available on " + displayName(display_name));
    }

    Log::debug("Using XTest {}.{} for input injection", major, minor);
    return display;
}

void XInjector::inject(InputKind kind, bool press, int code) {
    Display *dpy = getDisplay();
    Status ok;

    if (kind == InputKind::Key)
        ok = XTestFakeKeyEvent(dpy, code, press ? True : False, CurrentTime);
    else
        ok = XTestFakeButtonEvent(dpy, code, press ? True : False, CurrentTime);

    if (!ok)
        throw InjectError(fmt::format("Unable to inject {} {} {}",
                                      kind == InputKind::Key ? "key" : "button",
                                      code, press ? "press" : "release"));
}

void XInjector::sync() {
    if (display)
        XSync(display, False);
}

XRecordCapture::XRecordCapture(const string &display_name)
    : display_name(display_name)
{}

XRecordCapture::~XRecordCapture() {
    stop();
}

void XRecordCapture::intercept(XPointer self, XRecordInterceptData *rec) {
    auto *cap = reinterpret_cast<XRecordCapture *>(self);

    if (rec->category == XRecordFromServer && rec->data_len > 0) {
        int type = rec->data[0] & 0x7f;
        int code = rec->data[1];
        if (type == KeyPress || type == KeyRelease) {
            try {
                cap->callback(code, type == KeyPress);
            } catch (const exception &e) {
                Log::error("Dropped captured key {}: {}", code, e.what());
            }
        }
    }

    XRecordFreeData(rec);
}

void XRecordCapture::start(CaptureFn fn) {
    if (context)
        throw CaptureError("Already capturing");

    ctrl = openDisplay(display_name);
    data = openDisplay(display_name);
    if (!ctrl || !data) {
        release();
        throw CaptureError("Unable to open X display " + displayName(display_name));
    }

    int major, minor;
    if (!XRecordQueryVersion(ctrl, &major, &minor)) {
        release();
        throw CaptureError("The RECORD extension is not available on " + displayName(display_name));
    }

    auto range = mkuniq(XRecordAllocRange(), XFree);
    if (!range) {
        release();
        throw CaptureError("Unable to allocate a RECORD range");
    }
    range->device_events.first = KeyPress;
    range->device_events.last = KeyRelease;

    XRecordClientSpec clients = XRecordAllClients;
    XRecordRange *ranges[] = {range.get()};
    context = XRecordCreateContext(ctrl, 0, &clients, 1, ranges, 1);
    if (!context) {
        release();
        throw CaptureError("Unable to create a RECORD context");
    }
    XSync(ctrl, False);

    callback = move(fn);
    worker = thread([this]() {
        // Blocks until XRecordDisableContext() is called from stop().
        if (!XRecordEnableContext(data, context, &XRecordCapture::intercept,
                                  reinterpret_cast<XPointer>(this)))
            Log::error("Unable to enable the RECORD context");
    });

    Log::debug("Capturing key events with RECORD {}.{}", major, minor);
}

void XRecordCapture::stop() noexcept {
    if (!context)
        return;

    XRecordDisableContext(ctrl, context);
    XSync(ctrl, False);
    if (worker.joinable())
        worker.join();
    release();
}

void XRecordCapture::release() noexcept {
    if (context && ctrl)
        XRecordFreeContext(ctrl, context);
    context = 0;
    if (data)
        XCloseDisplay(data);
    if (ctrl)
        XCloseDisplay(ctrl);
    data = ctrl = nullptr;
    callback = nullptr;
}
