#include "MacroRecorder.hpp"
#include "Logging.hpp"
#include "utils.hpp"

using namespace std;

MacroRecorder::MacroRecorder(IEventCapture &capture, size_t max_pending)
    : capture(capture),
      pending(max_pending)
{}

MacroRecorder::~MacroRecorder() {
    if (capturing)
        capture.stop();
}

bool MacroRecorder::start() {
    if (capturing)
        return false;

    tokens.clear();
    pending.drain();
    pending.takeDropped();

    capture.start([this](int code, bool press) {
        pending.trySend({InputToken::Key, press, code});
    });
    capturing = true;

    Log::info("Started recording macro");
    return true;
}

void MacroRecorder::collect() {
    for (auto &token : pending.drain())
        tokens.push_back(token);
}

optional<string> MacroRecorder::stop() {
    if (!capturing)
        return nullopt;

    capture.stop();
    capturing = false;
    collect();

    if (size_t dropped = pending.takeDropped())
        Log::warn("Recording overflowed, {} key events were lost", dropped);

    if (tokens.empty()) {
        Log::info("Finished recording, nothing was captured");
        return nullopt;
    }

    vector<string> parts;
    for (const auto &token : tokens)
        parts.push_back(formatInputToken(token));
    tokens.clear();

    string cmd = "emit " + StringJoiner(",").joinAll(parts);
    Log::debug("Finished recording: {}", cmd);
    return cmd;
}
