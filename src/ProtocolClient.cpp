extern "C" {
    #include <poll.h>
    #include <errno.h>
}

#include <cstring>
#include <thread>
#include <fmt/chrono.h>

#include "ProtocolClient.hpp"
#include "Logging.hpp"
#include "SystemError.hpp"

using namespace std;
using namespace std::chrono;

const char *screenTag(ScreenType type) noexcept {
    switch (type) {
        case ScreenType::Text:  return "TBUF";
        case ScreenType::WBmp:  return "WBUF";
        case ScreenType::G15R:  return "RBUF";
        case ScreenType::Pixel: return "GBUF";
    }
    return "RBUF";
}

uint8_t encodeCommand(Opcode op, unsigned value) {
    unsigned max;
    switch (op) {
        case Opcode::KeyHandler:
        case Opcode::MKeyLeds:
            max = 1 << 3;
            break;
        case Opcode::Contrast:
        case Opcode::Backlight:
            max = 1 << 2;
            break;
        default:
            max = 0;
    }
    if (value > max)
        throw invalid_argument(fmt::format("Value {} out of range for opcode {:#04x}",
                                           value, static_cast<unsigned>(op)));
    return static_cast<uint8_t>(op) | static_cast<uint8_t>(value);
}

uint32_t decodeKeyState(const unsigned char buf[4]) noexcept {
    return  static_cast<uint32_t>(buf[0])        |
           (static_cast<uint32_t>(buf[1]) << 8)  |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 24);
}

ProtocolClient::ProtocolClient(ScreenType screen_type,
                               const string &host,
                               uint16_t port,
                               Milliseconds retry_delay)
    : host(host),
      port(port),
      screen_type(screen_type),
      retry_delay(retry_delay),
      leds(G15_STARTUP_LEDS)
{}

void ProtocolClient::connect(ScreenType type) {
    sock.connectTo(host, port);

    try {
        char greeting[G15_DAEMON_GREETING_LEN];
        if (sock.recv(greeting, sizeof(greeting)) != RecvStatus::Ok)
            throw SocketError("Connection closed during handshake");
        if (memcmp(greeting, G15_DAEMON_GREETING, sizeof(greeting)) != 0)
            throw HandshakeError("Wrong daemon greeting: '" + string(greeting, sizeof(greeting)) + "'");

        screen_type = type;
        disconnecting = false;
        if (!sock.sendAll(screenTag(type), 4))
            throw SocketError("Unable to register screen type");
        if (sendCommand(Opcode::KeyHandler) != Link::Ok ||
            sendCommand(Opcode::MKeyLeds, leds) != Link::Ok)
            throw SocketError("Connection dropped during session setup");
    } catch (...) {
        sock.close();
        throw;
    }

    session++;
    Log::info("Connected to g15daemon on {}:{} as {}", host, port, screenTag(type));
}

bool ProtocolClient::retryWait() {
    auto deadline = steady_clock::now() + retry_delay;

    for (;;) {
        auto left = duration_cast<Milliseconds>(deadline - steady_clock::now());
        if (left <= Milliseconds(0))
            return true;

        if (wake_fd == -1) {
            this_thread::sleep_for(left);
            continue;
        }

        struct pollfd pfd;
        pfd.fd = wake_fd;
        pfd.events = POLLIN;
        switch (poll(&pfd, 1, left.count())) {
            case -1:
                if (errno != EINTR)
                    this_thread::sleep_for(left);
                break;

            case 0:
                return true;

            default:
                return false;
        }
    }
}

bool ProtocolClient::reconnect() {
    for (unsigned attempt = 1;; attempt++) {
        try {
            connect(screen_type);
            if (attempt > 1)
                Log::info("Reconnected to g15daemon after {} attempts", attempt);
            return true;
        } catch (const SocketError &e) {
            Log::warn("{}, retrying in {}", e.what(), retry_delay);
        }

        if (!retryWait())
            return false;
    }
}

Link ProtocolClient::recvFrame(char *dst, size_t sz, int wake) {
    try {
        switch (sock.recv(dst, sz, wake)) {
            case RecvStatus::Ok:
                return Link::Ok;

            case RecvStatus::Interrupted:
                return Link::Interrupted;

            case RecvStatus::Closed:
                if (!disconnecting && sock.isOpen())
                    Log::warn("Connection closed by g15daemon");
                break;
        }
    } catch (const SocketError &e) {
        if (!disconnecting)
            Log::error("Socket error: {}", e.what());
    }

    sock.close();
    return Link::Disconnected;
}

Link ProtocolClient::sendCommand(Opcode op, unsigned value, uint32_t *reply) {
    uint8_t packet = encodeCommand(op, value);
    Log::debug("Sending packet (1 byte) to daemon: {:#04x}", packet);

    if (!sock.sendAll(&packet, sizeof(packet))) {
        if (!disconnecting && sock.isOpen())
            Log::warn("Unable to send command {:#04x}: {}", packet, SystemError::getErrorString());
        sock.close();
        return Link::Disconnected;
    }

    switch (op) {
        case Opcode::GetKeyState: {
            unsigned char buf[4];
            Link link = recvFrame(reinterpret_cast<char *>(buf), sizeof(buf), -1);
            if (link != Link::Ok)
                return link;
            if (reply)
                *reply = decodeKeyState(buf);
            break;
        }

        case Opcode::IsForeground:
        case Opcode::IsUserSelected: {
            unsigned char buf[2];
            Link link = recvFrame(reinterpret_cast<char *>(buf), sizeof(buf), -1);
            if (link != Link::Ok)
                return link;
            // The daemon answers with an ASCII digit in a 16-bit word.
            uint32_t v = static_cast<uint32_t>(buf[0]) | (static_cast<uint32_t>(buf[1]) << 8);
            if (reply)
                *reply = v >= '0' ? v - '0' : 0;
            break;
        }

        default:
            break;
    }

    return Link::Ok;
}

Link ProtocolClient::waitForKeyState(uint32_t *keys, bool interruptible) {
    unsigned char buf[4];
    Link link = recvFrame(reinterpret_cast<char *>(buf), sizeof(buf),
                          interruptible ? wake_fd : -1);
    if (link == Link::Ok)
        *keys = decodeKeyState(buf);
    return link;
}

void ProtocolClient::disconnect() noexcept {
    disconnecting = true;
    sock.shutdown();
    sock.close();
}

Link ProtocolClient::setLeds(unsigned mask) {
    Link link = sendCommand(Opcode::MKeyLeds, mask);
    leds = mask;
    return link;
}

Link ProtocolClient::queryKeyState(uint32_t *keys) {
    return sendCommand(Opcode::GetKeyState, 0, keys);
}

Link ProtocolClient::isForeground(bool *fg) {
    uint32_t v = 0;
    Link link = sendCommand(Opcode::IsForeground, 0, &v);
    *fg = v != 0;
    return link;
}

Link ProtocolClient::isUserSelected(bool *sel) {
    uint32_t v = 0;
    Link link = sendCommand(Opcode::IsUserSelected, 0, &v);
    *sel = v != 0;
    return link;
}
