/** @file ProtocolClient.hpp
 *
 * @brief Client side of the g15daemon socket protocol.
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <stdexcept>

#include "Socket.hpp"

/** Port g15daemon listens on. */
static constexpr uint16_t G15_DAEMON_PORT = 15550;

/** Greeting sent by the daemon to every new client. */
static constexpr char G15_DAEMON_GREETING[] = "G15 daemon HELLO";
static constexpr size_t G15_DAEMON_GREETING_LEN = sizeof(G15_DAEMON_GREETING) - 1;

/** Screen buffer types a client can register as. */
enum class ScreenType {
    Text,
    WBmp,
    G15R,
    Pixel,
};

/** The 4-byte registration tag for a screen type. */
const char *screenTag(ScreenType type) noexcept;

/** Single-byte commands understood by the daemon. */
enum class Opcode : uint8_t {
    KeyHandler       = 0x10,
    MKeyLeds         = 0x20,
    Contrast         = 0x40,
    Backlight        = 0x80,
    GetKeyState      = 0x6b,
    SwitchPriorities = 0x70,
    IsUserSelected   = 0x75,
    IsForeground     = 0x76,
};

/** State of the link after an operation. */
enum class Link {
    Ok,
    /** The connection is gone, either dropped or closed by disconnect(). */
    Disconnected,
    /** A control message is waiting, see ProtocolClient::setWakeFd(). */
    Interrupted,
};

/** The daemon greeted with something other than G15_DAEMON_GREETING. */
class HandshakeError : public std::runtime_error {
public:
    explicit HandshakeError(const std::string &expl) : std::runtime_error(expl) {}
};

/**
 * Encode a command byte.
 *
 * Key handler and M-key LED values are in [0, 8], contrast and backlight
 * values in [0, 4]. Other opcodes take no value.
 *
 * @throws std::invalid_argument If the value is out of range.
 */
uint8_t encodeCommand(Opcode op, unsigned value);

/** Decode a little-endian 32-bit key-state frame. */
uint32_t decodeKeyState(const unsigned char buf[4]) noexcept;

/** M-key LEDs lit after the first connection (M3). */
static constexpr unsigned G15_STARTUP_LEDS = 1 << 2;

/**
 * Connection to g15daemon.
 *
 * Not thread-safe, owned and driven by the event loop.
 */
class ProtocolClient {
    using Milliseconds = std::chrono::milliseconds;
private:
    TCPSocket sock;
    std::string host;
    uint16_t port;
    ScreenType screen_type;
    Milliseconds retry_delay;
    int wake_fd = -1;
    unsigned leds;
    unsigned session = 0;
    bool disconnecting = false;

    Link recvFrame(char *dst, size_t sz, int wake);

    /** Sleep for retry_delay, return false if woken up by wake_fd. */
    bool retryWait();

public:
    /**
     * @param screen_type The screen type to register as.
     * @param host Host running the daemon.
     * @param port Port the daemon listens on.
     * @param retry_delay Delay between reconnection attempts.
     */
    explicit ProtocolClient(ScreenType screen_type = ScreenType::G15R,
                            const std::string &host = "localhost",
                            uint16_t port = G15_DAEMON_PORT,
                            Milliseconds retry_delay = Milliseconds(10000));

    /**
     * Connect, check the greeting and register.
     *
     * After registering the key handler is enabled and the M-key LEDs are
     * restored to the last mask set with setLeds().
     *
     * @throws SocketError If the connection could not be made or dropped
     *                     during setup.
     * @throws HandshakeError If the greeting was wrong, this is fatal.
     */
    void connect(ScreenType type);

    /**
     * Connect, retrying every retry_delay until it works.
     *
     * @return False if the wait between two attempts was interrupted by the
     *         wake descriptor, the connection is not established then.
     * @throws HandshakeError See connect().
     */
    bool reconnect();

    /**
     * Send one command byte.
     *
     * For the query opcodes the reply is read and decoded into `reply` if it
     * is not null. Boolean queries decode to 0 or 1.
     *
     * @return Link::Disconnected if the send or the reply read failed.
     * @throws std::invalid_argument See encodeCommand().
     */
    Link sendCommand(Opcode op, unsigned value = 0, uint32_t *reply = nullptr);

    /**
     * Block until the next key-state frame.
     *
     * @param keys Receives the key-state bitmask.
     * @param interruptible Whether the wake descriptor may cut the wait short.
     */
    Link waitForKeyState(uint32_t *keys, bool interruptible = true);

    /**
     * Close the connection on purpose.
     *
     * Later reads return Link::Disconnected, and isDisconnecting() tells the
     * caller that this was expected rather than a fault.
     */
    void disconnect() noexcept;

    /** Set the M-key LED mask, remembered across reconnects. */
    Link setLeds(unsigned mask);

    inline Link setContrast(unsigned level) { return sendCommand(Opcode::Contrast, level); }

    inline Link setBacklight(unsigned level) { return sendCommand(Opcode::Backlight, level); }

    inline Link switchPriorities() { return sendCommand(Opcode::SwitchPriorities); }

    Link queryKeyState(uint32_t *keys);

    Link isForeground(bool *fg);

    Link isUserSelected(bool *sel);

    /**
     * Descriptor that, when readable, makes interruptible waits return
     * Link::Interrupted. The client never reads from it.
     */
    inline void setWakeFd(int fd) noexcept { wake_fd = fd; }

    inline bool isConnected() const noexcept { return sock.isOpen(); }

    inline bool isDisconnecting() const noexcept { return disconnecting; }

    /** Number of connections made so far, changes on every reconnect. */
    inline unsigned getSession() const noexcept { return session; }
};
