#include "ProtocolClient.hpp"
#include "Process.hpp"
#include "FakeDaemon.hpp"
#include <catch2/catch.hpp>
#include <memory>
#include <thread>

using namespace std;
using namespace std::chrono;

static const auto retry = milliseconds(20);

TEST_CASE("Command encoding", "[ProtocolClient]") {
    REQUIRE(encodeCommand(Opcode::KeyHandler, 0) == 0x10);
    REQUIRE(encodeCommand(Opcode::MKeyLeds, 2) == 0x22);
    REQUIRE(encodeCommand(Opcode::MKeyLeds, 8) == 0x28);
    REQUIRE(encodeCommand(Opcode::Contrast, 4) == 0x44);
    REQUIRE(encodeCommand(Opcode::Backlight, 1) == 0x81);
    REQUIRE(encodeCommand(Opcode::GetKeyState, 0) == 0x6b);
    REQUIRE_THROWS_AS(encodeCommand(Opcode::MKeyLeds, 9), invalid_argument);
    REQUIRE_THROWS_AS(encodeCommand(Opcode::Backlight, 5), invalid_argument);
    REQUIRE_THROWS_AS(encodeCommand(Opcode::IsForeground, 1), invalid_argument);
}

TEST_CASE("Key state frames are little-endian", "[ProtocolClient]") {
    const unsigned char g1[4] = {0x01, 0x00, 0x00, 0x00};
    const unsigned char g19[4] = {0x00, 0x00, 0x00, 0x10};
    const unsigned char mixed[4] = {0x78, 0x56, 0x34, 0x12};
    REQUIRE(decodeKeyState(g1) == 1u);
    REQUIRE(decodeKeyState(g19) == 1u << 28);
    REQUIRE(decodeKeyState(mixed) == 0x12345678u);
}

TEST_CASE("Screen tags", "[ProtocolClient]") {
    REQUIRE(string(screenTag(ScreenType::Text)) == "TBUF");
    REQUIRE(string(screenTag(ScreenType::WBmp)) == "WBUF");
    REQUIRE(string(screenTag(ScreenType::G15R)) == "RBUF");
    REQUIRE(string(screenTag(ScreenType::Pixel)) == "GBUF");
}

TEST_CASE("Handshake", "[ProtocolClient]") {
    FakeDaemon daemon;
    ProtocolClient client(ScreenType::G15R, "127.0.0.1", daemon.port(), retry);

    REQUIRE_FALSE(client.isConnected());
    client.connect(ScreenType::Text);
    REQUIRE(client.isConnected());
    REQUIRE(client.getSession() == 1);

    REQUIRE(waitFor([&]() { return daemon.commandCount() >= 2; }));
    REQUIRE(daemon.getTags() == vector<string>{"TBUF"});
    // Key handler registration, then the startup LEDs.
    REQUIRE(daemon.getCommands() == vector<uint8_t>{0x10, 0x24});
}

TEST_CASE("Wrong greeting", "[ProtocolClient]") {
    FakeDaemon daemon("G15 daemon HELLX");
    ProtocolClient client(ScreenType::G15R, "127.0.0.1", daemon.port(), retry);

    REQUIRE_THROWS_AS(client.connect(ScreenType::G15R), HandshakeError);
    REQUIRE_FALSE(client.isConnected());
    REQUIRE_THROWS_AS(client.reconnect(), HandshakeError);
}

TEST_CASE("Commands and key states", "[ProtocolClient]") {
    FakeDaemon daemon;
    ProtocolClient client(ScreenType::G15R, "127.0.0.1", daemon.port(), retry);
    client.connect(ScreenType::G15R);

    REQUIRE(client.setLeds(2) == Link::Ok);
    REQUIRE(client.setContrast(1) == Link::Ok);
    REQUIRE(client.setBacklight(2) == Link::Ok);
    REQUIRE(client.switchPriorities() == Link::Ok);
    REQUIRE(waitFor([&]() { return daemon.commandCount() >= 6; }));
    REQUIRE(daemon.getCommands() == vector<uint8_t>{0x10, 0x24, 0x22, 0x41, 0x82, 0x70});

    daemon.sendKeyState(1u << 28);
    uint32_t keys = 0;
    REQUIRE(client.waitForKeyState(&keys) == Link::Ok);
    REQUIRE(keys == 1u << 28);
}

TEST_CASE("Queries", "[ProtocolClient]") {
    FakeDaemon daemon;
    daemon.setKeyReply((1u << 21) | 1u);
    daemon.setForeground(true);
    daemon.setUserSelected(false);

    ProtocolClient client(ScreenType::G15R, "127.0.0.1", daemon.port(), retry);
    client.connect(ScreenType::G15R);

    uint32_t keys = 0;
    REQUIRE(client.queryKeyState(&keys) == Link::Ok);
    REQUIRE(keys == ((1u << 21) | 1u));

    bool fg = false, sel = true;
    REQUIRE(client.isForeground(&fg) == Link::Ok);
    REQUIRE(fg);
    REQUIRE(client.isUserSelected(&sel) == Link::Ok);
    REQUIRE_FALSE(sel);
}

TEST_CASE("Reconnect after the daemon hangs up", "[ProtocolClient]") {
    FakeDaemon daemon;
    ProtocolClient client(ScreenType::G15R, "127.0.0.1", daemon.port(), retry);
    client.connect(ScreenType::G15R);
    REQUIRE(client.setLeds(1) == Link::Ok);
    REQUIRE(waitFor([&]() { return daemon.commandCount() >= 3; }));

    daemon.dropClient();
    uint32_t keys;
    REQUIRE(client.waitForKeyState(&keys) == Link::Disconnected);
    REQUIRE_FALSE(client.isConnected());
    REQUIRE_FALSE(client.isDisconnecting());

    REQUIRE(client.reconnect());
    REQUIRE(client.isConnected());
    REQUIRE(client.getSession() == 2);
    REQUIRE(waitFor([&]() { return daemon.connections() == 2 && daemon.commandCount() >= 5; }));

    // The last LED mask is restored on the new session.
    REQUIRE(daemon.getCommands() == vector<uint8_t>{0x10, 0x24, 0x21, 0x10, 0x21});
}

TEST_CASE("Reconnect waits for the daemon", "[ProtocolClient]") {
    uint16_t port;
    {
        FakeDaemon gone;
        port = gone.port();
    }

    ProtocolClient client(ScreenType::G15R, "127.0.0.1", port, retry);
    unique_ptr<FakeDaemon> daemon;
    thread starter([&]() {
        this_thread::sleep_for(milliseconds(100));
        daemon = make_unique<FakeDaemon>(G15_DAEMON_GREETING, port);
    });

    bool connected = client.reconnect();
    starter.join();
    REQUIRE(connected);
    REQUIRE(client.isConnected());
}

TEST_CASE("Reconnect is interrupted by the wake descriptor", "[ProtocolClient]") {
    uint16_t port;
    {
        FakeDaemon gone;
        port = gone.port();
    }

    Pipe wake;
    char b = 1;
    REQUIRE(::write(wake.get(1), &b, 1) == 1);

    ProtocolClient client(ScreenType::G15R, "127.0.0.1", port, milliseconds(5000));
    client.setWakeFd(wake.get(0));

    auto start = steady_clock::now();
    REQUIRE_FALSE(client.reconnect());
    REQUIRE(steady_clock::now() - start < milliseconds(2000));
}

TEST_CASE("Wait for key state is interrupted by the wake descriptor", "[ProtocolClient]") {
    FakeDaemon daemon;
    Pipe wake;
    ProtocolClient client(ScreenType::G15R, "127.0.0.1", daemon.port(), retry);
    client.setWakeFd(wake.get(0));
    client.connect(ScreenType::G15R);

    char b = 1;
    REQUIRE(::write(wake.get(1), &b, 1) == 1);
    uint32_t keys;
    REQUIRE(client.waitForKeyState(&keys) == Link::Interrupted);
    REQUIRE(client.isConnected());

    // Not interruptible, the pending wake byte is ignored.
    daemon.sendKeyState(1u << 3);
    REQUIRE(client.waitForKeyState(&keys, false) == Link::Ok);
    REQUIRE(keys == 1u << 3);
}

TEST_CASE("Disconnect", "[ProtocolClient]") {
    FakeDaemon daemon;
    ProtocolClient client(ScreenType::G15R, "127.0.0.1", daemon.port(), retry);
    client.connect(ScreenType::G15R);

    client.disconnect();
    REQUIRE(client.isDisconnecting());
    REQUIRE_FALSE(client.isConnected());

    uint32_t keys;
    REQUIRE(client.waitForKeyState(&keys) == Link::Disconnected);
    REQUIRE(client.setLeds(1) == Link::Disconnected);
}
