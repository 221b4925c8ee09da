#include "EventLoop.hpp"
#include "KeyState.hpp"
#include "Fakes.hpp"
#include "FakeDaemon.hpp"
#include "Logging.hpp"
#include "utils.hpp"
#include <catch2/catch.hpp>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

extern "C" {
    #include <unistd.h>
    #include <fcntl.h>
    #include <stdio.h>
}

using namespace std;
using namespace std::chrono;

static void writeFile(const string &path, const string &text) {
    ofstream out(path, ios::trunc);
    out << text;
}

static size_t countOccurrences(const string &text, const string &needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != string::npos; pos = text.find(needle, pos + 1))
        n++;
    return n;
}

/** Redirects stderr, and with it the echoed log, to a file while alive. */
class StderrCapture {
private:
    string path;
    int saved_fd;

public:
    explicit StderrCapture(const string &path) : path(path) {
        fflush(stderr);
        saved_fd = dup(STDERR_FILENO);
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        dup2(fd, STDERR_FILENO);
        ::close(fd);
        Log::open("g15keys-tests", true);
    }

    ~StderrCapture() {
        Log::open("g15keys-tests", false);
        fflush(stderr);
        dup2(saved_fd, STDERR_FILENO);
        ::close(saved_fd);
        unlink(path.c_str());
    }

    string contents() const {
        ifstream in(path);
        sstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

struct LoopFixture {
    string path;
    FakeDaemon daemon;
    ProtocolClient client;
    FakeInjector injector;
    FakeCapture capture;
    ControlChannel control;

    mutex spawned_mtx;
    vector<vector<string>> spawned;

    LoopFixture()
        : path("/tmp/g15keys-tests-" + to_string(getpid()) + "-loop-config"),
          client(ScreenType::G15R, "127.0.0.1", daemon.port(), milliseconds(20))
    {}

    ~LoopFixture() {
        unlink(path.c_str());
    }

    SpawnFn spawner() {
        return [this](const vector<string> &argv) {
            lock_guard<mutex> lock(spawned_mtx);
            spawned.push_back(argv);
        };
    }

    size_t spawnCount() {
        lock_guard<mutex> lock(spawned_mtx);
        return spawned.size();
    }

    /** Press and release a key the way the daemon reports it. */
    void tap(uint32_t key) {
        daemon.sendKeyState(key);
        daemon.sendKeyState(key);
        daemon.sendKeyState(0);
        daemon.sendKeyState(0);
    }
};

TEST_CASE_METHOD(LoopFixture, "Missing configuration", "[EventLoop]") {
    EventLoop loop(path, client, injector, capture, control, spawner());
    REQUIRE_THROWS_AS(loop.load(), ConfigError);
}

TEST_CASE_METHOD(LoopFixture, "Key states run bindings", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "launcher", "G19": {"pressed": "emit k+10"}}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    loop.handleKeyState(1u << 0);
    REQUIRE(spawnCount() == 0);
    loop.handleKeyState((1u << 0) | (1u << 28));
    REQUIRE(injector.events.size() == 1);
    loop.handleKeyState(0);
    REQUIRE(spawned == vector<vector<string>>{{"launcher"}});
    REQUIRE(loop.getState().keys == 0);

    // The light key is not a key event.
    loop.handleKeyState(G15_KEY_LIGHT);
    REQUIRE(spawnCount() == 1);
    REQUIRE(injector.events.size() == 1);
}

TEST_CASE_METHOD(LoopFixture, "Record a macro", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "record", "G2": "xterm"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    loop.handleKeyEvent("G1", true);
    REQUIRE_FALSE(loop.isRecording());
    loop.handleKeyEvent("G1", false);
    REQUIRE(loop.isRecording());

    capture.feed(10, true);
    capture.feed(10, false);

    // The key that ends the recording does not run its binding.
    loop.handleKeyEvent("G2", true);
    loop.handleKeyEvent("G2", false);
    REQUIRE_FALSE(loop.isRecording());
    REQUIRE(spawnCount() == 0);

    Binding macro = SingleBinding{"emit k+10,k-10"};
    REQUIRE(loop.getState().config.find("default")->at("G2") == macro);
    REQUIRE(Config::load(path).find("default")->at("G2") == macro);
    REQUIRE(Config::load(path).find("default")->at("G1") == Binding(SingleBinding{"record"}));

    loop.handleKeyEvent("G2", false);
    REQUIRE(injector.events == vector<tuple<InputKind, bool, int>>{
        {InputKind::Key, true, 10}, {InputKind::Key, false, 10}});
}

TEST_CASE_METHOD(LoopFixture, "Empty macro keeps the binding", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "record", "G2": "xterm"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    loop.handleKeyEvent("G1", false);
    REQUIRE(loop.isRecording());
    loop.handleKeyEvent("G2", false);
    REQUIRE_FALSE(loop.isRecording());

    REQUIRE(loop.getState().config.find("default")->at("G2") == Binding(SingleBinding{"xterm"}));
}

TEST_CASE_METHOD(LoopFixture, "Reload keeps the active profile", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "switch-profile gaming"}, "gaming": {"G1": "a"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();
    loop.handleKeyEvent("G1", false);
    REQUIRE(loop.getState().profile == "gaming");

    writeFile(path, R"({"default": {}, "gaming": {"G1": "b"}})");
    loop.reload();
    REQUIRE(loop.getState().profile == "gaming");
    loop.handleKeyEvent("G1", false);
    REQUIRE(spawned == vector<vector<string>>{{"b"}});

    writeFile(path, R"({"work": {}, "default": {}})");
    loop.reload();
    REQUIRE(loop.getState().profile == "work");
}

TEST_CASE_METHOD(LoopFixture, "Invalid reload keeps the configuration", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "a"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    writeFile(path, "{ not json");
    REQUIRE_NOTHROW(loop.reload());
    loop.handleKeyEvent("G1", false);
    REQUIRE(spawned == vector<vector<string>>{{"a"}});
}

TEST_CASE_METHOD(LoopFixture, "Repeated reload failures are all logged", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "a"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    writeFile(path, "{ not json");
    string log;
    {
        StderrCapture cap(path + ".log");
        loop.reload();
        loop.reload();
        log = cap.contents();
    }

    REQUIRE(countOccurrences(log, "Unable to reload " + path) == 2);
    REQUIRE(countOccurrences(log, "Configuration was not reloaded") == 2);
    REQUIRE(loop.getState().config.find("default")->count("G1") == 1);
}

TEST_CASE_METHOD(LoopFixture, "Reload is deferred while recording", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "record"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    loop.handleKeyEvent("G1", false);
    REQUIRE(loop.isRecording());

    writeFile(path, R"({"default": {"G1": "record"}, "work": {}})");
    loop.reload();
    REQUIRE_FALSE(loop.getState().config.contains("work"));

    // Nothing was captured, the file is left alone and the reload happens now.
    loop.handleKeyEvent("G3", false);
    REQUIRE_FALSE(loop.isRecording());
    REQUIRE(loop.getState().config.contains("work"));
}

TEST_CASE_METHOD(LoopFixture, "Run until shutdown", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "launcher"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    thread runner([&]() { loop.run(); });

    REQUIRE(waitFor([&]() { return daemon.connections() == 1; }));
    tap(1u << 0);
    REQUIRE(waitFor([&]() { return spawnCount() == 1; }));

    control.post(ControlMessage::Shutdown);
    runner.join();

    REQUIRE_FALSE(client.isConnected());
    REQUIRE(client.isDisconnecting());
    REQUIRE(spawned == vector<vector<string>>{{"launcher"}});
}

TEST_CASE_METHOD(LoopFixture, "Second frame of a cycle is skipped", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": {"released": "g1-released"},
                                    "G2": {"pressed": "g2-pressed"}}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    thread runner([&]() { loop.run(); });
    REQUIRE(waitFor([&]() { return daemon.connections() == 1; }));

    // The release in the second frame is not a key event.
    daemon.sendKeyState(1u << 0);
    daemon.sendKeyState(0);
    daemon.sendKeyState((1u << 0) | (1u << 1));
    daemon.sendKeyState((1u << 0) | (1u << 1));
    REQUIRE(waitFor([&]() { return spawnCount() >= 1; }));

    control.post(ControlMessage::Shutdown);
    runner.join();
    REQUIRE(spawned == vector<vector<string>>{{"g2-pressed"}});
}

TEST_CASE_METHOD(LoopFixture, "Resync after a command reconnects", "[EventLoop]") {
    writeFile(path, R"({"default": {"G7": {"pressed": "set-leds M2", "released": "g7-released"},
                                    "G1": {"released": "launcher"}}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    thread runner([&]() { loop.run(); });
    REQUIRE(waitFor([&]() { return daemon.connections() == 1 && daemon.commandCount() >= 2; }));

    // G7 goes down, then the daemon hangs up before the second frame.
    daemon.sendKeyState(1u << 6);
    daemon.dropClient();
    REQUIRE(waitFor([&]() { return daemon.connections() == 2; }));
    REQUIRE(waitFor([&]() {
        auto cmds = daemon.getCommands();
        return cmds.size() >= 4 && cmds[cmds.size() - 2] == 0x10 && cmds.back() == 0x22;
    }));

    // One cycle per frame pair on the new session, G7 is not held anymore.
    daemon.sendKeyState(1u << 0);
    daemon.sendKeyState(0);
    daemon.sendKeyState(0);
    daemon.sendKeyState(0);
    REQUIRE(waitFor([&]() { return spawnCount() >= 1; }));

    control.post(ControlMessage::Shutdown);
    runner.join();
    REQUIRE(spawned == vector<vector<string>>{{"launcher"}});
}

TEST_CASE_METHOD(LoopFixture, "Reconnect and resume", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "launcher"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    thread runner([&]() { loop.run(); });

    REQUIRE(waitFor([&]() { return daemon.connections() == 1; }));
    daemon.dropClient();
    REQUIRE(waitFor([&]() { return daemon.connections() == 2; }));

    tap(1u << 0);
    REQUIRE(waitFor([&]() { return spawnCount() == 1; }));

    control.post(ControlMessage::Shutdown);
    runner.join();

    // Each session registers as a key handler and restores the LEDs.
    REQUIRE(waitFor([&]() { return daemon.commandCount() >= 4; }));
    REQUIRE(daemon.getCommands() == vector<uint8_t>{0x10, 0x24, 0x10, 0x24});
}

TEST_CASE_METHOD(LoopFixture, "Reload through the control channel", "[EventLoop]") {
    writeFile(path, R"({"default": {"G1": "first"}})");
    EventLoop loop(path, client, injector, capture, control, spawner());
    loop.load();

    thread runner([&]() { loop.run(); });
    REQUIRE(waitFor([&]() { return daemon.connections() == 1; }));

    writeFile(path, R"({"default": {"G1": "second"}})");
    control.post(ControlMessage::Reload);

    // The reload is handled before the next key state arrives.
    this_thread::sleep_for(milliseconds(50));
    tap(1u << 0);
    REQUIRE(waitFor([&]() { return spawnCount() == 1; }));

    control.post(ControlMessage::Shutdown);
    runner.join();
    REQUIRE(spawned == vector<vector<string>>{{"second"}});
}

TEST_CASE_METHOD(LoopFixture, "Shutdown while waiting for the daemon", "[EventLoop]") {
    uint16_t port;
    {
        FakeDaemon gone;
        port = gone.port();
    }
    ProtocolClient absent(ScreenType::G15R, "127.0.0.1", port, milliseconds(5000));

    writeFile(path, R"({"default": {}})");
    EventLoop loop(path, absent, injector, capture, control, spawner());
    loop.load();

    control.post(ControlMessage::Shutdown);
    auto start = steady_clock::now();
    loop.run();
    REQUIRE(steady_clock::now() - start < milliseconds(2000));
}

TEST_CASE_METHOD(LoopFixture, "Wrong daemon", "[EventLoop]") {
    FakeDaemon impostor("Not g15daemon!!!");
    ProtocolClient other(ScreenType::G15R, "127.0.0.1", impostor.port(), milliseconds(20));

    writeFile(path, R"({"default": {}})");
    EventLoop loop(path, other, injector, capture, control, spawner());
    loop.load();

    REQUIRE_THROWS_AS(loop.run(), HandshakeError);
}
