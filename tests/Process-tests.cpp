#include "Process.hpp"
#include "FakeDaemon.hpp"
#include <catch2/catch.hpp>
#include <fstream>
#include <string>

extern "C" {
    #include <unistd.h>
}

using namespace std;

TEST_CASE("Spawn a program", "[Process]") {
    REQUIRE_NOTHROW(spawnDetached({"true"}));
}

TEST_CASE("Spawned program runs on its own", "[Process]") {
    string path = "/tmp/g15keys-tests-" + to_string(getpid()) + "-spawn";
    unlink(path.c_str());

    spawnDetached({"sh", "-c", "echo spawned > \"$0\"", path});

    REQUIRE(waitFor([&]() {
        ifstream in(path);
        string line;
        return getline(in, line) && line == "spawned";
    }));
    unlink(path.c_str());
}

TEST_CASE("Nonexistent executable", "[Process]") {
    REQUIRE_THROWS_AS(spawnDetached({"g15keys-no-such-program"}), SubprocessError);
    REQUIRE_THROWS_AS(spawnDetached({}), SubprocessError);
}

TEST_CASE("Pipe", "[Process]") {
    Pipe pipe;
    REQUIRE(pipe.get(0) != -1);
    REQUIRE(pipe.get(1) != -1);

    char msg[] = "abc", buf[3];
    REQUIRE(::write(pipe.get(1), msg, 3) == 3);
    REQUIRE(::read(pipe.get(0), buf, 3) == 3);

    pipe.close(1);
    pipe.close(1);
    REQUIRE(pipe.get(1) == -1);
    REQUIRE(::read(pipe.get(0), buf, 3) == 0);
}
