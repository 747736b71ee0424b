#include "catch2_custom.hpp"

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/subprocess/subprocess.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace std::chrono_literals;
using patchgrader::ErrorKind;
using patchgrader::run_command;
using patchgrader::Subprocess;

TEST_CASE("Read /bin/echo stdout") {
    Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit(5s).value() == 0);

    REQUIRE(proc.read_stdout().value() == "Hello world!");
    // Nothing new since the last read
    REQUIRE(proc.read_stdout().value().empty());
    REQUIRE(proc.get_full_stdout() == "Hello world!");
}

TEST_CASE("Interact with /bin/cat") {
    Subprocess proc("/bin/cat", {});
    REQUIRE(proc.start());

    REQUIRE(proc.send_stdin("Goodbye dog..."));
    REQUIRE(proc.read_stdout(1s).value() == "Goodbye dog...");

    REQUIRE(proc.send_stdin("Du Du DUHHH"));
    REQUIRE(proc.read_stdout(1s).value() == "Du Du DUHHH");

    REQUIRE(proc.close_stdin());
    REQUIRE(proc.wait_for_exit(5s).value() == 0);
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("stderr is merged into stdout") {
    auto res = run_command("/bin/sh", {"-c", "echo out; echo err 1>&2; exit 3"}, 5s);

    REQUIRE(res.has_value());
    REQUIRE(res->exit_code == 3);
    REQUIRE_FALSE(res->succeeded());
    REQUIRE_FALSE(res->timed_out);
    REQUIRE(res->output == "out\nerr\n");
}

TEST_CASE("A command that outlives its timeout is killed") {
    auto res = run_command("/bin/sh", {"-c", "echo started; sleep 30"}, 300ms);

    REQUIRE(res.has_value());
    REQUIRE(res->timed_out);
    REQUIRE_FALSE(res->exit_code.has_value());
    // Output produced before the timeout is kept
    REQUIRE(res->output == "started\n");
    REQUIRE(res->elapsed < 10s);
}

TEST_CASE("wait_for_exit reports a timeout without killing") {
    Subprocess proc("/bin/sleep", {"30"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(100ms);
    REQUIRE(res.error() == ErrorKind::TimedOut);
    REQUIRE(proc.is_alive());

    REQUIRE(proc.kill());
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("A missing executable exits with 127") {
    auto res = run_command("patchgrader-no-such-binary", {}, 5s);

    REQUIRE(res.has_value());
    REQUIRE(res->exit_code == 127);
}
