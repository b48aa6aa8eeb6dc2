#include <catch2/catch.hpp>
#include <stacy/process.hpp>
#include "test_helpers.hpp"

#include <chrono>
#include <csignal>
#include <thread>

using namespace stacy;
using stacy::testing::TempDir;

// ===== run_command() =====

TEST_CASE("run_command captures stdout", "[process]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello\n");
}

TEST_CASE("run_command reports nonzero exit", "[process]") {
    auto r = run_command({"sh", "-c", "echo oops >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stderr_str.find("oops") != std::string::npos);
}

TEST_CASE("run_command in a working directory", "[process]") {
    TempDir td("stacy_process_test");
    auto r = run_command({"pwd"}, td.path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find(td.path.filename().string()) != std::string::npos);
}

TEST_CASE("run_command argument errors", "[process]") {
    auto empty = run_command({});
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == StacyError::InvalidArg);

    auto missing = run_command({"__stacy_no_such_binary__"});
    REQUIRE(missing.is_ok());
    REQUIRE(missing.value().exit_code == 127);
}

TEST_CASE("run_command timeout", "[process]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

// ===== PATH lookup =====

TEST_CASE("find programs on PATH", "[process]") {
    REQUIRE(program_available("sh"));
    REQUIRE(find_in_path("sh").find("/sh") != std::string::npos);
    REQUIRE_FALSE(program_available("__stacy_no_such_binary__"));

    TempDir td("stacy_process_test");
    auto exe = td.write_executable("tool.sh", "#!/bin/sh\nexit 0\n");
    auto plain = td.write_file("data.txt", "x\n");
    REQUIRE(find_in_path(exe.string()) == exe.string());
    REQUIRE(find_in_path(plain.string()).empty());
}

// ===== ChildProcess =====

TEST_CASE("spawned child exit status", "[process]") {
    SpawnOptions opts;
    opts.args = {"sh", "-c", "exit 7"};
    auto child = ChildProcess::spawn(opts);
    REQUIRE(child.is_ok());

    auto st = child.value().wait();
    REQUIRE(st.is_ok());
    REQUIRE(st.value().exit_code == 7);
    REQUIRE(st.value().signal == 0);
    REQUIRE_FALSE(child.value().running());
}

TEST_CASE("child sees extra environment and working directory", "[process]") {
    TempDir td("stacy_process_test");
    SpawnOptions opts;
    opts.args = {"sh", "-c", "printf '%s' \"$STACY_ARG_YEAR\" > out.txt"};
    opts.working_dir = td.path.string();
    opts.env["STACY_ARG_YEAR"] = "2020";

    auto child = ChildProcess::spawn(opts);
    REQUIRE(child.is_ok());
    REQUIRE(child.value().wait().value().exit_code == 0);
    REQUIRE(td.read_file("out.txt") == "2020");
}

TEST_CASE("signal terminates the child group", "[process]") {
    SpawnOptions opts;
    opts.args = {"sh", "-c", "sleep 30 & wait"};
    auto child = ChildProcess::spawn(opts);
    REQUIRE(child.is_ok());

    ExitStatus st;
    REQUIRE_FALSE(child.value().try_wait(st).value());

    child.value().signal(SIGTERM);
    auto done = child.value().wait();
    REQUIRE(done.is_ok());
    REQUIRE(done.value().signal == SIGTERM);
    REQUIRE(done.value().exit_code == 128 + SIGTERM);
}

TEST_CASE("try_wait polls until exit", "[process]") {
    SpawnOptions opts;
    opts.args = {"true"};
    auto child = ChildProcess::spawn(opts).value();

    ExitStatus st;
    bool exited = false;
    for (int i = 0; i < 500 && !exited; i++) {
        exited = child.try_wait(st).value();
        if (!exited) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(exited);
    REQUIRE(st.exit_code == 0);
}

TEST_CASE("spawn of a missing executable", "[process]") {
    SpawnOptions opts;
    opts.args = {"__stacy_no_such_binary__"};
    auto child = ChildProcess::spawn(opts);
    REQUIRE(child.is_err());
    REQUIRE(child.error().code == StacyError::Environment);

    ChildProcess empty;
    REQUIRE(empty.wait().is_err());
}
