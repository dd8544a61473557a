// SPDX-License-Identifier: Apache-2.0
#include <core/SubprocessRunner.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace mindcast;
using namespace std::chrono_literals;

TEST_CASE("SubprocessRunner captures stdout, stderr and the exit code", "[process]")
{
    auto runner = SubprocessRunner();

    auto result = runner.run(ProcessSpec {
        .command = "/bin/sh",
        .args = { "-c", "echo out; echo err 1>&2; exit 3" },
        .timeout = 10s,
    });

    REQUIRE(result.has_value());
    CHECK(result->exitCode == 3);
    CHECK(!result->succeeded());
    CHECK(result->standardOutput == "out\n");
    CHECK(result->standardError == "err\n");
}

TEST_CASE("SubprocessRunner finds commands on PATH", "[process]")
{
    auto runner = SubprocessRunner();

    auto result = runner.run(ProcessSpec { .command = "echo", .args = { "hello", "world" }, .timeout = 10s });
    REQUIRE(result.has_value());
    CHECK(result->succeeded());
    CHECK(result->standardOutput == "hello world\n");
}

TEST_CASE("SubprocessRunner gives the child an empty stdin", "[process]")
{
    auto runner = SubprocessRunner();

    // cat would block forever on an inherited terminal
    auto result = runner.run(ProcessSpec { .command = "cat", .args = {}, .timeout = 10s });
    REQUIRE(result.has_value());
    CHECK(result->succeeded());
    CHECK(result->standardOutput.empty());
}

TEST_CASE("SubprocessRunner kills a child that exceeds the timeout", "[process]")
{
    auto runner = SubprocessRunner();

    auto const started = std::chrono::steady_clock::now();
    auto result = runner.run(ProcessSpec { .command = "sleep", .args = { "10" }, .timeout = 200ms });
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(elapsed < 5s);
}

TEST_CASE("SubprocessRunner reports commands that cannot be spawned", "[process]")
{
    auto runner = SubprocessRunner();

    auto result = runner.run(ProcessSpec { .command = "/nonexistent/command/that/does/not/exist", .args = {}, .timeout = 10s });
    // glibc reports the failed exec from posix_spawnp; other libcs run a child that exits with 127
    if (result.has_value())
        CHECK(result->exitCode == 127);
    else
        CHECK(result.error().code == ErrorCode::ProcessError);
}

TEST_CASE("describeCommand quotes arguments with spaces", "[process]")
{
    auto const spec = ProcessSpec { .command = "ffmpeg", .args = { "-i", "my file.mp3", "out.mp3" }, .timeout = {} };
    CHECK(describeCommand(spec) == "ffmpeg -i 'my file.mp3' out.mp3");
}
