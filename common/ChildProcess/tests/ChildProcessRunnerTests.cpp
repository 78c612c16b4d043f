/*
 * Copyright (c) 2025, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <ChildProcess/ChildProcessRunner.hpp>
#include <catch2/catch_all.hpp>

#include <chrono>
#include <csignal>
#include <future>
#include <thread>

using namespace ChdNs::Common::Subprocess;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ChildProcessRunner: collects output and exit code")
{
    ChildProcessRunner runner;

    auto result
        = runner.Run("/bin/sh", { "-c", "echo to_stdout; echo to_stderr 1>&2; exit 3" }, std::chrono::seconds(10));
    REQUIRE(result.has_value());
    CHECK(result->exitCode == 3);
    CHECK_THAT(result->output, ContainsSubstring("to_stdout\n"));
    CHECK_THAT(result->output, ContainsSubstring("to_stderr\n"));
}

TEST_CASE("ChildProcessRunner: successful run")
{
    ChildProcessRunner runner;

    auto result = runner.Run("/bin/sh", { "-c", "printf 'line1\\nline2\\n'" }, std::chrono::seconds(10));
    REQUIRE(result.has_value());
    CHECK(result->exitCode == 0);
    CHECK(result->output == "line1\nline2\n");
}

TEST_CASE("ChildProcessRunner: timeout terminates the process group")
{
    ChildProcessRunner runner;

    auto const start   = std::chrono::steady_clock::now();
    auto result        = runner.Run("/bin/sh", { "-c", "echo started; sleep 30" }, std::chrono::milliseconds(500));
    auto const elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().status == CHD_ST_TIMEOUT);
    CHECK(result.error().message == "Process did not finish within 500 ms");
    CHECK_THAT(result.error().partialOutput, ContainsSubstring("started"));
    CHECK(elapsed < std::chrono::seconds(20));
}

TEST_CASE("ChildProcessRunner: missing executable")
{
    ChildProcessRunner runner;

    auto result = runner.Run("/nonexistent/path/to/mpirun", {}, std::chrono::seconds(1));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().status == CHD_ST_CHILD_SPAWN_FAILED);
    CHECK_THAT(result.error().message, ContainsSubstring("No such file or directory"));
}


TEST_CASE("ChildProcessRunner: active process group can be terminated from outside")
{
    CHECK(ActiveProcessGroup() == 0);

    ChildProcessRunner runner;
    auto const start = std::chrono::steady_clock::now();
    auto pending     = std::async(std::launch::async, [&runner]() {
        return runner.Run("/bin/sh", { "-c", "sleep 30; echo finished" }, std::chrono::seconds(60));
    });

    pid_t pgid = 0;
    while (pgid == 0 && std::chrono::steady_clock::now() - start < std::chrono::seconds(10))
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        pgid = ActiveProcessGroup();
    }
    REQUIRE(pgid > 0);

    TerminateActiveProcessGroup();

    auto result        = pending.get();
    auto const elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.has_value());
    CHECK(result->exitCode == SIGTERM);
    CHECK(result->output.find("finished") == std::string::npos);
    CHECK(elapsed < std::chrono::seconds(20));
    CHECK(ActiveProcessGroup() == 0);
}

TEST_CASE("ChildProcessRunner: terminating without a running child is a no-op")
{
    REQUIRE(ActiveProcessGroup() == 0);
    TerminateActiveProcessGroup();

    ChildProcessRunner runner;
    auto result = runner.Run("/bin/sh", { "-c", "exit 0" }, std::chrono::seconds(10));
    REQUIRE(result.has_value());
    CHECK(result->exitCode == 0);
}
