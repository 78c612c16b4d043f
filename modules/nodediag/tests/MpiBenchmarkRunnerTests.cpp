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

#include <MpiBenchmarkRunner.h>
#include <catch2/catch_all.hpp>

#include "TestTempDir.h"
#include "mocks/MockBenchmarkRunner.h"
#include "mocks/MockChildProcessRunner.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iterator>
#include <unistd.h>

using namespace ChdNs::NodeDiag;
using ChdNs::Common::Subprocess::ProcessError;
using ChdNs::Common::Subprocess::ProcessOutput;
using Catch::Matchers::StartsWith;

namespace
{
bool HasArg(std::vector<std::string> const &args, std::string const &arg)
{
    return std::find(args.begin(), args.end(), arg) != args.end();
}

std::string ArgAfter(std::vector<std::string> const &args, std::string const &flag)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || std::next(it) == args.end())
    {
        return {};
    }
    return *std::next(it);
}
} // namespace

TEST_CASE("MpiBenchmarkRunner: ConstructMpiCommand")
{
    unsetenv(NodeDiagConstants::ENV_ALLOW_RUN_AS_ROOT.data());

    MockChildProcessRunner::State state;
    MpiBenchmarkRunner runner(
        "/opt/nccl-tests/all_reduce_perf", std::nullopt, std::make_unique<MockChildProcessRunner>(state));

    auto const args = runner.ConstructMpiCommand({ "node01", "node02" }, 4);

    CHECK(ArgAfter(args, "-np") == "8");
    CHECK(ArgAfter(args, "--host") == "node01:4,node02:4");
    CHECK(ArgAfter(args, "--bind-to") == "none");
    CHECK(ArgAfter(args, "--map-by") == "slot");
    CHECK(HasArg(args, "NCCL_DEBUG=WARN"));
    CHECK(HasArg(args, "NCCL_IB_DISABLE=0"));
    CHECK(HasArg(args, "LD_LIBRARY_PATH"));
    CHECK_FALSE(HasArg(args, "--allow-run-as-root"));

    // Benchmark binary followed by its own arguments
    CHECK(ArgAfter(args, "/opt/nccl-tests/all_reduce_perf") == "-b");
    CHECK(ArgAfter(args, "-b") == "1G");
    CHECK(ArgAfter(args, "-e") == "1G");
    CHECK(ArgAfter(args, "-f") == "2");
    CHECK(ArgAfter(args, "-g") == "1");
    CHECK(ArgAfter(args, "-c") == "1");
    CHECK(ArgAfter(args, "-n") == "20");
    CHECK(args.back() == "20");
}

TEST_CASE("MpiBenchmarkRunner: allow-run-as-root")
{
    MockChildProcessRunner::State state;
    MpiBenchmarkRunner runner("/bin/true", std::nullopt, std::make_unique<MockChildProcessRunner>(state));

    unsetenv(NodeDiagConstants::ENV_ALLOW_RUN_AS_ROOT.data());
    CHECK_FALSE(HasArg(runner.ConstructMpiCommand({ "node01" }, 1), "--allow-run-as-root"));

    setenv(NodeDiagConstants::ENV_ALLOW_RUN_AS_ROOT.data(), "1", 1);
    auto const args = runner.ConstructMpiCommand({ "node01" }, 1);
    if (geteuid() == 0)
    {
        CHECK(args.front() == "--allow-run-as-root");
    }
    else
    {
        CHECK_FALSE(HasArg(args, "--allow-run-as-root"));
    }
    unsetenv(NodeDiagConstants::ENV_ALLOW_RUN_AS_ROOT.data());
}

TEST_CASE("MpiBenchmarkRunner: binary paths")
{
    SECTION("mpirun")
    {
        MockChildProcessRunner::State state;
        MpiBenchmarkRunner runner("/bin/true", std::nullopt, std::make_unique<MockChildProcessRunner>(state));

        unsetenv(NodeDiagConstants::ENV_MPIRUN_PATH.data());
        CHECK(runner.GetMpiBinPath() == NodeDiagConstants::DEFAULT_MPIRUN_PATH);

        setenv(NodeDiagConstants::ENV_MPIRUN_PATH.data(), "/opt/openmpi/bin/mpirun", 1);
        CHECK(runner.GetMpiBinPath() == "/opt/openmpi/bin/mpirun");
        unsetenv(NodeDiagConstants::ENV_MPIRUN_PATH.data());
    }

    SECTION("Benchmark")
    {
        unsetenv(NodeDiagConstants::ENV_BENCHMARK_PATH.data());
        CHECK(MpiBenchmarkRunner().GetBenchmarkBinPath() == NodeDiagConstants::DEFAULT_BENCHMARK_PATH);

        setenv(NodeDiagConstants::ENV_BENCHMARK_PATH.data(), "/env/all_reduce_perf", 1);
        CHECK(MpiBenchmarkRunner().GetBenchmarkBinPath() == "/env/all_reduce_perf");
        // Explicit path wins over the environment
        CHECK(MpiBenchmarkRunner("/explicit/all_reduce_perf").GetBenchmarkBinPath() == "/explicit/all_reduce_perf");
        unsetenv(NodeDiagConstants::ENV_BENCHMARK_PATH.data());
    }
}

TEST_CASE("MpiBenchmarkRunner: RunBenchmark")
{
    unsetenv(NodeDiagConstants::ENV_MPIRUN_PATH.data());

    TestTempDir dir;
    auto const outputDir = (dir.Path() / "raw").string();
    MockChildProcessRunner::State state;
    MpiBenchmarkRunner runner("/bin/true", outputDir, std::make_unique<MockChildProcessRunner>(state));

    SECTION("Completed run is returned and persisted")
    {
        state.result = ProcessOutput { MockBenchmarkRunner::MakeNcclOutput(180.0), 0 };

        auto result = runner.RunBenchmark({ "node01", "node02" }, 8, std::chrono::seconds(300), "group_depth0");
        REQUIRE(result.has_value());
        CHECK(result->exitCode == 0);
        CHECK(result->rawOutput == MockBenchmarkRunner::MakeNcclOutput(180.0));

        CHECK(state.runCount == 1);
        CHECK(state.executable == NodeDiagConstants::DEFAULT_MPIRUN_PATH);
        CHECK(state.timeout == std::chrono::milliseconds(300000));
        CHECK(ArgAfter(state.args, "--host") == "node01:8,node02:8");
        CHECK_THAT(runner.GetLastCommand(), StartsWith(std::string(NodeDiagConstants::DEFAULT_MPIRUN_PATH) + " "));

        auto const outputFile = runner.GetLastOutputFile();
        REQUIRE(outputFile.has_value());
        CHECK_THAT(std::filesystem::path(*outputFile).filename().string(), StartsWith("nccl_group_depth0_2nodes_"));
        CHECK(TestTempDir::ReadFile(*outputFile) == result->rawOutput);
    }

    SECTION("Non-zero exit is not an execution error")
    {
        state.result = ProcessOutput { "NCCL WARN failure\n", 3 };

        auto result = runner.RunBenchmark({ "node01" }, 8, std::chrono::seconds(10), "single_node_depth0");
        REQUIRE(result.has_value());
        CHECK(result->exitCode == 3);
    }

    SECTION("Timeout keeps the partial output")
    {
        state.result
            = std::unexpected(ProcessError { CHD_ST_TIMEOUT, "Process did not finish within 10000 ms", "partial\n" });

        auto result = runner.RunBenchmark({ "node01" }, 8, std::chrono::seconds(10), "baseline");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().status == CHD_ST_TIMEOUT);

        auto const outputFile = runner.GetLastOutputFile();
        REQUIRE(outputFile.has_value());
        CHECK(TestTempDir::ReadFile(*outputFile) == "partial\n");
    }

    SECTION("Runs with the same label and node count keep separate logs")
    {
        state.result = ProcessOutput { "ssh: node02 unreachable\n", 255 };
        auto first   = runner.RunBenchmark({ "node02" }, 8, std::chrono::seconds(10), "single_node_depth3");
        REQUIRE(first.has_value());
        auto const firstFile = runner.GetLastOutputFile();

        state.result = ProcessOutput { "ssh: node03 unreachable\n", 255 };
        auto second  = runner.RunBenchmark({ "node03" }, 8, std::chrono::seconds(10), "single_node_depth3");
        REQUIRE(second.has_value());
        auto const secondFile = runner.GetLastOutputFile();

        REQUIRE(firstFile.has_value());
        REQUIRE(secondFile.has_value());
        CHECK(*firstFile != *secondFile);
        CHECK(TestTempDir::ReadFile(*firstFile) == "ssh: node02 unreachable\n");
        CHECK(TestTempDir::ReadFile(*secondFile) == "ssh: node03 unreachable\n");

        auto const logCount = std::distance(std::filesystem::directory_iterator(outputDir),
                                            std::filesystem::directory_iterator {});
        CHECK(logCount == 2);
    }

    SECTION("Spawn failure")
    {
        state.result = std::unexpected(ProcessError { CHD_ST_CHILD_SPAWN_FAILED, "Could not exec", "" });

        auto result = runner.RunBenchmark({ "node01" }, 8, std::chrono::seconds(10), "baseline");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().status == CHD_ST_CHILD_SPAWN_FAILED);
        CHECK(result.error().message == "Could not exec");
        CHECK_FALSE(runner.GetLastOutputFile().has_value());
    }

    SECTION("Invalid arguments never launch anything")
    {
        auto noNodes = runner.RunBenchmark({}, 8, std::chrono::seconds(10), "baseline");
        REQUIRE_FALSE(noNodes.has_value());
        CHECK(noNodes.error().status == CHD_ST_BADPARAM);

        auto noProcesses = runner.RunBenchmark({ "node01" }, 0, std::chrono::seconds(10), "baseline");
        REQUIRE_FALSE(noProcesses.has_value());
        CHECK(noProcesses.error().status == CHD_ST_BADPARAM);

        CHECK(state.runCount == 0);
    }
}
