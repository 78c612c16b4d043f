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

#include <BenchmarkEvaluator.h>
#include <catch2/catch_all.hpp>

#include "mocks/MockBenchmarkRunner.h"

using namespace ChdNs::NodeDiag;
using Catch::Matchers::WithinAbs;

TEST_CASE("BenchmarkEvaluator: clean completion")
{
    MockBenchmarkRunner runner;
    TestHistory history;
    BenchmarkEvaluator evaluator(runner, 4, std::chrono::seconds(30), history);

    auto const &result = evaluator.Evaluate({ "node01", "node02" }, "baseline", 150.0);

    CHECK(result.success);
    CHECK(result.isGood);
    REQUIRE(result.bandwidth.has_value());
    CHECK_THAT(*result.bandwidth, WithinAbs(200.0, 1e-9));
    CHECK(result.exitCode == 0);
    CHECK_FALSE(result.error.has_value());
    CHECK(result.label == "baseline");
    CHECK(result.nodes == std::vector<NodeId> { "node01", "node02" });

    REQUIRE(runner.GetCallCount() == 1);
    CHECK(runner.GetCalls()[0].processesPerNode == 4);
    CHECK(runner.GetCalls()[0].timeout == std::chrono::seconds(30));
    CHECK(runner.GetCalls()[0].label == "baseline");
    CHECK(history.Size() == 1);
}

TEST_CASE("BenchmarkEvaluator: bandwidth below threshold")
{
    MockBenchmarkRunner runner;
    runner.SetBadNodes({ "node02" });
    TestHistory history;
    BenchmarkEvaluator evaluator(runner, 8, std::chrono::seconds(300), history);

    auto const &result = evaluator.Evaluate({ "node01", "node02" }, "group_depth0", 150.0);
    CHECK(result.success);
    CHECK_FALSE(result.isGood);
    REQUIRE(result.bandwidth.has_value());
    CHECK_THAT(*result.bandwidth, WithinAbs(20.0, 1e-9));
}

TEST_CASE("BenchmarkEvaluator: verdict without threshold follows success")
{
    MockBenchmarkRunner runner;
    runner.SetBadNodes({ "node02" });
    TestHistory history;
    BenchmarkEvaluator evaluator(runner, 8, std::chrono::seconds(300), history);

    CHECK(evaluator.Evaluate({ "node02" }, "single_node_depth0").isGood);
}

TEST_CASE("BenchmarkEvaluator: failure outcomes are distinct and recorded")
{
    MockBenchmarkRunner runner;
    TestHistory history;
    BenchmarkEvaluator evaluator(runner, 8, std::chrono::seconds(300), history);

    SECTION("Unparseable output")
    {
        runner.SetBehavior([](auto const &, auto const &) -> MockBenchmarkRunner::Result {
            return BenchmarkOutput { "NCCL WARN something went wrong\n", 0 };
        });
        auto const &result = evaluator.Evaluate({ "node01" }, "t", 10.0);
        CHECK_FALSE(result.success);
        CHECK_FALSE(result.isGood);
        CHECK_FALSE(result.bandwidth.has_value());
        CHECK(result.exitCode == 0);
        CHECK(result.error == "Unable to parse bandwidth from benchmark output");
    }

    SECTION("Timeout")
    {
        runner.SetBehavior([](auto const &, auto const &) -> MockBenchmarkRunner::Result {
            return std::unexpected(BenchmarkError { CHD_ST_TIMEOUT, "Process did not finish within 300000 ms" });
        });
        auto const &result = evaluator.Evaluate({ "node01" }, "t", 10.0);
        CHECK_FALSE(result.success);
        CHECK_FALSE(result.isGood);
        CHECK_FALSE(result.exitCode.has_value());
        CHECK(result.error == "Test timeout");
    }

    SECTION("Timeout with a process that could not be stopped")
    {
        runner.SetBehavior([](auto const &, auto const &) -> MockBenchmarkRunner::Result {
            return std::unexpected(
                BenchmarkError { CHD_ST_CHILD_NOT_KILLED, "Unable to terminate '/usr/bin/mpirun': Operation not permitted" });
        });
        auto const &result = evaluator.Evaluate({ "node01" }, "t", 10.0);
        CHECK_FALSE(result.success);
        CHECK_FALSE(result.isGood);
        CHECK_FALSE(result.exitCode.has_value());
        CHECK(result.error == "Test timeout, benchmark could not be stopped");
    }

    SECTION("Execution error")
    {
        runner.SetBehavior([](auto const &, auto const &) -> MockBenchmarkRunner::Result {
            return std::unexpected(
                BenchmarkError { CHD_ST_CHILD_SPAWN_FAILED, "Could not exec '/usr/bin/mpirun': No such file or directory" });
        });
        auto const &result = evaluator.Evaluate({ "node01" }, "t");
        CHECK_FALSE(result.success);
        CHECK_FALSE(result.isGood);
        REQUIRE(result.error.has_value());
        CHECK(result.error->starts_with("Failed to launch benchmark: "));
        CHECK(result.error->find("No such file or directory") != std::string::npos);
    }

    SECTION("Non-zero exit with a parseable bandwidth")
    {
        runner.SetBehavior([](auto const &, auto const &) -> MockBenchmarkRunner::Result {
            return BenchmarkOutput { MockBenchmarkRunner::MakeNcclOutput(300.0), 1 };
        });
        auto const &result = evaluator.Evaluate({ "node01" }, "t", 10.0);
        CHECK_FALSE(result.success);
        CHECK_FALSE(result.isGood);
        REQUIRE(result.bandwidth.has_value());
        CHECK_THAT(*result.bandwidth, WithinAbs(300.0, 1e-9));
        CHECK(result.exitCode == 1);
        CHECK(result.error == "Benchmark exited with code 1");
    }

    CHECK(history.Size() == 1);
    CHECK_FALSE(history.Back().success);
}

TEST_CASE("BenchmarkEvaluator: progress callback sees every result")
{
    MockBenchmarkRunner runner;
    TestHistory history;
    BenchmarkEvaluator evaluator(runner, 8, std::chrono::seconds(300), history);

    std::vector<std::string> seen;
    evaluator.SetProgressCallback([&seen](BenchmarkResult const &result) { seen.push_back(result.label); });

    evaluator.Evaluate({ "a" }, "first");
    evaluator.Evaluate({ "b" }, "second");

    CHECK(seen == std::vector<std::string> { "first", "second" });
    REQUIRE(history.Size() == 2);
    CHECK(history[0].label == "first");
    CHECK(history[1].label == "second");
}
