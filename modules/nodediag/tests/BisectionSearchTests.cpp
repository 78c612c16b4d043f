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

#include <BisectionSearch.h>
#include <catch2/catch_all.hpp>

#include "mocks/MockBenchmarkRunner.h"

#include <fmt/format.h>

#include <algorithm>
#include <set>
#include <vector>

using namespace ChdNs::NodeDiag;
using Catch::Matchers::WithinAbs;

namespace
{
Roster MakeRoster(std::size_t count)
{
    Roster roster;
    for (std::size_t i = 0; i < count; ++i)
    {
        roster.push_back(fmt::format("node{:02}", i));
    }
    return roster;
}

std::vector<std::string> Labels(MockBenchmarkRunner const &runner)
{
    std::vector<std::string> labels;
    for (auto const &call : runner.GetCalls())
    {
        labels.push_back(call.label);
    }
    return labels;
}

constexpr std::chrono::seconds timeout { 300 };
} // namespace

TEST_CASE("BisectionSearch: empty roster")
{
    MockBenchmarkRunner runner;
    BisectionSearch search(runner, 8, timeout);

    auto report = search.Run({});
    REQUIRE_FALSE(report.has_value());
    CHECK(report.error() == CHD_ST_BADPARAM);
    CHECK(runner.GetCallCount() == 0);
}

TEST_CASE("BisectionSearch: healthy roster is tested once")
{
    MockBenchmarkRunner runner;
    BisectionSearch search(runner, 8, timeout);
    auto const roster = MakeRoster(4);

    auto report = search.Run(roster);
    REQUIRE(report.has_value());

    CHECK(report->badNodes.empty());
    CHECK(report->goodNodes == CondemnedSet(roster.begin(), roster.end()));
    CHECK(Labels(runner) == std::vector<std::string> { "baseline", "group_depth0" });
    CHECK(report->history.Size() == 2);
    REQUIRE(report->threshold.has_value());
    CHECK_THAT(*report->threshold, WithinAbs(160.0, 1e-9));
}

TEST_CASE("BisectionSearch: one bad node in eight")
{
    MockBenchmarkRunner runner;
    runner.SetBadNodes({ "node03" });
    BisectionSearch search(runner, 8, timeout);
    auto const roster = MakeRoster(8);

    auto report = search.Run(roster);
    REQUIRE(report.has_value());

    CHECK(report->badNodes == CondemnedSet { "node03" });
    CHECK(report->goodNodes.size() == 7);
    CHECK_FALSE(report->goodNodes.contains("node03"));

    // Baseline, full group, left half, its two quarters, two singles in the bad quarter, right half
    CHECK(Labels(runner)
          == std::vector<std::string> { "baseline",
                                        "group_depth0",
                                        "group_depth1",
                                        "group_depth2",
                                        "group_depth2",
                                        "single_node_depth3",
                                        "single_node_depth3",
                                        "group_depth1" });

    auto const &calls = runner.GetCalls();
    CHECK(calls[0].nodes == std::vector<std::string> { "node00", "node01" });
    CHECK(calls[1].nodes == roster);
    CHECK(calls[2].nodes == std::vector<std::string> { "node00", "node01", "node02", "node03" });
    CHECK(calls[3].nodes == std::vector<std::string> { "node00", "node01" });
    CHECK(calls[4].nodes == std::vector<std::string> { "node02", "node03" });
    CHECK(calls[5].nodes == std::vector<std::string> { "node02" });
    CHECK(calls[6].nodes == std::vector<std::string> { "node03" });
    CHECK(calls[7].nodes == std::vector<std::string> { "node04", "node05", "node06", "node07" });

    CHECK(report->history.Size() == calls.size());
}

TEST_CASE("BisectionSearch: two bad nodes in sixteen")
{
    MockBenchmarkRunner runner;
    runner.SetBadNodes({ "node05", "node12" });
    BisectionSearch search(runner, 8, timeout);
    auto const roster = MakeRoster(16);

    auto report = search.Run(roster);
    REQUIRE(report.has_value());

    CHECK(report->badNodes == CondemnedSet { "node05", "node12" });
    CHECK(report->goodNodes.size() == 14);

    // Every node appears in exactly one verdict
    for (auto const &node : roster)
    {
        CHECK(report->badNodes.contains(node) != report->goodNodes.contains(node));
    }
}

TEST_CASE("BisectionSearch: condemns exactly the slow nodes")
{
    auto const [rosterSize, slowIndices] = GENERATE(table<std::size_t, std::vector<std::size_t>>({
        { 4, { 1 } },
        { 4, { 0, 3 } },
        { 8, { 4 } },
        { 8, { 2, 5 } },
        { 16, { 9 } },
        { 16, { 0, 15 } },
    }));

    auto const roster = MakeRoster(rosterSize);
    std::set<std::string> slow;
    for (auto const index : slowIndices)
    {
        slow.insert(roster[index]);
    }
    INFO("roster size " << rosterSize << ", slow nodes " << slow.size());

    MockBenchmarkRunner runner;
    runner.SetBadNodes(slow);
    BisectionSearch search(runner, 8, timeout, 100.0);

    auto report = search.Run(roster);
    REQUIRE(report.has_value());

    CHECK(report->badNodes == CondemnedSet(slow.begin(), slow.end()));
    for (auto const &node : roster)
    {
        CHECK(report->badNodes.contains(node) != report->goodNodes.contains(node));
    }
    CHECK(report->history.Size() == runner.GetCallCount());
}

TEST_CASE("BisectionSearch: healthy roster with explicit threshold runs a single test")
{
    auto const rosterSize = GENERATE(as<std::size_t> {}, 2, 3, 7, 16, 33);
    INFO("roster size " << rosterSize);

    MockBenchmarkRunner runner;
    BisectionSearch search(runner, 8, timeout, 100.0);
    auto const roster = MakeRoster(rosterSize);

    auto report = search.Run(roster);
    REQUIRE(report.has_value());

    REQUIRE(runner.GetCallCount() == 1);
    CHECK(runner.GetCalls()[0].nodes == roster);
    CHECK(runner.GetCalls()[0].label == "group_depth0");
    CHECK(report->badNodes.empty());
    CHECK(report->goodNodes.size() == rosterSize);
}

TEST_CASE("BisectionSearch: non power of two roster")
{
    MockBenchmarkRunner runner;
    runner.SetBadNodes({ "node04" });
    BisectionSearch search(runner, 8, timeout, 100.0);
    auto const roster = MakeRoster(5);

    auto report = search.Run(roster);
    REQUIRE(report.has_value());

    CHECK(report->badNodes == CondemnedSet { "node04" });

    // [0..4] -> [0,1] good, [2,3,4] -> [2] good, [3,4] -> [3] good, [4] bad
    auto const &calls = runner.GetCalls();
    REQUIRE(calls.size() == 7);
    CHECK(calls[1].nodes == std::vector<std::string> { "node00", "node01" });
    CHECK(calls[2].nodes == std::vector<std::string> { "node02", "node03", "node04" });
    CHECK(calls[3].nodes == std::vector<std::string> { "node02" });
    CHECK(calls[3].label == "single_node_depth2");
    CHECK(calls[4].nodes == std::vector<std::string> { "node03", "node04" });
    CHECK(calls[6].nodes == std::vector<std::string> { "node04" });
    CHECK(calls[6].label == "single_node_depth3");
}

TEST_CASE("BisectionSearch: tiny rosters")
{
    MockBenchmarkRunner runner;

    SECTION("Single bad node")
    {
        runner.SetBadNodes({ "node00" });
        BisectionSearch search(runner, 8, timeout, 100.0);
        auto report = search.Run(MakeRoster(1));
        REQUIRE(report.has_value());
        CHECK(report->badNodes == CondemnedSet { "node00" });
        CHECK(Labels(runner) == std::vector<std::string> { "single_node_depth0" });
    }

    SECTION("Single good node")
    {
        BisectionSearch search(runner, 8, timeout, 100.0);
        auto report = search.Run(MakeRoster(1));
        REQUIRE(report.has_value());
        CHECK(report->badNodes.empty());
        CHECK(report->goodNodes == CondemnedSet { "node00" });
    }

    SECTION("Two nodes, second one bad")
    {
        runner.SetBadNodes({ "node01" });
        BisectionSearch search(runner, 8, timeout, 100.0);
        auto report = search.Run(MakeRoster(2));
        REQUIRE(report.has_value());
        CHECK(report->badNodes == CondemnedSet { "node01" });
        CHECK(report->goodNodes == CondemnedSet { "node00" });
        CHECK(Labels(runner)
              == std::vector<std::string> { "group_depth0", "single_node_depth1", "single_node_depth1" });
    }

    SECTION("Two nodes, both bad")
    {
        runner.SetBadNodes({ "node00", "node01" });
        BisectionSearch search(runner, 8, timeout, 100.0);
        auto report = search.Run(MakeRoster(2));
        REQUIRE(report.has_value());
        CHECK(report->badNodes == CondemnedSet { "node00", "node01" });
        CHECK(report->goodNodes.empty());
    }
}

TEST_CASE("BisectionSearch: threshold calibration from baseline")
{
    MockBenchmarkRunner runner;
    runner.SetBehavior([](std::vector<std::string> const &nodes, std::string const &label) -> MockBenchmarkRunner::Result {
        if (label == "baseline")
        {
            return BenchmarkOutput { MockBenchmarkRunner::MakeNcclOutput(250.0), 0 };
        }
        bool const hasSlow = std::ranges::find(nodes, "node02") != nodes.end();
        bool const hasEdge = std::ranges::find(nodes, "node03") != nodes.end();
        double const bandwidth = hasSlow ? 199.99 : (hasEdge ? 200.0 : 240.0);
        return BenchmarkOutput { MockBenchmarkRunner::MakeNcclOutput(bandwidth), 0 };
    });

    BisectionSearch search(runner, 8, timeout);
    auto report = search.Run(MakeRoster(4));
    REQUIRE(report.has_value());

    REQUIRE(report->threshold.has_value());
    CHECK_THAT(*report->threshold, WithinAbs(200.0, 1e-9));
    // Exactly at the threshold is still good
    CHECK(report->badNodes == CondemnedSet { "node02" });
    CHECK(report->goodNodes.contains("node03"));
}

TEST_CASE("BisectionSearch: baseline without bandwidth falls back to success")
{
    MockBenchmarkRunner runner;
    runner.SetBehavior([](std::vector<std::string> const &nodes, std::string const &label) -> MockBenchmarkRunner::Result {
        if (label == "baseline")
        {
            return std::unexpected(BenchmarkError { CHD_ST_TIMEOUT, "timed out" });
        }
        if (std::ranges::find(nodes, "node01") != nodes.end())
        {
            return std::unexpected(BenchmarkError { CHD_ST_TIMEOUT, "timed out" });
        }
        // Very low bandwidth, but no threshold exists to judge it
        return BenchmarkOutput { MockBenchmarkRunner::MakeNcclOutput(1.0), 0 };
    });

    BisectionSearch search(runner, 8, timeout);
    auto report = search.Run(MakeRoster(4));
    REQUIRE(report.has_value());

    CHECK_FALSE(report->threshold.has_value());
    CHECK(report->badNodes == CondemnedSet { "node01" });
    CHECK(report->history[0].label == "baseline");
    CHECK(report->history[0].error == "Test timeout");
}

TEST_CASE("BisectionSearch: calibrated threshold does not leak into the next run")
{
    MockBenchmarkRunner runner;
    double baseline = 250.0;
    runner.SetBehavior([&baseline](auto const &, std::string const &label) -> MockBenchmarkRunner::Result {
        return BenchmarkOutput { MockBenchmarkRunner::MakeNcclOutput(label == "baseline" ? baseline : 240.0), 0 };
    });

    BisectionSearch search(runner, 8, timeout);
    auto first = search.Run(MakeRoster(4));
    REQUIRE(first.has_value());
    REQUIRE(first->threshold.has_value());
    CHECK_THAT(*first->threshold, WithinAbs(200.0, 1e-9));

    baseline    = 100.0;
    auto second = search.Run(MakeRoster(4));
    REQUIRE(second.has_value());
    REQUIRE(second->threshold.has_value());
    CHECK_THAT(*second->threshold, WithinAbs(80.0, 1e-9));
    CHECK(second->history.Size() == 2);
}

TEST_CASE("BisectionSearch: progress is reported per test")
{
    MockBenchmarkRunner runner;
    runner.SetBadNodes({ "node01" });
    BisectionSearch search(runner, 8, timeout, 100.0);

    std::size_t progressCalls = 0;
    search.SetProgressCallback([&progressCalls](BenchmarkResult const &) { progressCalls++; });

    auto report = search.Run(MakeRoster(4));
    REQUIRE(report.has_value());
    CHECK(progressCalls == runner.GetCallCount());
    CHECK(progressCalls == report->history.Size());
}
