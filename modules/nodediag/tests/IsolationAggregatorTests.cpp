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

#include <IsolationAggregator.h>
#include <catch2/catch_all.hpp>

#include "TestTempDir.h"

#include <array>
#include <sstream>

using namespace ChdNs::NodeDiag;

namespace
{
Json::Value Parse(std::string const &text)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    Json::String errors;
    std::istringstream input(text);
    REQUIRE(Json::parseFromStream(builder, input, &root, &errors));
    return root;
}
} // namespace

TEST_CASE("IsolationAggregator::Union")
{
    SECTION("Zero methods")
    {
        CHECK(IsolationAggregator::Union(std::nullopt, std::nullopt).empty());
        CHECK(IsolationAggregator::Union(std::span<CondemnedSet const> {}).empty());
    }

    SECTION("One method")
    {
        CHECK(IsolationAggregator::Union(CondemnedSet { "a", "b" }, std::nullopt) == CondemnedSet { "a", "b" });
        CHECK(IsolationAggregator::Union(std::nullopt, CondemnedSet { "c" }) == CondemnedSet { "c" });
    }

    SECTION("Two methods overlap")
    {
        CHECK(IsolationAggregator::Union(CondemnedSet { "a", "b" }, CondemnedSet { "b", "c" })
              == CondemnedSet { "a", "b", "c" });
    }

    SECTION("Any number of methods")
    {
        std::array<CondemnedSet, 3> const results { CondemnedSet { "x" }, CondemnedSet {}, CondemnedSet { "y", "x" } };
        CHECK(IsolationAggregator::Union(results) == CondemnedSet { "x", "y" });
    }
}

TEST_CASE("IsolationAggregator::ExitStatus")
{
    CHECK(IsolationAggregator::ExitStatus({}) == CHD_EXIT_OK);
    CHECK(IsolationAggregator::ExitStatus({ "node01" }) == CHD_EXIT_NODES_CONDEMNED);
    CHECK(CHD_EXIT_NODES_CONDEMNED != CHD_EXIT_CONFIG_ERROR);
}

TEST_CASE("IsolationAggregator::FromReport")
{
    SECTION("Bisection report")
    {
        auto const report = Parse(R"({"bad_nodes": ["node03", "node07"], "good_nodes": ["node01"]})");
        CHECK(IsolationAggregator::FromReport(report) == CondemnedSet { "node03", "node07" });
    }

    SECTION("Pairwise report")
    {
        auto const report = Parse(R"({"analysis": {"problematic_nodes": [
            {"node": "node02", "reason": "Low bandwidth"},
            {"node": "node05", "reason": "High failure rate"}]}})");
        CHECK(IsolationAggregator::FromReport(report) == CondemnedSet { "node02", "node05" });
    }

    SECTION("Combined report")
    {
        auto const report = Parse(R"({
            "mode": "both",
            "bisection": {"bad_nodes": ["node03"]},
            "pairwise": {"analysis": {"problematic_nodes": [{"node": "node04"}]}},
            "condemned_nodes": ["node03", "node04"]})");
        CHECK(IsolationAggregator::FromReport(report) == CondemnedSet { "node03", "node04" });
    }

    SECTION("Malformed fields contribute nothing")
    {
        auto const report = Parse(R"({
            "bad_nodes": "node01",
            "condemned_nodes": [1, null, "node09"],
            "analysis": {"problematic_nodes": [{"name": "node02"}, "node03", {"node": 4}]},
            "pairwise": []})");
        CHECK(IsolationAggregator::FromReport(report) == CondemnedSet { "node09" });
        CHECK(IsolationAggregator::FromReport(Json::Value(Json::arrayValue)).empty());
        CHECK(IsolationAggregator::FromReport(Json::Value("text")).empty());
    }
}

TEST_CASE("IsolationAggregator::FromReportFile")
{
    TestTempDir dir;

    auto const valid = dir.WriteFile("report.json", R"({"bad_nodes": ["node03"]})");
    auto condemned   = IsolationAggregator::FromReportFile(valid);
    REQUIRE(condemned.has_value());
    CHECK(*condemned == CondemnedSet { "node03" });

    auto const invalid = dir.WriteFile("broken.json", "{\"bad_nodes\": [");
    auto broken        = IsolationAggregator::FromReportFile(invalid);
    REQUIRE_FALSE(broken.has_value());
    CHECK(broken.error() == CHD_ST_BADPARAM);

    auto missing = IsolationAggregator::FromReportFile((dir.Path() / "missing.json").string());
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error() == CHD_ST_FILE_IO_ERROR);
}
