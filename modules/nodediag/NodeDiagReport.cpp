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
#include "NodeDiagReport.h"

#include <ChdLogging.h>
#include <TimeLib.hpp>

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <fstream>


namespace ChdNs::NodeDiag
{

namespace
{
Json::Value OptionalToJson(std::optional<double> const &value)
{
    return value.has_value() ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value NodesToJson(auto const &nodes)
{
    Json::Value array(Json::arrayValue);
    for (auto const &node : nodes)
    {
        array.append(node);
    }
    return array;
}
} // namespace

std::string ModeToString(DetectionMode mode)
{
    switch (mode)
    {
        case DetectionMode::Bisection:
            return "bisection";
        case DetectionMode::Pairwise:
            return "pairwise";
        case DetectionMode::Both:
            return "both";
    }
    return "unknown";
}

Json::Value ToJson(BenchmarkResult const &result)
{
    Json::Value entry(Json::objectValue);
    entry["nodes"]          = NodesToJson(result.nodes);
    entry["node_count"]     = static_cast<Json::UInt>(result.nodes.size());
    entry["label"]          = result.label;
    entry["test_name"]      = result.label;
    entry["timestamp"]      = Timelib::ToIsoString(result.timestamp);
    entry["success"]        = result.success;
    entry["is_good"]        = result.isGood;
    entry["bandwidth_gb_s"] = OptionalToJson(result.bandwidth);
    if (result.exitCode.has_value())
    {
        entry["return_code"] = *result.exitCode;
    }
    if (result.error.has_value())
    {
        entry["error"] = *result.error;
    }
    return entry;
}

Json::Value ToJson(TestHistory const &history)
{
    Json::Value array(Json::arrayValue);
    for (auto const &result : history)
    {
        array.append(ToJson(result));
    }
    return array;
}

Json::Value ToJson(BisectionReport const &report)
{
    Json::Value root(Json::objectValue);
    root["timestamp"]        = Timelib::ToIsoString(report.timestamp);
    root["total_nodes"]      = static_cast<Json::UInt>(report.roster.size());
    root["total_tests"]      = static_cast<Json::UInt>(report.history.Size());
    root["duration_seconds"] = report.durationSeconds;
    root["threshold_gb_s"]   = OptionalToJson(report.threshold);
    root["bad_nodes"]        = NodesToJson(report.badNodes);
    root["good_nodes"]       = NodesToJson(report.goodNodes);
    root["test_history"]     = ToJson(report.history);
    return root;
}

Json::Value ToJson(PairwiseAnalysis const &analysis)
{
    Json::Value root(Json::objectValue);

    Json::Value stats(Json::objectValue);
    for (auto const &[node, nodeStats] : analysis.nodeStatistics)
    {
        Json::Value entry(Json::objectValue);
        entry["average_bandwidth_gb_s"] = OptionalToJson(nodeStats.averageBandwidth);
        entry["std_bandwidth_gb_s"]     = nodeStats.stdBandwidth;
        entry["failure_count"]          = nodeStats.failureCount;
        entry["total_tests"]            = nodeStats.totalTests;
        entry["failure_rate"]           = nodeStats.failureRate;
        stats[node]                     = entry;
    }
    root["node_statistics"] = stats;

    if (analysis.overallMeanBandwidth.has_value())
    {
        root["overall_mean_bandwidth"] = *analysis.overallMeanBandwidth;
        root["overall_std_bandwidth"]  = OptionalToJson(analysis.overallStdBandwidth);
        root["threshold_bandwidth"]    = OptionalToJson(analysis.thresholdBandwidth);
    }

    Json::Value problems(Json::arrayValue);
    for (auto const &problem : analysis.problematicNodes)
    {
        Json::Value entry(Json::objectValue);
        entry["node"]                   = problem.node;
        entry["average_bandwidth_gb_s"] = OptionalToJson(problem.averageBandwidth);
        entry["failure_rate"]           = problem.failureRate;
        entry["reason"]                 = problem.reason;
        problems.append(entry);
    }
    root["problematic_nodes"] = problems;

    return root;
}

Json::Value ToJson(PairwiseReport const &report)
{
    Json::Value root(Json::objectValue);
    root["timestamp"]        = Timelib::ToIsoString(report.timestamp);
    root["total_nodes"]      = static_cast<Json::UInt>(report.roster.size());
    root["total_pairs"]      = static_cast<Json::UInt>(report.totalPairs);
    root["seed"]             = static_cast<Json::UInt64>(report.seed);
    root["duration_seconds"] = report.durationSeconds;

    Json::Value pairs(Json::objectValue);
    for (auto const &pair : report.pairResults)
    {
        Json::Value entry(Json::objectValue);
        entry["nodes"]          = NodesToJson(std::vector<NodeId> { pair.nodes.first, pair.nodes.second });
        entry["bandwidth_gb_s"] = OptionalToJson(pair.bandwidth);
        entry["success"]        = pair.success;
        entry["timestamp"]      = Timelib::ToIsoString(pair.timestamp);
        pairs[fmt::format("{}↔{}", pair.nodes.first, pair.nodes.second)] = entry;
    }
    root["pairwise_results"] = pairs;
    root["analysis"]         = ToJson(report.analysis);
    root["test_history"]     = ToJson(report.history);
    return root;
}

Json::Value CombinedReport(DetectionMode mode,
                           BisectionReport const *bisection,
                           PairwiseReport const *pairwise,
                           CondemnedSet const &condemned)
{
    Json::Value root(Json::objectValue);
    root["mode"] = ModeToString(mode);
    if (bisection != nullptr)
    {
        root["bisection"] = ToJson(*bisection);
    }
    if (pairwise != nullptr)
    {
        root["pairwise"] = ToJson(*pairwise);
    }
    root["condemned_nodes"] = NodesToJson(condemned);
    return root;
}

std::string SerializeReport(Json::Value const &report)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"]    = true;
    return Json::writeString(builder, report);
}

std::expected<std::string, chdReturn_t> WriteReport(Json::Value const &report,
                                                    std::string const &outputDir,
                                                    std::string_view prefix)
{
    boost::system::error_code ec;
    boost::filesystem::create_directories(outputDir, ec);
    if (ec)
    {
        log_error("Unable to create output directory {}: {}", outputDir, ec.message());
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    auto const path = (boost::filesystem::path(outputDir)
                       / fmt::format("{}_{}.json", prefix, Timelib::ToFileStamp(Timelib::Now())))
                          .string();

    std::ofstream file(path);
    if (!file)
    {
        log_error("Unable to open {} for writing", path);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    file << SerializeReport(report) << "\n";
    if (!file)
    {
        log_error("Error while writing report {}", path);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    log_info("Report saved to {}", path);
    return path;
}

} // namespace ChdNs::NodeDiag
