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
#include "PairwiseAnalyzer.h"
#include "OutlierDetector.h"

#include <ChdLogging.h>

#include <algorithm>
#include <fmt/format.h>
#include <iterator>


namespace ChdNs::NodeDiag
{

CondemnedSet PairwiseAnalysis::Condemned() const
{
    CondemnedSet result;
    for (auto const &problem : problematicNodes)
    {
        result.insert(problem.node);
    }
    return result;
}

PairwiseAnalyzer::PairwiseAnalyzer(BenchmarkRunnerBase &runner,
                                   unsigned int processesPerNode,
                                   std::chrono::seconds timeout,
                                   std::optional<std::size_t> maxPairs,
                                   std::optional<std::uint64_t> seed)
    : m_runner(runner)
    , m_processesPerNode(processesPerNode)
    , m_timeout(timeout)
    , m_maxPairs(maxPairs)
    , m_seed(seed)
{}

std::vector<NodePair> PairwiseAnalyzer::BuildPairs(Roster const &roster)
{
    std::vector<NodePair> pairs;
    if (roster.size() < 2)
    {
        return pairs;
    }

    pairs.reserve(roster.size() * (roster.size() - 1) / 2);
    for (std::size_t i = 0; i < roster.size(); ++i)
    {
        for (std::size_t j = i + 1; j < roster.size(); ++j)
        {
            pairs.emplace_back(roster[i], roster[j]);
        }
    }
    return pairs;
}

std::vector<NodePair> PairwiseAnalyzer::SamplePairs(std::vector<NodePair> const &pairs,
                                                    std::size_t maxPairs,
                                                    std::mt19937_64 &rng)
{
    if (pairs.size() <= maxPairs)
    {
        return pairs;
    }

    std::vector<NodePair> sampled;
    sampled.reserve(maxPairs);
    std::sample(pairs.begin(), pairs.end(), std::back_inserter(sampled), maxPairs, rng);
    return sampled;
}

PairwiseAnalysis PairwiseAnalyzer::Analyze(std::vector<PairResult> const &results)
{
    PairwiseAnalysis analysis;

    for (auto const &result : results)
    {
        for (auto const *node : { &result.nodes.first, &result.nodes.second })
        {
            auto &stats = analysis.nodeStatistics[*node];
            stats.totalTests++;
            if (result.bandwidth.has_value())
            {
                stats.bandwidths.push_back(*result.bandwidth);
            }
            if (!result.success)
            {
                stats.failureCount++;
            }
        }
    }

    std::vector<double> averages;
    for (auto &[node, stats] : analysis.nodeStatistics)
    {
        stats.failureRate = stats.totalTests > 0
                                ? static_cast<double>(stats.failureCount) / static_cast<double>(stats.totalTests)
                                : 0.0;
        if (!stats.bandwidths.empty())
        {
            stats.averageBandwidth = OutlierDetector::Mean(stats.bandwidths);
            stats.stdBandwidth     = OutlierDetector::StdDev(stats.bandwidths);
            averages.push_back(*stats.averageBandwidth);
        }
    }

    if (!averages.empty())
    {
        analysis.overallMeanBandwidth = OutlierDetector::Mean(averages);
        analysis.overallStdBandwidth  = OutlierDetector::StdDev(averages);
        analysis.thresholdBandwidth   = *analysis.overallMeanBandwidth
                                      - NodeDiagConstants::PAIRWISE_SIGMA_MULTIPLIER * *analysis.overallStdBandwidth;
    }

    for (auto const &[node, stats] : analysis.nodeStatistics)
    {
        bool const lowBandwidth = stats.averageBandwidth.has_value() && analysis.thresholdBandwidth.has_value()
                                  && *stats.averageBandwidth < *analysis.thresholdBandwidth;
        bool const highFailureRate = stats.failureRate > NodeDiagConstants::PAIRWISE_MAX_FAILURE_RATE;

        if (lowBandwidth || highFailureRate)
        {
            analysis.problematicNodes.push_back(ProblematicNode {
                node,
                stats.averageBandwidth,
                stats.failureRate,
                std::string(lowBandwidth ? NodeDiagConstants::REASON_LOW_BANDWIDTH
                                         : NodeDiagConstants::REASON_HIGH_FAILURE_RATE) });
        }
    }

    return analysis;
}

std::expected<PairwiseReport, chdReturn_t> PairwiseAnalyzer::Run(Roster const &roster)
{
    if (roster.empty())
    {
        log_error("Pairwise testing requires at least one node");
        return std::unexpected(CHD_ST_BADPARAM);
    }

    PairwiseReport report;
    report.roster = roster;
    report.seed   = m_seed.has_value() ? *m_seed
                                       : (static_cast<std::uint64_t>(std::random_device {}()) << 32)
                                           | std::random_device {}();

    std::mt19937_64 rng(report.seed);
    auto pairs = BuildPairs(roster);
    if (m_maxPairs.has_value() && pairs.size() > *m_maxPairs)
    {
        log_info("Limiting to {} pairs (out of {} total), seed {}", *m_maxPairs, pairs.size(), report.seed);
        pairs = SamplePairs(pairs, *m_maxPairs, rng);
    }
    else
    {
        log_info("Testing {} node pairs", pairs.size());
    }

    if (pairs.empty())
    {
        log_warning("Roster of {} node(s) has no pairs to test", roster.size());
    }

    BenchmarkEvaluator evaluator(m_runner, m_processesPerNode, m_timeout, report.history);
    evaluator.SetProgressCallback(m_progressCallback);

    auto const start = Timelib::Now();
    for (std::size_t i = 0; i < pairs.size(); ++i)
    {
        auto const &[first, second] = pairs[i];
        log_debug("[{}/{}] Testing pair: {} <-> {}", i + 1, pairs.size(), first, second);

        auto const &result = evaluator.Evaluate({ first, second }, fmt::format("pair_{}", i + 1));
        report.pairResults.push_back(PairResult { pairs[i], result.bandwidth, result.success, result.timestamp });
    }

    report.totalPairs      = pairs.size();
    report.analysis        = Analyze(report.pairResults);
    auto const end         = Timelib::Now();
    report.durationSeconds = Timelib::SecondsBetween(start, end);
    report.timestamp       = end;

    log_info("Pairwise testing finished: {} pairs, {} problematic nodes",
             report.totalPairs,
             report.analysis.problematicNodes.size());
    return report;
}

} // namespace ChdNs::NodeDiag
