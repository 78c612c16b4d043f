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
#include "Detect.h"

#include <ChdException.hpp>
#include <ChdLogging.h>
#include <ChdStringHelpers.h>
#include <IsolationAggregator.h>
#include <MpiBenchmarkRunner.h>
#include <NodeDiagReport.h>
#include <Roster.h>

#include <fmt/format.h>

#include <iostream>
#include <string>

using namespace ChdNs::NodeDiag;

namespace
{
std::string const g_separator(70, '=');

std::string AbbreviateNodes(std::vector<NodeId> const &nodes)
{
    constexpr std::size_t maxShown = 3;
    if (nodes.size() <= maxShown)
    {
        return ChdNs::Join(nodes, ", ");
    }
    return ChdNs::Join(nodes.begin(), nodes.begin() + maxShown, ", ") + ", ...";
}

std::string FormatBandwidth(std::optional<double> const &bandwidth)
{
    return bandwidth.has_value() ? fmt::format("{:.2f} GB/s", *bandwidth) : std::string("N/A");
}
} //namespace

/*****************************************************************************/
StartDetect::StartDetect(DetectParams params, std::unique_ptr<BenchmarkRunnerBase> runner)
    : m_params(std::move(params))
    , m_runner(std::move(runner))
{
    m_json = m_params.json;
    if (!m_runner)
    {
        m_runner = std::make_unique<MpiBenchmarkRunner>(m_params.benchmarkPath, m_params.outputDir);
    }
}

/*****************************************************************************/
std::string StartDetect::FormatProgressLine(BenchmarkResult const &result)
{
    std::string line = fmt::format("[{}] {} node(s): {} -> {} - Bandwidth: {}",
                                   result.label,
                                   result.nodes.size(),
                                   AbbreviateNodes(result.nodes),
                                   result.isGood ? "GOOD" : "BAD",
                                   FormatBandwidth(result.bandwidth));
    if (result.error.has_value())
    {
        line += fmt::format(" ({})", *result.error);
    }
    return line;
}

/*****************************************************************************/
std::ostream &StartDetect::Progress()
{
    // Keep stdout a single JSON document when --json is requested
    return m_json ? std::cerr : Out();
}

/*****************************************************************************/
void StartDetect::PersistReport(Json::Value const &report, std::string_view prefix)
{
    auto written = WriteReport(report, m_params.outputDir, prefix);
    if (!written)
    {
        throw ChdNs::ChdException(written.error(), fmt::format("unable to write {} to {}", prefix, m_params.outputDir));
    }
    Progress() << "Report saved to: " << *written << std::endl;
    m_reportFiles.push_back(std::move(*written));
}

/*****************************************************************************/
int StartDetect::RunBisection(Roster const &roster, std::optional<BisectionReport> &report)
{
    Progress() << std::endl << g_separator << std::endl << "BISECTION SLOW NODE DETECTION" << std::endl
               << g_separator << std::endl;
    Progress() << "Total nodes: " << roster.size() << std::endl;
    Progress() << "Processes per node: " << m_params.processesPerNode << std::endl;
    if (m_params.threshold.has_value())
    {
        Progress() << fmt::format("Threshold: {:.2f} GB/s", *m_params.threshold) << std::endl;
    }
    else
    {
        Progress() << "Threshold: Auto (80% of a " << NodeDiagConstants::BASELINE_NODE_COUNT << " node baseline)"
                   << std::endl;
    }

    BisectionSearch search(*m_runner, m_params.processesPerNode, m_params.timeout, m_params.threshold);
    search.SetProgressCallback(
        [this](BenchmarkResult const &result) { Progress() << FormatProgressLine(result) << std::endl; });

    auto result = search.Run(roster);
    if (!result)
    {
        log_error("Bisection search failed: {}", errorString(result.error()));
        std::cerr << "Error: bisection search failed: " << errorString(result.error()) << std::endl;
        return ExitStatusFromReturn(result.error());
    }
    report = std::move(*result);

    PersistReport(ToJson(*report), "bisection_report");
    DisplayBisectionSummary(*report);
    return CHD_EXIT_OK;
}

/*****************************************************************************/
int StartDetect::RunPairwise(Roster const &roster, std::optional<PairwiseReport> &report)
{
    Progress() << std::endl << g_separator << std::endl << "PAIRWISE NODE TESTING" << std::endl
               << g_separator << std::endl;

    PairwiseAnalyzer analyzer(
        *m_runner, m_params.processesPerNode, m_params.timeout, m_params.maxPairs, m_params.seed);
    analyzer.SetProgressCallback(
        [this](BenchmarkResult const &result) { Progress() << FormatProgressLine(result) << std::endl; });

    auto result = analyzer.Run(roster);
    if (!result)
    {
        log_error("Pairwise analysis failed: {}", errorString(result.error()));
        std::cerr << "Error: pairwise analysis failed: " << errorString(result.error()) << std::endl;
        return ExitStatusFromReturn(result.error());
    }
    report = std::move(*result);

    PersistReport(ToJson(*report), "pairwise_report");
    DisplayPairwiseSummary(*report);
    return CHD_EXIT_OK;
}

/*****************************************************************************/
void StartDetect::DisplayBisectionSummary(BisectionReport const &report)
{
    Progress() << std::endl << g_separator << std::endl << "BISECTION DETECTION COMPLETE" << std::endl
               << g_separator << std::endl;
    Progress() << "Total tests run: " << report.history.Size() << std::endl;
    Progress() << fmt::format("Duration: {:.1f} seconds", report.durationSeconds) << std::endl;
    Progress() << "Bad nodes found: " << report.badNodes.size() << std::endl;
    for (auto const &node : report.badNodes)
    {
        Progress() << "  x " << node << std::endl;
    }
}

/*****************************************************************************/
void StartDetect::DisplayPairwiseSummary(PairwiseReport const &report)
{
    Progress() << std::endl << g_separator << std::endl << "PAIRWISE TESTING COMPLETE" << std::endl
               << g_separator << std::endl;
    Progress() << "Pairs tested: " << report.totalPairs << " (seed " << report.seed << ")" << std::endl;
    Progress() << std::endl << "Node Performance Summary:" << std::endl << std::string(70, '-') << std::endl;
    for (auto const &[node, stats] : report.analysis.nodeStatistics)
    {
        Progress() << fmt::format("{:30s} | BW: {:>12s} | Failures: {}/{}",
                                  node,
                                  FormatBandwidth(stats.averageBandwidth),
                                  stats.failureCount,
                                  stats.totalTests)
                   << std::endl;
    }

    if (report.analysis.problematicNodes.empty())
    {
        Progress() << std::endl << "No problematic nodes detected" << std::endl;
        return;
    }
    Progress() << std::endl << "Problematic Nodes Detected:" << std::endl;
    for (auto const &problem : report.analysis.problematicNodes)
    {
        Progress() << fmt::format(
            "  x {}: {} ({})", problem.node, problem.reason, FormatBandwidth(problem.averageBandwidth))
                   << std::endl;
    }
}

/*****************************************************************************/
void StartDetect::DisplayFinalSummary(CondemnedSet const &condemned)
{
    Out() << std::endl << g_separator << std::endl << "FINAL SUMMARY" << std::endl << g_separator << std::endl;
    if (condemned.empty())
    {
        Out() << "All nodes performing well" << std::endl;
        return;
    }
    Out() << "ACTION REQUIRED: Isolate these nodes from the cluster:" << std::endl;
    for (auto const &node : condemned)
    {
        Out() << "  - " << node << std::endl;
    }
}

/*****************************************************************************/
int StartDetect::DoExecute()
{
    m_reportFiles.clear();

    auto roster = LoadRoster(m_params.hostfile);
    if (!roster)
    {
        std::cerr << "Error: Hostfile not found: " << m_params.hostfile << std::endl;
        return CHD_EXIT_CONFIG_ERROR;
    }
    if (roster->empty())
    {
        std::cerr << "Error: Hostfile " << m_params.hostfile << " does not list any node" << std::endl;
        return CHD_EXIT_CONFIG_ERROR;
    }
    log_info("Starting {} detection over {} nodes from {}", ModeToString(m_params.mode), roster->size(),
             m_params.hostfile);

    bool const runBisection = m_params.mode != DetectionMode::Pairwise;
    bool const runPairwise  = m_params.mode != DetectionMode::Bisection;

    std::optional<BisectionReport> bisection;
    std::optional<PairwiseReport> pairwise;

    if (runBisection)
    {
        if (int status = RunBisection(*roster, bisection); status != CHD_EXIT_OK)
        {
            return status;
        }
    }
    if (runPairwise)
    {
        if (int status = RunPairwise(*roster, pairwise); status != CHD_EXIT_OK)
        {
            return status;
        }
    }

    std::optional<CondemnedSet> bisectionNodes;
    std::optional<CondemnedSet> pairwiseNodes;
    if (bisection.has_value())
    {
        bisectionNodes = bisection->badNodes;
    }
    if (pairwise.has_value())
    {
        pairwiseNodes = pairwise->analysis.Condemned();
    }
    CondemnedSet const condemned = IsolationAggregator::Union(bisectionNodes, pairwiseNodes);

    if (m_json)
    {
        Out() << SerializeReport(CombinedReport(m_params.mode,
                                                bisection.has_value() ? &*bisection : nullptr,
                                                pairwise.has_value() ? &*pairwise : nullptr,
                                                condemned))
              << std::endl;
    }
    else
    {
        DisplayFinalSummary(condemned);
    }

    log_info("Detection finished with {} condemned node(s)", condemned.size());
    return IsolationAggregator::ExitStatus(condemned);
}
