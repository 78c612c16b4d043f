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
#include "BisectionSearch.h"

#include <ChdLogging.h>

#include <algorithm>
#include <fmt/format.h>


namespace ChdNs::NodeDiag
{

BisectionSearch::BisectionSearch(BenchmarkRunnerBase &runner,
                                 unsigned int processesPerNode,
                                 std::chrono::seconds timeout,
                                 std::optional<double> threshold)
    : m_runner(runner)
    , m_processesPerNode(processesPerNode)
    , m_timeout(timeout)
    , m_threshold(threshold)
{}

std::expected<BisectionReport, chdReturn_t> BisectionSearch::Run(Roster const &roster)
{
    if (roster.empty())
    {
        log_error("Bisection search requires at least one node");
        return std::unexpected(CHD_ST_BADPARAM);
    }

    BisectionReport report;
    report.roster = roster;
    m_goodNodes.clear();
    m_activeThreshold = m_threshold;

    BenchmarkEvaluator evaluator(m_runner, m_processesPerNode, m_timeout, report.history);
    evaluator.SetProgressCallback(m_progressCallback);

    auto const start = Timelib::Now();

    if (!m_activeThreshold.has_value())
    {
        auto const baselineCount = std::min(roster.size(), NodeDiagConstants::BASELINE_NODE_COUNT);
        std::vector<NodeId> const baselineNodes(roster.begin(), roster.begin() + baselineCount);

        log_info("Running baseline test on {} nodes to establish threshold", baselineNodes.size());
        auto const &baseline = evaluator.Evaluate(baselineNodes, "baseline");
        if (baseline.bandwidth.has_value())
        {
            m_activeThreshold = *baseline.bandwidth * NodeDiagConstants::BASELINE_THRESHOLD_FRACTION;
            log_info("Threshold set to {:.2f} GB/s ({}% of baseline)",
                     *m_activeThreshold,
                     NodeDiagConstants::BASELINE_THRESHOLD_FRACTION * 100);
        }
        else
        {
            log_warning("Baseline produced no bandwidth. Verdicts fall back to benchmark success");
        }
    }

    report.badNodes  = Bisect(evaluator, roster, 0);
    report.goodNodes = m_goodNodes;
    report.threshold = m_activeThreshold;

    auto const end         = Timelib::Now();
    report.durationSeconds = Timelib::SecondsBetween(start, end);
    report.timestamp       = end;

    log_info("Bisection finished after {} tests in {:.1f}s. {} bad nodes",
             report.history.Size(),
             report.durationSeconds,
             report.badNodes.size());
    return report;
}

CondemnedSet BisectionSearch::Bisect(BenchmarkEvaluator &evaluator,
                                     std::span<NodeId const> nodes,
                                     unsigned int depth)
{
    if (nodes.empty())
    {
        return {};
    }

    std::vector<NodeId> const group(nodes.begin(), nodes.end());

    if (nodes.size() == 1)
    {
        auto const &result = evaluator.Evaluate(group, fmt::format("single_node_depth{}", depth), m_activeThreshold);
        if (!result.isGood)
        {
            log_info("Node {} is BAD", nodes.front());
            return { nodes.front() };
        }
        log_info("Node {} is GOOD", nodes.front());
        m_goodNodes.insert(nodes.front());
        return {};
    }

    auto const &result = evaluator.Evaluate(group, fmt::format("group_depth{}", depth), m_activeThreshold);
    if (result.isGood)
    {
        log_info("All {} nodes at depth {} are GOOD", nodes.size(), depth);
        m_goodNodes.insert(nodes.begin(), nodes.end());
        return {};
    }

    log_info("Group of {} nodes at depth {} has issues, splitting", nodes.size(), depth);

    auto const mid = nodes.size() / 2;
    CondemnedSet bad      = Bisect(evaluator, nodes.first(mid), depth + 1);
    CondemnedSet rightBad = Bisect(evaluator, nodes.subspan(mid), depth + 1);
    bad.merge(rightBad);
    return bad;
}

} // namespace ChdNs::NodeDiag
