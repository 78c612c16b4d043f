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
#include "BenchmarkEvaluator.h"
#include "BandwidthParser.h"

#include <ChdLogging.h>

#include <fmt/format.h>
#include <fmt/ranges.h>


namespace ChdNs::NodeDiag
{

BenchmarkEvaluator::BenchmarkEvaluator(BenchmarkRunnerBase &runner,
                                       unsigned int processesPerNode,
                                       std::chrono::seconds timeout,
                                       TestHistory &history)
    : m_runner(runner)
    , m_processesPerNode(processesPerNode)
    , m_timeout(timeout)
    , m_history(history)
{}

BenchmarkResult const &BenchmarkEvaluator::Evaluate(std::vector<NodeId> const &nodes,
                                                    std::string const &label,
                                                    std::optional<double> threshold)
{
    log_info("Testing {} nodes [{}]: {}", nodes.size(), label, fmt::join(nodes, ","));

    BenchmarkResult result;
    result.nodes = nodes;
    result.label = label;

    auto output = m_runner.RunBenchmark(nodes, m_processesPerNode, m_timeout, label);
    if (!output)
    {
        result.success = false;
        if (output.error().status == CHD_ST_TIMEOUT)
        {
            result.error = "Test timeout";
            log_warning("Benchmark [{}] timed out after {}s", label, m_timeout.count());
        }
        else if (output.error().status == CHD_ST_CHILD_NOT_KILLED)
        {
            result.error = "Test timeout, benchmark could not be stopped";
            log_error("Benchmark [{}] timed out after {}s and could not be stopped: {}",
                      label,
                      m_timeout.count(),
                      output.error().message);
        }
        else
        {
            result.error = fmt::format("Failed to launch benchmark: {}", output.error().message);
            log_error("Benchmark [{}] could not be executed: {} ({})",
                      label,
                      output.error().message,
                      errorString(output.error().status));
        }
    }
    else
    {
        result.exitCode  = output->exitCode;
        result.bandwidth = ParseAverageBusBandwidth(output->rawOutput);

        if (output->exitCode != 0)
        {
            result.success = false;
            result.error   = fmt::format("Benchmark exited with code {}", output->exitCode);
            log_warning("Benchmark [{}] exited with code {}", label, output->exitCode);
        }
        else if (!result.bandwidth.has_value())
        {
            result.success = false;
            result.error   = "Unable to parse bandwidth from benchmark output";
            log_warning("Benchmark [{}] finished but no bandwidth could be parsed from its output", label);
        }
        else
        {
            result.success = true;
        }
    }

    // A non-zero exit is bad even when the output still carries a bandwidth
    if (result.success && threshold.has_value())
    {
        result.isGood = *result.bandwidth >= *threshold;
    }
    else
    {
        result.isGood = result.success;
    }

    result.timestamp = Timelib::Now();

    if (result.bandwidth.has_value())
    {
        log_info("[{}] bandwidth {:.2f} GB/s, {}", label, *result.bandwidth, result.isGood ? "GOOD" : "BAD");
    }
    else
    {
        log_info("[{}] no bandwidth, {}", label, result.isGood ? "GOOD" : "BAD");
    }

    m_history.Append(std::move(result));
    BenchmarkResult const &stored = m_history.Back();

    if (m_progressCallback)
    {
        m_progressCallback(stored);
    }

    return stored;
}

} // namespace ChdNs::NodeDiag
