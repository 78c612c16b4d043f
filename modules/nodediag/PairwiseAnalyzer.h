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
#pragma once

#include "BenchmarkEvaluator.h"
#include "BenchmarkResult.h"
#include "BenchmarkRunnerBase.h"
#include "nodediag_structs.hpp"

#include <chd_structs.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>


namespace ChdNs::NodeDiag
{

using NodePair = std::pair<NodeId, NodeId>;

struct PairResult
{
    NodePair nodes;
    std::optional<double> bandwidth; //!< GB/s
    bool success = false;
    Timelib::TimePoint timestamp;
};

struct NodeStatistics
{
    std::vector<double> bandwidths;         //!< Bandwidth of every pair containing the node that reported one
    unsigned int failureCount = 0;          //!< Pairs containing the node that did not succeed
    unsigned int totalTests   = 0;          //!< Pairs containing the node
    std::optional<double> averageBandwidth; //!< Unset when no pair reported a bandwidth
    double stdBandwidth = 0.0;              //!< Population std of bandwidths
    double failureRate  = 0.0;
};

struct ProblematicNode
{
    NodeId node;
    std::optional<double> averageBandwidth;
    double failureRate = 0.0;
    std::string reason;
};

struct PairwiseAnalysis
{
    std::map<NodeId, NodeStatistics> nodeStatistics;
    std::optional<double> overallMeanBandwidth; //!< Mean of per-node averages
    std::optional<double> overallStdBandwidth;  //!< Population std of per-node averages
    std::optional<double> thresholdBandwidth;   //!< overall mean - 2 * overall std
    std::vector<ProblematicNode> problematicNodes;

    [[nodiscard]] CondemnedSet Condemned() const;
};

struct PairwiseReport
{
    Roster roster;
    std::size_t totalPairs = 0; //!< Pairs actually tested
    std::uint64_t seed     = 0; //!< Seed of the pair sampler
    std::vector<PairResult> pairResults;
    PairwiseAnalysis analysis;
    TestHistory history;
    Timelib::TimePoint timestamp;
    double durationSeconds = 0.0;
};

/**
 * Benchmarks node pairs one at a time and flags nodes that are consistently slow or unreliable.
 */
class PairwiseAnalyzer
{
public:
    /**
     * @param maxPairs  Upper bound for the number of pairs. A random subset is tested when the roster has more
     * @param seed      Seed for the pair sampler. A random seed is drawn (and reported) when std::nullopt
     */
    PairwiseAnalyzer(BenchmarkRunnerBase &runner,
                     unsigned int processesPerNode,
                     std::chrono::seconds timeout,
                     std::optional<std::size_t> maxPairs = std::nullopt,
                     std::optional<std::uint64_t> seed   = std::nullopt);

    void SetProgressCallback(BenchmarkEvaluator::ProgressCallback callback)
    {
        m_progressCallback = std::move(callback);
    }

    /**
     * @brief Test all (or a sample of) pairs of the roster and analyze the results
     *
     * @return CHD_ST_BADPARAM for an empty roster
     */
    std::expected<PairwiseReport, chdReturn_t> Run(Roster const &roster);

    /**
     * @brief All unordered pairs (i < j) in roster order
     */
    static std::vector<NodePair> BuildPairs(Roster const &roster);

    /**
     * @brief Uniform random subset of exactly maxPairs pairs. Relative order is preserved.
     *
     * Returns the input unchanged when it has no more than maxPairs entries.
     */
    static std::vector<NodePair> SamplePairs(std::vector<NodePair> const &pairs,
                                             std::size_t maxPairs,
                                             std::mt19937_64 &rng);

    /**
     * @brief Aggregate pair results into per-node statistics and flag problematic nodes
     *
     * A node is problematic when its average bandwidth is below mean - 2 sigma of all per-node averages,
     * or when more than 20% of its pairs failed.
     */
    static PairwiseAnalysis Analyze(std::vector<PairResult> const &results);

private:
    BenchmarkRunnerBase &m_runner;
    unsigned int m_processesPerNode;
    std::chrono::seconds m_timeout;
    std::optional<std::size_t> m_maxPairs;
    std::optional<std::uint64_t> m_seed;
    BenchmarkEvaluator::ProgressCallback m_progressCallback;
};

} // namespace ChdNs::NodeDiag
