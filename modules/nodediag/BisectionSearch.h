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
#include <expected>
#include <optional>
#include <span>


namespace ChdNs::NodeDiag
{

struct BisectionReport
{
    Roster roster;
    std::optional<double> threshold; //!< GB/s. Unset when neither given nor calibrated
    CondemnedSet badNodes;
    CondemnedSet goodNodes;
    TestHistory history;
    Timelib::TimePoint timestamp;
    double durationSeconds = 0.0;
};

/**
 * Finds bad nodes by benchmarking the whole roster and recursively halving every failing group.
 *
 * A passing group marks all of its members good and is never tested again. The recursion is
 * depth-first and the left half always finishes before the right half starts.
 */
class BisectionSearch
{
public:
    /**
     * @param threshold   Bandwidth floor in GB/s. When std::nullopt, a baseline over the first two roster
     *                    nodes is run and 80% of its bandwidth becomes the threshold
     */
    BisectionSearch(BenchmarkRunnerBase &runner,
                    unsigned int processesPerNode,
                    std::chrono::seconds timeout,
                    std::optional<double> threshold = std::nullopt);

    void SetProgressCallback(BenchmarkEvaluator::ProgressCallback callback)
    {
        m_progressCallback = std::move(callback);
    }

    /**
     * @brief Run the search over the roster
     *
     * @return CHD_ST_BADPARAM for an empty roster
     */
    std::expected<BisectionReport, chdReturn_t> Run(Roster const &roster);

private:
    CondemnedSet Bisect(BenchmarkEvaluator &evaluator, std::span<NodeId const> nodes, unsigned int depth);

    BenchmarkRunnerBase &m_runner;
    unsigned int m_processesPerNode;
    std::chrono::seconds m_timeout;
    std::optional<double> m_threshold;
    std::optional<double> m_activeThreshold;
    CondemnedSet m_goodNodes;
    BenchmarkEvaluator::ProgressCallback m_progressCallback;
};

} // namespace ChdNs::NodeDiag
