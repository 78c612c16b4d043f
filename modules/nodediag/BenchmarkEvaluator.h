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

#include "BenchmarkResult.h"
#include "BenchmarkRunnerBase.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>


namespace ChdNs::NodeDiag
{

/**
 * Runs one benchmark over a node subset and turns the outcome into a BenchmarkResult.
 *
 * Every invocation, whether it succeeded, failed or timed out, is appended to the TestHistory
 * given at construction time.
 */
class BenchmarkEvaluator
{
public:
    using ProgressCallback = std::function<void(BenchmarkResult const &)>;

    BenchmarkEvaluator(BenchmarkRunnerBase &runner,
                       unsigned int processesPerNode,
                       std::chrono::seconds timeout,
                       TestHistory &history);

    /**
     * @brief Benchmark the given nodes
     *
     * @param nodes       Participating nodes, order preserved
     * @param label       Tag stored in the result
     * @param threshold   Bandwidth floor in GB/s. Without it the verdict follows the success flag
     * @return The result that was just appended to the history. The reference is invalidated by the next append
     */
    BenchmarkResult const &Evaluate(std::vector<NodeId> const &nodes,
                                    std::string const &label,
                                    std::optional<double> threshold = std::nullopt);

    void SetProgressCallback(ProgressCallback callback)
    {
        m_progressCallback = std::move(callback);
    }

private:
    BenchmarkRunnerBase &m_runner;
    unsigned int m_processesPerNode;
    std::chrono::seconds m_timeout;
    TestHistory &m_history;
    ProgressCallback m_progressCallback;
};

} // namespace ChdNs::NodeDiag
