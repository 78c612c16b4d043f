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

#include "nodediag_structs.hpp"

#include <TimeLib.hpp>

#include <optional>
#include <string>
#include <vector>


namespace ChdNs::NodeDiag
{

/**
 * Outcome of one benchmark invocation over a set of nodes.
 * Created once by BenchmarkEvaluator and never modified afterwards.
 */
struct BenchmarkResult
{
    std::vector<NodeId> nodes;        //!< Participating nodes, in the order they were passed to the benchmark
    std::optional<double> bandwidth;  //!< Mean bus bandwidth in GB/s, if it could be parsed
    bool success = false;             //!< Benchmark completed cleanly and reported a bandwidth
    bool isGood  = false;             //!< Verdict: bandwidth >= threshold when both are known, success otherwise
    std::optional<int> exitCode;      //!< Exit code of the benchmark process, if it exited
    std::optional<std::string> error; //!< Failure description. Empty for successful runs
    Timelib::TimePoint timestamp;
    std::string label;
};

/**
 * Append-only ordered log of benchmark results.
 */
class TestHistory
{
public:
    using const_iterator = std::vector<BenchmarkResult>::const_iterator;

    void Append(BenchmarkResult result)
    {
        m_results.push_back(std::move(result));
    }

    [[nodiscard]] std::size_t Size() const
    {
        return m_results.size();
    }

    [[nodiscard]] bool Empty() const
    {
        return m_results.empty();
    }

    [[nodiscard]] BenchmarkResult const &operator[](std::size_t index) const
    {
        return m_results[index];
    }

    [[nodiscard]] BenchmarkResult const &Back() const
    {
        return m_results.back();
    }

    [[nodiscard]] const_iterator begin() const
    {
        return m_results.cbegin();
    }

    [[nodiscard]] const_iterator end() const
    {
        return m_results.cend();
    }

private:
    std::vector<BenchmarkResult> m_results;
};

} // namespace ChdNs::NodeDiag
