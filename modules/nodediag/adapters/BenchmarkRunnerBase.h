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

#include <chd_structs.h>

#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace ChdNs::NodeDiag
{

/**
 * @brief Raw result of a benchmark process that ran to completion
 */
struct BenchmarkOutput
{
    std::string rawOutput;
    int exitCode = 0;
};

/**
 * @brief Reason a benchmark could not produce any output
 */
struct BenchmarkError
{
    chdReturn_t status = CHD_ST_GENERIC_ERROR; //!< CHD_ST_TIMEOUT for timeouts, anything else is an execution error
    std::string message;
};

/**
 * @brief Base interface for the external bandwidth benchmark to allow for mocking in tests
 */
class BenchmarkRunnerBase
{
public:
    virtual ~BenchmarkRunnerBase() = default;

    /**
     * @brief Run the collective bandwidth benchmark over the given nodes and wait for it to finish
     *
     * @param nodes              Participating nodes, in order
     * @param processesPerNode   Number of ranks to start on every node
     * @param timeout            Upper bound for the benchmark wall time
     * @param label              Short tag of the invocation, used for log and output file names
     * @return BenchmarkOutput when the process exited (with any exit code), BenchmarkError otherwise
     */
    virtual std::expected<BenchmarkOutput, BenchmarkError> RunBenchmark(std::vector<std::string> const &nodes,
                                                                        unsigned int processesPerNode,
                                                                        std::chrono::seconds timeout,
                                                                        std::string const &label)
        = 0;
};

} // namespace ChdNs::NodeDiag
