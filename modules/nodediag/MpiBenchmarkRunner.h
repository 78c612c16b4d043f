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
#ifndef CHD_MPI_BENCHMARK_RUNNER_H
#define CHD_MPI_BENCHMARK_RUNNER_H

#include "BenchmarkRunnerBase.h"
#include "nodediag_structs.hpp"

#include <ChildProcess/ChildProcessRunner.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ChdNs::NodeDiag
{

/**
 * @brief Runs the NCCL all_reduce_perf benchmark across nodes through mpirun
 */
class MpiBenchmarkRunner : public BenchmarkRunnerBase
{
public:
    /**
     * @brief Constructor
     *
     * @param benchmarkPath   Path to all_reduce_perf. Empty means CHD_BENCHMARK_PATH or the default location
     * @param outputDir       Directory for raw benchmark logs. std::nullopt disables persisting them
     * @param processRunner   Process launcher. A ChildProcessRunner is created when nullptr
     */
    explicit MpiBenchmarkRunner(
        std::string benchmarkPath                                            = {},
        std::optional<std::string> outputDir                                 = std::nullopt,
        std::unique_ptr<Common::Subprocess::ChildProcessRunnerBase> processRunner = nullptr);

    std::expected<BenchmarkOutput, BenchmarkError> RunBenchmark(std::vector<std::string> const &nodes,
                                                                unsigned int processesPerNode,
                                                                std::chrono::seconds timeout,
                                                                std::string const &label) override;

    /**
     * @brief Build the mpirun argument list (without the mpirun binary itself)
     */
    std::vector<std::string> ConstructMpiCommand(std::vector<std::string> const &nodes,
                                                 unsigned int processesPerNode) const;

    /**
     * @brief Get the path to the mpirun binary
     *
     * @return CHD_MPIRUN_PATH if set, /usr/bin/mpirun otherwise
     */
    std::string GetMpiBinPath() const;

    std::string GetBenchmarkBinPath() const
    {
        return m_benchmarkPath;
    }

    /**
     * @brief Get the last command that was used to launch mpirun, space delimited
     */
    std::string GetLastCommand() const;

    /**
     * @brief Path of the raw log written by the last invocation, if any
     */
    std::optional<std::string> GetLastOutputFile() const
    {
        return m_lastOutputFile;
    }

private:
    void PersistOutput(std::string const &label, std::size_t nodeCount, std::string const &output);

    std::string m_benchmarkPath;
    std::optional<std::string> m_outputDir;
    std::unique_ptr<Common::Subprocess::ChildProcessRunnerBase> m_processRunner;
    std::vector<std::string> m_lastCommand;
    std::optional<std::string> m_lastOutputFile;
    unsigned int m_logSequence = 0; //!< Keeps raw log names unique within one second
};

} // namespace ChdNs::NodeDiag

#endif // CHD_MPI_BENCHMARK_RUNNER_H
