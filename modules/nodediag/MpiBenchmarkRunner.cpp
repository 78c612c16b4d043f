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
#include "MpiBenchmarkRunner.h"

#include <ChdLogging.h>
#include <TimeLib.hpp>

#include <boost/filesystem.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace ChdNs::NodeDiag
{

namespace
{
std::string ResolveBenchmarkPath(std::string benchmarkPath)
{
    if (!benchmarkPath.empty())
    {
        return benchmarkPath;
    }

    char const *customPath = std::getenv(NodeDiagConstants::ENV_BENCHMARK_PATH.data());
    if (customPath && *customPath != '\0')
    {
        log_debug("Using custom benchmark path from environment: {}", customPath);
        return std::string(customPath);
    }

    return std::string(NodeDiagConstants::DEFAULT_BENCHMARK_PATH);
}
} // namespace

MpiBenchmarkRunner::MpiBenchmarkRunner(std::string benchmarkPath,
                                       std::optional<std::string> outputDir,
                                       std::unique_ptr<Common::Subprocess::ChildProcessRunnerBase> processRunner)
    : m_benchmarkPath(ResolveBenchmarkPath(std::move(benchmarkPath)))
    , m_outputDir(std::move(outputDir))
    , m_processRunner(std::move(processRunner))
{
    if (!m_processRunner)
    {
        m_processRunner = std::make_unique<Common::Subprocess::ChildProcessRunner>();
    }
}

std::vector<std::string> MpiBenchmarkRunner::ConstructMpiCommand(std::vector<std::string> const &nodes,
                                                                 unsigned int processesPerNode) const
{
    std::vector<std::string> hostSlots;
    hostSlots.reserve(nodes.size());
    for (auto const &node : nodes)
    {
        hostSlots.push_back(fmt::format("{}:{}", node, processesPerNode));
    }

    std::vector<std::string> command = { "-np",
                                         std::to_string(nodes.size() * processesPerNode),
                                         "--host",
                                         fmt::format("{}", fmt::join(hostSlots, ",")),
                                         "--bind-to",
                                         "none",
                                         "--map-by",
                                         "slot",
                                         "-mca",
                                         "pml",
                                         "ob1",
                                         "-mca",
                                         "btl",
                                         "^openib",
                                         "-x",
                                         "NCCL_DEBUG=WARN",
                                         "-x",
                                         "NCCL_IB_DISABLE=0",
                                         "-x",
                                         "LD_LIBRARY_PATH",
                                         m_benchmarkPath,
                                         "-b",
                                         "1G",
                                         "-e",
                                         "1G",
                                         "-f",
                                         "2",
                                         "-g",
                                         "1",
                                         "-c",
                                         "1",
                                         "-n",
                                         "20" };

    auto envAllowRunAsRoot = std::getenv(NodeDiagConstants::ENV_ALLOW_RUN_AS_ROOT.data()) ? true : false;
    if (geteuid() == 0 && envAllowRunAsRoot)
    {
        command.insert(command.begin(), "--allow-run-as-root");
    }

    return command;
}

std::string MpiBenchmarkRunner::GetMpiBinPath() const
{
    char const *customMpiPath = std::getenv(NodeDiagConstants::ENV_MPIRUN_PATH.data());
    if (customMpiPath && *customMpiPath != '\0')
    {
        log_debug("Using custom MPI path from environment: {}", customMpiPath);
        return std::string(customMpiPath);
    }

    return std::string(NodeDiagConstants::DEFAULT_MPIRUN_PATH);
}

std::string MpiBenchmarkRunner::GetLastCommand() const
{
    return m_lastCommand.empty() ? "" : fmt::format("{} {}", GetMpiBinPath(), fmt::join(m_lastCommand, " "));
}

std::expected<BenchmarkOutput, BenchmarkError> MpiBenchmarkRunner::RunBenchmark(std::vector<std::string> const &nodes,
                                                                                unsigned int processesPerNode,
                                                                                std::chrono::seconds timeout,
                                                                                std::string const &label)
{
    if (nodes.empty() || processesPerNode == 0)
    {
        log_error("Refusing to run benchmark with {} nodes and {} processes per node", nodes.size(), processesPerNode);
        return std::unexpected(BenchmarkError { CHD_ST_BADPARAM, "Empty node list or zero processes per node" });
    }

    m_lastCommand = ConstructMpiCommand(nodes, processesPerNode);
    m_lastOutputFile.reset();
    log_debug("Running: {}", GetLastCommand());

    auto result = m_processRunner->Run(GetMpiBinPath(), m_lastCommand, timeout);
    if (!result)
    {
        if (!result.error().partialOutput.empty())
        {
            PersistOutput(label, nodes.size(), result.error().partialOutput);
        }
        return std::unexpected(BenchmarkError { result.error().status, result.error().message });
    }

    PersistOutput(label, nodes.size(), result->output);
    return BenchmarkOutput { std::move(result->output), result->exitCode };
}

void MpiBenchmarkRunner::PersistOutput(std::string const &label, std::size_t nodeCount, std::string const &output)
{
    if (!m_outputDir.has_value())
    {
        return;
    }

    boost::system::error_code ec;
    boost::filesystem::create_directories(*m_outputDir, ec);
    if (ec)
    {
        log_warning("Unable to create output directory {}: {}", *m_outputDir, ec.message());
        return;
    }

    auto const path
        = boost::filesystem::path(*m_outputDir)
          / fmt::format(
              "nccl_{}_{}nodes_{}_{:04}.txt", label, nodeCount, Timelib::ToFileStamp(Timelib::Now()), ++m_logSequence);
    std::ofstream file(path.string());
    if (!file)
    {
        log_warning("Unable to write benchmark output to {}", path.string());
        return;
    }
    file << output;
    m_lastOutputFile = path.string();
}

} // namespace ChdNs::NodeDiag
