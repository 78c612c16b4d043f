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
#ifndef CHDIAG_DETECT_H
#define CHDIAG_DETECT_H

#include "Command.h"

#include <BenchmarkResult.h>
#include <BenchmarkRunnerBase.h>
#include <BisectionSearch.h>
#include <PairwiseAnalyzer.h>
#include <nodediag_structs.hpp>

#include <chrono>
#include <cstdint>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct DetectParams
{
    std::string hostfile;
    ChdNs::NodeDiag::DetectionMode mode = ChdNs::NodeDiag::DetectionMode::Bisection;
    unsigned int processesPerNode       = NodeDiagConstants::DEFAULT_PROCESSES_PER_NODE;
    std::optional<double> threshold;
    std::string outputDir { NodeDiagConstants::DEFAULT_OUTPUT_DIR };
    std::optional<std::size_t> maxPairs;
    std::optional<std::uint64_t> seed;
    std::chrono::seconds timeout = NodeDiagConstants::DEFAULT_TEST_TIMEOUT;
    std::string benchmarkPath;
    bool json = false;
    LoggingParams logging;
};

/**
 * Runs bisection and/or pairwise detection over a hostfile and persists the reports
 */
class StartDetect : public Command
{
public:
    /**
     * @param runner  Benchmark backend. An MpiBenchmarkRunner is created when nullptr
     */
    explicit StartDetect(DetectParams params,
                         std::unique_ptr<ChdNs::NodeDiag::BenchmarkRunnerBase> runner = nullptr);

    /**
     * @brief One line verdict printed as soon as a benchmark completes
     */
    static std::string FormatProgressLine(ChdNs::NodeDiag::BenchmarkResult const &result);

    /**
     * @brief Paths of the reports written by the last execution
     */
    std::vector<std::string> const &GetReportFiles() const
    {
        return m_reportFiles;
    }

protected:
    int DoExecute() override;

private:
    std::ostream &Progress();

    int RunBisection(ChdNs::NodeDiag::Roster const &roster,
                     std::optional<ChdNs::NodeDiag::BisectionReport> &report);
    int RunPairwise(ChdNs::NodeDiag::Roster const &roster, std::optional<ChdNs::NodeDiag::PairwiseReport> &report);
    void PersistReport(Json::Value const &report, std::string_view prefix);

    void DisplayBisectionSummary(ChdNs::NodeDiag::BisectionReport const &report);
    void DisplayPairwiseSummary(ChdNs::NodeDiag::PairwiseReport const &report);
    void DisplayFinalSummary(ChdNs::NodeDiag::CondemnedSet const &condemned);

    DetectParams m_params;
    std::unique_ptr<ChdNs::NodeDiag::BenchmarkRunnerBase> m_runner;
    std::vector<std::string> m_reportFiles;
};

#endif // CHDIAG_DETECT_H
