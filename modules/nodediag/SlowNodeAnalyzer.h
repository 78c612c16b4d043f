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

#include "BandwidthParser.h"
#include "OutlierDetector.h"

#include <chd_structs.h>
#include <TimeLib.hpp>

#include <algorithm>
#include <cstdint>
#include <expected>
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace ChdNs::NodeDiag
{

struct SlowNodeFinding
{
    std::string hostname;
    std::size_t index = 0; //!< Position of the host in the results file
    std::string reason;
    OutlierDetector::Confidence confidence = OutlierDetector::Confidence::High;
};

struct SlowSampleFinding
{
    std::size_t slowSamples = 0; //!< Samples below mean - 2 sigma
    double threshold        = 0.0;
    double percentage       = 0.0;
};

/**
 * Offline analysis of previously collected benchmark output.
 */
struct SlowNodeAnalysis
{
    Timelib::TimePoint timestamp;
    std::optional<OutlierDetector::SampleSummary> statistics; //!< Per-test maxima, results file mode
    std::map<std::uint64_t, OutlierDetector::SampleSummary> performanceBySize; //!< Raw log mode
    std::optional<OutlierDetector::SampleSummary> summary;                     //!< Raw log mode
    OutlierDetector::OutlierClassification outliers;
    std::vector<SlowNodeFinding> slowNodes;
    std::optional<SlowSampleFinding> slowSamples;
    std::optional<std::string> error;

    /**
     * Medium confidence findings alone do not count as a detection.
     */
    [[nodiscard]] bool SlowDetected() const
    {
        return slowSamples.has_value()
               || std::any_of(slowNodes.begin(), slowNodes.end(), [](SlowNodeFinding const &finding) {
                      return finding.confidence == OutlierDetector::Confidence::High;
                  });
    }
};

/**
 * @brief Analyze raw nccl-tests output
 *
 * Samples are grouped by message size. Sizes with fewer than 3 samples are ignored for statistics.
 * Samples below mean - 2 sigma of the remaining values are reported as slow.
 */
SlowNodeAnalysis AnalyzeRawLog(std::string_view content,
                               double zscoreThreshold = NodeDiagConstants::DEFAULT_ZSCORE_THRESHOLD);

/**
 * @brief Analyze a results document of the form
 *        `{"hosts": [...], "gpus_per_node": 8, "tests": [{"results": [{"busbw_GB/s": x}, ...]}, ...]}`
 *
 * The best bus bandwidth of every test is one sample. Sample i belongs to host i / gpus_per_node.
 * Hosts owning a sample flagged by both outlier methods are reported with high confidence, hosts
 * flagged by one method only with medium confidence.
 */
SlowNodeAnalysis AnalyzeTestResults(Json::Value const &results,
                                    double zscoreThreshold = NodeDiagConstants::DEFAULT_ZSCORE_THRESHOLD);

/**
 * @brief Load a file and dispatch to AnalyzeRawLog or AnalyzeTestResults
 *
 * @param raw  Treat the file as raw benchmark output even if it ends with .json
 * @return CHD_ST_FILE_IO_ERROR if the file cannot be read, CHD_ST_BADPARAM for invalid JSON
 */
std::expected<SlowNodeAnalysis, chdReturn_t> AnalyzeFile(std::string const &path,
                                                         bool raw,
                                                         double zscoreThreshold
                                                         = NodeDiagConstants::DEFAULT_ZSCORE_THRESHOLD);

Json::Value ToJson(SlowNodeAnalysis const &analysis);

/**
 * @brief Human readable report
 */
std::string FormatSlowNodeReport(SlowNodeAnalysis const &analysis);

} // namespace ChdNs::NodeDiag
