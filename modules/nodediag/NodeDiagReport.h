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
#include "BisectionSearch.h"
#include "PairwiseAnalyzer.h"
#include "nodediag_structs.hpp"

#include <chd_structs.h>

#include <expected>
#include <json/json.h>
#include <string>
#include <string_view>


namespace ChdNs::NodeDiag
{

Json::Value ToJson(BenchmarkResult const &result);
Json::Value ToJson(TestHistory const &history);
Json::Value ToJson(BisectionReport const &report);
Json::Value ToJson(PairwiseAnalysis const &analysis);
Json::Value ToJson(PairwiseReport const &report);

/**
 * @brief Document printed by `chdiag detect --json`
 *
 * Contains the mode, the per-method reports that ran and the final condemned set.
 */
Json::Value CombinedReport(DetectionMode mode,
                           BisectionReport const *bisection,
                           PairwiseReport const *pairwise,
                           CondemnedSet const &condemned);

std::string ModeToString(DetectionMode mode);

/**
 * @brief Render a report with two space indentation
 */
std::string SerializeReport(Json::Value const &report);

/**
 * @brief Write a report as <outputDir>/<prefix>_YYYYmmdd_HHMMSS.json, creating the directory if needed
 *
 * @return Path of the written file, or CHD_ST_FILE_IO_ERROR
 */
std::expected<std::string, chdReturn_t> WriteReport(Json::Value const &report,
                                                    std::string const &outputDir,
                                                    std::string_view prefix);

} // namespace ChdNs::NodeDiag
