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
#ifndef CHD_NODEDIAG_STRUCTS_HPP
#define CHD_NODEDIAG_STRUCTS_HPP

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace NodeDiagConstants
{
// Environment variables
constexpr std::string_view ENV_MPIRUN_PATH       = "CHD_MPIRUN_PATH";
constexpr std::string_view ENV_BENCHMARK_PATH    = "CHD_BENCHMARK_PATH";
constexpr std::string_view ENV_ALLOW_RUN_AS_ROOT = "CHD_MPIRUN_ALLOW_RUN_AS_ROOT";

// Default paths
constexpr std::string_view DEFAULT_MPIRUN_PATH    = "/usr/bin/mpirun";
constexpr std::string_view DEFAULT_BENCHMARK_PATH = "/usr/local/bin/all_reduce_perf";
constexpr std::string_view DEFAULT_OUTPUT_DIR     = "./results";

// Benchmark invocation
constexpr unsigned int DEFAULT_PROCESSES_PER_NODE   = 8;
constexpr std::chrono::seconds DEFAULT_TEST_TIMEOUT = std::chrono::seconds(300);

// Bisection
constexpr std::size_t BASELINE_NODE_COUNT    = 2;
constexpr double BASELINE_THRESHOLD_FRACTION = 0.8;

// Pairwise analysis
constexpr double PAIRWISE_SIGMA_MULTIPLIER = 2.0;
constexpr double PAIRWISE_MAX_FAILURE_RATE = 0.2;

// Outlier detection
constexpr double DEFAULT_ZSCORE_THRESHOLD = 2.0;
constexpr double DEFAULT_IQR_MULTIPLIER   = 1.5;
constexpr std::size_t ZSCORE_MIN_SAMPLES  = 3;
constexpr std::size_t IQR_MIN_SAMPLES     = 4;

// Reasons reported for problematic nodes
constexpr std::string_view REASON_LOW_BANDWIDTH     = "Low bandwidth";
constexpr std::string_view REASON_HIGH_FAILURE_RATE = "High failure rate";
} //namespace NodeDiagConstants

namespace ChdNs::NodeDiag
{
using NodeId       = std::string;
using Roster       = std::vector<NodeId>;
using CondemnedSet = std::set<NodeId>;

enum class DetectionMode
{
    Bisection,
    Pairwise,
    Both,
};
} //namespace ChdNs::NodeDiag

#endif // CHD_NODEDIAG_STRUCTS_HPP
