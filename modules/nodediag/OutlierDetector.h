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

#include <cstddef>
#include <set>
#include <span>


namespace ChdNs::NodeDiag::OutlierDetector
{

enum class Confidence
{
    High,   //!< Flagged by both Z-score and IQR
    Medium, //!< Flagged by exactly one method. Never enough on its own to condemn a node
};

struct OutlierClassification
{
    std::set<std::size_t> zscore;
    std::set<std::size_t> iqr;
    std::set<std::size_t> high;   //!< Flagged by both methods
    std::set<std::size_t> medium; //!< Flagged by one method only
};

struct SampleSummary
{
    std::size_t count = 0;
    double mean       = 0.0;
    double median     = 0.0;
    double stddev     = 0.0; //!< Population standard deviation
    double min        = 0.0;
    double max        = 0.0;
    double coeffOfVar = 0.0; //!< stddev / mean, 0 when mean <= 0
};

/**
 * @brief Indices whose population Z-score magnitude is strictly greater than threshold
 *
 * Returns an empty set for fewer than 3 samples or when all samples are equal.
 */
std::set<std::size_t> ZScoreOutliers(std::span<double const> samples,
                                     double threshold = NodeDiagConstants::DEFAULT_ZSCORE_THRESHOLD);

/**
 * @brief Indices outside [Q1 - multiplier * IQR, Q3 + multiplier * IQR]
 *
 * Quartiles use linear interpolation between closest ranks. Returns an empty set for fewer than 4 samples.
 */
std::set<std::size_t> IqrOutliers(std::span<double const> samples,
                                  double multiplier = NodeDiagConstants::DEFAULT_IQR_MULTIPLIER);

/**
 * @brief Runs both detectors and splits the flagged indices by confidence
 */
OutlierClassification ClassifyOutliers(std::span<double const> samples,
                                       double zscoreThreshold = NodeDiagConstants::DEFAULT_ZSCORE_THRESHOLD,
                                       double iqrMultiplier   = NodeDiagConstants::DEFAULT_IQR_MULTIPLIER);

/**
 * @brief p-th percentile (p in [0, 100]) with linear interpolation. Samples need not be sorted.
 *
 * @return 0.0 for an empty input
 */
double Percentile(std::span<double const> samples, double p);

double Mean(std::span<double const> samples);

/**
 * Population standard deviation. 0.0 for an empty input.
 */
double StdDev(std::span<double const> samples);

SampleSummary Summarize(std::span<double const> samples);

} // namespace ChdNs::NodeDiag::OutlierDetector
