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
#include "OutlierDetector.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <vector>


namespace ChdNs::NodeDiag::OutlierDetector
{

double Mean(std::span<double const> samples)
{
    if (samples.empty())
    {
        return 0.0;
    }
    return std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
}

double StdDev(std::span<double const> samples)
{
    if (samples.empty())
    {
        return 0.0;
    }
    double const mean = Mean(samples);
    double sumSq      = 0.0;
    for (double const value : samples)
    {
        sumSq += (value - mean) * (value - mean);
    }
    return std::sqrt(sumSq / static_cast<double>(samples.size()));
}

double Percentile(std::span<double const> samples, double p)
{
    if (samples.empty())
    {
        return 0.0;
    }

    std::vector<double> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());

    double const position = std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    auto const lower      = static_cast<std::size_t>(std::floor(position));
    auto const upper      = std::min(lower + 1, sorted.size() - 1);
    double const fraction = position - static_cast<double>(lower);

    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

std::set<std::size_t> ZScoreOutliers(std::span<double const> samples, double threshold)
{
    std::set<std::size_t> outliers;
    if (samples.size() < NodeDiagConstants::ZSCORE_MIN_SAMPLES)
    {
        return outliers;
    }

    double const mean   = Mean(samples);
    double const stddev = StdDev(samples);
    if (stddev == 0.0)
    {
        return outliers;
    }

    for (std::size_t i = 0; i < samples.size(); ++i)
    {
        if (std::abs((samples[i] - mean) / stddev) > threshold)
        {
            outliers.insert(i);
        }
    }
    return outliers;
}

std::set<std::size_t> IqrOutliers(std::span<double const> samples, double multiplier)
{
    std::set<std::size_t> outliers;
    if (samples.size() < NodeDiagConstants::IQR_MIN_SAMPLES)
    {
        return outliers;
    }

    double const q1    = Percentile(samples, 25.0);
    double const q3    = Percentile(samples, 75.0);
    double const iqr   = q3 - q1;
    double const lower = q1 - multiplier * iqr;
    double const upper = q3 + multiplier * iqr;

    for (std::size_t i = 0; i < samples.size(); ++i)
    {
        if (samples[i] < lower || samples[i] > upper)
        {
            outliers.insert(i);
        }
    }
    return outliers;
}

OutlierClassification ClassifyOutliers(std::span<double const> samples, double zscoreThreshold, double iqrMultiplier)
{
    OutlierClassification result;
    result.zscore = ZScoreOutliers(samples, zscoreThreshold);
    result.iqr    = IqrOutliers(samples, iqrMultiplier);

    std::set_intersection(result.zscore.begin(),
                          result.zscore.end(),
                          result.iqr.begin(),
                          result.iqr.end(),
                          std::inserter(result.high, result.high.end()));

    std::set<std::size_t> either;
    std::set_union(result.zscore.begin(),
                   result.zscore.end(),
                   result.iqr.begin(),
                   result.iqr.end(),
                   std::inserter(either, either.end()));
    std::set_difference(either.begin(),
                        either.end(),
                        result.high.begin(),
                        result.high.end(),
                        std::inserter(result.medium, result.medium.end()));
    return result;
}

SampleSummary Summarize(std::span<double const> samples)
{
    SampleSummary summary;
    summary.count = samples.size();
    if (samples.empty())
    {
        return summary;
    }

    auto const [minIt, maxIt] = std::minmax_element(samples.begin(), samples.end());
    summary.mean              = Mean(samples);
    summary.median            = Percentile(samples, 50.0);
    summary.stddev            = StdDev(samples);
    summary.min               = *minIt;
    summary.max               = *maxIt;
    summary.coeffOfVar        = summary.mean > 0.0 ? summary.stddev / summary.mean : 0.0;
    return summary;
}

} // namespace ChdNs::NodeDiag::OutlierDetector
