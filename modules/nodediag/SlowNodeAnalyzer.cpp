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
#include "SlowNodeAnalyzer.h"

#include <ChdLogging.h>

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>


namespace ChdNs::NodeDiag
{

namespace
{
constexpr unsigned int DEFAULT_GPUS_PER_NODE = 8;
constexpr std::size_t MIN_SAMPLES_PER_SIZE   = 3;
constexpr std::string_view BUSBW_KEY         = "busbw_GB/s";

Json::Value SummaryToJson(OutlierDetector::SampleSummary const &summary)
{
    Json::Value entry(Json::objectValue);
    entry["count"]                    = static_cast<Json::UInt>(summary.count);
    entry["mean_GB/s"]                = summary.mean;
    entry["median_GB/s"]              = summary.median;
    entry["std_GB/s"]                 = summary.stddev;
    entry["min_GB/s"]                 = summary.min;
    entry["max_GB/s"]                 = summary.max;
    entry["coefficient_of_variation"] = summary.coeffOfVar;
    return entry;
}

Json::Value IndicesToJson(std::set<std::size_t> const &indices)
{
    Json::Value array(Json::arrayValue);
    for (auto const index : indices)
    {
        array.append(static_cast<Json::UInt>(index));
    }
    return array;
}

std::string ConfidenceToString(OutlierDetector::Confidence confidence)
{
    return confidence == OutlierDetector::Confidence::High ? "high" : "medium";
}

bool EndsWith(std::string_view value, std::string_view suffix)
{
    return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}
} // namespace

SlowNodeAnalysis AnalyzeRawLog(std::string_view content, double zscoreThreshold)
{
    SlowNodeAnalysis analysis;
    analysis.timestamp = Timelib::Now();

    auto const samples = ParseBandwidthSamples(content);
    if (samples.empty())
    {
        analysis.error = "No performance data found in logs";
        return analysis;
    }

    std::map<std::uint64_t, std::vector<double>> sizeGroups;
    std::vector<double> allSamples;
    allSamples.reserve(samples.size());
    for (auto const &sample : samples)
    {
        sizeGroups[sample.sizeBytes].push_back(sample.busBw);
        allSamples.push_back(sample.busBw);
    }

    std::vector<double> qualifying;
    for (auto const &[size, bandwidths] : sizeGroups)
    {
        if (bandwidths.size() >= MIN_SAMPLES_PER_SIZE)
        {
            analysis.performanceBySize[size] = OutlierDetector::Summarize(bandwidths);
            qualifying.insert(qualifying.end(), bandwidths.begin(), bandwidths.end());
        }
    }

    analysis.outliers = OutlierDetector::ClassifyOutliers(allSamples, zscoreThreshold);

    if (qualifying.empty())
    {
        log_debug("No message size has at least {} samples", MIN_SAMPLES_PER_SIZE);
        return analysis;
    }

    analysis.summary       = OutlierDetector::Summarize(qualifying);
    double const threshold = analysis.summary->mean - zscoreThreshold * analysis.summary->stddev;
    auto const slow = static_cast<std::size_t>(
        std::count_if(qualifying.begin(), qualifying.end(), [threshold](double bw) { return bw < threshold; }));

    if (slow > 0)
    {
        analysis.slowSamples = SlowSampleFinding {
            slow, threshold, static_cast<double>(slow) / static_cast<double>(qualifying.size()) * 100.0
        };
    }

    return analysis;
}

SlowNodeAnalysis AnalyzeTestResults(Json::Value const &results, double zscoreThreshold)
{
    SlowNodeAnalysis analysis;
    analysis.timestamp = Timelib::Now();

    if (!results.isObject() || !results.isMember("tests") || !results["tests"].isArray())
    {
        analysis.error = "No test results found";
        return analysis;
    }

    std::vector<double> maxima;
    for (auto const &test : results["tests"])
    {
        if (!test.isObject() || !test["results"].isArray() || test["results"].empty())
        {
            continue;
        }
        std::optional<double> best;
        for (auto const &row : test["results"])
        {
            if (row.isObject() && row[std::string(BUSBW_KEY)].isNumeric())
            {
                double const bw = row[std::string(BUSBW_KEY)].asDouble();
                best            = best.has_value() ? std::max(*best, bw) : bw;
            }
        }
        if (best.has_value())
        {
            maxima.push_back(*best);
        }
    }

    if (maxima.empty())
    {
        analysis.error = "No test results found";
        return analysis;
    }

    analysis.statistics = OutlierDetector::Summarize(maxima);
    analysis.outliers   = OutlierDetector::ClassifyOutliers(maxima, zscoreThreshold);
    log_debug("Z-score outliers: {}, IQR outliers: {}", analysis.outliers.zscore.size(), analysis.outliers.iqr.size());

    if (!results["hosts"].isArray())
    {
        return analysis;
    }

    unsigned int gpusPerNode = DEFAULT_GPUS_PER_NODE;
    if (results["gpus_per_node"].isUInt() && results["gpus_per_node"].asUInt() > 0)
    {
        gpusPerNode = results["gpus_per_node"].asUInt();
    }

    auto const ownsAny = [gpusPerNode](std::set<std::size_t> const &indices, std::size_t hostIdx) {
        auto const start = hostIdx * gpusPerNode;
        auto const it    = indices.lower_bound(start);
        return it != indices.end() && *it < start + gpusPerNode;
    };

    auto const &hosts = results["hosts"];
    for (Json::ArrayIndex hostIdx = 0; hostIdx < hosts.size(); ++hostIdx)
    {
        if (!hosts[hostIdx].isString())
        {
            continue;
        }
        if (ownsAny(analysis.outliers.high, hostIdx))
        {
            analysis.slowNodes.push_back(SlowNodeFinding {
                hosts[hostIdx].asString(), hostIdx, "Performance outlier detected", OutlierDetector::Confidence::High });
        }
        else if (ownsAny(analysis.outliers.medium, hostIdx))
        {
            log_info("Host {} is flagged by one outlier method only", hosts[hostIdx].asString());
            analysis.slowNodes.push_back(SlowNodeFinding { hosts[hostIdx].asString(),
                                                           hostIdx,
                                                           "Flagged by a single outlier method",
                                                           OutlierDetector::Confidence::Medium });
        }
    }

    return analysis;
}

std::expected<SlowNodeAnalysis, chdReturn_t> AnalyzeFile(std::string const &path, bool raw, double zscoreThreshold)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        log_error("Input file not found: {}", path);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    if (!raw && EndsWith(path, ".json"))
    {
        Json::CharReaderBuilder builder;
        Json::Value root;
        Json::String errors;
        if (!Json::parseFromStream(builder, file, &root, &errors))
        {
            log_error("Unable to parse {}: {}", path, errors);
            return std::unexpected(CHD_ST_BADPARAM);
        }
        return AnalyzeTestResults(root, zscoreThreshold);
    }

    std::string const content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        log_error("Error while reading {}", path);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }
    return AnalyzeRawLog(content, zscoreThreshold);
}

Json::Value ToJson(SlowNodeAnalysis const &analysis)
{
    Json::Value root(Json::objectValue);
    root["timestamp"] = Timelib::ToIsoString(analysis.timestamp);

    if (analysis.error.has_value())
    {
        root["error"] = *analysis.error;
    }
    if (analysis.statistics.has_value())
    {
        root["statistics"] = SummaryToJson(*analysis.statistics);
    }
    if (!analysis.performanceBySize.empty())
    {
        Json::Value bySize(Json::objectValue);
        for (auto const &[size, summary] : analysis.performanceBySize)
        {
            bySize[std::to_string(size)] = SummaryToJson(summary);
        }
        root["performance_by_size"] = bySize;
    }
    if (analysis.summary.has_value())
    {
        root["summary"] = SummaryToJson(*analysis.summary);
    }

    Json::Value outliers(Json::objectValue);
    outliers["zscore"] = IndicesToJson(analysis.outliers.zscore);
    outliers["iqr"]    = IndicesToJson(analysis.outliers.iqr);
    outliers["high"]   = IndicesToJson(analysis.outliers.high);
    outliers["medium"] = IndicesToJson(analysis.outliers.medium);
    root["outliers"]   = outliers;

    Json::Value slowNodes(Json::arrayValue);
    for (auto const &finding : analysis.slowNodes)
    {
        Json::Value entry(Json::objectValue);
        entry["hostname"]   = finding.hostname;
        entry["index"]      = static_cast<Json::UInt>(finding.index);
        entry["reason"]     = finding.reason;
        entry["confidence"] = ConfidenceToString(finding.confidence);
        slowNodes.append(entry);
    }
    if (analysis.slowSamples.has_value())
    {
        Json::Value entry(Json::objectValue);
        entry["detection"]      = fmt::format("{} samples below threshold", analysis.slowSamples->slowSamples);
        entry["threshold_GB/s"] = analysis.slowSamples->threshold;
        entry["percentage"]     = analysis.slowSamples->percentage;
        slowNodes.append(entry);
    }
    root["slow_nodes"] = slowNodes;
    return root;
}

std::string FormatSlowNodeReport(SlowNodeAnalysis const &analysis)
{
    std::string const rule(70, '=');
    fmt::memory_buffer out;
    auto inserter = std::back_inserter(out);

    fmt::format_to(inserter, "{}\nSLOW NODE DETECTION REPORT\n{}\n", rule, rule);
    fmt::format_to(inserter, "Timestamp: {}\n\n", Timelib::ToIsoString(analysis.timestamp));

    if (analysis.error.has_value())
    {
        fmt::format_to(inserter, "Error: {}\n\n", *analysis.error);
    }

    if (analysis.statistics.has_value())
    {
        auto const &s = *analysis.statistics;
        fmt::format_to(inserter, "Overall Statistics:\n");
        fmt::format_to(inserter, "  mean_bandwidth_GB/s: {:.2f}\n", s.mean);
        fmt::format_to(inserter, "  median_bandwidth_GB/s: {:.2f}\n", s.median);
        fmt::format_to(inserter, "  std_bandwidth_GB/s: {:.2f}\n", s.stddev);
        fmt::format_to(inserter, "  min_bandwidth_GB/s: {:.2f}\n", s.min);
        fmt::format_to(inserter, "  max_bandwidth_GB/s: {:.2f}\n\n", s.max);
    }

    if (analysis.summary.has_value())
    {
        auto const &s = *analysis.summary;
        fmt::format_to(inserter, "Performance Summary:\n");
        fmt::format_to(inserter, "  overall_mean_GB/s: {:.4f}\n", s.mean);
        fmt::format_to(inserter, "  overall_std_GB/s: {:.4f}\n", s.stddev);
        fmt::format_to(inserter, "  coefficient_of_variation: {:.4f}\n\n", s.coeffOfVar);
    }

    fmt::format_to(inserter, "Slow Nodes Detected:\n");
    if (analysis.slowNodes.empty() && !analysis.slowSamples.has_value())
    {
        fmt::format_to(inserter, "  No slow nodes detected!\n");
    }
    std::size_t item = 1;
    for (auto const &finding : analysis.slowNodes)
    {
        fmt::format_to(inserter, "\n{}. {}\n", item++, finding.hostname);
        fmt::format_to(inserter, "   Reason: {}\n", finding.reason);
        fmt::format_to(inserter, "   Confidence: {}\n", ConfidenceToString(finding.confidence));
    }
    if (analysis.slowSamples.has_value())
    {
        fmt::format_to(inserter, "\n{}. Unknown\n", item++);
        fmt::format_to(inserter, "   Detection: {} samples below threshold\n", analysis.slowSamples->slowSamples);
        fmt::format_to(inserter, "   Threshold: {:.2f} GB/s\n", analysis.slowSamples->threshold);
        fmt::format_to(inserter, "   Percentage: {:.1f}%\n", analysis.slowSamples->percentage);
    }

    fmt::format_to(inserter, "\n{}\n", rule);
    return fmt::to_string(out);
}

} // namespace ChdNs::NodeDiag
