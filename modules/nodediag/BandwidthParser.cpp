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
#include "BandwidthParser.h"

#include <ChdLogging.h>
#include <ChdStringHelpers.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <numeric>
#include <string>


namespace ChdNs::NodeDiag
{

namespace
{
bool IsUnsigned(std::string_view token)
{
    return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool IsSignedInteger(std::string_view token)
{
    if (!token.empty() && token.front() == '-')
    {
        token.remove_prefix(1);
    }
    return IsUnsigned(token);
}

bool IsWord(std::string_view token)
{
    return !token.empty()
           && std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

std::optional<double> ToDouble(std::string_view token)
{
    if (token.empty() || !(std::isdigit(static_cast<unsigned char>(token.front())) || token.front() == '.'))
    {
        return std::nullopt;
    }
    try
    {
        return ChdNs::strictStrToDouble(std::string(token));
    }
    catch (std::exception const &)
    {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> ToUnsigned(std::string_view token)
{
    std::uint64_t value = 0;
    auto [ptr, ec]      = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc {} || ptr != token.data() + token.size())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<BandwidthSample> ParseDataRow(std::string_view line)
{
    auto const tokens = ChdNs::SplitWhitespace(line);
    if (tokens.size() < 7 || !IsUnsigned(tokens[0]) || !IsUnsigned(tokens[1]) || !IsWord(tokens[2])
        || !IsWord(tokens[3]))
    {
        return std::nullopt;
    }

    std::size_t timeIdx = 4;
    if (IsSignedInteger(tokens[4]) && tokens.size() >= 8)
    {
        // Newer nccl-tests print a root column between redop and time
        timeIdx = 5;
    }

    auto const time  = ToDouble(tokens[timeIdx]);
    auto const algBw = ToDouble(tokens[timeIdx + 1]);
    auto const busBw = ToDouble(tokens[timeIdx + 2]);
    auto const size  = ToUnsigned(tokens[0]);
    auto const count = ToUnsigned(tokens[1]);
    if (!time || !algBw || !busBw || !size || !count)
    {
        return std::nullopt;
    }

    return BandwidthSample { *size, *count, *time, *algBw, *busBw };
}

std::optional<double> ParseSummaryLine(std::string_view line)
{
    static constexpr std::string_view marker = "Avg bus bandwidth";

    auto pos = line.find(marker);
    if (pos == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto rest  = line.substr(pos + marker.size());
    auto colon = rest.find(':');
    if (colon == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto tokens = ChdNs::SplitWhitespace(rest.substr(colon + 1));
    if (tokens.empty())
    {
        return std::nullopt;
    }
    return ToDouble(tokens.front());
}
} // namespace

std::vector<BandwidthSample> ParseBandwidthSamples(std::string_view output)
{
    std::vector<BandwidthSample> samples;
    std::string const clean = ChdNs::StripAnsiCodes(output);

    for (auto line : ChdNs::Split(clean, '\n'))
    {
        auto const trimmed = ChdNs::Trim(line);
        if (trimmed.empty() || trimmed.front() == '#')
        {
            continue;
        }
        if (auto sample = ParseDataRow(trimmed); sample.has_value())
        {
            samples.push_back(*sample);
        }
    }

    return samples;
}

std::optional<double> ParseAverageBusBandwidth(std::string_view output)
{
    auto const samples = ParseBandwidthSamples(output);
    if (!samples.empty())
    {
        double const total = std::accumulate(
            samples.begin(), samples.end(), 0.0, [](double acc, BandwidthSample const &s) { return acc + s.busBw; });
        return total / static_cast<double>(samples.size());
    }

    std::string const clean = ChdNs::StripAnsiCodes(output);
    for (auto line : ChdNs::Split(clean, '\n'))
    {
        if (auto avg = ParseSummaryLine(line); avg.has_value())
        {
            log_debug("No data rows found, using summary line value {}", *avg);
            return avg;
        }
    }

    return std::nullopt;
}

} // namespace ChdNs::NodeDiag
