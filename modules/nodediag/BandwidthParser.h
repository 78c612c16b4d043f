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

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>


namespace ChdNs::NodeDiag
{

/**
 * One data row of nccl-tests output. Only the out-of-place measurements are kept.
 */
struct BandwidthSample
{
    std::uint64_t sizeBytes = 0;
    std::uint64_t count     = 0;
    double timeUs           = 0.0;
    double algBw            = 0.0; //!< GB/s
    double busBw            = 0.0; //!< GB/s
};

/**
 * @brief Extracts all data rows from nccl-tests output
 *
 * Rows look like `size count type redop [root] time algbw busbw ...`. The root column is optional.
 * Comment lines, headers and anything that does not match are skipped. ANSI color codes are ignored.
 */
std::vector<BandwidthSample> ParseBandwidthSamples(std::string_view output);

/**
 * @brief Mean bus bandwidth (GB/s) over all data rows of the output
 *
 * Falls back to the `# Avg bus bandwidth : X` summary line when no data row could be parsed.
 *
 * @return std::nullopt if the output has neither
 */
std::optional<double> ParseAverageBusBandwidth(std::string_view output);

} // namespace ChdNs::NodeDiag
