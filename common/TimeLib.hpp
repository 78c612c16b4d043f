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
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <string>


namespace ChdNs::Timelib
{
using TimePoint = std::chrono::system_clock::time_point;

inline TimePoint Now() noexcept
{
    return std::chrono::system_clock::now();
}

inline std::tm ToLocalTime(TimePoint value) noexcept
{
    std::time_t const seconds = std::chrono::system_clock::to_time_t(value);
    std::tm result {};
    localtime_r(&seconds, &result);
    return result;
}

/**
 * @brief Formats a time point as local ISO-8601 with microseconds, e.g. 2025-01-31T13:05:07.123456
 */
[[nodiscard]] inline std::string ToIsoString(TimePoint value)
{
    auto const micros
        = std::chrono::duration_cast<std::chrono::microseconds>(value.time_since_epoch()).count() % 1'000'000;
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}", ToLocalTime(value), micros < 0 ? micros + 1'000'000 : micros);
}

/**
 * @brief Formats a time point for use in file names: YYYYmmdd_HHMMSS
 */
[[nodiscard]] inline std::string ToFileStamp(TimePoint value)
{
    return fmt::format("{:%Y%m%d_%H%M%S}", ToLocalTime(value));
}

/**
 * @brief Seconds elapsed between two time points as a double.
 */
[[nodiscard]] inline double SecondsBetween(TimePoint start, TimePoint end)
{
    return std::chrono::duration<double>(end - start).count();
}

} // namespace ChdNs::Timelib
