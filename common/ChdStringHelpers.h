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

#include <string>
#include <string_view>
#include <vector>


/*****************************************************************************/
/*
 * Split a string using a specified delimiter, returning an array of strings in tokens[]
 *
 * Note that the src string is left unmodified, and the returned array does not contain the delimiter
 *
 * Returns: Nothing
 */
void chdTokenizeString(const std::string &src, const std::string &delimiter, std::vector<std::string> &tokens);


/*****************************************************************************/
/*
 * Split a string using a specified delimiter, returning an array of strings.
 *
 * Returns: Vector of strings
 */
std::vector<std::string> chdTokenizeString(const std::string &src, const std::string &delimiter);

std::string chdStrToLower(std::string s);

namespace ChdNs
{
/*****************************************************************************/
/**
 * Splits a string view into substrings using the specified delimiter.
 * @param[in] value         original string to split
 * @param[in] delimiter     delimiting char
 * @return vector of string views.
 * @note The returned vector does not own its items. The original memory that the value points to must outlive the
 *       returned vector.
 */
std::vector<std::string_view> Split(std::string_view value, char delimiter);

/*****************************************************************************/
/**
 * Splits a line on any run of spaces or tabs. Empty tokens are never returned.
 */
std::vector<std::string_view> SplitWhitespace(std::string_view value);

/*****************************************************************************/
/**
 * Returns the view without leading and trailing whitespace.
 */
std::string_view Trim(std::string_view value);

/*****************************************************************************/
/**
 * Removes ANSI color sequences (ESC '[' ... 'm') from the input.
 */
std::string StripAnsiCodes(std::string_view input);

template <typename TIterator>
std::string Join(TIterator start, TIterator end, std::string_view separator = "")
{
    std::string result;
    auto it = start;
    if (it != end)
    {
        result.append(*it);
        ++it;

        for (; it != end; ++it)
        {
            result.append(separator);
            result.append(*it);
        }
    }

    return result;
}

template <typename TContainer>
std::string Join(TContainer const &values, std::string_view separator = "")
{
    return Join(std::begin(values), std::end(values), separator);
}

/*****************************************************************************/
/**
 * @brief Strictly converts a string to an integer
 *
 * Unlike std::stoi, this requires the entire string to represent a valid integer,
 * with no extraneous characters.
 *
 * @throws std::invalid_argument if the string isn't a valid integer
 * @throws std::out_of_range if the number is out of range for int
 */
int strictStrToInt(std::string const &str);

/*****************************************************************************/
/**
 * @brief Strictly converts a string to a double. Same rules as strictStrToInt.
 *
 * @throws std::invalid_argument if the string isn't a valid number
 * @throws std::out_of_range if the number is out of range for double
 */
double strictStrToDouble(std::string const &str);

} // namespace ChdNs
