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
#include "ChdStringHelpers.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

/*****************************************************************************/
void chdTokenizeString(const std::string &src, const std::string &delimiter, std::vector<std::string> &tokens)
{
    size_t pos      = 0;
    size_t prev_pos = 0;

    if (src.size() > 0)
    {
        while (pos != std::string::npos)
        {
            std::string token;
            pos = src.find(delimiter, prev_pos);

            if (pos == std::string::npos)
            {
                token = src.substr(prev_pos);
            }
            else
            {
                token    = src.substr(prev_pos, pos - prev_pos);
                prev_pos = pos + delimiter.size();
            }

            tokens.push_back(std::move(token));
        }
    }
}

/*****************************************************************************/
std::vector<std::string> chdTokenizeString(const std::string &src, const std::string &delimiter)
{
    std::vector<std::string> tokens;

    chdTokenizeString(src, delimiter, tokens);

    return tokens;
}


std::string chdStrToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

namespace ChdNs
{
std::vector<std::string_view> Split(std::string_view value, char const separator)
{
    std::vector<std::string_view> result;
    std::string_view::size_type prevPos = 0;
    std::string_view::size_type curPos  = 0;
    while (std::string_view::npos != (curPos = value.find(separator, prevPos)))
    {
        result.push_back(value.substr(prevPos, curPos - prevPos));
        prevPos = curPos + 1;
    }

    result.push_back(value.substr(prevPos));

    return result;
}

/*****************************************************************************/
std::vector<std::string_view> SplitWhitespace(std::string_view value)
{
    static constexpr std::string_view blanks = " \t\r\n";

    std::vector<std::string_view> result;
    std::string_view::size_type pos = value.find_first_not_of(blanks);
    while (pos != std::string_view::npos)
    {
        auto end = value.find_first_of(blanks, pos);
        if (end == std::string_view::npos)
        {
            result.push_back(value.substr(pos));
            break;
        }
        result.push_back(value.substr(pos, end - pos));
        pos = value.find_first_not_of(blanks, end);
    }

    return result;
}

/*****************************************************************************/
std::string_view Trim(std::string_view value)
{
    static constexpr std::string_view blanks = " \t\r\n";

    auto const first = value.find_first_not_of(blanks);
    if (first == std::string_view::npos)
    {
        return {};
    }
    auto const last = value.find_last_not_of(blanks);
    return value.substr(first, last - first + 1);
}

/*****************************************************************************/
std::string StripAnsiCodes(std::string_view input)
{
    std::string result;
    result.reserve(input.length());

    for (size_t i = 0; i < input.length(); ++i)
    {
        if (input[i] == '\x1B' && i + 1 < input.length() && input[i + 1] == '[')
        {
            // Skip until the 'm' that ends the sequence
            i = input.find('m', i);
            if (i == std::string_view::npos)
            {
                break; // Malformed escape sequence
            }
        }
        else
        {
            result.push_back(input[i]);
        }
    }
    return result;
}

/*****************************************************************************/
int strictStrToInt(std::string const &str)
{
    size_t pos;
    int result = std::stoi(str, &pos);
    if (pos != str.length())
    {
        throw std::invalid_argument("extra characters after number");
    }
    return result;
}

/*****************************************************************************/
double strictStrToDouble(std::string const &str)
{
    size_t pos;
    double result = std::stod(str, &pos);
    if (pos != str.length())
    {
        throw std::invalid_argument("extra characters after number");
    }
    return result;
}

} // namespace ChdNs
