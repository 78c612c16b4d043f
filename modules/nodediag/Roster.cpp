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
#include "Roster.h"

#include <ChdLogging.h>
#include <ChdStringHelpers.h>

#include <fstream>
#include <unordered_set>


namespace ChdNs::NodeDiag
{

Roster ParseRoster(std::istream &input)
{
    Roster roster;
    std::unordered_set<std::string> seen;
    std::string line;

    while (std::getline(input, line))
    {
        auto const trimmed = ChdNs::Trim(line);
        if (trimmed.empty() || trimmed.front() == '#')
        {
            continue;
        }

        auto tokens = ChdNs::SplitWhitespace(trimmed);
        std::string node(tokens.front());
        if (!seen.insert(node).second)
        {
            log_warning("Node {} is listed more than once in the hostfile. Ignoring the duplicate", node);
            continue;
        }
        roster.push_back(std::move(node));
    }

    return roster;
}

std::expected<Roster, chdReturn_t> LoadRoster(std::string const &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        log_error("Hostfile not found or not readable: {}", path);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    auto roster = ParseRoster(file);
    if (file.bad())
    {
        log_error("Error while reading hostfile {}", path);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    log_debug("Loaded {} nodes from {}", roster.size(), path);
    return roster;
}

} // namespace ChdNs::NodeDiag
