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
#include "IsolationAggregator.h"

#include <ChdLogging.h>

#include <fstream>


namespace ChdNs::NodeDiag::IsolationAggregator
{

namespace
{
void CollectNodeArray(Json::Value const &array, CondemnedSet &out)
{
    if (!array.isArray())
    {
        return;
    }
    for (auto const &entry : array)
    {
        if (entry.isString())
        {
            out.insert(entry.asString());
        }
    }
}

void CollectProblematicNodes(Json::Value const &analysis, CondemnedSet &out)
{
    if (!analysis.isObject() || !analysis.isMember("problematic_nodes") || !analysis["problematic_nodes"].isArray())
    {
        return;
    }
    for (auto const &entry : analysis["problematic_nodes"])
    {
        if (entry.isObject() && entry.isMember("node") && entry["node"].isString())
        {
            out.insert(entry["node"].asString());
        }
    }
}

Json::Value const &Member(Json::Value const &object, char const *key)
{
    static Json::Value const null;
    if (!object.isObject() || !object.isMember(key))
    {
        return null;
    }
    return object[key];
}
} // namespace

CondemnedSet Union(std::span<CondemnedSet const> methodResults)
{
    CondemnedSet result;
    for (auto const &condemned : methodResults)
    {
        result.insert(condemned.begin(), condemned.end());
    }
    return result;
}

CondemnedSet Union(std::optional<CondemnedSet> const &bisection, std::optional<CondemnedSet> const &pairwise)
{
    CondemnedSet result;
    if (bisection.has_value())
    {
        result.insert(bisection->begin(), bisection->end());
    }
    if (pairwise.has_value())
    {
        result.insert(pairwise->begin(), pairwise->end());
    }
    return result;
}

CondemnedSet FromReport(Json::Value const &report)
{
    CondemnedSet result;

    CollectNodeArray(Member(report, "condemned_nodes"), result);
    CollectNodeArray(Member(report, "bad_nodes"), result);
    CollectNodeArray(Member(Member(report, "bisection"), "bad_nodes"), result);
    CollectProblematicNodes(Member(report, "analysis"), result);
    CollectProblematicNodes(Member(Member(report, "pairwise"), "analysis"), result);

    return result;
}

std::expected<CondemnedSet, chdReturn_t> FromReportFile(std::string const &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        log_error("Unable to open report file {}", path);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    Json::String errors;
    if (!Json::parseFromStream(builder, file, &root, &errors))
    {
        log_error("Report file {} is not valid JSON: {}", path, errors);
        return std::unexpected(CHD_ST_BADPARAM);
    }

    auto condemned = FromReport(root);
    log_debug("Loaded {} condemned nodes from {}", condemned.size(), path);
    return condemned;
}

int ExitStatus(CondemnedSet const &condemned)
{
    return condemned.empty() ? CHD_EXIT_OK : CHD_EXIT_NODES_CONDEMNED;
}

} // namespace ChdNs::NodeDiag::IsolationAggregator
