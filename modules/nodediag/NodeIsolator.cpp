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
#include "NodeIsolator.h"

#include <ChdLogging.h>
#include <ChdStringHelpers.h>
#include <TimeLib.hpp>

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <fstream>
#include <iterator>


namespace ChdNs::NodeDiag
{

NodeIsolator::NodeIsolator(CondemnedSet badNodes, bool backup)
    : m_badNodes(std::move(badNodes))
    , m_backup(backup)
{}

std::string NodeIsolator::IsolateHostfileContent(std::string_view content, std::vector<NodeId> &excluded) const
{
    std::string result;
    result.reserve(content.size() + m_badNodes.size() * 16);

    std::size_t pos = 0;
    while (pos < content.size())
    {
        auto end = content.find('\n', pos);
        // Keep the line terminator attached to the line
        auto const lineEnd = end == std::string_view::npos ? content.size() : end + 1;
        auto const line    = content.substr(pos, lineEnd - pos);
        pos                = lineEnd;

        auto const trimmed = ChdNs::Trim(line);
        if (trimmed.empty() || trimmed.front() == '#')
        {
            result.append(line);
            continue;
        }

        std::string const hostname(ChdNs::SplitWhitespace(trimmed).front());
        if (m_badNodes.contains(hostname))
        {
            result.append("# ISOLATED: ").append(line);
            excluded.push_back(hostname);
            log_info("Excluding {} from hostfile", hostname);
        }
        else
        {
            result.append(line);
        }
    }

    return result;
}

std::expected<HostfileUpdate, chdReturn_t> NodeIsolator::UpdateHostfile(std::string const &hostfile,
                                                                        std::optional<std::string> const &output) const
{
    std::ifstream input(hostfile);
    if (!input.is_open())
    {
        log_error("Hostfile not found: {}", hostfile);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }
    std::string const content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    input.close();

    HostfileUpdate update;

    if (m_backup)
    {
        auto const backupPath = fmt::format("{}.backup_{}", hostfile, Timelib::ToFileStamp(Timelib::Now()));
        boost::system::error_code ec;
        boost::filesystem::copy_file(hostfile, backupPath, boost::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            log_error("Unable to back up {} to {}: {}", hostfile, backupPath, ec.message());
            return std::unexpected(CHD_ST_FILE_IO_ERROR);
        }
        update.backupPath = backupPath;
    }

    auto const updated = IsolateHostfileContent(content, update.excluded);
    update.outputPath  = output.value_or(hostfile);

    std::ofstream out(update.outputPath, std::ios::trunc);
    if (!out)
    {
        log_error("Unable to open {} for writing", update.outputPath);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }
    out << updated;
    if (!out)
    {
        log_error("Error while writing {}", update.outputPath);
        return std::unexpected(CHD_ST_FILE_IO_ERROR);
    }

    return update;
}

Json::Value NodeIsolator::KubernetesNodeSelector() const
{
    Json::Value values(Json::arrayValue);
    for (auto const &node : m_badNodes)
    {
        values.append(node);
    }

    Json::Value expression(Json::objectValue);
    expression["key"]      = "kubernetes.io/hostname";
    expression["operator"] = "NotIn";
    expression["values"]   = values;

    Json::Value term(Json::objectValue);
    term["matchExpressions"].append(expression);

    Json::Value selector(Json::objectValue);
    selector["nodeSelector"]["node-type"] = "gpu-compute";
    selector["affinity"]["nodeAffinity"]["requiredDuringSchedulingIgnoredDuringExecution"]["nodeSelectorTerms"]
        .append(term);
    return selector;
}

std::string NodeIsolator::SlurmExclude() const
{
    return fmt::format("#SBATCH --exclude={}", ChdNs::Join(m_badNodes, ","));
}

Json::Value NodeIsolator::IsolationReport() const
{
    Json::Value nodes(Json::arrayValue);
    for (auto const &node : m_badNodes)
    {
        nodes.append(node);
    }

    Json::Value report(Json::objectValue);
    report["timestamp"] = Timelib::ToIsoString(Timelib::Now());
    report["bad_nodes"] = nodes;
    report["count"]     = static_cast<Json::UInt>(m_badNodes.size());

    Json::Value actions(Json::objectValue);
    actions["hostfile"]   = "Updated to exclude bad nodes";
    actions["kubernetes"] = "Use nodeAffinity to avoid bad nodes";
    actions["slurm"]      = fmt::format("Use --exclude={}", ChdNs::Join(m_badNodes, ","));
    report["actions"]     = actions;
    return report;
}

} // namespace ChdNs::NodeDiag
