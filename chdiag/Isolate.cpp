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
#include "Isolate.h"

#include <ChdException.hpp>
#include <ChdLogging.h>
#include <ChdStringHelpers.h>
#include <IsolationAggregator.h>
#include <NodeDiagReport.h>
#include <NodeIsolator.h>

#include <iostream>

using namespace ChdNs::NodeDiag;

namespace
{
std::string const g_separator(70, '=');
} //namespace

/*****************************************************************************/
IsolateNodes::IsolateNodes(IsolateParams params)
    : m_params(std::move(params))
{}

/*****************************************************************************/
int IsolateNodes::CollectBadNodes(CondemnedSet &badNodes)
{
    for (auto const &reportPath : m_params.reports)
    {
        auto fromReport = IsolationAggregator::FromReportFile(reportPath);
        if (!fromReport)
        {
            if (fromReport.error() == CHD_ST_FILE_IO_ERROR)
            {
                std::cerr << "Error: Report file not found: " << reportPath << std::endl;
            }
            else
            {
                std::cerr << "Error: Report file " << reportPath << " is not valid JSON" << std::endl;
            }
            return CHD_EXIT_CONFIG_ERROR;
        }
        Out() << "Loaded " << fromReport->size() << " bad nodes from " << reportPath << std::endl;
        badNodes.insert(fromReport->begin(), fromReport->end());
    }

    for (auto const &list : m_params.nodes)
    {
        for (auto const token : ChdNs::Split(list, ','))
        {
            auto const node = ChdNs::Trim(token);
            if (!node.empty())
            {
                badNodes.emplace(node);
            }
        }
    }
    return CHD_EXIT_OK;
}

/*****************************************************************************/
int IsolateNodes::DoExecute()
{
    m_reportFile.reset();

    CondemnedSet badNodes;
    if (int status = CollectBadNodes(badNodes); status != CHD_EXIT_OK)
    {
        return status;
    }

    if (badNodes.empty())
    {
        std::cerr << "Error: No bad nodes specified" << std::endl;
        std::cerr << "Use --report or --nodes to specify bad nodes" << std::endl;
        return CHD_EXIT_CONFIG_ERROR;
    }

    Out() << std::endl << "Bad nodes to isolate (" << badNodes.size() << "):" << std::endl;
    for (auto const &node : badNodes)
    {
        Out() << "  - " << node << std::endl;
    }

    NodeIsolator isolator(badNodes, m_params.backup);

    if (m_params.hostfile.has_value())
    {
        auto update = isolator.UpdateHostfile(*m_params.hostfile, m_params.output);
        if (!update)
        {
            std::cerr << "Error: unable to update hostfile " << *m_params.hostfile << ": "
                      << errorString(update.error()) << std::endl;
            return CHD_EXIT_CONFIG_ERROR;
        }
        if (update->backupPath.has_value())
        {
            Out() << "Backup created: " << *update->backupPath << std::endl;
        }
        Out() << "Updated hostfile: " << update->outputPath << std::endl;
        Out() << "Excluded " << update->excluded.size() << " nodes: " << ChdNs::Join(update->excluded, ", ")
              << std::endl;
    }

    if (m_params.k8s)
    {
        Out() << std::endl << "Kubernetes Node Affinity Configuration:" << std::endl << g_separator << std::endl;
        Out() << SerializeReport(isolator.KubernetesNodeSelector()) << std::endl;
    }

    if (m_params.slurm)
    {
        Out() << std::endl << "SLURM Exclude Directive:" << std::endl << g_separator << std::endl;
        Out() << isolator.SlurmExclude() << std::endl;
    }

    auto written = WriteReport(isolator.IsolationReport(), m_params.reportDir, "isolation_report");
    if (!written)
    {
        throw ChdNs::ChdException(written.error(), "unable to write isolation report to " + m_params.reportDir);
    }
    Out() << std::endl << "Isolation report saved to: " << *written << std::endl;
    m_reportFile = *written;

    log_info("Isolated {} node(s)", badNodes.size());
    Out() << "Isolation complete" << std::endl;
    return CHD_EXIT_OK;
}
