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

#include "nodediag_structs.hpp"

#include <chd_structs.h>

#include <expected>
#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace ChdNs::NodeDiag
{

struct HostfileUpdate
{
    std::string outputPath;
    std::optional<std::string> backupPath;
    std::vector<NodeId> excluded; //!< In hostfile order
};

/**
 * Produces configuration changes that keep condemned nodes out of future jobs.
 */
class NodeIsolator
{
public:
    explicit NodeIsolator(CondemnedSet badNodes, bool backup = true);

    /**
     * @brief Comment out every hostfile line whose node is condemned, as `# ISOLATED: <line>`
     *
     * Comments, blank lines and good nodes are kept verbatim.
     *
     * @param[out] excluded   Nodes that were commented out, in hostfile order
     */
    std::string IsolateHostfileContent(std::string_view content, std::vector<NodeId> &excluded) const;

    /**
     * @brief Rewrite a hostfile
     *
     * @param hostfile   File to read
     * @param output     Destination. The hostfile is updated in place when std::nullopt
     * @return CHD_ST_FILE_IO_ERROR when a file cannot be read, copied or written
     */
    std::expected<HostfileUpdate, chdReturn_t> UpdateHostfile(std::string const &hostfile,
                                                              std::optional<std::string> const &output
                                                              = std::nullopt) const;

    /**
     * @brief Kubernetes node affinity that keeps pods off the condemned nodes
     */
    Json::Value KubernetesNodeSelector() const;

    /**
     * @brief `#SBATCH --exclude=a,b,c` with nodes sorted
     */
    std::string SlurmExclude() const;

    Json::Value IsolationReport() const;

    CondemnedSet const &BadNodes() const
    {
        return m_badNodes;
    }

private:
    CondemnedSet m_badNodes;
    bool m_backup;
};

} // namespace ChdNs::NodeDiag
