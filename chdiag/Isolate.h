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
#ifndef CHDIAG_ISOLATE_H
#define CHDIAG_ISOLATE_H

#include "Command.h"

#include <nodediag_structs.hpp>

#include <optional>
#include <string>
#include <vector>

struct IsolateParams
{
    std::vector<std::string> reports; //!< Detection reports to load condemned nodes from
    std::vector<std::string> nodes;   //!< Comma separated node lists
    std::optional<std::string> hostfile;
    std::optional<std::string> output; //!< Destination of the rewritten hostfile. In place when unset
    bool backup = true;
    bool k8s    = false;
    bool slurm  = false;
    std::string reportDir = ".";
    LoggingParams logging;
};

/**
 * Removes condemned nodes from future scheduling
 */
class IsolateNodes : public Command
{
public:
    explicit IsolateNodes(IsolateParams params);

    /**
     * @brief Path of the isolation report written by the last execution
     */
    std::optional<std::string> const &GetReportFile() const
    {
        return m_reportFile;
    }

protected:
    int DoExecute() override;

private:
    int CollectBadNodes(ChdNs::NodeDiag::CondemnedSet &badNodes);

    IsolateParams m_params;
    std::optional<std::string> m_reportFile;
};

#endif // CHDIAG_ISOLATE_H
