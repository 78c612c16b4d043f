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
#include "Analyze.h"

#include <ChdException.hpp>
#include <ChdLogging.h>
#include <NodeDiagReport.h>
#include <SlowNodeAnalyzer.h>

#include <fstream>
#include <iostream>

using namespace ChdNs::NodeDiag;

/*****************************************************************************/
AnalyzeResults::AnalyzeResults(AnalyzeParams params)
    : m_params(std::move(params))
{
    m_json = m_params.json;
}

/*****************************************************************************/
int AnalyzeResults::DoExecute()
{
    auto analysis = AnalyzeFile(m_params.input, m_params.raw, m_params.zscoreThreshold);
    if (!analysis)
    {
        if (analysis.error() == CHD_ST_FILE_IO_ERROR)
        {
            std::cerr << "Error: Input file not found: " << m_params.input << std::endl;
        }
        else
        {
            std::cerr << "Error: unable to analyze " << m_params.input << ": " << errorString(analysis.error())
                      << std::endl;
        }
        return CHD_EXIT_CONFIG_ERROR;
    }

    if (analysis->error.has_value())
    {
        log_warning("Analysis of {} produced no statistics: {}", m_params.input, *analysis->error);
    }

    if (m_json)
    {
        Out() << SerializeReport(ToJson(*analysis)) << std::endl;
    }
    else
    {
        std::string const report = FormatSlowNodeReport(*analysis);
        Out() << report;
        if (m_params.outputFile.has_value())
        {
            std::ofstream file(*m_params.outputFile);
            file << report;
            if (!file)
            {
                throw ChdNs::ChdException(CHD_ST_FILE_IO_ERROR, "unable to write report to " + *m_params.outputFile);
            }
            Out() << std::endl << "Report saved to: " << *m_params.outputFile << std::endl;
        }
    }

    return analysis->SlowDetected() ? CHD_EXIT_NODES_CONDEMNED : CHD_EXIT_OK;
}
