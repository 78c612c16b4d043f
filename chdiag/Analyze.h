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
#ifndef CHDIAG_ANALYZE_H
#define CHDIAG_ANALYZE_H

#include "Command.h"

#include <nodediag_structs.hpp>

#include <optional>
#include <string>

struct AnalyzeParams
{
    std::string input;
    bool raw               = false; //!< Parse the input as raw benchmark output even if it ends with .json
    bool json              = false;
    double zscoreThreshold = NodeDiagConstants::DEFAULT_ZSCORE_THRESHOLD;
    std::optional<std::string> outputFile; //!< Also write the text report here
    LoggingParams logging;
};

/**
 * Offline slow node analysis of saved benchmark output
 */
class AnalyzeResults : public Command
{
public:
    explicit AnalyzeResults(AnalyzeParams params);

protected:
    int DoExecute() override;

private:
    AnalyzeParams m_params;
};

#endif // CHDIAG_ANALYZE_H
