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
#ifndef CHDIAG_CLI_PARSER_H
#define CHDIAG_CLI_PARSER_H

#include "Analyze.h"
#include "Detect.h"
#include "Isolate.h"

#include <map>
#include <string>


/*
 * This class is meant to handle all of the command line parsing for chdiag
 */
class CommandLineParser
{
public:
    // entry point to start CL processing
    // only accepts a subsystem name
    static int ProcessCommandLine(int argc, char const *const *argv);

#ifndef CHDIAG_TESTS
private:
#endif
    struct StaticConstructor
    {
        StaticConstructor();
    };
    // map of subsystem function pointers
    static inline std::map<std::string, int (*)(int argc, char const *const *argv)> m_functionMap;
    static inline StaticConstructor m_staticConstructor;

    // subsystem CL processing
    static int ProcessDetectCommandLine(int argc, char const *const *argv);
    static int ProcessAnalyzeCommandLine(int argc, char const *const *argv);
    static int ProcessIsolateCommandLine(int argc, char const *const *argv);

    // Parse and validate the arguments of a subsystem. Throws TCLAP::ArgException on invalid input
    static DetectParams ParseDetectParams(int argc, char const *const *argv);
    static AnalyzeParams ParseAnalyzeParams(int argc, char const *const *argv);
    static IsolateParams ParseIsolateParams(int argc, char const *const *argv);

    static ChdNs::NodeDiag::DetectionMode ParseDetectionMode(std::string const &mode);

    // Initialize logging from --log-file/--log-level, falling back to CHD_LOG_FILE/CHD_LOG_LVL
    static void InitLogging(LoggingParams const &logging);
};

#endif // CHDIAG_CLI_PARSER_H
