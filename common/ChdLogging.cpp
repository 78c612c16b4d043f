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
#include "ChdLogging.h"
#include "ChdLoggingImpl.h"

#include <cstdio>
#include <cstdlib>
#include <string>


plog::ConsoleAppender<ChdLogFormatter<PlogSeverityMapper>> consoleAppender;
ChdLogging ChdLogging::singletonInstance;

const char *PlogSeverityMapper::severityToString(plog::Severity severity)
{
    return plog::severityToString(severity);
}

std::string helperGetLogSettingFromArgAndEnv(const std::string &arg,
                                             const std::string &defaultValue,
                                             const std::string &envPrefix,
                                             const std::string &envSuffix)
{
    if (!arg.empty())
    {
        return arg;
    }

    const size_t maxLen      = FILENAME_MAX;
    const std::string envKey = envPrefix + "_" + envSuffix;
    const char *envValue     = std::getenv(envKey.c_str());

    if (envValue != nullptr)
    {
        size_t len = strnlen(envValue, maxLen);

        if (len > 0 && len < maxLen)
        {
            return envValue;
        }
    }

    return defaultValue;
}

void ChdLoggingInit(const char *logFile,
                    const ChdLoggingSeverity_t severity,
                    const ChdLoggingSeverity_t consoleSeverity)
{
    ChdLogging::init(logFile, severity, consoleSeverity);
}

std::string LoggingSeverityToString(int inputSeverity, const char *defaultSeverity)
{
    return ChdLogging::severityToString(inputSeverity, defaultSeverity);
}

ChdLoggingSeverity_t LoggingSeverityFromString(const char *severityStr, ChdLoggingSeverity_t defaultSeverity)
{
    return ChdLogging::severityFromString(severityStr, defaultSeverity);
}

std::string GetLogSeverityFromArgAndEnv(const std::string &arg,
                                        const std::string &defaultValue,
                                        const std::string &envPrefix)
{
    return ChdLogging::getLogSeverityFromArgAndEnv(arg, defaultValue, envPrefix);
}

std::string GetLogFilenameFromArgAndEnv(const std::string &arg,
                                        const std::string &defaultValue,
                                        const std::string &envPrefix)
{
    return ChdLogging::getLogFilenameFromArgAndEnv(arg, defaultValue, envPrefix);
}

bool IsValidSeverity(const char *severityStr)
{
    return ChdLogging::isValidSeverity(severityStr);
}
