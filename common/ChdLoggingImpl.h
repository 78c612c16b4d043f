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

#include "ChdLogging.h"

#include <plog/Record.h>
#define PLOG_CAPTURE_FILE

#include <plog/Init.h>
#include <plog/Log.h>

#include <atomic>
#include <chd_structs.h>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <sstream>
#include <strings.h>
#include <unistd.h>
#include <vector>

/**
 * How to use this class
 *
 * // if destination file is "-", log to stdout
 * ChdLogging::init("-", ChdLoggingSeverityInfo);
 * log_info("Now it's possible to log {}", 42);
 *
 * BASE_LOGGER always writes through FILE_LOGGER. CONSOLE_LOGGER writes to stdout with its own severity.
 */

// Forward declarations
class ChdLogging;
class PlogSeverityMapper;
template <class SeverityMapper = PlogSeverityMapper>
class ChdLogFormatter;

// Static appender that should always be allocated
extern plog::ConsoleAppender<ChdLogFormatter<PlogSeverityMapper>> consoleAppender;

static_assert(ChdLoggingSeverityNone == static_cast<ChdLoggingSeverity_t>(plog::none));
static_assert(ChdLoggingSeverityFatal == static_cast<ChdLoggingSeverity_t>(plog::fatal));
static_assert(ChdLoggingSeverityError == static_cast<ChdLoggingSeverity_t>(plog::error));
static_assert(ChdLoggingSeverityWarning == static_cast<ChdLoggingSeverity_t>(plog::warning));
static_assert(ChdLoggingSeverityInfo == static_cast<ChdLoggingSeverity_t>(plog::info));
static_assert(ChdLoggingSeverityDebug == static_cast<ChdLoggingSeverity_t>(plog::debug));
static_assert(ChdLoggingSeverityVerbose == static_cast<ChdLoggingSeverity_t>(plog::verbose));

/**
 * @brief Helper function to handle command line arguments and environment variables
 *
 * @param arg[in]           If not empty, arg's value will be returned from the function.
 * @param defaultValue[in]  If neither arg nor env variable value is set, this value will
 *                          be returned from the function.
 * @param envPrefix[in]     Env variable prefix
 * @param envSuffix[in]     Env variable suffix
 * @return
 *      - arg if arg is not empty
 *      - defaultValue if env variable is not set or empty
 *      - value of the env variable with name envPrefix_envSuffix
 * @note Env variable value is limited by max filename path length. If the value exceeds
 *       this limit, the defaultValue will be returned.
 */
std::string helperGetLogSettingFromArgAndEnv(const std::string &arg,
                                             const std::string &defaultValue,
                                             const std::string &envPrefix,
                                             const std::string &envSuffix);

class ChdLogging
{
public:
    ChdLogging(const ChdLogging &other)            = delete;
    ChdLogging &operator=(const ChdLogging &other) = delete;

    static void init(const char *logFile,
                     const ChdLoggingSeverity_t severity,
                     const ChdLoggingSeverity_t consoleSeverity = ChdLoggingSeverityNone)
    {
        if (!singletonInstance.m_loggingInitialized.load(std::memory_order_relaxed))
        {
            std::lock_guard<std::mutex> guard(singletonInstance.m_loggerMutex);
            if (!singletonInstance.m_loggingInitialized.load(std::memory_order_relaxed))
            {
                singletonInstance.Initialize(logFile, severity, consoleSeverity);
                return;
            }
        }
        CHD_LOG_DEBUG << "Logger already initialized -- skipped second initialization";
    }

    static ChdLogging &getInstance()
    {
        return singletonInstance;
    }

    // The reason we have two severities is to cover the case of bad input
    static std::string severityToString(int inputSeverity, const char *defaultSeverity)
    {
        // none is the first in the severity enum, verbose is the last
        if (inputSeverity < plog::none || inputSeverity > plog::verbose)
        {
            CHD_LOG_ERROR << "severityToString received invalid severity " << inputSeverity << ". "
                          << "Defaulting to " << defaultSeverity;
            return defaultSeverity;
        }

        return plog::severityToString(static_cast<plog::Severity>(inputSeverity));
    }

    static ChdLoggingSeverity_t severityFromString(const char *severityStr, ChdLoggingSeverity_t defaultSeverity)
    {
        for (int severity = plog::none; severity <= plog::verbose; severity++)
        {
            // Case insensitive comparison
            if (strncasecmp(plog::severityToString(static_cast<plog::Severity>(severity)),
                            severityStr,
                            MAX_SEVERITY_STRING_LENGTH)
                == 0)
            {
                return static_cast<ChdLoggingSeverity_t>(severity);
            }
        }

        CHD_LOG_ERROR << "Could not parse severity level. Defaulting to "
                      << plog::severityToString(static_cast<plog::Severity>(defaultSeverity));
        return defaultSeverity;
    }

    static bool isValidSeverity(const char *severityStr)
    {
        for (int severity = plog::none; severity <= plog::verbose; severity++)
        {
            // Case insensitive comparison
            if (strncasecmp(plog::severityToString(static_cast<plog::Severity>(severity)),
                            severityStr,
                            MAX_SEVERITY_STRING_LENGTH)
                == 0)
            {
                return true;
            }
        }

        return false;
    }

    static std::string getLogFilenameFromArgAndEnv(const std::string &arg,
                                                   const std::string &defaultValue,
                                                   const std::string &envPrefix)
    {
        return helperGetLogSettingFromArgAndEnv(arg, defaultValue, envPrefix, "FILE");
    }

    static std::string getLogSeverityFromArgAndEnv(const std::string &arg,
                                                   const std::string &defaultValue,
                                                   const std::string &envPrefix)
    {
        return helperGetLogSettingFromArgAndEnv(arg, defaultValue, envPrefix, "LVL");
    }

private:
    static ChdLogging singletonInstance;
    // Not really unique_ptr as they are used in plog as well. We are using
    // unique_ptr to manage lifetime only so we don't have to write a destructor
    std::vector<std::unique_ptr<plog::IAppender>> m_appenders;
    std::atomic<bool> m_loggingInitialized = false;
    std::mutex m_loggerMutex;
    ChdLogging() = default;

    void Initialize(const char *logFile,
                    const ChdLoggingSeverity_t severity,
                    const ChdLoggingSeverity_t consoleSeverity)
    {
        InitLogger<FILE_LOGGER>(logFile, static_cast<plog::Severity>(severity));
        // BASE_LOGGER always redirects to FILE_LOGGER
        plog::init<BASE_LOGGER>(static_cast<plog::Severity>(severity), plog::get<FILE_LOGGER>());
        plog::init<CONSOLE_LOGGER>(static_cast<plog::Severity>(consoleSeverity), &consoleAppender);

        m_loggingInitialized = true;
    }

    template <loggerCategory_t logger = BASE_LOGGER>
    int InitLogger(const char *logFile, plog::Severity severity)
    {
        plog::IAppender *appender;

        if (strncmp(CHD_LOGGING_CONSTANT_HYPHEN, logFile, sizeof(CHD_LOGGING_CONSTANT_HYPHEN)) == 0)
        {
            appender = &consoleAppender;
        }
        else
        {
            appender = new plog::RollingFileAppender<ChdLogFormatter<PlogSeverityMapper>>(logFile);
            m_appenders.push_back(std::unique_ptr<plog::IAppender>(appender));
        }

        plog::init<logger>(severity, appender);
        return 0;
    }
};

class PlogSeverityMapper
{
public:
    static const char *severityToString(plog::Severity severity);
};

template <class SeverityMapper>
class ChdLogFormatter
{
public:
    static std::string header();
    static std::string format(const plog::Record &record);
};

template <class SeverityMapper>
std::string ChdLogFormatter<SeverityMapper>::header()
{
    return std::string();
}

// Format: YYYY-mm-dd HH:MM:ss.sss <severity> [<PID>:<TID>] <message> [<filename>:<line>] [<function>]
template <class SeverityMapper>
std::string ChdLogFormatter<SeverityMapper>::format(const plog::Record &record)
{
    tm t;
    plog::util::localtime_s(&t, &record.getTime().time);

    std::ostringstream ss;
    ss << std::put_time(&t, "%Y-%m-%d %H:%M:%S.") << std::setfill('0') << std::setw(3) << record.getTime().millitm
       << " ";

    ss << std::setfill(' ') << std::setw(5) << std::left << SeverityMapper::severityToString(record.getSeverity())
       << " ";

    ss << "[" << getpid() << ":" << record.getTid() << "] ";

    ss << record.getMessage() << " ";

    ss << "[" << record.getFile() << ":" << record.getLine() << "] ";

    ss << "[" << record.getFunc() << "]\n";

    return ss.str();
}
